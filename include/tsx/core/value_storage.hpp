#pragma once

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace tsx::detail {

/// Contiguous bool storage.
///
/// std::vector<bool> packs bits and cannot be viewed as std::span<const bool>,
/// so Series<K, bool> keeps its values here instead.
class BoolBuffer {
   public:
    using value_type = bool;
    using size_type = std::size_t;

    BoolBuffer() = default;

    explicit BoolBuffer(const std::vector<bool>& values)
        : size_(values.size()), data_(std::make_unique<bool[]>(values.size())) {
        std::ranges::copy(values, data_.get());
    }

    BoolBuffer(const BoolBuffer& other)
        : size_(other.size_), data_(std::make_unique<bool[]>(other.size_)) {
        std::copy_n(other.data_.get(), other.size_, data_.get());
    }

    BoolBuffer(BoolBuffer&& other) noexcept
        : size_(std::exchange(other.size_, 0)), data_(std::move(other.data_)) {}

    auto operator=(const BoolBuffer& other) -> BoolBuffer& {
        if (this != &other) {
            BoolBuffer copy(other);
            *this = std::move(copy);
        }
        return *this;
    }

    auto operator=(BoolBuffer&& other) noexcept -> BoolBuffer& {
        size_ = std::exchange(other.size_, 0);
        data_ = std::move(other.data_);
        return *this;
    }

    ~BoolBuffer() = default;

    [[nodiscard]] auto data() const noexcept -> const bool* { return data_.get(); }
    [[nodiscard]] auto size() const noexcept -> size_type { return size_; }
    [[nodiscard]] auto empty() const noexcept -> bool { return size_ == 0; }

    [[nodiscard]] auto begin() const noexcept -> const bool* { return data_.get(); }
    [[nodiscard]] auto end() const noexcept -> const bool* { return data_.get() + size_; }

    auto operator[](size_type pos) const noexcept -> const bool& { return data_[pos]; }

    auto operator==(const BoolBuffer& other) const -> bool {
        return std::ranges::equal(*this, other);
    }

   private:
    size_type size_ = 0;
    std::unique_ptr<bool[]> data_;
};

template <typename V>
struct ValueStorage {
    using type = std::vector<V>;
};

template <>
struct ValueStorage<bool> {
    using type = BoolBuffer;
};

/// Owning, contiguous storage for Series values of type V.
template <typename V>
using value_storage_t = typename ValueStorage<V>::type;

template <typename V>
[[nodiscard]] auto make_value_storage(std::vector<V> values) -> value_storage_t<V> {
    if constexpr (std::same_as<V, bool>) {
        return BoolBuffer(values);
    } else {
        return values;
    }
}

}  // namespace tsx::detail
