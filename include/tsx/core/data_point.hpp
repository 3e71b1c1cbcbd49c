#pragma once

namespace tsx {

/// A single (key, value) observation.
template <typename K, typename V>
struct DataPoint {
    using key_type = K;
    using value_type = V;

    K key;
    V value;

    auto operator==(const DataPoint&) const -> bool = default;
};

template <typename K, typename V>
DataPoint(K, V) -> DataPoint<K, V>;

}  // namespace tsx
