#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tsx {

/// Why a checked construction or a validated operation rejected its input.
enum class ErrorKind : std::uint8_t {
    LengthMismatch,  ///< key and value sequences differ in length
    UnorderedInput,  ///< a key is lower than its predecessor
    DuplicateKey,    ///< a key equals its predecessor
};

[[nodiscard]] auto to_string(ErrorKind kind) noexcept -> std::string_view;

/// Construction / validation error with the offending position.
///
/// For LengthMismatch `position` is the length of the shorter sequence; for
/// ordering errors it is the index of the first key that breaks strict
/// ascending order.
struct SeriesError {
    ErrorKind kind = ErrorKind::UnorderedInput;
    std::size_t position = 0;
    std::string message;

    /// Format as "<kind> at <position>: <message>".
    [[nodiscard]] auto format() const -> std::string;
};

[[nodiscard]] auto length_mismatch(std::size_t keys, std::size_t values) -> SeriesError;
[[nodiscard]] auto unordered_input(std::size_t position) -> SeriesError;
[[nodiscard]] auto duplicate_key(std::size_t position) -> SeriesError;

/// Thrown by operations that check their preconditions (TSX_VALIDATE_INPUTS
/// builds) when an input Series is not strictly ascending.
class OrderViolation : public std::runtime_error {
   public:
    OrderViolation(std::string_view operation, SeriesError error);

    [[nodiscard]] auto error() const noexcept -> const SeriesError& { return error_; }
    [[nodiscard]] auto operation() const noexcept -> const std::string& { return operation_; }

   private:
    std::string operation_;
    SeriesError error_;
};

}  // namespace tsx
