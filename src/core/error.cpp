#include <tsx/core/error.hpp>

#include <fmt/core.h>

#include <utility>

namespace tsx {

auto to_string(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::LengthMismatch:
            return "length mismatch";
        case ErrorKind::UnorderedInput:
            return "unordered input";
        case ErrorKind::DuplicateKey:
            return "duplicate key";
    }
    return "unknown error";
}

auto SeriesError::format() const -> std::string {
    return fmt::format("{} at {}: {}", to_string(kind), position, message);
}

auto length_mismatch(std::size_t keys, std::size_t values) -> SeriesError {
    return SeriesError{
        .kind = ErrorKind::LengthMismatch,
        .position = keys < values ? keys : values,
        .message = fmt::format("{} keys but {} values", keys, values),
    };
}

auto unordered_input(std::size_t position) -> SeriesError {
    return SeriesError{
        .kind = ErrorKind::UnorderedInput,
        .position = position,
        .message = fmt::format("key at position {} is lower than key at position {}", position,
                               position - 1),
    };
}

auto duplicate_key(std::size_t position) -> SeriesError {
    return SeriesError{
        .kind = ErrorKind::DuplicateKey,
        .position = position,
        .message = fmt::format("key at position {} repeats key at position {}", position,
                               position - 1),
    };
}

OrderViolation::OrderViolation(std::string_view operation, SeriesError error)
    : std::runtime_error(fmt::format("{}: {}", operation, error.format())),
      operation_(operation),
      error_(std::move(error)) {}

}  // namespace tsx
