#include <tsx/ops/join.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace tsx::ops {

auto to_string(JoinStrategy strategy) noexcept -> std::string_view {
    switch (strategy) {
        case JoinStrategy::Auto:
            return "auto";
        case JoinStrategy::Merge:
            return "merge";
        case JoinStrategy::Hash:
            return "hash";
    }
    return "unknown";
}

auto choose_strategy(std::size_t left_rows, std::size_t right_rows, const JoinOptions& options,
                     bool hashable_key) -> JoinStrategy {
    JoinStrategy chosen = JoinStrategy::Merge;
    switch (options.strategy) {
        case JoinStrategy::Merge:
            chosen = JoinStrategy::Merge;
            break;
        case JoinStrategy::Hash:
            if (hashable_key) {
                chosen = JoinStrategy::Hash;
            } else {
                spdlog::warn("join: hash strategy requested for a key type without std::hash, "
                             "falling back to merge");
            }
            break;
        case JoinStrategy::Auto: {
            const auto small = static_cast<double>(std::min(left_rows, right_rows));
            const auto large = static_cast<double>(std::max(left_rows, right_rows));
            if (hashable_key && large > 0.0 && small <= options.hash_size_ratio * large) {
                chosen = JoinStrategy::Hash;
            }
            break;
        }
    }
    spdlog::debug("join: left={} right={} requested={} chosen={}", left_rows, right_rows,
                  to_string(options.strategy), to_string(chosen));
    return chosen;
}

}  // namespace tsx::ops
