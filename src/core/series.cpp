#include <tsx/core/series.hpp>
#include <tsx/core/time.hpp>

#include <cstdint>

// Series<K, V> is header-only. This translation unit anchors explicit
// instantiations for the key/value combinations used most often.

namespace tsx {

template class Series<std::int64_t, double>;
template class Series<std::int64_t, std::int64_t>;
template class Series<std::int64_t, bool>;
template class Series<Timestamp, double>;
template class Series<Timestamp, std::int64_t>;
template class Series<Date, double>;

auto library_validates_inputs() noexcept -> bool { return kValidateInputs; }

}  // namespace tsx
