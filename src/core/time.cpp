#include <tsx/core/time.hpp>

#include <fmt/core.h>

#include <chrono>

namespace tsx {

namespace {

auto step_nanos(Duration step) -> std::int64_t {
    if (step.count() <= 0) {
        throw std::invalid_argument(
            fmt::format("bucket step must be positive, got {}ns", step.count()));
    }
    return step.count();
}

auto step_days(std::chrono::days step) -> std::int32_t {
    if (step.count() <= 0) {
        throw std::invalid_argument(
            fmt::format("bucket step must be positive, got {} days", step.count()));
    }
    return static_cast<std::int32_t>(step.count());
}

}  // namespace

auto floor_to(Timestamp ts, Duration step) -> Timestamp {
    return Timestamp{floor_to(ts.nanos, step_nanos(step))};
}

auto ceil_to(Timestamp ts, Duration step) -> Timestamp {
    return Timestamp{ceil_to(ts.nanos, step_nanos(step))};
}

auto bucket_end(Timestamp ts, Duration step) -> Timestamp {
    return Timestamp{bucket_end(ts.nanos, step_nanos(step))};
}

auto round_to(Timestamp ts, Duration step) -> Timestamp {
    return Timestamp{round_to(ts.nanos, step_nanos(step))};
}

auto floor_to(Date date, std::chrono::days step) -> Date {
    return Date{floor_to(date.days, step_days(step))};
}

auto ceil_to(Date date, std::chrono::days step) -> Date {
    return Date{ceil_to(date.days, step_days(step))};
}

auto bucket_end(Date date, std::chrono::days step) -> Date {
    return Date{bucket_end(date.days, step_days(step))};
}

auto round_to(Date date, std::chrono::days step) -> Date {
    return Date{round_to(date.days, step_days(step))};
}

auto format_date(Date date) -> std::string {
    using namespace std::chrono;
    sys_days day = sys_days{days{date.days}};
    year_month_day ymd{day};
    return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
}

auto format_timestamp(Timestamp ts) -> std::string {
    using namespace std::chrono;
    sys_time<nanoseconds> tp{nanoseconds{ts.nanos}};
    auto day = floor<days>(tp);
    year_month_day ymd{day};
    auto tod = tp - day;
    hh_mm_ss<nanoseconds> hms{tod};
    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:09}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                       hms.hours().count(), hms.minutes().count(), hms.seconds().count(),
                       hms.subseconds().count());
}

}  // namespace tsx
