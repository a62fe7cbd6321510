#include <scalex/core/time.hpp>

#include <fmt/format.h>

#include <chrono>

namespace scalex {

namespace {

constexpr std::int64_t kNanosPerMicro = 1'000;

auto format_fraction(std::int64_t sub_second_nanos) -> std::string {
    auto micros = sub_second_nanos / kNanosPerMicro;
    if (micros == 0) {
        return {};
    }
    return fmt::format(".{:06}", micros);
}

}  // namespace

auto format_timestamp(Timestamp ts) -> std::string {
    using namespace std::chrono;
    sys_time<nanoseconds> tp{nanoseconds{ts.nanos}};
    auto day = floor<days>(tp);
    year_month_day ymd{day};
    hh_mm_ss<nanoseconds> hms{tp - day};
    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}{}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                       hms.hours().count(), hms.minutes().count(), hms.seconds().count(),
                       format_fraction(hms.subseconds().count()));
}

auto format_duration(Duration d) -> std::string {
    using namespace std::chrono;
    hh_mm_ss<nanoseconds> hms{nanoseconds{d.nanos}};
    return fmt::format("{}{:02}:{:02}:{:02}{}", hms.is_negative() ? "-" : "", hms.hours().count(),
                       hms.minutes().count(), hms.seconds().count(),
                       format_fraction(hms.subseconds().count()));
}

}  // namespace scalex
