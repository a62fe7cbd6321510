#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <string>

namespace scalex {

/// Instant in nanoseconds since 1970-01-01T00:00:00 (Unix epoch), already shifted into the
/// session time zone.
struct Timestamp {
    std::int64_t nanos = 0;
    auto operator<=>(const Timestamp&) const = default;
};

/// Signed time interval in nanoseconds.
struct Duration {
    std::int64_t nanos = 0;
    auto operator<=>(const Duration&) const = default;
};

/// Formats as `YYYY-MM-DD HH:MM:SS[.ffffff]` (fraction only when non-zero).
[[nodiscard]] auto format_timestamp(Timestamp ts) -> std::string;

/// Formats as `[-]HH:MM:SS[.ffffff]`; hours may exceed 24.
[[nodiscard]] auto format_duration(Duration d) -> std::string;

}  // namespace scalex

namespace std {

template <>
struct hash<scalex::Timestamp> {
    auto operator()(const scalex::Timestamp& ts) const noexcept -> std::size_t {
        return std::hash<std::int64_t>{}(ts.nanos);
    }
};

template <>
struct hash<scalex::Duration> {
    auto operator()(const scalex::Duration& d) const noexcept -> std::size_t {
        return std::hash<std::int64_t>{}(d.nanos);
    }
};

}  // namespace std
