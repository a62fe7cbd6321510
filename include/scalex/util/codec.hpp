#pragma once

#include <scalex/core/datum.hpp>
#include <scalex/core/error.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace scalex::codec {

using Bytes = std::vector<std::uint8_t>;

/// Leading byte of each datum encoded by encode_datum().
inline constexpr std::uint8_t kNilFlag = 0;
inline constexpr std::uint8_t kCompactBytesFlag = 2;
inline constexpr std::uint8_t kIntFlag = 3;
inline constexpr std::uint8_t kUintFlag = 4;
inline constexpr std::uint8_t kFloatFlag = 5;
inline constexpr std::uint8_t kDecimalFlag = 6;
inline constexpr std::uint8_t kDurationFlag = 7;
inline constexpr std::uint8_t kTimestampFlag = 10;

/// Zig-zag varint (same layout as protobuf sint64).
void encode_varint(Bytes& buf, std::int64_t value);
void encode_uvarint(Bytes& buf, std::uint64_t value);

/// Varint length followed by the raw bytes.
void encode_compact_bytes(Bytes& buf, std::string_view data);

/// Memcomparable big-endian encodings.
void encode_int(Bytes& buf, std::int64_t value);
void encode_uint(Bytes& buf, std::uint64_t value);
void encode_float(Bytes& buf, double value);

/// Flag byte followed by the kind-specific payload. Decimals are normalized first so that
/// equal values with different scales encode identically.
void encode_datum(Bytes& buf, const Datum& datum);

[[nodiscard]] auto decode_varint(std::span<const std::uint8_t> data, std::size_t& pos)
    -> Result<std::int64_t>;
[[nodiscard]] auto decode_compact_bytes(std::span<const std::uint8_t> data, std::size_t& pos)
    -> Result<std::string>;

/// Lowercase hex rendering, used for diagnostics.
[[nodiscard]] auto to_hex(std::span<const std::uint8_t> data) -> std::string;

}  // namespace scalex::codec
