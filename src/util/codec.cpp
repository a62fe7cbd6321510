#include <scalex/util/codec.hpp>

#include <fmt/format.h>

#include <bit>
#include <type_traits>

namespace scalex::codec {

namespace {

constexpr std::uint64_t kSignMask = 0x8000000000000000ULL;
constexpr std::size_t kMaxVarintLen = 10;

void append_big_endian(Bytes& buf, std::uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        buf.push_back(static_cast<std::uint8_t>(value >> static_cast<unsigned>(shift)));
    }
}

}  // namespace

void encode_uvarint(Bytes& buf, std::uint64_t value) {
    while (value >= 0x80) {
        buf.push_back(static_cast<std::uint8_t>(value) | 0x80U);
        value >>= 7U;
    }
    buf.push_back(static_cast<std::uint8_t>(value));
}

void encode_varint(Bytes& buf, std::int64_t value) {
    auto zigzag = static_cast<std::uint64_t>(value) << 1U;
    if (value < 0) {
        zigzag = ~zigzag;
    }
    encode_uvarint(buf, zigzag);
}

void encode_compact_bytes(Bytes& buf, std::string_view data) {
    encode_varint(buf, static_cast<std::int64_t>(data.size()));
    buf.insert(buf.end(), data.begin(), data.end());
}

void encode_int(Bytes& buf, std::int64_t value) {
    append_big_endian(buf, static_cast<std::uint64_t>(value) ^ kSignMask);
}

void encode_uint(Bytes& buf, std::uint64_t value) { append_big_endian(buf, value); }

void encode_float(Bytes& buf, double value) {
    auto bits = std::bit_cast<std::uint64_t>(value);
    if (value >= 0) {
        bits |= kSignMask;
    } else {
        bits = ~bits;
    }
    append_big_endian(buf, bits);
}

void encode_datum(Bytes& buf, const Datum& datum) {
    std::visit(
        [&buf](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                buf.push_back(kNilFlag);
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                buf.push_back(kIntFlag);
                encode_int(buf, v);
            } else if constexpr (std::is_same_v<T, std::uint64_t>) {
                buf.push_back(kUintFlag);
                encode_uint(buf, v);
            } else if constexpr (std::is_same_v<T, double>) {
                buf.push_back(kFloatFlag);
                encode_float(buf, v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                buf.push_back(kCompactBytesFlag);
                encode_compact_bytes(buf, v);
            } else if constexpr (std::is_same_v<T, Decimal>) {
                auto norm = v.normalized();
                buf.push_back(kDecimalFlag);
                encode_varint(buf, norm.scale());
                encode_int(buf, norm.unscaled());
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                buf.push_back(kTimestampFlag);
                encode_int(buf, v.nanos);
            } else if constexpr (std::is_same_v<T, Duration>) {
                buf.push_back(kDurationFlag);
                encode_int(buf, v.nanos);
            }
        },
        datum);
}

auto decode_varint(std::span<const std::uint8_t> data, std::size_t& pos) -> Result<std::int64_t> {
    std::uint64_t zigzag = 0;
    unsigned shift = 0;
    for (std::size_t i = 0; i < kMaxVarintLen; ++i) {
        if (pos >= data.size()) {
            return make_error(ErrorCode::TypeMismatch, "truncated varint at offset {}", pos);
        }
        std::uint8_t byte = data[pos++];
        zigzag |= static_cast<std::uint64_t>(byte & 0x7FU) << shift;
        if ((byte & 0x80U) == 0) {
            auto value = static_cast<std::int64_t>(zigzag >> 1U);
            if ((zigzag & 1U) != 0) {
                value = ~value;
            }
            return value;
        }
        shift += 7;
    }
    return make_error(ErrorCode::Overflow, "varint overflows 64 bits at offset {}", pos);
}

auto decode_compact_bytes(std::span<const std::uint8_t> data, std::size_t& pos)
    -> Result<std::string> {
    auto length = decode_varint(data, pos);
    if (!length) {
        return std::unexpected(length.error());
    }
    if (*length < 0 || static_cast<std::size_t>(*length) > data.size() - pos) {
        return make_error(ErrorCode::TypeMismatch, "invalid compact bytes length {} at offset {}",
                          *length, pos);
    }
    std::string out(reinterpret_cast<const char*>(data.data() + pos),
                    static_cast<std::size_t>(*length));
    pos += static_cast<std::size_t>(*length);
    return out;
}

auto to_hex(std::span<const std::uint8_t> data) -> std::string {
    std::string out;
    out.reserve(data.size() * 2);
    for (auto byte : data) {
        out += fmt::format("{:02x}", byte);
    }
    return out;
}

}  // namespace scalex::codec
