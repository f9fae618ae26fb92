#include "tracing/trace_id.hpp"
#include "tracing/random_source.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <ostream>

namespace tracectx {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

constexpr uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

void store_big_endian(uint64_t value, uint8_t* out) {
    for (std::size_t i = 0; i < sizeof(uint64_t); ++i) {
        out[i] = static_cast<uint8_t>(value >> (56 - i * 8));
    }
}

// -1 for anything outside [0-9a-fA-F]
int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

namespace detail {

void trace_id_index_out_of_range(std::size_t index) {
    utils::log::error(std::format(
        "TraceId index {} out of range [0, {})", index, TraceId::kSize));
    std::abort();
}

} // namespace detail

TraceId TraceId::random(IRandomSource& source) {
    Bytes bytes{};
    const uint64_t high = source.next();
    const uint64_t low = source.next();
    store_big_endian(high, bytes.data());
    store_big_endian(low, bytes.data() + 8);
    return TraceId(bytes);
}

TraceId TraceId::random() {
    return random(SecureRandomSource::instance());
}

Result<TraceId> TraceId::from_hex(std::string_view hex) {
    if (hex.size() != kHexLength) {
        return Result<TraceId>::error(ErrorCategory::INVALID_LENGTH,
            std::format("trace ID must be {} hex characters, got {}", kHexLength, hex.size()));
    }

    Bytes bytes{};
    for (std::size_t i = 0; i < kSize; ++i) {
        const int hi = hex_value(hex[i * 2]);
        if (hi < 0) {
            return Result<TraceId>::error(ErrorCategory::INVALID_CHARACTER,
                std::format("invalid hex character 0x{:02x} at offset {}",
                            static_cast<unsigned char>(hex[i * 2]), i * 2),
                i * 2);
        }
        const int lo = hex_value(hex[i * 2 + 1]);
        if (lo < 0) {
            return Result<TraceId>::error(ErrorCategory::INVALID_CHARACTER,
                std::format("invalid hex character 0x{:02x} at offset {}",
                            static_cast<unsigned char>(hex[i * 2 + 1]), i * 2 + 1),
                i * 2 + 1);
        }
        bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return Result<TraceId>::ok(TraceId(bytes));
}

bool TraceId::is_zero() const noexcept {
    uint8_t acc = 0;
    for (const uint8_t b : bytes_) {
        acc |= b;
    }
    return acc == 0;
}

std::size_t TraceId::hash() const noexcept {
    uint64_t h = kFnvOffsetBasis;
    for (const uint8_t b : bytes_) {
        h ^= b;
        h *= kFnvPrime;
    }
    return static_cast<std::size_t>(h);
}

std::array<char, TraceId::kHexLength> TraceId::hex_bytes() const noexcept {
    std::array<char, kHexLength> out{};
    for (std::size_t i = 0; i < kSize; ++i) {
        out[i * 2]     = kHexDigits[bytes_[i] >> 4];
        out[i * 2 + 1] = kHexDigits[bytes_[i] & 0x0F];
    }
    return out;
}

std::string TraceId::to_hex() const {
    const auto hex = hex_bytes();
    return std::string(hex.data(), hex.size());
}

std::ostream& operator<<(std::ostream& os, const TraceId& trace_id) {
    const auto hex = trace_id.hex_bytes();
    return os.write(hex.data(), static_cast<std::streamsize>(hex.size()));
}

} // namespace tracectx
