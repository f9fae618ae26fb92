#pragma once

#include "core/error.hpp"
#include "tracing/irandom_source.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <iosfwd>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace tracectx {

namespace detail {
[[noreturn]] void trace_id_index_out_of_range(std::size_t index);
} // namespace detail

/**
 * @brief W3C TraceContext trace-id: 16 opaque bytes naming a trace
 *
 * Immutable value type. Every bit pattern is representable, including
 * all zeros; callers that must reject the all-zero ID (as the W3C
 * traceparent grammar requires) check is_zero() themselves.
 *
 * Canonical text form: 32 lowercase hex chars, byte 0 first, e.g.
 *   4bf92f3577b34da6a3ce929d0e0e4736
 *
 * See https://www.w3.org/TR/trace-context-1/#trace-id
 */
class TraceId {
public:
    static constexpr std::size_t kSize = 16;
    static constexpr std::size_t kHexLength = kSize * 2;

    using Bytes = std::array<uint8_t, kSize>;
    using value_type = uint8_t;
    using const_iterator = Bytes::const_iterator;

    /// All-zero trace ID
    constexpr TraceId() noexcept = default;

    explicit constexpr TraceId(const Bytes& bytes) noexcept : bytes_(bytes) {}

    /// Store the given bytes verbatim
    [[nodiscard]] static constexpr TraceId from_bytes(const Bytes& bytes) noexcept {
        return TraceId(bytes);
    }

    /**
     * @brief Generate a trace ID from two 64-bit draws
     *
     * The first draw fills bytes 0-7 and the second bytes 8-15, each in
     * big-endian order, so the hex string's halves map to the two draws.
     */
    [[nodiscard]] static TraceId random(IRandomSource& source);

    /// Generate a trace ID from the process-wide OpenSSL CSPRNG
    [[nodiscard]] static TraceId random();

    /**
     * @brief Decode 32 hex characters (case-insensitive)
     * @return INVALID_LENGTH when size != 32, INVALID_CHARACTER (with offset)
     *         for the first non-hex character
     */
    [[nodiscard]] static Result<TraceId> from_hex(std::string_view hex);

    // ---- Byte-sequence access ----------------------------------------------

    [[nodiscard]] static constexpr std::size_t size() noexcept { return kSize; }

    /// Index must be < 16; anything else aborts the process
    [[nodiscard]] uint8_t operator[](std::size_t index) const {
        if (index >= kSize) [[unlikely]] {
            detail::trace_id_index_out_of_range(index);
        }
        return bytes_[index];
    }

    [[nodiscard]] const_iterator begin() const noexcept { return bytes_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return bytes_.end(); }

    [[nodiscard]] const Bytes& bytes() const noexcept { return bytes_; }

    /**
     * @brief Scoped read-only access to the underlying storage
     *
     * The span is only valid for the duration of the call and must not be
     * stored. Returns whatever fn returns.
     */
    template<typename Fn>
    decltype(auto) with_bytes(Fn&& fn) const {
        return std::invoke(std::forward<Fn>(fn), std::span<const uint8_t, kSize>(bytes_));
    }

    /// A trace ID is its own identity key
    [[nodiscard]] TraceId id() const noexcept { return *this; }

    [[nodiscard]] bool is_zero() const noexcept;

    // ---- Hashing / text ----------------------------------------------------

    /// FNV-1a over bytes 0..15; stable for the lifetime of the process
    [[nodiscard]] std::size_t hash() const noexcept;

    /// 32 lowercase hex characters
    [[nodiscard]] std::string to_hex() const;

    /// Same as to_hex() without allocating
    [[nodiscard]] std::array<char, kHexLength> hex_bytes() const noexcept;

    friend bool operator==(const TraceId& lhs, const TraceId& rhs) noexcept = default;

private:
    Bytes bytes_{};
};

std::ostream& operator<<(std::ostream& os, const TraceId& trace_id);

} // namespace tracectx

namespace std {

template<>
struct hash<tracectx::TraceId> {
    size_t operator()(const tracectx::TraceId& trace_id) const noexcept {
        return trace_id.hash();
    }
};

template<>
struct formatter<tracectx::TraceId> : formatter<string_view> {
    auto format(const tracectx::TraceId& trace_id, format_context& ctx) const {
        const auto hex = trace_id.hex_bytes();
        return formatter<string_view>::format(string_view(hex.data(), hex.size()), ctx);
    }
};

} // namespace std
