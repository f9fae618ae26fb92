#pragma once

#include "config/config_types.hpp"
#include "tracing/irandom_source.hpp"

#include <cstdint>
#include <memory>
#include <random>

namespace tracectx {

/**
 * @brief Cryptographically secure source backed by OpenSSL's DRBG
 *
 * Stateless; RAND_bytes is thread-safe, so a single instance may be shared
 * across threads. Throws std::runtime_error if OpenSSL reports failure.
 */
class SecureRandomSource : public IRandomSource {
public:
    [[nodiscard]] uint64_t next() override;

    /// Process-wide instance used for default trace ID generation
    [[nodiscard]] static SecureRandomSource& instance();
};

/**
 * @brief Deterministic source (mt19937_64) for reproducible test runs
 *
 * Not thread-safe.
 */
class SeededRandomSource : public IRandomSource {
public:
    explicit SeededRandomSource(uint64_t seed) : gen_(seed) {}

    [[nodiscard]] uint64_t next() override { return gen_(); }

private:
    std::mt19937_64 gen_;
};

/// Build the random source selected by [trace_id] config
[[nodiscard]] std::unique_ptr<IRandomSource> make_random_source(const TraceIdConfig& config);

} // namespace tracectx
