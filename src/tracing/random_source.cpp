#include "tracing/random_source.hpp"
#include "core/utils.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <cstring>
#include <format>
#include <stdexcept>

namespace tracectx {

uint64_t SecureRandomSource::next() {
    unsigned char buf[sizeof(uint64_t)];
    if (RAND_bytes(buf, static_cast<int>(sizeof(buf))) != 1) {
        char err_buf[256];
        ERR_error_string_n(ERR_get_error(), err_buf, sizeof(err_buf));
        utils::log::error(std::format("SecureRandomSource: RAND_bytes failed: {}", err_buf));
        throw std::runtime_error("RAND_bytes failed");
    }
    uint64_t value = 0;
    std::memcpy(&value, buf, sizeof(value));
    return value;
}

SecureRandomSource& SecureRandomSource::instance() {
    static SecureRandomSource source;
    return source;
}

std::unique_ptr<IRandomSource> make_random_source(const TraceIdConfig& config) {
    const auto kind = parse_random_source_kind(config.random_source);
    if (!kind) {
        utils::log::warn(std::format(
            "Unknown trace_id.random_source '{}', using secure", config.random_source));
        return std::make_unique<SecureRandomSource>();
    }

    if (*kind == RandomSourceKind::SEEDED) {
        const uint64_t seed = config.seed.value_or(0);
        utils::log::warn(std::format(
            "Trace IDs use a seeded generator (seed={}); not for production", seed));
        return std::make_unique<SeededRandomSource>(seed);
    }
    return std::make_unique<SecureRandomSource>();
}

} // namespace tracectx
