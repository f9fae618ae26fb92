#pragma once

#include <cstdint>

namespace tracectx {

/**
 * @brief Abstract source of uniformly distributed 64-bit words
 *
 * Consumed by TraceId::random(). Production code uses the OpenSSL-backed
 * SecureRandomSource; tests inject seeded or scripted sources for
 * deterministic identifiers. Implementations shared between threads are
 * responsible for their own synchronization.
 */
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    [[nodiscard]] virtual uint64_t next() = 0;
};

} // namespace tracectx
