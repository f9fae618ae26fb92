#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace tracectx {

// ============================================================================
// Configuration Types
// ============================================================================

struct LoggingConfig {
    std::string level = "info";   // info | warn | error
};

enum class RandomSourceKind {
    SECURE,   // OpenSSL CSPRNG
    SEEDED    // mt19937_64, reproducible
};

struct TraceIdConfig {
    std::string random_source = "secure";  // Parsed at use site (secure | seeded)
    std::optional<uint64_t> seed;          // Required when random_source = "seeded"
};

struct TraceContextConfig {
    LoggingConfig logging;
    TraceIdConfig trace_id;
};

[[nodiscard]] std::optional<RandomSourceKind> parse_random_source_kind(const std::string& name);

} // namespace tracectx
