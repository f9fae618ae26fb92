#pragma once

#include "config/config_types.hpp"

#include <string>
#include <vector>

namespace tracectx {

// ============================================================================
// ConfigLoader - Extract typed config from TOML
// ============================================================================

/**
 * Recognized layout:
 *
 *   [logging]
 *   level = "info"            # info | warn | error
 *
 *   [trace_id]
 *   random_source = "secure"  # secure | seeded
 *   seed = 42                 # required for seeded
 *
 * String values may reference environment variables as ${VAR_NAME}.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        TraceContextConfig config;

        static LoadResult ok(TraceContextConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file
     * @param config_path Path to the .toml file
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from a TOML string
     * @param toml_content TOML content
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Collect every validation error (empty = valid)
    [[nodiscard]] static std::vector<std::string> validate_config(const TraceContextConfig& config);

private:
    static LoadResult validate_and_return(TraceContextConfig config);
};

/// Apply [logging] settings to the process-wide logger
void apply_logging(const LoggingConfig& config);

} // namespace tracectx
