#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <charconv>
#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace tracectx {

// ============================================================================
// TOML Parsing Helpers
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        }
    }
}

// ---- Section extractors ----------------------------------------------------

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

// Integer, or a decimal string so the seed can come from ${ENV}
std::optional<uint64_t> extract_seed(const toml::node_view<const toml::node> node) {
    if (!node) return std::nullopt;

    if (const auto* i = node.as_integer()) {
        const int64_t seed = i->get();
        if (seed < 0) {
            throw std::runtime_error(
                std::format("trace_id.seed must be non-negative, got {}", seed));
        }
        return static_cast<uint64_t>(seed);
    }

    if (const auto* s = node.as_string()) {
        const std::string& text = s->get();
        uint64_t seed = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), seed);
        if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
            throw std::runtime_error(
                std::format("trace_id.seed must be a non-negative integer, got \"{}\"", text));
        }
        return seed;
    }

    throw std::runtime_error("trace_id.seed must be an integer");
}

TraceIdConfig extract_trace_id(const toml::table& root) {
    TraceIdConfig cfg;
    const auto* t = root["trace_id"].as_table();
    if (!t) return cfg;

    cfg.random_source = (*t)["random_source"].value_or("secure"s);
    cfg.seed = extract_seed((*t)["seed"]);
    return cfg;
}

TraceContextConfig extract_all_sections(const toml::table& tbl) {
    TraceContextConfig config;
    config.logging = extract_logging(tbl);
    config.trace_id = extract_trace_id(tbl);
    return config;
}

} // anonymous namespace

std::optional<RandomSourceKind> parse_random_source_kind(const std::string& name) {
    const std::string lower = utils::to_lower(name);
    if (lower == "secure") return RandomSourceKind::SECURE;
    if (lower == "seeded") return RandomSourceKind::SEEDED;
    return std::nullopt;
}

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::validate_and_return(TraceContextConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const TraceContextConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be info, warn or error, got '{}'", config.logging.level));
    }

    const auto kind = parse_random_source_kind(config.trace_id.random_source);
    if (!kind) {
        errors.push_back(std::format(
            "trace_id.random_source must be secure or seeded, got '{}'",
            config.trace_id.random_source));
    } else if (*kind == RandomSourceKind::SEEDED && !config.trace_id.seed) {
        errors.push_back("trace_id.seed required when random_source is seeded");
    }

    return errors;
}

void apply_logging(const LoggingConfig& config) {
    const auto level = utils::log::parse_level(config.level);
    if (!level) {
        utils::log::warn(std::format("Unknown log level '{}', keeping current", config.level));
        return;
    }
    utils::log::set_level(*level);
}

} // namespace tracectx
