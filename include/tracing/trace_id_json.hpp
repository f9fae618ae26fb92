#pragma once

#include "tracing/trace_id.hpp"

#include <nlohmann/json.hpp>

#include <format>
#include <stdexcept>
#include <string>

namespace tracectx {

/**
 * @brief nlohmann::json binding: a TraceId is its hex string
 *
 * from_json throws nlohmann::json::type_error for non-string values and
 * std::invalid_argument for malformed hex.
 */
inline void to_json(nlohmann::json& j, const TraceId& trace_id) {
    j = trace_id.to_hex();
}

inline void from_json(const nlohmann::json& j, TraceId& trace_id) {
    const auto hex = j.get<std::string>();
    auto result = TraceId::from_hex(hex);
    if (result.is_error()) {
        throw std::invalid_argument(std::format("Invalid trace ID: {}", result.error_message()));
    }
    trace_id = result.value();
}

} // namespace tracectx
