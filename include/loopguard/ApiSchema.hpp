#pragma once

/**
 * API Introspection / Self-Description System
 *
 * Describes the guardrail derivation operations as JSON so tools can
 * discover them without reading source code. The CLI prints this for
 * --schema.
 */

#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include "GuardrailPolicy.hpp"

namespace loopguard {

/**
 * One input of a guardrail operation. Bounds are present only for scalar
 * settings that have a guardrail of their own.
 */
struct ParamInfo {
    std::string name;
    std::string type;          // "float", "float[]", "range", "range[]", "enum", "int"
    std::string description;
    std::string unit;
    std::optional<std::pair<double, double>> bounds;
    bool optional = false;

    [[nodiscard]] std::string toJson() const {
        std::string json = fmt::format(R"({{"name":"{}","type":"{}","description":"{}")", name, type, description);
        if (!unit.empty()) {
            json += fmt::format(R"(,"unit":"{}")", unit);
        }
        if (bounds) {
            json += fmt::format(R"(,"min":{},"max":{})", bounds->first, bounds->second);
        }
        if (optional) {
            json += R"(,"optional":true)";
        }
        return json + "}";
    }
};

template<typename T>
[[nodiscard]] std::string toJsonArray(const std::vector<T>& items) {
    std::vector<std::string> rendered;
    rendered.reserve(items.size());
    for (const auto& item : items) {
        rendered.push_back(item.toJson());
    }
    return fmt::format("[{}]", fmt::join(rendered, ","));
}

struct CommandInfo {
    std::string name;
    std::string description;
    std::vector<ParamInfo> params;
    std::string returns;       // "Guardrail" or "Quantity"

    [[nodiscard]] std::string toJson() const {
        return fmt::format(R"({{"name":"{}","description":"{}","params":{},"returns":"{}"}})",
                           name, description, toJsonArray(params), returns);
    }
};

struct ApiSchema {
    std::string name;
    std::string version;
    std::string description;
    std::vector<CommandInfo> commands;

    [[nodiscard]] std::string toJson() const {
        return fmt::format(R"({{"name":"{}","version":"{}","description":"{}","commands":{}}})",
                           name, version, description, toJsonArray(commands));
    }
};

/**
 * Get the LoopGuard API schema for introspection.
 */
[[nodiscard]] inline ApiSchema describe_api() {
    ApiSchema schema;
    schema.name = "loopguard";
    schema.version = Version::STRING;
    schema.description = "Safety bounds for automated insulin delivery therapy settings. "
                         "Each operation returns absolute and recommended bounds, a unit and an optional starting suggestion.";

    const ParamInfo suspendThreshold{"suspend_threshold", "float", "Configured suspend threshold", "mg/dL",
                                     std::pair{SuspendThresholdPolicy::ABSOLUTE_MIN, SuspendThresholdPolicy::ABSOLUTE_MAX},
                                     true};
    const ParamInfo supportedBasalRates{"supported_basal_rates", "float[]", "Basal rates the pump accepts, ascending",
                                        "U/hr", std::nullopt, false};

    schema.commands = {
        {"suspend_threshold", "Fixed suspend threshold guardrail", {}, "Guardrail"},
        {
            "max_suspend_threshold_value",
            "Highest suspend threshold allowed by the correction range schedule and overrides",
            {
                {"correction_range_schedule", "range[]", "Correction range schedule", "mg/dL", std::nullopt, true},
                {"pre_meal_target_range", "range", "Pre-meal override range", "mg/dL", std::nullopt, true},
                {"workout_target_range", "range", "Workout override range", "mg/dL", std::nullopt, true}
            },
            "Quantity"
        },
        {"correction_range", "Fixed correction range guardrail", {}, "Guardrail"},
        {
            "min_correction_range_value",
            "Lowest correction range value allowed by the suspend threshold",
            {suspendThreshold},
            "Quantity"
        },
        {
            "correction_range_override",
            "Guardrail for a pre-meal or workout override",
            {
                {"preset", "enum", "pre_meal or workout", "", std::nullopt, false},
                {"correction_range_schedule_range", "range", "Lowest to highest scheduled correction target",
                 "mg/dL", std::nullopt, false},
                suspendThreshold
            },
            "Guardrail"
        },
        {"insulin_sensitivity", "Fixed insulin sensitivity guardrail", {}, "Guardrail"},
        {"carb_ratio", "Fixed carb ratio guardrail", {}, "Guardrail"},
        {"basal_rate", "Scheduled basal rate guardrail", {supportedBasalRates}, "Guardrail"},
        {
            "maximum_basal_rate",
            "Maximum basal rate guardrail",
            {
                supportedBasalRates,
                {"scheduled_basal_range", "range", "Lowest to highest scheduled basal rate", "U/hr", std::nullopt, true},
                {"lowest_carb_ratio", "float", "Most aggressive configured carb ratio", "g/U",
                 std::pair{CarbRatioPolicy::ABSOLUTE_MIN, CarbRatioPolicy::ABSOLUTE_MAX}, true},
                {"decimal_places", "int", "Precision for matching supported rates", "", std::nullopt, true}
            },
            "Guardrail"
        },
        {
            "maximum_bolus",
            "Maximum bolus guardrail",
            {{"supported_bolus_volumes", "float[]", "Bolus volumes the pump accepts, ascending", "U", std::nullopt, false}},
            "Guardrail"
        }
    };

    return schema;
}

/**
 * JSON-formatted schema string.
 */
[[nodiscard]] inline std::string describe_api_json() {
    return describe_api().toJson();
}

} // namespace loopguard
