#include "loopguard/Cli.hpp"

#include <cmath>
#include <cstring>
#include <stdexcept>

#include <fmt/format.h>

#include "loopguard/Guardrails.hpp"
#include "loopguard/settings/CorrectionRangeOverrides.hpp"
#include "loopguard/settings/GlucoseRangeSchedule.hpp"
#include "loopguard/settings/GlucoseThreshold.hpp"

namespace loopguard::cli {

using settings::CorrectionRangeOverrides;
using settings::GlucoseRangeSchedule;
using settings::GlucoseThreshold;

namespace {

std::string render(const Options& options, const std::string& setting, const Guardrail& guardrail) {
    if (options.humanReadable) {
        return fmt::format("{:<28} {}", setting, guardrail.toString());
    }
    return fmt::format(R"({{"setting":"{}","guardrail":{}}})", setting, guardrail.toJson());
}

std::string render(const Options& options, const std::string& setting, const Quantity& value) {
    if (options.humanReadable) {
        return fmt::format("{:<28} {}", setting, value.toString());
    }
    return fmt::format(R"({{"setting":"{}","value":{},"unit":"{}"}})",
                       setting, value.doubleValue(value.unit()), loopguard::toString(value.unit()));
}

} // namespace

std::vector<double> defaultIncrements() {
    std::vector<double> values;
    for (int i = 1; i <= 600; ++i) {
        values.push_back(i / 20.0);
    }
    return values;
}

double parseNumber(std::string_view text) {
    std::string item(text);
    std::size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(item, &consumed);
    } catch (const std::logic_error&) {
        throw std::invalid_argument(fmt::format("Not a number: '{}'", item));
    }
    if (consumed != item.size()) {
        throw std::invalid_argument(fmt::format("Not a number: '{}'", item));
    }
    if (!std::isfinite(value)) {
        throw std::invalid_argument(fmt::format("Number must be finite: '{}'", item));
    }
    return value;
}

std::vector<double> parseNumberList(std::string_view text) {
    std::vector<double> values;
    std::size_t start = 0;
    while (true) {
        std::size_t comma = text.find(',', start);
        values.push_back(parseNumber(text.substr(start, comma == std::string_view::npos ? comma : comma - start)));
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return values;
}

Options parseArguments(int argc, const char* const argv[]) {
    Options options;
    options.basalRates = defaultIncrements();
    options.bolusVolumes = defaultIncrements();

    for (int i = 1; i < argc; ++i) {
        auto value = [&]() -> std::string_view {
            if (i + 1 >= argc) {
                throw std::invalid_argument(fmt::format("Missing value for {}", argv[i]));
            }
            return argv[++i];
        };

        if (std::strcmp(argv[i], "--schema") == 0) {
            options.showSchema = true;
        } else if (std::strcmp(argv[i], "--basal-rates") == 0) {
            options.basalRates = parseNumberList(value());
        } else if (std::strcmp(argv[i], "--bolus-volumes") == 0) {
            options.bolusVolumes = parseNumberList(value());
        } else if (std::strcmp(argv[i], "--scheduled-basal-max") == 0) {
            options.scheduledBasalMax = parseNumber(value());
        } else if (std::strcmp(argv[i], "--lowest-carb-ratio") == 0) {
            options.lowestCarbRatio = parseNumber(value());
        } else if (std::strcmp(argv[i], "--suspend-threshold") == 0) {
            options.suspendThreshold = parseNumber(value());
        } else if (std::strcmp(argv[i], "--correction-range") == 0) {
            auto bounds = parseNumberList(value());
            if (bounds.size() != 2) {
                throw std::invalid_argument("--correction-range expects LO,HI");
            }
            options.correctionRange.emplace(bounds[0], bounds[1]);
        } else if (std::strcmp(argv[i], "--human") == 0) {
            options.humanReadable = true;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            options.verbose = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            options.showHelp = true;
        } else {
            throw std::invalid_argument(fmt::format("Unknown option: {}", argv[i]));
        }
    }
    return options;
}

std::vector<std::string> guardrailReport(const Options& options) {
    std::optional<GlucoseThreshold> suspendThreshold;
    if (options.suspendThreshold) {
        suspendThreshold.emplace(Unit::MilligramsPerDeciliter, *options.suspendThreshold);
    }
    std::optional<GlucoseRangeSchedule> schedule;
    if (options.correctionRange) {
        schedule.emplace(Unit::MilligramsPerDeciliter,
                         std::vector<GlucoseRangeSchedule::Item>{{0, *options.correctionRange}});
    }

    std::vector<std::string> lines;
    lines.push_back(render(options, "suspend_threshold", Guardrails::suspendThreshold()));
    lines.push_back(render(options, "max_suspend_threshold_value",
                           Guardrails::maxSuspendThresholdValue(schedule, std::nullopt, std::nullopt)));
    lines.push_back(render(options, "correction_range", Guardrails::correctionRange()));
    lines.push_back(render(options, "min_correction_range_value",
                           Guardrails::minCorrectionRangeValue(suspendThreshold)));
    if (schedule) {
        lines.push_back(render(options, "pre_meal_override", Guardrails::correctionRangeOverride(
            CorrectionRangeOverrides::Preset::PreMeal, *schedule, suspendThreshold)));
        lines.push_back(render(options, "workout_override", Guardrails::correctionRangeOverride(
            CorrectionRangeOverrides::Preset::Workout, *schedule, suspendThreshold)));
    }
    lines.push_back(render(options, "insulin_sensitivity", Guardrails::insulinSensitivity()));
    lines.push_back(render(options, "carb_ratio", Guardrails::carbRatio()));
    lines.push_back(render(options, "basal_rate", Guardrails::basalRate(options.basalRates)));

    std::optional<ClosedRange<double>> scheduledBasalRange;
    if (options.scheduledBasalMax) {
        scheduledBasalRange.emplace(*options.scheduledBasalMax, *options.scheduledBasalMax);
    }
    lines.push_back(render(options, "maximum_basal_rate",
                           Guardrails::maximumBasalRate(options.basalRates, scheduledBasalRange,
                                                        options.lowestCarbRatio)));
    lines.push_back(render(options, "maximum_bolus", Guardrails::maximumBolus(options.bolusVolumes)));
    return lines;
}

} // namespace loopguard::cli
