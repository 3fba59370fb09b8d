#pragma once

/**
 * Argument parsing and report rendering for loopguard_cli.
 *
 * Kept in the library so the command line surface can be tested without
 * spawning the executable.
 */

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ClosedRange.hpp"

namespace loopguard::cli {

struct Options {
    std::vector<double> basalRates;
    std::vector<double> bolusVolumes;
    std::optional<double> scheduledBasalMax;
    std::optional<double> lowestCarbRatio;
    std::optional<double> suspendThreshold;
    std::optional<ClosedRange<double>> correctionRange;
    bool humanReadable = false;
    bool verbose = false;
    bool showSchema = false;
    bool showHelp = false;
};

/**
 * 0.05 to 30 in 0.05 steps, the increments most pumps accept for both
 * basal rates and bolus volumes.
 */
[[nodiscard]] std::vector<double> defaultIncrements();

/**
 * Parse a whole argument as a finite number.
 * @throws std::invalid_argument on trailing characters, empty input or NaN/Inf
 */
[[nodiscard]] double parseNumber(std::string_view text);

/**
 * Parse a comma separated list of finite numbers.
 * @throws std::invalid_argument if any item fails parseNumber
 */
[[nodiscard]] std::vector<double> parseNumberList(std::string_view text);

/**
 * Parse argv (argv[0] is skipped). Lists default to defaultIncrements().
 * @throws std::invalid_argument for unknown options, missing values or bad numbers
 */
[[nodiscard]] Options parseArguments(int argc, const char* const argv[]);

/**
 * One line per derived setting, JSONL unless options.humanReadable.
 * @throws GuardrailError if a derivation fails
 */
[[nodiscard]] std::vector<std::string> guardrailReport(const Options& options);

} // namespace loopguard::cli
