/**
 * LoopGuard CLI - prints the guardrails for a set of therapy settings
 *
 * Usage:
 *   loopguard_cli --schema                       # Output API schema as JSON
 *   loopguard_cli                                # Guardrails for a default pump (JSONL output)
 *   loopguard_cli --correction-range 100,120 --suspend-threshold 75 --human
 *   loopguard_cli --help                         # Show help
 */

#include <exception>
#include <iostream>
#include <string>

#include <fmt/format.h>

#include <loopguard/LoopGuard.hpp>

namespace {

void printHelp() {
    std::cout << R"(
LoopGuard CLI v)" << loopguard::Version::STRING << R"(

Usage:
  loopguard_cli [OPTIONS]

Options:
  --schema                    Output API schema as JSON
  --basal-rates A,B,...       Supported basal rates in U/hr (default 0.05 to 30 by 0.05)
  --bolus-volumes A,B,...     Supported bolus volumes in U (default 0.05 to 30 by 0.05)
  --scheduled-basal-max X     Highest scheduled basal rate in U/hr
  --lowest-carb-ratio X       Lowest configured carb ratio in g/U
  --suspend-threshold X       Suspend threshold in mg/dL
  --correction-range LO,HI    Correction range in mg/dL
  --human                     Human-readable output (default is JSONL)
  --verbose                   Log debug messages to stderr
  --help, -h                  Show this help message

)" << std::endl;
}

void logFailure(const std::exception& e) {
    loopguard::Log::write(loopguard::LogLevel::Error, fmt::format("loopguard_cli: {}", e.what()));
}

} // namespace

int main(int argc, char* argv[]) {
    loopguard::cli::Options options;
    try {
        options = loopguard::cli::parseArguments(argc, argv);
    } catch (const std::exception& e) {
        logFailure(e);
        printHelp();
        return 1;
    }

    if (options.showHelp) {
        printHelp();
        return 0;
    }
    if (options.verbose) {
        loopguard::Log::setMinimumLevel(loopguard::LogLevel::Debug);
    }
    if (options.showSchema) {
        std::cout << loopguard::describe_api_json() << std::endl;
        return 0;
    }

    try {
        for (const auto& line : loopguard::cli::guardrailReport(options)) {
            std::cout << line << std::endl;
        }
    } catch (const std::exception& e) {
        logFailure(e);
        return 1;
    }
    return 0;
}
