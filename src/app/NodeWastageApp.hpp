/**
 * @file NodeWastageApp.hpp
 * @brief Command-line application: parses flags, runs the scan, writes the report.
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "infrastructure/ConfigLoader.hpp"

namespace nodewastage::app {

/**
 * @struct CommandLine
 * @brief Flags as given; unset values fall back to the settings file or defaults.
 */
struct CommandLine {
    std::optional<std::string> configPath;
    std::optional<std::string> root;
    std::optional<std::string> reportPath;
    std::optional<unsigned> workers;
    bool keepGoing = false;
    bool noProgress = false;
    bool help = false;
};

/**
 * @class NodeWastageApp
 * @brief Orchestrates one run from arguments to exit code.
 *
 * Exit codes: 0 success, 1 usage or fatal scan error (no report written),
 * 2 report written but some entries could not be analyzed.
 */
class NodeWastageApp {
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitFailure = 1;
    static constexpr int kExitPartial = 2;

    /**
     * @brief Runs the application.
     * @return Process exit code.
     */
    int Run(const std::vector<std::string>& args);

    /**
     * @brief Parses flags (program name excluded).
     * @throws std::invalid_argument on an unknown flag or a missing/invalid value.
     */
    static CommandLine ParseArguments(const std::vector<std::string>& args);

    /**
     * @brief Merges the settings file (if any) with the flags.
     * @return nullopt if the settings file was given but could not be loaded.
     */
    static std::optional<infrastructure::ScanSettings> ResolveSettings(const CommandLine& cli);

    /** @brief Elapsed time as "850ms" or "2.31s". */
    static std::string FormatElapsed(std::chrono::steady_clock::duration elapsed);

    static std::string Usage();

private:
    int Scan(const infrastructure::ScanSettings& settings);
};

} // namespace nodewastage::app
