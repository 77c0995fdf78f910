/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading scan settings from a JSON file.
 *
 * Lets a scan be described once (root, report location, conventions) instead
 * of being repeated on every command line.
 */

#pragma once

#include <optional>
#include <string>
#include "domain/ScanConventions.hpp"

namespace nodewastage::infrastructure {

/**
 * @struct ScanSettings
 * @brief Everything the application needs to run one scan.
 */
struct ScanSettings {
    static constexpr unsigned kMaxWorkers = 1024;


    std::string root;                        ///< Directory holding the projects. Required.
    std::string reportPath = "results.txt";  ///< Report destination, relative to the working directory.
    unsigned workers = 1;                    ///< Projects processed concurrently.
    bool keepGoing = false;                  ///< Record per-package failures instead of aborting.
    bool showProgress = true;
    domain::ScanConventions conventions;
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from a JSON file, starting from @p defaults.
     * @param configPath Path to the settings file.
     * @return The merged settings, or nullopt if the file is missing, malformed or wrongly typed.
     */
    static std::optional<ScanSettings> Load(const std::string& configPath, const ScanSettings& defaults = {});

    /**
     * @brief Same as Load, from already-read JSON text.
     * @param source Name used in diagnostics.
     */
    static std::optional<ScanSettings> FromJson(const std::string& text, const ScanSettings& defaults,
                                                const std::string& source = "settings");
};

} // namespace nodewastage::infrastructure
