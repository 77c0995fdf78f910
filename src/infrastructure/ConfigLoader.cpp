/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>
#include <nlohmann/json.hpp>

namespace nodewastage::infrastructure {

namespace {

template <typename T>
void ReadIfPresent(const nlohmann::json& j, const char* key, T& target) {
    if (j.contains(key)) {
        target = j.at(key).get<T>();
    }
}

} // namespace

std::optional<ScanSettings> ConfigLoader::Load(const std::string& configPath, const ScanSettings& defaults) {
    std::error_code ec;
    bool found = std::filesystem::exists(configPath, ec);
    if (ec) {
        std::cerr << "[ConfigLoader] Cannot access settings file " << configPath << ": " << ec.message() << std::endl;
        return std::nullopt;
    }
    if (!found) {
        std::cerr << "[ConfigLoader] Settings file not found: " << configPath << std::endl;
        return std::nullopt;
    }

    std::ifstream f(configPath);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Cannot open settings file: " << configPath << std::endl;
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    return FromJson(buffer.str(), defaults, configPath);
}

std::optional<ScanSettings> ConfigLoader::FromJson(const std::string& text, const ScanSettings& defaults,
                                                   const std::string& source) {
    ScanSettings settings = defaults;
    try {
        nlohmann::json j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            std::cerr << "[ConfigLoader] " << source << ": expected a JSON object" << std::endl;
            return std::nullopt;
        }

        ReadIfPresent(j, "root", settings.root);
        ReadIfPresent(j, "report_path", settings.reportPath);
        ReadIfPresent(j, "keep_going", settings.keepGoing);
        ReadIfPresent(j, "progress", settings.showProgress);
        ReadIfPresent(j, "manifest_marker", settings.conventions.manifestMarker);
        ReadIfPresent(j, "dependency_dir", settings.conventions.dependencyDir);
        ReadIfPresent(j, "package_manifest", settings.conventions.packageManifest);

        if (j.contains("workers")) {
            const auto& workers = j.at("workers");
            // Unsigned values above LLONG_MAX must not wrap into range.
            bool inRange = workers.is_number_unsigned()
                ? workers.get<std::uint64_t>() >= 1 && workers.get<std::uint64_t>() <= ScanSettings::kMaxWorkers
                : workers.is_number_integer() && workers.get<long long>() >= 1
                    && workers.get<long long>() <= static_cast<long long>(ScanSettings::kMaxWorkers);
            if (!inRange) {
                std::cerr << "[ConfigLoader] " << source << ": 'workers' must be an integer between 1 and "
                          << ScanSettings::kMaxWorkers << std::endl;
                return std::nullopt;
            }
            settings.workers = workers.get<unsigned>();
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << source << ": " << e.what() << std::endl;
        return std::nullopt;
    }

    return settings;
}

} // namespace nodewastage::infrastructure
