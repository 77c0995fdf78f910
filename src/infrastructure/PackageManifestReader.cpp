/**
 * @file PackageManifestReader.cpp
 * @brief Implementation of PackageManifestReader.
 */

#include "infrastructure/PackageManifestReader.hpp"
#include <fstream>
#include <sstream>
#include <system_error>
#include <nlohmann/json.hpp>
#include "domain/ScanError.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace nodewastage::infrastructure {

namespace {

std::string RequireString(const json& j, const char* field, const std::string& source) {
    auto it = j.find(field);
    if (it == j.end()) {
        throw domain::InvalidManifestError(source, source + ": missing '" + field + "' field");
    }
    if (!it->is_string()) {
        throw domain::InvalidManifestError(
            source, source + ": '" + field + "' must be a string, got " + it->type_name());
    }
    return it->get<std::string>();
}

} // namespace

PackageManifestReader::PackageManifestReader(std::string manifestFileName)
    : m_manifestFileName(std::move(manifestFileName)) {}

std::optional<domain::PackageManifest> PackageManifestReader::read(const fs::path& packageDir) const {
    fs::path manifestPath = packageDir / m_manifestFileName;

    std::error_code ec;
    auto status = fs::status(manifestPath, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
            return std::nullopt;
        }
        throw domain::FilesystemError(manifestPath.string(),
                                      "cannot stat " + manifestPath.string() + ": " + ec.message());
    }
    if (!fs::exists(status)) {
        return std::nullopt;
    }

    std::ifstream in(manifestPath, std::ios::binary);
    if (!in.is_open()) {
        throw domain::FilesystemError(manifestPath.string(), "cannot open " + manifestPath.string());
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw domain::FilesystemError(manifestPath.string(), "cannot read " + manifestPath.string());
    }

    return Parse(buffer.str(), manifestPath.string());
}

domain::PackageManifest PackageManifestReader::Parse(const std::string& text, const std::string& source) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw domain::InvalidManifestError(source, source + ": " + e.what());
    }

    if (!j.is_object()) {
        throw domain::InvalidManifestError(
            source, source + ": manifest must be a JSON object, got " + std::string(j.type_name()));
    }

    domain::PackageManifest manifest;
    manifest.name = RequireString(j, "name", source);
    manifest.version = RequireString(j, "version", source);
    return manifest;
}

} // namespace nodewastage::infrastructure
