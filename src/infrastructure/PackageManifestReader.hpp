/**
 * @file PackageManifestReader.hpp
 * @brief Reads the identity of an installed package from its manifest.
 */

#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include "domain/PackageUsage.hpp"

namespace nodewastage::infrastructure {

/**
 * @class PackageManifestReader
 * @brief Parses a package's JSON manifest and extracts `name` and `version`.
 */
class PackageManifestReader {
public:
    explicit PackageManifestReader(std::string manifestFileName = "package.json");

    /**
     * @brief Reads the manifest inside @p packageDir.
     * @return The manifest, or std::nullopt when the package has no manifest file.
     * @throws domain::InvalidManifestError if the file is malformed or lacks string fields.
     * @throws domain::FilesystemError if the file exists but cannot be read.
     */
    std::optional<domain::PackageManifest> read(const std::filesystem::path& packageDir) const;

    /**
     * @brief Validates already-loaded manifest text.
     * @param source Path used in error messages.
     */
    static domain::PackageManifest Parse(const std::string& text, const std::string& source);

private:
    std::string m_manifestFileName;
};

} // namespace nodewastage::infrastructure
