/**
 * @file ScanError.hpp
 * @brief Exception types raised while scanning dependency trees.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace nodewastage::domain {

/**
 * @class ScanError
 * @brief Base for every failure attributable to a path under the scan root.
 */
class ScanError : public std::runtime_error {
public:
    ScanError(const std::string& path, const std::string& message)
        : std::runtime_error(message), m_path(path) {}

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

/** @brief A directory or file could not be listed, stat'ed, read or written. */
class FilesystemError : public ScanError {
public:
    using ScanError::ScanError;
};

/** @brief A package manifest is unparsable or lacks string `name`/`version`. */
class InvalidManifestError : public ScanError {
public:
    using ScanError::ScanError;
};

/**
 * @struct ScanFailure
 * @brief A recorded failure when the scan is allowed to continue past errors.
 */
struct ScanFailure {
    std::string path;
    std::string message;
};

} // namespace nodewastage::domain
