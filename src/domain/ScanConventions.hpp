/**
 * @file ScanConventions.hpp
 * @brief Conventional file and directory names the scanner looks for.
 */

#pragma once
#include <string>

namespace nodewastage::domain {

/**
 * @struct ScanConventions
 * @brief Names that mark an eligible project and identify installed packages.
 */
struct ScanConventions {
    std::string manifestMarker = "package.json";   ///< Project top-level marker file.
    std::string dependencyDir = "node_modules";    ///< Project dependency-tree directory.
    std::string packageManifest = "package.json";  ///< Descriptor inside each installed package.
};

} // namespace nodewastage::domain
