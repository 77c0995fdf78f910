/**
 * @file PackageUsage.hpp
 * @brief Domain entities describing installed packages and their disk usage.
 */

#pragma once
#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

namespace nodewastage::domain {

/**
 * @struct Project
 * @brief A directory directly under the scan root.
 */
struct Project {
    std::string name; ///< Directory name.
    std::string path; ///< Absolute path.
};

/**
 * @struct PackageManifest
 * @brief Identity fields declared by an installed package's manifest.
 */
struct PackageManifest {
    std::string name;
    std::string version;
};

/**
 * @struct PackageIdentity
 * @brief Deduplication key: the exact (name, version) pair.
 */
struct PackageIdentity {
    std::string name;
    std::string version;

    /** @brief Composite rendering `name:version`. */
    std::string key() const { return name + ":" + version; }

    bool operator<(const PackageIdentity& other) const {
        return std::tie(name, version) < std::tie(other.name, other.version);
    }
    bool operator==(const PackageIdentity& other) const {
        return name == other.name && version == other.version;
    }
};

/**
 * @struct UsageRecord
 * @brief One observed install of a package at one location.
 */
struct UsageRecord {
    std::string packageName;
    std::string packageVersion;
    std::string location;    ///< Install directory of the package.
    std::uint64_t sizeBytes = 0;

    PackageIdentity identity() const { return {packageName, packageVersion}; }
};

/**
 * @struct AggregatedUsage
 * @brief One report row: every install of a single identity.
 *
 * The representative size is the size of the first discovered install and is
 * assumed to hold for every other install of the same identity.
 */
struct AggregatedUsage {
    std::string packageName;
    std::string packageVersion;
    std::vector<UsageRecord> instances; ///< Discovery order.
    std::uint64_t representativeSize = 0;

    std::size_t instanceCount() const { return instances.size(); }
    std::uint64_t totalSize() const {
        return static_cast<std::uint64_t>(instances.size()) * representativeSize;
    }
};

} // namespace nodewastage::domain
