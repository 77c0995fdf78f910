/**
 * @file ProjectScanner.hpp
 * @brief Discovers candidate projects under the scan root.
 */

#pragma once
#include <filesystem>
#include <vector>
#include "domain/PackageUsage.hpp"
#include "domain/ScanConventions.hpp"

namespace nodewastage::infrastructure {

/**
 * @class ProjectScanner
 * @brief Infrastructure adapter that lists projects and checks their eligibility.
 */
class ProjectScanner {
public:
    ProjectScanner(const std::filesystem::path& root, domain::ScanConventions conventions);

    /**
     * @brief Lists the immediate subdirectories of the root.
     * @return Projects sorted by directory name; non-directory entries are ignored.
     * @throws domain::FilesystemError if the root cannot be listed.
     */
    std::vector<domain::Project> scan() const;

    /**
     * @brief Checks that the project carries both the manifest marker and the dependency-tree directory.
     * @throws domain::FilesystemError if the project directory cannot be listed.
     */
    bool isEligible(const domain::Project& project) const;

    /** @brief Path of the project's dependency-tree directory. */
    std::filesystem::path dependencyTreeOf(const domain::Project& project) const;

private:
    std::filesystem::path m_root;
    domain::ScanConventions m_conventions;
};

} // namespace nodewastage::infrastructure
