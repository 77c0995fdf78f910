/**
 * @file PackageTraverser.hpp
 * @brief Walks one dependency-tree directory and records each installed package.
 */

#pragma once

#include <filesystem>
#include <vector>
#include "domain/ScanError.hpp"
#include "domain/UsageTable.hpp"
#include "infrastructure/PackageManifestReader.hpp"

namespace nodewastage::application {

/**
 * @class PackageTraverser
 * @brief Records a UsageRecord for every top-level package under a dependency tree.
 *
 * Only immediate subdirectories are considered; nested dependency trees inside
 * a package are not visited.
 */
class PackageTraverser {
public:
    explicit PackageTraverser(const infrastructure::PackageManifestReader& reader);

    /**
     * @brief Traverses @p dependencyTree, appending one record per package to @p table.
     *
     * Entries without a manifest are skipped. When @p failures is null, the
     * first error aborts the traversal; records appended before it stay in the
     * table. When @p failures is given, a failing package is recorded there and
     * its siblings are still processed.
     *
     * @return Number of entries in the dependency tree, skipped ones included.
     * @throws domain::ScanError when the tree cannot be listed, or per package when not isolating.
     */
    std::size_t traverse(const std::filesystem::path& dependencyTree,
                         domain::UsageTable& table,
                         std::vector<domain::ScanFailure>* failures = nullptr) const;

private:
    void recordPackage(const std::filesystem::path& packageDir, domain::UsageTable& table) const;

    const infrastructure::PackageManifestReader& m_reader;
};

} // namespace nodewastage::application
