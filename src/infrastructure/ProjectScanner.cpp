/**
 * @file ProjectScanner.cpp
 * @brief Implementation of the ProjectScanner.
 */

#include "infrastructure/ProjectScanner.hpp"
#include <algorithm>
#include <system_error>
#include "domain/ScanError.hpp"

namespace fs = std::filesystem;

namespace nodewastage::infrastructure {

namespace {

[[noreturn]] void ThrowListError(const fs::path& path, const std::error_code& ec) {
    throw domain::FilesystemError(path.string(), "cannot list " + path.string() + ": " + ec.message());
}

} // namespace

ProjectScanner::ProjectScanner(const fs::path& root, domain::ScanConventions conventions)
    : m_root(root), m_conventions(std::move(conventions)) {}

std::vector<domain::Project> ProjectScanner::scan() const {
    std::vector<domain::Project> projects;

    std::error_code ec;
    fs::path absoluteRoot = fs::absolute(m_root, ec);
    if (ec) ThrowListError(m_root, ec);

    fs::directory_iterator it(absoluteRoot, ec);
    const fs::directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        // Own type only: a symlink to a directory is not a project.
        auto status = it->symlink_status(ec);
        if (ec) ThrowListError(it->path(), ec);
        if (!fs::is_directory(status)) continue;

        projects.push_back({it->path().filename().string(), it->path().string()});
    }
    if (ec) ThrowListError(absoluteRoot, ec);

    std::sort(projects.begin(), projects.end(),
        [](const domain::Project& a, const domain::Project& b) { return a.name < b.name; });
    return projects;
}

bool ProjectScanner::isEligible(const domain::Project& project) const {
    bool hasMarker = false;
    bool hasDependencyTree = false;

    std::error_code ec;
    fs::directory_iterator it(project.path, ec);
    const fs::directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name == m_conventions.manifestMarker) {
            hasMarker = true;
        } else if (name == m_conventions.dependencyDir) {
            hasDependencyTree = true;
        }
    }
    if (ec) ThrowListError(project.path, ec);

    return hasMarker && hasDependencyTree;
}

fs::path ProjectScanner::dependencyTreeOf(const domain::Project& project) const {
    return fs::path(project.path) / m_conventions.dependencyDir;
}

} // namespace nodewastage::infrastructure
