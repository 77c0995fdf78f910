#include "application/PackageTraverser.hpp"
#include <algorithm>
#include <system_error>
#include "infrastructure/DirectorySizeCalculator.hpp"

namespace fs = std::filesystem;

namespace nodewastage::application {

PackageTraverser::PackageTraverser(const infrastructure::PackageManifestReader& reader)
    : m_reader(reader) {}

std::size_t PackageTraverser::traverse(const fs::path& dependencyTree,
                                       domain::UsageTable& table,
                                       std::vector<domain::ScanFailure>* failures) const {
    std::vector<fs::path> packageDirs;
    std::size_t entries = 0;

    std::error_code ec;
    fs::directory_iterator it(dependencyTree, ec);
    const fs::directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        ++entries;
        auto status = it->symlink_status(ec);
        if (ec) break;
        if (fs::is_directory(status)) {
            packageDirs.push_back(it->path());
        }
    }
    if (ec) {
        throw domain::FilesystemError(dependencyTree.string(),
                                      "cannot list " + dependencyTree.string() + ": " + ec.message());
    }

    std::sort(packageDirs.begin(), packageDirs.end());

    for (const auto& packageDir : packageDirs) {
        if (!failures) {
            recordPackage(packageDir, table);
            continue;
        }
        try {
            recordPackage(packageDir, table);
        } catch (const domain::ScanError& e) {
            failures->push_back({e.path(), e.what()});
        }
    }

    return entries;
}

void PackageTraverser::recordPackage(const fs::path& packageDir, domain::UsageTable& table) const {
    auto manifest = m_reader.read(packageDir);
    if (!manifest) {
        return;
    }

    domain::UsageRecord record;
    record.packageName = std::move(manifest->name);
    record.packageVersion = std::move(manifest->version);
    record.location = packageDir.string();
    record.sizeBytes = infrastructure::DirectorySizeCalculator::Calculate(packageDir);
    table.append(std::move(record));
}

} // namespace nodewastage::application
