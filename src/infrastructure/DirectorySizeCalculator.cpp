/**
 * @file DirectorySizeCalculator.cpp
 * @brief Implementation of DirectorySizeCalculator.
 */

#include "infrastructure/DirectorySizeCalculator.hpp"
#include <system_error>
#include "domain/ScanError.hpp"

namespace fs = std::filesystem;

namespace nodewastage::infrastructure {

namespace {

[[noreturn]] void ThrowWalkError(const fs::path& path, const std::error_code& ec) {
    throw domain::FilesystemError(path.string(), "cannot walk " + path.string() + ": " + ec.message());
}

// lstat-style size of a non-directory entry: file length for regular files,
// length of the target text for symlinks, 0 for special files.
std::uint64_t EntrySize(const fs::path& path, const fs::file_status& status) {
    std::error_code ec;
    if (fs::is_regular_file(status)) {
        auto size = fs::file_size(path, ec);
        if (ec) ThrowWalkError(path, ec);
        return size;
    }
    if (fs::is_symlink(status)) {
        auto target = fs::read_symlink(path, ec);
        if (ec) ThrowWalkError(path, ec);
        return target.native().size();
    }
    return 0;
}

} // namespace

std::uint64_t DirectorySizeCalculator::Calculate(const fs::path& directory) {
    std::error_code ec;
    auto rootStatus = fs::symlink_status(directory, ec);
    if (ec) ThrowWalkError(directory, ec);
    if (!fs::is_directory(rootStatus)) {
        return EntrySize(directory, rootStatus);
    }

    std::uint64_t total = 0;
    fs::recursive_directory_iterator it(directory, fs::directory_options::none, ec);
    const fs::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        auto status = entry.symlink_status(ec);
        if (ec) ThrowWalkError(entry.path(), ec);
        if (fs::is_directory(status)) continue;

        total += EntrySize(entry.path(), status);
    }
    if (ec) ThrowWalkError(directory, ec);
    return total;
}

} // namespace nodewastage::infrastructure
