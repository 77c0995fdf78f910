/**
 * @file DirectorySizeCalculator.hpp
 * @brief Recursive on-disk size of a directory subtree.
 */

#pragma once
#include <cstdint>
#include <filesystem>

namespace nodewastage::infrastructure {

class DirectorySizeCalculator {
public:
    /**
     * @brief Sums the sizes of all non-directory entries below @p directory.
     *
     * Symlinks are not followed; each one counts as the length of its target
     * path. Directories and special files contribute nothing.
     * @throws domain::FilesystemError on the first error met during the walk.
     */
    static std::uint64_t Calculate(const std::filesystem::path& directory);
};

} // namespace nodewastage::infrastructure
