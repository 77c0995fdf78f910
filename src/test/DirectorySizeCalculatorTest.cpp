#include <cassert>
#include <filesystem>
#include <iostream>

#include "domain/ScanError.hpp"
#include "infrastructure/DirectorySizeCalculator.hpp"
#include "TestFixtures.hpp"

namespace fs = std::filesystem;
using nodewastage::infrastructure::DirectorySizeCalculator;
using namespace nodewastage::test;

int main() {
    std::cout << "[Test] Starting DirectorySizeCalculator Test..." << std::endl;
    ScopedDir fixture("test_fixture_dirsize");
    const fs::path root = fixture.path();

    // Empty directory
    fs::create_directories(root / "empty");
    assert(DirectorySizeCalculator::Calculate(root / "empty") == 0);

    // Nested files are summed, directories contribute nothing
    WriteBytes(root / "pkg" / "a.js", 100);
    WriteBytes(root / "pkg" / "lib" / "b.js", 250);
    WriteBytes(root / "pkg" / "lib" / "deep" / "c.js", 674);
    fs::create_directories(root / "pkg" / "lib" / "empty");
    assert(DirectorySizeCalculator::Calculate(root / "pkg") == 1024);

    // Symlinks are not followed; each counts as the length of its target text
    fs::create_directories(root / "linked");
    WriteBytes(root / "linked" / "own.txt", 7);
    const fs::path absoluteTarget = fs::absolute(root / "pkg");
    std::error_code ec;
    fs::create_directory_symlink(absoluteTarget, root / "linked" / "loop", ec);
    if (!ec) {
        assert(DirectorySizeCalculator::Calculate(root / "linked") == 7 + absoluteTarget.native().size());

        // Relative bin link in a nested tree, as npm lays out node_modules/.bin
        WriteBytes(root / "tool" / "bin.js", 100);
        fs::create_directories(root / "tool" / "node_modules" / ".bin");
        fs::create_symlink("../../bin.js", root / "tool" / "node_modules" / ".bin" / "tool");
        assert(DirectorySizeCalculator::Calculate(root / "tool") == 100 + 12);

        // A dangling link still counts its own text
        fs::create_directories(root / "dangling");
        fs::create_symlink("nowhere", root / "dangling" / "gone");
        assert(DirectorySizeCalculator::Calculate(root / "dangling") == 7);
    } else {
        std::cout << "[WARN] Symlinks unsupported here, skipping symlink checks." << std::endl;
    }

    // A missing path is an error, not zero
    assert(Throws<nodewastage::domain::FilesystemError>(
        [&] { DirectorySizeCalculator::Calculate(root / "does-not-exist"); }));

    std::cout << "[PASS] DirectorySizeCalculator Test." << std::endl;
    return 0;
}
