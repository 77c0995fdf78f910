#include <cassert>
#include <filesystem>
#include <iostream>

#include "domain/ScanError.hpp"
#include "infrastructure/PackageManifestReader.hpp"
#include "TestFixtures.hpp"

namespace fs = std::filesystem;
using nodewastage::domain::InvalidManifestError;
using nodewastage::infrastructure::PackageManifestReader;
using namespace nodewastage::test;

int main() {
    std::cout << "[Test] Starting PackageManifestReader Test..." << std::endl;
    ScopedDir fixture("test_fixture_manifest");
    const fs::path root = fixture.path();
    PackageManifestReader reader;

    // Well-formed manifest, extra fields ignored
    WriteFile(root / "ok" / "package.json",
              R"({"name": "left-pad", "version": "1.0.0", "main": "index.js", "dependencies": {}})");
    auto manifest = reader.read(root / "ok");
    assert(manifest.has_value());
    assert(manifest->name == "left-pad");
    assert(manifest->version == "1.0.0");

    // Missing manifest means "skip", not an error
    fs::create_directories(root / "no-manifest");
    assert(!reader.read(root / "no-manifest").has_value());

    // Malformed JSON
    WriteFile(root / "broken" / "package.json", "{\"name\": \"x\",");
    assert(Throws<InvalidManifestError>([&] { reader.read(root / "broken"); }));

    // Version is a number
    WriteFile(root / "numeric" / "package.json", R"({"name": "x", "version": 1})");
    assert(Throws<InvalidManifestError>([&] { reader.read(root / "numeric"); }));

    // Missing name
    WriteFile(root / "nameless" / "package.json", R"({"version": "1.0.0"})");
    assert(Throws<InvalidManifestError>([&] { reader.read(root / "nameless"); }));

    // Not an object
    WriteFile(root / "array" / "package.json", R"(["left-pad", "1.0.0"])");
    assert(Throws<InvalidManifestError>([&] { reader.read(root / "array"); }));

    // Custom manifest file name
    PackageManifestReader custom("bower.json");
    WriteFile(root / "bower" / "bower.json", ManifestJson("jquery", "3.7.1"));
    auto bower = custom.read(root / "bower");
    assert(bower && bower->name == "jquery" && bower->version == "3.7.1");
    assert(!custom.read(root / "ok").has_value());

    // Error messages carry the manifest path
    try {
        PackageManifestReader::Parse(R"({"name": "x", "version": null})", "some/package.json");
        assert(false && "Parse should reject a null version.");
    } catch (const InvalidManifestError& e) {
        assert(e.path() == "some/package.json");
        assert(std::string(e.what()).find("version") != std::string::npos);
    }

    std::cout << "[PASS] PackageManifestReader Test." << std::endl;
    return 0;
}
