#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "app/NodeWastageApp.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "TestFixtures.hpp"

namespace fs = std::filesystem;
using namespace nodewastage;
using namespace nodewastage::test;
using app::NodeWastageApp;

namespace {

std::string ReadAll(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void TestArgumentParsing() {
    auto cli = NodeWastageApp::ParseArguments({"-dir", "/srv/code", "--out", "r.txt", "--jobs", "8", "--keep-going"});
    assert(cli.root && *cli.root == "/srv/code");
    assert(cli.reportPath && *cli.reportPath == "r.txt");
    assert(cli.workers && *cli.workers == 8);
    assert(cli.keepGoing);
    assert(!cli.noProgress);

    auto eq = NodeWastageApp::ParseArguments({"--dir=/tmp/x", "--no-progress"});
    assert(eq.root && *eq.root == "/tmp/x");
    assert(eq.noProgress);

    assert(Throws<std::invalid_argument>([] { NodeWastageApp::ParseArguments({"--bogus"}); }));
    assert(Throws<std::invalid_argument>([] { NodeWastageApp::ParseArguments({"-dir"}); }));
    assert(Throws<std::invalid_argument>([] { NodeWastageApp::ParseArguments({"--jobs", "0"}); }));
    assert(Throws<std::invalid_argument>([] { NodeWastageApp::ParseArguments({"--jobs", "4x"}); }));
    assert(Throws<std::invalid_argument>([] { NodeWastageApp::ParseArguments({"--jobs", "1025"}); }));
    std::cout << "[PASS] Argument parsing." << std::endl;
}

void TestConfigLoader() {
    infrastructure::ScanSettings defaults;
    auto settings = infrastructure::ConfigLoader::FromJson(
        R"({"root": "/srv", "workers": 3, "keep_going": true, "dependency_dir": "vendor", "unknown": 1})", defaults);
    assert(settings);
    assert(settings->root == "/srv");
    assert(settings->workers == 3);
    assert(settings->keepGoing);
    assert(settings->reportPath == "results.txt");
    assert(settings->conventions.dependencyDir == "vendor");
    assert(settings->conventions.manifestMarker == "package.json");

    assert(!infrastructure::ConfigLoader::FromJson(R"({"workers": "many"})", defaults));
    assert(!infrastructure::ConfigLoader::FromJson(R"({"workers": 0})", defaults));
    assert(!infrastructure::ConfigLoader::FromJson(R"({"workers": -3})", defaults));
    assert(!infrastructure::ConfigLoader::FromJson(R"({"workers": 1025})", defaults));
    assert(!infrastructure::ConfigLoader::FromJson(R"({"workers": 4294967296})", defaults));
    assert(!infrastructure::ConfigLoader::FromJson(R"({"workers": 18446744073709551615})", defaults));
    auto maxWorkers = infrastructure::ConfigLoader::FromJson(R"({"workers": 1024})", defaults);
    assert(maxWorkers && maxWorkers->workers == 1024);
    assert(!infrastructure::ConfigLoader::FromJson(R"({"root": 42})", defaults));
    assert(!infrastructure::ConfigLoader::FromJson("[1, 2]", defaults));
    assert(!infrastructure::ConfigLoader::FromJson("{", defaults));
    assert(!infrastructure::ConfigLoader::Load("test_fixture_no_such_settings.json"));
    std::cout << "[PASS] ConfigLoader." << std::endl;
}

void TestResolveSettingsPrecedence() {
    ScopedDir fixture("test_fixture_app_settings");
    const fs::path configPath = fixture.path() / "settings.json";
    WriteFile(configPath, R"({"root": "/from/config", "report_path": "config.txt", "workers": 2})");

    app::CommandLine cli;
    cli.configPath = configPath.string();
    cli.reportPath = "cli.txt";
    auto settings = NodeWastageApp::ResolveSettings(cli);
    assert(settings);
    assert(settings->root == "/from/config");
    assert(settings->reportPath == "cli.txt");
    assert(settings->workers == 2);
    std::cout << "[PASS] Settings precedence." << std::endl;
}

void TestRunWithoutDirectoryFails() {
    NodeWastageApp app;
    assert(app.Run({}) == NodeWastageApp::kExitFailure);
    assert(app.Run({"--bogus"}) == NodeWastageApp::kExitFailure);
    assert(app.Run({"--help"}) == NodeWastageApp::kExitOk);

    // A settings path the OS refuses to stat is reported, not thrown out of Run
    const std::string unreachable = std::string(300, 'n') + ".json";
    assert(!infrastructure::ConfigLoader::Load(unreachable));
    assert(app.Run({"--config", unreachable}) == NodeWastageApp::kExitFailure);
    std::cout << "[PASS] Usage errors." << std::endl;
}

void TestEndToEnd() {
    ScopedDir fixture("test_fixture_app_e2e");
    const fs::path root = fixture.path() / "projects";
    const fs::path report = fixture.path() / "results.txt";

    auto modules = MakeProject(root, "site");
    InstallPackage(modules, "left-pad", "left-pad", "1.0.0", 1024);
    InstallPackage(modules, "left-pad-2", "left-pad", "1.0.0", 1024);
    fs::create_directories(root / "docs");

    NodeWastageApp app;
    int code = app.Run({"-dir", root.string(), "--out", report.string(), "--no-progress"});
    assert(code == NodeWastageApp::kExitOk);
    assert(ReadAll(report) == "left-pad@1.0.0: 2 (1.0 kB -> 2.0 kB)\n");

    // Only ineligible projects: still succeeds with an empty report
    fs::remove_all(root / "site");
    code = app.Run({"-dir", root.string(), "--out", report.string(), "--no-progress"});
    assert(code == NodeWastageApp::kExitOk);
    assert(fs::exists(report));
    assert(ReadAll(report).empty());

    // A numeric version aborts the run and leaves no new report behind
    fs::remove(report);
    auto broken = MakeProject(root, "broken");
    WriteFile(broken / "pkg" / "package.json", R"({"name": "pkg", "version": 1.2})");
    code = app.Run({"-dir", root.string(), "--out", report.string(), "--no-progress"});
    assert(code == NodeWastageApp::kExitFailure);
    assert(!fs::exists(report));

    // With --keep-going the report is written and the run flags partial success
    InstallPackage(broken, "ok", "ok", "2.0.0", 64);
    code = app.Run({"-dir", root.string(), "--out", report.string(), "--no-progress", "--keep-going"});
    assert(code == NodeWastageApp::kExitPartial);
    assert(ReadAll(report) == "ok@2.0.0: 1 (64 B -> 64 B)\n");
    std::cout << "[PASS] End to end." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting NodeWastageApp Test..." << std::endl;

    TestArgumentParsing();
    TestConfigLoader();
    TestResolveSettingsPrecedence();
    TestRunWithoutDirectoryFails();
    TestEndToEnd();

    assert(NodeWastageApp::FormatElapsed(std::chrono::milliseconds(850)) == "850ms");
    assert(NodeWastageApp::FormatElapsed(std::chrono::milliseconds(2310)) == "2.31s");

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
