/**
 * @file NodeWastageApp.cpp
 * @brief Implementation of NodeWastageApp.
 */

#include "app/NodeWastageApp.hpp"
#include <cstdio>
#include <iostream>
#include <memory>
#include <stdexcept>
#include "application/AggregationEngine.hpp"
#include "application/ReportFormatter.hpp"
#include "infrastructure/ByteFormatter.hpp"
#include "infrastructure/ConsoleProgressBar.hpp"
#include "infrastructure/ReportWriter.hpp"

namespace nodewastage::app {

namespace {

const std::string& RequireValue(const std::vector<std::string>& args, std::size_t& i) {
    if (i + 1 >= args.size()) {
        throw std::invalid_argument("flag " + args[i] + " needs a value");
    }
    return args[++i];
}

unsigned ParseWorkers(const std::string& value) {
    std::size_t consumed = 0;
    unsigned long parsed = 0;
    try {
        parsed = std::stoul(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid --jobs value: " + value);
    }
    if (consumed != value.size() || parsed == 0 || parsed > infrastructure::ScanSettings::kMaxWorkers) {
        throw std::invalid_argument("invalid --jobs value: " + value);
    }
    return static_cast<unsigned>(parsed);
}

} // namespace

CommandLine NodeWastageApp::ParseArguments(const std::vector<std::string>& args) {
    CommandLine cli;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-dir" || arg == "--dir") {
            cli.root = RequireValue(args, i);
        } else if (arg.rfind("-dir=", 0) == 0 || arg.rfind("--dir=", 0) == 0) {
            cli.root = arg.substr(arg.find('=') + 1);
        } else if (arg == "--config") {
            cli.configPath = RequireValue(args, i);
        } else if (arg == "--out") {
            cli.reportPath = RequireValue(args, i);
        } else if (arg == "--jobs" || arg == "-j") {
            cli.workers = ParseWorkers(RequireValue(args, i));
        } else if (arg == "--keep-going") {
            cli.keepGoing = true;
        } else if (arg == "--no-progress") {
            cli.noProgress = true;
        } else if (arg == "--help" || arg == "-h") {
            cli.help = true;
        } else {
            throw std::invalid_argument("unknown flag: " + arg);
        }
    }
    return cli;
}

std::optional<infrastructure::ScanSettings> NodeWastageApp::ResolveSettings(const CommandLine& cli) {
    infrastructure::ScanSettings settings;
    if (cli.configPath) {
        auto loaded = infrastructure::ConfigLoader::Load(*cli.configPath, settings);
        if (!loaded) return std::nullopt;
        settings = *loaded;
    }

    if (cli.root) settings.root = *cli.root;
    if (cli.reportPath) settings.reportPath = *cli.reportPath;
    if (cli.workers) settings.workers = *cli.workers;
    if (cli.keepGoing) settings.keepGoing = true;
    if (cli.noProgress) settings.showProgress = false;
    return settings;
}

std::string NodeWastageApp::FormatElapsed(std::chrono::steady_clock::duration elapsed) {
    using namespace std::chrono;
    char buf[32];
    auto us = duration_cast<microseconds>(elapsed).count();
    if (us < 1000000) {
        std::snprintf(buf, sizeof(buf), "%.0fms", us / 1000.0);
    } else {
        std::snprintf(buf, sizeof(buf), "%.2fs", us / 1000000.0);
    }
    return buf;
}

std::string NodeWastageApp::Usage() {
    return "usage: node-wastage -dir <root> [--config settings.json] [--out results.txt]\n"
           "                    [--jobs N] [--keep-going] [--no-progress]\n";
}

int NodeWastageApp::Run(const std::vector<std::string>& args) {
    CommandLine cli;
    try {
        cli = ParseArguments(args);
    } catch (const std::invalid_argument& e) {
        std::cout << e.what() << "\n" << Usage();
        return kExitFailure;
    }
    if (cli.help) {
        std::cout << Usage();
        return kExitOk;
    }

    try {
        auto settings = ResolveSettings(cli);
        if (!settings) {
            std::cout << "could not load settings, exiting..." << std::endl;
            return kExitFailure;
        }
        if (settings->root.empty()) {
            std::cout << "no directory given, exiting..." << std::endl;
            return kExitFailure;
        }
        return Scan(*settings);
    } catch (const std::exception& e) {
        std::cout << e.what() << std::endl;
        return kExitFailure;
    }
}

int NodeWastageApp::Scan(const infrastructure::ScanSettings& settings) {
    std::unique_ptr<infrastructure::ConsoleProgressBar> bar;

    application::ScanOptions options;
    options.conventions = settings.conventions;
    options.workers = settings.workers;
    options.keepGoing = settings.keepGoing;
    options.onProjectsDiscovered = [&bar, &settings](std::size_t total) {
        std::cout << "found " << total << " projects to check" << std::endl;
        if (settings.showProgress) {
            bar = std::make_unique<infrastructure::ConsoleProgressBar>(std::cout, total);
            bar->update(0);
        }
    };
    options.onProjectExamined = [&bar](std::size_t done, std::size_t) {
        if (bar) bar->update(done);
    };

    application::AggregationEngine engine(options);
    application::ScanResult result;
    try {
        result = engine.run(settings.root);
    } catch (const std::exception&) {
        if (bar) bar->finish();
        throw;
    }
    if (bar) bar->finish();

    std::cout << "processed " << result.entriesProcessed << " entries in "
              << FormatElapsed(result.elapsed) << std::endl;
    std::cout << "formatting results..." << std::endl;

    infrastructure::ReportWriter writer(settings.reportPath);
    writer.write(application::ReportFormatter::ToReportText(result.rows));

    std::cout << "total space used: " << infrastructure::ByteFormatter::Humanize(result.totalBytes) << std::endl;

    if (!result.complete()) {
        std::cerr << "[NodeWastageApp] " << application::ReportFormatter::FormatFailures(result.failures);
        return kExitPartial;
    }
    return kExitOk;
}

} // namespace nodewastage::app
