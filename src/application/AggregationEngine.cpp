/**
 * @file AggregationEngine.cpp
 * @brief Implementation of AggregationEngine.
 */

#include "application/AggregationEngine.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <mutex>
#include <thread>
#include "application/PackageTraverser.hpp"
#include "domain/UsageTable.hpp"
#include "infrastructure/PackageManifestReader.hpp"
#include "infrastructure/ProjectScanner.hpp"

namespace fs = std::filesystem;

namespace nodewastage::application {

namespace {

/**
 * State shared by every worker of one run. The table serializes its own
 * appends; everything under m_mutex is touched by at most one worker at a time.
 */
struct ScanState {
    ScanState(const ScanOptions& opts, const infrastructure::ProjectScanner& projectScanner,
              const PackageTraverser& packageTraverser, const std::vector<domain::Project>& candidates)
        : options(opts), scanner(projectScanner), traverser(packageTraverser), projects(candidates) {}

    const ScanOptions& options;
    const infrastructure::ProjectScanner& scanner;
    const PackageTraverser& traverser;
    const std::vector<domain::Project>& projects;

    domain::UsageTable table;
    std::atomic<std::size_t> cursor{0};
    std::atomic<std::size_t> eligible{0};
    std::atomic<std::size_t> entries{0};
    std::atomic<bool> cancelled{false};

    std::mutex mutex;
    std::size_t examined = 0;
    std::vector<domain::ScanFailure> failures;
    std::exception_ptr firstError;
};

void ProcessProject(const domain::Project& project, ScanState& state) {
    if (!state.scanner.isEligible(project)) {
        return;
    }
    state.eligible++;

    std::vector<domain::ScanFailure> localFailures;
    std::size_t processed = state.traverser.traverse(
        state.scanner.dependencyTreeOf(project), state.table,
        state.options.keepGoing ? &localFailures : nullptr);
    state.entries += processed;

    if (!localFailures.empty()) {
        std::lock_guard<std::mutex> lock(state.mutex);
        state.failures.insert(state.failures.end(), localFailures.begin(), localFailures.end());
    }
}

void MarkExamined(ScanState& state) {
    std::lock_guard<std::mutex> lock(state.mutex);
    ++state.examined;
    if (state.options.onProjectExamined) {
        state.options.onProjectExamined(state.examined, state.projects.size());
    }
}

void WorkerLoop(ScanState& state) {
    while (!state.cancelled) {
        std::size_t index = state.cursor++;
        if (index >= state.projects.size()) {
            return;
        }
        const auto& project = state.projects[index];

        try {
            ProcessProject(project, state);
        } catch (const domain::ScanError& e) {
            std::lock_guard<std::mutex> lock(state.mutex);
            if (state.options.keepGoing) {
                state.failures.push_back({e.path(), e.what()});
            } else {
                if (!state.firstError) state.firstError = std::current_exception();
                state.cancelled = true;
                return;
            }
        } catch (const std::exception&) {
            // Anything that is not a ScanError is a bug or resource exhaustion: always fatal.
            std::lock_guard<std::mutex> lock(state.mutex);
            if (!state.firstError) state.firstError = std::current_exception();
            state.cancelled = true;
            return;
        }

        MarkExamined(state);
    }
}

} // namespace

AggregationEngine::AggregationEngine(ScanOptions options) : m_options(std::move(options)) {
    if (m_options.workers == 0) m_options.workers = 1;
}

ScanResult AggregationEngine::run(const fs::path& root) const {
    infrastructure::ProjectScanner scanner(root, m_options.conventions);
    infrastructure::PackageManifestReader reader(m_options.conventions.packageManifest);
    PackageTraverser traverser(reader);

    const std::vector<domain::Project> projects = scanner.scan();
    if (m_options.onProjectsDiscovered) {
        m_options.onProjectsDiscovered(projects.size());
    }

    auto start = std::chrono::steady_clock::now();
    ScanState state(m_options, scanner, traverser, projects);

    std::size_t threadCount = std::min<std::size_t>(m_options.workers, projects.size());
    if (threadCount <= 1) {
        WorkerLoop(state);
    } else {
        std::vector<std::thread> workers;
        workers.reserve(threadCount);
        for (std::size_t i = 0; i < threadCount; ++i) {
            workers.emplace_back(WorkerLoop, std::ref(state));
        }
        for (auto& t : workers) {
            if (t.joinable()) t.join();
        }
    }

    if (state.firstError) {
        std::rethrow_exception(state.firstError);
    }

    ScanResult result;
    result.rows = state.table.toRows();
    SortByName(result.rows);
    result.projectsExamined = state.examined;
    result.eligibleProjects = state.eligible;
    result.entriesProcessed = state.entries;
    result.elapsed = std::chrono::steady_clock::now() - start;
    result.totalBytes = GrandTotal(result.rows);
    result.failures = std::move(state.failures);

    if (!result.failures.empty()) {
        std::cerr << "[AggregationEngine] " << result.failures.size()
                  << " failure(s) recorded, results are partial." << std::endl;
    }
    return result;
}

void AggregationEngine::SortByName(std::vector<domain::AggregatedUsage>& rows) {
    std::stable_sort(rows.begin(), rows.end(),
        [](const domain::AggregatedUsage& a, const domain::AggregatedUsage& b) {
            return a.packageName < b.packageName;
        });
}

std::uint64_t AggregationEngine::GrandTotal(const std::vector<domain::AggregatedUsage>& rows) {
    std::uint64_t total = 0;
    for (const auto& row : rows) {
        total += row.totalSize();
    }
    return total;
}

} // namespace nodewastage::application
