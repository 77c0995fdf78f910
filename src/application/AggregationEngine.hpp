/**
 * @file AggregationEngine.hpp
 * @brief Aggregates package disk usage across every project under a root directory.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <vector>
#include "domain/PackageUsage.hpp"
#include "domain/ScanConventions.hpp"
#include "domain/ScanError.hpp"

namespace nodewastage::application {

/**
 * @struct ScanOptions
 * @brief Tuning and observation hooks for one scan.
 */
struct ScanOptions {
    domain::ScanConventions conventions;

    /** Projects processed concurrently. 1 keeps the scan strictly sequential. */
    unsigned workers = 1;

    /**
     * When false, the first error aborts the scan. When true, failing packages
     * and projects are recorded in ScanResult::failures and the scan continues.
     */
    bool keepGoing = false;

    /** Called once with the number of candidate projects, before any is processed. */
    std::function<void(std::size_t total)> onProjectsDiscovered;

    /** Called after each project is examined, eligible or not. Calls are serialized. */
    std::function<void(std::size_t done, std::size_t total)> onProjectExamined;
};

/**
 * @struct ScanResult
 * @brief Sorted report rows plus the counters gathered along the way.
 */
struct ScanResult {
    std::vector<domain::AggregatedUsage> rows;  ///< One per identity, sorted by package name.
    std::size_t projectsExamined = 0;
    std::size_t eligibleProjects = 0;
    std::size_t entriesProcessed = 0;
    std::chrono::steady_clock::duration elapsed{};
    std::uint64_t totalBytes = 0;               ///< Sum of every row's total size.
    std::vector<domain::ScanFailure> failures;  ///< Only populated with keepGoing.

    bool complete() const { return failures.empty(); }
};

/**
 * @class AggregationEngine
 * @brief Drives project discovery, package traversal and the final aggregation.
 */
class AggregationEngine {
public:
    explicit AggregationEngine(ScanOptions options = {});

    /**
     * @brief Scans every project directly under @p root.
     * @throws domain::ScanError if the root cannot be listed, or on the first
     *         failure anywhere when keepGoing is off. No partial result is returned then.
     */
    ScanResult run(const std::filesystem::path& root) const;

    /**
     * @brief Orders rows by package name with a strict comparison.
     *
     * The sort is stable, so rows that share a name keep their incoming
     * (version) order.
     */
    static void SortByName(std::vector<domain::AggregatedUsage>& rows);

    /** @brief Sum over rows of instance count times representative size. */
    static std::uint64_t GrandTotal(const std::vector<domain::AggregatedUsage>& rows);

    const ScanOptions& options() const { return m_options; }

private:
    ScanOptions m_options;
};

} // namespace nodewastage::application
