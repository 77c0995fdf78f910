/**
 * @file UsageTable.hpp
 * @brief Identity-keyed collection of usage records shared by a scan.
 */

#pragma once
#include <map>
#include <mutex>
#include <vector>
#include "domain/PackageUsage.hpp"

namespace nodewastage::domain {

/**
 * @class UsageTable
 * @brief Groups UsageRecords by PackageIdentity in append order.
 *
 * Appends are serialized so that several traversals may feed one table.
 */
class UsageTable {
public:
    /** @brief Appends a record under its identity, creating the group on first sight. */
    void append(UsageRecord record);

    /** @brief Number of distinct identities seen so far. */
    std::size_t identityCount() const;

    /** @brief Total number of records across all identities. */
    std::size_t recordCount() const;

    /**
     * @brief Converts the table into one row per identity.
     * @return Rows ordered by (name, version); representative size taken from the first record.
     */
    std::vector<AggregatedUsage> toRows() const;

private:
    mutable std::mutex m_mutex;
    std::map<PackageIdentity, std::vector<UsageRecord>> m_records;
};

} // namespace nodewastage::domain
