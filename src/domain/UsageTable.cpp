#include "domain/UsageTable.hpp"

namespace nodewastage::domain {

void UsageTable::append(UsageRecord record) {
    auto id = record.identity();
    std::lock_guard<std::mutex> lock(m_mutex);
    m_records[std::move(id)].push_back(std::move(record));
}

std::size_t UsageTable::identityCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.size();
}

std::size_t UsageTable::recordCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::size_t total = 0;
    for (const auto& [id, records] : m_records) {
        total += records.size();
    }
    return total;
}

std::vector<AggregatedUsage> UsageTable::toRows() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<AggregatedUsage> rows;
    rows.reserve(m_records.size());
    for (const auto& [id, records] : m_records) {
        if (records.empty()) continue;
        AggregatedUsage row;
        row.packageName = id.name;
        row.packageVersion = id.version;
        row.instances = records;
        row.representativeSize = records.front().sizeBytes;
        rows.push_back(std::move(row));
    }
    return rows;
}

} // namespace nodewastage::domain
