#include "application/ReportFormatter.hpp"
#include <sstream>
#include "infrastructure/ByteFormatter.hpp"

namespace nodewastage::application {

using infrastructure::ByteFormatter;

std::string ReportFormatter::FormatLine(const domain::AggregatedUsage& row) {
    std::stringstream ss;
    ss << row.packageName << "@" << row.packageVersion << ": " << row.instanceCount()
       << " (" << ByteFormatter::Humanize(row.representativeSize)
       << " -> " << ByteFormatter::Humanize(row.totalSize()) << ")";
    return ss.str();
}

std::string ReportFormatter::ToReportText(const std::vector<domain::AggregatedUsage>& rows) {
    std::stringstream ss;
    for (const auto& row : rows) {
        ss << FormatLine(row) << "\n";
    }
    return ss.str();
}

std::string ReportFormatter::FormatFailures(const std::vector<domain::ScanFailure>& failures) {
    std::stringstream ss;
    ss << failures.size() << " entr" << (failures.size() == 1 ? "y" : "ies") << " could not be analyzed:\n";
    for (const auto& failure : failures) {
        ss << "  - " << failure.message << "\n";
    }
    return ss.str();
}

} // namespace nodewastage::application
