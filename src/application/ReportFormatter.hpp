/**
 * @file ReportFormatter.hpp
 * @brief Renders aggregated usage rows as the plain-text report.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/PackageUsage.hpp"
#include "domain/ScanError.hpp"

namespace nodewastage::application {

class ReportFormatter {
public:
    /**
     * @brief One report line: `name@version: count (repSize -> totalSize)`, no newline.
     */
    static std::string FormatLine(const domain::AggregatedUsage& row);

    /**
     * @brief The whole report, one newline-terminated line per row, in row order.
     */
    static std::string ToReportText(const std::vector<domain::AggregatedUsage>& rows);

    /** @brief Multi-line summary of recorded failures for the console. */
    static std::string FormatFailures(const std::vector<domain::ScanFailure>& failures);
};

} // namespace nodewastage::application
