/**
 * @file ReportWriter.hpp
 * @brief Atomic writer for the plain-text usage report.
 */

#pragma once
#include <filesystem>
#include <string>

namespace nodewastage::infrastructure {

/**
 * @class ReportWriter
 * @brief Replaces the report file in one step (temp file, then rename).
 *
 * A reader never observes a half-written report; an existing report is only
 * replaced once the new content has been fully written.
 */
class ReportWriter {
public:
    explicit ReportWriter(std::filesystem::path reportPath);

    /**
     * @brief Writes @p content to the report path, overwriting any previous report.
     * @throws domain::FilesystemError if any step fails; the temp file is removed.
     */
    void write(const std::string& content) const;

    const std::filesystem::path& path() const { return m_reportPath; }

private:
    std::filesystem::path m_reportPath;
};

} // namespace nodewastage::infrastructure
