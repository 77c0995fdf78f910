/**
 * @file ReportWriter.cpp
 * @brief Implementation of ReportWriter.
 */

#include "infrastructure/ReportWriter.hpp"
#include <chrono>
#include <fstream>
#include <system_error>
#include "domain/ScanError.hpp"

namespace nodewastage::infrastructure {

namespace fs = std::filesystem;

ReportWriter::ReportWriter(fs::path reportPath) : m_reportPath(std::move(reportPath)) {}

void ReportWriter::write(const std::string& content) const {
    const fs::path finalPath = m_reportPath;
    const std::string target = finalPath.string();

    // filename.<timestamp>.tmp beside the target so the rename stays on one filesystem
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    std::error_code ec;
    if (finalPath.has_parent_path()) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            throw domain::FilesystemError(target, "cannot create directory for " + target + ": " + ec.message());
        }
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw domain::FilesystemError(target, "cannot open " + tempPath.string() + " for writing");
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            fs::remove(tempPath, ec);
            throw domain::FilesystemError(target, "write failed for " + tempPath.string());
        }
    }

    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        throw domain::FilesystemError(target, "cannot replace " + target + ": " + ec.message());
    }
}

} // namespace nodewastage::infrastructure
