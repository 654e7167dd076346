#include "merge/run_summary.hpp"

#include "util/human_size.hpp"
#include "util/logger.hpp"

namespace takeout {

std::string ExtractionHint(const std::string& artifact_path) {
    return "tar -xJf " + artifact_path;
}

void LogRunSummary(const RunSummary& s) {
    LogInfo("=== COMPLETION SUMMARY ===");
    LogInfo("Merged archives: %zu", s.archives_merged);
    LogInfo("Total files: %llu", (unsigned long long)s.file_count);
    LogInfo("Takeout date: %s%s", s.takeout_date.c_str(), s.date_from_fallback ? " (current date)" : "");
    LogInfo("Output file: %s", s.output_path.c_str());
    LogInfo("Archive size: %s", HumanReadableSize(s.artifact_size_bytes).c_str());
    if (!s.artifact_sha256.empty()) {
        LogInfo("SHA-256: %s", s.artifact_sha256.c_str());
    }
    if (!s.checksum_path.empty()) {
        LogInfo("Checksum file: %s", s.checksum_path.c_str());
    }
    LogInfo("To extract:");
    LogInfo("  %s", ExtractionHint(s.output_path).c_str());
}

} // namespace takeout
