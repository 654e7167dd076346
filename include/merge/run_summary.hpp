#pragma once

#include <cstdint>
#include <string>

namespace takeout {

struct RunSummary {
    std::size_t archives_merged = 0;
    std::uint64_t file_count = 0;
    std::string takeout_date;
    bool date_from_fallback = false;
    std::string output_path;
    std::uint64_t artifact_size_bytes = 0;
    std::string artifact_sha256;
    std::string checksum_path;  // empty when no sidecar was written
};

std::string ExtractionHint(const std::string& artifact_path);

void LogRunSummary(const RunSummary& summary);

} // namespace takeout
