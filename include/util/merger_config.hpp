#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace takeout {

// What to do when the first archive's name carries no recognizable date.
enum class DateFallback {
    CurrentDate,
    Fail,
};

enum class MergeMode {
    Move,
    Copy,
};

std::optional<DateFallback> ParseDateFallback(std::string_view s);
std::optional<MergeMode> ParseMergeMode(std::string_view s);

namespace config {

constexpr const char kConfigEnvVar[] = "TAKEOUT_MERGER_CONFIG";

// Every key is optional; unset members keep the built-in defaults.
class MergerConfigFromFile {
public:
    std::optional<std::string> output_label;
    std::optional<std::string> archive_prefix;
    std::optional<std::vector<std::string>> archive_extensions;
    std::optional<std::string> wrapper_directory;
    std::optional<std::string> work_root;
    std::optional<std::string> output_dir;

    std::optional<DateFallback> date_fallback;
    std::optional<MergeMode> merge_mode;
    std::optional<int> compression_level;
    std::optional<unsigned> compression_threads;
    std::optional<bool> write_checksum;
    std::optional<bool> progress;
    std::optional<LogLevel> log_level;

    Result LoadFile(const std::string& path);

    void Reset();
};

} // namespace config
} // namespace takeout
