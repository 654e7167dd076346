#include "util/merger_config.hpp"

#include "util/config_json_utils.hpp"

namespace takeout {

std::optional<DateFallback> ParseDateFallback(std::string_view s) {
    if (s == "current-date") return DateFallback::CurrentDate;
    if (s == "fail") return DateFallback::Fail;
    return std::nullopt;
}

std::optional<MergeMode> ParseMergeMode(std::string_view s) {
    if (s == "move") return MergeMode::Move;
    if (s == "copy") return MergeMode::Copy;
    return std::nullopt;
}

namespace config {

void MergerConfigFromFile::Reset() {
    output_label.reset();
    archive_prefix.reset();
    archive_extensions.reset();
    wrapper_directory.reset();
    work_root.reset();
    output_dir.reset();
    date_fallback.reset();
    merge_mode.reset();
    compression_level.reset();
    compression_threads.reset();
    write_checksum.reset();
    progress.reset();
    log_level.reset();
}

Result MergerConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(ErrorKind::Config, "config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::Fail(ErrorKind::Config, "config: " + err + " in " + path);
    }

    return Result::Ok();
}

} // namespace config
} // namespace takeout
