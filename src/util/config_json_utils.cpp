#include "util/config_json_utils.hpp"

#include <fstream>

namespace takeout::config::detail {

namespace {

// Each getter leaves `out` untouched when the key is absent and fails only
// when the key is present with the wrong type.
bool GetStringIfPresent(const nlohmann::json& j,
                        const char* key,
                        std::optional<std::string>& out,
                        std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetIntIfPresent(const nlohmann::json& j,
                     const char* key,
                     std::optional<long long>& out,
                     std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string(key) + " must be an integer";
        return false;
    }
    out = it->get<long long>();
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j,
                      const char* key,
                      std::optional<bool>& out,
                      std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean()) {
        err = std::string(key) + " must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool GetStringArrayIfPresent(const nlohmann::json& j,
                             const char* key,
                             std::optional<std::vector<std::string>>& out,
                             std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_array()) {
        err = std::string(key) + " must be an array of strings";
        return false;
    }
    std::vector<std::string> values;
    for (const auto& v : *it) {
        if (!v.is_string()) {
            err = std::string(key) + " must be an array of strings";
            return false;
        }
        values.push_back(v.get<std::string>());
    }
    out = std::move(values);
    return true;
}

bool IsSupportedExtension(const std::string& ext) {
    return ext == ".zip" || ext == ".tgz" || ext == ".tar.gz";
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, MergerConfigFromFile& cfg, std::string& err) {
    if (!GetStringIfPresent(j, "OutputLabel", cfg.output_label, err) ||
        !GetStringIfPresent(j, "ArchivePrefix", cfg.archive_prefix, err) ||
        !GetStringIfPresent(j, "WrapperDirectory", cfg.wrapper_directory, err) ||
        !GetStringIfPresent(j, "WorkRoot", cfg.work_root, err) ||
        !GetStringIfPresent(j, "OutputDir", cfg.output_dir, err) ||
        !GetStringArrayIfPresent(j, "ArchiveExtensions", cfg.archive_extensions, err) ||
        !GetBoolIfPresent(j, "WriteChecksum", cfg.write_checksum, err) ||
        !GetBoolIfPresent(j, "Progress", cfg.progress, err)) {
        return false;
    }

    if (cfg.archive_prefix && cfg.archive_prefix->empty()) {
        err = "ArchivePrefix must not be empty";
        return false;
    }
    if (cfg.archive_extensions) {
        if (cfg.archive_extensions->empty()) {
            err = "ArchiveExtensions must not be empty";
            return false;
        }
        for (const auto& ext : *cfg.archive_extensions) {
            if (!IsSupportedExtension(ext)) {
                err = "unsupported archive extension: " + ext;
                return false;
            }
        }
    }

    {
        std::optional<std::string> s;
        if (!GetStringIfPresent(j, "DateFallback", s, err))
            return false;
        if (s) {
            cfg.date_fallback = ParseDateFallback(*s);
            if (!cfg.date_fallback) {
                err = "DateFallback must be \"current-date\" or \"fail\"";
                return false;
            }
        }
    }
    {
        std::optional<std::string> s;
        if (!GetStringIfPresent(j, "MergeMode", s, err))
            return false;
        if (s) {
            cfg.merge_mode = ParseMergeMode(*s);
            if (!cfg.merge_mode) {
                err = "MergeMode must be \"move\" or \"copy\"";
                return false;
            }
        }
    }
    {
        std::optional<std::string> s;
        if (!GetStringIfPresent(j, "LogLevel", s, err))
            return false;
        if (s) {
            cfg.log_level = ParseLogLevel(*s);
            if (!cfg.log_level) {
                err = "LogLevel must be one of debug, info, warn, error, none";
                return false;
            }
        }
    }
    {
        std::optional<long long> v;
        if (!GetIntIfPresent(j, "CompressionLevel", v, err))
            return false;
        if (v) {
            if (*v < 0 || *v > 9) {
                err = "CompressionLevel must be between 0 and 9";
                return false;
            }
            cfg.compression_level = static_cast<int>(*v);
        }
    }
    {
        std::optional<long long> v;
        if (!GetIntIfPresent(j, "CompressionThreads", v, err))
            return false;
        if (v) {
            if (*v < 0 || *v > 1024) {
                err = "CompressionThreads must be between 0 and 1024";
                return false;
            }
            cfg.compression_threads = static_cast<unsigned>(*v);
        }
    }

    return true;
}

} // namespace takeout::config::detail
