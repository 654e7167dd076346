#include "merge/entry_path_policy.hpp"

#include "util/path_utils.hpp"

namespace takeout {

bool EntryPathPolicy::IsContained(std::string_view p) {
    if (p.empty()) return false;
    if (p.front() == '/') return false;
    if (p.find('\\') != std::string_view::npos) return false;

    while (!p.empty()) {
        const auto pos = p.find('/');
        const auto seg = p.substr(0, pos);
        if (seg == "..") return false;
        if (pos == std::string_view::npos) break;
        p.remove_prefix(pos + 1);
    }
    return true;
}

Result EntryPathPolicy::Normalize(const char* raw_path, std::string& out_relative) const {
    out_relative = NormalizeEntryPath(raw_path ? std::string(raw_path) : std::string());
    if (out_relative == ".") out_relative.clear();
    if (out_relative.empty()) return Result::Ok();

    if (reject_unsafe_ && !IsContained(out_relative)) {
        return Result::Fail(ErrorKind::ExtractionFailure, "Unsafe path in archive: " + out_relative);
    }
    return Result::Ok();
}

Result EntryPathPolicy::NormalizeHardlink(const char* raw_path, std::string& out_relative) const {
    out_relative.clear();
    if (!raw_path || !*raw_path) return Result::Ok();

    out_relative = NormalizeEntryPath(std::string(raw_path));
    if (out_relative == ".") out_relative.clear();
    if (out_relative.empty()) return Result::Ok();

    if (reject_unsafe_ && !IsContained(out_relative)) {
        return Result::Fail(ErrorKind::ExtractionFailure,
                            "Unsafe hardlink target in archive: " + out_relative);
    }
    return Result::Ok();
}

} // namespace takeout
