#include "merge/archive_discovery.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace takeout {

std::string DescribePatterns(const DiscoveryOptions& opt) {
    std::string out;
    for (const auto& ext : opt.extensions) {
        if (!out.empty()) out += ", ";
        out += opt.prefix + "*" + ext;
    }
    return out;
}

std::optional<ArchiveKind> MatchArchiveName(std::string_view file_name, const DiscoveryOptions& opt) {
    if (!HasPrefix(file_name, opt.prefix)) return std::nullopt;

    for (const auto& ext : opt.extensions) {
        if (file_name.size() < opt.prefix.size() + ext.size()) continue;
        if (!HasSuffix(file_name, ext)) continue;
        if (auto kind = ArchiveKindForExtension(ext)) return kind;
    }
    return std::nullopt;
}

Result DiscoverArchives(const std::string& dir,
                        const DiscoveryOptions& opt,
                        std::vector<ArchiveRef>& out) {
    out.clear();

    std::error_code ec;
    const fs::path base = fs::absolute(dir, ec);
    if (ec) {
        return Result::Fail(ec.value(), "cannot resolve directory " + dir + ": " + ec.message());
    }

    fs::directory_iterator it(base, ec);
    for (const fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
        const fs::directory_entry& entry = *it;
        const std::string name = entry.path().filename().string();
        const auto kind = MatchArchiveName(name, opt);
        if (!kind) continue;

        // Same rule as `find -type f`: symlinks and directories never match.
        std::error_code st_ec;
        if (!entry.is_regular_file(st_ec) || entry.is_symlink(st_ec)) {
            LogDebug("skip non-regular entry: %s", name.c_str());
            continue;
        }

        ArchiveRef ref;
        ref.path = entry.path().string();
        ref.file_name = name;
        ref.kind = *kind;
        const auto size = entry.file_size(st_ec);
        ref.size_bytes = st_ec ? 0 : static_cast<std::uint64_t>(size);
        out.push_back(std::move(ref));
    }
    if (ec) {
        out.clear();
        return Result::Fail(ec.value(), "cannot list " + base.string() + ": " + ec.message());
    }

    if (out.empty()) {
        return Result::Fail(ErrorKind::NoInputFound,
                            "No Google Takeout archives found in " + base.string() +
                                " (looking for files matching: " + DescribePatterns(opt) + ")");
    }

    std::sort(out.begin(), out.end(), [](const ArchiveRef& a, const ArchiveRef& b) {
        return a.file_name < b.file_name;
    });
    return Result::Ok();
}

} // namespace takeout
