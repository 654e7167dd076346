#pragma once

#include "merge/archive_ref.hpp"
#include "util/result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace takeout {

struct DiscoveryOptions {
    std::string prefix = "takeout-";
    std::vector<std::string> extensions = {".zip", ".tgz", ".tar.gz"};
};

// "takeout-*.zip, takeout-*.tgz, takeout-*.tar.gz"
std::string DescribePatterns(const DiscoveryOptions& opt);

// Glob-equivalent of `<prefix>*<ext>` for any configured extension.
// Returns the matching kind, or nullopt.
std::optional<ArchiveKind> MatchArchiveName(std::string_view file_name, const DiscoveryOptions& opt);

// Scans the immediate entries of `dir` (no recursion) for regular files whose
// names match. The result is sorted by file name, byte-wise. An empty result
// is a NoInputFound failure.
Result DiscoverArchives(const std::string& dir,
                        const DiscoveryOptions& opt,
                        std::vector<ArchiveRef>& out);

} // namespace takeout
