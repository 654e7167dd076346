#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace takeout {

enum class ArchiveKind {
    Zip,
    TarGz,
};

const char* ArchiveKindName(ArchiveKind kind);

// ".zip" -> Zip; ".tgz" and ".tar.gz" -> TarGz; anything else -> nullopt.
std::optional<ArchiveKind> ArchiveKindForExtension(std::string_view ext);

struct ArchiveRef {
    std::string path;       // absolute
    std::string file_name;  // base name, used for ordering and date extraction
    ArchiveKind kind = ArchiveKind::Zip;
    std::uint64_t size_bytes = 0;
};

} // namespace takeout
