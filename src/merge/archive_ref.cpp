#include "merge/archive_ref.hpp"

namespace takeout {

const char* ArchiveKindName(ArchiveKind kind) {
    switch (kind) {
        case ArchiveKind::Zip:   return "zip";
        case ArchiveKind::TarGz: return "tar.gz";
    }
    return "unknown";
}

std::optional<ArchiveKind> ArchiveKindForExtension(std::string_view ext) {
    if (ext == ".zip") return ArchiveKind::Zip;
    if (ext == ".tgz" || ext == ".tar.gz") return ArchiveKind::TarGz;
    return std::nullopt;
}

} // namespace takeout
