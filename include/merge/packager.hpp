#pragma once

#include "merge/progress.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>

namespace takeout {

struct ArtifactInfo {
    std::string path;
    std::uint64_t size_bytes = 0;
    std::string sha256;  // hex of the compressed artifact
};

struct PackageRequest {
    std::string src_dir;
    std::string final_path;
    std::uint64_t src_bytes = 0;  // regular file bytes under src_dir, for progress
    IProgress* progress_sink = nullptr;
};

class IPackager {
  public:
    virtual ~IPackager() = default;

    // Probed once before any work; MissingDependency when unusable.
    virtual Result CheckAvailable() const = 0;

    // Writes the tree below `req.src_dir` to `req.final_path`. Nothing is
    // left at `final_path` unless the whole artifact was written.
    virtual Result Package(const PackageRequest& req, ArtifactInfo& out) const = 0;
};

struct XzCapabilities {
    bool available = false;
    bool threads = false;
    std::string detail;
};

// Asks libarchive whether it can write xz (and with worker threads).
XzCapabilities ProbeXzSupport();

constexpr const char kXzInstallHint[] =
    "Install with: sudo apt install liblzma-dev libarchive-dev  # Debian/Ubuntu";

class TarXzPackager final : public IPackager {
  public:
    struct Options {
        int compression_level = 9;
        unsigned threads = 0;  // 0 => every available processor
    };

    TarXzPackager() = default;
    explicit TarXzPackager(const Options& opt) : opt_(opt) {}

    Result CheckAvailable() const override;
    Result Package(const PackageRequest& req, ArtifactInfo& out) const override;

  private:
    Options opt_{};
};

// `<hex>  <file name>\n` next to the artifact, the format `sha256sum -c` reads.
Result WriteChecksumFile(const ArtifactInfo& artifact, std::string& out_path);

} // namespace takeout
