#pragma once

#include "merge/archive_ref.hpp"
#include "merge/progress.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace takeout {

struct ExtractStats {
    std::uint64_t entries = 0;
    std::uint64_t bytes_written = 0;     // uncompressed entry data
    std::uint64_t compressed_bytes = 0;  // archive bytes consumed
};

class IArchiveExtractor {
  public:
    struct Options {
        bool safe_paths_only = true;
        IProgress* progress_sink = nullptr;
        // Overall progress spans every archive of the run.
        std::uint64_t overall_total_bytes = 0;
        std::uint64_t overall_done_base_bytes = 0;
    };

    virtual ~IArchiveExtractor() = default;
    virtual bool Supports(ArchiveKind kind) const = 0;

    // Unpacks every entry of `archive` below the existing directory `dst_dir`.
    // Failures carry ErrorKind::ExtractionFailure (or Cancelled).
    virtual Result Extract(const ArchiveRef& archive,
                           const std::string& dst_dir,
                           const Options& opt,
                           ExtractStats& stats) const = 0;
};

class ZipExtractor final : public IArchiveExtractor {
  public:
    bool Supports(ArchiveKind kind) const override { return kind == ArchiveKind::Zip; }
    Result Extract(const ArchiveRef& archive,
                   const std::string& dst_dir,
                   const Options& opt,
                   ExtractStats& stats) const override;
};

// gzip layer through zlib, tar layer through libarchive.
class TarGzExtractor final : public IArchiveExtractor {
  public:
    bool Supports(ArchiveKind kind) const override { return kind == ArchiveKind::TarGz; }
    Result Extract(const ArchiveRef& archive,
                   const std::string& dst_dir,
                   const Options& opt,
                   ExtractStats& stats) const override;
};

// Dispatches to the first extractor supporting the archive's kind.
class ExtractorSet final : public IArchiveExtractor {
  public:
    ExtractorSet();
    explicit ExtractorSet(std::vector<std::unique_ptr<IArchiveExtractor>> extractors);

    bool Supports(ArchiveKind kind) const override;
    Result Extract(const ArchiveRef& archive,
                   const std::string& dst_dir,
                   const Options& opt,
                   ExtractStats& stats) const override;

  private:
    std::vector<std::unique_ptr<IArchiveExtractor>> extractors_;
};

std::vector<std::unique_ptr<IArchiveExtractor>> CreateDefaultExtractors();

} // namespace takeout
