#pragma once

#include "util/merger_config.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace takeout {

struct MergeStats {
    std::uint64_t files_added = 0;
    std::uint64_t files_replaced = 0;
    std::uint64_t directories_created = 0;
    std::uint64_t symlinks = 0;
    std::uint64_t skipped_special = 0;  // fifos, sockets, devices
};

class ITreeMerger {
  public:
    virtual ~ITreeMerger() = default;

    // Overlays `src_dir` onto `dst_dir`: relative paths are kept and an
    // existing destination entry at the same path is replaced.
    virtual Result Merge(const std::string& src_dir,
                         const std::string& dst_dir,
                         MergeStats& stats) const = 0;
};

// Filesystem overlay with `rsync -a` semantics for regular files, directories
// and symlinks; modes and modification times are carried over.
class OverlayTreeMerger final : public ITreeMerger {
  public:
    explicit OverlayTreeMerger(MergeMode mode = MergeMode::Move) : mode_(mode) {}

    Result Merge(const std::string& src_dir,
                 const std::string& dst_dir,
                 MergeStats& stats) const override;

    MergeMode Mode() const { return mode_; }

  private:
    MergeMode mode_;
};

// Returns `<extract_root>/<wrapper_name>` when that directory is the only
// top-level entry of the extraction, otherwise `extract_root`.
std::string SelectMergeSource(const std::string& extract_root, std::string_view wrapper_name);

struct TreeCount {
    std::uint64_t files = 0;
    std::uint64_t bytes = 0;
};

// Regular files below `dir`, recursively; symlinks are not followed or counted.
Result CountRegularFiles(const std::string& dir, TreeCount& out);

} // namespace takeout
