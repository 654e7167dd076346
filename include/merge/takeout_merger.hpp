#pragma once

#include "merge/archive_extractor.hpp"
#include "merge/archive_ref.hpp"
#include "merge/output_identifier.hpp"
#include "merge/packager.hpp"
#include "merge/progress.hpp"
#include "merge/run_context.hpp"
#include "merge/run_summary.hpp"
#include "merge/tree_merger.hpp"
#include "merge/work_directory.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace takeout {

// discover -> derive identifier -> extract+merge each archive -> package -> clean up.
class TakeoutMerger {
public:
    struct MergedTree {
        std::string dir;
        std::uint64_t file_count = 0;
        std::uint64_t total_bytes = 0;
    };

    explicit TakeoutMerger(RunContext ctx);
    TakeoutMerger(RunContext ctx,
                  std::unique_ptr<IArchiveExtractor> extractor,
                  std::unique_ptr<ITreeMerger> merger,
                  std::unique_ptr<IPackager> packager);

    void SetProgressSink(IProgress* sink) { progress_sink_ = sink; }
    const RunContext& Context() const { return ctx_; }

    Result Run(RunSummary& out);

    Result Discover(std::vector<ArchiveRef>& out) const;
    Result DeriveIdentifier(const std::vector<ArchiveRef>& archives, OutputIdentifier& out) const;
    Result MergeAll(const std::vector<ArchiveRef>& archives,
                    const WorkDirectory& work,
                    MergedTree& out) const;
    std::string OutputPathFor(const OutputIdentifier& id) const;

private:
    RunContext ctx_;
    std::unique_ptr<IArchiveExtractor> extractor_;
    std::unique_ptr<ITreeMerger> merger_;
    std::unique_ptr<IPackager> packager_;
    IProgress* progress_sink_ = nullptr;
};

} // namespace takeout
