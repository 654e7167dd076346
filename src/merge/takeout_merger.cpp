#include "merge/takeout_merger.hpp"

#include "system/signals.hpp"
#include "util/human_size.hpp"
#include "util/logger.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace takeout {

namespace {

RunContext WithDefaults(RunContext ctx) {
    ctx.ApplyDefaults();
    return ctx;
}

TarXzPackager::Options PackagerOptionsFor(const RunContext& ctx) {
    TarXzPackager::Options opt;
    opt.compression_level = ctx.compression_level;
    opt.threads = ctx.compression_threads;
    return opt;
}

} // namespace

TakeoutMerger::TakeoutMerger(RunContext ctx)
    : ctx_(WithDefaults(std::move(ctx))),
      extractor_(std::make_unique<ExtractorSet>()),
      merger_(std::make_unique<OverlayTreeMerger>(ctx_.merge_mode)),
      packager_(std::make_unique<TarXzPackager>(PackagerOptionsFor(ctx_))) {}

TakeoutMerger::TakeoutMerger(RunContext ctx,
                             std::unique_ptr<IArchiveExtractor> extractor,
                             std::unique_ptr<ITreeMerger> merger,
                             std::unique_ptr<IPackager> packager)
    : ctx_(WithDefaults(std::move(ctx))),
      extractor_(std::move(extractor)),
      merger_(std::move(merger)),
      packager_(std::move(packager)) {}

Result TakeoutMerger::Discover(std::vector<ArchiveRef>& out) const {
    LogInfo("Searching for Google Takeout archives in %s", ctx_.working_dir.c_str());
    auto res = DiscoverArchives(ctx_.working_dir, ctx_.discovery, out);
    if (!res.is_ok()) {
        if (res.kind == ErrorKind::NoInputFound) {
            LogWarn("Looking for files matching: %s", DescribePatterns(ctx_.discovery).c_str());
        }
        return res;
    }
    LogInfo("Found %zu archive(s)", out.size());
    for (const auto& archive : out) {
        LogDebug("  %s (%s, %llu bytes)",
                 archive.file_name.c_str(),
                 ArchiveKindName(archive.kind),
                 (unsigned long long)archive.size_bytes);
    }
    return Result::Ok();
}

Result TakeoutMerger::DeriveIdentifier(const std::vector<ArchiveRef>& archives,
                                       OutputIdentifier& out) const {
    if (archives.empty()) {
        return Result::Fail(ErrorKind::NoInputFound, "no archives to name the output after");
    }

    const std::string& first = archives.front().file_name;
    LogInfo("Extracting date from: %s", first.c_str());

    auto derived = DeriveOutputIdentifier(
        first, ctx_.output_label, ctx_.discovery.prefix, ctx_.date_fallback, ctx_.now);
    if (!derived) {
        return Result::Fail(ErrorKind::Config, derived.error());
    }
    out = std::move(*derived);

    if (out.from_fallback) {
        LogWarn("Could not extract date from filename, using current date");
    }
    LogInfo("Output name will be: %s", out.Name().c_str());
    return Result::Ok();
}

Result TakeoutMerger::MergeAll(const std::vector<ArchiveRef>& archives,
                               const WorkDirectory& work,
                               MergedTree& out) const {
    out = MergedTree{};
    out.dir = work.MergedDir();

    std::uint64_t overall_total = 0;
    for (const auto& archive : archives) overall_total += archive.size_bytes;
    std::uint64_t overall_done = 0;

    for (std::size_t i = 0; i < archives.size(); ++i) {
        const ArchiveRef& archive = archives[i];
        if (CancelRequested()) {
            return Result::Fail(ErrorKind::Cancelled, "interrupted before " + archive.file_name);
        }

        LogInfo("Extracting: %s (%zu/%zu)", archive.file_name.c_str(), i + 1, archives.size());

        auto prep = work.PrepareExtractDir();
        if (!prep.is_ok()) return prep;

        IArchiveExtractor::Options xopt;
        xopt.progress_sink = progress_sink_;
        xopt.overall_total_bytes = overall_total;
        xopt.overall_done_base_bytes = overall_done;

        ExtractStats xstats;
        auto xres = extractor_->Extract(archive, work.ExtractDir(), xopt, xstats);
        if (!xres.is_ok()) {
            if (xres.kind == ErrorKind::Cancelled) return xres;
            return xres.As(ErrorKind::ExtractionFailure);
        }
        LogDebug("%s: %llu entries, %llu bytes",
                 archive.file_name.c_str(),
                 (unsigned long long)xstats.entries,
                 (unsigned long long)xstats.bytes_written);

        const std::string source = SelectMergeSource(work.ExtractDir(), ctx_.wrapper_directory);
        if (source != work.ExtractDir()) {
            LogInfo("Merging content from %s folder", ctx_.wrapper_directory.c_str());
        } else {
            LogInfo("Merging content (no %s subfolder found)", ctx_.wrapper_directory.c_str());
        }

        MergeStats mstats;
        auto mres = merger_->Merge(source, out.dir, mstats);
        if (!mres.is_ok()) return mres;
        LogInfo("  %llu new file(s), %llu replaced, %llu symlink(s)",
                (unsigned long long)mstats.files_added,
                (unsigned long long)mstats.files_replaced,
                (unsigned long long)mstats.symlinks);

        auto discard = work.DiscardExtractDir();
        if (!discard.is_ok()) return discard;

        overall_done += archive.size_bytes;
    }

    TreeCount count;
    auto cres = CountRegularFiles(out.dir, count);
    if (!cres.is_ok()) return cres;
    out.file_count = count.files;
    out.total_bytes = count.bytes;
    LogInfo("Merged %llu files into %s", (unsigned long long)out.file_count, out.dir.c_str());
    return Result::Ok();
}

std::string TakeoutMerger::OutputPathFor(const OutputIdentifier& id) const {
    std::error_code ec;
    fs::path dir = fs::absolute(ctx_.output_dir, ec);
    if (ec) dir = ctx_.output_dir;
    return (dir.lexically_normal() / (id.Name() + ".tar.xz")).string();
}

Result TakeoutMerger::Run(RunSummary& out) {
    out = RunSummary{};

    if (!extractor_ || !merger_ || !packager_) {
        return Result::Fail(ErrorKind::Config, "merger is missing a service");
    }

    auto dep = packager_->CheckAvailable();
    if (!dep.is_ok()) return dep;

    if (!IsValidOutputLabel(ctx_.output_label)) {
        return Result::Fail(ErrorKind::Config, "invalid output label: '" + ctx_.output_label + "'");
    }

    std::vector<ArchiveRef> archives;
    auto dres = Discover(archives);
    if (!dres.is_ok()) return dres;

    OutputIdentifier id;
    auto ires = DeriveIdentifier(archives, id);
    if (!ires.is_ok()) return ires;

    WorkDirectory work;
    auto wres = WorkDirectory::Create(ctx_.work_root, work);
    if (!wres.is_ok()) return wres;
    LogInfo("Creating working directory: %s", work.Dir().c_str());

    MergedTree tree;
    auto mres = MergeAll(archives, work, tree);
    if (!mres.is_ok()) return mres;

    PackageRequest req;
    req.src_dir = tree.dir;
    req.final_path = OutputPathFor(id);
    req.src_bytes = tree.total_bytes;
    req.progress_sink = progress_sink_;

    LogInfo("Creating xz-compressed archive: %s", req.final_path.c_str());
    ArtifactInfo artifact;
    auto pres = packager_->Package(req, artifact);
    if (!pres.is_ok()) {
        if (pres.kind == ErrorKind::Cancelled || pres.kind == ErrorKind::MissingDependency) return pres;
        return pres.As(ErrorKind::PackagingFailure);
    }
    LogInfo("Archive created successfully (size: %s)", HumanReadableSize(artifact.size_bytes).c_str());

    std::string checksum_path;
    if (ctx_.write_checksum) {
        auto cres = WriteChecksumFile(artifact, checksum_path);
        if (!cres.is_ok()) {
            LogWarn("Could not write checksum file: %s", cres.msg.c_str());
            checksum_path.clear();
        }
    }

    LogInfo("Cleaning up temporary files");
    auto rres = work.Remove();
    if (!rres.is_ok()) {
        LogWarn("%s", rres.msg.c_str());
    }

    out.archives_merged = archives.size();
    out.file_count = tree.file_count;
    out.takeout_date = id.date;
    out.date_from_fallback = id.from_fallback;
    out.output_path = artifact.path;
    out.artifact_size_bytes = artifact.size_bytes;
    out.artifact_sha256 = artifact.sha256;
    out.checksum_path = checksum_path;
    return Result::Ok();
}

} // namespace takeout
