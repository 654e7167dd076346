#include "merge/takeout_merger.hpp"
#include "testing.hpp"

#include <cerrno>
#include <filesystem>
#include <gtest/gtest.h>
#include <map>
#include <set>

namespace takeout {
namespace {

namespace fs = std::filesystem;

using Files = std::map<std::string, std::string>;

// Writes a fixed set of files per archive name instead of unpacking anything.
class FakeExtractor final : public IArchiveExtractor {
  public:
    FakeExtractor(std::map<std::string, Files> contents, std::vector<std::string>* calls)
        : contents_(std::move(contents)), calls_(calls) {}

    std::string fail_on;

    bool Supports(ArchiveKind) const override { return true; }

    Result Extract(const ArchiveRef& archive,
                   const std::string& dst_dir,
                   const Options&,
                   ExtractStats& stats) const override {
        calls_->push_back(archive.file_name);
        if (archive.file_name == fail_on) {
            return Result::Fail(ErrorKind::ExtractionFailure,
                                "Failed to extract " + archive.file_name + ": corrupt");
        }
        stats = ExtractStats{};
        auto it = contents_.find(archive.file_name);
        if (it == contents_.end()) return Result::Ok();
        for (const auto& [rel, body] : it->second) {
            testutil::WriteTextFile(dst_dir + "/" + rel, body);
            ++stats.entries;
        }
        return Result::Ok();
    }

  private:
    std::map<std::string, Files> contents_;
    std::vector<std::string>* calls_;
};

struct PackagerLog {
    int calls = 0;
    Files seen;  // merged tree as handed to Package()
    PackageRequest request;
};

class FakePackager final : public IPackager {
  public:
    explicit FakePackager(PackagerLog* log) : log_(log) {}

    Result available = Result::Ok();
    Result outcome = Result::Ok();

    Result CheckAvailable() const override { return available; }

    Result Package(const PackageRequest& req, ArtifactInfo& out) const override {
        ++log_->calls;
        log_->request = req;
        for (const auto& e : fs::recursive_directory_iterator(req.src_dir)) {
            if (e.is_regular_file()) {
                const std::string rel = fs::relative(e.path(), req.src_dir).string();
                log_->seen[rel] = testutil::ReadTextFile(e.path().string());
            }
        }
        if (!outcome.ok) return outcome;
        testutil::WriteTextFile(req.final_path, "artifact");
        out.path = req.final_path;
        out.size_bytes = 8;
        out.sha256 = std::string(64, 'a');
        return Result::Ok();
    }

  private:
    PackagerLog* log_;
};

class MergePipelineTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    std::vector<std::string> extract_calls;
    PackagerLog packager_log;

    std::string In() const { return tmp.Path() + "/in"; }

    void SetUp() override { fs::create_directories(In()); }

    void Touch(const std::string& name) { testutil::WriteTextFile(In() + "/" + name, "archive bytes"); }

    RunContext Context() const {
        RunContext ctx;
        ctx.working_dir = In();
        ctx.now = std::chrono::system_clock::from_time_t(1741521600);
        ctx.write_checksum = false;
        return ctx;
    }

    const std::map<std::string, Files> kContents = {
        {"takeout-20240115T103000Z-001.zip",
         {{"Takeout/Drive/shared.txt", "v1"}, {"Takeout/Drive/a.txt", "a"}}},
        {"takeout-20240115T103000Z-002.tgz",
         {{"Takeout/Drive/shared.txt", "v2"}, {"Takeout/Mail/all.mbox", "mail"}}},
    };

    std::unique_ptr<TakeoutMerger> MakeMerger(RunContext ctx,
                                              std::unique_ptr<FakeExtractor> extractor = nullptr,
                                              std::unique_ptr<FakePackager> packager = nullptr) {
        if (!extractor) extractor = std::make_unique<FakeExtractor>(kContents, &extract_calls);
        if (!packager) packager = std::make_unique<FakePackager>(&packager_log);
        return std::make_unique<TakeoutMerger>(std::move(ctx),
                                               std::move(extractor),
                                               std::make_unique<OverlayTreeMerger>(),
                                               std::move(packager));
    }

    std::set<std::string> InEntries() const {
        std::set<std::string> names;
        for (const auto& e : fs::directory_iterator(In())) names.insert(e.path().filename().string());
        return names;
    }
};

TEST_F(MergePipelineTest, MergesInOrderAndPackages) {
    Touch("takeout-20240115T103000Z-002.tgz");
    Touch("takeout-20240115T103000Z-001.zip");

    auto merger = MakeMerger(Context());
    RunSummary summary;
    auto res = merger->Run(summary);
    ASSERT_TRUE(res.ok) << res.msg;

    EXPECT_EQ(extract_calls, (std::vector<std::string>{"takeout-20240115T103000Z-001.zip",
                                                       "takeout-20240115T103000Z-002.tgz"}));
    const Files expected = {
        {"Drive/shared.txt", "v2"},
        {"Drive/a.txt", "a"},
        {"Mail/all.mbox", "mail"},
    };
    EXPECT_EQ(packager_log.seen, expected);
    EXPECT_EQ(packager_log.request.src_bytes, 2u + 1u + 4u);

    EXPECT_EQ(summary.archives_merged, 2u);
    EXPECT_EQ(summary.file_count, 3u);
    EXPECT_EQ(summary.takeout_date, "2024-01-15");
    EXPECT_FALSE(summary.date_from_fallback);
    EXPECT_EQ(summary.output_path, (fs::path(In()) / "Takeout-2024-01-15.tar.xz").string());
    EXPECT_TRUE(summary.checksum_path.empty());

    // Scratch space is gone; only inputs and the artifact remain.
    EXPECT_EQ(InEntries(), (std::set<std::string>{"takeout-20240115T103000Z-001.zip",
                                                  "takeout-20240115T103000Z-002.tgz",
                                                  "Takeout-2024-01-15.tar.xz"}));
}

TEST_F(MergePipelineTest, NoArchivesFailsBeforeExtraction) {
    testutil::WriteTextFile(In() + "/unrelated.zip", "x");

    auto merger = MakeMerger(Context());
    RunSummary summary;
    auto res = merger->Run(summary);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, ErrorKind::NoInputFound);
    EXPECT_TRUE(extract_calls.empty());
    EXPECT_EQ(packager_log.calls, 0);
    EXPECT_EQ(InEntries(), std::set<std::string>{"unrelated.zip"});
}

TEST_F(MergePipelineTest, MissingDependencyFailsFirst) {
    Touch("takeout-20240115T103000Z-001.zip");

    auto packager = std::make_unique<FakePackager>(&packager_log);
    packager->available = Result::Fail(ErrorKind::MissingDependency, "xz compression is not available");
    auto merger = MakeMerger(Context(), nullptr, std::move(packager));

    RunSummary summary;
    auto res = merger->Run(summary);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, ErrorKind::MissingDependency);
    EXPECT_TRUE(extract_calls.empty());
    EXPECT_EQ(InEntries().size(), 1u);
}

TEST_F(MergePipelineTest, ExtractionFailureLeavesNoArtifact) {
    Touch("takeout-20240115T103000Z-001.zip");
    Touch("takeout-20240115T103000Z-002.tgz");

    auto extractor = std::make_unique<FakeExtractor>(kContents, &extract_calls);
    extractor->fail_on = "takeout-20240115T103000Z-002.tgz";
    auto merger = MakeMerger(Context(), std::move(extractor));

    RunSummary summary;
    auto res = merger->Run(summary);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, ErrorKind::ExtractionFailure);
    EXPECT_NE(res.msg.find("takeout-20240115T103000Z-002.tgz"), std::string::npos);
    EXPECT_EQ(packager_log.calls, 0);
    EXPECT_EQ(InEntries(), (std::set<std::string>{"takeout-20240115T103000Z-001.zip",
                                                  "takeout-20240115T103000Z-002.tgz"}));
}

TEST_F(MergePipelineTest, PackagingFailureCleansUp) {
    Touch("takeout-20240115T103000Z-001.zip");

    auto packager = std::make_unique<FakePackager>(&packager_log);
    packager->outcome = Result::Fail(ENOSPC, "No space left on device");
    auto merger = MakeMerger(Context(), nullptr, std::move(packager));

    RunSummary summary;
    auto res = merger->Run(summary);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, ErrorKind::PackagingFailure);
    EXPECT_EQ(InEntries(), std::set<std::string>{"takeout-20240115T103000Z-001.zip"});
}

TEST_F(MergePipelineTest, RepeatedRunsAgree) {
    Touch("takeout-20240115T103000Z-001.zip");
    Touch("takeout-20240115T103000Z-002.tgz");

    RunSummary first;
    ASSERT_TRUE(MakeMerger(Context())->Run(first).ok);
    RunSummary second;
    ASSERT_TRUE(MakeMerger(Context())->Run(second).ok);

    EXPECT_EQ(first.file_count, second.file_count);
    EXPECT_EQ(first.output_path, second.output_path);
    EXPECT_EQ(first.takeout_date, second.takeout_date);
}

TEST_F(MergePipelineTest, UndatedNameUsesClockOrFails) {
    Touch("takeout-latest.zip");

    RunSummary summary;
    auto merger = MakeMerger(Context());
    ASSERT_TRUE(merger->Run(summary).ok);
    EXPECT_TRUE(summary.date_from_fallback);
    EXPECT_EQ(summary.takeout_date, FormatLocalDate(Context().now));

    extract_calls.clear();
    RunContext strict = Context();
    strict.date_fallback = DateFallback::Fail;
    auto res = MakeMerger(strict)->Run(summary);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, ErrorKind::Config);
    EXPECT_TRUE(extract_calls.empty());
}

TEST_F(MergePipelineTest, InvalidLabelIsConfigError) {
    Touch("takeout-20240115T103000Z-001.zip");
    RunContext ctx = Context();
    ctx.output_label = "a/b";

    RunSummary summary;
    auto res = MakeMerger(ctx)->Run(summary);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, ErrorKind::Config);
}

TEST_F(MergePipelineTest, SeparateOutputAndWorkDirectories) {
    Touch("takeout-20240115T103000Z-001.zip");
    RunContext ctx = Context();
    ctx.output_dir = tmp.Path() + "/out";
    ctx.work_root = tmp.Path() + "/scratch";
    ctx.output_label = "Backup";
    fs::create_directories(ctx.output_dir);

    RunSummary summary;
    auto res = MakeMerger(ctx)->Run(summary);
    ASSERT_TRUE(res.ok) << res.msg;
    EXPECT_EQ(summary.output_path, (fs::path(tmp.Path()) / "out" / "Backup-2024-01-15.tar.xz").string());
    EXPECT_TRUE(fs::exists(summary.output_path));
    EXPECT_TRUE(fs::is_empty(tmp.Path() + "/scratch"));
}

TEST_F(MergePipelineTest, RealServicesEndToEnd) {
    testutil::WriteZipFile(In() + "/takeout-20240115T103000Z-001.zip", {
        {"Takeout/Drive/shared.txt", "v1", AE_IFREG},
        {"Takeout/Drive/a.txt", "a", AE_IFREG},
    });
    testutil::WriteTarGzFile(In() + "/takeout-20240115T103000Z-002.tgz", {
        {"Takeout/Drive/shared.txt", "v2", AE_IFREG},
        {"Takeout/Mail/all.mbox", "mail", AE_IFREG},
    });

    RunContext ctx = Context();
    ctx.write_checksum = true;
    ctx.compression_level = 1;
    TakeoutMerger merger(ctx);

    RunSummary summary;
    auto res = merger.Run(summary);
    ASSERT_TRUE(res.ok) << res.msg;
    EXPECT_EQ(summary.file_count, 3u);
    EXPECT_EQ(summary.checksum_path, summary.output_path + ".sha256");

    const std::vector<std::pair<std::string, std::string>> expected = {
        {"Drive", "<dir>"},
        {"Drive/a.txt", "a"},
        {"Drive/shared.txt", "v2"},
        {"Mail", "<dir>"},
        {"Mail/all.mbox", "mail"},
    };
    EXPECT_EQ(testutil::ListArchive(summary.output_path), expected);
}

TEST_F(MergePipelineTest, RealServicesThroughSymlinkedDirectories) {
    testutil::WriteZipFile(In() + "/takeout-20240115T103000Z-001.zip", {
        {"Takeout/Drive/a.txt", "a", AE_IFREG},
    });
    testutil::WriteTarGzFile(In() + "/takeout-20240115T103000Z-002.tgz", {
        {"Takeout/Photos/p.jpg", "p", AE_IFREG},
    });

    const fs::path disk = fs::path(tmp.Path()) / "bigdisk";
    const fs::path scratch_link = fs::path(tmp.Path()) / "scratch";
    const fs::path out_link = fs::path(tmp.Path()) / "out";
    fs::create_directories(disk / "out");
    fs::create_directory_symlink(disk, scratch_link);
    fs::create_directory_symlink(disk / "out", out_link);

    RunContext ctx = Context();
    ctx.work_root = scratch_link.string();
    ctx.output_dir = out_link.string();
    ctx.compression_level = 1;
    TakeoutMerger merger(ctx);

    RunSummary summary;
    auto res = merger.Run(summary);
    ASSERT_TRUE(res.ok) << res.msg;
    EXPECT_EQ(summary.file_count, 2u);

    EXPECT_TRUE(fs::is_symlink(scratch_link));
    EXPECT_TRUE(fs::is_symlink(out_link));
    std::set<std::string> on_disk;
    for (const auto& e : fs::directory_iterator(disk)) on_disk.insert(e.path().filename().string());
    EXPECT_EQ(on_disk, std::set<std::string>{"out"});
    EXPECT_TRUE(fs::exists(disk / "out" / "Takeout-2024-01-15.tar.xz"));

    const std::vector<std::pair<std::string, std::string>> expected = {
        {"Drive", "<dir>"},
        {"Drive/a.txt", "a"},
        {"Photos", "<dir>"},
        {"Photos/p.jpg", "p"},
    };
    EXPECT_EQ(testutil::ListArchive(summary.output_path), expected);
}

} // namespace
} // namespace takeout
