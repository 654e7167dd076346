#include "merge/archive_extractor.hpp"
#include "testing.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <sys/stat.h>
#include <vector>

namespace takeout {
namespace {

namespace fs = std::filesystem;

class RecordingProgress final : public IProgress {
  public:
    void OnProgress(const ProgressEvent& e) override { events.push_back(e); }
    std::vector<ProgressEvent> events;
};

class ArchiveExtractorTest : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;

    void SetUp() override { fs::create_directory(Dest()); }

    std::string Dest() const { return tmp.Path() + "/extract"; }

    ArchiveRef Ref(const std::string& name, ArchiveKind kind) const {
        ArchiveRef ref;
        ref.path = tmp.Path() + "/" + name;
        ref.file_name = name;
        ref.kind = kind;
        std::error_code ec;
        const auto size = fs::file_size(ref.path, ec);
        ref.size_bytes = ec ? 0 : static_cast<std::uint64_t>(size);
        return ref;
    }

    const std::vector<testutil::TarEntry> kEntries = {
        {"Takeout/", "", AE_IFDIR},
        {"Takeout/Drive/", "", AE_IFDIR},
        {"Takeout/Drive/notes.txt", "drive notes\n", AE_IFREG},
        {"./Takeout/Photos/2024/img_0001.jpg", std::string(70000, 'j'), AE_IFREG},
        {"Takeout/Photos/latest.jpg", "", AE_IFLNK, "2024/img_0001.jpg"},
    };

    void ExpectExtracted() const {
        EXPECT_EQ(testutil::ReadTextFile(Dest() + "/Takeout/Drive/notes.txt"), "drive notes\n");
        EXPECT_EQ(testutil::ReadTextFile(Dest() + "/Takeout/Photos/2024/img_0001.jpg"),
                  std::string(70000, 'j'));
        const fs::path link = Dest() + "/Takeout/Photos/latest.jpg";
        ASSERT_TRUE(fs::is_symlink(fs::symlink_status(link)));
        EXPECT_EQ(fs::read_symlink(link), fs::path("2024/img_0001.jpg"));
    }
};

TEST_F(ArchiveExtractorTest, ExtractsTarGz) {
    testutil::WriteTarGzFile(tmp.Path() + "/takeout-1.tgz", kEntries);

    TarGzExtractor extractor;
    ExtractStats stats;
    auto res = extractor.Extract(Ref("takeout-1.tgz", ArchiveKind::TarGz), Dest(), {}, stats);
    ASSERT_TRUE(res.ok) << res.msg;

    ExpectExtracted();
    EXPECT_EQ(stats.entries, 5u);
    EXPECT_EQ(stats.bytes_written, 12u + 70000u);
}

TEST_F(ArchiveExtractorTest, ExtractsZip) {
    testutil::WriteZipFile(tmp.Path() + "/takeout-1.zip", kEntries);

    ZipExtractor extractor;
    ExtractStats stats;
    auto res = extractor.Extract(Ref("takeout-1.zip", ArchiveKind::Zip), Dest(), {}, stats);
    ASSERT_TRUE(res.ok) << res.msg;

    ExpectExtracted();
}

TEST_F(ArchiveExtractorTest, PreservesModificationTime) {
    testutil::WriteTarGzFile(tmp.Path() + "/takeout-1.tar.gz", {{"a.txt", "a", AE_IFREG}});

    TarGzExtractor extractor;
    ExtractStats stats;
    ASSERT_TRUE(extractor.Extract(Ref("takeout-1.tar.gz", ArchiveKind::TarGz), Dest(), {}, stats).ok);

    struct stat st {};
    ASSERT_EQ(::stat((Dest() + "/a.txt").c_str(), &st), 0);
    EXPECT_EQ(st.st_mtime, 1700000000);
}

TEST_F(ArchiveExtractorTest, RejectsPathTraversal) {
    testutil::WriteTarGzFile(tmp.Path() + "/takeout-evil.tgz", {
        {"Takeout/ok.txt", "ok", AE_IFREG},
        {"../escaped.txt", "nope", AE_IFREG},
    });

    TarGzExtractor extractor;
    ExtractStats stats;
    auto res = extractor.Extract(Ref("takeout-evil.tgz", ArchiveKind::TarGz), Dest(), {}, stats);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, ErrorKind::ExtractionFailure);
    EXPECT_NE(res.msg.find("takeout-evil.tgz"), std::string::npos);
    EXPECT_FALSE(fs::exists(tmp.Path() + "/escaped.txt"));
}

TEST_F(ArchiveExtractorTest, CorruptArchiveFails) {
    testutil::WriteTextFile(tmp.Path() + "/takeout-bad.tgz", "this is not gzip at all");
    testutil::WriteTextFile(tmp.Path() + "/takeout-bad.zip", "this is not a zip either");

    ExtractorSet extractors;
    ExtractStats stats;
    auto gz = extractors.Extract(Ref("takeout-bad.tgz", ArchiveKind::TarGz), Dest(), {}, stats);
    ASSERT_FALSE(gz.ok);
    EXPECT_EQ(gz.kind, ErrorKind::ExtractionFailure);
    EXPECT_NE(gz.msg.find("Failed to extract takeout-bad.tgz"), std::string::npos);

    auto zip = extractors.Extract(Ref("takeout-bad.zip", ArchiveKind::Zip), Dest(), {}, stats);
    ASSERT_FALSE(zip.ok);
    EXPECT_EQ(zip.kind, ErrorKind::ExtractionFailure);
}

TEST_F(ArchiveExtractorTest, TruncatedTarGzFails) {
    std::string big(200000, 'x');
    for (size_t i = 0; i < big.size(); ++i)
        big[i] = static_cast<char>('a' + (i * 31 + i / 7) % 26);
    auto gz = testutil::Gzip(testutil::BuildTar({{"big.bin", big, AE_IFREG}}));
    gz.resize(gz.size() / 2);
    testutil::WriteBytesFile(tmp.Path() + "/takeout-cut.tgz", gz);

    TarGzExtractor extractor;
    ExtractStats stats;
    auto res = extractor.Extract(Ref("takeout-cut.tgz", ArchiveKind::TarGz), Dest(), {}, stats);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, ErrorKind::ExtractionFailure);
}

TEST_F(ArchiveExtractorTest, ReportsProgressAcrossArchives) {
    testutil::WriteTarGzFile(tmp.Path() + "/takeout-2.tgz", kEntries);
    const ArchiveRef ref = Ref("takeout-2.tgz", ArchiveKind::TarGz);

    RecordingProgress progress;
    IArchiveExtractor::Options opt;
    opt.progress_sink = &progress;
    opt.overall_done_base_bytes = 1000;
    opt.overall_total_bytes = 1000 + ref.size_bytes;

    TarGzExtractor extractor;
    ExtractStats stats;
    ASSERT_TRUE(extractor.Extract(ref, Dest(), opt, stats).ok);

    ASSERT_FALSE(progress.events.empty());
    const ProgressEvent& last = progress.events.back();
    EXPECT_EQ(last.stage, "takeout-2.tgz");
    EXPECT_EQ(last.stage_done, ref.size_bytes);
    EXPECT_EQ(last.overall_done, opt.overall_total_bytes);
    for (const auto& e : progress.events) {
        EXPECT_GE(e.overall_done, 1000u);
        EXPECT_LE(e.overall_done, opt.overall_total_bytes);
    }
}

TEST_F(ArchiveExtractorTest, ExtractorSetDispatchesByKind) {
    ExtractorSet all;
    EXPECT_TRUE(all.Supports(ArchiveKind::Zip));
    EXPECT_TRUE(all.Supports(ArchiveKind::TarGz));

    std::vector<std::unique_ptr<IArchiveExtractor>> only_zip;
    only_zip.push_back(std::make_unique<ZipExtractor>());
    ExtractorSet zips(std::move(only_zip));
    EXPECT_FALSE(zips.Supports(ArchiveKind::TarGz));

    testutil::WriteTarGzFile(tmp.Path() + "/takeout-3.tgz", kEntries);
    ExtractStats stats;
    auto res = zips.Extract(Ref("takeout-3.tgz", ArchiveKind::TarGz), Dest(), {}, stats);
    ASSERT_FALSE(res.ok);
    EXPECT_EQ(res.kind, ErrorKind::ExtractionFailure);
}

} // namespace
} // namespace takeout
