#include <gtest/gtest.h>

#include "io/fd.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

TEST(FdTests, ClosesFileDescriptorOnDestruct) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    {
        takeout::Fd holder(fd);
        ASSERT_TRUE(holder.Valid());
        EXPECT_EQ(holder.Get(), fd);
    }

    errno = 0;
    int rc = ::close(fd);
    EXPECT_EQ(rc, -1);
    EXPECT_EQ(errno, EBADF);
}

TEST(FdTests, ReleaseKeepsDescriptorOpen) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    {
        takeout::Fd holder(fd);
        EXPECT_EQ(holder.Release(), fd);
        EXPECT_FALSE(holder.Valid());
    }

    EXPECT_EQ(::close(fd), 0);
}

TEST(FdTests, MoveTransfersOwnership) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    takeout::Fd a(fd);
    takeout::Fd b(std::move(a));
    EXPECT_FALSE(a.Valid());
    ASSERT_TRUE(b.Valid());
    EXPECT_EQ(b.Get(), fd);

    b.Close();
    EXPECT_FALSE(b.Valid());
}

TEST(FdTests, OpenReportsErrno) {
    takeout::Fd fd;
    auto missing = takeout::Fd::Open("/nonexistent/takeout-merger/file", O_RDONLY, fd);
    ASSERT_FALSE(missing.ok);
    EXPECT_EQ(missing.err, ENOENT);
    EXPECT_FALSE(fd.Valid());

    ASSERT_TRUE(takeout::Fd::Open("/dev/null", O_RDONLY, fd).ok);
    EXPECT_TRUE(fd.Valid());
    EXPECT_NE(::fcntl(fd.Get(), F_GETFD) & FD_CLOEXEC, 0);

    struct stat st {};
    ASSERT_TRUE(fd.Stat(st).ok);
    EXPECT_TRUE(S_ISCHR(st.st_mode));
}

} // namespace
