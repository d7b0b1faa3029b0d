#include <gtest/gtest.h>

#include "io/fd.hpp"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#include <string>
#include <utility>

namespace {

TEST(FdTests, ClosesFileDescriptorOnDestruct) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    {
        otafetch::Fd holder(fd);
        ASSERT_TRUE(holder.Valid());
        EXPECT_EQ(holder.Get(), fd);
    }

    errno = 0;
    int rc = ::close(fd);
    EXPECT_EQ(rc, -1);
    EXPECT_EQ(errno, EBADF);
}

TEST(FdTests, MoveTransfersOwnership) {
    otafetch::Fd a(::open("/dev/null", O_RDONLY));
    ASSERT_TRUE(a.Valid());
    const int raw = a.Get();

    otafetch::Fd b(std::move(a));
    EXPECT_FALSE(a.Valid());
    EXPECT_EQ(b.Get(), raw);
}

TEST(FdTests, ReleaseKeepsDescriptorOpen) {
    int raw = -1;
    {
        otafetch::Fd holder(::open("/dev/null", O_RDONLY));
        raw = holder.Release();
        EXPECT_FALSE(holder.Valid());
    }
    ASSERT_GE(raw, 0);
    EXPECT_EQ(::close(raw), 0);
}

TEST(FdTests, OpenReportsMissingPath) {
    otafetch::Fd fd;
    auto r = otafetch::Fd::Open("/nonexistent/otafetch/none", O_RDONLY, 0, "open image", fd);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.err, ENOENT);
    EXPECT_NE(r.msg.find("open image: /nonexistent/otafetch/none"), std::string::npos);
    EXPECT_FALSE(fd.Valid());
}

TEST(FdTests, OpenSetsCloseOnExec) {
    otafetch::Fd fd;
    ASSERT_TRUE(otafetch::Fd::Open("/dev/null", O_RDONLY, 0, "open", fd).is_ok());
    ASSERT_TRUE(fd.Valid());
    const int flags = ::fcntl(fd.Get(), F_GETFD);
    ASSERT_GE(flags, 0);
    EXPECT_NE(flags & FD_CLOEXEC, 0);
}

} // namespace
