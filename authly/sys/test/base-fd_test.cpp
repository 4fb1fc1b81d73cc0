#include "authly/base-fd.hpp"

#include <gtest/gtest.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <utility>

using namespace authly;

TEST(BaseFd, DefaultConstructedIsClosed) {
  BaseFd fd;
  EXPECT_FALSE(fd);
  EXPECT_EQ(fd.fd(), BaseFd::kClosedFd);
}

TEST(BaseFd, ReleaseMakesObjectClosedAndReturnsFd) {
  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));
  BaseFd rd(fds[0]);
  ::close(fds[1]);

  ASSERT_TRUE(rd);
  int raw = rd.release();
  EXPECT_FALSE(rd);
  EXPECT_GE(raw, 0);
  EXPECT_EQ(0, ::close(raw));
}

TEST(BaseFd, CloseIsIdempotent) {
  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));
  BaseFd rd(fds[0]);
  BaseFd wr(fds[1]);
  const int rawRd = rd.fd();

  rd.close();
  EXPECT_FALSE(rd);
  rd.close();
  EXPECT_FALSE(rd);

  // underlying fd really is closed
  errno = 0;
  EXPECT_EQ(-1, ::fcntl(rawRd, F_GETFD));
  EXPECT_EQ(EBADF, errno);
}

TEST(BaseFd, MoveTransfersOwnership) {
  int fds[2];
  ASSERT_EQ(0, ::pipe(fds));
  BaseFd rd(fds[0]);
  BaseFd wr(fds[1]);

  BaseFd moved(std::move(rd));
  EXPECT_FALSE(rd);  // NOLINT(bugprone-use-after-move)
  EXPECT_EQ(moved.fd(), fds[0]);

  BaseFd assigned;
  assigned = std::move(moved);
  EXPECT_FALSE(moved);  // NOLINT(bugprone-use-after-move)
  EXPECT_EQ(assigned.fd(), fds[0]);
}
