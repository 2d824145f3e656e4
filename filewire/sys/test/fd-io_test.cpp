#include "filewire/fd-io.hpp"

#include <fcntl.h>
#include <gtest/gtest.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstddef>
#include <span>
#include <string>

#include "filewire/base-fd.hpp"
#include "filewire/stream.hpp"
#include "filewire/sys-test-support.hpp"
#include "filewire/temp-file.hpp"
#include "filewire/test-util.hpp"

using namespace filewire;

namespace {
// Injected actions: (return value, errno). A positive return value caps the real call to that many bytes.
test::KeyedActionQueue<int, test::IoAction> gReadActions;
test::KeyedActionQueue<int, test::IoAction> gWriteActions;

using ReadFn = ssize_t (*)(int, void*, size_t);
using WriteFn = ssize_t (*)(int, const void*, size_t);

ReadFn RealRead() {
  static ReadFn fn = test::ResolveNext<ReadFn>("read");
  return fn;
}

WriteFn RealWrite() {
  static WriteFn fn = test::ResolveNext<WriteFn>("write");
  return fn;
}

struct PipeFds {
  PipeFds() {
    int fds[2];
    if (::pipe(fds) == 0) {
      readEnd = BaseFd(fds[0]);
      writeEnd = BaseFd(fds[1]);
    }
  }

  BaseFd readEnd;
  BaseFd writeEnd;
};

}  // namespace

extern "C" ssize_t read(int fd, void* buf, size_t count) {
  const auto action = gReadActions.pop(fd);
  if (action.has_value()) {
    if (action->first < 0) {
      errno = action->second;
      return -1;
    }
    count = std::min(count, static_cast<size_t>(action->first));
  }
  return RealRead()(fd, buf, count);
}

extern "C" ssize_t write(int fd, const void* buf, size_t count) {
  const auto action = gWriteActions.pop(fd);
  if (action.has_value()) {
    if (action->first < 0) {
      errno = action->second;
      return -1;
    }
    count = std::min(count, static_cast<size_t>(action->first));
  }
  return RealWrite()(fd, buf, count);
}

TEST(FdIo, ReadRetriesEintr) {
  test::QueueResetGuard guard(gReadActions);
  PipeFds pipe;
  ASSERT_EQ(WriteAllFd(pipe.writeEnd.fd(), test::AsBytes("abc")).status, IoStatus::Ok);
  gReadActions.setActions(pipe.readEnd.fd(), {{-1, EINTR}, {-1, EINTR}});

  std::array<std::byte, 8> buf;
  const IoResult res = ReadFd(pipe.readEnd.fd(), buf);
  EXPECT_EQ(res.status, IoStatus::Ok);
  EXPECT_EQ(res.bytes, 3U);
}

TEST(FdIo, ReadReportsEofAndEmptyBufferIsOk) {
  PipeFds pipe;
  pipe.writeEnd.close();
  std::array<std::byte, 8> buf;
  EXPECT_EQ(ReadFd(pipe.readEnd.fd(), buf).status, IoStatus::Eof);
  EXPECT_EQ(ReadFd(pipe.readEnd.fd(), std::span<std::byte>{}).status, IoStatus::Ok);
}

TEST(FdIo, ReadEagainIsTimeout) {
  test::QueueResetGuard guard(gReadActions);
  PipeFds pipe;
  gReadActions.setActions(pipe.readEnd.fd(), {{-1, EAGAIN}});
  std::array<std::byte, 8> buf;
  const IoResult res = ReadFd(pipe.readEnd.fd(), buf);
  EXPECT_EQ(res.status, IoStatus::Timeout);
  EXPECT_EQ(res.err, EAGAIN);
}

TEST(FdIo, ReadErrorCarriesErrno) {
  test::QueueResetGuard guard(gReadActions);
  PipeFds pipe;
  gReadActions.setActions(pipe.readEnd.fd(), {{-1, EIO}});
  std::array<std::byte, 8> buf;
  const IoResult res = ReadFd(pipe.readEnd.fd(), buf);
  EXPECT_EQ(res.status, IoStatus::Error);
  EXPECT_EQ(res.err, EIO);
  EXPECT_EQ(IoStatusToString(res.status), "error");
}

TEST(FdIo, WriteAllContinuesPartialWrites) {
  test::QueueResetGuard guard(gWriteActions);
  test::ScopedTempDir dir;
  test::ScopedTempFile file(dir, "");
  BaseFd fd(::open(file.filePath().c_str(), O_WRONLY | O_CLOEXEC));
  ASSERT_TRUE(fd);
  gWriteActions.setActions(fd.fd(), {{2, 0}, {-1, EINTR}, {3, 0}});

  const IoResult res = WriteAllFd(fd.fd(), test::AsBytes("partial-writes"));
  EXPECT_EQ(res.status, IoStatus::Ok);
  EXPECT_EQ(res.bytes, 14U);
  fd.close();
  EXPECT_EQ(test::ReadFileContent(file.filePath()), "partial-writes");
}

TEST(FdIo, WriteAllReportsBytesBeforeError) {
  test::QueueResetGuard guard(gWriteActions);
  PipeFds pipe;
  gWriteActions.setActions(pipe.writeEnd.fd(), {{4, 0}, {-1, ENOSPC}});
  const IoResult res = WriteAllFd(pipe.writeEnd.fd(), test::AsBytes("0123456789"));
  EXPECT_EQ(res.status, IoStatus::Error);
  EXPECT_EQ(res.bytes, 4U);
  EXPECT_EQ(res.err, ENOSPC);
}

TEST(FdIo, SeekAndOffset) {
  test::ScopedTempDir dir;
  test::ScopedTempFile file(dir, "0123456789");
  BaseFd fd(::open(file.filePath().c_str(), O_RDONLY | O_CLOEXEC));
  ASSERT_TRUE(fd);
  EXPECT_EQ(CurrentOffset(fd.fd()), 0);
  ASSERT_TRUE(SeekTo(fd.fd(), 7));
  EXPECT_EQ(CurrentOffset(fd.fd()), 7);
  std::array<std::byte, 8> buf;
  EXPECT_EQ(ReadFd(fd.fd(), buf).bytes, 3U);
}

TEST(FdIo, SeekOnPipeFails) {
  PipeFds pipe;
  EXPECT_FALSE(SeekTo(pipe.readEnd.fd(), 0));
  EXPECT_EQ(CurrentOffset(pipe.readEnd.fd()), -1);
}
