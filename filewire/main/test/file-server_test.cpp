#include "filewire/file-server.hpp"

#include <gtest/gtest.h>
#include <pthread.h>
#include <sys/socket.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "filewire/connection.hpp"
#include "filewire/file-server-config.hpp"
#include "filewire/frame-header.hpp"
#include "filewire/invalid_argument_exception.hpp"
#include "filewire/memory-stream.hpp"
#include "filewire/receiver.hpp"
#include "filewire/sys-test-support.hpp"
#include "filewire/tcp-connector.hpp"
#include "filewire/temp-file.hpp"
#include "filewire/test-util.hpp"
#include "filewire/transfer-config.hpp"
#include "filewire/transfer-error.hpp"

namespace {
// errno values returned, in order, by the next pthread_create / accept4 calls instead of the real ones.
filewire::test::ActionQueue<int> gThreadCreateErrors;
filewire::test::ActionQueue<int> gAcceptErrors;
std::atomic<int> gInjectedAcceptFailures{0};
}  // namespace

extern "C" int pthread_create(pthread_t* thread, const pthread_attr_t* attr, void* (*startRoutine)(void*),
                              void* arg) noexcept {
  using PthreadCreateFn = int (*)(pthread_t*, const pthread_attr_t*, void* (*)(void*), void*);
  static PthreadCreateFn realFn = filewire::test::ResolveNext<PthreadCreateFn>("pthread_create");
  if (const auto err = gThreadCreateErrors.pop()) {
    return *err;
  }
  return realFn(thread, attr, startRoutine, arg);
}

extern "C" int accept4(int fd, sockaddr* addr, socklen_t* addrLen, int flags) {
  using Accept4Fn = int (*)(int, sockaddr*, socklen_t*, int);
  static Accept4Fn realFn = filewire::test::ResolveNext<Accept4Fn>("accept4");
  if (const auto err = gAcceptErrors.pop()) {
    gInjectedAcceptFailures.fetch_add(1, std::memory_order_relaxed);
    errno = *err;
    return -1;
  }
  return realFn(fd, addr, addrLen, flags);
}

namespace filewire {

namespace {
constexpr std::chrono::milliseconds kPollInterval{10};

std::string Download(uint16_t port) {
  ConnectResult res = ConnectTCP("127.0.0.1", port);
  if (res.failure) {
    ADD_FAILURE() << "connection to port " << port << " failed";
    return {};
  }
  MemoryWriter sink;
  Receiver receiver;
  receiver.receive(res.cnx, sink);
  return std::string(sink.view());
}

template <class Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds{5}) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds{1});
  }
  return true;
}
}  // namespace

class FileServerTest : public ::testing::Test {
 protected:
  FileServerConfig makeConfig(const test::ScopedTempFile& file) const {
    return FileServerConfig{}.withFilePath(file.filePath().string()).withPollInterval(kPollInterval);
  }

  test::ScopedTempDir tmpDir;
};

TEST_F(FileServerTest, BindsEphemeralPort) {
  test::ScopedTempFile file(tmpDir, "content");
  FileServer server(makeConfig(file));
  EXPECT_NE(server.port(), 0);
  EXPECT_FALSE(server.isRunning());
}

TEST_F(FileServerTest, RefusesMissingFile) {
  EXPECT_THROW(FileServer(FileServerConfig{}.withFilePath(tmpDir.entry("missing").string())), std::system_error);
}

TEST_F(FileServerTest, RefusesNonRegularFile) {
  EXPECT_THROW(FileServer(FileServerConfig{}.withFilePath("/dev/null")), std::system_error);
}

TEST_F(FileServerTest, RefusesInvalidConfig) {
  EXPECT_THROW(FileServer(FileServerConfig{}), invalid_argument);
}

TEST_F(FileServerTest, RefusesPortInUse) {
  test::ScopedTempFile file(tmpDir, "content");
  FileServer first(makeConfig(file));
  EXPECT_THROW(FileServer(makeConfig(file).withPort(first.port())), std::system_error);
}

TEST_F(FileServerTest, ServesFileToSequentialClients) {
  test::ScopedTempFile file(tmpDir, 200000);
  FileServer server(makeConfig(file));
  auto handle = server.startDetached();
  ASSERT_TRUE(handle.started());

  EXPECT_EQ(Download(server.port()), file.content());
  EXPECT_EQ(Download(server.port()), file.content());

  ASSERT_TRUE(WaitFor([&] { return server.stats().completedTransfers == 2U; }));
  const FileServerStats stats = server.stats();
  EXPECT_EQ(stats.acceptedConnections, 2U);
  EXPECT_EQ(stats.failedTransfers, 0U);
  EXPECT_EQ(stats.payloadBytesSent, 400000U);
  EXPECT_TRUE(server.isRunning());

  handle.stop();
  handle.rethrowIfError();
  EXPECT_FALSE(server.isRunning());
}

TEST_F(FileServerTest, EveryStrategyServesIdenticalBytes) {
  test::ScopedTempFile file(tmpDir, 300001);
  for (auto kind : {CopyStrategyKind::Auto, CopyStrategyKind::Buffered, CopyStrategyKind::SmallChunk,
                    CopyStrategyKind::Sendfile}) {
    FileServer server(makeConfig(file).withTransferConfig(TransferConfig{}.withStrategy(kind)));
    auto handle = server.startDetached();
    EXPECT_EQ(Download(server.port()), file.content()) << CopyStrategyKindToString(kind);
  }
}

TEST_F(FileServerTest, ConcurrentClientsGetNonInterleavedContent) {
  test::ScopedTempFile file(tmpDir, 1UL << 20);
  FileServer server(makeConfig(file));
  server.start();

  static constexpr std::size_t kNbClients = 8;
  std::array<std::string, kNbClients> received;
  {
    std::vector<std::jthread> clients;
    for (std::size_t clientIdx = 0; clientIdx < kNbClients; ++clientIdx) {
      clients.emplace_back([&, clientIdx] { received[clientIdx] = Download(server.port()); });
    }
  }
  for (const std::string& content : received) {
    EXPECT_EQ(content, file.content());
  }
  ASSERT_TRUE(WaitFor([&] { return server.stats().completedTransfers == kNbClients; }));
  server.stop();
  EXPECT_FALSE(server.isRunning());
}

TEST_F(FileServerTest, MaxConcurrentTransfersQueuesExtraClients) {
  test::ScopedTempFile file(tmpDir, 50000);
  FileServer server(makeConfig(file).withMaxConcurrentTransfers(1));
  auto handle = server.startDetached();

  std::array<std::string, 4> received;
  {
    std::vector<std::jthread> clients;
    for (std::size_t clientIdx = 0; clientIdx < received.size(); ++clientIdx) {
      clients.emplace_back([&, clientIdx] { received[clientIdx] = Download(server.port()); });
    }
  }
  for (const std::string& content : received) {
    EXPECT_EQ(content, file.content());
  }
  ASSERT_TRUE(WaitFor([&] { return server.stats().completedTransfers == received.size(); }));
}

TEST_F(FileServerTest, EmptyFileSendsOnlyHeader) {
  test::ScopedTempFile file(tmpDir, "");
  FileServer server(makeConfig(file));
  auto handle = server.startDetached();

  ConnectResult res = ConnectTCP("127.0.0.1", server.port());
  ASSERT_FALSE(res.failure);
  const std::string wire = test::ReadAll(res.cnx);
  ASSERT_EQ(wire.size(), kFrameHeaderSize);
  EXPECT_EQ(wire, std::string(kFrameHeaderSize, '\0'));
}

TEST_F(FileServerTest, FailedTransferIsCountedAndServerKeepsServing) {
  test::ScopedTempFile file(tmpDir, 16UL << 20);
  FileServer server(makeConfig(file).withTransferConfig(TransferConfig{}.withIoTimeout(std::chrono::milliseconds{100})));
  auto handle = server.startDetached();

  {
    // client that never reads: the server send buffer fills up and the send deadline expires
    ConnectResult silent = ConnectTCP("127.0.0.1", server.port());
    ASSERT_FALSE(silent.failure);
    ASSERT_TRUE(WaitFor([&] { return server.stats().failedTransfers == 1U; }));
  }

  EXPECT_EQ(Download(server.port()), file.content());
  ASSERT_TRUE(WaitFor([&] { return server.stats().completedTransfers == 1U; }));
  EXPECT_EQ(server.stats().acceptedConnections, 2U);
}

TEST_F(FileServerTest, ThreadCreationFailureOnlyFailsThatTransfer) {
  test::QueueResetGuard guard(gThreadCreateErrors);
  test::ScopedTempFile file(tmpDir, 100000);
  FileServer server(makeConfig(file).withMaxConcurrentTransfers(1));
  auto handle = server.startDetached();
  ASSERT_TRUE(WaitFor([&] { return server.isRunning(); }));

  gThreadCreateErrors.push(EAGAIN);
  {
    ConnectResult first = ConnectTCP("127.0.0.1", server.port());
    ASSERT_FALSE(first.failure);
    // the server closes the connection without sending anything
    MemoryWriter sink;
    Receiver receiver;
    try {
      receiver.receive(first.cnx, sink);
      FAIL() << "expected TransferError";
    } catch (const TransferError& err) {
      EXPECT_EQ(err.errc(), TransferErrc::HeaderTruncated);
    }
  }
  ASSERT_TRUE(WaitFor([&] { return server.stats().failedTransfers == 1U; }));
  EXPECT_TRUE(server.isRunning());
  EXPECT_TRUE(gThreadCreateErrors.empty());

  // the failed spawn must not keep the only transfer slot busy
  EXPECT_EQ(Download(server.port()), file.content());
  ASSERT_TRUE(WaitFor([&] { return server.stats().completedTransfers == 1U; }));
  const FileServerStats stats = server.stats();
  EXPECT_EQ(stats.acceptedConnections, 2U);
  EXPECT_EQ(stats.activeTransfers, 0U);

  handle.stop();
  EXPECT_NO_THROW(handle.rethrowIfError());
}

TEST_F(FileServerTest, AcceptResourceExhaustionBacksOffForPollInterval) {
  test::QueueResetGuard guard(gAcceptErrors);
  static constexpr std::chrono::milliseconds kSlowPoll{50};
  test::ScopedTempFile file(tmpDir, "still served");
  FileServer server(makeConfig(file).withPollInterval(kSlowPoll));
  auto handle = server.startDetached();
  ASSERT_TRUE(WaitFor([&] { return server.isRunning(); }));

  for (int errIdx = 0; errIdx < 10000; ++errIdx) {
    gAcceptErrors.push(EMFILE);
  }
  gInjectedAcceptFailures.store(0);

  // pending in the backlog: the listener stays readable while accept4 fails
  ConnectResult pending = ConnectTCP("127.0.0.1", server.port());
  ASSERT_FALSE(pending.failure);
  std::this_thread::sleep_for(10 * kSlowPoll);

  // roughly one attempt per poll interval, not a busy loop
  EXPECT_GE(gInjectedAcceptFailures.load(), 1);
  EXPECT_LE(gInjectedAcceptFailures.load(), 20);
  EXPECT_TRUE(server.isRunning());

  gAcceptErrors.reset();
  MemoryWriter sink;
  Receiver receiver;
  EXPECT_EQ(receiver.receive(pending.cnx, sink), 12U);
  EXPECT_EQ(sink.view(), "still served");

  handle.stop();
  EXPECT_NO_THROW(handle.rethrowIfError());
}

TEST_F(FileServerTest, RunUntilPredicate) {
  test::ScopedTempFile file(tmpDir, "abc");
  FileServer server(makeConfig(file));
  int nbChecks = 0;
  server.runUntil([&nbChecks] { return ++nbChecks == 3; });
  EXPECT_EQ(nbChecks, 3);
  EXPECT_FALSE(server.isRunning());
}

TEST_F(FileServerTest, StopFromAnotherThread) {
  test::ScopedTempFile file(tmpDir, "abc");
  FileServer server(makeConfig(file));
  std::jthread runner([&] { server.run(); });
  ASSERT_TRUE(WaitFor([&] { return server.isRunning(); }));
  server.stop();
  runner.join();
  EXPECT_FALSE(server.isRunning());
}

}  // namespace filewire
