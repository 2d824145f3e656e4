#include "filewire/receiver.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "filewire/frame-header.hpp"
#include "filewire/memory-stream.hpp"
#include "filewire/test-util.hpp"
#include "filewire/transfer-config.hpp"
#include "filewire/transfer-error.hpp"

namespace filewire {

namespace {
std::string Frame(std::uint64_t length, std::string_view payload) {
  const FrameHeaderBytes header = EncodeLength(length);
  std::string wire(reinterpret_cast<const char*>(header.data()), header.size());
  wire.append(payload);
  return wire;
}

TransferErrc ReceiveErrc(Receiver& receiver, Reader& conn, Writer& sink) {
  try {
    receiver.receive(conn, sink);
  } catch (const TransferError& ex) {
    return ex.errc();
  }
  ADD_FAILURE() << "receive did not throw";
  return TransferErrc::IO;
}
}  // namespace

TEST(Receiver, ReceivesPayload) {
  const std::string payload = test::RandomPayload(123456);
  const std::string wire = Frame(payload.size(), payload);
  // peer delivering at most 1000 bytes per read
  MemoryReader conn(wire, 1000);
  MemoryWriter sink;
  Receiver receiver;
  EXPECT_EQ(receiver.receive(conn, sink), payload.size());
  EXPECT_EQ(sink.view(), payload);
}

TEST(Receiver, HeaderSplitAcrossReads) {
  const std::string wire = Frame(3, "abc");
  MemoryReader conn(wire, 1);
  Receiver receiver;
  EXPECT_EQ(receiver.readHeader(conn), 3U);
  EXPECT_EQ(conn.consumed(), kFrameHeaderSize);
}

TEST(Receiver, ZeroLengthReadsNoPayload) {
  const std::string wire = Frame(0, "trailing");
  MemoryReader conn(wire);
  MemoryWriter sink;
  Receiver receiver;
  EXPECT_EQ(receiver.receive(conn, sink), 0U);
  EXPECT_EQ(sink.size(), 0U);
  EXPECT_EQ(conn.remaining(), 8U);
}

TEST(Receiver, TrailingBytesStayUnread) {
  const std::string wire = Frame(4, "abcdEXTRA");
  MemoryReader conn(wire);
  MemoryWriter sink;
  Receiver receiver(TransferConfig{}.withStrategy(CopyStrategyKind::SmallChunk));
  EXPECT_EQ(receiver.receive(conn, sink), 4U);
  EXPECT_EQ(sink.view(), "abcd");
  EXPECT_EQ(conn.remaining(), 5U);
}

TEST(Receiver, FiveHeaderBytesIsHeaderTruncated) {
  const std::string wire = Frame(10, "").substr(0, 5);
  MemoryReader conn(wire);
  MemoryWriter sink;
  Receiver receiver;
  EXPECT_EQ(ReceiveErrc(receiver, conn, sink), TransferErrc::HeaderTruncated);
}

TEST(Receiver, EmptyStreamIsHeaderTruncated) {
  MemoryReader conn("");
  MemoryWriter sink;
  Receiver receiver;
  EXPECT_EQ(ReceiveErrc(receiver, conn, sink), TransferErrc::HeaderTruncated);
}

TEST(Receiver, MissingLastPayloadByteIsPayloadTruncated) {
  const std::string wire = Frame(10, "123456789");
  MemoryReader conn(wire);
  MemoryWriter sink;
  Receiver receiver;
  EXPECT_EQ(ReceiveErrc(receiver, conn, sink), TransferErrc::PayloadTruncated);
  EXPECT_EQ(sink.view(), "123456789");
}

TEST(Receiver, SilentPeerTimesOut) {
  auto pair = test::MakeLoopbackPair();
  ASSERT_TRUE(pair.server.setTimeouts(std::chrono::milliseconds{50}));
  MemoryWriter sink;
  Receiver receiver;
  EXPECT_EQ(ReceiveErrc(receiver, pair.server, sink), TransferErrc::Timeout);
}

TEST(Receiver, SendfileConfigurationReceivesWithAuto) {
  Receiver receiver(TransferConfig{}.withStrategy(CopyStrategyKind::Sendfile));
  EXPECT_EQ(receiver.strategy().name(), "auto");

  const std::string wire = Frame(5, "hello");
  MemoryReader conn(wire);
  MemoryWriter sink;
  EXPECT_EQ(receiver.receive(conn, sink), 5U);
  EXPECT_EQ(sink.view(), "hello");
}

}  // namespace filewire
