#include "filewire/socket.hpp"

#include <fcntl.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <system_error>

namespace filewire {

TEST(Socket, Nominal) {
  Socket sock(Socket::Type::Stream);
  EXPECT_TRUE(sock);
  EXPECT_GE(sock.fd(), 0);
  sock.close();
  EXPECT_FALSE(sock);
}

TEST(Socket, DescriptorFlagsFollowType) {
  Socket blocking(Socket::Type::Stream);
  EXPECT_NE(::fcntl(blocking.fd(), F_GETFD) & FD_CLOEXEC, 0);
  EXPECT_EQ(::fcntl(blocking.fd(), F_GETFL) & O_NONBLOCK, 0);

  Socket nonBlocking(Socket::Type::StreamNonBlock);
  EXPECT_NE(::fcntl(nonBlocking.fd(), F_GETFD) & FD_CLOEXEC, 0);
  EXPECT_NE(::fcntl(nonBlocking.fd(), F_GETFL) & O_NONBLOCK, 0);
}

TEST(Socket, InvalidType) {
  Socket::Type invalidType;
  std::memset(&invalidType, 255, sizeof(Socket::Type));
  EXPECT_THROW(Socket{invalidType}, std::invalid_argument);
}

TEST(Socket, BindAndListenAssignsEphemeralPort) {
  Socket sock(Socket::Type::StreamNonBlock);
  uint16_t port = 0;
  EXPECT_EQ(sock.boundPort(), 0);
  EXPECT_NO_THROW(sock.bindAndListen(false, true, port));
  EXPECT_NE(0, port);
  EXPECT_EQ(sock.boundPort(), port);
  sock.close();
  EXPECT_EQ(sock.boundPort(), 0);
}

TEST(Socket, TryBindReturnsFalseWhenPortIsTaken) {
  Socket first(Socket::Type::Stream);
  uint16_t port = 0;
  first.bindAndListen(false, false, port);
  Socket second(Socket::Type::Stream);
  EXPECT_FALSE(second.tryBind(false, false, port));
}

TEST(Socket, BindAndListenThrowsWhenPortInUse) {
  Socket first(Socket::Type::Stream);
  uint16_t port = 0;
  first.bindAndListen(false, false, port);
  Socket second(Socket::Type::Stream);
  EXPECT_THROW(second.bindAndListen(false, false, port), std::system_error);
}

TEST(Socket, ReusePortAllowsSharedBinding) {
  Socket first(Socket::Type::Stream);
  uint16_t port = 0;
  first.bindAndListen(true, false, port);
  Socket second(Socket::Type::Stream);
  uint16_t samePort = port;
  EXPECT_NO_THROW(second.bindAndListen(true, false, samePort));
  EXPECT_EQ(samePort, port);
}

}  // namespace filewire
