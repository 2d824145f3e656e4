#include "filewire/file-server-config.hpp"

#include <gtest/gtest.h>

#include <chrono>

#include "filewire/invalid_argument_exception.hpp"
#include "filewire/transfer-config.hpp"

namespace filewire {

TEST(FileServerConfig, Defaults) {
  FileServerConfig config;
  EXPECT_EQ(config.port, 0);
  EXPECT_FALSE(config.reusePort);
  EXPECT_EQ(config.maxConcurrentTransfers, 0U);
  EXPECT_EQ(config.pollInterval, std::chrono::milliseconds{500});
  // a file is required
  EXPECT_THROW(config.validate(), invalid_argument);
  EXPECT_NO_THROW(config.withFilePath("data.bin").validate());
}

TEST(FileServerConfig, FluentSetters) {
  const auto config = FileServerConfig{}
                          .withPort(3000)
                          .withReusePort()
                          .withTcpNoDelay()
                          .withListenBacklog(16)
                          .withFilePath("/srv/file")
                          .withPollInterval(std::chrono::milliseconds{20})
                          .withMaxConcurrentTransfers(4)
                          .withTransferConfig(TransferConfig{}.withStrategy(CopyStrategyKind::Sendfile));
  EXPECT_EQ(config.port, 3000);
  EXPECT_TRUE(config.reusePort);
  EXPECT_TRUE(config.tcpNoDelay);
  EXPECT_EQ(config.listenBacklog, 16);
  EXPECT_EQ(config.filePath, "/srv/file");
  EXPECT_EQ(config.pollInterval, std::chrono::milliseconds{20});
  EXPECT_EQ(config.maxConcurrentTransfers, 4U);
  EXPECT_EQ(config.transfer.strategy, CopyStrategyKind::Sendfile);
  EXPECT_NO_THROW(config.validate());
}

TEST(FileServerConfig, InvalidValues) {
  const auto base = FileServerConfig{}.withFilePath("f");
  EXPECT_THROW(FileServerConfig(base).withPollInterval(std::chrono::milliseconds{0}).validate(), invalid_argument);
  EXPECT_THROW(FileServerConfig(base).withPollInterval(std::chrono::hours{24 * 30}).validate(), invalid_argument);
  EXPECT_THROW(FileServerConfig(base).withListenBacklog(0).validate(), invalid_argument);
  EXPECT_THROW(FileServerConfig(base).withTransferConfig(TransferConfig{}.withBufferSize(0)).validate(),
               invalid_argument);
}

}  // namespace filewire
