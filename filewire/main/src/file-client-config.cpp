#include "filewire/file-client-config.hpp"

#include <sys/socket.h>

#include "filewire/invalid_argument_exception.hpp"

namespace filewire {

void FileClientConfig::validate() const {
  if (host.empty()) {
    throw invalid_argument("host must not be empty");
  }
  if (port == 0) {
    throw invalid_argument("port must be > 0");
  }
  if (family != 0 && family != AF_INET && family != AF_INET6) {
    throw invalid_argument("Unsupported address family {}", family);
  }
  if (outputPath.empty()) {
    throw invalid_argument("outputPath must not be empty");
  }
  transfer.validate();
}

}  // namespace filewire
