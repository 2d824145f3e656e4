#include "filewire/tcp-connector.hpp"

#include <netdb.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>

#include "filewire/base-fd.hpp"
#include "filewire/log.hpp"
#include "filewire/socket-ops.hpp"

namespace filewire {

ConnectResult ConnectTCP(std::string_view host, uint16_t port, int family) {
  // getaddrinfo needs null-terminated strings
  const std::string hostStr(host);
  const std::string portStr = std::to_string(port);

  addrinfo hints{};
  hints.ai_family = family;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo* res = nullptr;
  const int gai = ::getaddrinfo(hostStr.c_str(), portStr.c_str(), &hints, &res);
  std::unique_ptr<addrinfo, void (*)(addrinfo*)> resRAII(res, &::freeaddrinfo);
  ConnectResult connectResult;

  if (gai != 0) [[unlikely]] {
    log::error("ConnectTCP: getaddrinfo('{}', '{}') failed: {}", hostStr, portStr, ::gai_strerror(gai));
    connectResult.failure = true;
    return connectResult;
  }

  for (addrinfo* rp = res; rp != nullptr; rp = rp->ai_next) {
#ifdef FILEWIRE_LINUX
    connectResult.cnx = Connection(BaseFd(::socket(rp->ai_family, rp->ai_socktype | SOCK_CLOEXEC, rp->ai_protocol)));
#else
    connectResult.cnx = Connection(BaseFd(::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol)));
    if (connectResult.cnx) {
      SetCloseOnExec(connectResult.cnx.fd());
    }
#endif
    if (!connectResult.cnx) [[unlikely]] {
      connectResult.err = errno;
      log::error("ConnectTCP: socket() failed for family {}: {}", rp->ai_family, std::strerror(connectResult.err));
      if (connectResult.err == EMFILE || connectResult.err == ENFILE) {
        break;
      }
      continue;
    }
    SetNoSigPipe(connectResult.cnx.fd());

    int rc;
    do {
      rc = ::connect(connectResult.cnx.fd(), rp->ai_addr, rp->ai_addrlen);
    } while (rc == -1 && errno == EINTR);

    if (rc == 0) {
      log::debug("ConnectTCP: connection fd # {} established to {}", connectResult.cnx.fd(),
                 PeerAddressString(connectResult.cnx.fd()));
      connectResult.err = 0;
      return connectResult;
    }

    connectResult.err = errno;
    log::debug("ConnectTCP: connect() to {}:{} failed for family {}: {}", hostStr, port, rp->ai_family,
               std::strerror(connectResult.err));
    connectResult.cnx.close();
  }

  log::error("ConnectTCP: unable to connect to {}:{}: {}", hostStr, port, std::strerror(connectResult.err));
  connectResult.cnx = Connection();
  connectResult.failure = true;
  return connectResult;
}

}  // namespace filewire
