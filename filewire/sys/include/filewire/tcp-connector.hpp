#pragma once

#include <cstdint>
#include <string_view>

#include "filewire/connection.hpp"

namespace filewire {

struct ConnectResult {
  Connection cnx;
  int err{0};  // errno of the last failed attempt, 0 if the host could not be resolved
  bool failure{false};
};

// Resolve host:port and connect, in blocking mode, to the first address that accepts.
// The returned Connection is blocking and close-on-exec.
// The default family value is 0 (unspecified, lets getaddrinfo return IPv4 and IPv6 entries).
ConnectResult ConnectTCP(std::string_view host, uint16_t port, int family = 0);

}  // namespace filewire
