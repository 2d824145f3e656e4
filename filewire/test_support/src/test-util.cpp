#include "filewire/test-util.hpp"

#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <random>
#include <span>
#include <string>
#include <system_error>
#include <utility>

#include "filewire/connection.hpp"
#include "filewire/file-source.hpp"
#include "filewire/socket.hpp"
#include "filewire/tcp-connector.hpp"

namespace filewire::test {

ConnectionPair MakeLoopbackPair() {
  Socket listener(Socket::Type::Stream);
  uint16_t port = 0;
  listener.bindAndListen(false, true, port, 4);

  ConnectionPair pair;
  // connect() completes against the backlog, so the accept can happen afterwards on the same thread
  ConnectResult res = ConnectTCP("127.0.0.1", port);
  if (res.failure) {
    throw std::system_error(res.err, std::generic_category(), "MakeLoopbackPair: connect failed");
  }
  pair.client = std::move(res.cnx);
  pair.server = Connection(listener);
  if (!pair.server) {
    throw std::system_error(errno, std::generic_category(), "MakeLoopbackPair: accept failed");
  }
  return pair;
}

std::string RandomPayload(std::size_t size, std::uint64_t seed) {
  std::mt19937_64 engine(seed);
  std::string payload(size, '\0');
  std::size_t pos = 0;
  while (pos < size) {
    const uint64_t word = engine();
    for (int byteIdx = 0; byteIdx < 8 && pos < size; ++byteIdx, ++pos) {
      payload[pos] = static_cast<char>((word >> (8 * byteIdx)) & 0xFF);
    }
  }
  return payload;
}

std::string ReadFileContent(const std::filesystem::path& path) {
  FileSource source(path.string());
  return ReadAll(source);
}

std::string ReadAll(Reader& reader) {
  std::string out;
  std::array<std::byte, 16384> buf;
  for (;;) {
    const IoResult res = reader.read(buf);
    if (res.status != IoStatus::Ok) {
      break;
    }
    out.append(reinterpret_cast<const char*>(buf.data()), res.bytes);
  }
  return out;
}

}  // namespace filewire::test
