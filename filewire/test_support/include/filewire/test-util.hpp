#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

#include "filewire/connection.hpp"

namespace filewire::test {

// Two ends of an established loopback TCP connection (both blocking).
struct ConnectionPair {
  Connection client;
  Connection server;
};

// Open a listening socket on an ephemeral loopback port, connect to it and accept.
// Throws std::system_error on failure.
ConnectionPair MakeLoopbackPair();

// Deterministic pseudo-random payload of 'size' bytes.
std::string RandomPayload(std::size_t size, std::uint64_t seed = 42);

// Whole content of the file at 'path'. Throws std::system_error if it cannot be read.
std::string ReadFileContent(const std::filesystem::path& path);

// Read from 'reader' until end of stream (or error / timeout) and return everything received.
std::string ReadAll(Reader& reader);

inline std::span<const std::byte> AsBytes(std::string_view str) noexcept {
  return std::as_bytes(std::span<const char>(str.data(), str.size()));
}

}  // namespace filewire::test
