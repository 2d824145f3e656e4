#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace filewire {

// Every transfer starts with the payload length as an unsigned 64-bit little-endian integer,
// followed by exactly that many payload bytes.
inline constexpr std::size_t kFrameHeaderSize = 8;

using FrameHeaderBytes = std::array<std::byte, kFrameHeaderSize>;

// Encode 'length' in little-endian order, whatever the host byte order.
constexpr FrameHeaderBytes EncodeLength(std::uint64_t length) noexcept {
  FrameHeaderBytes bytes;
  for (std::size_t pos = 0; pos < kFrameHeaderSize; ++pos) {
    bytes[pos] = static_cast<std::byte>((length >> (8U * pos)) & 0xFFU);
  }
  return bytes;
}

constexpr std::uint64_t DecodeLength(std::span<const std::byte, kFrameHeaderSize> bytes) noexcept {
  std::uint64_t length = 0;
  for (std::size_t pos = 0; pos < kFrameHeaderSize; ++pos) {
    length |= static_cast<std::uint64_t>(bytes[pos]) << (8U * pos);
  }
  return length;
}

}  // namespace filewire
