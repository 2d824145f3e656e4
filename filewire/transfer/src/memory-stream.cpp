#include "filewire/memory-stream.hpp"

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <span>

namespace filewire {

IoResult MemoryReader::read(std::span<std::byte> dst) {
  if (dst.empty()) {
    return {};
  }
  std::size_t nbBytes = std::min(dst.size(), remaining());
  if (_maxChunk != 0) {
    nbBytes = std::min(nbBytes, _maxChunk);
  }
  if (nbBytes == 0) {
    return IoResult{0, IoStatus::Eof, 0};
  }
  std::copy_n(_data.begin() + static_cast<std::ptrdiff_t>(_pos), nbBytes, dst.begin());
  _pos += nbBytes;
  return IoResult{nbBytes, IoStatus::Ok, 0};
}

IoResult MemoryWriter::write(std::span<const std::byte> src) {
  const std::size_t room = _capacity - _buf.size();
  const std::size_t nbBytes = std::min(src.size(), room);
  _buf.insert(_buf.end(), src.begin(), src.begin() + static_cast<std::ptrdiff_t>(nbBytes));
  if (nbBytes < src.size()) {
    return IoResult{nbBytes, IoStatus::Error, ENOSPC};
  }
  return IoResult{nbBytes, IoStatus::Ok, 0};
}

}  // namespace filewire
