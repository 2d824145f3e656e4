#include "filewire/transfer-config.hpp"

#include <chrono>
#include <limits>
#include <string_view>
#include <utility>

#include "filewire/invalid_argument_exception.hpp"

namespace filewire {

namespace {
constexpr std::pair<std::string_view, CopyStrategyKind> kKindNames[] = {
    {"auto", CopyStrategyKind::Auto},
    {"buffered", CopyStrategyKind::Buffered},
    {"small", CopyStrategyKind::SmallChunk},
    {"sendfile", CopyStrategyKind::Sendfile},
};
}  // namespace

CopyStrategyKind CopyStrategyKindFromString(std::string_view name) {
  for (const auto& [kindName, kind] : kKindNames) {
    if (kindName == name) {
      return kind;
    }
  }
  throw invalid_argument("Unknown copy strategy '{}', expected auto, buffered, small or sendfile", name);
}

std::string_view CopyStrategyKindToString(CopyStrategyKind kind) noexcept {
  for (const auto& [kindName, knownKind] : kKindNames) {
    if (knownKind == kind) {
      return kindName;
    }
  }
  return "unknown";
}

void TransferConfig::validate() const {
  if (bufferSize == 0) {
    throw invalid_argument("bufferSize must be > 0");
  }
  if (bufferSize > kMaxBufferSize) {
    throw invalid_argument("bufferSize {} exceeds the maximum of {}", bufferSize, kMaxBufferSize);
  }
  if (ioTimeout.count() < 0) {
    throw invalid_argument("ioTimeout cannot be negative");
  }
  // timeval conversion of the socket deadline
  if (std::chrono::duration_cast<std::chrono::seconds>(ioTimeout).count() > std::numeric_limits<int>::max()) {
    throw invalid_argument("ioTimeout is too large");
  }
  switch (strategy) {
    case CopyStrategyKind::Auto:
    case CopyStrategyKind::Buffered:
    case CopyStrategyKind::SmallChunk:
    case CopyStrategyKind::Sendfile:
      break;
    default:
      throw invalid_argument("Invalid copy strategy");
  }
}

}  // namespace filewire
