#include "filewire/stream.hpp"

#include <string_view>
#include <utility>

namespace filewire {

std::string_view IoStatusToString(IoStatus status) noexcept {
  switch (status) {
    case IoStatus::Ok:
      return "ok";
    case IoStatus::Eof:
      return "eof";
    case IoStatus::Timeout:
      return "timeout";
    case IoStatus::Error:
      return "error";
    default:
      std::unreachable();
  }
}

}  // namespace filewire
