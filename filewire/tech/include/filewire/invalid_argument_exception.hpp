#pragma once

#include <fmt/format.h>

#include <utility>

#include "filewire/exception.hpp"

namespace filewire {

// Thrown on invalid user input: configuration values, command line options.
class invalid_argument : public exception {
 public:
  template <unsigned N>
  explicit invalid_argument(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
      : exception(str) {}

  template <typename... Args>
  explicit invalid_argument(fmt::format_string<Args...> fmtStr, Args&&... args)
      : exception(fmtStr, std::forward<Args>(args)...) {}
};

}  // namespace filewire
