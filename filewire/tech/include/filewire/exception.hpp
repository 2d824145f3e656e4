#pragma once

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstring>
#include <exception>
#include <string_view>
#include <utility>

namespace filewire {

// Exception with an inline, fixed size message buffer: constructing it never allocates.
// Messages longer than kMsgMaxLen are truncated and end with "...".
class exception : public std::exception {
 public:
  static constexpr std::size_t kMsgMaxLen = 87;

  template <unsigned N>
  explicit exception(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
  {
    std::memcpy(_msg.data(), str, N);
  }

  template <typename... Args>
  explicit exception(fmt::format_string<Args...> fmtStr, Args&&... args) {
    const auto res = fmt::format_to_n(_msg.data(), kMsgMaxLen, fmtStr, std::forward<Args>(args)...);
    if (res.size > kMsgMaxLen) {
      static constexpr std::string_view kEllipsis = "...";
      std::ranges::copy(kEllipsis, _msg.data() + kMsgMaxLen - kEllipsis.size());
      _msg[kMsgMaxLen] = '\0';
    } else {
      *res.out = '\0';
    }
  }

  [[nodiscard]] const char* what() const noexcept override { return _msg.data(); }

 private:
  std::array<char, kMsgMaxLen + 1> _msg{};
};

}  // namespace filewire
