#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace filewire {

// Reasons a transfer fails. All of them are fatal to the transfer, none is retried.
enum class TransferErrc : std::uint8_t {
  SourceMetadata = 1,     // source size could not be determined (stat failure, not a regular file)
  HeaderWrite,            // the 8 header bytes could not be fully written
  HeaderTruncated,        // end of stream before the 8 header bytes were received
  PayloadTruncated,       // end of stream (or end of source) before 'length' payload bytes
  DescriptorUnavailable,  // a kernel fast path was requested on streams not exposing the needed descriptors
  Timeout,                // I/O deadline expired
  IO                      // any other read / write / kernel copy failure
};

const std::error_category& TransferCategory() noexcept;

std::error_code make_error_code(TransferErrc errc) noexcept;

std::string_view TransferErrcToString(TransferErrc errc) noexcept;

class TransferError : public std::system_error {
 public:
  // 'osErrno' is the errno value at the origin of the failure, 0 if there is none.
  // When non zero, its description is appended to the message.
  TransferError(TransferErrc errc, int osErrno, std::string_view context);

  [[nodiscard]] TransferErrc errc() const noexcept { return static_cast<TransferErrc>(code().value()); }

  [[nodiscard]] int osErrno() const noexcept { return _osErrno; }

 private:
  int _osErrno;
};

template <typename... Args>
[[noreturn]] void ThrowTransferError(TransferErrc errc, int osErrno, fmt::format_string<Args...> fmtStr,
                                     Args&&... args) {
  throw TransferError(errc, osErrno, fmt::format(fmtStr, std::forward<Args>(args)...));
}

}  // namespace filewire

template <>
struct std::is_error_code_enum<filewire::TransferErrc> : std::true_type {};
