#include "filewire/transfer-error.hpp"

#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "filewire/platform.hpp"

namespace filewire {

namespace {

class TransferErrorCategory final : public std::error_category {
 public:
  [[nodiscard]] const char* name() const noexcept override { return "filewire.transfer"; }

  [[nodiscard]] std::string message(int value) const override {
    return std::string(TransferErrcToString(static_cast<TransferErrc>(value)));
  }
};

std::string BuildMessage(std::string_view context, int osErrno) {
  std::string msg(context);
  if (osErrno != 0) {
    msg.append(" (");
    msg.append(SystemErrorMessage(osErrno));
    msg.push_back(')');
  }
  return msg;
}

}  // namespace

const std::error_category& TransferCategory() noexcept {
  static const TransferErrorCategory kCategory;
  return kCategory;
}

std::error_code make_error_code(TransferErrc errc) noexcept {
  return {static_cast<int>(errc), TransferCategory()};
}

std::string_view TransferErrcToString(TransferErrc errc) noexcept {
  switch (errc) {
    case TransferErrc::SourceMetadata:
      return "source metadata unavailable";
    case TransferErrc::HeaderWrite:
      return "header write failed";
    case TransferErrc::HeaderTruncated:
      return "header truncated";
    case TransferErrc::PayloadTruncated:
      return "payload truncated";
    case TransferErrc::DescriptorUnavailable:
      return "descriptor unavailable";
    case TransferErrc::Timeout:
      return "timeout";
    case TransferErrc::IO:
      return "I/O error";
    default:
      return "unknown transfer error";
  }
}

TransferError::TransferError(TransferErrc errc, int osErrno, std::string_view context)
    : std::system_error(make_error_code(errc), BuildMessage(context, osErrno)), _osErrno(osErrno) {}

}  // namespace filewire
