#include "filewire/units-parser.hpp"

#include <charconv>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "filewire/invalid_argument_exception.hpp"

namespace filewire {

namespace {

constexpr std::pair<std::uint64_t, std::string_view> kBytesUnits[] = {{std::uint64_t{1} << 40, "Ti"},
                                                                      {std::uint64_t{1} << 30, "Gi"},
                                                                      {std::uint64_t{1} << 20, "Mi"},
                                                                      {std::uint64_t{1} << 10, "Ki"},
                                                                      {std::uint64_t{1}, ""}};

std::uint64_t CheckedMul(std::uint64_t lhs, std::uint64_t rhs) {
  if (rhs != 0 && lhs > std::numeric_limits<std::uint64_t>::max() / rhs) {
    throw std::overflow_error("Number of bytes does not fit in 64 bits");
  }
  return lhs * rhs;
}

}  // namespace

std::uint64_t ParseNumberOfBytes(std::string_view sizeStr) {
  if (sizeStr.empty()) {
    throw invalid_argument("Empty number of bytes");
  }
  std::uint64_t totalNbBytes = 0;
  while (!sizeStr.empty()) {
    if (sizeStr.front() == '-') {
      throw invalid_argument("Number of bytes cannot be negative");
    }
    std::uint64_t nbBytes = 0;
    const auto [ptr, errc] = std::from_chars(sizeStr.data(), sizeStr.data() + sizeStr.size(), nbBytes);
    if (errc == std::errc::result_out_of_range) {
      throw std::overflow_error("Number of bytes does not fit in 64 bits");
    }
    if (errc != std::errc{}) {
      throw invalid_argument("Expected digits for number of bytes parsing");
    }
    sizeStr.remove_prefix(static_cast<std::string_view::size_type>(ptr - sizeStr.data()));

    std::uint64_t multiplier = 1;
    if (!sizeStr.empty()) {
      const bool iMultiplier = 1UL < sizeStr.size() && sizeStr[1UL] == 'i';
      const std::uint64_t multiplierBase = iMultiplier ? 1024U : 1000U;
      switch (sizeStr.front()) {
        case '.':
          throw invalid_argument("Decimal number not accepted for number of bytes parsing");
        case 'T':  // NOLINT(bugprone-branch-clone)
          multiplier *= multiplierBase;
          [[fallthrough]];
        case 'G':
          multiplier *= multiplierBase;
          [[fallthrough]];
        case 'M':
          multiplier *= multiplierBase;
          [[fallthrough]];
        case 'K':
          [[fallthrough]];
        case 'k':
          multiplier *= multiplierBase;
          break;
        default:
          throw invalid_argument("Invalid suffix for number of bytes parsing");
      }
      sizeStr.remove_prefix(1UL + static_cast<std::string_view::size_type>(iMultiplier));
    }
    const std::uint64_t chunk = CheckedMul(nbBytes, multiplier);
    if (chunk > std::numeric_limits<std::uint64_t>::max() - totalNbBytes) {
      throw std::overflow_error("Number of bytes does not fit in 64 bits");
    }
    totalNbBytes += chunk;
  }

  return totalNbBytes;
}

std::string BytesToStr(std::uint64_t numberOfBytes, int nbSignificantUnits) {
  if (numberOfBytes == 0) {
    return "0";
  }
  std::string ret;
  for (std::size_t unitPos = 0; numberOfBytes > 0 && nbSignificantUnits > 0; ++unitPos) {
    const std::uint64_t nbUnits = numberOfBytes / kBytesUnits[unitPos].first;
    if (nbUnits != 0) {
      numberOfBytes %= kBytesUnits[unitPos].first;
      ret.append(std::to_string(nbUnits));
      ret.append(kBytesUnits[unitPos].second);
      --nbSignificantUnits;
    }
  }
  return ret;
}

}  // namespace filewire
