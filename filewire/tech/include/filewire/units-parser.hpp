#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace filewire {

// Parse a human-readable byte count such as "1024", "64Ki", "1M", "2Gi512Mi".
// Units K/k, M, G, T are powers of 1000; with the 'i' suffix (Ki, Mi, Gi, Ti) powers of 1024.
// Throws filewire::invalid_argument on malformed input and std::overflow_error if the total does not fit.
std::uint64_t ParseNumberOfBytes(std::string_view sizeStr);

// Format a byte count with binary units, keeping at most nbSignificantUnits units.
// Example: BytesToStr(1049600) == "1Mi1Ki", BytesToStr(1049600, 1) == "1Mi".
std::string BytesToStr(std::uint64_t numberOfBytes, int nbSignificantUnits = 10);

}  // namespace filewire
