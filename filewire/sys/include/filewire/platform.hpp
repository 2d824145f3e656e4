#pragma once

// Platform detection and portable type aliases for filewire's system layer.
//
// Detection macros:
//   FILEWIRE_LINUX  – defined on Linux (sendfile(2) and splice(2) fast paths available)
//   FILEWIRE_MACOS  – defined on macOS / Darwin
//   FILEWIRE_POSIX  – defined on any supported platform
//
// Portable types / functions:
//   NativeHandle       – the OS handle type for sockets / file descriptors
//   kInvalidHandle     – sentinel value representing an invalid handle
//   SystemErrorMessage – human-readable description for an error code

#ifdef __linux__
#define FILEWIRE_LINUX
#define FILEWIRE_POSIX
#elifdef __APPLE__
#define FILEWIRE_MACOS
#define FILEWIRE_POSIX
#else
#error "Unsupported platform – filewire currently supports Linux and macOS"
#endif

#include <cstring>  // std::strerror

namespace filewire {

using NativeHandle = int;
inline constexpr NativeHandle kInvalidHandle = -1;

inline const char* SystemErrorMessage(int err) noexcept { return std::strerror(err); }

}  // namespace filewire
