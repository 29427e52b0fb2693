#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

// Version string; typically injected by CMake via -DCLAWGUARD_VERSION_STRING=...
#ifndef CLAWGUARD_VERSION_STRING
#define CLAWGUARD_VERSION_STRING "0.1.0-dev"
#endif

namespace clawguard::net {

using std::chrono::milliseconds;

inline constexpr milliseconds kDefaultTimeout{10000};
inline constexpr milliseconds kMinTimeout{1000};
inline constexpr milliseconds kMaxTimeout{60000};
inline constexpr milliseconds kDnsLookupTimeout{5000};
inline constexpr milliseconds kHealthCheckTimeout{5000};

/// Backstop added on top of the transport timeout so the transport's own
/// timeout fires first under normal conditions.
inline constexpr milliseconds kTimeoutGrace{500};

inline constexpr size_t kMaxResponseSize = 10 * 1024 * 1024;
inline constexpr int kMaxRedirects = 5;
inline constexpr size_t kMaxHeaderValueLogLength = 8192;

inline constexpr std::string_view kUserAgent = "ClawGuard/" CLAWGUARD_VERSION_STRING;

} // namespace clawguard::net
