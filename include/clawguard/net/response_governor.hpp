#pragma once

#include <cstddef>
#include <optional>

#include "clawguard/net/constants.hpp"
#include "clawguard/net/transport.hpp"

namespace clawguard::net {

/// Declared Content-Length, if present and numeric.
auto declared_content_length(const TransportResponse& response) -> std::optional<size_t>;

/// Rejects a response whose declared Content-Length or buffered body exceeds
/// `max_bytes`. Both checks run after buffering; this bounds what reaches
/// the caller, not what crosses the wire.
[[nodiscard]] auto validate_response_size(const TransportResponse& response,
                                          size_t max_bytes = kMaxResponseSize) -> bool;

} // namespace clawguard::net
