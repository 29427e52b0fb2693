#include "clawguard/net/response_governor.hpp"

#include "clawguard/core/utils.hpp"
#include "clawguard/net/header_sanitizer.hpp"

#include <charconv>
#include <cstdint>

namespace clawguard::net {

auto declared_content_length(const TransportResponse& response) -> std::optional<size_t> {
    auto value = find_header(response.headers, "Content-Length");
    if (!value) return std::nullopt;

    auto text = utils::trim(*value);
    size_t length = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), length);
    if (ec == std::errc::result_out_of_range) {
        return SIZE_MAX;
    }
    if (ec != std::errc{} || ptr == text.data()) {
        return std::nullopt;
    }
    return length;
}

auto validate_response_size(const TransportResponse& response, size_t max_bytes) -> bool {
    if (auto declared = declared_content_length(response); declared && *declared > max_bytes) {
        return false;
    }
    return response.body.size() <= max_bytes;
}

} // namespace clawguard::net
