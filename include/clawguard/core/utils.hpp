#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace clawguard::utils {

auto generate_uuid() -> std::string;
auto timestamp_iso() -> std::string;
auto trim(std::string_view s) -> std::string;
auto split(std::string_view s, char delim) -> std::vector<std::string>;
auto to_lower(std::string_view s) -> std::string;
auto to_upper(std::string_view s) -> std::string;
auto iequals(std::string_view a, std::string_view b) -> bool;
auto starts_with_icase(std::string_view s, std::string_view prefix) -> bool;
auto url_decode(std::string_view s) -> std::string;

} // namespace clawguard::utils
