#pragma once

#include <map>
#include <string>

#include <nlohmann/json.hpp>

namespace clawguard {

using json = nlohmann::json;

/// Header map as sent and received; name lookups go through find_header().
using HeaderMap = std::map<std::string, std::string>;

} // namespace clawguard
