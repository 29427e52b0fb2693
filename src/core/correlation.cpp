#include "clawguard/core/correlation.hpp"

#include "clawguard/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>

namespace clawguard::correlation {

namespace {

std::mutex g_mutex;
std::optional<std::string> g_current;

} // anonymous namespace

auto generate_id() -> std::string {
    auto uuid = utils::generate_uuid();
    std::erase(uuid, '-');
    return "cg_" + uuid;
}

auto is_valid_id(std::string_view id) -> bool {
    if (id.size() < kMinIdLength || id.size() > kMaxIdLength) return false;
    return std::ranges::all_of(id, [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
}

auto sanitize_id(std::string_view id) -> std::string {
    if (is_valid_id(id)) return std::string(id);
    return generate_id();
}

auto current_id() -> std::optional<std::string> {
    std::lock_guard lock(g_mutex);
    return g_current;
}

auto set_current_id(std::string_view id) -> std::string {
    auto valid = sanitize_id(id);
    std::lock_guard lock(g_mutex);
    g_current = valid;
    return valid;
}

void clear_current_id() {
    std::lock_guard lock(g_mutex);
    g_current.reset();
}

auto init_from_env() -> std::string {
    if (auto* val = std::getenv(std::string(kEnvVar).c_str())) {
        return set_current_id(val);
    }
    return set_current_id(generate_id());
}

ScopedCorrelationId::ScopedCorrelationId(std::string_view id)
    : previous_(current_id()) {
    id_ = set_current_id(id);
}

ScopedCorrelationId::~ScopedCorrelationId() {
    std::lock_guard lock(g_mutex);
    g_current = previous_;
}

} // namespace clawguard::correlation
