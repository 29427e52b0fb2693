#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace clawguard::correlation {

inline constexpr size_t kMinIdLength = 8;
inline constexpr size_t kMaxIdLength = 64;
inline constexpr std::string_view kHeaderName = "X-Correlation-ID";
inline constexpr std::string_view kEnvVar = "CLAWGUARD_CORRELATION_ID";

/// Creates a fresh ID of the form "cg_<uuid-without-dashes>".
auto generate_id() -> std::string;

/// True when `id` is 8..64 characters of [A-Za-z0-9_-].
[[nodiscard]] auto is_valid_id(std::string_view id) -> bool;

/// Returns `id` when valid, otherwise a newly generated ID.
auto sanitize_id(std::string_view id) -> std::string;

/// Process-wide ambient correlation ID, if one has been set.
auto current_id() -> std::optional<std::string>;

/// Sets the ambient ID (sanitized) and returns the value stored.
auto set_current_id(std::string_view id) -> std::string;

void clear_current_id();

/// Adopts CLAWGUARD_CORRELATION_ID when present and valid, otherwise a new ID.
auto init_from_env() -> std::string;

/// Installs an ambient correlation ID for the lifetime of the scope and
/// restores the previous one on exit.
class ScopedCorrelationId {
public:
    explicit ScopedCorrelationId(std::string_view id);
    ~ScopedCorrelationId();

    ScopedCorrelationId(const ScopedCorrelationId&) = delete;
    ScopedCorrelationId& operator=(const ScopedCorrelationId&) = delete;

    [[nodiscard]] auto id() const noexcept -> const std::string& { return id_; }

private:
    std::string id_;
    std::optional<std::string> previous_;
};

} // namespace clawguard::correlation
