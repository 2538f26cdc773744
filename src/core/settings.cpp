#include "faultline/core/settings.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>

namespace faultline::core {
namespace {

constexpr const char *kEnvMaxRetries = "FAULTLINE_MAX_RETRIES";
constexpr const char *kEnvLogErrors = "FAULTLINE_LOG_ERRORS";
constexpr const char *kEnvLogLevel = "FAULTLINE_LOG_LEVEL";

[[nodiscard]] bool iequals(std::string_view lhs, std::string_view rhs) noexcept {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        const auto a = std::tolower(static_cast<unsigned char>(lhs[i]));
        const auto b = std::tolower(static_cast<unsigned char>(rhs[i]));
        if (a != b) {
            return false;
        }
    }
    return true;
}

[[nodiscard]] std::optional<std::size_t> parse_count(std::string_view text) noexcept {
    std::size_t value = 0;
    const auto *first = text.data();
    const auto *last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || text.empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::optional<LogLevel> parse_log_level(std::string_view text) noexcept {
    if (iequals(text, "trace")) {
        return LogLevel::trace;
    }
    if (iequals(text, "debug")) {
        return LogLevel::debug;
    }
    if (iequals(text, "info")) {
        return LogLevel::info;
    }
    if (iequals(text, "warn") || iequals(text, "warning")) {
        return LogLevel::warn;
    }
    if (iequals(text, "error")) {
        return LogLevel::error;
    }
    if (iequals(text, "critical")) {
        return LogLevel::critical;
    }
    if (iequals(text, "off")) {
        return LogLevel::off;
    }
    return std::nullopt;
}

std::optional<std::string> read_env(const char *name) {
    if (name == nullptr || *name == '\0') {
        return std::nullopt;
    }
    // POSIX getenv 返回的指针只读；这里立即拷贝，避免后续 setenv 使其失效。
    const char *v = std::getenv(name);
    if (v == nullptr) {
        return std::nullopt;
    }
    return std::string(v);
}

Settings Settings::from_environment() {
    Settings out{};

    if (const auto v = read_env(kEnvMaxRetries)) {
        if (const auto n = parse_count(*v)) {
            out.max_retries = *n;
        }
    }
    if (const auto v = read_env(kEnvLogErrors)) {
        out.log_errors = !iequals(*v, "false");
    }
    if (const auto v = read_env(kEnvLogLevel)) {
        if (const auto level = parse_log_level(*v)) {
            out.log_level = *level;
        }
    }
    return out;
}

const Settings &settings() {
    static const Settings instance = Settings::from_environment();
    return instance;
}

} // namespace faultline::core
