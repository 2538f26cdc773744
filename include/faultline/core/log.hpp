#pragma once

#include <cstdint>
#include <string_view>

namespace faultline::core {

/**
 * @brief 日志级别（用于库内 spdlog 日志的统一控制）。
 *
 * 说明：
 * - 本库内部日志使用 spdlog，但不把 spdlog 类型暴露到 public headers；
 * - 业务侧可通过 set_log_level 调整全局日志级别。
 */
enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    critical = 5,
    off = 6,
};

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

/**
 * @brief 判断 level 级别的日志当前是否会被输出（off 永远返回 false）。
 */
[[nodiscard]] bool should_log(LogLevel level) noexcept;

/**
 * @brief 通过 spdlog 默认 logger 输出一行日志。
 */
void write_log(LogLevel level, std::string_view message) noexcept;

[[nodiscard]] std::string_view to_string(LogLevel level) noexcept;

} // namespace faultline::core
