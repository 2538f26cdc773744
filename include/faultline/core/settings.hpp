#pragma once

#include "faultline/core/log.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace faultline::core {

/**
 * @brief 运行期配置（重试上限、错误日志开关与级别）。
 *
 * 环境变量（均可缺省，非法取值时保留默认值）：
 * - FAULTLINE_MAX_RETRIES：非负整数
 * - FAULTLINE_LOG_ERRORS：取值为 "false"（不区分大小写）时关闭错误日志
 * - FAULTLINE_LOG_LEVEL：trace/debug/info/warn(warning)/error/critical/off
 */
struct Settings final {
    std::size_t max_retries{3};
    bool log_errors{true};
    LogLevel log_level{LogLevel::info};

    [[nodiscard]] static Settings from_environment();

    friend bool operator==(const Settings &, const Settings &) = default;
};

/**
 * @brief 解析日志级别文本（不区分大小写）。
 */
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;

/**
 * @brief 读取环境变量；未设置时返回 std::nullopt，已设置但为空时返回空串。
 */
[[nodiscard]] std::optional<std::string> read_env(const char *name);

/**
 * @brief 进程级配置快照：首次调用时从环境变量加载，之后不再变化。
 */
[[nodiscard]] const Settings &settings();

} // namespace faultline::core
