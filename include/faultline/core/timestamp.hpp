#pragma once

#include "faultline/core/common.hpp"
#include "faultline/core/error.hpp"

#include <string>
#include <string_view>
#include <system_error>

namespace faultline::core {

/**
 * @brief 当前 UTC 墙钟时间（截断到微秒）。
 *
 * 说明：
 * - 只保证是墙钟时间，不保证进程内单调；
 * - 截断到微秒是为了让 format/parse 往返后逐位相等。
 */
[[nodiscard]] timestamp now() noexcept;

/**
 * @brief 格式化为 ISO-8601 文本：`YYYY-MM-DDTHH:MM:SS.ffffffZ`。
 */
[[nodiscard]] std::string format_timestamp(timestamp ts);

/**
 * @brief 解析 ISO-8601 文本（仅接受 UTC 'Z' 后缀，小数秒 0..6 位可选）。
 *
 * @return ok 成功；invalid_timestamp 表示格式或字段取值非法。
 */
std::error_code parse_timestamp(std::string_view text, timestamp &out) noexcept;

} // namespace faultline::core
