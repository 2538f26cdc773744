#pragma once

#include "faultline/core/log.hpp"
#include "faultline/error/error.hpp"

#include <string>

namespace faultline {

/**
 * @brief 生成错误日志行：to_string() 后接单行记录 dump。
 */
[[nodiscard]] std::string format_log_line(const Error& error);

/**
 * @brief 通过 spdlog 输出一条错误日志。
 *
 * 以下情况不输出并返回 false：
 * - core::settings().log_errors 为 false；
 * - level 低于 core::settings().log_level（FAULTLINE_LOG_LEVEL）；
 * - level 低于当前 spdlog 级别（或为 off）。
 */
bool log_error(const Error& error, core::LogLevel level = core::LogLevel::error);

}  // namespace faultline
