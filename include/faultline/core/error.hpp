#pragma once

#include <system_error>

namespace faultline::core {

/**
 * @brief 本库底层通用错误码（时间戳/标识符解析、配置读取等）。
 *
 * 约定：
 * - 底层工具函数优先返回 std::error_code，避免异常路径；
 * - 面向调用方的错误值请使用 faultline::Error / faultline::Result。
 */
enum class errc : int {
  ok = 0,
  invalid_argument = 1,
  invalid_timestamp = 2,
  invalid_identifier = 3,
  out_of_range = 4,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace faultline::core

namespace std {
template <>
struct is_error_code_enum<faultline::core::errc> : true_type {};
}  // namespace std
