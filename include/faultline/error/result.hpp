#pragma once

#include "faultline/error/error.hpp"

#include <boost/outcome/bad_access.hpp>
#include <boost/outcome/basic_result.hpp>
#include <boost/outcome/policy/base.hpp>
#include <boost/outcome/success_failure.hpp>
#include <boost/outcome/try.hpp>

#include <exception>
#include <string>
#include <string_view>
#include <system_error>

namespace faultline {

namespace outcome = BOOST_OUTCOME_V2_NAMESPACE;

/**
 * @brief 对 Result 做“宽检查”取值失败时抛出的异常（携带原始 Error）。
 *
 * 仅在调用方误用（对失败结果调用 value()）时出现；正常的错误传递不走异常。
 */
class error_exception final : public std::exception {
 public:
  explicit error_exception(Error err);

  [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }
  [[nodiscard]] const Error& error() const noexcept { return err_; }

 private:
  Error err_;
  std::string what_;
};

namespace detail {

class result_no_value_policy : public outcome::policy::base {
 public:
  //! Performs a narrow check of state, used in the assume_value() functions.
  using base::narrow_value_check;

  //! Performs a narrow check of state, used in the assume_error() functions.
  using base::narrow_error_check;

  //! Performs a wide check of state, used in the value() functions.
  template <class Impl>
  static constexpr void wide_value_check(Impl&& self) {
    if (!base::_has_value(self)) {
      if (base::_has_error(self)) {
        throw error_exception(Error(base::_error(static_cast<Impl&&>(self))));
      }
      throw outcome::bad_result_access("no value");
    }
  }

  //! Performs a wide check of state, used in the error() functions.
  template <class Impl>
  static constexpr void wide_error_check(Impl&& self) {
    if (!base::_has_error(self)) {
      throw outcome::bad_result_access("no error");
    }
  }
};

}  // namespace detail

using outcome::failure;
using outcome::success;

/**
 * @brief 失败分支固定为 faultline::Error 的二选一结果。
 */
template <class T>
using Result = outcome::basic_result<T, Error, detail::result_no_value_policy>;

/**
 * @brief 把外部失败（I/O、解码等 std::error_code）包装成 Error。
 *
 * 生成的 Error：
 * - 消息为 "<operation>: <ec.message()>"；
 * - 上下文的前因记录原始错误（error_category/error_code/message 三项元数据），
 *   外层上下文记录 operation；
 * - kind 为 Kind::custom 时按 Kind::internal 处理（包装不携带自定义分类）。
 */
[[nodiscard]] Error wrap(std::error_code ec, std::string_view operation, Kind kind = Kind::internal);

/**
 * @brief 把外部异常（如解析异常）包装成 Error，前因记录 what()。
 */
[[nodiscard]] Error wrap(const std::exception& ex,
                         std::string_view operation,
                         Kind kind = Kind::internal);

}  // namespace faultline

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define FAULTLINE_TRY(...) BOOST_OUTCOME_TRY(__VA_ARGS__)

// NOLINTEND(cppcoreguidelines-macro-usage)
