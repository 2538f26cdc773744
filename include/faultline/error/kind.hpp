#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace faultline {

/**
 * @brief 错误种类（封闭集合）。
 *
 * custom 是唯一的扩展点：需要新的重试语义时，通过 Error::custom 携带自定义
 * Classification，而不是给本枚举新增成员。
 */
enum class Kind : std::uint8_t {
  database = 0,
  network = 1,
  validation = 2,
  not_found = 3,
  internal = 4,
  custom = 5,
};

inline constexpr std::size_t kKindCount = 6;

/**
 * @brief 种类的稳定名称（序列化标签），如 "NotFound"。
 */
[[nodiscard]] std::string_view to_string(Kind kind) noexcept;

[[nodiscard]] std::optional<Kind> kind_from_string(std::string_view name) noexcept;

}  // namespace faultline
