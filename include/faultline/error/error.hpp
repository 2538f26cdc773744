#pragma once

#include "faultline/category/classification.hpp"
#include "faultline/core/common.hpp"
#include "faultline/error/context.hpp"
#include "faultline/error/kind.hpp"

#include <concepts>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace faultline {

/**
 * @brief 聚合错误值：种类 + 消息 + 可选上下文（+ Custom 独占的分类）。
 *
 * 不变量：
 * - 只有 Kind::custom 可能持有分类实例；其它种类的分类一律按 kind 查内置表；
 * - 构造后 kind/message 不再变化；附加上下文会产生新的 Error 值；
 * - 拷贝时自定义分类经 duplicate() 深拷贝，两个副本之间不共享可变状态，
 *   可以在不同线程中无锁并发查询。
 */
class Error final {
 public:
  using Classification = category::Classification;

  [[nodiscard]] static Error database(std::string_view operation, std::string_view message);
  [[nodiscard]] static Error network(std::string_view message);
  [[nodiscard]] static Error validation(std::string_view field, std::string_view message);
  [[nodiscard]] static Error not_found(std::string_view resource, std::string_view identifier);
  [[nodiscard]] static Error internal(std::string_view message);

  /**
   * @brief 携带调用方自定义分类的错误（唯一的扩展点）。
   *
   * classification 为空时退化为 category::default_classification()。
   */
  [[nodiscard]] static Error custom(std::string message,
                                    std::unique_ptr<Classification> classification);

  template <class C>
    requires std::derived_from<std::remove_cvref_t<C>, Classification>
  [[nodiscard]] static Error custom(std::string message, C&& classification) {
    return custom(std::move(message),
                  std::make_unique<std::remove_cvref_t<C>>(std::forward<C>(classification)));
  }

  // 常用场景的便捷构造（语义上仍归入上面的内置种类）。
  [[nodiscard]] static Error parsing(std::string_view message);
  [[nodiscard]] static Error serialization(std::string_view message);
  [[nodiscard]] static Error connection(std::string_view message);
  [[nodiscard]] static Error initialization(std::string_view message);

  /**
   * @brief 以既有种类与消息重建错误（反序列化使用）。
   *
   * Kind::custom 重建后不携带分类，category() 返回兜底分类。
   */
  [[nodiscard]] static Error restore(Kind kind,
                                     std::string message,
                                     std::optional<ErrorContext> context = std::nullopt);

  /**
   * @brief 默认值仅用于结果容器占位：Internal 种类、空消息、无上下文。
   */
  Error() noexcept = default;
  Error(const Error& other);
  Error& operator=(const Error& other);
  Error(Error&&) noexcept = default;
  Error& operator=(Error&&) noexcept = default;
  ~Error() = default;

  [[nodiscard]] Kind kind() const noexcept { return kind_; }
  [[nodiscard]] const std::string& message() const noexcept { return message_; }

  [[nodiscard]] bool has_context() const noexcept { return context_.has_value(); }
  [[nodiscard]] const ErrorContext* context() const noexcept {
    return context_ ? &*context_ : nullptr;
  }

  [[nodiscard]] Error with_context(ErrorContext context) const&;
  [[nodiscard]] Error with_context(ErrorContext context) &&;

  /**
   * @brief 分类查询入口：内置种类查表，Custom 返回自身持有的实例。
   */
  [[nodiscard]] const Classification& category() const noexcept;

  [[nodiscard]] bool is_retriable() const noexcept { return category().is_retriable(); }
  [[nodiscard]] core::delay retry_delay(std::size_t attempt) const noexcept {
    return category().retry_delay(attempt);
  }

  /**
   * @brief 可读描述，如 "Validation error: age: must be positive"。
   *
   * Custom 统一以 "Custom error" 开头，分类名只出现在 to_context() 的 category 中。
   */
  [[nodiscard]] std::string to_string() const;

  /**
   * @brief 生成一个新的上下文，记录 operation/category/message 三项元数据。
   */
  [[nodiscard]] ErrorContext to_context(std::string_view operation) const;

 private:
  Error(Kind kind,
        std::string message,
        std::unique_ptr<Classification> classification,
        std::optional<ErrorContext> context) noexcept;

  Kind kind_{Kind::internal};
  std::string message_;
  std::unique_ptr<Classification> classification_;
  std::optional<ErrorContext> context_;
};

}  // namespace faultline
