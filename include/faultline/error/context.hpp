#pragma once

#include "faultline/core/common.hpp"

#include <boost/uuid/uuid.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace faultline {

/**
 * @brief 错误上下文：唯一标识 + 创建时间 + 有序键值标注 + 可选的前因。
 *
 * 语义：
 * - 默认构造即生成随机标识（UUID v4）并记录当前 UTC 时间，元数据为空；
 * - with_metadata 返回新的上下文，原对象保持不变（已捕获的引用依旧有效）；
 * - 前因（cause）只能在创建时通过 caused_by/restore 链接，之后不可重设，
 *   因此链条天然无环；链条由 unique_ptr 独占，拷贝时整条深拷贝；
 * - 拷贝、比较与析构沿链条迭代进行，链条长度不受调用栈深度限制。
 *
 * 注意：
 * - 元数据按插入顺序保存；对已存在的 key 赋值会保留其原位置。
 */
class ErrorContext final {
 public:
  using id_type = boost::uuids::uuid;
  using metadata_type = std::vector<std::pair<std::string, std::string>>;

  ErrorContext();

  ErrorContext(const ErrorContext& other);
  ErrorContext& operator=(const ErrorContext& other);
  ErrorContext(ErrorContext&&) noexcept = default;
  ErrorContext& operator=(ErrorContext&&) noexcept = default;
  ~ErrorContext();

  /**
   * @brief 创建一个新的上下文，并把 cause 作为它的前因。
   */
  [[nodiscard]] static ErrorContext caused_by(ErrorContext cause);

  /**
   * @brief 以既有字段重建上下文（反序列化使用），不会生成新的标识/时间。
   */
  [[nodiscard]] static ErrorContext restore(id_type id,
                                            core::timestamp created_at,
                                            metadata_type metadata,
                                            std::optional<ErrorContext> cause = std::nullopt);

  [[nodiscard]] ErrorContext with_metadata(std::string key, std::string value) const&;
  [[nodiscard]] ErrorContext with_metadata(std::string key, std::string value) &&;

  [[nodiscard]] const id_type& id() const noexcept { return id_; }
  [[nodiscard]] std::string id_string() const;
  [[nodiscard]] core::timestamp created_at() const noexcept { return created_at_; }

  [[nodiscard]] const metadata_type& metadata() const noexcept { return metadata_; }
  [[nodiscard]] std::optional<std::string_view> find_metadata(std::string_view key) const noexcept;
  [[nodiscard]] bool has_metadata(std::string_view key) const noexcept;
  [[nodiscard]] std::size_t metadata_count() const noexcept { return metadata_.size(); }

  [[nodiscard]] const ErrorContext* cause() const noexcept { return cause_.get(); }

  /**
   * @brief 从本上下文开始沿前因依次列出（最新在前，根因在后）。
   */
  [[nodiscard]] std::vector<const ErrorContext*> chain() const;

  friend bool operator==(const ErrorContext& lhs, const ErrorContext& rhs) noexcept;
  friend bool operator!=(const ErrorContext& lhs, const ErrorContext& rhs) noexcept { return !(lhs == rhs); }

 private:
  ErrorContext(id_type id,
               core::timestamp created_at,
               metadata_type metadata,
               std::unique_ptr<ErrorContext> cause) noexcept;

  void set_metadata_(std::string key, std::string value);

  id_type id_{};
  core::timestamp created_at_{};
  metadata_type metadata_{};
  std::unique_ptr<ErrorContext> cause_{};
};

}  // namespace faultline
