#pragma once

#include "faultline/core/common.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace faultline::codec {

using byte = faultline::core::byte;
using bytes_view = faultline::core::bytes_view;
using mutable_bytes_view = faultline::core::mutable_bytes_view;

/**
 * @brief 记录节点的 6-bit 格式码。
 *
 * 编码时会写入一个“格式字节”：
 * - 高 6 位：format_code
 * - 低 2 位：长度字段字节数 - 1（00->1B, 01->2B, 10->3B）
 */
enum class format_code : std::uint8_t {
  list = 0x00,
  text = 0x10,
  unsigned_integer = 0x28,
};

inline constexpr std::size_t kMaxLength = 0x00FF'FFFFu;  // 3 字节长度字段最大值

class Record;
using List = std::vector<Record>;

struct Text final {
  std::string value;
  friend bool operator==(const Text&, const Text&) = default;
};

struct Unsigned final {
  std::uint64_t value{0};
  friend bool operator==(const Unsigned&, const Unsigned&) = default;
};

/**
 * @brief 结构化记录：错误与上下文的序列化载体（支持嵌套 List）。
 *
 * 约定：
 * - “对象”用 List 表示，每个字段是一个二元 List：[Text key, value]；
 * - 字段顺序即写入顺序，解码后保持不变；
 * - Text 使用 std::string（允许包含 '\\0'，以字节序列视角编码）。
 */
class Record final {
 public:
  using storage_type = std::variant<List, Text, Unsigned>;

  Record() = delete;

  explicit Record(List v);
  explicit Record(Text v);
  explicit Record(Unsigned v);

  [[nodiscard]] const storage_type& storage() const noexcept { return storage_; }
  [[nodiscard]] storage_type& storage() noexcept { return storage_; }

  template <class T>
  [[nodiscard]] const T* get_if() const noexcept {
    return std::get_if<T>(&storage_);
  }

  template <class T>
  [[nodiscard]] T* get_if() noexcept {
    return std::get_if<T>(&storage_);
  }

  [[nodiscard]] bool is_list() const noexcept { return std::holds_alternative<List>(storage_); }

  static Record list(std::vector<Record> values);
  static Record text(std::string value);
  static Record number(std::uint64_t value);

  /**
   * @brief 构造对象字段：[Text key, value]。
   */
  static Record field(std::string key, Record value);

  friend bool operator==(const Record& lhs, const Record& rhs) noexcept;
  friend bool operator!=(const Record& lhs, const Record& rhs) noexcept { return !(lhs == rhs); }

 private:
  storage_type storage_;
};

/**
 * @brief 在对象记录中按 key 查找字段值（首个匹配）。
 *
 * object 不是 List，或字段形状不是 [Text, value] 时跳过；找不到返回 nullptr。
 */
[[nodiscard]] const Record* find_field(const Record& object, std::string_view key) noexcept;

}  // namespace faultline::codec
