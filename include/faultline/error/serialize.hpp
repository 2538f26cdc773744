#pragma once

#include "faultline/codec/record.hpp"
#include "faultline/core/common.hpp"
#include "faultline/error/context.hpp"
#include "faultline/error/error.hpp"
#include "faultline/error/result.hpp"

#include <cstdint>
#include <vector>

namespace faultline {

/**
 * @brief 错误记录的格式版本；解码时只接受该版本。
 */
inline constexpr std::uint64_t kRecordFormatVersion = 1;

/**
 * @brief 上下文转为对象记录。
 *
 * 字段（按顺序）：
 * - identifier：Text，UUID 规范文本（小写、带连字符）
 * - timestamp：Text，ISO-8601 UTC（微秒）
 * - metadata：List，每项为 [Text key, Text value]，保持插入顺序
 * - cause：上下文对象，仅在存在前因时写出
 */
[[nodiscard]] codec::Record to_record(const ErrorContext& context);

/**
 * @brief 错误转为对象记录：format、kind、message，及可选的 context。
 *
 * 分类信息从不写出；Custom 只保留消息。
 */
[[nodiscard]] codec::Record to_record(const Error& error);

/**
 * @brief 解码得到的错误。
 *
 * Result 的成功与失败两侧不能是同一类型，解码出的 Error 因此包一层返回。
 */
struct DecodedError {
  Error error;
};

[[nodiscard]] Result<ErrorContext> context_from_record(const codec::Record& record);

/**
 * @brief 从对象记录重建错误。
 *
 * 内置种类按 kind 重新查表得到分类；Custom 使用兜底分类（不可重试）。
 */
[[nodiscard]] Result<DecodedError> error_from_record(const codec::Record& record);

/**
 * @brief 编码为二进制记录（见 codec::encode）。
 */
[[nodiscard]] Result<std::vector<core::byte>> serialize(const Error& error);

/**
 * @brief 解码二进制记录；输入必须恰好包含一个完整记录。
 */
[[nodiscard]] Result<DecodedError> deserialize(core::bytes_view bytes);

}  // namespace faultline
