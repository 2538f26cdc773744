#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>

namespace faultline::core {

using byte = std::uint8_t;
using bytes_view = std::span<const byte>;
using mutable_bytes_view = std::span<byte>;

// 重试退避的时间粒度：毫秒足以表达内置表中的全部参数。
using delay = std::chrono::milliseconds;

// 上下文时间戳精度固定为微秒：序列化为 ISO-8601 文本后可逐位还原。
using system_clock = std::chrono::system_clock;
using timestamp = std::chrono::time_point<system_clock, std::chrono::microseconds>;

}  // 命名空间 faultline::core
