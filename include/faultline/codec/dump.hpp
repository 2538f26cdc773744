#pragma once

#include "faultline/codec/record.hpp"

#include <cstddef>
#include <string>

namespace faultline::codec {

/**
 * @brief Record 的可读化输出（日志/调试用途）。
 *
 * 说明：
 * - 输出仅供人阅读，不保证可被重新解析；
 * - 默认会对超长内容做截断，避免日志被巨量 payload 淹没；
 * - 写日志时通常使用 multiline=false，保证一条错误只占一行。
 */
struct DumpOptions final {
    // 递归最大深度（0 表示只输出根节点）。
    std::size_t max_depth{16};

    // List 最大输出元素数（0 表示不限制）。
    std::size_t max_list_items{128};

    // Text 最大输出字节数（0 表示不限制）。
    std::size_t max_text_bytes{256};

    // List 是否使用多行缩进格式。
    bool multiline{true};

    // 每层缩进空格数（multiline=true 时生效）。
    std::size_t indent_spaces{2};

    // 是否输出 ANSI 颜色控制码（终端更易读；写入日志/文件时建议关闭）。
    bool enable_color{false};
};

/**
 * @brief 将 Record 格式化为字符串。
 */
[[nodiscard]] std::string dump_record(const Record &record,
                                      DumpOptions options = {});

} // namespace faultline::codec
