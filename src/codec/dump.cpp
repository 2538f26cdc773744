#include "faultline/codec/dump.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <type_traits>
#include <variant>

namespace faultline::codec {
namespace {

struct Ansi final {
    static constexpr const char *reset = "\033[0m";
    static constexpr const char *type = "\033[1;35m";
    static constexpr const char *string = "\033[1;32m";
    static constexpr const char *value = "\033[1;33m";
    static constexpr const char *dim = "\033[2m";
};

[[nodiscard]] const char *ansi_(bool enable, const char *code) noexcept {
    return enable ? code : "";
}

struct DumpContext final {
    std::ostringstream oss;
    DumpOptions options{};
};

[[nodiscard]] std::string indent_(std::size_t depth, std::size_t spaces) {
    return std::string(depth * spaces, ' ');
}

void append_escaped_text_(std::ostringstream &oss,
                          const std::string &s,
                          std::size_t max_bytes,
                          bool enable_color) {
    const auto *reset = ansi_(enable_color, Ansi::reset);
    const auto *string = ansi_(enable_color, Ansi::string);

    const std::size_t total = s.size();
    const std::size_t n = (max_bytes == 0 ? total : std::min(total, max_bytes));

    oss << string;
    oss << '"';
    for (std::size_t i = 0; i < n; ++i) {
        const auto c = static_cast<unsigned char>(s[i]);
        if (c == '\\') {
            oss << "\\\\";
            continue;
        }
        if (c == '"') {
            oss << "\\\"";
            continue;
        }
        if (c >= 0x20 && c <= 0x7E) {
            oss << static_cast<char>(c);
            continue;
        }
        // 非可打印字符（含换行）：用 \xHH，保证单行输出不被打断。
        oss << "\\x" << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(c) << std::dec;
    }
    if (max_bytes != 0 && total > max_bytes) {
        oss << "...";
    }
    oss << '"';
    oss << reset;
}

void append_record_(DumpContext &ctx, const Record &record, std::size_t depth);

void append_list_(DumpContext &ctx, const List &list, std::size_t depth) {
    const auto &opt = ctx.options;
    const bool enable_color = opt.enable_color;
    const auto *reset = ansi_(enable_color, Ansi::reset);
    const auto *type = ansi_(enable_color, Ansi::type);
    const auto *dim = ansi_(enable_color, Ansi::dim);

    const std::size_t total = list.size();
    const std::size_t n =
        (opt.max_list_items == 0 ? total : std::min(total, opt.max_list_items));

    ctx.oss << type << "L[" << total << ']' << reset;

    if (total == 0) {
        return;
    }

    if (depth >= opt.max_depth) {
        ctx.oss << ' ' << dim << "..." << reset;
        return;
    }

    if (!opt.multiline) {
        ctx.oss << ' ' << dim << "{ " << reset;
        for (std::size_t i = 0; i < n; ++i) {
            append_record_(ctx, list[i], depth + 1);
            if (i + 1 != n) {
                ctx.oss << ", ";
            }
        }
        if (opt.max_list_items != 0 && total > opt.max_list_items) {
            ctx.oss << ", " << dim << "..." << reset;
        }
        ctx.oss << ' ' << dim << '}' << reset;
        return;
    }

    ctx.oss << ' ' << dim << "{\n" << reset;
    for (std::size_t i = 0; i < n; ++i) {
        ctx.oss << indent_(depth + 1, opt.indent_spaces);
        append_record_(ctx, list[i], depth + 1);
        ctx.oss << '\n';
    }
    if (opt.max_list_items != 0 && total > opt.max_list_items) {
        ctx.oss << indent_(depth + 1, opt.indent_spaces) << dim << "..." << reset
                << '\n';
    }
    ctx.oss << indent_(depth, opt.indent_spaces) << dim << '}' << reset;
}

void append_record_(DumpContext &ctx, const Record &record, std::size_t depth) {
    const bool enable_color = ctx.options.enable_color;
    const auto *reset = ansi_(enable_color, Ansi::reset);
    const auto *type = ansi_(enable_color, Ansi::type);
    const auto *value = ansi_(enable_color, Ansi::value);

    std::visit(
        [&](const auto &v) {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, List>) {
                append_list_(ctx, v, depth);
            } else if constexpr (std::is_same_v<T, Text>) {
                ctx.oss << type << "T[" << v.value.size() << ']' << reset << ' ';
                append_escaped_text_(
                    ctx.oss, v.value, ctx.options.max_text_bytes, enable_color);
            } else if constexpr (std::is_same_v<T, Unsigned>) {
                ctx.oss << type << "U8" << reset << ' ' << value << v.value
                        << reset;
            }
        },
        record.storage());
}

} // namespace

std::string dump_record(const Record &record, DumpOptions options) {
    DumpContext ctx;
    ctx.options = options;

    append_record_(ctx, record, 0);
    return ctx.oss.str();
}

} // namespace faultline::codec
