/**
 * @file basic_usage.cpp
 * @brief 演示 faultline 的基本用法：构造错误、附加上下文、序列化与日志输出
 *
 * 运行：
 * - ./build/examples/basic_usage
 */

#include <faultline/codec/dump.hpp>
#include <faultline/error/error.hpp>
#include <faultline/error/log.hpp>
#include <faultline/error/result.hpp>
#include <faultline/error/serialize.hpp>

#include <iostream>
#include <string>
#include <string_view>

using namespace faultline;

namespace {

Result<int> parse_age(std::string_view text) {
    if (text.empty()) {
        return failure(Error::validation("age", "is required"));
    }
    int value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return failure(Error::parsing("age is not a number"));
        }
        value = value * 10 + (c - '0');
    }
    if (value == 0) {
        return failure(Error::validation("age", "must be positive"));
    }
    return success(value);
}

Result<int> load_user_age(std::string_view user_id, std::string_view raw_age) {
    auto age = parse_age(raw_age);
    if (age.has_error()) {
        // 向上传递前附加调用点信息；原错误保持不变
        const auto ctx = ErrorContext{}
                             .with_metadata("user_id", std::string(user_id))
                             .with_metadata("raw_age", std::string(raw_age));
        return failure(std::move(age).error().with_context(ctx));
    }
    return age;
}

} // namespace

int main() {
    std::cout << "=== faultline 基本用法示例 ===\n\n";

    for (std::string_view raw : {"42", "", "4x", "0"}) {
        auto r = load_user_age("u-1001", raw);
        if (r.has_value()) {
            std::cout << "解析成功: age=" << r.value() << "\n";
            continue;
        }
        const auto &err = r.error();
        std::cout << "解析失败: " << err.to_string()
                  << " (可重试: " << (err.is_retriable() ? "是" : "否") << ")\n";
    }

    // 序列化后再还原：上下文标识与时间逐位一致
    const auto err = Error::not_found("user", "42")
                         .with_context(ErrorContext{}.with_metadata("table", "users"));
    auto bytes = serialize(err);
    if (bytes.has_error()) {
        std::cerr << "序列化失败: " << bytes.error().to_string() << "\n";
        return 1;
    }
    std::cout << "\n序列化成功: " << bytes.value().size() << " 字节\n";
    std::cout << codec::dump_record(to_record(err)) << "\n";

    auto back = deserialize(bytes.value());
    if (back.has_error()) {
        std::cerr << "反序列化失败: " << back.error().to_string() << "\n";
        return 1;
    }
    const Error& restored = back.value().error;
    std::cout << "反序列化成功: " << restored.to_string()
              << " id=" << restored.context()->id_string() << "\n";

    // 通过 spdlog 输出一行错误日志（受 FAULTLINE_LOG_ERRORS/级别控制）
    log_error(err, core::LogLevel::warn);
    return 0;
}
