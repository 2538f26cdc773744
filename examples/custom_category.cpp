/**
 * @file custom_category.cpp
 * @brief 演示自定义分类：为业务错误提供自己的重试语义
 *
 * 说明：
 * - 内置种类的分类由库内常量表决定，无法修改；
 * - 需要不同的重试策略时，实现 Classification 并通过 Error::custom 携带。
 */

#include <faultline/category/builtin.hpp>
#include <faultline/category/classification.hpp>
#include <faultline/error/error.hpp>
#include <faultline/error/serialize.hpp>

#include <chrono>
#include <iostream>
#include <string_view>

using namespace faultline;
using namespace std::chrono_literals;

namespace {

// 第三方支付网关限流：可重试，1s 起步，翻三倍，上限 2 分钟
class PaymentThrottled final : public category::Cloneable<PaymentThrottled> {
public:
    [[nodiscard]] bool is_retriable() const noexcept override { return true; }

    [[nodiscard]] core::delay retry_delay(std::size_t attempt) const noexcept override {
        return category::compute_backoff(category::Backoff{1000ms, 3, 120000ms}, attempt);
    }

    [[nodiscard]] std::string_view category_name() const noexcept override {
        return "PaymentThrottled";
    }
};

void describe(const Error &err) {
    std::cout << err.to_string() << "\n";
    std::cout << "  分类: " << err.category().category_name()
              << "  可重试: " << (err.is_retriable() ? "是" : "否") << "\n";
    if (err.is_retriable()) {
        std::cout << "  退避:";
        for (std::size_t a = 0; a < 6; ++a) {
            std::cout << ' ' << err.retry_delay(a).count() << "ms";
        }
        std::cout << "\n";
    }
}

} // namespace

int main() {
    std::cout << "=== 自定义分类示例 ===\n\n";

    const auto err = Error::custom("gateway returned 429", PaymentThrottled{});
    describe(err);

    // 拷贝得到独立的分类实例
    const Error copy = err;
    std::cout << "\n拷贝后分类实例是否相同: "
              << (&copy.category() == &err.category() ? "是" : "否") << "\n";

    // 分类不参与序列化：还原后使用兜底分类（不可重试）
    auto bytes = serialize(err);
    if (bytes.has_error()) {
        std::cerr << "序列化失败: " << bytes.error().to_string() << "\n";
        return 1;
    }
    auto back = deserialize(bytes.value());
    if (back.has_error()) {
        std::cerr << "反序列化失败: " << back.error().to_string() << "\n";
        return 1;
    }
    std::cout << "\n反序列化后:\n";
    describe(back.value().error);
    return 0;
}
