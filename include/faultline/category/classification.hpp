#pragma once

#include "faultline/core/common.hpp"

#include <cstddef>
#include <memory>
#include <string_view>

namespace faultline::category {

/**
 * @brief 错误分类能力：决定“是否可重试”与“下次重试前等待多久”。
 *
 * 约定：
 * - 所有查询都是纯函数：无副作用，同样的输入得到同样的输出；
 * - retry_delay 的 attempt 为此前已失败的次数（从 0 开始）；
 * - 不可重试的分类也必须给出确定的 retry_delay（通常为 0），调用方应先检查
 *   is_retriable 再使用延迟；
 * - category_name 只是展示用标识，库内不保证不同自定义分类之间的唯一性。
 *
 * 内置分类是无状态的进程级单例；自定义分类由持有它的 Error 独占，
 * Error 拷贝时通过 duplicate() 得到互不共享状态的副本。
 */
class Classification {
public:
    virtual ~Classification() = default;

    [[nodiscard]] virtual bool is_retriable() const noexcept = 0;
    [[nodiscard]] virtual core::delay retry_delay(std::size_t attempt) const noexcept = 0;
    [[nodiscard]] virtual std::string_view category_name() const noexcept = 0;

    /**
     * @brief 产生一个独立副本（不得与原对象共享任何可变状态）。
     */
    [[nodiscard]] virtual std::unique_ptr<Classification> duplicate() const = 0;

protected:
    Classification() = default;
    Classification(const Classification &) = default;
    Classification(Classification &&) = default;
    Classification &operator=(const Classification &) = default;
    Classification &operator=(Classification &&) = default;
};

/**
 * @brief 自定义分类的便捷基类：按派生类型的拷贝构造实现 duplicate()。
 *
 * 用法：`class Payment final : public Cloneable<Payment> { ... };`
 */
template <class Derived>
class Cloneable : public Classification {
public:
    [[nodiscard]] std::unique_ptr<Classification> duplicate() const override {
        return std::make_unique<Derived>(static_cast<const Derived &>(*this));
    }
};

} // namespace faultline::category
