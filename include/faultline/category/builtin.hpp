#pragma once

#include "faultline/category/classification.hpp"
#include "faultline/error/kind.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace faultline::category {

/**
 * @brief 指数退避参数：delay = min(base * factor^attempt, cap)。
 */
struct Backoff final {
    core::delay base{0};
    std::uint32_t factor{1};
    core::delay cap{0};
};

/**
 * @brief 按 Backoff 计算第 attempt 次（从 0 开始）重试前的等待时间。
 *
 * 计算过程饱和而非溢出：一旦超过 cap 立即返回 cap，attempt 再大也不会回绕。
 * 也供自定义分类复用。
 */
[[nodiscard]] core::delay compute_backoff(const Backoff &backoff, std::size_t attempt) noexcept;

/**
 * @brief 内置分类：参数来自编译期常量表，本身无可变状态。
 */
class BuiltinClassification final : public Classification {
public:
    constexpr BuiltinClassification(std::string_view name,
                                    bool retriable,
                                    Backoff backoff) noexcept
        : name_(name), retriable_(retriable), backoff_(backoff) {}

    [[nodiscard]] bool is_retriable() const noexcept override { return retriable_; }
    [[nodiscard]] core::delay retry_delay(std::size_t attempt) const noexcept override;
    [[nodiscard]] std::string_view category_name() const noexcept override { return name_; }
    [[nodiscard]] std::unique_ptr<Classification> duplicate() const override;

    [[nodiscard]] const Backoff &backoff() const noexcept { return backoff_; }

private:
    std::string_view name_;
    bool retriable_{false};
    Backoff backoff_{};
};

/**
 * @brief 查表获得内置种类的共享分类。
 *
 * Kind::custom 没有内置条目，返回 default_classification()。
 */
[[nodiscard]] const Classification &builtin(Kind kind) noexcept;

/**
 * @brief 兜底分类：不可重试、延迟为 0、名称 "Unknown"（等同 Internal 语义）。
 *
 * 反序列化得到的 Custom 错误无法恢复原分类时使用它。
 */
[[nodiscard]] const Classification &default_classification() noexcept;

} // namespace faultline::category
