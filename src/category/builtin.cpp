#include "faultline/category/builtin.hpp"

#include <array>

namespace faultline::category {
namespace {

using namespace std::chrono_literals;

// 内置分类参数（按 Kind 数值下标排列，custom 不在表内）。
// 不可重试的条目 backoff 全 0，retry_delay 恒为 0。
constexpr Backoff kNoBackoff{0ms, 1, 0ms};
constexpr Backoff kDatabaseBackoff{50ms, 2, 5000ms};
constexpr Backoff kNetworkBackoff{100ms, 2, 10000ms};

} // namespace

core::delay compute_backoff(const Backoff &backoff, std::size_t attempt) noexcept {
    if (backoff.cap <= core::delay::zero() || backoff.base <= core::delay::zero()) {
        return core::delay::zero();
    }
    if (backoff.base >= backoff.cap) {
        return backoff.cap;
    }
    if (backoff.factor <= 1) {
        return backoff.base;
    }

    // 逐次乘以 factor，在乘法溢出或越过 cap 之前停下；
    // 至多 log_factor(cap / base) 次循环，与 attempt 大小无关。
    const auto cap = backoff.cap.count();
    const auto factor = static_cast<core::delay::rep>(backoff.factor);
    auto current = backoff.base.count();
    for (std::size_t i = 0; i < attempt; ++i) {
        if (current > cap / factor) {
            return backoff.cap;
        }
        current *= factor;
    }
    return core::delay{current < cap ? current : cap};
}

core::delay BuiltinClassification::retry_delay(std::size_t attempt) const noexcept {
    if (!retriable_) {
        return core::delay::zero();
    }
    return compute_backoff(backoff_, attempt);
}

std::unique_ptr<Classification> BuiltinClassification::duplicate() const {
    return std::make_unique<BuiltinClassification>(*this);
}

const Classification &builtin(Kind kind) noexcept {
    static const std::array<BuiltinClassification, kKindCount - 1> table{{
        {"Database", true, kDatabaseBackoff},
        {"Network", true, kNetworkBackoff},
        {"Validation", false, kNoBackoff},
        {"NotFound", false, kNoBackoff},
        {"Internal", false, kNoBackoff},
    }};
    const auto index = static_cast<std::size_t>(kind);
    if (index >= table.size()) {
        return default_classification();
    }
    return table[index];
}

const Classification &default_classification() noexcept {
    static const BuiltinClassification fallback{"Unknown", false, kNoBackoff};
    return fallback;
}

} // namespace faultline::category
