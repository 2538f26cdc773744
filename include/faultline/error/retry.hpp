#pragma once

#include "faultline/core/common.hpp"
#include "faultline/error/error.hpp"

#include <cstddef>
#include <cstdint>
#include <random>

namespace faultline {

/**
 * @brief 是否应当再试一次：错误可重试，且已尝试次数未达到上限。
 *
 * 本库只给出判定，不负责 sleep/循环；重试循环由调用方编写。
 */
[[nodiscard]] bool should_retry(const Error& error,
                                std::size_t attempt,
                                std::size_t max_retries) noexcept;

/**
 * @brief 同上，上限取 core::settings().max_retries。
 */
[[nodiscard]] bool should_retry(const Error& error, std::size_t attempt);

/**
 * @brief 调用方侧的重试策略参数（与分类表的退避相互独立）。
 *
 * 说明：
 * - attempt 从 1 开始计数（第 1 次重试）；attempt 为 0 时延迟为 0；
 * - delay = min(base_delay * backoff_multiplier^(attempt-1), max_delay)；
 * - jitter 仅在带随机源的 calculate_delay 重载中生效，系数落在 [0.75, 1.25)。
 */
struct RetryPolicy final {
  std::uint32_t max_attempts{3};
  core::delay base_delay{100};
  core::delay max_delay{30'000};
  double backoff_multiplier{2.0};
  bool jitter{true};

  [[nodiscard]] static RetryPolicy fast() noexcept;
  [[nodiscard]] static RetryPolicy standard() noexcept;
  [[nodiscard]] static RetryPolicy slow() noexcept;
  [[nodiscard]] static RetryPolicy network() noexcept;
  [[nodiscard]] static RetryPolicy database() noexcept;

  [[nodiscard]] core::delay calculate_delay(std::uint32_t attempt) const noexcept;

  template <class URBG>
  [[nodiscard]] core::delay calculate_delay(std::uint32_t attempt, URBG&& urbg) const {
    const auto plain = calculate_delay(attempt);
    if (!jitter || plain.count() == 0) {
      return plain;
    }
    std::uniform_real_distribution<double> dist(0.75, 1.25);
    return scale_(plain, dist(urbg));
  }

  [[nodiscard]] bool should_retry(std::uint32_t attempt) const noexcept {
    return attempt < max_attempts;
  }

  friend bool operator==(const RetryPolicy&, const RetryPolicy&) = default;

 private:
  [[nodiscard]] static core::delay scale_(core::delay value, double factor) noexcept;
};

}  // namespace faultline
