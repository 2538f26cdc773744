#include "faultline/error/retry.hpp"

#include "faultline/core/settings.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace faultline {
namespace {

using rep = core::delay::rep;

// 浮点结果超出 rep 表示范围时饱和到 max，避免未定义的转换。
core::delay to_delay(double ms) noexcept {
  if (!(ms > 0.0)) {
    return core::delay{0};
  }
  if (ms >= static_cast<double>(std::numeric_limits<rep>::max())) {
    return core::delay{std::numeric_limits<rep>::max()};
  }
  return core::delay{static_cast<rep>(ms)};
}

}  // namespace

bool should_retry(const Error& error, std::size_t attempt, std::size_t max_retries) noexcept {
  return error.is_retriable() && attempt < max_retries;
}

bool should_retry(const Error& error, std::size_t attempt) {
  return should_retry(error, attempt, core::settings().max_retries);
}

RetryPolicy RetryPolicy::fast() noexcept {
  return RetryPolicy{3, core::delay{50}, core::delay{1'000}, 1.5, true};
}

RetryPolicy RetryPolicy::standard() noexcept {
  return RetryPolicy{3, core::delay{100}, core::delay{30'000}, 2.0, true};
}

RetryPolicy RetryPolicy::slow() noexcept {
  return RetryPolicy{5, core::delay{500}, core::delay{60'000}, 2.0, true};
}

RetryPolicy RetryPolicy::network() noexcept {
  return RetryPolicy{4, core::delay{250}, core::delay{30'000}, 2.0, true};
}

RetryPolicy RetryPolicy::database() noexcept {
  return RetryPolicy{3, core::delay{100}, core::delay{10'000}, 2.0, true};
}

core::delay RetryPolicy::calculate_delay(std::uint32_t attempt) const noexcept {
  if (attempt == 0 || base_delay.count() <= 0 || max_delay.count() <= 0) {
    return core::delay{0};
  }
  const double exponent = static_cast<double>(attempt - 1);
  const double raw = static_cast<double>(base_delay.count()) * std::pow(backoff_multiplier, exponent);
  const double capped = std::isfinite(raw) ? std::min(raw, static_cast<double>(max_delay.count()))
                                           : static_cast<double>(max_delay.count());
  return to_delay(capped);
}

core::delay RetryPolicy::scale_(core::delay value, double factor) noexcept {
  return to_delay(static_cast<double>(value.count()) * factor);
}

}  // namespace faultline
