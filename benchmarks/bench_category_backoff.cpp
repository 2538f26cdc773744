#include "bench_main.hpp"
#include "faultline/category/builtin.hpp"
#include "faultline/error/error.hpp"
#include "faultline/error/retry.hpp"

#include <chrono>
#include <random>

using namespace faultline;

static void bench_builtin_retry_delay() {
  const auto err = Error::network("timeout");
  std::chrono::milliseconds sink{0};

  BENCH_RUN("Category: builtin retry_delay (10000 attempts)", 10000, 20, {
    for (std::size_t a = 0; a < 10000; ++a) {
      sink += err.retry_delay(a % 64);
    }
  });

  if (sink.count() < 0) {
    std::cerr << "unexpected delay\n";
  }
}

static void bench_custom_copy() {
  class Fixed final : public category::Cloneable<Fixed> {
   public:
    [[nodiscard]] bool is_retriable() const noexcept override { return true; }
    [[nodiscard]] core::delay retry_delay(std::size_t) const noexcept override { return core::delay{5}; }
    [[nodiscard]] std::string_view category_name() const noexcept override { return "Fixed"; }
  };

  const auto err = Error::custom("fixed", Fixed{});

  BENCH_RUN("Category: copy custom error (10000 copies)", 10000, 20, {
    for (int i = 0; i < 10000; ++i) {
      Error copy = err;
      if (!copy.is_retriable()) {
        std::cerr << "unexpected classification\n";
      }
    }
  });
}

static void bench_policy_jitter() {
  const auto policy = RetryPolicy::network();
  std::mt19937 rng(7);
  std::chrono::milliseconds sink{0};

  BENCH_RUN("RetryPolicy: jittered delay (10000 attempts)", 10000, 20, {
    for (std::uint32_t a = 1; a <= 10000; ++a) {
      sink += policy.calculate_delay(a % 8, rng);
    }
  });

  if (sink.count() < 0) {
    std::cerr << "unexpected delay\n";
  }
}

int main() {
  std::cout << "Running classification benchmarks...\n";

  bench_builtin_retry_delay();
  bench_custom_copy();
  bench_policy_jitter();

  faultline::benchmarks::print_results();
  return 0;
}
