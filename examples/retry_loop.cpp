/**
 * @file retry_loop.cpp
 * @brief 演示由调用方编写的重试循环
 *
 * 本库只提供判定（is_retriable/retry_delay/should_retry/RetryPolicy），
 * 何时等待、等待多久、是否放弃都由调用方决定。
 *
 * 运行：
 * - ./build/examples/retry_loop [失败次数]
 */

#include <faultline/error/error.hpp>
#include <faultline/error/log.hpp>
#include <faultline/error/result.hpp>
#include <faultline/error/retry.hpp>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <random>
#include <string>
#include <thread>

using namespace faultline;

namespace {

// 模拟一个前 N 次连接超时、之后成功的远端调用
class FlakyService final {
public:
    explicit FlakyService(int failures) : failures_(failures) {}

    Result<std::string> fetch() {
        if (calls_++ < failures_) {
            return failure(Error::connection("timeout after 3s")
                               .with_context(ErrorContext{}.with_metadata(
                                   "attempt", std::to_string(calls_))));
        }
        return success(std::string("payload"));
    }

private:
    int failures_{0};
    int calls_{0};
};

} // namespace

int main(int argc, char **argv) {
    const int failures = argc > 1 ? std::atoi(argv[1]) : 2;
    FlakyService service(failures);

    const auto policy = RetryPolicy::network();
    std::mt19937 rng(std::random_device{}());

    std::cout << "=== 重试循环示例（失败 " << failures << " 次后成功） ===\n\n";

    std::uint32_t attempt = 0;
    while (true) {
        auto r = service.fetch();
        if (r.has_value()) {
            std::cout << "成功: " << r.value() << "\n";
            return 0;
        }

        const auto &err = r.error();
        if (!err.is_retriable() || !policy.should_retry(attempt)) {
            log_error(err);
            std::cerr << "放弃: " << err.to_string() << "\n";
            return 1;
        }

        ++attempt;
        // 两种延迟来源：分类表的退避（按已失败次数），或调用方策略（带抖动）
        const auto table_delay = err.retry_delay(attempt - 1);
        const auto policy_delay = policy.calculate_delay(attempt, rng);
        std::cout << "第 " << attempt << " 次重试: 分类退避 " << table_delay.count()
                  << "ms, 策略退避 " << policy_delay.count() << "ms\n";

        // 示例中缩短等待，避免演示时间过长
        std::this_thread::sleep_for(policy_delay / 100);
    }
}
