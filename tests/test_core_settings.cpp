#include "faultline/core/settings.hpp"

#include "test_main.hpp"

#include <cstdlib>

namespace {

using faultline::core::LogLevel;
using faultline::core::parse_log_level;
using faultline::core::Settings;

void set_env(const char *name, const char *value) {
    ::setenv(name, value, 1);
}

void clear_env() {
    ::unsetenv("FAULTLINE_MAX_RETRIES");
    ::unsetenv("FAULTLINE_LOG_ERRORS");
    ::unsetenv("FAULTLINE_LOG_LEVEL");
}

void test_parse_log_level() {
    TEST_EXPECT(parse_log_level("trace") == LogLevel::trace);
    TEST_EXPECT(parse_log_level("DEBUG") == LogLevel::debug);
    TEST_EXPECT(parse_log_level("Info") == LogLevel::info);
    TEST_EXPECT(parse_log_level("warn") == LogLevel::warn);
    TEST_EXPECT(parse_log_level("warning") == LogLevel::warn);
    TEST_EXPECT(parse_log_level("error") == LogLevel::error);
    TEST_EXPECT(parse_log_level("critical") == LogLevel::critical);
    TEST_EXPECT(parse_log_level("off") == LogLevel::off);
    TEST_EXPECT(!parse_log_level("verbose").has_value());
    TEST_EXPECT(!parse_log_level("").has_value());
}

void test_defaults_without_environment() {
    clear_env();
    const auto s = Settings::from_environment();
    TEST_EXPECT_EQ(s, Settings{});
    TEST_EXPECT_EQ(s.max_retries, std::size_t{3});
    TEST_EXPECT(s.log_errors);
    TEST_EXPECT_EQ(s.log_level, LogLevel::info);
}

void test_environment_overrides() {
    clear_env();
    set_env("FAULTLINE_MAX_RETRIES", "7");
    set_env("FAULTLINE_LOG_ERRORS", "FALSE");
    set_env("FAULTLINE_LOG_LEVEL", "warning");

    const auto s = Settings::from_environment();
    TEST_EXPECT_EQ(s.max_retries, std::size_t{7});
    TEST_EXPECT(!s.log_errors);
    TEST_EXPECT_EQ(s.log_level, LogLevel::warn);
    clear_env();
}

void test_invalid_values_keep_defaults() {
    clear_env();
    set_env("FAULTLINE_MAX_RETRIES", "-1");
    set_env("FAULTLINE_LOG_ERRORS", "no");
    set_env("FAULTLINE_LOG_LEVEL", "loud");

    const auto s = Settings::from_environment();
    TEST_EXPECT_EQ(s.max_retries, std::size_t{3});
    // 只有 "false" 会关闭错误日志。
    TEST_EXPECT(s.log_errors);
    TEST_EXPECT_EQ(s.log_level, LogLevel::info);

    set_env("FAULTLINE_MAX_RETRIES", "5x");
    TEST_EXPECT_EQ(Settings::from_environment().max_retries, std::size_t{3});
    set_env("FAULTLINE_MAX_RETRIES", "");
    TEST_EXPECT_EQ(Settings::from_environment().max_retries, std::size_t{3});
    clear_env();
}

void test_read_env() {
    clear_env();
    TEST_EXPECT(!faultline::core::read_env("FAULTLINE_LOG_LEVEL").has_value());
    TEST_EXPECT(!faultline::core::read_env(nullptr).has_value());
    set_env("FAULTLINE_LOG_LEVEL", "");
    const auto v = faultline::core::read_env("FAULTLINE_LOG_LEVEL");
    TEST_EXPECT(v.has_value());
    TEST_EXPECT(v.has_value() && v->empty());
    clear_env();
}

} // namespace

int main() {
    test_parse_log_level();
    test_defaults_without_environment();
    test_environment_overrides();
    test_invalid_values_keep_defaults();
    test_read_env();
    return ::faultline::tests::run_and_report();
}
