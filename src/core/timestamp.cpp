#include "faultline/core/timestamp.hpp"

#include <charconv>
#include <iomanip>
#include <sstream>

namespace faultline::core {
namespace {

using std::chrono::days;
using std::chrono::floor;
using std::chrono::microseconds;

// 读取 width 位十进制数字；遇到非数字或越界返回 false。
[[nodiscard]] bool read_digits(std::string_view text,
                               std::size_t pos,
                               std::size_t width,
                               int &out) noexcept {
    if (pos + width > text.size()) {
        return false;
    }
    const char *first = text.data() + pos;
    const char *last = first + width;
    for (const char *p = first; p != last; ++p) {
        if (*p < '0' || *p > '9') {
            return false;
        }
    }
    const auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

[[nodiscard]] bool expect_char(std::string_view text, std::size_t pos, char c) noexcept {
    return pos < text.size() && text[pos] == c;
}

} // namespace

timestamp now() noexcept {
    return floor<microseconds>(system_clock::now());
}

std::string format_timestamp(timestamp ts) {
    const auto day = floor<days>(ts);
    const std::chrono::year_month_day ymd{day};
    const std::chrono::hh_mm_ss tod{ts - day};

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << '-'
        << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-' << std::setw(2)
        << static_cast<unsigned>(ymd.day()) << 'T' << std::setw(2) << tod.hours().count()
        << ':' << std::setw(2) << tod.minutes().count() << ':' << std::setw(2)
        << tod.seconds().count() << '.' << std::setw(6) << tod.subseconds().count()
        << 'Z';
    return oss.str();
}

/*
 * 固定字段布局：
 *   0    5  8  11 14 17 19
 *   YYYY-MM-DDTHH:MM:SS[.f{1,6}]Z
 * 小数位不足 6 位时按右补零处理（".5" 表示 500000 微秒）。
 */
std::error_code parse_timestamp(std::string_view text, timestamp &out) noexcept {
    const auto invalid = make_error_code(errc::invalid_timestamp);

    int year = 0;
    int month = 0;
    int day_of_month = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    if (!read_digits(text, 0, 4, year) || !expect_char(text, 4, '-') ||
        !read_digits(text, 5, 2, month) || !expect_char(text, 7, '-') ||
        !read_digits(text, 8, 2, day_of_month) || !expect_char(text, 10, 'T') ||
        !read_digits(text, 11, 2, hour) || !expect_char(text, 13, ':') ||
        !read_digits(text, 14, 2, minute) || !expect_char(text, 16, ':') ||
        !read_digits(text, 17, 2, second)) {
        return invalid;
    }

    std::size_t pos = 19;
    long long micros = 0;
    if (expect_char(text, pos, '.')) {
        ++pos;
        std::size_t digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits == 6) {
                return invalid;
            }
            micros = micros * 10 + (text[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return invalid;
        }
        for (; digits < 6; ++digits) {
            micros *= 10;
        }
    }
    if (!expect_char(text, pos, 'Z') || pos + 1 != text.size()) {
        return invalid;
    }

    const std::chrono::year_month_day ymd{std::chrono::year{year},
                                          std::chrono::month{static_cast<unsigned>(month)},
                                          std::chrono::day{static_cast<unsigned>(day_of_month)}};
    if (!ymd.ok() || hour > 23 || minute > 59 || second > 59) {
        return invalid;
    }

    out = timestamp{std::chrono::sys_days{ymd}} + std::chrono::hours{hour} +
          std::chrono::minutes{minute} + std::chrono::seconds{second} +
          microseconds{micros};
    return {};
}

} // namespace faultline::core
