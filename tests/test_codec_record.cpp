#include "faultline/codec/codec.hpp"
#include "faultline/codec/record.hpp"

#include "test_main.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace {

using faultline::codec::byte;
using faultline::codec::bytes_view;
using faultline::codec::decode_one;
using faultline::codec::encode;
using faultline::codec::encode_to;
using faultline::codec::encoded_size;
using faultline::codec::errc;
using faultline::codec::List;
using faultline::codec::Record;
using faultline::codec::Text;

Record placeholder_record() { return Record::number(0); }

std::vector<byte> encode_ok(const Record &record) {
    std::vector<byte> out;
    TEST_EXPECT_OK(encode(record, out));
    return out;
}

Record decode_ok(const std::vector<byte> &in) {
    Record out = placeholder_record();
    std::size_t consumed = 0;
    TEST_EXPECT_OK(decode_one(bytes_view{in.data(), in.size()}, out, consumed));
    TEST_EXPECT_EQ(consumed, in.size());
    return out;
}

void test_text_wire_format() {
    const auto bytes = encode_ok(Record::text("OK"));
    const std::vector<byte> expected{0x40, 0x02, 'O', 'K'};
    TEST_EXPECT_EQ(bytes, expected);
    TEST_EXPECT(decode_ok(bytes) == Record::text("OK"));
}

void test_unsigned_wire_format() {
    const auto bytes = encode_ok(Record::number(0x0102030405060708ull));
    const std::vector<byte> expected{0xA0, 0x08, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08};
    TEST_EXPECT_EQ(bytes, expected);
    TEST_EXPECT(decode_ok(bytes) == Record::number(0x0102030405060708ull));
}

void test_list_wire_format() {
    const auto record = Record::list({Record::text("a"), Record::list({})});
    const auto bytes = encode_ok(record);
    const std::vector<byte> expected{0x00, 0x02, 0x40, 0x01, 'a', 0x00, 0x00};
    TEST_EXPECT_EQ(bytes, expected);
    TEST_EXPECT(decode_ok(bytes) == record);
}

void test_length_field_widths() {
    const auto two = encode_ok(Record::text(std::string(300, 'x')));
    TEST_EXPECT_EQ(two[0], static_cast<byte>(0x41));
    TEST_EXPECT_EQ(two[1], static_cast<byte>(0x01));
    TEST_EXPECT_EQ(two[2], static_cast<byte>(0x2C));
    TEST_EXPECT_EQ(two.size(), std::size_t{303});

    const auto three = encode_ok(Record::text(std::string(70000, 'y')));
    TEST_EXPECT_EQ(three[0], static_cast<byte>(0x42));
    TEST_EXPECT_EQ(three.size(), std::size_t{70004});
    TEST_EXPECT(decode_ok(three) == Record::text(std::string(70000, 'y')));
}

void test_encoded_size_matches() {
    const auto record = Record::list({
        Record::field("kind", Record::text("Network")),
        Record::field("format", Record::number(1)),
    });
    std::size_t size = 0;
    TEST_EXPECT_OK(encoded_size(record, size));
    TEST_EXPECT_EQ(size, encode_ok(record).size());
}

void test_encode_appends() {
    std::vector<byte> out{0xFF};
    TEST_EXPECT_OK(encode(Record::text(""), out));
    const std::vector<byte> expected{0xFF, 0x40, 0x00};
    TEST_EXPECT_EQ(out, expected);
}

void test_encode_to_fixed_buffer() {
    std::vector<byte> small(3);
    std::size_t written = 0;
    TEST_EXPECT(encode_to(small, Record::text("hello"), written) == errc::buffer_overflow);

    std::vector<byte> exact(7);
    TEST_EXPECT_OK(encode_to(exact, Record::text("hello"), written));
    TEST_EXPECT_EQ(written, std::size_t{7});
}

void test_decode_errors() {
    Record out = placeholder_record();
    std::size_t consumed = 0;

    const std::vector<byte> empty;
    TEST_EXPECT(decode_one(empty, out, consumed) == errc::truncated);

    const std::vector<byte> short_text{0x40, 0x05, 'a', 'b'};
    TEST_EXPECT(decode_one(short_text, out, consumed) == errc::truncated);
    TEST_EXPECT_EQ(consumed, std::size_t{0});

    const std::vector<byte> bad_code{0x20, 0x00};
    TEST_EXPECT(decode_one(bad_code, out, consumed) == errc::invalid_format);

    const std::vector<byte> bad_len_bytes{0x43, 0x00};
    TEST_EXPECT(decode_one(bad_len_bytes, out, consumed) == errc::invalid_header);

    const std::vector<byte> short_unsigned{0xA0, 0x04, 0x00, 0x00, 0x00, 0x01};
    TEST_EXPECT(decode_one(short_unsigned, out, consumed) == errc::length_mismatch);

    const std::vector<byte> list_truncated{0x00, 0x03, 0x40, 0x00};
    TEST_EXPECT(decode_one(list_truncated, out, consumed) == errc::truncated);
}

void test_decode_depth_limit() {
    std::vector<byte> nested;
    for (int i = 0; i < 70; ++i) {
        nested.push_back(0x00);
        nested.push_back(0x01);
    }
    nested.push_back(0x00);
    nested.push_back(0x00);

    Record out = placeholder_record();
    std::size_t consumed = 0;
    TEST_EXPECT(decode_one(nested, out, consumed) == errc::invalid_header);
}

void test_decode_reports_consumed_prefix() {
    auto bytes = encode_ok(Record::text("x"));
    bytes.push_back(0xEE);
    Record out = placeholder_record();
    std::size_t consumed = 0;
    TEST_EXPECT_OK(decode_one(bytes, out, consumed));
    TEST_EXPECT_EQ(consumed, std::size_t{3});
}

void test_find_field() {
    const auto object = Record::list({
        Record::field("a", Record::number(1)),
        Record::text("stray"),
        Record::field("b", Record::text("two")),
        Record::field("a", Record::number(3)),
    });
    const auto *a = faultline::codec::find_field(object, "a");
    TEST_EXPECT(a != nullptr && *a == Record::number(1));
    const auto *b = faultline::codec::find_field(object, "b");
    TEST_EXPECT(b != nullptr && b->get_if<Text>() != nullptr);
    TEST_EXPECT(faultline::codec::find_field(object, "c") == nullptr);
    TEST_EXPECT(faultline::codec::find_field(Record::text("a"), "a") == nullptr);
}

void test_error_category() {
    const auto ec = faultline::codec::make_error_code(errc::length_overflow);
    TEST_EXPECT_EQ(std::string_view(ec.category().name()), std::string_view("faultline.codec"));
    TEST_EXPECT_EQ(ec.message(), std::string("record length overflow"));
    std::error_code unknown(99, faultline::codec::error_category());
    TEST_EXPECT_EQ(unknown.message(), std::string("unknown faultline.codec error"));
}

} // namespace

int main() {
    test_text_wire_format();
    test_unsigned_wire_format();
    test_list_wire_format();
    test_length_field_widths();
    test_encoded_size_matches();
    test_encode_appends();
    test_encode_to_fixed_buffer();
    test_decode_errors();
    test_decode_depth_limit();
    test_decode_reports_consumed_prefix();
    test_find_field();
    test_error_category();
    return ::faultline::tests::run_and_report();
}
