#include "faultline/codec/codec.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <new>
#include <optional>
#include <string>
#include <type_traits>

namespace faultline::codec {
namespace {

class codec_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "faultline.codec"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::truncated:
        return "truncated input";
      case errc::invalid_header:
        return "invalid record header";
      case errc::invalid_format:
        return "invalid record format code";
      case errc::length_overflow:
        return "record length overflow";
      case errc::length_mismatch:
        return "record length mismatch";
      case errc::buffer_overflow:
        return "output buffer overflow";
      default:
        return "unknown faultline.codec error";
    }
  }
};

constexpr bool checked_add(std::size_t a, std::size_t b, std::size_t& out) noexcept {
  if (b > (std::numeric_limits<std::size_t>::max() - a)) {
    return false;
  }
  out = a + b;
  return true;
}

constexpr std::uint8_t length_bytes_for(std::uint32_t length) noexcept {
  if (length <= 0xFFu) {
    return 1;
  }
  if (length <= 0xFFFFu) {
    return 2;
  }
  return 3;
}

constexpr std::uint8_t make_format_byte(format_code code, std::uint8_t length_bytes) noexcept {
  return static_cast<std::uint8_t>((static_cast<std::uint8_t>(code) << 2) | (length_bytes - 1));
}

// 解码深度上限：防止恶意输入构造极深嵌套导致栈溢出。
constexpr std::size_t kMaxDecodeDepth = 64;

constexpr std::uint32_t kUnsignedWidth = sizeof(std::uint64_t);

class SpanWriter final {
 public:
  explicit SpanWriter(mutable_bytes_view out) : out_(out) {}

  [[nodiscard]] std::size_t written() const noexcept { return written_; }

  std::error_code write_u8(byte v) noexcept {
    if (written_ >= out_.size()) {
      return make_error_code(errc::buffer_overflow);
    }
    out_[written_++] = v;
    return {};
  }

  std::error_code write_bytes(bytes_view v) noexcept {
    if (v.empty()) {
      return {};
    }
    if (out_.size() - written_ < v.size()) {
      return make_error_code(errc::buffer_overflow);
    }
    std::copy(v.begin(), v.end(), out_.begin() + static_cast<std::ptrdiff_t>(written_));
    written_ += v.size();
    return {};
  }

  std::error_code write_be_u32(std::uint32_t v, std::uint8_t bytes) noexcept {
    if (bytes < 1 || bytes > 3) {
      return make_error_code(errc::invalid_header);
    }
    if (out_.size() - written_ < bytes) {
      return make_error_code(errc::buffer_overflow);
    }
    for (std::uint8_t i = 0; i < bytes; ++i) {
      const auto shift = static_cast<std::uint8_t>(8u * (bytes - 1u - i));
      out_[written_ + i] = static_cast<byte>((v >> shift) & 0xFFu);
    }
    written_ += bytes;
    return {};
  }

  std::error_code write_be_u64(std::uint64_t v) noexcept {
    if (out_.size() - written_ < kUnsignedWidth) {
      return make_error_code(errc::buffer_overflow);
    }
    for (std::size_t i = 0; i < kUnsignedWidth; ++i) {
      const auto shift = static_cast<unsigned>(8u * (kUnsignedWidth - 1u - i));
      out_[written_ + i] = static_cast<byte>((v >> shift) & 0xFFu);
    }
    written_ += kUnsignedWidth;
    return {};
  }

 private:
  mutable_bytes_view out_{};
  std::size_t written_{0};
};

class SpanReader final {
 public:
  explicit SpanReader(bytes_view in) : in_(in) {}

  [[nodiscard]] std::size_t remaining() const noexcept { return in_.size() - pos_; }
  [[nodiscard]] std::size_t consumed() const noexcept { return pos_; }

  std::error_code read_u8(byte& out) noexcept {
    if (pos_ >= in_.size()) {
      return make_error_code(errc::truncated);
    }
    out = in_[pos_++];
    return {};
  }

  std::error_code read_be_u32(std::uint8_t bytes, std::uint32_t& out) noexcept {
    if (bytes < 1 || bytes > 3) {
      return make_error_code(errc::invalid_header);
    }
    if (remaining() < bytes) {
      return make_error_code(errc::truncated);
    }
    std::uint32_t v = 0;
    for (std::uint8_t i = 0; i < bytes; ++i) {
      v = (v << 8) | static_cast<std::uint32_t>(in_[pos_++]);
    }
    out = v;
    return {};
  }

  std::error_code read_payload(std::uint32_t n, bytes_view& out) noexcept {
    if (remaining() < n) {
      return make_error_code(errc::truncated);
    }
    out = in_.subspan(pos_, n);
    pos_ += n;
    return {};
  }

 private:
  bytes_view in_{};
  std::size_t pos_{0};
};

std::error_code encode_record(const Record& record, SpanWriter& w) noexcept;
std::error_code decode_record(SpanReader& r, Record& out, std::size_t depth);

std::error_code encode_header_and_length(format_code code, std::uint32_t length, SpanWriter& w) noexcept {
  if (length > kMaxLength) {
    return make_error_code(errc::length_overflow);
  }
  const auto length_bytes = length_bytes_for(length);
  auto ec = w.write_u8(make_format_byte(code, length_bytes));
  if (ec) {
    return ec;
  }
  return w.write_be_u32(length, length_bytes);
}

// 头部中的长度值：List 为子节点数，Text 为字节数，Unsigned 固定 8。
std::error_code header_of(const Record& record, format_code& code, std::uint32_t& length) noexcept {
  const auto& storage = record.storage();
  if (const auto* v = std::get_if<List>(&storage)) {
    if (v->size() > kMaxLength) {
      return make_error_code(errc::length_overflow);
    }
    code = format_code::list;
    length = static_cast<std::uint32_t>(v->size());
    return {};
  }
  if (const auto* v = std::get_if<Text>(&storage)) {
    if (v->value.size() > kMaxLength) {
      return make_error_code(errc::length_overflow);
    }
    code = format_code::text;
    length = static_cast<std::uint32_t>(v->value.size());
    return {};
  }
  if (std::holds_alternative<Unsigned>(storage)) {
    code = format_code::unsigned_integer;
    length = kUnsignedWidth;
    return {};
  }
  return make_error_code(errc::invalid_format);
}

std::error_code encoded_size_impl(const Record& record, std::size_t& out_size) noexcept {
  format_code code{};
  std::uint32_t length_value = 0;
  auto ec = header_of(record, code, length_value);
  if (ec) {
    return ec;
  }

  std::size_t payload_size = 0;
  if (const auto* v = record.get_if<List>()) {
    for (const auto& child : *v) {
      std::size_t child_size = 0;
      ec = encoded_size_impl(child, child_size);
      if (ec) {
        return ec;
      }
      std::size_t next = 0;
      if (!checked_add(payload_size, child_size, next)) {
        return make_error_code(errc::length_overflow);
      }
      payload_size = next;
    }
  } else {
    payload_size = length_value;
  }

  const auto header = static_cast<std::size_t>(1 + length_bytes_for(length_value));
  std::size_t total = 0;
  if (!checked_add(header, payload_size, total)) {
    return make_error_code(errc::length_overflow);
  }
  out_size = total;
  return {};
}

std::error_code encode_payload(const Record& record, SpanWriter& w) noexcept {
  return std::visit(
    [&](const auto& v) -> std::error_code {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, List>) {
        for (const auto& child : v) {
          auto ec = encode_record(child, w);
          if (ec) {
            return ec;
          }
        }
        return {};
      } else if constexpr (std::is_same_v<T, Text>) {
        return w.write_bytes(bytes_view{reinterpret_cast<const byte*>(v.value.data()), v.value.size()});
      } else if constexpr (std::is_same_v<T, Unsigned>) {
        return w.write_be_u64(v.value);
      } else {
        return make_error_code(errc::invalid_format);
      }
    },
    record.storage());
}

std::error_code encode_record(const Record& record, SpanWriter& w) noexcept {
  format_code code{};
  std::uint32_t length_value = 0;
  auto ec = header_of(record, code, length_value);
  if (ec) {
    return ec;
  }
  ec = encode_header_and_length(code, length_value, w);
  if (ec) {
    return ec;
  }
  return encode_payload(record, w);
}

std::optional<format_code> format_code_from_bits(std::uint8_t bits) noexcept {
  switch (static_cast<format_code>(bits)) {
    case format_code::list:
    case format_code::text:
    case format_code::unsigned_integer:
      return static_cast<format_code>(bits);
    default:
      return std::nullopt;
  }
}

std::error_code decode_record(SpanReader& r, Record& out, std::size_t depth) {
  if (depth > kMaxDecodeDepth) {
    return make_error_code(errc::invalid_header);
  }

  byte format_byte = 0;
  auto ec = r.read_u8(format_byte);
  if (ec) {
    return ec;
  }

  const auto length_bytes = static_cast<std::uint8_t>((format_byte & 0x03u) + 1u);
  if (length_bytes == 4) {
    return make_error_code(errc::invalid_header);
  }

  std::uint32_t length = 0;
  ec = r.read_be_u32(length_bytes, length);
  if (ec) {
    return ec;
  }
  if (length > kMaxLength) {
    return make_error_code(errc::length_overflow);
  }

  const auto fmt = format_code_from_bits(static_cast<std::uint8_t>(format_byte >> 2));
  if (!fmt) {
    return make_error_code(errc::invalid_format);
  }

  if (*fmt == format_code::list) {
    // 每个子节点至少占 2 字节：先按剩余输入校验，避免按伪造的长度预留内存。
    if (length > r.remaining() / 2) {
      return make_error_code(errc::truncated);
    }
    List children;
    children.reserve(length);
    for (std::uint32_t i = 0; i < length; ++i) {
      Record child = Record::number(0);  // 占位，后续会被覆盖
      ec = decode_record(r, child, depth + 1);
      if (ec) {
        return ec;
      }
      children.push_back(std::move(child));
    }
    out = Record(std::move(children));
    return {};
  }

  bytes_view payload{};
  ec = r.read_payload(length, payload);
  if (ec) {
    return ec;
  }

  if (*fmt == format_code::text) {
    std::string s(reinterpret_cast<const char*>(payload.data()), payload.size());
    out = Record(Text{std::move(s)});
    return {};
  }

  if (payload.size() != kUnsignedWidth) {
    return make_error_code(errc::length_mismatch);
  }
  std::uint64_t v = 0;
  for (byte b : payload) {
    v = (v << 8) | static_cast<std::uint64_t>(b);
  }
  out = Record(Unsigned{v});
  return {};
}

}  // namespace

const std::error_category& error_category() noexcept {
  static codec_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

std::error_code encoded_size(const Record& record, std::size_t& out_size) noexcept {
  return encoded_size_impl(record, out_size);
}

std::error_code encode(const Record& record, std::vector<byte>& out) noexcept {
  std::size_t size = 0;
  auto ec = encoded_size_impl(record, size);
  if (ec) {
    return ec;
  }

  const auto old_size = out.size();
  std::size_t new_size = 0;
  if (!checked_add(old_size, size, new_size)) {
    return make_error_code(errc::length_overflow);
  }
  try {
    out.resize(new_size);
  } catch (const std::bad_alloc&) {
    return std::make_error_code(std::errc::not_enough_memory);
  }

  SpanWriter w(mutable_bytes_view{out.data() + old_size, size});
  ec = encode_record(record, w);
  if (ec) {
    out.resize(old_size);
    return ec;
  }
  if (w.written() != size) {
    out.resize(old_size);
    return make_error_code(errc::length_mismatch);
  }
  return {};
}

std::error_code encode_to(mutable_bytes_view out, const Record& record, std::size_t& written) noexcept {
  SpanWriter w(out);
  auto ec = encode_record(record, w);
  if (ec) {
    return ec;
  }
  written = w.written();
  return {};
}

std::error_code decode_one(bytes_view in, Record& out, std::size_t& consumed) noexcept {
  SpanReader r(in);
  try {
    auto ec = decode_record(r, out, 0);
    if (ec) {
      consumed = 0;
      return ec;
    }
  } catch (const std::bad_alloc&) {
    consumed = 0;
    return std::make_error_code(std::errc::not_enough_memory);
  }
  consumed = r.consumed();
  return {};
}

}  // namespace faultline::codec
