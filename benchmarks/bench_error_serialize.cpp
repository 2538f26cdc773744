#include "bench_main.hpp"
#include "faultline/codec/codec.hpp"
#include "faultline/error/serialize.hpp"

#include <string>
#include <vector>

using namespace faultline;

static Error create_error_with_chain(int depth, int metadata_per_context) {
  // 构造带前因链的错误：每层上下文携带若干元数据
  auto err = Error::database("commit transaction", "deadlock detected");
  if (depth <= 0) {
    return err;
  }
  ErrorContext ctx;
  for (int level = 0; level < depth; ++level) {
    ctx = level == 0 ? ErrorContext{} : ErrorContext::caused_by(std::move(ctx));
    for (int i = 0; i < metadata_per_context; ++i) {
      ctx = std::move(ctx).with_metadata("key-" + std::to_string(i), "value-" + std::to_string(level));
    }
  }
  return std::move(err).with_context(std::move(ctx));
}

static void bench_serialize(const char* encode_name, const char* decode_name, int depth, int metadata) {
  const auto err = create_error_with_chain(depth, metadata);
  std::vector<core::byte> encoded;

  BENCH_RUN(encode_name, static_cast<std::size_t>(depth * metadata), 1000, {
    auto bytes = serialize(err);
    if (bytes.has_error()) {
      std::cerr << "Serialize failed: " << bytes.error().to_string() << "\n";
    } else {
      encoded = std::move(bytes).value();
    }
  });

  BENCH_RUN(decode_name, encoded.size(), 1000, {
    auto back = deserialize(encoded);
    if (back.has_error()) {
      std::cerr << "Deserialize failed: " << back.error().to_string() << "\n";
    }
  });
}

static void bench_record_only() {
  const auto err = create_error_with_chain(4, 8);

  BENCH_RUN("Error: to_record (4 contexts x 8 metadata)", 32, 1000, {
    auto record = to_record(err);
    std::size_t size = 0;
    auto ec = codec::encoded_size(record, size);
    if (ec) {
      std::cerr << "encoded_size failed: " << ec.message() << "\n";
    }
  });
}

int main() {
  std::cout << "Running error serialization benchmarks...\n";

  bench_serialize("Error: serialize (no context)", "Error: deserialize (no context)", 0, 0);
  bench_serialize("Error: serialize (1 context x 4 metadata)", "Error: deserialize (1 context x 4 metadata)", 1, 4);
  bench_serialize("Error: serialize (8 contexts x 16 metadata)", "Error: deserialize (8 contexts x 16 metadata)", 8, 16);
  bench_record_only();

  faultline::benchmarks::print_results();
  return 0;
}
