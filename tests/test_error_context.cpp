#include "faultline/core/timestamp.hpp"
#include "faultline/error/context.hpp"

#include "test_main.hpp"

#include <chrono>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace {

using faultline::ErrorContext;

void test_fresh_context() {
  const auto before = faultline::core::now();
  const ErrorContext ctx;
  const auto after = faultline::core::now();

  TEST_EXPECT(!ctx.id().is_nil());
  TEST_EXPECT_EQ(ctx.id_string().size(), std::size_t{36});
  TEST_EXPECT(ctx.created_at() >= before);
  TEST_EXPECT(ctx.created_at() <= after);
  TEST_EXPECT_EQ(ctx.metadata_count(), std::size_t{0});
  TEST_EXPECT(ctx.cause() == nullptr);
}

void test_identifiers_are_unique() {
  std::set<std::string> seen;
  for (int i = 0; i < 256; ++i) {
    seen.insert(ErrorContext{}.id_string());
  }
  TEST_EXPECT_EQ(seen.size(), std::size_t{256});
}

void test_identifiers_unique_across_threads() {
  std::vector<std::string> a;
  std::vector<std::string> b;
  std::thread ta([&a] {
    for (int i = 0; i < 128; ++i) {
      a.push_back(ErrorContext{}.id_string());
    }
  });
  std::thread tb([&b] {
    for (int i = 0; i < 128; ++i) {
      b.push_back(ErrorContext{}.id_string());
    }
  });
  ta.join();
  tb.join();

  std::set<std::string> seen(a.begin(), a.end());
  seen.insert(b.begin(), b.end());
  TEST_EXPECT_EQ(seen.size(), std::size_t{256});
}

void test_with_metadata_is_non_mutating() {
  const ErrorContext base;
  const auto one = base.with_metadata("user", "alice");
  const auto two = one.with_metadata("request", "r-1");

  TEST_EXPECT_EQ(base.metadata_count(), std::size_t{0});
  TEST_EXPECT_EQ(one.metadata_count(), std::size_t{1});
  TEST_EXPECT_EQ(two.metadata_count(), std::size_t{2});

  // 派生出的上下文沿用同一个标识与时间。
  TEST_EXPECT(one.id() == base.id());
  TEST_EXPECT(two.created_at() == base.created_at());
}

void test_metadata_order_and_overwrite() {
  const auto ctx = ErrorContext{}
                     .with_metadata("zeta", "1")
                     .with_metadata("alpha", "2")
                     .with_metadata("mid", "3")
                     .with_metadata("zeta", "4");

  TEST_EXPECT_EQ(ctx.metadata_count(), std::size_t{3});
  TEST_EXPECT_EQ(ctx.metadata()[0].first, std::string("zeta"));
  TEST_EXPECT_EQ(ctx.metadata()[0].second, std::string("4"));
  TEST_EXPECT_EQ(ctx.metadata()[1].first, std::string("alpha"));
  TEST_EXPECT_EQ(ctx.metadata()[2].first, std::string("mid"));

  TEST_EXPECT(ctx.has_metadata("alpha"));
  TEST_EXPECT(!ctx.has_metadata("beta"));
  TEST_EXPECT(ctx.find_metadata("mid") == std::string_view("3"));
  TEST_EXPECT(!ctx.find_metadata("missing").has_value());
}

void test_cause_chain() {
  const auto root = ErrorContext{}.with_metadata("layer", "socket");
  const auto middle = ErrorContext::caused_by(root).with_metadata("layer", "client");
  const auto top = ErrorContext::caused_by(middle).with_metadata("layer", "service");

  TEST_EXPECT(top.cause() != nullptr);
  TEST_EXPECT(*top.cause() == middle);
  TEST_EXPECT(top.cause()->cause() != nullptr);
  TEST_EXPECT(*top.cause()->cause() == root);

  const auto chain = top.chain();
  TEST_EXPECT_EQ(chain.size(), std::size_t{3});
  TEST_EXPECT(chain[0]->find_metadata("layer") == std::string_view("service"));
  TEST_EXPECT(chain[1]->find_metadata("layer") == std::string_view("client"));
  TEST_EXPECT(chain[2]->find_metadata("layer") == std::string_view("socket"));
  TEST_EXPECT(chain[2]->cause() == nullptr);

  TEST_EXPECT(top.id() != middle.id());
  TEST_EXPECT(middle.id() != root.id());
}

void test_copy_is_deep() {
  const auto original = ErrorContext::caused_by(ErrorContext{}.with_metadata("k", "v"));
  const ErrorContext copy = original;  // NOLINT(performance-unnecessary-copy-initialization)

  TEST_EXPECT(copy == original);
  TEST_EXPECT(copy.cause() != original.cause());
  TEST_EXPECT(*copy.cause() == *original.cause());

  ErrorContext assigned;
  assigned = original;
  TEST_EXPECT(assigned == original);
  TEST_EXPECT(assigned.cause() != original.cause());
}

void test_long_chain_copy_compare_destroy() {
  constexpr std::size_t kLinks = 200000;
  {
    auto ctx = ErrorContext{}.with_metadata("layer", "root");
    for (std::size_t i = 0; i < kLinks; ++i) {
      ctx = ErrorContext::caused_by(std::move(ctx));
    }
    TEST_EXPECT_EQ(ctx.chain().size(), kLinks + 1);

    const ErrorContext copy = ctx;  // NOLINT(performance-unnecessary-copy-initialization)
    TEST_EXPECT(copy == ctx);
    TEST_EXPECT(copy.chain().back()->find_metadata("layer") == std::string_view("root"));

    const auto other_root = copy.with_metadata("layer", "top");
    TEST_EXPECT(other_root != ctx);

    ErrorContext assigned;
    assigned = copy;
    TEST_EXPECT(assigned == ctx);
    // 离开作用域时整条链被逐节点释放。
  }
}

void test_restore_keeps_fields() {
  const ErrorContext source = ErrorContext{}.with_metadata("a", "b");
  const auto restored = ErrorContext::restore(source.id(), source.created_at(), source.metadata());
  TEST_EXPECT(restored == source);

  const auto with_cause =
    ErrorContext::restore(source.id(), source.created_at(), {}, ErrorContext::caused_by(source));
  TEST_EXPECT(with_cause.cause() != nullptr);
  TEST_EXPECT_EQ(with_cause.chain().size(), std::size_t{3});
}

void test_equality_is_structural() {
  const ErrorContext a;
  const ErrorContext b;
  TEST_EXPECT(a != b);
  TEST_EXPECT(a.with_metadata("x", "1") != a.with_metadata("x", "2"));
  TEST_EXPECT(a.with_metadata("x", "1") == a.with_metadata("x", "1"));
}

}  // namespace

int main() {
  test_fresh_context();
  test_identifiers_are_unique();
  test_identifiers_unique_across_threads();
  test_with_metadata_is_non_mutating();
  test_metadata_order_and_overwrite();
  test_cause_chain();
  test_copy_is_deep();
  test_long_chain_copy_compare_destroy();
  test_restore_keeps_fields();
  test_equality_is_structural();
  return ::faultline::tests::run_and_report();
}
