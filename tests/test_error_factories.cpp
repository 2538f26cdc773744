#include "faultline/error/error.hpp"
#include "faultline/error/kind.hpp"

#include "test_main.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace {

using namespace std::chrono_literals;
using faultline::Error;
using faultline::ErrorContext;
using faultline::Kind;

void test_builtin_factories() {
  const auto db = Error::database("insert user", "duplicate key");
  TEST_EXPECT_EQ(db.kind(), Kind::database);
  TEST_EXPECT_EQ(db.message(), std::string("insert user: duplicate key"));
  TEST_EXPECT_EQ(db.to_string(), std::string("Database error: insert user: duplicate key"));
  TEST_EXPECT(db.is_retriable());
  TEST_EXPECT_EQ(db.retry_delay(0), 50ms);

  const auto net = Error::network("timeout");
  TEST_EXPECT_EQ(net.kind(), Kind::network);
  TEST_EXPECT_EQ(net.message(), std::string("timeout"));
  TEST_EXPECT_EQ(net.to_string(), std::string("Network error: timeout"));
  TEST_EXPECT_EQ(net.retry_delay(0), 100ms);
  TEST_EXPECT_EQ(net.retry_delay(3), 800ms);
  TEST_EXPECT_EQ(net.retry_delay(10), 10000ms);

  const auto invalid = Error::validation("age", "must be positive");
  TEST_EXPECT_EQ(invalid.kind(), Kind::validation);
  TEST_EXPECT_EQ(invalid.message(), std::string("age: must be positive"));
  TEST_EXPECT_EQ(invalid.to_string(), std::string("Validation error: age: must be positive"));
  TEST_EXPECT(!invalid.is_retriable());

  const auto missing = Error::not_found("user", "42");
  TEST_EXPECT_EQ(missing.kind(), Kind::not_found);
  TEST_EXPECT_EQ(missing.message(), std::string("user with id 42"));
  TEST_EXPECT_EQ(missing.to_string(), std::string("Not found: user with id 42"));
  TEST_EXPECT(!missing.is_retriable());

  const auto bug = Error::internal("invariant broken");
  TEST_EXPECT_EQ(bug.kind(), Kind::internal);
  TEST_EXPECT_EQ(bug.to_string(), std::string("Internal error: invariant broken"));
  TEST_EXPECT(!bug.is_retriable());
  TEST_EXPECT_EQ(bug.retry_delay(2), 0ms);
}

void test_convenience_factories() {
  const auto parse = Error::parsing("unexpected token");
  TEST_EXPECT_EQ(parse.kind(), Kind::validation);
  TEST_EXPECT_EQ(parse.message(), std::string("parsing: unexpected token"));

  const auto ser = Error::serialization("bad utf-8");
  TEST_EXPECT_EQ(ser.kind(), Kind::internal);
  TEST_EXPECT_EQ(ser.message(), std::string("Serialization error: bad utf-8"));

  const auto conn = Error::connection("refused");
  TEST_EXPECT_EQ(conn.kind(), Kind::network);
  TEST_EXPECT_EQ(conn.message(), std::string("Connection error: refused"));
  TEST_EXPECT(conn.is_retriable());

  const auto init = Error::initialization("pool");
  TEST_EXPECT_EQ(init.kind(), Kind::internal);
  TEST_EXPECT_EQ(init.to_string(), std::string("Internal error: Initialization error: pool"));
}

void test_category_matches_kind() {
  TEST_EXPECT_EQ(Error::database("op", "m").category().category_name(), std::string_view("Database"));
  TEST_EXPECT_EQ(Error::not_found("r", "1").category().category_name(), std::string_view("NotFound"));
  TEST_EXPECT_EQ(&Error::network("a").category(), &Error::network("b").category());
}

void test_default_error() {
  const Error placeholder{};
  TEST_EXPECT_EQ(placeholder.kind(), Kind::internal);
  TEST_EXPECT(placeholder.message().empty());
  TEST_EXPECT(!placeholder.has_context());
}

void test_with_context() {
  const auto base = Error::network("timeout");
  const auto ctx = ErrorContext{}.with_metadata("host", "db-1");

  const auto enriched = base.with_context(ctx);
  TEST_EXPECT(!base.has_context());
  TEST_EXPECT(enriched.has_context());
  TEST_EXPECT(*enriched.context() == ctx);
  TEST_EXPECT_EQ(enriched.kind(), base.kind());
  TEST_EXPECT_EQ(enriched.message(), base.message());

  auto moved = Error::database("select", "deadlock").with_context(ctx);
  TEST_EXPECT(moved.context() != nullptr);
  TEST_EXPECT(moved.context()->find_metadata("host") == std::string_view("db-1"));

  const Error copied = enriched;  // NOLINT(performance-unnecessary-copy-initialization)
  TEST_EXPECT(copied.context() != enriched.context());
  TEST_EXPECT(*copied.context() == *enriched.context());
}

void test_to_context() {
  const auto err = Error::validation("email", "missing @");
  const auto ctx = err.to_context("register user");
  TEST_EXPECT_EQ(ctx.metadata_count(), std::size_t{3});
  TEST_EXPECT(ctx.find_metadata("operation") == std::string_view("register user"));
  TEST_EXPECT(ctx.find_metadata("category") == std::string_view("Validation"));
  TEST_EXPECT(ctx.find_metadata("message") == std::string_view("Validation error: email: missing @"));
  TEST_EXPECT_EQ(ctx.metadata()[0].first, std::string("operation"));
  TEST_EXPECT_EQ(ctx.metadata()[2].first, std::string("message"));
}

void test_kind_names() {
  using faultline::kind_from_string;
  using faultline::to_string;
  TEST_EXPECT_EQ(to_string(Kind::database), std::string_view("Database"));
  TEST_EXPECT_EQ(to_string(Kind::not_found), std::string_view("NotFound"));
  TEST_EXPECT_EQ(to_string(Kind::custom), std::string_view("Custom"));

  for (auto kind : {Kind::database, Kind::network, Kind::validation, Kind::not_found, Kind::internal, Kind::custom}) {
    TEST_EXPECT(kind_from_string(to_string(kind)) == kind);
  }
  TEST_EXPECT(!kind_from_string("database").has_value());
  TEST_EXPECT(!kind_from_string("").has_value());
}

}  // namespace

int main() {
  test_builtin_factories();
  test_convenience_factories();
  test_category_matches_kind();
  test_default_error();
  test_with_context();
  test_to_context();
  test_kind_names();
  return ::faultline::tests::run_and_report();
}
