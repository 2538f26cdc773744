#include "faultline/error/result.hpp"

#include <utility>

namespace faultline {
namespace {

Kind wrappable_kind(Kind kind) noexcept {
  return kind == Kind::custom ? Kind::internal : kind;
}

std::string join_operation(std::string_view operation, std::string_view message) {
  std::string out;
  out.reserve(operation.size() + 2 + message.size());
  out.append(operation).append(": ").append(message);
  return out;
}

Error make_wrapped(Kind kind, std::string_view operation, std::string message, ErrorContext cause) {
  auto context = ErrorContext::caused_by(std::move(cause)).with_metadata("operation", std::string(operation));
  return Error::restore(wrappable_kind(kind), join_operation(operation, message), std::move(context));
}

}  // namespace

error_exception::error_exception(Error err) : err_(std::move(err)), what_(err_.to_string()) {}

Error wrap(std::error_code ec, std::string_view operation, Kind kind) {
  auto message = ec.message();
  auto cause = ErrorContext{}
                 .with_metadata("error_category", ec.category().name())
                 .with_metadata("error_code", std::to_string(ec.value()))
                 .with_metadata("message", message);
  return make_wrapped(kind, operation, std::move(message), std::move(cause));
}

Error wrap(const std::exception& ex, std::string_view operation, Kind kind) {
  std::string message = ex.what();
  auto cause = ErrorContext{}.with_metadata("message", message);
  return make_wrapped(kind, operation, std::move(message), std::move(cause));
}

}  // namespace faultline
