#include "faultline/error/error.hpp"

#include "faultline/category/builtin.hpp"

namespace faultline {
namespace {

std::string join(std::string_view lhs, std::string_view sep, std::string_view rhs) {
  std::string out;
  out.reserve(lhs.size() + sep.size() + rhs.size());
  out.append(lhs).append(sep).append(rhs);
  return out;
}

std::string_view display_prefix(Kind kind) noexcept {
  switch (kind) {
    case Kind::database:
      return "Database error";
    case Kind::network:
      return "Network error";
    case Kind::validation:
      return "Validation error";
    case Kind::not_found:
      return "Not found";
    case Kind::internal:
      return "Internal error";
    case Kind::custom:
      return "Custom error";
  }
  return {};
}

}  // namespace

Error::Error(Kind kind,
             std::string message,
             std::unique_ptr<Classification> classification,
             std::optional<ErrorContext> context) noexcept
    : kind_(kind),
      message_(std::move(message)),
      classification_(std::move(classification)),
      context_(std::move(context)) {}

Error::Error(const Error& other)
    : kind_(other.kind_),
      message_(other.message_),
      classification_(other.classification_ ? other.classification_->duplicate() : nullptr),
      context_(other.context_) {}

Error& Error::operator=(const Error& other) {
  if (this == &other) {
    return *this;
  }
  Error copy(other);
  *this = std::move(copy);
  return *this;
}

Error Error::database(std::string_view operation, std::string_view message) {
  return Error(Kind::database, join(operation, ": ", message), nullptr, std::nullopt);
}

Error Error::network(std::string_view message) {
  return Error(Kind::network, std::string(message), nullptr, std::nullopt);
}

Error Error::validation(std::string_view field, std::string_view message) {
  return Error(Kind::validation, join(field, ": ", message), nullptr, std::nullopt);
}

Error Error::not_found(std::string_view resource, std::string_view identifier) {
  return Error(Kind::not_found, join(resource, " with id ", identifier), nullptr, std::nullopt);
}

Error Error::internal(std::string_view message) {
  return Error(Kind::internal, std::string(message), nullptr, std::nullopt);
}

Error Error::custom(std::string message, std::unique_ptr<Classification> classification) {
  return Error(Kind::custom, std::move(message), std::move(classification), std::nullopt);
}

Error Error::parsing(std::string_view message) { return validation("parsing", message); }

Error Error::serialization(std::string_view message) {
  return internal(join("Serialization error", ": ", message));
}

Error Error::connection(std::string_view message) {
  return network(join("Connection error", ": ", message));
}

Error Error::initialization(std::string_view message) {
  return internal(join("Initialization error", ": ", message));
}

Error Error::restore(Kind kind, std::string message, std::optional<ErrorContext> context) {
  return Error(kind, std::move(message), nullptr, std::move(context));
}

Error Error::with_context(ErrorContext context) const& {
  Error out(*this);
  out.context_ = std::move(context);
  return out;
}

Error Error::with_context(ErrorContext context) && {
  context_ = std::move(context);
  return std::move(*this);
}

const category::Classification& Error::category() const noexcept {
  if (kind_ == Kind::custom) {
    if (classification_) {
      return *classification_;
    }
    return category::default_classification();
  }
  return category::builtin(kind_);
}

std::string Error::to_string() const {
  return join(display_prefix(kind_), ": ", message_);
}

ErrorContext Error::to_context(std::string_view operation) const {
  return ErrorContext{}
    .with_metadata("operation", std::string(operation))
    .with_metadata("category", std::string(category().category_name()))
    .with_metadata("message", to_string());
}

}  // namespace faultline
