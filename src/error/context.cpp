#include "faultline/error/context.hpp"

#include "faultline/core/timestamp.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>

namespace faultline {
namespace {

// 每个线程一份生成器：random_generator 本身不是线程安全的。
ErrorContext::id_type generate_id() {
  thread_local boost::uuids::random_generator generator;
  return generator();
}

}  // namespace

ErrorContext::ErrorContext() : id_(generate_id()), created_at_(core::now()) {}

ErrorContext::ErrorContext(id_type id,
                           core::timestamp created_at,
                           metadata_type metadata,
                           std::unique_ptr<ErrorContext> cause) noexcept
    : id_(id), created_at_(created_at), metadata_(std::move(metadata)), cause_(std::move(cause)) {}

ErrorContext::ErrorContext(const ErrorContext& other)
    : id_(other.id_), created_at_(other.created_at_), metadata_(other.metadata_) {
  // 逐节点复制前因，避免沿链条递归。
  auto* tail = &cause_;
  for (const auto* node = other.cause_.get(); node != nullptr; node = node->cause_.get()) {
    tail->reset(new ErrorContext(node->id_, node->created_at_, node->metadata_, nullptr));
    tail = &(*tail)->cause_;
  }
}

ErrorContext::~ErrorContext() {
  // 先摘下后继再释放当前节点，每个节点析构时前因已为空。
  auto next = std::move(cause_);
  while (next) {
    next = std::move(next->cause_);
  }
}

ErrorContext& ErrorContext::operator=(const ErrorContext& other) {
  if (this == &other) {
    return *this;
  }
  ErrorContext copy(other);
  *this = std::move(copy);
  return *this;
}

ErrorContext ErrorContext::caused_by(ErrorContext cause) {
  ErrorContext out;
  out.cause_ = std::make_unique<ErrorContext>(std::move(cause));
  return out;
}

ErrorContext ErrorContext::restore(id_type id,
                                   core::timestamp created_at,
                                   metadata_type metadata,
                                   std::optional<ErrorContext> cause) {
  std::unique_ptr<ErrorContext> owned;
  if (cause) {
    owned = std::make_unique<ErrorContext>(std::move(*cause));
  }
  return ErrorContext(id, created_at, std::move(metadata), std::move(owned));
}

ErrorContext ErrorContext::with_metadata(std::string key, std::string value) const& {
  ErrorContext out(*this);
  out.set_metadata_(std::move(key), std::move(value));
  return out;
}

ErrorContext ErrorContext::with_metadata(std::string key, std::string value) && {
  set_metadata_(std::move(key), std::move(value));
  return std::move(*this);
}

void ErrorContext::set_metadata_(std::string key, std::string value) {
  auto it = std::find_if(metadata_.begin(), metadata_.end(), [&](const auto& entry) {
    return entry.first == key;
  });
  if (it != metadata_.end()) {
    it->second = std::move(value);
    return;
  }
  metadata_.emplace_back(std::move(key), std::move(value));
}

std::string ErrorContext::id_string() const { return boost::uuids::to_string(id_); }

std::optional<std::string_view> ErrorContext::find_metadata(std::string_view key) const noexcept {
  for (const auto& [k, v] : metadata_) {
    if (k == key) {
      return std::string_view{v};
    }
  }
  return std::nullopt;
}

bool ErrorContext::has_metadata(std::string_view key) const noexcept {
  return find_metadata(key).has_value();
}

std::vector<const ErrorContext*> ErrorContext::chain() const {
  std::vector<const ErrorContext*> out;
  for (const auto* ctx = this; ctx != nullptr; ctx = ctx->cause()) {
    out.push_back(ctx);
  }
  return out;
}

bool operator==(const ErrorContext& lhs, const ErrorContext& rhs) noexcept {
  const auto* a = &lhs;
  const auto* b = &rhs;
  while (a != nullptr && b != nullptr) {
    if (a->id_ != b->id_ || a->created_at_ != b->created_at_ || a->metadata_ != b->metadata_) {
      return false;
    }
    a = a->cause_.get();
    b = b->cause_.get();
  }
  return a == nullptr && b == nullptr;
}

}  // namespace faultline
