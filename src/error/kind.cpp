#include "faultline/error/kind.hpp"

#include <array>
#include <utility>

namespace faultline {
namespace {

constexpr std::array<std::pair<Kind, std::string_view>, kKindCount> kKindNames{{
  {Kind::database, "Database"},
  {Kind::network, "Network"},
  {Kind::validation, "Validation"},
  {Kind::not_found, "NotFound"},
  {Kind::internal, "Internal"},
  {Kind::custom, "Custom"},
}};

}  // namespace

std::string_view to_string(Kind kind) noexcept {
  for (const auto& [k, name] : kKindNames) {
    if (k == kind) {
      return name;
    }
  }
  return "Unknown";
}

std::optional<Kind> kind_from_string(std::string_view name) noexcept {
  for (const auto& [k, n] : kKindNames) {
    if (n == name) {
      return k;
    }
  }
  return std::nullopt;
}

}  // namespace faultline
