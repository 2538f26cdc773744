#include "faultline/codec/record.hpp"

#include <utility>

namespace faultline::codec {

Record::Record(List v) : storage_(std::move(v)) {}
Record::Record(Text v) : storage_(std::move(v)) {}
Record::Record(Unsigned v) : storage_(v) {}

Record Record::list(std::vector<Record> values) {
  return Record(List{std::move(values)});
}

Record Record::text(std::string value) {
  return Record(Text{std::move(value)});
}

Record Record::number(std::uint64_t value) {
  return Record(Unsigned{value});
}

Record Record::field(std::string key, Record value) {
  List pair;
  pair.reserve(2);
  pair.push_back(Record::text(std::move(key)));
  pair.push_back(std::move(value));
  return Record(std::move(pair));
}

bool operator==(const Record& lhs, const Record& rhs) noexcept {
  return lhs.storage_ == rhs.storage_;
}

const Record* find_field(const Record& object, std::string_view key) noexcept {
  const auto* fields = object.get_if<List>();
  if (fields == nullptr) {
    return nullptr;
  }
  for (const auto& entry : *fields) {
    const auto* pair = entry.get_if<List>();
    if (pair == nullptr || pair->size() != 2) {
      continue;
    }
    const auto* name = (*pair)[0].get_if<Text>();
    if (name != nullptr && name->value == key) {
      return &(*pair)[1];
    }
  }
  return nullptr;
}

}  // namespace faultline::codec
