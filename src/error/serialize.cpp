#include "faultline/error/serialize.hpp"

#include "faultline/codec/codec.hpp"
#include "faultline/core/error.hpp"
#include "faultline/core/timestamp.hpp"

#include <boost/uuid/string_generator.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace faultline {
namespace {

using codec::List;
using codec::Record;
using codec::Text;
using codec::Unsigned;

Error malformed(core::errc code, std::string_view field) {
  std::string operation = "decode field '";
  operation.append(field).append("'");
  return wrap(core::make_error_code(code), operation);
}

Result<std::string> text_field(const Record& object, std::string_view key) {
  const auto* value = codec::find_field(object, key);
  if (value == nullptr) {
    return failure(malformed(core::errc::invalid_argument, key));
  }
  const auto* text = value->get_if<Text>();
  if (text == nullptr) {
    return failure(malformed(core::errc::invalid_argument, key));
  }
  return success(text->value);
}

Result<ErrorContext::metadata_type> metadata_from(const Record& record) {
  const auto* entries = record.get_if<List>();
  if (entries == nullptr) {
    return failure(malformed(core::errc::invalid_argument, "metadata"));
  }
  ErrorContext::metadata_type metadata;
  metadata.reserve(entries->size());
  for (const auto& entry : *entries) {
    const auto* pair = entry.get_if<List>();
    if (pair == nullptr || pair->size() != 2) {
      return failure(malformed(core::errc::invalid_argument, "metadata"));
    }
    const auto* key = (*pair)[0].get_if<Text>();
    const auto* value = (*pair)[1].get_if<Text>();
    if (key == nullptr || value == nullptr) {
      return failure(malformed(core::errc::invalid_argument, "metadata"));
    }
    metadata.emplace_back(key->value, value->value);
  }
  return success(std::move(metadata));
}

}  // namespace

Record to_record(const ErrorContext& context) {
  List metadata;
  metadata.reserve(context.metadata_count());
  for (const auto& [key, value] : context.metadata()) {
    metadata.push_back(Record::field(key, Record::text(value)));
  }

  List fields;
  fields.reserve(4);
  fields.push_back(Record::field("identifier", Record::text(context.id_string())));
  fields.push_back(Record::field("timestamp", Record::text(core::format_timestamp(context.created_at()))));
  fields.push_back(Record::field("metadata", Record::list(std::move(metadata))));
  if (const auto* cause = context.cause()) {
    fields.push_back(Record::field("cause", to_record(*cause)));
  }
  return Record::list(std::move(fields));
}

Record to_record(const Error& error) {
  List fields;
  fields.reserve(4);
  fields.push_back(Record::field("format", Record::number(kRecordFormatVersion)));
  fields.push_back(Record::field("kind", Record::text(std::string(to_string(error.kind())))));
  fields.push_back(Record::field("message", Record::text(error.message())));
  if (const auto* context = error.context()) {
    fields.push_back(Record::field("context", to_record(*context)));
  }
  return Record::list(std::move(fields));
}

Result<ErrorContext> context_from_record(const Record& record) {
  if (!record.is_list()) {
    return failure(malformed(core::errc::invalid_argument, "context"));
  }

  FAULTLINE_TRY(identifier_text, text_field(record, "identifier"));
  ErrorContext::id_type id{};
  try {
    id = boost::uuids::string_generator{}(identifier_text);
  } catch (const std::runtime_error&) {
    return failure(malformed(core::errc::invalid_identifier, "identifier"));
  }

  FAULTLINE_TRY(timestamp_text, text_field(record, "timestamp"));
  core::timestamp created_at{};
  if (auto ec = core::parse_timestamp(timestamp_text, created_at)) {
    return failure(malformed(core::errc::invalid_timestamp, "timestamp"));
  }

  const auto* metadata_record = codec::find_field(record, "metadata");
  if (metadata_record == nullptr) {
    return failure(malformed(core::errc::invalid_argument, "metadata"));
  }
  FAULTLINE_TRY(metadata, metadata_from(*metadata_record));

  std::optional<ErrorContext> cause;
  if (const auto* cause_record = codec::find_field(record, "cause")) {
    FAULTLINE_TRY(decoded_cause, context_from_record(*cause_record));
    cause.emplace(std::move(decoded_cause));
  }

  return success(ErrorContext::restore(id, created_at, std::move(metadata), std::move(cause)));
}

Result<DecodedError> error_from_record(const Record& record) {
  if (!record.is_list()) {
    return failure(malformed(core::errc::invalid_argument, "error"));
  }

  const auto* format = codec::find_field(record, "format");
  const auto* version = format == nullptr ? nullptr : format->get_if<Unsigned>();
  if (version == nullptr) {
    return failure(malformed(core::errc::invalid_argument, "format"));
  }
  if (version->value != kRecordFormatVersion) {
    return failure(malformed(core::errc::out_of_range, "format"));
  }

  FAULTLINE_TRY(kind_text, text_field(record, "kind"));
  const auto kind = kind_from_string(kind_text);
  if (!kind) {
    return failure(malformed(core::errc::out_of_range, "kind"));
  }

  FAULTLINE_TRY(message, text_field(record, "message"));

  std::optional<ErrorContext> context;
  if (const auto* context_record = codec::find_field(record, "context")) {
    FAULTLINE_TRY(decoded_context, context_from_record(*context_record));
    context.emplace(std::move(decoded_context));
  }

  return success(DecodedError{Error::restore(*kind, std::move(message), std::move(context))});
}

Result<std::vector<core::byte>> serialize(const Error& error) {
  std::vector<core::byte> out;
  if (auto ec = codec::encode(to_record(error), out)) {
    return failure(wrap(ec, "encode error record"));
  }
  return success(std::move(out));
}

Result<DecodedError> deserialize(core::bytes_view bytes) {
  Record record = Record::number(0);
  std::size_t consumed = 0;
  if (auto ec = codec::decode_one(bytes, record, consumed)) {
    return failure(wrap(ec, "decode error record"));
  }
  if (consumed != bytes.size()) {
    return failure(wrap(codec::make_error_code(codec::errc::length_mismatch), "decode error record"));
  }
  return error_from_record(record);
}

}  // namespace faultline
