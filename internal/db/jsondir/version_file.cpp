#include "version_file.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <stdexcept>

#include "internal/util/time.hpp"

namespace artifact::db::jsondir {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

std::string StringOr(const Struct& object, const std::string& key, const std::string& fallback) {
  auto it = object.fields().find(key);
  if (it == object.fields().end() || it->second.kind_case() != Value::kStringValue) return fallback;
  return it->second.string_value();
}

std::string ValueToJson(const google::protobuf::Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to encode JSON: " + std::string(status.message()));
  }
  return json;
}

model::VersionRecord DecodeRecord(const std::string& file_artifact_id, const Struct& object) {
  model::VersionRecord r;
  r.artifact_id   = StringOr(object, "artifact_id", file_artifact_id);
  r.artifact_type = StringOr(object, "artifact_type", "");

  auto version = object.fields().find("version");
  if (version != object.fields().end() && version->second.kind_case() == Value::kNumberValue && version->second.number_value() > 0) {
    r.version = static_cast<uint32_t>(std::llround(version->second.number_value()));
  }

  auto content = object.fields().find("content");
  if (content != object.fields().end()) {
    if (content->second.kind_case() == Value::kStringValue) {
      r.content = content->second.string_value();
    } else if (content->second.kind_case() != Value::kNullValue) {
      r.content = ValueToJson(content->second);
    }
  }

  if (auto created_at = util::ParseIso8601(StringOr(object, "created_at", ""))) {
    r.created_at_us = *created_at;
  }

  auto is_current = object.fields().find("is_current");
  r.is_current    = is_current != object.fields().end() && is_current->second.kind_case() == Value::kBoolValue && is_current->second.bool_value();

  auto metadata = object.fields().find("metadata");
  if (metadata != object.fields().end() && metadata->second.kind_case() == Value::kStructValue) {
    r.metadata_json = ValueToJson(metadata->second.struct_value());
  }
  return r;
}

} // namespace

std::vector<model::VersionRecord> DecodeVersionFile(const std::string& file_artifact_id, const std::string& text) {
  google::protobuf::ListValue list;
  auto                        status = google::protobuf::util::JsonStringToMessage(text, &list);
  if (!status.ok()) {
    throw std::runtime_error("Malformed version file '" + file_artifact_id + "': " + std::string(status.message()));
  }

  std::vector<model::VersionRecord> records;
  records.reserve(list.values_size());
  for (const auto& value : list.values()) {
    if (value.kind_case() != Value::kStructValue) {
      throw std::runtime_error("Malformed version file '" + file_artifact_id + "': entry is not an object");
    }
    records.push_back(DecodeRecord(file_artifact_id, value.struct_value()));
  }
  return records;
}

std::string EncodeVersionFile(const std::vector<model::VersionRecord>& records) {
  google::protobuf::ListValue list;
  for (const auto& r : records) {
    auto& fields = *list.add_values()->mutable_struct_value()->mutable_fields();
    fields["version"].set_number_value(r.version);
    fields["artifact_id"].set_string_value(r.artifact_id);
    fields["artifact_type"].set_string_value(r.artifact_type);
    fields["content"].set_string_value(r.content);
    fields["created_at"].set_string_value(util::FormatIso8601(r.created_at_us));
    fields["is_current"].set_bool_value(r.is_current);

    Struct metadata;
    if (!google::protobuf::util::JsonStringToMessage(r.metadata_json, &metadata).ok()) {
      throw std::runtime_error("Invalid metadata JSON for '" + r.artifact_id + "' version " + std::to_string(r.version));
    }
    *fields["metadata"].mutable_struct_value() = std::move(metadata);
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(list, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to encode version file: " + std::string(status.message()));
  }
  return json;
}

} // namespace artifact::db::jsondir
