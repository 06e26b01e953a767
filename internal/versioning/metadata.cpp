#include "metadata.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace artifact::versioning {

google::protobuf::Struct ParseMetadata(const std::string& json) {
  google::protobuf::Struct metadata;
  if (json.empty()) return metadata;

  auto status = google::protobuf::util::JsonStringToMessage(json, &metadata);
  if (!status.ok()) {
    throw std::runtime_error("Invalid version metadata: " + std::string(status.message()));
  }
  return metadata;
}

std::string SerializeMetadata(const google::protobuf::Struct& metadata) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(metadata, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize version metadata: " + std::string(status.message()));
  }
  return json;
}

std::string WithMetadataField(const std::string& json, const std::string& key, const std::string& value) {
  auto metadata = ParseMetadata(json);
  (*metadata.mutable_fields())[key].set_string_value(value);
  return SerializeMetadata(metadata);
}

} // namespace artifact::versioning
