#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>

namespace artifact::versioning {

// Version metadata travels as a JSON object between the store and its
// repositories and as google.protobuf.Struct everywhere else.

// throws std::runtime_error if json is not an object
google::protobuf::Struct ParseMetadata(const std::string& json);

std::string SerializeMetadata(const google::protobuf::Struct& metadata);

// returns json with metadata[key] = value
std::string WithMetadataField(const std::string& json, const std::string& key, const std::string& value);

} // namespace artifact::versioning
