#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <set>
#include <sstream>
#include <stdexcept>

namespace artifact::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

namespace {

constexpr const char* kDefaultBindAddress    = "0.0.0.0:50061";
constexpr uint32_t    kDefaultWorkerThreads  = 4;
constexpr uint64_t    kDefaultMaxRequestBytes = 10ull * 1024 * 1024;
constexpr uint32_t    kDefaultMinNotesChars   = 10;

constexpr const char* kDefaultArtifactTypes[] = {"mermaid_erd", "mermaid_architecture", "mermaid_sequence", "api_docs", "code_prototype"};

constexpr const char* kDefaultTemplate =
    "# {{artifact_type}}\n"
    "\n"
    "artifact: {{artifact_id}}\n"
    "context: {{context_id}}\n"
    "\n"
    "{{meeting_notes}}\n";

} // namespace

void ConfigLoader::ApplyDefaults(artifact::runtime::config::RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }
  if (config.database().backend_case() == artifact::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }
  if (config.jobs().worker_threads() == 0) {
    config.mutable_jobs()->set_worker_threads(kDefaultWorkerThreads);
  }
  if (config.jobs().max_request_bytes() == 0) {
    config.mutable_jobs()->set_max_request_bytes(kDefaultMaxRequestBytes);
  }
  if (config.generation().artifact_types().empty()) {
    for (const char* name : kDefaultArtifactTypes) {
      auto* type = config.mutable_generation()->add_artifact_types();
      type->set_name(name);
      type->set_min_notes_chars(kDefaultMinNotesChars);
    }
  }
  for (auto& type : *config.mutable_generation()->mutable_artifact_types()) {
    if (type.template_().empty()) {
      type.set_template_(kDefaultTemplate);
    }
  }
}

void ConfigLoader::Validate(const artifact::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (database.has_json_dir() && database.json_dir().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.json_dir.path is required");
  }
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }

  std::set<std::string> names;
  for (const auto& type : config.generation().artifact_types()) {
    if (type.name().empty()) {
      throw std::runtime_error("Invalid configuration: generation.artifact_types entry without name");
    }
    if (!names.insert(type.name()).second) {
      throw std::runtime_error("Invalid configuration: duplicate artifact type '" + type.name() + "'");
    }
  }
}

artifact::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  artifact::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

} // namespace artifact::config
