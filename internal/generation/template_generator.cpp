#include "template_generator.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace artifact::generation {

namespace {

constexpr const char* kOptionsPrefix = "options.";

std::string Trim(const std::string& text) {
  auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
  auto end   = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c); }).base();
  return begin < end ? std::string(begin, end) : std::string();
}

std::string ValueToText(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kStringValue:
      return value.string_value();
    case google::protobuf::Value::kBoolValue:
      return value.bool_value() ? "true" : "false";
    case google::protobuf::Value::kNumberValue: {
      std::ostringstream out;
      out << value.number_value();
      return out.str();
    }
    case google::protobuf::Value::kNullValue:
      return {};
    default: {
      std::string json;
      if (!google::protobuf::util::MessageToJsonString(value, &json).ok()) return {};
      return json;
    }
  }
}

std::string Lookup(const std::string& key, const artifact::manager::v1::GenerationRequest& request) {
  if (key == "artifact_type") return request.artifact_type();
  if (key == "artifact_id") return request.artifact_id().empty() ? request.artifact_type() : request.artifact_id();
  if (key == "meeting_notes") return request.meeting_notes();
  if (key == "context_id") return request.context_id();

  if (key.rfind(kOptionsPrefix, 0) == 0) {
    const auto& fields = request.options().fields();
    auto        it     = fields.find(key.substr(std::string(kOptionsPrefix).size()));
    if (it != fields.end()) return ValueToText(it->second);
  }
  return {};
}

} // namespace

TemplateGenerator::TemplateGenerator(std::string template_text) : template_(std::move(template_text)) {
}

std::string TemplateGenerator::Render(const std::string& template_text, const artifact::manager::v1::GenerationRequest& request) {
  std::string out;
  out.reserve(template_text.size() + request.meeting_notes().size());

  std::size_t pos = 0;
  while (pos < template_text.size()) {
    const auto open = template_text.find("{{", pos);
    if (open == std::string::npos) {
      out.append(template_text, pos, std::string::npos);
      break;
    }
    const auto close = template_text.find("}}", open + 2);
    if (close == std::string::npos) {
      out.append(template_text, pos, std::string::npos);
      break;
    }
    out.append(template_text, pos, open - pos);
    out += Lookup(Trim(template_text.substr(open + 2, close - open - 2)), request);
    pos = close + 2;
  }
  return out;
}

GenerationOutput TemplateGenerator::Generate(const artifact::manager::v1::GenerationRequest& request, const ProgressCallback& progress) {
  if (progress) progress(0.1, "rendering template");

  GenerationOutput output;
  output.content = Render(template_, request);

  if (Trim(output.content).empty()) {
    output.ok    = false;
    output.error = "template rendered empty content";
    return output;
  }

  output.ok = true;
  (*output.metadata.mutable_fields())["generator"].set_string_value("template");
  if (progress) progress(0.9, "template rendered");
  return output;
}

} // namespace artifact::generation
