#pragma once

#include <string>

#include "internal/generation/generator.hpp"

namespace artifact::generation {

/*
  Deterministic generator rendering a text template.

  Placeholders: {{artifact_type}} {{artifact_id}} {{meeting_notes}}
  {{context_id}} and {{options.<key>}}. Unknown placeholders render empty.
*/
class TemplateGenerator : public Generator {
 public:
  explicit TemplateGenerator(std::string template_text);

  GenerationOutput Generate(const artifact::manager::v1::GenerationRequest& request, const ProgressCallback& progress) override;

  static std::string Render(const std::string& template_text, const artifact::manager::v1::GenerationRequest& request);

 private:
  std::string template_;
};

} // namespace artifact::generation
