#include "generator_registry.hpp"

#include <mutex>
#include <stdexcept>

#include "internal/generation/template_generator.hpp"

namespace artifact::generation {

std::shared_ptr<GeneratorRegistry> GeneratorRegistry::FromConfig(const artifact::runtime::config::GenerationConfig& config) {
  auto registry = std::make_shared<GeneratorRegistry>();
  for (const auto& type : config.artifact_types()) {
    registry->Register(type.name(), std::make_shared<TemplateGenerator>(type.template_()), type.min_notes_chars());
  }
  return registry;
}

void GeneratorRegistry::Register(const std::string& artifact_type, std::shared_ptr<Generator> generator, uint32_t min_notes_chars) {
  if (artifact_type.empty()) {
    throw std::invalid_argument("artifact type name is required");
  }
  if (!generator) {
    throw std::invalid_argument("generator is required for artifact type " + artifact_type);
  }

  std::unique_lock lock(mutex_);
  entries_[artifact_type] = ArtifactTypeEntry{artifact_type, min_notes_chars, std::move(generator)};
}

std::optional<ArtifactTypeEntry> GeneratorRegistry::Find(const std::string& artifact_type) const {
  std::shared_lock lock(mutex_);
  auto             it = entries_.find(artifact_type);
  if (it == entries_.end()) return std::nullopt;
  return it->second;
}

std::vector<std::string> GeneratorRegistry::Types() const {
  std::shared_lock         lock(mutex_);
  std::vector<std::string> out;
  out.reserve(entries_.size());
  for (const auto& [name, entry] : entries_) {
    out.push_back(name);
  }
  return out;
}

} // namespace artifact::generation
