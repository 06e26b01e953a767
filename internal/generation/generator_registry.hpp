#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/generation/generator.hpp"

namespace artifact::generation {

struct ArtifactTypeEntry {
  std::string                name;
  uint32_t                   min_notes_chars = 0;
  std::shared_ptr<Generator> generator;
};

/*
  Artifact type -> generator lookup.

  Built from generation.artifact_types at startup; tests and embedders may
  register their own generators afterwards.
*/
class GeneratorRegistry {
 public:
  static std::shared_ptr<GeneratorRegistry> FromConfig(const artifact::runtime::config::GenerationConfig& config);

  // replaces any generator registered under the same name
  void Register(const std::string& artifact_type, std::shared_ptr<Generator> generator, uint32_t min_notes_chars = 0);

  std::optional<ArtifactTypeEntry> Find(const std::string& artifact_type) const;

  // sorted
  std::vector<std::string> Types() const;

 private:
  mutable std::shared_mutex                mutex_;
  std::map<std::string, ArtifactTypeEntry> entries_;
};

} // namespace artifact::generation
