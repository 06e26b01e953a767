#pragma once

#include <google/protobuf/struct.pb.h>

#include <functional>
#include <string>

#include "artifact/manager/v1.hpp"

namespace artifact::generation {

struct GenerationOutput {
  bool                     ok = false;
  std::string              content;
  std::string              error;
  google::protobuf::Struct metadata;
};

// fraction in [0, 1] plus a short human readable step description
using ProgressCallback = std::function<void(double fraction, const std::string& message)>;

/*
  Produces artifact content for one request.

  Implementations report failure through GenerationOutput::ok; an
  exception escaping Generate is treated the same way by the runner.
  Generate may be called concurrently from several workers.
*/
class Generator {
 public:
  virtual ~Generator() = default;

  virtual GenerationOutput Generate(const artifact::manager::v1::GenerationRequest& request, const ProgressCallback& progress) = 0;
};

} // namespace artifact::generation
