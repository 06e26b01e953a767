#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "artifact/manager/v1.hpp"
#include "internal/versioning/version_store.hpp"

namespace artifact::versioning {

// "<base_type>_<YYYYMMDD_HHMMSS>" split into its parts.
struct LegacyId {
  std::string base_type;
  std::string timestamp_suffix;
};

/*
  Folds legacy timestamp-suffixed collections into one stable history per
  base type.

  Each group is persisted before its legacy collections are deleted. A rerun
  after a crash between the two steps finds the stable history already
  holding every legacy record and only finishes the deletion; a stable
  history that does not hold them is left alone together with its legacy
  collections. Once no legacy ids remain a run does nothing.
*/
class MigrationReconciler {
 public:
  explicit MigrationReconciler(std::shared_ptr<VersionStore> store);

  static std::optional<LegacyId> Classify(const std::string& artifact_id);

  artifact::manager::v1::MigrationPreviewResponse Preview();
  artifact::manager::v1::MigrateResponse          Run();

 private:
  // base_type -> legacy ids sorted by suffix
  using Groups = std::map<std::string, std::vector<std::string>>;

  Groups CollectGroups(uint64_t* stable_artifacts);

  std::shared_ptr<VersionStore> store_;
};

} // namespace artifact::versioning
