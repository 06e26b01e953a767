#include "migration_reconciler.hpp"

#include <algorithm>
#include <regex>
#include <set>
#include <stdexcept>
#include <unordered_map>

#include "internal/observability/logging.hpp"
#include "internal/versioning/metadata.hpp"

namespace artifact::versioning {

using artifact::db::model::VersionRecord;
using artifact::observability::IntField;
using artifact::observability::StringField;

namespace {

constexpr const char* kMigratedFrom = "migrated_from";

std::string MigratedFrom(const VersionRecord& record) {
  const auto metadata = ParseMetadata(record.metadata_json);
  auto       it       = metadata.fields().find(kMigratedFrom);
  if (it == metadata.fields().end() || it->second.kind_case() != google::protobuf::Value::kStringValue) {
    return {};
  }
  return it->second.string_value();
}

// True when every legacy record is already present in the stable history.
bool HoldsGroup(const std::vector<VersionRecord>& stable, const std::unordered_map<std::string, size_t>& legacy_counts) {
  std::unordered_map<std::string, size_t> tagged;
  for (const auto& record : stable) {
    const auto source = MigratedFrom(record);
    if (!source.empty()) ++tagged[source];
  }
  for (const auto& [legacy_id, count] : legacy_counts) {
    auto it = tagged.find(legacy_id);
    if (it == tagged.end() || it->second != count) return false;
  }
  return true;
}

} // namespace

MigrationReconciler::MigrationReconciler(std::shared_ptr<VersionStore> store) : store_(std::move(store)) {
  if (!store_) {
    throw std::invalid_argument("migration reconciler: version store is required");
  }
}

std::optional<LegacyId> MigrationReconciler::Classify(const std::string& artifact_id) {
  static const std::regex kLegacyPattern(R"(^(.+)_(\d{8}_\d{6})$)");

  std::smatch match;
  if (!std::regex_match(artifact_id, match, kLegacyPattern)) {
    return std::nullopt;
  }
  return LegacyId{match[1].str(), match[2].str()};
}

MigrationReconciler::Groups MigrationReconciler::CollectGroups(uint64_t* stable_artifacts) {
  Groups   groups;
  uint64_t stable = 0;

  for (const auto& artifact_id : store_->ListArtifactIds()) {
    if (auto legacy = Classify(artifact_id)) {
      groups[legacy->base_type].push_back(artifact_id);
    } else {
      ++stable;
    }
  }

  // The suffix is fixed width, so id order within a group is suffix order.
  for (auto& [base_type, ids] : groups) {
    std::sort(ids.begin(), ids.end(),
              [](const std::string& a, const std::string& b) { return Classify(a)->timestamp_suffix < Classify(b)->timestamp_suffix; });
  }

  if (stable_artifacts) *stable_artifacts = stable;
  return groups;
}

artifact::manager::v1::MigrationPreviewResponse MigrationReconciler::Preview() {
  artifact::manager::v1::MigrationPreviewResponse resp;

  uint64_t   stable = 0;
  const auto groups = CollectGroups(&stable);

  std::set<std::string> existing;
  for (const auto& head : store_->ListHeads()) {
    existing.insert(head.artifact_id);
  }

  for (const auto& [base_type, legacy_ids] : groups) {
    auto* group = resp.add_groups();
    group->set_base_type(base_type);
    uint64_t versions = 0;
    for (const auto& legacy_id : legacy_ids) {
      group->add_legacy_ids(legacy_id);
      versions += store_->ListRecords(legacy_id).size();
    }
    group->set_version_count(versions);
    group->set_stable_exists(existing.count(base_type) > 0);
  }

  resp.set_stable_artifacts(stable);
  resp.set_needs_migration(!groups.empty());
  return resp;
}

artifact::manager::v1::MigrateResponse MigrationReconciler::Run() {
  artifact::manager::v1::MigrateResponse report;

  const auto groups = CollectGroups(nullptr);
  if (groups.empty()) {
    return report;
  }

  for (const auto& [base_type, legacy_ids] : groups) {
    std::vector<VersionRecord>              merged;
    std::unordered_map<std::string, size_t> legacy_counts;

    for (const auto& legacy_id : legacy_ids) {
      auto records             = store_->ListRecords(legacy_id);
      legacy_counts[legacy_id] = records.size();
      for (auto& record : records) {
        record.metadata_json = WithMetadataField(record.metadata_json, kMigratedFrom, legacy_id);
        merged.push_back(std::move(record));
      }
    }

    const auto stable = store_->ListRecords(base_type);
    if (!stable.empty()) {
      if (!HoldsGroup(stable, legacy_counts)) {
        report.set_groups_skipped(report.groups_skipped() + 1);
        ARTIFACT_LOG_WARN("Legacy group skipped: stable artifact already exists",
                          {StringField("base_type", base_type), IntField("legacy_collections", static_cast<int64_t>(legacy_ids.size()))});
        continue;
      }
      ARTIFACT_LOG_INFO("Completing interrupted migration", {StringField("base_type", base_type)});
    } else {
      std::stable_sort(merged.begin(), merged.end(),
                       [](const VersionRecord& a, const VersionRecord& b) { return a.created_at_us < b.created_at_us; });

      for (size_t i = 0; i < merged.size(); ++i) {
        auto& record       = merged[i];
        record.artifact_id = base_type;
        if (record.artifact_type.empty()) record.artifact_type = base_type;
        record.version    = static_cast<uint32_t>(i + 1);
        record.is_current = i + 1 == merged.size();
      }

      if (!store_->ImportHistory(base_type, merged)) {
        report.set_groups_skipped(report.groups_skipped() + 1);
        ARTIFACT_LOG_WARN("Legacy group skipped: stable artifact appeared during migration", {StringField("base_type", base_type)});
        continue;
      }
      report.set_versions_migrated(report.versions_migrated() + merged.size());
    }

    for (const auto& legacy_id : legacy_ids) {
      store_->Drop(legacy_id);
      report.set_legacy_deleted(report.legacy_deleted() + 1);
    }
    report.set_groups_migrated(report.groups_migrated() + 1);
    report.add_migrated_artifact_ids(base_type);

    ARTIFACT_LOG_INFO("Legacy group migrated",
                      {StringField("base_type", base_type), IntField("versions", static_cast<int64_t>(merged.size())),
                       IntField("legacy_collections", static_cast<int64_t>(legacy_ids.size()))});
  }

  return report;
}

} // namespace artifact::versioning
