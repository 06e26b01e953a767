#include "internal/versioning/migration_reconciler.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/versioning/metadata.hpp"
#include "internal/versioning/version_store.hpp"

namespace {

using artifact::db::memory::MemoryRepository;
using artifact::db::model::VersionRecord;
using artifact::versioning::MigrationReconciler;
using artifact::versioning::VersionStore;

constexpr const char* kLegacyA = "foo_20240101_120000";
constexpr const char* kLegacyB = "foo_20240102_090000";

// history with one version per entry of created_at_us; the last is current
std::vector<VersionRecord> History(const std::string& artifact_id, const std::vector<int64_t>& created_at_us,
                                   const std::string& metadata_json = "{}") {
  std::vector<VersionRecord> out;
  for (std::size_t i = 0; i < created_at_us.size(); ++i) {
    VersionRecord record;
    record.artifact_id   = artifact_id;
    record.artifact_type = "foo";
    record.version       = static_cast<uint32_t>(i + 1);
    record.content       = artifact_id + " v" + std::to_string(i + 1);
    record.created_at_us = created_at_us[i];
    record.is_current    = i + 1 == created_at_us.size();
    record.metadata_json = metadata_json;
    out.push_back(std::move(record));
  }
  return out;
}

std::string MigratedFrom(const artifact::manager::v1::ArtifactVersion& version) {
  auto it = version.metadata().fields().find("migrated_from");
  return it == version.metadata().fields().end() ? std::string() : it->second.string_value();
}

std::shared_ptr<VersionStore> SeedLegacyStore() {
  auto store = std::make_shared<VersionStore>(std::make_shared<MemoryRepository>());
  assert(store->ImportHistory(kLegacyA, History(kLegacyA, {100, 300})));
  assert(store->ImportHistory(kLegacyB, History(kLegacyB, {200})));
  assert(store->ImportHistory("bar", History("bar", {50})));
  return store;
}

void TestClassify() {
  const auto legacy = MigrationReconciler::Classify("api_docs_20240101_120000");
  assert(legacy.has_value());
  assert(legacy->base_type == "api_docs");
  assert(legacy->timestamp_suffix == "20240101_120000");

  assert(!MigrationReconciler::Classify("api_docs").has_value());
  assert(!MigrationReconciler::Classify("api_docs_2024_120000").has_value());
  assert(!MigrationReconciler::Classify("_20240101_120000").has_value());
  assert(!MigrationReconciler::Classify("api_docs_20240101_120000_copy").has_value());
}

void TestPreviewReportsGroupsWithoutWriting() {
  auto                store = SeedLegacyStore();
  MigrationReconciler reconciler(store);

  const auto preview = reconciler.Preview();
  assert(preview.needs_migration());
  assert(preview.stable_artifacts() == 1);
  assert(preview.groups_size() == 1);
  assert(preview.groups(0).base_type() == "foo");
  assert(preview.groups(0).legacy_ids_size() == 2);
  assert(preview.groups(0).legacy_ids(0) == kLegacyA);
  assert(preview.groups(0).version_count() == 3);
  assert(!preview.groups(0).stable_exists());

  assert(store->ListArtifactIds().size() == 3);
}

void TestRunMergesLegacyGroupByCreationTime() {
  auto                store = SeedLegacyStore();
  MigrationReconciler reconciler(store);

  const auto report = reconciler.Run();
  assert(report.groups_migrated() == 1);
  assert(report.versions_migrated() == 3);
  assert(report.groups_skipped() == 0);
  assert(report.legacy_deleted() == 2);
  assert(report.migrated_artifact_ids_size() == 1 && report.migrated_artifact_ids(0) == "foo");

  const auto versions = store->ListVersions("foo");
  assert(versions.size() == 3);
  assert(versions[0].content() == std::string(kLegacyA) + " v1");
  assert(versions[1].content() == std::string(kLegacyB) + " v1");
  assert(versions[2].content() == std::string(kLegacyA) + " v2");
  assert(MigratedFrom(versions[0]) == kLegacyA);
  assert(MigratedFrom(versions[1]) == kLegacyB);
  for (std::size_t i = 0; i < versions.size(); ++i) {
    assert(versions[i].version() == i + 1);
    assert(versions[i].artifact_id() == "foo");
    assert(versions[i].is_current() == (i == 2));
  }

  assert((store->ListArtifactIds() == std::vector<std::string>{"bar", "foo"}));
  assert(store->ListVersions("bar").size() == 1);

  // later appends continue the merged history
  assert(store->Append("foo", "foo", "fresh", {}).version() == 4);
}

void TestSecondRunIsNoOp() {
  auto                store = SeedLegacyStore();
  MigrationReconciler reconciler(store);
  reconciler.Run();

  const auto again = reconciler.Run();
  assert(again.groups_migrated() == 0);
  assert(again.versions_migrated() == 0);
  assert(again.legacy_deleted() == 0);
  assert(!reconciler.Preview().needs_migration());
  assert(store->ListVersions("foo").size() == 3);
}

void TestInterruptedRunOnlyFinishesDeletion() {
  auto store = SeedLegacyStore();

  // stable history written, legacy collections still present
  std::vector<VersionRecord> stable;
  for (auto record : History("foo", {100, 200, 300})) {
    const char* source   = record.version == 2 ? kLegacyB : kLegacyA;
    record.metadata_json = artifact::versioning::WithMetadataField(record.metadata_json, "migrated_from", source);
    stable.push_back(std::move(record));
  }
  assert(store->ImportHistory("foo", stable));

  MigrationReconciler reconciler(store);
  const auto          report = reconciler.Run();
  assert(report.groups_migrated() == 1);
  assert(report.versions_migrated() == 0);
  assert(report.legacy_deleted() == 2);
  assert(store->ListVersions("foo").size() == 3);
  assert(store->ListVersions(kLegacyA).empty());
  assert(store->ListVersions(kLegacyB).empty());
}

void TestUnrelatedStableArtifactIsNotOverwritten() {
  auto store = SeedLegacyStore();
  assert(store->ImportHistory("foo", History("foo", {10})));

  MigrationReconciler reconciler(store);
  assert(reconciler.Preview().groups(0).stable_exists());

  const auto report = reconciler.Run();
  assert(report.groups_migrated() == 0);
  assert(report.groups_skipped() == 1);
  assert(report.legacy_deleted() == 0);

  assert(store->ListVersions("foo").size() == 1);
  assert(store->ListVersions(kLegacyA).size() == 2);
  assert(store->ListVersions(kLegacyB).size() == 1);
}

} // namespace

int main() {
  TestClassify();
  TestPreviewReportsGroupsWithoutWriting();
  TestRunMergesLegacyGroupByCreationTime();
  TestSecondRunIsNoOp();
  TestInterruptedRunOnlyFinishesDeletion();
  TestUnrelatedStableArtifactIsNotOverwritten();

  std::cout << "artifact_manager_unit_migration_reconciler: pass\n";
  return 0;
}
