#include "internal/db/jsondir/json_dir_repository.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "internal/db/jsondir/version_file.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/versioning/metadata.hpp"
#include "internal/versioning/version_store.hpp"

namespace {

using artifact::db::jsondir::DecodeVersionFile;
using artifact::db::jsondir::EncodeVersionFile;
using artifact::db::jsondir::JsonDirRepository;
using artifact::db::model::VersionRecord;

std::filesystem::path FreshDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "artifact_manager_json_dir_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

std::string ReadAll(const std::filesystem::path& path) {
  std::ifstream      in(path, std::ios::binary);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

void WriteAll(const std::filesystem::path& path, const std::string& text) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << text;
}

void TestAppendWritesOneFilePerArtifact() {
  const auto dir        = FreshDir("one_file");
  auto       repository = std::make_shared<JsonDirRepository>(dir);

  artifact::versioning::VersionStore store(repository);
  store.Append("api_docs", "api_docs", "# v1", {});
  store.Append("api_docs", "api_docs", "# v2", {});

  const auto file = dir / "api_docs.json";
  assert(std::filesystem::exists(file));
  assert(!std::filesystem::exists(dir / "api_docs.json.tmp"));

  const auto records = DecodeVersionFile("api_docs", ReadAll(file));
  assert(records.size() == 2);
  assert(records[0].version == 1 && !records[0].is_current);
  assert(records[1].version == 2 && records[1].is_current);
  assert(records[1].content == "# v2");

  // a second repository over the same directory sees the history
  artifact::versioning::VersionStore reopened(std::make_shared<JsonDirRepository>(dir));
  reopened.Hydrate();
  assert(reopened.LatestVersion("api_docs") == 2);
  assert(reopened.Append("api_docs", "api_docs", "# v3", {}).version() == 3);
}

void TestWriteReplacesStaleTempAndSurvivesLargeContent() {
  const auto dir = FreshDir("durable_write");

  // leftover from an interrupted write
  WriteAll(dir / "big.json.tmp", std::string(1 << 20, 'z'));

  const std::string content(3 * 1024 * 1024 + 17, 'a');
  {
    artifact::versioning::VersionStore store(std::make_shared<JsonDirRepository>(dir));
    store.Append("big", "api_docs", content, {});
  }
  assert(!std::filesystem::exists(dir / "big.json.tmp"));

  const auto records = DecodeVersionFile("big", ReadAll(dir / "big.json"));
  assert(records.size() == 1);
  assert(records[0].content == content);
}

void TestFailedWriteLeavesNoStableFile() {
  const auto dir = FreshDir("blocked_write");

  // a non-empty directory where the temp file would go
  std::filesystem::create_directories(dir / "blocked.json.tmp" / "inner");

  auto                               repository = std::make_shared<JsonDirRepository>(dir);
  artifact::versioning::VersionStore store(repository);
  bool                               threw = false;
  try {
    store.Append("blocked", "api_docs", "never written", {});
  } catch (const artifact::util::StoreUnavailable& e) {
    threw = std::string(e.what()).find("cannot write version file") != std::string::npos;
  }
  assert(threw);
  assert(!std::filesystem::exists(dir / "blocked.json"));
  assert(!store.GetCurrent("blocked").has_value());

  std::filesystem::remove_all(dir / "blocked.json.tmp");
  assert(store.Append("blocked", "api_docs", "written", {}).version() == 1);
  assert(!std::filesystem::exists(dir / "blocked.json.tmp"));
}

void TestRolledBackTransactionWritesNothing() {
  const auto        dir = FreshDir("rollback");
  JsonDirRepository repository(dir);

  {
    auto          tx = repository.Begin();
    VersionRecord record;
    record.artifact_id = "draft";
    record.version     = 1;
    record.is_current  = true;
    assert(repository.InsertVersion(*tx, record));
    assert(repository.GetCurrentVersion(*tx, "draft").has_value());
    // destroyed without commit
  }
  assert(!std::filesystem::exists(dir / "draft.json"));

  auto tx = repository.Begin();
  assert(repository.ListHeads(*tx).empty());
  tx->Commit();
}

void TestLegacyFilesDecodeLeniently() {
  const auto dir = FreshDir("legacy");
  WriteAll(dir / "foo_20240101_120000.json", R"([
    {"version": 1, "content": {"nodes": ["a", "b"]}, "created_at": "2024-01-01T12:00:00.250000"},
    {"version": 2, "artifact_type": "foo", "content": "plain", "created_at": "2024-01-01T13:00:00",
     "is_current": true, "metadata": {"author": "ana"}}
  ])");

  JsonDirRepository repository(dir);
  auto              tx      = repository.Begin();
  const auto        records = repository.ListVersions(*tx, "foo_20240101_120000");
  tx->Commit();

  assert(records.size() == 2);
  assert(records[0].artifact_id == "foo_20240101_120000");
  assert(records[0].content.find("\"nodes\"") != std::string::npos);
  assert(artifact::util::FormatIso8601(records[0].created_at_us) == "2024-01-01T12:00:00.250000");
  assert(records[0].metadata_json == "{}");
  assert(!records[0].is_current);
  assert(records[1].artifact_type == "foo");
  assert(records[1].is_current);
  assert(artifact::versioning::ParseMetadata(records[1].metadata_json).fields().at("author").string_value() == "ana");
}

void TestMalformedFileIsReported() {
  const auto dir = FreshDir("malformed");
  WriteAll(dir / "broken.json", "{not json");

  JsonDirRepository repository(dir);
  auto              tx    = repository.Begin();
  bool              threw = false;
  try {
    (void)repository.ListVersions(*tx, "broken");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestUnsafeIdsAreRefused() {
  assert(JsonDirRepository::IsStorableId("api_docs"));
  assert(!JsonDirRepository::IsStorableId(""));
  assert(!JsonDirRepository::IsStorableId(".hidden"));
  assert(!JsonDirRepository::IsStorableId("../escape"));
  assert(!JsonDirRepository::IsStorableId("a\\b"));

  const auto        dir = FreshDir("unsafe");
  JsonDirRepository repository(dir);
  auto              tx = repository.Begin();
  VersionRecord     record;
  record.artifact_id = "nested/path";
  record.version     = 1;
  assert(!repository.InsertVersion(*tx, record));
}

void TestDeleteRemovesFile() {
  const auto dir        = FreshDir("delete");
  auto       repository = std::make_shared<JsonDirRepository>(dir);

  artifact::versioning::VersionStore store(repository);
  store.Append("gone", "api_docs", "# soon gone", {});
  assert(std::filesystem::exists(dir / "gone.json"));

  store.Drop("gone");
  assert(!std::filesystem::exists(dir / "gone.json"));
  assert(store.ListArtifactIds().empty());
}

void TestEncodedFileKeepsMetadataObject() {
  VersionRecord record;
  record.artifact_id   = "a";
  record.artifact_type = "api_docs";
  record.version       = 1;
  record.content       = "x";
  record.is_current    = true;
  record.metadata_json = R"({"job_id":"j-1"})";

  const auto text    = EncodeVersionFile({record});
  const auto decoded = DecodeVersionFile("a", text);
  assert(decoded.size() == 1);
  assert(artifact::versioning::ParseMetadata(decoded[0].metadata_json).fields().at("job_id").string_value() == "j-1");
}

} // namespace

int main() {
  TestAppendWritesOneFilePerArtifact();
  TestWriteReplacesStaleTempAndSurvivesLargeContent();
  TestFailedWriteLeavesNoStableFile();
  TestRolledBackTransactionWritesNothing();
  TestLegacyFilesDecodeLeniently();
  TestMalformedFileIsReported();
  TestUnsafeIdsAreRefused();
  TestDeleteRemovesFile();
  TestEncodedFileKeepsMetadataObject();

  std::cout << "artifact_manager_unit_json_dir_repository: pass\n";
  return 0;
}
