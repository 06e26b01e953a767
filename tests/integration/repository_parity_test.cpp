#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/jsondir/json_dir_repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/version_record.hpp"
#include "internal/versioning/version_store.hpp"

#if ARTIFACT_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

#if ARTIFACT_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using artifact::db::Repository;
using artifact::db::jsondir::JsonDirRepository;
using artifact::db::memory::MemoryRepository;
using artifact::db::model::VersionRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

VersionRecord Record(const std::string& id, uint32_t version, const std::string& content, bool current) {
  VersionRecord record;
  record.artifact_id   = id;
  record.artifact_type = "api_docs";
  record.version       = version;
  record.content       = content;
  record.created_at_us = static_cast<int64_t>(NowMs()) * 1000 + version;
  record.is_current    = current;
  record.metadata_json = R"({"source":"parity"})";
  return record;
}

void VerifyAppendAndCurrent(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertVersion(*tx, Record(id, 1, "first", true)));
    tx->Commit();
  }
  {
    auto tx = repo.Begin();
    assert(repo.ClearCurrent(*tx, id));
    assert(repo.InsertVersion(*tx, Record(id, 2, "second", true)));

    // the transaction sees its own writes
    auto current = repo.GetCurrentVersion(*tx, id);
    assert(current.has_value());
    assert(current->version == 2);
    tx->Commit();
  }

  auto tx       = repo.Begin();
  auto versions = repo.ListVersions(*tx, id);
  assert(versions.size() == 2);
  assert(versions[0].version == 1 && !versions[0].is_current);
  assert(versions[1].version == 2 && versions[1].is_current);
  assert(versions[1].content == "second");
  assert(versions[1].artifact_type == "api_docs");

  auto first = repo.GetVersion(*tx, id, 1);
  assert(first.has_value());
  assert(first->content == "first");
  assert(first->created_at_us == versions[0].created_at_us);

  assert(!repo.GetVersion(*tx, id, 3).has_value());
  assert(!repo.GetCurrentVersion(*tx, id + "-missing").has_value());
  assert(repo.ListVersions(*tx, id + "-missing").empty());
  tx->Commit();
}

void VerifyDuplicateVersionIsRejected(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertVersion(*tx, Record(id, 1, "original", true)));
    tx->Commit();
  }
  {
    auto tx = repo.Begin();
    assert(!repo.InsertVersion(*tx, Record(id, 1, "imposter", true)));
    tx->Rollback();
  }

  auto tx       = repo.Begin();
  auto versions = repo.ListVersions(*tx, id);
  assert(versions.size() == 1);
  assert(versions[0].content == "original");
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertVersion(*tx, Record(id, 1, "kept", true)));
    tx->Commit();
  }
  {
    auto tx = repo.Begin();
    assert(repo.ClearCurrent(*tx, id));
    assert(repo.InsertVersion(*tx, Record(id, 2, "discarded", true)));
    tx->Rollback();
  }
  {
    // destroyed without commit
    auto tx = repo.Begin();
    assert(repo.InsertVersion(*tx, Record(id, 3, "abandoned", false)));
  }

  auto tx      = repo.Begin();
  auto current = repo.GetCurrentVersion(*tx, id);
  assert(current.has_value());
  assert(current->version == 1);
  assert(current->content == "kept");
  assert(repo.ListVersions(*tx, id).size() == 1);
  tx->Commit();
}

void VerifyHeadsAndDelete(Repository& repo, const std::string& prefix) {
  const auto b = prefix + "-b";
  const auto a = prefix + "-a";
  {
    auto tx = repo.Begin();
    assert(repo.InsertVersion(*tx, Record(b, 1, "b1", true)));
    assert(repo.InsertVersion(*tx, Record(a, 1, "a1", false)));
    assert(repo.InsertVersion(*tx, Record(a, 2, "a2", true)));
    tx->Commit();
  }

  auto                       tx    = repo.Begin();
  auto                       heads = repo.ListHeads(*tx);
  std::vector<std::string>   ids;
  std::optional<std::size_t> a_index;
  for (std::size_t i = 0; i < heads.size(); ++i) {
    ids.push_back(heads[i].artifact_id);
    if (heads[i].artifact_id == a) a_index = i;
  }
  for (std::size_t i = 1; i < ids.size(); ++i) {
    assert(ids[i - 1] < ids[i]);
  }
  assert(a_index.has_value());
  assert(heads[*a_index].latest_version == 2);
  assert(heads[*a_index].version_count == 2);
  assert(heads[*a_index + 1].artifact_id == b);
  tx->Commit();

  auto del = repo.Begin();
  assert(repo.DeleteArtifact(*del, a));
  assert(repo.DeleteArtifact(*del, prefix + "-never-existed"));
  del->Commit();

  auto verify = repo.Begin();
  assert(repo.ListVersions(*verify, a).empty());
  assert(repo.ListVersions(*verify, b).size() == 1);
  verify->Commit();
}

void VerifyConcurrentAppends(const std::shared_ptr<Repository>& repo, const std::string& id) {
  artifact::versioning::VersionStore store(repo);
  store.Hydrate();

  constexpr int            kThreads = 4;
  constexpr int            kAppends = 10;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&store, &id, t] {
      for (int i = 0; i < kAppends; ++i) {
        store.Append(id, "api_docs", "writer " + std::to_string(t) + " #" + std::to_string(i), {});
      }
    });
  }
  for (auto& thread : threads) thread.join();

  const auto versions = store.ListVersions(id);
  assert(versions.size() == kThreads * kAppends);
  int current = 0;
  for (std::size_t i = 0; i < versions.size(); ++i) {
    assert(versions[i].version() == i + 1);
    if (versions[i].is_current()) ++current;
  }
  assert(current == 1);
  assert(versions.back().is_current());
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    artifact::versioning::VersionStore store(repo);
    store.Hydrate();
    store.Append(id, "mermaid_erd", "erDiagram A", {});
    store.Append(id, "mermaid_erd", "erDiagram B", {});
  }

  backend.restart(repo);

  artifact::versioning::VersionStore store(repo);
  store.Hydrate();
  assert(store.LatestVersion(id) == 2);

  auto current = store.GetCurrent(id);
  assert(current.has_value());
  assert(current->content() == "erDiagram B");
  assert(current->artifact_type() == "mermaid_erd");

  assert(store.Append(id, "mermaid_erd", "erDiagram C", {}).version() == 3);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

BackendFactory MakeJsonDirFactory() {
  auto dir = std::filesystem::temp_directory_path() / ("artifact_manager_integration_json_" + std::to_string(NowMs()));
  std::filesystem::create_directories(dir);

  auto make_repo = [dir]() { return std::make_shared<JsonDirRepository>(dir); };

  return BackendFactory{
      .name             = "json_dir",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = [dir]() { std::filesystem::remove_all(dir); },
  };
}

#if ARTIFACT_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("artifact_manager_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<artifact::db::sqlite::SqliteDB>(db_path);
    artifact::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<artifact::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = [db_path]() { std::filesystem::remove(db_path); },
  };
}
#endif

#if ARTIFACT_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("ARTIFACT_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("ARTIFACT_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<artifact::db::postgres::PgPool>(conninfo);
    artifact::db::postgres::BootstrapSchema(*pool);
    return std::make_shared<artifact::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  // shared databases keep rows between runs
  const auto run = backend.name + "_" + std::to_string(NowMs());

  VerifyAppendAndCurrent(*repo, run + "_life");
  VerifyDuplicateVersionIsRejected(*repo, run + "_duplicate");
  VerifyRollbackBehavior(*repo, run + "_rollback");
  VerifyHeadsAndDelete(*repo, run + "_heads");
  VerifyConcurrentAppends(repo, run + "_concurrency");

  VerifyRestartDurability(backend, run + "_durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeJsonDirFactory());

#if ARTIFACT_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if ARTIFACT_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "artifact_manager_integration_repository_parity: pass\n";
  return 0;
}
