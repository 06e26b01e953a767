#include "internal/jobs/job_runner.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/generation/generator_registry.hpp"
#include "internal/generation/template_generator.hpp"
#include "internal/jobs/job_registry.hpp"
#include "internal/jobs/job_state.hpp"
#include "internal/notify/notification_hub.hpp"
#include "internal/util/errors.hpp"
#include "internal/versioning/version_store.hpp"

namespace {

using artifact::generation::GenerationOutput;
using artifact::generation::Generator;
using artifact::generation::ProgressCallback;
using artifact::jobs::JobRegistry;
using artifact::jobs::JobRunner;
using artifact::jobs::JobRunnerOptions;
using artifact::manager::v1::ErrorKind;
using artifact::manager::v1::Event;
using artifact::manager::v1::GenerationJob;
using artifact::manager::v1::GenerationRequest;
using artifact::manager::v1::JobStatus;
using artifact::notify::NotificationHub;
namespace events = artifact::notify::events;

class RefusingGenerator final : public Generator {
 public:
  GenerationOutput Generate(const GenerationRequest&, const ProgressCallback& progress) override {
    progress(0.2, "thinking");
    GenerationOutput output;
    output.error = "model refused the prompt";
    return output;
  }
};

class SilentGenerator final : public Generator {
 public:
  GenerationOutput Generate(const GenerationRequest&, const ProgressCallback&) override {
    GenerationOutput output;
    output.ok = true;
    return output;
  }
};

class ThrowingGenerator final : public Generator {
 public:
  GenerationOutput Generate(const GenerationRequest&, const ProgressCallback&) override {
    throw std::runtime_error("upstream timeout");
  }
};

// Version store whose repository rejects every insert.
class ReadOnlyRepository final : public artifact::db::Repository {
 public:
  std::unique_ptr<artifact::db::Transaction> Begin() override {
    return inner_.Begin();
  }
  artifact::db::Result InsertVersion(artifact::db::Transaction&, const artifact::db::model::VersionRecord&) override {
    return artifact::db::Result::Err(artifact::db::ErrorCode::IOError, "read-only medium");
  }
  artifact::db::Result ClearCurrent(artifact::db::Transaction& tx, const std::string& artifact_id) override {
    return inner_.ClearCurrent(tx, artifact_id);
  }
  std::optional<artifact::db::model::VersionRecord> GetVersion(artifact::db::Transaction& tx, const std::string& artifact_id,
                                                               uint32_t version) override {
    return inner_.GetVersion(tx, artifact_id, version);
  }
  std::optional<artifact::db::model::VersionRecord> GetCurrentVersion(artifact::db::Transaction& tx, const std::string& artifact_id) override {
    return inner_.GetCurrentVersion(tx, artifact_id);
  }
  std::vector<artifact::db::model::VersionRecord> ListVersions(artifact::db::Transaction& tx, const std::string& artifact_id) override {
    return inner_.ListVersions(tx, artifact_id);
  }
  std::vector<artifact::db::model::ArtifactHead> ListHeads(artifact::db::Transaction& tx) override {
    return inner_.ListHeads(tx);
  }
  artifact::db::Result DeleteArtifact(artifact::db::Transaction& tx, const std::string& artifact_id) override {
    return inner_.DeleteArtifact(tx, artifact_id);
  }

 private:
  artifact::db::memory::MemoryRepository inner_;
};

struct Harness {
  std::shared_ptr<artifact::versioning::VersionStore>      store;
  std::shared_ptr<JobRegistry>                             registry   = std::make_shared<JobRegistry>();
  std::shared_ptr<artifact::generation::GeneratorRegistry> generators = std::make_shared<artifact::generation::GeneratorRegistry>();
  std::shared_ptr<NotificationHub>                         hub        = std::make_shared<NotificationHub>();
  std::unique_ptr<JobRunner>                               runner;

  std::mutex                                events_mutex;
  std::map<std::string, std::vector<Event>> events_by_job;

  explicit Harness(std::shared_ptr<artifact::db::Repository> repository = std::make_shared<artifact::db::memory::MemoryRepository>(),
                   JobRunnerOptions options = {}) {
    store = std::make_shared<artifact::versioning::VersionStore>(std::move(repository));
    generators->Register("api_docs", std::make_shared<artifact::generation::TemplateGenerator>("# API\n{{meeting_notes}}"), 10);
    generators->Register("refuses", std::make_shared<RefusingGenerator>());
    generators->Register("throws", std::make_shared<ThrowingGenerator>());
    generators->Register("silent", std::make_shared<SilentGenerator>());
    generators->Register("erd_20240101_120000", std::make_shared<artifact::generation::TemplateGenerator>("{{meeting_notes}}"));

    hub->Subscribe(artifact::notify::kJobsChannel, [this](const Event& event) {
      if (event.job_id().empty()) return true;
      std::lock_guard lock(events_mutex);
      events_by_job[event.job_id()].push_back(event);
      return true;
    });

    runner = std::make_unique<JobRunner>(registry, store, generators, hub, options);
    runner->Start();
  }

  ~Harness() {
    runner->Stop();
  }

  GenerationJob WaitTerminal(const std::string& job_id) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (std::chrono::steady_clock::now() < deadline) {
      auto job = registry->Get(job_id);
      assert(job.has_value());
      if (artifact::jobs::IsTerminal(job->status())) return *job;
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    assert(false && "job did not finish in time");
    return {};
  }

  // events of a job once its final event has been delivered
  std::vector<Event> EventsFor(const std::string& job_id) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (std::chrono::steady_clock::now() < deadline) {
      {
        std::lock_guard lock(events_mutex);
        const auto&     received = events_by_job[job_id];
        if (!received.empty() && (received.back().type() == events::kGenerationComplete || received.back().type() == events::kGenerationError)) {
          return received;
        }
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    assert(false && "final event not delivered in time");
    return {};
  }
};

GenerationRequest Request(const std::string& artifact_type, const std::string& notes) {
  GenerationRequest request;
  request.set_artifact_type(artifact_type);
  request.set_meeting_notes(notes);
  return request;
}

std::string ValidationMessage(JobRunner& runner, const GenerationRequest& request) {
  try {
    runner.Validate(request);
  } catch (const artifact::util::ValidationError& e) {
    return e.what();
  }
  return {};
}

void TestValidationErrors() {
  JobRunnerOptions options;
  options.max_request_bytes = 256;
  Harness h(std::make_shared<artifact::db::memory::MemoryRepository>(), options);

  assert(ValidationMessage(*h.runner, Request("", "long enough notes")) == "artifact_type is required");
  assert(ValidationMessage(*h.runner, Request("invalid_type", "long enough notes")) == "Invalid artifact_type: invalid_type");
  assert(ValidationMessage(*h.runner, Request("api_docs", "")) == "Either meeting_notes or context_id must be provided");
  assert(ValidationMessage(*h.runner, Request("api_docs", "   short   ")) == "meeting_notes must be at least 10 characters");
  // five two-byte code points
  assert(ValidationMessage(*h.runner, Request("api_docs", "\xc3\xa9\xc3\xa9\xc3\xa9\xc3\xa9\xc3\xa9")) ==
         "meeting_notes must be at least 10 characters");

  assert(!ValidationMessage(*h.runner, Request("api_docs", std::string(300, 'x'))).empty());

  auto bad_id = Request("api_docs", "long enough notes");
  bad_id.set_artifact_id("../escape");
  assert(ValidationMessage(*h.runner, bad_id) == "Invalid artifact_id: ../escape");

  auto legacy_id = Request("api_docs", "long enough notes");
  legacy_id.set_artifact_id("billing_20240101_120000");
  assert(ValidationMessage(*h.runner, legacy_id) == "artifact_id must not end in a _YYYYMMDD_HHMMSS suffix: billing_20240101_120000");

  auto near_legacy = Request("api_docs", "long enough notes");
  near_legacy.set_artifact_id("billing_2024_01");
  assert(ValidationMessage(*h.runner, near_legacy).empty());

  auto context_only = Request("api_docs", "");
  context_only.set_context_id("ctx-1");
  assert(ValidationMessage(*h.runner, context_only).empty());

  // the type name becomes the id when none is given
  assert(!ValidationMessage(*h.runner, Request("erd_20240101_120000", "long enough notes")).empty());
  auto renamed = Request("erd_20240101_120000", "long enough notes");
  renamed.set_artifact_id("erd");
  assert(ValidationMessage(*h.runner, renamed).empty());

  bool threw = false;
  try {
    h.runner->Submit(Request("invalid_type", "long enough notes"));
  } catch (const artifact::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
  assert(h.registry->List().empty());
}

void TestArtifactIdRules() {
  assert(JobRunner::IsValidArtifactId("api_docs"));
  assert(JobRunner::IsValidArtifactId("billing erd v2"));
  assert(!JobRunner::IsValidArtifactId(""));
  assert(!JobRunner::IsValidArtifactId(".hidden"));
  assert(!JobRunner::IsValidArtifactId("a/b"));
  assert(!JobRunner::IsValidArtifactId("a\\b"));
  assert(!JobRunner::IsValidArtifactId(std::string("a\0b", 3)));
  assert(!JobRunner::IsValidArtifactId(std::string(201, 'a')));
}

void TestSuccessfulJobAppendsVersion() {
  Harness h;

  const auto job_id = h.runner->Submit(Request("api_docs", "Expose GET /invoices with paging."));
  const auto job    = h.WaitTerminal(job_id);

  assert(job.status() == JobStatus::JOB_STATUS_COMPLETED);
  assert(job.result_artifact_id() == "api_docs");
  assert(job.result_version() == 1);
  assert(job.progress() == 1.0);

  const auto current = h.store->GetCurrent("api_docs");
  assert(current.has_value());
  assert(current->content() == "# API\nExpose GET /invoices with paging.");
  assert(current->metadata().fields().at("job_id").string_value() == job_id);
  assert(current->metadata().fields().at("generator").string_value() == "template");

  const auto received = h.EventsFor(job_id);
  assert(received.size() >= 3);
  assert(received.front().type() == events::kJobStatus);
  assert(received.front().status() == JobStatus::JOB_STATUS_QUEUED);
  assert(received.back().type() == events::kGenerationComplete);
  assert(received.back().artifact_id() == "api_docs");
  assert(received.back().version() == 1);

  // status never regresses and progress never decreases
  double last_progress = 0.0;
  int    last_status   = 0;
  for (const auto& event : received) {
    assert(static_cast<int>(event.status()) >= last_status);
    last_status = static_cast<int>(event.status());
    if (event.type() == events::kGenerationProgress || event.type() == events::kGenerationComplete) {
      assert(event.progress() >= last_progress);
      last_progress = event.progress();
    }
  }
}

void TestExplicitArtifactIdAccumulatesVersions() {
  Harness h;

  auto request = Request("api_docs", "Version one of the billing docs.");
  request.set_artifact_id("billing_docs");
  const auto first = h.WaitTerminal(h.runner->Submit(request));

  request.set_meeting_notes("Version two of the billing docs.");
  const auto second = h.WaitTerminal(h.runner->Submit(request));

  assert(first.result_version() == 1);
  assert(second.result_version() == 2);
  assert(h.store->ListVersions("billing_docs").size() == 2);
  assert(h.store->GetCurrent("billing_docs")->content() == "# API\nVersion two of the billing docs.");
  assert(!h.store->GetCurrent("api_docs").has_value());
}

void TestGeneratorFailuresAreRecordedOnJob() {
  Harness h;

  const auto refused = h.WaitTerminal(h.runner->Submit(Request("refuses", "anything at all")));
  assert(refused.status() == JobStatus::JOB_STATUS_FAILED);
  assert(refused.error_kind() == ErrorKind::ERROR_KIND_GENERATION_FAILURE);
  assert(refused.error() == "model refused the prompt");

  const auto thrown = h.WaitTerminal(h.runner->Submit(Request("throws", "anything at all")));
  assert(thrown.status() == JobStatus::JOB_STATUS_FAILED);
  assert(thrown.error_kind() == ErrorKind::ERROR_KIND_GENERATION_FAILURE);
  assert(thrown.error() == "generator error: upstream timeout");

  const auto silent = h.WaitTerminal(h.runner->Submit(Request("silent", "anything at all")));
  assert(silent.status() == JobStatus::JOB_STATUS_FAILED);
  assert(silent.error_kind() == ErrorKind::ERROR_KIND_GENERATION_FAILURE);
  assert(silent.error() == "generator produced no content");

  assert(h.store->ListArtifactIds().empty());

  const auto received = h.EventsFor(refused.job_id());
  assert(received.back().type() == events::kGenerationError);
  assert(received.back().error_kind() == ErrorKind::ERROR_KIND_GENERATION_FAILURE);
}

void TestStoreFailureIsRecordedOnJob() {
  Harness h(std::make_shared<ReadOnlyRepository>());

  const auto job = h.WaitTerminal(h.runner->Submit(Request("api_docs", "Notes that will never be stored.")));
  assert(job.status() == JobStatus::JOB_STATUS_FAILED);
  assert(job.error_kind() == ErrorKind::ERROR_KIND_STORE_UNAVAILABLE);
  assert(job.result_version() == 0);
  assert(h.EventsFor(job.job_id()).back().type() == events::kGenerationError);
}

void TestStopDrainsQueuedJobs() {
  JobRunnerOptions options;
  options.worker_threads = 1;
  Harness h(std::make_shared<artifact::db::memory::MemoryRepository>(), options);

  std::vector<std::string> ids;
  for (int i = 0; i < 10; ++i) {
    ids.push_back(h.runner->Submit(Request("api_docs", "Queued job number " + std::to_string(i))));
  }
  h.runner->Stop();
  assert(!h.runner->Accepting());

  for (const auto& id : ids) {
    assert(h.registry->Get(id)->status() == JobStatus::JOB_STATUS_COMPLETED);
  }
  assert(h.store->ListVersions("api_docs").size() == 10);

  bool threw = false;
  try {
    h.runner->Submit(Request("api_docs", "Too late for this runner."));
  } catch (const artifact::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestSubmitRacingStopNeverStrandsJobs() {
  for (int round = 0; round < 20; ++round) {
    JobRunnerOptions options;
    options.worker_threads = 2;
    Harness h(std::make_shared<artifact::db::memory::MemoryRepository>(), options);

    std::atomic<bool>        go{false};
    std::atomic<int>         rejected{0};
    std::vector<std::thread> submitters;
    for (int t = 0; t < 4; ++t) {
      submitters.emplace_back([&, t] {
        while (!go) std::this_thread::yield();
        for (int i = 0; i < 25; ++i) {
          try {
            h.runner->Submit(Request("api_docs", "Racing submitter " + std::to_string(t) + " #" + std::to_string(i)));
          } catch (const artifact::util::InvalidState&) {
            ++rejected;
          }
        }
      });
    }
    go = true;
    h.runner->Stop();
    for (auto& thread : submitters) thread.join();

    // every registered job ran; rejected submits left nothing behind
    const auto counts = h.registry->Counts();
    assert(counts.queued == 0);
    assert(counts.running == 0);
    assert(counts.failed == 0);
    assert(counts.completed + static_cast<uint64_t>(rejected.load()) == 100);
    assert(h.store->ListVersions("api_docs").size() == counts.completed);
  }
}

void TestConcurrentSubmittersGetGaplessVersions() {
  Harness h;

  std::vector<std::thread> threads;
  std::mutex               ids_mutex;
  std::vector<std::string> ids;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < 5; ++i) {
        auto request = Request("api_docs", "Submitter " + std::to_string(t) + " request " + std::to_string(i));
        request.set_artifact_id("shared_docs");
        const auto id = h.runner->Submit(request);
        std::lock_guard lock(ids_mutex);
        ids.push_back(id);
      }
    });
  }
  for (auto& thread : threads) thread.join();

  for (const auto& id : ids) {
    assert(h.WaitTerminal(id).status() == JobStatus::JOB_STATUS_COMPLETED);
  }

  const auto versions = h.store->ListVersions("shared_docs");
  assert(versions.size() == 20);
  for (std::size_t i = 0; i < versions.size(); ++i) {
    assert(versions[i].version() == i + 1);
    assert(versions[i].is_current() == (i + 1 == versions.size()));
  }
}

} // namespace

int main() {
  TestValidationErrors();
  TestArtifactIdRules();
  TestSuccessfulJobAppendsVersion();
  TestExplicitArtifactIdAccumulatesVersions();
  TestGeneratorFailuresAreRecordedOnJob();
  TestStoreFailureIsRecordedOnJob();
  TestStopDrainsQueuedJobs();
  TestSubmitRacingStopNeverStrandsJobs();
  TestConcurrentSubmittersGetGaplessVersions();

  std::cout << "artifact_manager_unit_job_runner: pass\n";
  return 0;
}
