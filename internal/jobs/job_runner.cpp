#include "job_runner.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <mutex>
#include <stdexcept>

#include "internal/generation/generator_registry.hpp"
#include "internal/jobs/job_registry.hpp"
#include "internal/jobs/job_state.hpp"
#include "internal/notify/notification_hub.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/versioning/migration_reconciler.hpp"
#include "internal/versioning/version_store.hpp"

namespace artifact::jobs {

using artifact::manager::v1::ErrorKind;
using artifact::manager::v1::GenerationRequest;
using artifact::manager::v1::JobStatus;
using artifact::notify::NotificationHub;
using artifact::observability::IntField;
using artifact::observability::StringField;

namespace {

constexpr std::size_t kMaxArtifactIdLength = 200;

// code points of the notes with surrounding whitespace removed
std::size_t NotesLength(const std::string& notes) {
  auto begin = std::find_if_not(notes.begin(), notes.end(), [](unsigned char c) { return std::isspace(c); });
  auto end   = std::find_if_not(notes.rbegin(), notes.rend(), [](unsigned char c) { return std::isspace(c); }).base();
  if (begin >= end) return 0;
  return static_cast<std::size_t>(std::count_if(begin, end, [](unsigned char c) { return (c & 0xC0) != 0x80; }));
}

artifact::manager::v1::Event StatusEvent(JobStatus status) {
  auto event = NotificationHub::MakeEvent(artifact::notify::events::kJobStatus);
  event.set_status(status);
  event.set_message(StatusName(status));
  return event;
}

// Runs the generator; every failure comes back as util::GenerationFailure.
artifact::generation::GenerationOutput Produce(artifact::generation::Generator& generator, const GenerationRequest& request,
                                               const artifact::generation::ProgressCallback& on_progress) {
  artifact::generation::GenerationOutput output;
  try {
    output = generator.Generate(request, on_progress);
  } catch (const std::exception& e) {
    throw util::GenerationFailure(std::string("generator error: ") + e.what());
  }

  if (!output.ok || output.content.empty()) {
    throw util::GenerationFailure(output.error.empty() ? std::string("generator produced no content") : output.error);
  }
  return output;
}

} // namespace

JobRunner::JobRunner(std::shared_ptr<JobRegistry> registry, std::shared_ptr<artifact::versioning::VersionStore> store,
                     std::shared_ptr<artifact::generation::GeneratorRegistry> generators,
                     std::shared_ptr<artifact::notify::NotificationHub> hub, JobRunnerOptions options)
    : registry_(std::move(registry)),
      store_(std::move(store)),
      generators_(std::move(generators)),
      hub_(std::move(hub)),
      options_(options) {
  if (!registry_ || !store_ || !generators_ || !hub_) {
    throw std::invalid_argument("job runner: registry, store, generators and hub are required");
  }
  if (options_.worker_threads == 0) options_.worker_threads = 1;
}

JobRunner::~JobRunner() {
  Stop();
}

void JobRunner::Start() {
  if (running_.exchange(true)) return;

  workers_.reserve(options_.worker_threads);
  for (uint32_t i = 0; i < options_.worker_threads; ++i) {
    workers_.emplace_back(&JobRunner::Run, this);
  }
  ARTIFACT_LOG_INFO("Job runner started", {IntField("workers", options_.worker_threads)});
}

void JobRunner::Stop() {
  {
    std::lock_guard lock(submit_mu_);
    queue_.Shutdown();
  }
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
  if (running_.exchange(false)) {
    ARTIFACT_LOG_INFO("Job runner stopped");
  }
  workers_.clear();
}

bool JobRunner::Accepting() const {
  return running_ && !queue_.IsShutdown();
}

bool JobRunner::IsValidArtifactId(const std::string& artifact_id) {
  if (artifact_id.empty() || artifact_id.size() > kMaxArtifactIdLength) return false;
  if (artifact_id.front() == '.') return false;
  return artifact_id.find_first_of(std::string("/\\\0", 3)) == std::string::npos;
}

void JobRunner::Validate(const GenerationRequest& request) const {
  if (request.artifact_type().empty()) {
    throw util::ValidationError("artifact_type is required");
  }

  const auto type = generators_->Find(request.artifact_type());
  if (!type) {
    throw util::ValidationError("Invalid artifact_type: " + request.artifact_type());
  }

  if (request.meeting_notes().empty() && request.context_id().empty()) {
    throw util::ValidationError("Either meeting_notes or context_id must be provided");
  }

  if (!request.meeting_notes().empty() && NotesLength(request.meeting_notes()) < type->min_notes_chars) {
    throw util::ValidationError("meeting_notes must be at least " + std::to_string(type->min_notes_chars) + " characters");
  }

  if (request.ByteSizeLong() > options_.max_request_bytes) {
    throw util::ValidationError("request exceeds " + std::to_string(options_.max_request_bytes) + " bytes");
  }

  if (!request.artifact_id().empty() && !IsValidArtifactId(request.artifact_id())) {
    throw util::ValidationError("Invalid artifact_id: " + request.artifact_id());
  }

  // legacy-shaped ids would be folded into their base type by the next migration
  const auto& target = request.artifact_id().empty() ? request.artifact_type() : request.artifact_id();
  if (artifact::versioning::MigrationReconciler::Classify(target)) {
    throw util::ValidationError("artifact_id must not end in a _YYYYMMDD_HHMMSS suffix: " + target);
  }
}

std::string JobRunner::Submit(GenerationRequest request) {
  Validate(request);
  if (request.artifact_id().empty()) {
    request.set_artifact_id(request.artifact_type());
  }

  std::string job_id;
  {
    // Stop() shuts the queue under the same lock, so a registered job is always queued
    std::lock_guard lock(submit_mu_);
    if (!Accepting()) {
      throw util::InvalidState("job runner is not accepting work");
    }

    job_id = registry_->Create(request);
    hub_->PublishJobEvent(job_id, StatusEvent(JobStatus::JOB_STATUS_QUEUED));
    if (!queue_.Enqueue(job_id)) {
      registry_->MarkRunning(job_id);
      Fail(job_id, request.artifact_type(), ErrorKind::ERROR_KIND_INTERNAL, "job runner stopped before the job was queued");
      return job_id;
    }
  }
  artifact::observability::Metrics::Instance().SetJobQueueDepth(queue_.Depth());

  ARTIFACT_LOG_INFO("Job queued", {StringField("job_id", job_id), StringField("artifact_type", request.artifact_type()),
                                   StringField("artifact_id", request.artifact_id())});
  return job_id;
}

void JobRunner::Run() {
  while (true) {
    auto job_id = queue_.Dequeue();
    if (!job_id) break;

    artifact::observability::Metrics::Instance().SetJobQueueDepth(queue_.Depth());

    try {
      Execute(*job_id);
    } catch (const std::exception& e) {
      ARTIFACT_LOG_ERROR("Job execution failed", {StringField("job_id", *job_id), StringField("error", e.what())});
    }
  }
}

void JobRunner::Fail(const std::string& job_id, const std::string& artifact_type, ErrorKind kind, const std::string& error) {
  try {
    registry_->MarkFailed(job_id, kind, error);
  } catch (const util::InvalidTransition& e) {
    ARTIFACT_LOG_ERROR("Job could not be marked failed", {StringField("job_id", job_id), StringField("error", e.what())});
    return;
  }

  artifact::observability::Metrics::Instance().RecordJobOutcome(artifact_type, StatusName(JobStatus::JOB_STATUS_FAILED));
  ARTIFACT_LOG_WARN("Job failed", {StringField("job_id", job_id), StringField("artifact_type", artifact_type), StringField("error", error)});

  auto event = NotificationHub::MakeEvent(artifact::notify::events::kGenerationError);
  event.set_status(JobStatus::JOB_STATUS_FAILED);
  event.set_error(error);
  event.set_error_kind(kind);
  hub_->PublishJobEvent(job_id, event);
}

void JobRunner::Execute(const std::string& job_id) {
  const auto job = registry_->Get(job_id);
  if (!job) {
    ARTIFACT_LOG_ERROR("Dequeued unknown job", {StringField("job_id", job_id)});
    return;
  }

  const auto& request       = job->request();
  const auto& artifact_type = job->artifact_type();
  const auto  started       = std::chrono::steady_clock::now();

  artifact::observability::SpanScope span("JobRunner.Execute");
  span.SetAttribute("job.id", job_id);
  span.SetAttribute("artifact.type", artifact_type);

  registry_->MarkRunning(job_id);
  hub_->PublishJobEvent(job_id, StatusEvent(JobStatus::JOB_STATUS_RUNNING));

  auto record_duration = [&] {
    const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
    artifact::observability::Metrics::Instance().ObserveJobDurationMs(artifact_type, elapsed);
  };

  const auto type = generators_->Find(artifact_type);
  if (!type) {
    Fail(job_id, artifact_type, ErrorKind::ERROR_KIND_GENERATION_FAILURE, "no generator registered for " + artifact_type);
    record_duration();
    return;
  }

  auto on_progress = [&](double fraction, const std::string& message) {
    try {
      registry_->UpdateProgress(job_id, fraction, message);
    } catch (const util::InvalidTransition& e) {
      ARTIFACT_LOG_WARN("Progress after job left running", {StringField("job_id", job_id), StringField("error", e.what())});
      return;
    }
    auto event = NotificationHub::MakeEvent(artifact::notify::events::kGenerationProgress);
    event.set_status(JobStatus::JOB_STATUS_RUNNING);
    event.set_progress(std::clamp(fraction, 0.0, 1.0));
    event.set_message(message);
    hub_->PublishJobEvent(job_id, event);
  };

  artifact::generation::GenerationOutput output;
  try {
    output = Produce(*type->generator, request, on_progress);
  } catch (const util::GenerationFailure& e) {
    span.RecordException(e.what());
    Fail(job_id, artifact_type, ErrorKind::ERROR_KIND_GENERATION_FAILURE, e.what());
    record_duration();
    return;
  }

  auto metadata = output.metadata;
  (*metadata.mutable_fields())["job_id"].set_string_value(job_id);

  const auto artifact_id = request.artifact_id().empty() ? artifact_type : request.artifact_id();

  artifact::manager::v1::ArtifactVersion version;
  try {
    version = store_->Append(artifact_id, artifact_type, output.content, metadata);
  } catch (const util::StoreUnavailable& e) {
    span.RecordException(e.what());
    Fail(job_id, artifact_type, ErrorKind::ERROR_KIND_STORE_UNAVAILABLE, e.what());
    record_duration();
    return;
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    Fail(job_id, artifact_type, ErrorKind::ERROR_KIND_INTERNAL, e.what());
    record_duration();
    return;
  }

  registry_->MarkCompleted(job_id, version.artifact_id(), version.version());
  record_duration();
  artifact::observability::Metrics::Instance().RecordJobOutcome(artifact_type, StatusName(JobStatus::JOB_STATUS_COMPLETED));

  auto event = NotificationHub::MakeEvent(artifact::notify::events::kGenerationComplete);
  event.set_status(JobStatus::JOB_STATUS_COMPLETED);
  event.set_progress(1.0);
  event.set_artifact_id(version.artifact_id());
  event.set_version(version.version());
  hub_->PublishJobEvent(job_id, event);

  ARTIFACT_LOG_INFO("Job completed", {StringField("job_id", job_id), StringField("artifact_id", version.artifact_id()),
                                      IntField("version", version.version())});
}

} // namespace artifact::jobs
