#include <google/protobuf/util/json_util.h>
#include <grpcpp/grpcpp.h>

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "client/cpp/artifact_client.h"

using namespace artifact::manager::v1;
using artifact::manager::client::ArtifactClient;
using artifact::manager::client::RetryPolicy;

static void Usage() {
  std::cout << "Usage:\n"
            << "  artifactctl <addr> generate <artifact_type> [--id <artifact_id>] [--notes <text> | --notes-file <path>]\n"
            << "                              [--context <context_id>] [--wait]\n"
            << "  artifactctl <addr> job <job_id>\n"
            << "  artifactctl <addr> jobs [limit]\n"
            << "  artifactctl <addr> wait <job_id> [timeout_s]\n"
            << "  artifactctl <addr> artifact <artifact_id>\n"
            << "  artifactctl <addr> versions <artifact_id>\n"
            << "  artifactctl <addr> version <artifact_id> <version>\n"
            << "  artifactctl <addr> restore <artifact_id> <version>\n"
            << "  artifactctl <addr> compare <artifact_id> <version_a> <version_b>\n"
            << "  artifactctl <addr> health\n"
            << "  artifactctl <addr> stats\n"
            << "  artifactctl <addr> migrate [--preview]\n"
            << "  artifactctl <addr> watch <channel>\n";
}

static void Print(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << "failed to render response: " << status.message() << "\n";
    return;
  }
  std::cout << json;
}

static int Fail(const ::grpc::Status& status) {
  std::cerr << status.error_message() << " (code " << status.error_code() << ")\n";
  return 2;
}

static bool ReadFile(const std::string& path, std::string* out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream buffer;
  buffer << in.rdbuf();
  *out = buffer.str();
  return true;
}

static uint32_t ParseVersion(const std::string& text) {
  return static_cast<uint32_t>(std::stoul(text));
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  ArtifactClient client(::grpc::CreateChannel(addr, ::grpc::InsecureChannelCredentials()));

  try {
    // ------------------------------------------------------------

    if (cmd == "generate") {
      if (argc < 4) {
        Usage();
        return 1;
      }

      GenerationRequest request;
      request.set_artifact_type(argv[3]);
      bool wait = false;

      for (int i = 4; i < argc; ++i) {
        const std::string flag = argv[i];
        if (flag == "--wait") {
          wait = true;
          continue;
        }
        if (i + 1 >= argc) {
          std::cerr << "missing value for " << flag << "\n";
          return 1;
        }
        const std::string value = argv[++i];
        if (flag == "--id") {
          request.set_artifact_id(value);
        } else if (flag == "--notes") {
          request.set_meeting_notes(value);
        } else if (flag == "--notes-file") {
          std::string notes;
          if (!ReadFile(value, &notes)) {
            std::cerr << "cannot read " << value << "\n";
            return 1;
          }
          request.set_meeting_notes(notes);
        } else if (flag == "--context") {
          request.set_context_id(value);
        } else {
          std::cerr << "unknown flag: " << flag << "\n";
          return 1;
        }
      }

      std::string job_id;
      auto        status = client.Generate(request, &job_id);
      if (!status.ok()) return Fail(status);
      std::cout << "job_id=" << job_id << "\n";

      if (wait) {
        GenerationJob job;
        status = client.WaitForJob(job_id, RetryPolicy{}, &job);
        if (!status.ok()) return Fail(status);
        Print(job);
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "job") {
      if (argc < 4) return 1;

      GenerationJob job;
      auto          status = client.GetJob(argv[3], &job);
      if (!status.ok()) return Fail(status);
      Print(job);
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "jobs") {
      const uint32_t limit = argc >= 4 ? static_cast<uint32_t>(std::stoul(argv[3])) : 0;

      std::vector<GenerationJob> jobs;
      auto                       status = client.ListJobs(limit, &jobs);
      if (!status.ok()) return Fail(status);
      for (const auto& job : jobs) {
        std::cout << job.job_id() << " " << job.artifact_type() << " " << JobStatus_Name(job.status()) << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "wait") {
      if (argc < 4) return 1;

      RetryPolicy policy;
      if (argc >= 5) {
        policy.deadline = std::chrono::seconds(std::stoul(argv[4]));
      }

      GenerationJob job;
      auto          status = client.WaitForJob(argv[3], policy, &job);
      if (!status.ok()) return Fail(status);
      Print(job);
      return job.status() == JOB_STATUS_COMPLETED ? 0 : 3;
    }

    // ------------------------------------------------------------

    if (cmd == "artifact") {
      if (argc < 4) return 1;

      ArtifactVersion artifact;
      auto            status = client.GetArtifact(argv[3], &artifact);
      if (!status.ok()) return Fail(status);
      Print(artifact);
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "versions") {
      if (argc < 4) return 1;

      std::vector<ArtifactVersion> versions;
      auto                         status = client.ListVersions(argv[3], &versions);
      if (!status.ok()) return Fail(status);
      for (const auto& version : versions) {
        std::cout << "v" << version.version() << (version.is_current() ? " current " : " ") << version.created_at().seconds() << " "
                  << version.content().size() << " bytes\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "version") {
      if (argc < 5) return 1;

      ArtifactVersion artifact;
      auto            status = client.GetVersion(argv[3], ParseVersion(argv[4]), &artifact);
      if (!status.ok()) return Fail(status);
      Print(artifact);
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "restore") {
      if (argc < 5) return 1;

      ArtifactVersion artifact;
      auto            status = client.RestoreVersion(argv[3], ParseVersion(argv[4]), &artifact);
      if (!status.ok()) return Fail(status);
      std::cout << "restored as v" << artifact.version() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "compare") {
      if (argc < 6) return 1;

      VersionComparison comparison;
      auto              status = client.CompareVersions(argv[3], ParseVersion(argv[4]), ParseVersion(argv[5]), &comparison);
      if (!status.ok()) return Fail(status);
      Print(comparison);
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "health") {
      HealthResponse resp;
      auto           status = client.Health(&resp);
      if (!status.ok()) return Fail(status);
      std::cout << "status=" << resp.status() << " ready=" << (resp.ready() ? "true" : "false") << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "stats") {
      StatsResponse resp;
      auto          status = client.Stats(&resp);
      if (!status.ok()) return Fail(status);
      Print(resp);
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "migrate") {
      if (argc >= 4 && std::string(argv[3]) == "--preview") {
        MigrationPreviewResponse resp;
        auto                     status = client.MigrationPreview(&resp);
        if (!status.ok()) return Fail(status);
        Print(resp);
        return 0;
      }

      MigrateResponse resp;
      auto            status = client.Migrate(&resp);
      if (!status.ok()) return Fail(status);
      Print(resp);
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "watch") {
      const std::string channel = argc >= 4 ? argv[3] : "default";

      ::grpc::ClientContext ctx;
      auto                  stream = client.Connect(channel, &ctx);

      Event event;
      while (stream->Read(&event)) {
        std::cout << event.type() << " job=" << event.job_id() << " status=" << JobStatus_Name(event.status())
                  << " progress=" << event.progress();
        if (!event.message().empty()) std::cout << " message=\"" << event.message() << "\"";
        if (!event.artifact_id().empty()) std::cout << " artifact=" << event.artifact_id() << " v" << event.version();
        if (!event.error().empty()) std::cout << " error=\"" << event.error() << "\"";
        std::cout << std::endl;
      }
      auto status = stream->Finish();
      if (!status.ok()) return Fail(status);
      return 0;
    }
  } catch (const std::exception& e) {
    // std::stoul on a malformed number
    std::cerr << "invalid argument: " << e.what() << "\n";
    return 1;
  }

  Usage();
  return 1;
}
