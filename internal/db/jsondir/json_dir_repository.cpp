#include "json_dir_repository.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "json_dir_tx.hpp"
#include "version_file.hpp"

namespace artifact::db::jsondir {

namespace fs = std::filesystem;

namespace {

constexpr const char* kExtension = ".json";

JsonDirTransaction& TX(db::Transaction& t) {
  return static_cast<JsonDirTransaction&>(t);
}

// write, fsync and close; false with errno set on failure
bool WriteDurably(const fs::path& path, const std::string& text) {
  const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd < 0) return false;

  const char* data = text.data();
  std::size_t left = text.size();
  while (left > 0) {
    const ssize_t n = ::write(fd, data, left);
    if (n < 0) {
      if (errno == EINTR) continue;
      const int saved = errno;
      ::close(fd);
      errno = saved;
      return false;
    }
    data += n;
    left -= static_cast<std::size_t>(n);
  }

  if (::fsync(fd) != 0) {
    const int saved = errno;
    ::close(fd);
    errno = saved;
    return false;
  }
  return ::close(fd) == 0;
}

// makes a rename inside dir durable; filesystems that cannot sync a directory (EINVAL) are accepted
bool SyncDirectory(const fs::path& dir) {
  const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) return false;
  const bool synced = ::fsync(fd) == 0 || errno == EINVAL;
  const int  saved  = errno;
  ::close(fd);
  errno = saved;
  return synced;
}

} // namespace

JsonDirRepository::JsonDirRepository(fs::path root) : root_(std::move(root)) {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec) {
    throw std::runtime_error("cannot create version directory '" + root_.string() + "': " + ec.message());
  }
}

std::unique_ptr<db::Transaction> JsonDirRepository::Begin() {
  return std::make_unique<JsonDirTransaction>(*this);
}

bool JsonDirRepository::IsStorableId(const std::string& artifact_id) {
  if (artifact_id.empty() || artifact_id.front() == '.') return false;
  return std::none_of(artifact_id.begin(), artifact_id.end(), [](char c) { return c == '/' || c == '\\' || c == '\0'; });
}

fs::path JsonDirRepository::PathFor(const std::string& artifact_id) const {
  return root_ / (artifact_id + kExtension);
}

std::optional<std::vector<model::VersionRecord>> JsonDirRepository::ReadFile(const std::string& artifact_id) const {
  if (!IsStorableId(artifact_id)) return std::nullopt;

  const auto path = PathFor(artifact_id);
  std::error_code ec;
  if (!fs::exists(path, ec)) return std::nullopt;

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open version file '" + path.string() + "'");
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return DecodeVersionFile(artifact_id, buffer.str());
}

void JsonDirRepository::WriteFile(const std::string& artifact_id, const std::vector<model::VersionRecord>& records) const {
  const auto path = PathFor(artifact_id);
  auto       tmp  = path;
  tmp += ".tmp";

  // the temp file is on disk before it replaces the stable file
  const auto text = EncodeVersionFile(records);
  if (!WriteDurably(tmp, text)) {
    const std::string reason = std::strerror(errno);
    std::error_code   ec;
    fs::remove(tmp, ec);
    throw std::runtime_error("cannot write version file '" + tmp.string() + "': " + reason);
  }

  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) {
    const auto reason = ec.message();
    fs::remove(tmp, ec);
    throw std::runtime_error("cannot publish version file '" + path.string() + "': " + reason);
  }
  if (!SyncDirectory(root_)) {
    throw std::runtime_error("cannot sync version directory '" + root_.string() + "': " + std::strerror(errno));
  }
}

void JsonDirRepository::RemoveFile(const std::string& artifact_id) const {
  std::error_code ec;
  fs::remove(PathFor(artifact_id), ec);
  if (ec) {
    throw std::runtime_error("cannot remove version file for '" + artifact_id + "': " + ec.message());
  }
}

std::vector<std::string> JsonDirRepository::ListFileIds() const {
  std::vector<std::string> ids;
  std::error_code          ec;
  for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file() || it->path().extension() != kExtension) continue;
    auto id = it->path().stem().string();
    if (IsStorableId(id)) ids.push_back(std::move(id));
  }
  if (ec) {
    throw std::runtime_error("cannot list version directory '" + root_.string() + "': " + ec.message());
  }
  return ids;
}

// ------------------------------------------------------------------
// Versions
// ------------------------------------------------------------------

Result JsonDirRepository::InsertVersion(Transaction& t, const model::VersionRecord& r) {
  if (!IsStorableId(r.artifact_id)) {
    return Result::Err(ErrorCode::Unsupported, "artifact id '" + r.artifact_id + "' cannot be stored as a file name");
  }

  auto& history = TX(t).Mutable(r.artifact_id);
  if (std::any_of(history.begin(), history.end(), [&](const model::VersionRecord& existing) { return existing.version == r.version; })) {
    return Result::Err(ErrorCode::AlreadyExists, "version " + std::to_string(r.version) + " of '" + r.artifact_id + "' already exists");
  }

  auto pos = std::find_if(history.begin(), history.end(), [&](const model::VersionRecord& existing) { return existing.version > r.version; });
  history.insert(pos, r);
  return Result::Ok();
}

Result JsonDirRepository::ClearCurrent(Transaction& t, const std::string& artifact_id) {
  if (!IsStorableId(artifact_id)) return Result::Ok();
  for (auto& record : TX(t).Mutable(artifact_id)) {
    record.is_current = false;
  }
  return Result::Ok();
}

std::optional<model::VersionRecord> JsonDirRepository::GetVersion(Transaction& t, const std::string& artifact_id, uint32_t version) {
  for (const auto& record : TX(t).View(artifact_id)) {
    if (record.version == version) return record;
  }
  return std::nullopt;
}

std::optional<model::VersionRecord> JsonDirRepository::GetCurrentVersion(Transaction& t, const std::string& artifact_id) {
  for (const auto& record : TX(t).View(artifact_id)) {
    if (record.is_current) return record;
  }
  return std::nullopt;
}

std::vector<model::VersionRecord> JsonDirRepository::ListVersions(Transaction& t, const std::string& artifact_id) {
  return TX(t).View(artifact_id);
}

// ------------------------------------------------------------------
// Artifacts
// ------------------------------------------------------------------

std::vector<model::ArtifactHead> JsonDirRepository::ListHeads(Transaction& t) {
  auto& tx = TX(t);

  std::vector<model::ArtifactHead> heads;
  for (const auto& id : tx.ArtifactIds()) {
    const auto& history = tx.View(id);
    if (history.empty()) continue;

    model::ArtifactHead head;
    head.artifact_id   = id;
    head.version_count = history.size();
    for (const auto& record : history) {
      head.latest_version = std::max(head.latest_version, record.version);
    }
    heads.push_back(std::move(head));
  }
  return heads;
}

Result JsonDirRepository::DeleteArtifact(Transaction& t, const std::string& artifact_id) {
  if (!IsStorableId(artifact_id)) return Result::Ok();
  TX(t).Mutable(artifact_id).clear();
  return Result::Ok();
}

} // namespace artifact::db::jsondir
