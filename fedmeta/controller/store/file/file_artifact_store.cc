#include "fedmeta/controller/store/file/file_artifact_store.h"

#include <glog/logging.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>
#include <thread>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"

namespace fedmeta::controller {

namespace fs = std::filesystem;

namespace {

constexpr char kLocalDir[] = "local";
constexpr char kGlobalFile[] = "global.jsonl";
constexpr char kClosedMarker[] = "CLOSED";
constexpr char kBlobSuffix[] = ".jsonl";

absl::Status ValidateParticipant(const std::string &participant) {
  if (participant.empty() || absl::StartsWith(participant, ".") ||
      participant.find('/') != std::string::npos ||
      participant.find('\\') != std::string::npos) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid participant name: '", participant, "'"));
  }
  return absl::OkStatus();
}

std::string TempName(const fs::path &target) {
  std::ostringstream thread_id;
  thread_id << std::this_thread::get_id();
  return absl::StrCat(".", target.filename().string(), ".",
                      absl::ToUnixNanos(absl::Now()), ".", thread_id.str(),
                      ".tmp");
}

}  // namespace

FileArtifactStore::FileArtifactStore(fs::path root) : m_root(std::move(root)) {
  LOG(INFO) << "Using File Artifact Store rooted at " << m_root;
}

fs::path FileArtifactStore::RoundDir(const RoundKey &key) const {
  return m_root / key.run_id / std::to_string(key.sequence) /
         std::to_string(key.round);
}

absl::Status FileArtifactStore::WriteOnce(const fs::path &target,
                                          const std::string &blob) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) {
    return absl::UnavailableError(absl::StrCat(
        "Cannot create ", target.parent_path().string(), ": ", ec.message()));
  }

  fs::path temp = target.parent_path() / TempName(target);
  {
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out) {
      return absl::UnavailableError(
          absl::StrCat("Cannot open ", temp.string(), " for writing."));
    }
    out << blob;
    out.flush();
    if (!out) {
      out.close();
      fs::remove(temp, ec);
      return absl::UnavailableError(
          absl::StrCat("Failed writing ", temp.string()));
    }
  }

  // link(2) refuses an existing target, which gives write-once semantics.
  fs::create_hard_link(temp, target, ec);
  std::error_code cleanup_ec;
  fs::remove(temp, cleanup_ec);
  if (ec) {
    if (ec == std::errc::file_exists) {
      return absl::AlreadyExistsError(
          absl::StrCat(target.string(), " already exists."));
    }
    return absl::UnavailableError(absl::StrCat(
        "Cannot publish ", target.string(), ": ", ec.message()));
  }
  return absl::OkStatus();
}

absl::StatusOr<std::string> FileArtifactStore::ReadFile(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return absl::NotFoundError(absl::StrCat(path.string(), " not found."));
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

absl::Status FileArtifactStore::WriteLocal(const RoundKey &key,
                                           const std::string &participant,
                                           const std::string &blob) {
  auto status = ValidateParticipant(participant);
  if (!status.ok()) return status;
  return WriteOnce(
      RoundDir(key) / kLocalDir / absl::StrCat(participant, kBlobSuffix),
      blob);
}

absl::Status FileArtifactStore::WriteGlobal(const RoundKey &key,
                                            const std::string &blob) {
  return WriteOnce(RoundDir(key) / kGlobalFile, blob);
}

absl::StatusOr<std::vector<ParticipantBlob>> FileArtifactStore::ListLocal(
    const RoundKey &key) {
  std::vector<ParticipantBlob> blobs;
  fs::path local_dir = RoundDir(key) / kLocalDir;
  std::error_code ec;
  if (!fs::is_directory(local_dir, ec)) return blobs;

  std::vector<fs::path> files;
  for (fs::directory_iterator it(local_dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    const auto name = it->path().filename().string();
    // Hidden files are in-flight temporaries.
    if (absl::StartsWith(name, ".") || !absl::EndsWith(name, kBlobSuffix)) {
      continue;
    }
    files.push_back(it->path());
  }
  if (ec) {
    return absl::UnavailableError(
        absl::StrCat("Cannot list ", local_dir.string(), ": ", ec.message()));
  }
  std::sort(files.begin(), files.end());

  for (const auto &file : files) {
    auto blob = ReadFile(file);
    if (!blob.ok()) return blob.status();
    blobs.emplace_back(file.stem().string(), *std::move(blob));
  }
  return blobs;
}

absl::StatusOr<std::string> FileArtifactStore::ReadGlobal(const RoundKey &key) {
  auto blob = ReadFile(RoundDir(key) / kGlobalFile);
  if (!blob.ok()) {
    return absl::NotFoundError(
        absl::StrCat("No global payload for ", key.ToString()));
  }
  return blob;
}

absl::Status FileArtifactStore::CloseRound(const RoundKey &key) {
  auto status = WriteOnce(RoundDir(key) / kClosedMarker, "");
  if (absl::IsAlreadyExists(status)) return absl::OkStatus();
  return status;
}

bool FileArtifactStore::IsClosed(const RoundKey &key) {
  std::error_code ec;
  return fs::exists(RoundDir(key) / kClosedMarker, ec);
}

}  // namespace fedmeta::controller
