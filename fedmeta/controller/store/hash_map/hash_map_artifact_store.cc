#include "fedmeta/controller/store/hash_map/hash_map_artifact_store.h"

#include <glog/logging.h>

#include "absl/strings/str_cat.h"

namespace fedmeta::controller {

HashMapArtifactStore::HashMapArtifactStore()
    : m_store_mutex(), m_local_blobs(), m_global_blobs(), m_closed_rounds() {
  LOG(INFO) << "Using InMemory Artifact Store.";
}

absl::Status HashMapArtifactStore::WriteLocal(const RoundKey &key,
                                              const std::string &participant,
                                              const std::string &blob) {
  std::lock_guard<std::mutex> lock(m_store_mutex);
  auto &round_blobs = m_local_blobs[key.ToString()];
  if (!round_blobs.emplace(participant, blob).second) {
    return absl::AlreadyExistsError(absl::StrCat(
        "Participant ", participant, " already published ", key.ToString()));
  }
  return absl::OkStatus();
}

absl::Status HashMapArtifactStore::WriteGlobal(const RoundKey &key,
                                               const std::string &blob) {
  std::lock_guard<std::mutex> lock(m_store_mutex);
  if (!m_global_blobs.emplace(key.ToString(), blob).second) {
    return absl::AlreadyExistsError(
        absl::StrCat("Global payload already published for ", key.ToString()));
  }
  return absl::OkStatus();
}

absl::StatusOr<std::vector<ParticipantBlob>> HashMapArtifactStore::ListLocal(
    const RoundKey &key) {
  std::lock_guard<std::mutex> lock(m_store_mutex);
  std::vector<ParticipantBlob> blobs;
  auto it = m_local_blobs.find(key.ToString());
  if (it == m_local_blobs.end()) return blobs;
  // std::map keeps the participants ordered.
  for (const auto &[participant, blob] : it->second) {
    blobs.emplace_back(participant, blob);
  }
  return blobs;
}

absl::StatusOr<std::string> HashMapArtifactStore::ReadGlobal(
    const RoundKey &key) {
  std::lock_guard<std::mutex> lock(m_store_mutex);
  auto it = m_global_blobs.find(key.ToString());
  if (it == m_global_blobs.end()) {
    return absl::NotFoundError(
        absl::StrCat("No global payload for ", key.ToString()));
  }
  return it->second;
}

absl::Status HashMapArtifactStore::CloseRound(const RoundKey &key) {
  std::lock_guard<std::mutex> lock(m_store_mutex);
  m_closed_rounds.insert(key.ToString());
  return absl::OkStatus();
}

bool HashMapArtifactStore::IsClosed(const RoundKey &key) {
  std::lock_guard<std::mutex> lock(m_store_mutex);
  return m_closed_rounds.contains(key.ToString());
}

}  // namespace fedmeta::controller
