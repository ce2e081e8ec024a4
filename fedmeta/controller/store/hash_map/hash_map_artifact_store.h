#ifndef FEDMETA_FEDMETA_CONTROLLER_STORE_HASH_MAP_HASH_MAP_ARTIFACT_STORE_H_
#define FEDMETA_FEDMETA_CONTROLLER_STORE_HASH_MAP_HASH_MAP_ARTIFACT_STORE_H_

#include <map>
#include <mutex>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "fedmeta/controller/store/artifact_store.h"

namespace fedmeta::controller {

class HashMapArtifactStore : public ArtifactStore {
  std::mutex m_store_mutex;

  // round key -> participant -> blob
  absl::flat_hash_map<std::string, std::map<std::string, std::string>>
      m_local_blobs;
  absl::flat_hash_map<std::string, std::string> m_global_blobs;
  absl::flat_hash_set<std::string> m_closed_rounds;

 public:
  HashMapArtifactStore();

  ~HashMapArtifactStore() = default;

  absl::Status WriteLocal(const RoundKey &key, const std::string &participant,
                          const std::string &blob) override;

  absl::Status WriteGlobal(const RoundKey &key,
                           const std::string &blob) override;

  absl::StatusOr<std::vector<ParticipantBlob>> ListLocal(
      const RoundKey &key) override;

  absl::StatusOr<std::string> ReadGlobal(const RoundKey &key) override;

  absl::Status CloseRound(const RoundKey &key) override;

  bool IsClosed(const RoundKey &key) override;

  inline std::string Name() override { return "HashMapArtifactStore"; }
};

}  // namespace fedmeta::controller

#endif  // FEDMETA_FEDMETA_CONTROLLER_STORE_HASH_MAP_HASH_MAP_ARTIFACT_STORE_H_
