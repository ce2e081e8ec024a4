#ifndef FEDMETA_FEDMETA_CONTROLLER_STORE_FILE_FILE_ARTIFACT_STORE_H_
#define FEDMETA_FEDMETA_CONTROLLER_STORE_FILE_FILE_ARTIFACT_STORE_H_

#include <filesystem>

#include "fedmeta/controller/store/artifact_store.h"

namespace fedmeta::controller {

/**
 * Shared-directory artifact store. A round lives under
 * <root>/<run_id>/<sequence>/<round>/ and holds
 *
 *   local/<participant>.jsonl   one per site
 *   global.jsonl                the coordinator's output
 *   CLOSED                      round-closure marker
 *
 * Blobs are written to a hidden temporary file and hard-linked into place,
 * so a reader sees either nothing or the complete blob, and a second write
 * of the same key fails.
 */
class FileArtifactStore : public ArtifactStore {
  std::filesystem::path m_root;

 public:
  explicit FileArtifactStore(std::filesystem::path root);

  ~FileArtifactStore() = default;

  absl::Status WriteLocal(const RoundKey &key, const std::string &participant,
                          const std::string &blob) override;

  absl::Status WriteGlobal(const RoundKey &key,
                           const std::string &blob) override;

  absl::StatusOr<std::vector<ParticipantBlob>> ListLocal(
      const RoundKey &key) override;

  absl::StatusOr<std::string> ReadGlobal(const RoundKey &key) override;

  absl::Status CloseRound(const RoundKey &key) override;

  bool IsClosed(const RoundKey &key) override;

  inline std::string Name() override { return "FileArtifactStore"; }

 private:
  std::filesystem::path RoundDir(const RoundKey &key) const;

  static absl::Status WriteOnce(const std::filesystem::path &target,
                                const std::string &blob);

  static absl::StatusOr<std::string> ReadFile(
      const std::filesystem::path &path);
};

}  // namespace fedmeta::controller

#endif  // FEDMETA_FEDMETA_CONTROLLER_STORE_FILE_FILE_ARTIFACT_STORE_H_
