#ifndef FEDMETA_FEDMETA_CONTROLLER_STORE_ARTIFACT_STORE_H_
#define FEDMETA_FEDMETA_CONTROLLER_STORE_ARTIFACT_STORE_H_

#include <string>
#include <utility>
#include <vector>

#include "absl/status/statusor.h"

namespace fedmeta::controller {

// Addresses one step of a run's task sequence.
struct RoundKey {
  std::string run_id;
  int sequence = 1;
  int round = 1;

  bool IsFirstRound() const { return round <= 1; }

  // The previous round of the same task. Only valid if !IsFirstRound().
  RoundKey Previous() const { return {run_id, sequence, round - 1}; }

  std::string ToString() const;

  bool operator==(const RoundKey &other) const {
    return run_id == other.run_id && sequence == other.sequence &&
           round == other.round;
  }
};

// A participant's blob as returned by a listing.
typedef std::pair<std::string, std::string> ParticipantBlob;

/**
 * Keyed, write-once blob storage shared by the sites and the coordinator.
 *
 * Local payloads are keyed by (round, participant), the global payload by
 * round alone. A write is all-or-nothing: readers never observe a partially
 * written blob. Writing an existing key fails with AlreadyExists.
 */
class ArtifactStore {
 public:
  virtual ~ArtifactStore() = default;

  virtual absl::Status WriteLocal(const RoundKey &key,
                                  const std::string &participant,
                                  const std::string &blob) = 0;

  virtual absl::Status WriteGlobal(const RoundKey &key,
                                   const std::string &blob) = 0;

  // Every local blob published under the round, ordered by participant.
  virtual absl::StatusOr<std::vector<ParticipantBlob>> ListLocal(
      const RoundKey &key) = 0;

  // NotFound if the coordinator has not published the round yet.
  virtual absl::StatusOr<std::string> ReadGlobal(const RoundKey &key) = 0;

  // Round-closure signal: no further local payloads are expected.
  virtual absl::Status CloseRound(const RoundKey &key) = 0;

  virtual bool IsClosed(const RoundKey &key) = 0;

  virtual std::string Name() = 0;
};

}  // namespace fedmeta::controller

#endif  // FEDMETA_FEDMETA_CONTROLLER_STORE_ARTIFACT_STORE_H_
