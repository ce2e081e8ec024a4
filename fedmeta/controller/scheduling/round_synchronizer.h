#ifndef FEDMETA_FEDMETA_CONTROLLER_SCHEDULING_ROUND_SYNCHRONIZER_H_
#define FEDMETA_FEDMETA_CONTROLLER_SCHEDULING_ROUND_SYNCHRONIZER_H_

#include <atomic>
#include <vector>

#include "absl/status/statusor.h"
#include "fedmeta/controller/core/types.h"
#include "fedmeta/controller/store/artifact_store.h"

namespace fedmeta::controller {

/**
 * Decides when the coordinator may aggregate a round.
 *
 * A round is ready once every expected participant has published, or once
 * the round has been closed with at least min_quorum payloads. Until then
 * Poll() reports kUnavailable. AwaitRound() keeps polling until the round
 * timeout and then settles for a quorum.
 */
class RoundSynchronizer {
 public:
  RoundSynchronizer(ArtifactStore *store, const SyncParams &params);

  absl::StatusOr<std::vector<ParticipantBlob>> Poll(const RoundKey &key);

  absl::StatusOr<std::vector<ParticipantBlob>> AwaitRound(const RoundKey &key);

  // Safe to call from another thread while AwaitRound() is blocked.
  void Cancel() { cancelled_ = true; }

  bool IsCancelled() const { return cancelled_; }

 private:
  absl::StatusOr<std::vector<ParticipantBlob>> SettleAtDeadline(
      const RoundKey &key);

  ArtifactStore *store_;
  SyncParams params_;
  std::atomic<bool> cancelled_;
};

}  // namespace fedmeta::controller

#endif  // FEDMETA_FEDMETA_CONTROLLER_SCHEDULING_ROUND_SYNCHRONIZER_H_
