#ifndef FEDMETA_FEDMETA_CONTROLLER_CORE_ROUND_LIFECYCLE_H_
#define FEDMETA_FEDMETA_CONTROLLER_CORE_ROUND_LIFECYCLE_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "fedmeta/controller/core/controller_utils.h"
#include "fedmeta/controller/core/types.h"
#include "fedmeta/controller/data/dataset.h"
#include "fedmeta/controller/store/artifact_store.h"

namespace fedmeta::controller {

// Below this many records a site still publishes, but with a warning.
constexpr int kMinSampleSize = 30;

/**
 * One participant's pass through one round:
 *
 *   Initial -> DataReady -> Validated -> Trained -> Published
 *
 * Any stage failure moves the lifecycle to Failed and is returned as a
 * status; nothing escapes a stage boundary as an exception. A stage called
 * out of order returns kFailedPrecondition and leaves the state untouched.
 * The local payload becomes visible to others only at the final, atomic
 * store write.
 */
class RoundLifecycle {
 public:
  RoundLifecycle(RoundKey key, std::string participant, ModelTask task,
                 DatasetSource *source, ArtifactStore *store);

  virtual ~RoundLifecycle() = default;

  // Loads and splits the local dataset. For rounds after the first, also
  // picks up the previous round's global payload if it is already there.
  absl::Status PrepareData();

  // Makes sure every artifact the fit needs is present. Rounds after the
  // first require the previous round's global payload.
  absl::Status Validate();

  // Fits the local model and publishes its payload under this round's key.
  absl::Status Training();

  // All three stages in order, stopping at the first failure.
  absl::Status Run();

  // Gives up on the round. Has no effect once the payload is published.
  void Abandon();

  RoundState state() const { return state_; }

  const absl::Status &status() const { return status_; }

  const RoundKey &key() const { return key_; }

  const ModelTask &task() const { return task_; }

 protected:
  // Runs the model task's fit and returns the local payload. May throw.
  virtual absl::StatusOr<std::string> Fit();

 private:
  absl::Status ExpectState(RoundState expected, const char *stage) const;

  absl::Status Fail(absl::Status status, const char *stage);

  void Transition(RoundState next);

  // NotFound if the previous round has no global payload yet.
  absl::Status LoadPriorGlobal();

  RoundKey key_;
  std::string participant_;
  ModelTask task_;
  DatasetSource *source_;
  ArtifactStore *store_;

  RoundState state_ = RoundState::kInitial;
  absl::Status status_;
  bool has_prior_global_ = false;
};

}  // namespace fedmeta::controller

#endif  // FEDMETA_FEDMETA_CONTROLLER_CORE_ROUND_LIFECYCLE_H_
