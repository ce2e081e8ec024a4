#ifndef FEDMETA_FEDMETA_CONTROLLER_CORE_COORDINATOR_H_
#define FEDMETA_FEDMETA_CONTROLLER_CORE_COORDINATOR_H_

#include "absl/status/status.h"
#include "fedmeta/controller/core/controller_utils.h"
#include "fedmeta/controller/core/types.h"
#include "fedmeta/controller/scheduling/round_synchronizer.h"
#include "fedmeta/controller/store/artifact_store.h"

namespace fedmeta::controller {

// Aggregates the local payloads of a round into its global payload.
class Coordinator {
  ModelTask task_;
  ArtifactStore *store_;
  RoundSynchronizer synchronizer_;

 public:
  Coordinator(ModelTask task, ArtifactStore *store,
              const SyncParams &sync_params);

  ~Coordinator() = default;

  // Waits for the round to be ready, aggregates and publishes the global
  // payload. Nothing is published on failure, in particular when the round
  // has no local payloads (kNotFound).
  absl::Status DoAggregate(const RoundKey &key);

  // Aborts a pending DoAggregate with kCancelled.
  void Abandon() { synchronizer_.Cancel(); }

  RoundSynchronizer &synchronizer() { return synchronizer_; }
};

}  // namespace fedmeta::controller

#endif  // FEDMETA_FEDMETA_CONTROLLER_CORE_COORDINATOR_H_
