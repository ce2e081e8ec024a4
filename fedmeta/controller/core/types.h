#ifndef FEDMETA_FEDMETA_CONTROLLER_CORE_TYPES_H_
#define FEDMETA_FEDMETA_CONTROLLER_CORE_TYPES_H_

#include <string>

#include "absl/time/time.h"

namespace fedmeta::controller {

typedef struct SyncParams {
  // 0 when the number of sites is not known in advance.
  int expected_participants = 0;
  int min_quorum = 1;
  absl::Duration round_timeout = absl::ZeroDuration();
  absl::Duration poll_interval = absl::Milliseconds(200);
} SyncParams;

typedef struct ArtifactStoreParams {
  // "File" or "InMemory".
  std::string artifact_store = "File";
  std::string root;
} ArtifactStoreParams;

enum class RoundState {
  kInitial,
  kDataReady,
  kValidated,
  kTrained,
  kPublished,
  kFailed
};

inline const char *RoundStateName(RoundState state) {
  switch (state) {
    case RoundState::kInitial:
      return "Initial";
    case RoundState::kDataReady:
      return "DataReady";
    case RoundState::kValidated:
      return "Validated";
    case RoundState::kTrained:
      return "Trained";
    case RoundState::kPublished:
      return "Published";
    case RoundState::kFailed:
      return "Failed";
  }
  return "Unknown";
}

}  // namespace fedmeta::controller

#endif  // FEDMETA_FEDMETA_CONTROLLER_CORE_TYPES_H_
