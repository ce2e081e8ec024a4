#include "fedmeta/controller/scheduling/round_synchronizer.h"

#include <glog/logging.h>

#include <algorithm>

#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"

namespace fedmeta::controller {

RoundSynchronizer::RoundSynchronizer(ArtifactStore *store,
                                     const SyncParams &params)
    : store_(store), params_(params), cancelled_(false) {
  params_.min_quorum = std::max(params_.min_quorum, 1);
}

absl::StatusOr<std::vector<ParticipantBlob>> RoundSynchronizer::Poll(
    const RoundKey &key) {
  // Closure is read before the listing so that a closed round lists every
  // payload published ahead of the marker.
  const bool closed = store_->IsClosed(key);
  auto blobs = store_->ListLocal(key);
  if (!blobs.ok()) return blobs.status();
  const int published = static_cast<int>(blobs->size());

  if (params_.expected_participants > 0 &&
      published >= params_.expected_participants) {
    return blobs;
  }

  if (closed) {
    if (published == 0) {
      return absl::NotFoundError(
          absl::StrCat("Round ", key.ToString(), " closed with no payloads."));
    }
    if (published < params_.min_quorum) {
      return absl::FailedPreconditionError(
          absl::StrCat("Round ", key.ToString(), " closed with ", published,
                       " payloads, quorum is ", params_.min_quorum));
    }
    return blobs;
  }

  return absl::UnavailableError(absl::StrCat(
      "Round ", key.ToString(), " not ready: ", published, " of ",
      params_.expected_participants > 0
          ? std::to_string(params_.expected_participants)
          : std::string("?"),
      " payloads published."));
}

absl::StatusOr<std::vector<ParticipantBlob>> RoundSynchronizer::AwaitRound(
    const RoundKey &key) {
  const absl::Time deadline = absl::Now() + params_.round_timeout;
  LOG(INFO) << "Waiting for round " << key.ToString() << " until "
            << absl::FormatTime(deadline);

  while (true) {
    if (cancelled_) {
      return absl::CancelledError(
          absl::StrCat("Round ", key.ToString(), " abandoned."));
    }

    auto blobs = Poll(key);
    if (blobs.ok() || !absl::IsUnavailable(blobs.status())) return blobs;
    VLOG(1) << blobs.status().message();

    const absl::Time now = absl::Now();
    if (now >= deadline) break;
    absl::SleepFor(std::min(params_.poll_interval, deadline - now));
  }

  return SettleAtDeadline(key);
}

absl::StatusOr<std::vector<ParticipantBlob>>
RoundSynchronizer::SettleAtDeadline(const RoundKey &key) {
  auto blobs = store_->ListLocal(key);
  if (!blobs.ok()) return blobs.status();
  const int published = static_cast<int>(blobs->size());

  if (published == 0) {
    return absl::NotFoundError(
        absl::StrCat("No local payloads for round ", key.ToString()));
  }
  if (published < params_.min_quorum) {
    return absl::DeadlineExceededError(
        absl::StrCat("Round ", key.ToString(), " timed out with ", published,
                     " payloads, quorum is ", params_.min_quorum));
  }

  if (params_.expected_participants > 0) {
    LOG(WARNING) << "Round " << key.ToString() << " timed out with "
                 << published << " of " << params_.expected_participants
                 << " payloads. Proceeding with quorum.";
  }
  return blobs;
}

}  // namespace fedmeta::controller
