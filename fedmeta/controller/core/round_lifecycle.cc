#include "fedmeta/controller/core/round_lifecycle.h"

#include <glog/logging.h>

#include <exception>

#include "absl/strings/str_cat.h"
#include "fedmeta/controller/common/macros.h"

namespace fedmeta::controller {

RoundLifecycle::RoundLifecycle(RoundKey key, std::string participant,
                               ModelTask task, DatasetSource *source,
                               ArtifactStore *store)
    : key_(std::move(key)),
      participant_(std::move(participant)),
      task_(std::move(task)),
      source_(source),
      store_(store) {}

absl::Status RoundLifecycle::PrepareData() {
  RETURN_IF_ERROR(ExpectState(RoundState::kInitial, "prepare_data"));
  VLOG(1) << "Loading dataset for run " << key_.run_id << " from "
          << source_->Name();

  auto dataset = source_->Load();
  if (!dataset.ok()) return Fail(dataset.status(), "prepare_data");
  if (dataset->Empty()) {
    return Fail(absl::UnavailableError("Dataset is not ready."),
                "prepare_data");
  }

  if (dataset->NumRows() < kMinSampleSize) {
    LOG(WARNING) << "Sample size (" << dataset->NumRows()
                 << ") is below minimum threshold (" << kMinSampleSize
                 << "). This may pose privacy risks.";
  }

  auto status = std::visit(
      [&](auto &task) { return task.PrepareData(*dataset); }, task_);
  if (!status.ok()) return Fail(status, "prepare_data");

  if (!key_.IsFirstRound()) {
    status = LoadPriorGlobal();
    if (absl::IsNotFound(status)) {
      VLOG(1) << status.message();
    } else if (!status.ok()) {
      return Fail(status, "prepare_data");
    }
  }

  Transition(RoundState::kDataReady);
  return absl::OkStatus();
}

absl::Status RoundLifecycle::Validate() {
  RETURN_IF_ERROR(ExpectState(RoundState::kDataReady, "validate"));
  VLOG(1) << "Run " << key_.run_id << " - task " << key_.sequence
          << " - round " << key_.round << " task begins";

  if (!key_.IsFirstRound() && !has_prior_global_) {
    auto status = LoadPriorGlobal();
    if (!status.ok()) return Fail(status, "validate");
  }

  Transition(RoundState::kValidated);
  return absl::OkStatus();
}

absl::Status RoundLifecycle::Training() {
  RETURN_IF_ERROR(ExpectState(RoundState::kValidated, "training"));

  absl::StatusOr<std::string> payload;
  try {
    payload = Fit();
  } catch (const std::exception &e) {
    payload = absl::InternalError(absl::StrCat("Fit raised: ", e.what()));
  }
  if (!payload.ok()) return Fail(payload.status(), "training");
  Transition(RoundState::kTrained);

  LOG(INFO) << "Upload payload of " << participant_ << " to round "
            << key_.ToString();
  auto status = store_->WriteLocal(key_, participant_, *payload);
  if (!status.ok()) return Fail(status, "training");

  Transition(RoundState::kPublished);
  return absl::OkStatus();
}

absl::StatusOr<std::string> RoundLifecycle::Fit() {
  return std::visit([](auto &task) { return task.Train(); }, task_);
}

absl::Status RoundLifecycle::Run() {
  RETURN_IF_ERROR(PrepareData());
  RETURN_IF_ERROR(Validate());
  return Training();
}

void RoundLifecycle::Abandon() {
  if (state_ == RoundState::kPublished || state_ == RoundState::kFailed) {
    return;
  }
  LOG(WARNING) << participant_ << " abandons round " << key_.ToString()
               << " in state " << RoundStateName(state_);
  status_ = absl::CancelledError(
      absl::StrCat("Round ", key_.ToString(), " abandoned."));
  Transition(RoundState::kFailed);
}

absl::Status RoundLifecycle::ExpectState(RoundState expected,
                                         const char *stage) const {
  if (state_ != expected) {
    return absl::FailedPreconditionError(absl::StrCat(
        "Stage ", stage, " needs state ", RoundStateName(expected),
        " but the round is ", RoundStateName(state_)));
  }
  return absl::OkStatus();
}

absl::Status RoundLifecycle::Fail(absl::Status status, const char *stage) {
  LOG(ERROR) << "Stage " << stage << " of " << participant_ << " failed for "
             << "round " << key_.ToString() << ": " << status;
  status_ = status;
  Transition(RoundState::kFailed);
  return status;
}

void RoundLifecycle::Transition(RoundState next) {
  VLOG(1) << participant_ << " " << RoundStateName(state_) << " -> "
          << RoundStateName(next);
  state_ = next;
}

absl::Status RoundLifecycle::LoadPriorGlobal() {
  const RoundKey previous = key_.Previous();
  ASSIGN_OR_RETURN(auto blob, store_->ReadGlobal(previous));
  RETURN_IF_ERROR(std::visit(
      [&](auto &task) { return task.AcceptPriorGlobal(blob); }, task_));
  VLOG(1) << "Loaded global payload of round " << previous.ToString();
  has_prior_global_ = true;
  return absl::OkStatus();
}

}  // namespace fedmeta::controller
