/**
 * Runs one stage of a federated round against a shared artifact directory:
 *
 *   fedmeta_main --role=site --run_spec=run.pbtxt --store_root=/shared \
 *       --dataset=site1.csv --participant=site1 --sequence=1 --round=1
 *   fedmeta_main --role=coordinator --run_spec=run.pbtxt \
 *       --store_root=/shared --expected_participants=3 --round_timeout=10m
 *   fedmeta_main --role=close --run_spec=run.pbtxt --store_root=/shared
 */

#include <glog/logging.h>
#include <signal.h>

#include <memory>
#include <string>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "fedmeta/controller/core/controller_utils.h"
#include "fedmeta/controller/core/coordinator.h"
#include "fedmeta/controller/core/round_lifecycle.h"

ABSL_FLAG(std::string, role, "site",
          "site: fit and publish the local payload. coordinator: aggregate "
          "the round. close: mark the round closed.");
ABSL_FLAG(std::string, run_spec, "", "Text-format RunSpec file.");
ABSL_FLAG(std::string, store_root, "", "Root of the shared artifact store.");
ABSL_FLAG(std::string, dataset, "", "Local CSV dataset (site role).");
ABSL_FLAG(std::string, participant, "", "Participant name (site role).");
ABSL_FLAG(int, sequence, 1, "Task sequence number, 1-based.");
ABSL_FLAG(int, round, 1, "Round number, 1-based.");
ABSL_FLAG(int, expected_participants, 0,
          "Number of sites expected to publish; 0 if unknown.");
ABSL_FLAG(int, min_quorum, 1,
          "Minimum number of payloads to aggregate after the timeout.");
ABSL_FLAG(absl::Duration, round_timeout, absl::Minutes(5),
          "Maximum wait for the round's payloads.");
ABSL_FLAG(absl::Duration, poll_interval, absl::Seconds(1),
          "Interval between store listings while waiting.");

using fedmeta::controller::ArtifactStore;
using fedmeta::controller::ArtifactStoreParams;
using fedmeta::controller::Coordinator;
using fedmeta::controller::CsvDatasetSource;
using fedmeta::controller::RoundKey;
using fedmeta::controller::RoundLifecycle;
using fedmeta::controller::SyncParams;

Coordinator *coordinator = nullptr;

void sigint_handler(int code) {
  LOG(INFO) << "Received SIGINT (code " << code << ")";
  if (coordinator != nullptr) {
    coordinator->Abandon();
  }
}

int main(int argc, char **argv) {
  absl::SetProgramUsageMessage(
      "Runs a site or coordinator stage of a federated round.");
  absl::ParseCommandLine(argc, argv);

  FLAGS_log_dir = "/tmp";
  FLAGS_alsologtostderr = true;
  google::InitGoogleLogging(argv[0]);

  signal(SIGINT, sigint_handler);

  auto run_spec =
      fedmeta::controller::LoadRunSpec(absl::GetFlag(FLAGS_run_spec));
  if (!run_spec.ok()) {
    LOG(ERROR) << run_spec.status();
    return 1;
  }

  ArtifactStoreParams store_params;
  store_params.artifact_store = "File";
  store_params.root = absl::GetFlag(FLAGS_store_root);
  auto store = fedmeta::controller::CreateArtifactStore(store_params);
  if (!store.ok()) {
    LOG(ERROR) << store.status();
    return 1;
  }

  RoundKey key{run_spec->run_id(), absl::GetFlag(FLAGS_sequence),
               absl::GetFlag(FLAGS_round)};
  auto task_spec = fedmeta::controller::GetTaskSpec(*run_spec, key.sequence);
  if (!task_spec.ok()) {
    LOG(ERROR) << task_spec.status();
    return 1;
  }
  auto task = fedmeta::controller::CreateModelTask(*task_spec);
  if (!task.ok()) {
    LOG(ERROR) << task.status();
    return 1;
  }

  LOG(INFO) << "Starting " << absl::GetFlag(FLAGS_role) << " for round "
            << key.ToString() << " of project " << run_spec->project_id()
            << ", batch " << run_spec->batch_id() << " with task "
            << fedmeta::controller::ModelTaskName(*task);

  absl::Status status;
  const std::string role = absl::GetFlag(FLAGS_role);
  if (role == "site") {
    CsvDatasetSource source(absl::GetFlag(FLAGS_dataset));
    RoundLifecycle lifecycle(key, absl::GetFlag(FLAGS_participant),
                             *std::move(task), &source, store->get());
    status = lifecycle.Run();
  } else if (role == "coordinator") {
    SyncParams sync_params;
    sync_params.expected_participants =
        absl::GetFlag(FLAGS_expected_participants);
    sync_params.min_quorum = absl::GetFlag(FLAGS_min_quorum);
    sync_params.round_timeout = absl::GetFlag(FLAGS_round_timeout);
    sync_params.poll_interval = absl::GetFlag(FLAGS_poll_interval);

    auto round_coordinator = std::make_unique<Coordinator>(
        *std::move(task), store->get(), sync_params);
    coordinator = round_coordinator.get();
    status = coordinator->DoAggregate(key);
    coordinator = nullptr;
  } else if (role == "close") {
    status = (*store)->CloseRound(key);
  } else {
    status = absl::InvalidArgumentError(absl::StrCat("Unknown role: ", role));
  }

  if (!status.ok()) {
    LOG(ERROR) << "Round " << key.ToString() << " failed: " << status;
    return 1;
  }

  LOG(INFO) << "Exiting... Bye!";
  return 0;
}
