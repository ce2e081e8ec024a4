#include "fedmeta/controller/core/coordinator.h"

#include <glog/logging.h>

#include <chrono>

#include "fedmeta/controller/common/macros.h"

namespace fedmeta::controller {

Coordinator::Coordinator(ModelTask task, ArtifactStore *store,
                         const SyncParams &sync_params)
    : task_(std::move(task)),
      store_(store),
      synchronizer_(store, sync_params) {}

absl::Status Coordinator::DoAggregate(const RoundKey &key) {
  auto published = synchronizer_.AwaitRound(key);
  if (!published.ok()) {
    LOG(ERROR) << "Cannot aggregate round " << key.ToString() << ": "
               << published.status();
    return published.status();
  }

  std::vector<std::string> blobs;
  blobs.reserve(published->size());
  for (auto &[participant, blob] : *published) {
    VLOG(1) << "Collected payload of " << participant;
    blobs.push_back(std::move(blob));
  }

  auto start = std::chrono::high_resolution_clock::now();
  auto global = std::visit(
      [&](const auto &task) { return task.Aggregate(blobs); }, task_);
  std::chrono::duration<double, std::milli> elapsed =
      std::chrono::high_resolution_clock::now() - start;

  if (!global.ok()) {
    LOG(ERROR) << ModelTaskName(task_) << " aggregation of round "
               << key.ToString() << " failed: " << global.status();
    return global.status();
  }
  LOG(INFO) << "Aggregated " << blobs.size() << " payloads of round "
            << key.ToString() << " in " << elapsed.count() << " ms.";

  auto status = store_->WriteGlobal(key, *global);
  if (!status.ok()) {
    LOG(ERROR) << "Cannot publish global payload of round " << key.ToString()
               << ": " << status;
    return status;
  }
  return absl::OkStatus();
}

}  // namespace fedmeta::controller
