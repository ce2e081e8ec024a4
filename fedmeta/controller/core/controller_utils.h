#ifndef FEDMETA_FEDMETA_CONTROLLER_CORE_CONTROLLER_UTILS_H_
#define FEDMETA_FEDMETA_CONTROLLER_CORE_CONTROLLER_UTILS_H_

#include <memory>
#include <string>
#include <variant>

#include "absl/status/statusor.h"
#include "fedmeta/controller/core/types.h"
#include "fedmeta/controller/models/svr_solver.h"
#include "fedmeta/controller/store/store.h"
#include "fedmeta/controller/tasks/kernel_regression_task.h"
#include "fedmeta/controller/tasks/linear_covariate_task.h"
#include "fedmeta/proto/run.pb.h"

namespace fedmeta::controller {

// The model kinds a task can run. Each alternative provides PrepareData,
// AcceptPriorGlobal, Train and Aggregate.
typedef std::variant<LinearCovariateTask, KernelRegressionTask> ModelTask;

constexpr int kDefaultGroupColumns = 1;

absl::StatusOr<ModelTask> CreateModelTask(const TaskSpec &task_spec);

absl::StatusOr<std::unique_ptr<ArtifactStore>> CreateArtifactStore(
    const ArtifactStoreParams &params);

SvrParams GetSvrParams(const KernelParams &kernel);

inline int GetGroupColumns(const TaskConfig &config) {
  return config.has_n_group_columns() ? config.n_group_columns()
                                      : kDefaultGroupColumns;
}

// Parses a text-format RunSpec and checks that it names a run and at least
// one task.
absl::StatusOr<RunSpec> LoadRunSpec(const std::string &path);

absl::Status ValidateRunSpec(const RunSpec &run_spec);

// Sequences are 1-based.
absl::StatusOr<TaskSpec> GetTaskSpec(const RunSpec &run_spec, int sequence);

std::string ModelTaskName(const ModelTask &task);

}  // namespace fedmeta::controller

#endif  // FEDMETA_FEDMETA_CONTROLLER_CORE_CONTROLLER_UTILS_H_
