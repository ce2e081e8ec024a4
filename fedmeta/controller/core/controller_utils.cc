#include "fedmeta/controller/core/controller_utils.h"

#include <glog/logging.h>
#include <google/protobuf/text_format.h>

#include <fstream>
#include <sstream>

#include "absl/memory/memory.h"
#include "absl/strings/str_cat.h"

namespace fedmeta::controller {

absl::StatusOr<ModelTask> CreateModelTask(const TaskSpec &task_spec) {
  switch (task_spec.model_kind()) {
    case LINEAR_COVARIATE: {
      const int n_group_columns = GetGroupColumns(task_spec.config());
      if (n_group_columns < 0) {
        return absl::InvalidArgumentError(absl::StrCat(
            "n_group_columns must be non-negative, got ", n_group_columns));
      }
      return ModelTask(std::in_place_type<LinearCovariateTask>,
                       n_group_columns);
    }
    case KERNEL_REGRESSION:
      return ModelTask(std::in_place_type<KernelRegressionTask>,
                       GetSvrParams(task_spec.kernel()));
    default:
      return absl::InvalidArgumentError(
          absl::StrCat("Unsupported model kind: ",
                       ModelKind_Name(task_spec.model_kind())));
  }
}

absl::StatusOr<std::unique_ptr<ArtifactStore>> CreateArtifactStore(
    const ArtifactStoreParams &params) {
  const auto &artifact_store = params.artifact_store;
  if (artifact_store == "File") {
    if (params.root.empty()) {
      return absl::InvalidArgumentError("File artifact store needs a root.");
    }
    return absl::make_unique<FileArtifactStore>(params.root);
  }
  if (artifact_store == "InMemory")
    return absl::make_unique<HashMapArtifactStore>();

  return absl::InvalidArgumentError(
      absl::StrCat("Unsupported artifact store: ", artifact_store));
}

SvrParams GetSvrParams(const KernelParams &kernel) {
  SvrParams params;
  if (kernel.has_c()) params.c = kernel.c();
  if (kernel.has_epsilon()) params.epsilon = kernel.epsilon();
  if (kernel.has_gamma()) params.gamma = kernel.gamma();
  if (kernel.has_tol()) params.tol = kernel.tol();
  if (kernel.has_max_iter()) params.max_iter = kernel.max_iter();
  return params;
}

absl::StatusOr<RunSpec> LoadRunSpec(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return absl::NotFoundError(absl::StrCat("Cannot open run spec ", path));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  RunSpec run_spec;
  if (!google::protobuf::TextFormat::ParseFromString(buffer.str(),
                                                     &run_spec)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Unable to parse run spec ", path));
  }
  auto status = ValidateRunSpec(run_spec);
  if (!status.ok()) return status;
  return run_spec;
}

absl::Status ValidateRunSpec(const RunSpec &run_spec) {
  if (run_spec.run_id().empty()) {
    return absl::InvalidArgumentError("Run spec has no run_id.");
  }
  if (run_spec.tasks().empty()) {
    return absl::InvalidArgumentError(
        absl::StrCat("Run ", run_spec.run_id(), " has no tasks."));
  }
  return absl::OkStatus();
}

absl::StatusOr<TaskSpec> GetTaskSpec(const RunSpec &run_spec, int sequence) {
  if (sequence < 1 || sequence > run_spec.tasks_size()) {
    return absl::OutOfRangeError(
        absl::StrCat("Run ", run_spec.run_id(), " has ", run_spec.tasks_size(),
                     " tasks, no task for sequence ", sequence));
  }
  return run_spec.tasks(sequence - 1);
}

std::string ModelTaskName(const ModelTask &task) {
  return std::visit([](const auto &model) { return model.Name(); }, task);
}

}  // namespace fedmeta::controller
