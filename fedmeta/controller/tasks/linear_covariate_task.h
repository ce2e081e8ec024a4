#ifndef FEDMETA_FEDMETA_CONTROLLER_TASKS_LINEAR_COVARIATE_TASK_H_
#define FEDMETA_FEDMETA_CONTROLLER_TASKS_LINEAR_COVARIATE_TASK_H_

#include <string>
#include <vector>

#include <Eigen/Dense>

#include "absl/status/statusor.h"
#include "fedmeta/controller/aggregation/inverse_variance_meta.h"
#include "fedmeta/controller/data/dataset.h"
#include "fedmeta/proto/payload.pb.h"

namespace fedmeta::controller {

/**
 * Covariate-adjusted group comparison. The design matrix is
 * [group dummies (n_group_columns) | covariates]; the site fits OLS on its
 * training partition and publishes LinearLocalStats. The coordinator pools
 * the sites with inverse-variance weighting.
 */
class LinearCovariateTask {
 public:
  explicit LinearCovariateTask(int n_group_columns);

  absl::Status PrepareData(const Dataset &dataset);

  // The previous global estimate is not used to initialize an OLS fit; it is
  // only checked to be a well-formed global payload.
  absl::Status AcceptPriorGlobal(const std::string &blob);

  // Fits the training partition and returns the local payload as a JSON
  // line.
  absl::StatusOr<std::string> Train();

  absl::StatusOr<std::string> Aggregate(
      const std::vector<std::string> &blobs) const;

  absl::StatusOr<LinearLocalStats> ComputeLocalStats() const;

  int n_group_columns() const { return n_group_columns_; }

  inline std::string Name() const { return "LinearCovariate"; }

 private:
  int n_group_columns_;
  bool prepared_ = false;
  Eigen::MatrixXd x_train_;
  Eigen::VectorXd y_train_;
  InverseVarianceMetaAnalysis aggregator_;
};

}  // namespace fedmeta::controller

#endif  // FEDMETA_FEDMETA_CONTROLLER_TASKS_LINEAR_COVARIATE_TASK_H_
