#ifndef FEDMETA_FEDMETA_CONTROLLER_TASKS_KERNEL_REGRESSION_TASK_H_
#define FEDMETA_FEDMETA_CONTROLLER_TASKS_KERNEL_REGRESSION_TASK_H_

#include <optional>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "absl/status/statusor.h"
#include "fedmeta/controller/aggregation/sample_size_average.h"
#include "fedmeta/controller/data/dataset.h"
#include "fedmeta/controller/models/svr_solver.h"
#include "fedmeta/proto/payload.pb.h"

namespace fedmeta::controller {

// Held-out regression metrics.
struct RegressionMetrics {
  double mse = 0;
  double rmse = 0;
  double mae = 0;
  double r2 = 0;

  // R^2 is 1 for a perfect prediction of a constant target and 0 for any
  // other prediction of one.
  static RegressionMetrics Compute(const Eigen::VectorXd &truth,
                                   const Eigen::VectorXd &predicted);
};

/**
 * RBF support vector regression on standardized features. Sites fit their
 * training partition, optionally warm started from the previous round's
 * pooled dual row, and report held-out metrics. The coordinator averages
 * the dual rows and intercepts weighted by sample size.
 */
class KernelRegressionTask {
 public:
  explicit KernelRegressionTask(const SvrParams &params);

  absl::Status PrepareData(const Dataset &dataset);

  // Keeps the previous global dual row as the warm start of the next fit.
  absl::Status AcceptPriorGlobal(const std::string &blob);

  absl::StatusOr<std::string> Train();

  absl::StatusOr<std::string> Aggregate(
      const std::vector<std::string> &blobs) const;

  absl::StatusOr<KernelStats> ComputeLocalStats() const;

  bool HasWarmStart() const { return warm_start_.has_value(); }

  const SvrParams &params() const { return solver_.params(); }

  inline std::string Name() const { return "KernelRegression"; }

 private:
  SvrSolver solver_;
  bool prepared_ = false;
  int sample_size_ = 0;
  Eigen::MatrixXd x_train_;
  Eigen::VectorXd y_train_;
  Eigen::MatrixXd x_test_;
  Eigen::VectorXd y_test_;
  std::optional<Eigen::VectorXd> warm_start_;
  SampleSizeWeightedAverage aggregator_;
};

}  // namespace fedmeta::controller

#endif  // FEDMETA_FEDMETA_CONTROLLER_TASKS_KERNEL_REGRESSION_TASK_H_
