#include "fedmeta/controller/tasks/kernel_regression_task.h"

#include <glog/logging.h>

#include <cmath>

#include "fedmeta/controller/common/macros.h"
#include "fedmeta/controller/common/proto_json.h"

namespace fedmeta::controller {

using fedmeta::proto::JsonOps;

RegressionMetrics RegressionMetrics::Compute(const Eigen::VectorXd &truth,
                                             const Eigen::VectorXd &predicted) {
  RegressionMetrics metrics;
  const Eigen::Index n = truth.size();
  if (n == 0) return metrics;

  const Eigen::VectorXd residual = truth - predicted;
  const double ss_residual = residual.squaredNorm();
  const double ss_total = (truth.array() - truth.mean()).matrix().squaredNorm();

  metrics.mse = ss_residual / static_cast<double>(n);
  metrics.rmse = std::sqrt(metrics.mse);
  metrics.mae = residual.cwiseAbs().mean();
  if (ss_total > 0) {
    metrics.r2 = 1.0 - ss_residual / ss_total;
  } else {
    metrics.r2 = ss_residual == 0 ? 1.0 : 0.0;
  }
  return metrics;
}

KernelRegressionTask::KernelRegressionTask(const SvrParams &params)
    : solver_(params) {}

absl::Status KernelRegressionTask::PrepareData(const Dataset &dataset) {
  if (dataset.Empty()) {
    return absl::UnavailableError("Dataset is not ready.");
  }
  sample_size_ = dataset.NumRows();

  auto split = TrainTestSplit(dataset);
  StandardScaler scaler;
  x_train_ = scaler.FitTransform(split.x_train);
  x_test_ = scaler.Transform(split.x_test);
  y_train_ = std::move(split.y_train);
  y_test_ = std::move(split.y_test);
  prepared_ = true;

  VLOG(1) << "Training data shape: (" << x_train_.rows() << ", "
          << x_train_.cols() << ")";
  VLOG(1) << "Test data shape: (" << x_test_.rows() << ", " << x_test_.cols()
          << ")";
  return absl::OkStatus();
}

absl::Status KernelRegressionTask::AcceptPriorGlobal(const std::string &blob) {
  ASSIGN_OR_RETURN(auto previous, JsonOps::ParseBlobs<KernelStats>({blob}));
  if (previous.empty() || previous.front().dual_coef_size() == 0) {
    LOG(WARNING) << "Previous global payload has no dual coefficients. "
                 << "Training starts cold.";
    warm_start_.reset();
    return absl::OkStatus();
  }
  ASSIGN_OR_RETURN(auto row, JsonOps::GetRow(previous.front().dual_coef(0)));
  VLOG(1) << "Loaded previous dual row of width " << row.size()
          << " and intercept " << previous.front().intercept();
  warm_start_ = std::move(row);
  return absl::OkStatus();
}

absl::StatusOr<KernelStats> KernelRegressionTask::ComputeLocalStats() const {
  if (!prepared_) {
    return absl::FailedPreconditionError("PrepareData has not been called.");
  }
  ASSIGN_OR_RETURN(auto model,
                   solver_.Fit(x_train_, y_train_,
                               warm_start_ ? &*warm_start_ : nullptr));

  const Eigen::VectorXd predicted = model.Predict(x_test_);
  const auto metrics = RegressionMetrics::Compute(y_test_, predicted);

  KernelStats stats;
  stats.set_sample_size(sample_size_);
  JsonOps::SetRow(model.dual, stats.add_dual_coef());
  stats.set_intercept(model.intercept);
  stats.set_metric_mse(metrics.mse);
  stats.set_metric_rmse(metrics.rmse);
  stats.set_metric_mae(metrics.mae);
  stats.set_metric_r2(metrics.r2);

  LOG(INFO) << "SVR fit with " << model.NumSupportVectors()
            << " support vectors in " << model.iterations << " iterations.";
  return stats;
}

absl::StatusOr<std::string> KernelRegressionTask::Train() {
  LOG(INFO) << "Starting training...";
  ASSIGN_OR_RETURN(auto stats, ComputeLocalStats());

  LOG(INFO) << "Mean Squared Error: " << stats.metric_mse();
  LOG(INFO) << "Root Mean Squared Error: " << stats.metric_rmse();
  LOG(INFO) << "Mean Absolute Error: " << stats.metric_mae();
  LOG(INFO) << "R^2 Score: " << stats.metric_r2();
  return JsonOps::ToJsonLine(stats);
}

absl::StatusOr<std::string> KernelRegressionTask::Aggregate(
    const std::vector<std::string> &blobs) const {
  ASSIGN_OR_RETURN(auto local_stats, JsonOps::ParseBlobs<KernelStats>(blobs));

  std::vector<const KernelStats *> payloads;
  payloads.reserve(local_stats.size());
  for (const auto &stats : local_stats) payloads.push_back(&stats);

  ASSIGN_OR_RETURN(auto global, aggregator_.Aggregate(payloads));
  return JsonOps::ToJsonLine(global);
}

}  // namespace fedmeta::controller
