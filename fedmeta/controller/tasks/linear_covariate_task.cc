#include "fedmeta/controller/tasks/linear_covariate_task.h"

#include <glog/logging.h>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "fedmeta/controller/common/macros.h"
#include "fedmeta/controller/common/proto_json.h"
#include "fedmeta/controller/models/ols_fitter.h"

namespace fedmeta::controller {

using fedmeta::proto::JsonOps;

namespace {

template <typename Field>
void CopyVector(const Eigen::VectorXd &values, Field *field) {
  field->Assign(values.data(), values.data() + values.size());
}

}  // namespace

LinearCovariateTask::LinearCovariateTask(int n_group_columns)
    : n_group_columns_(n_group_columns) {}

absl::Status LinearCovariateTask::PrepareData(const Dataset &dataset) {
  if (dataset.Empty()) {
    return absl::UnavailableError("Dataset is not ready.");
  }
  if (n_group_columns_ > dataset.NumFeatures()) {
    LOG(WARNING) << "n_group_columns = " << n_group_columns_ << " but the "
                 << "dataset has only " << dataset.NumFeatures()
                 << " feature columns.";
  }

  auto split = TrainTestSplit(dataset);
  x_train_ = std::move(split.x_train);
  y_train_ = std::move(split.y_train);
  prepared_ = true;

  VLOG(1) << "Training data shape: (" << x_train_.rows() << ", "
          << x_train_.cols() << ")";
  VLOG(1) << "Number of group columns: " << n_group_columns_;
  return absl::OkStatus();
}

absl::Status LinearCovariateTask::AcceptPriorGlobal(const std::string &blob) {
  ASSIGN_OR_RETURN(auto previous,
                   JsonOps::ParseBlobs<LinearGlobalStats>({blob}));
  if (previous.empty()) {
    return absl::InvalidArgumentError("Previous global payload is empty.");
  }
  VLOG(1) << "Previous global estimate over "
          << previous.front().total_sample_size() << " samples: coef_ = ["
          << absl::StrJoin(previous.front().coef(), ", ") << "]";
  return absl::OkStatus();
}

absl::StatusOr<LinearLocalStats> LinearCovariateTask::ComputeLocalStats()
    const {
  if (!prepared_) {
    return absl::FailedPreconditionError("PrepareData has not been called.");
  }
  ASSIGN_OR_RETURN(auto fit, OlsFitter::Fit(y_train_, x_train_));

  LinearLocalStats stats;
  stats.set_sample_size(static_cast<int32_t>(y_train_.size()));
  CopyVector(fit.coefficients, stats.mutable_coef());
  CopyVector(fit.std_errors, stats.mutable_std_err());
  CopyVector(fit.t_values, stats.mutable_t_values());
  CopyVector(fit.p_values, stats.mutable_p_values());
  CopyVector(fit.conf_int_lower, stats.mutable_conf_int_lower());
  CopyVector(fit.conf_int_upper, stats.mutable_conf_int_upper());
  stats.set_r_squared(fit.r_squared);
  stats.set_adj_r_squared(fit.adj_r_squared);
  stats.set_f_statistic(fit.f_statistic);
  stats.set_f_pvalue(fit.f_pvalue);
  stats.set_ss_model(fit.ss_model);
  stats.set_ss_residual(fit.ss_residual);
  stats.set_ss_total(fit.ss_total);
  stats.set_df_model(fit.df_model);
  stats.set_df_residual(fit.df_residual);
  stats.set_partial_eta_squared(
      OlsFitter::PartialEtaSquared(fit, n_group_columns_));
  stats.set_n_group_columns(n_group_columns_);
  return stats;
}

absl::StatusOr<std::string> LinearCovariateTask::Train() {
  LOG(INFO) << "Starting ANCOVA analysis...";
  ASSIGN_OR_RETURN(auto stats, ComputeLocalStats());

  LOG(INFO) << "OLS fit on " << stats.sample_size()
            << " samples: R^2 = " << stats.r_squared()
            << ", adj R^2 = " << stats.adj_r_squared()
            << ", F = " << stats.f_statistic() << " (p = " << stats.f_pvalue()
            << ")";
  LOG(INFO) << "Partial eta-squared (group effect, approximate): "
            << stats.partial_eta_squared();
  return JsonOps::ToJsonLine(stats);
}

absl::StatusOr<std::string> LinearCovariateTask::Aggregate(
    const std::vector<std::string> &blobs) const {
  ASSIGN_OR_RETURN(auto local_stats,
                   JsonOps::ParseBlobs<LinearLocalStats>(blobs));

  std::vector<const LinearLocalStats *> payloads;
  payloads.reserve(local_stats.size());
  for (const auto &stats : local_stats) payloads.push_back(&stats);

  ASSIGN_OR_RETURN(auto global, aggregator_.Aggregate(payloads));
  return JsonOps::ToJsonLine(global);
}

}  // namespace fedmeta::controller
