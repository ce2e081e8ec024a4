#include "fedmeta/controller/aggregation/sample_size_average.h"

#include <glog/logging.h>

#include <cmath>

#include "absl/strings/str_cat.h"
#include "fedmeta/controller/aggregation/canonical_order.h"
#include "fedmeta/controller/common/macros.h"
#include "fedmeta/controller/common/proto_json.h"
#include "fedmeta/controller/scaling/scaling.h"

namespace fedmeta::controller {

using fedmeta::proto::JsonOps;

absl::StatusOr<KernelStats> SampleSizeWeightedAverage::Aggregate(
    const std::vector<const KernelStats *> &payloads) const {
  if (payloads.empty()) {
    return absl::NotFoundError("No local payloads to aggregate.");
  }

  auto usable = CanonicalOrder(SelectUsable(payloads));
  if (usable.empty()) {
    return absl::NotFoundError(
        "Not able to calculate dual coefficients and intercept: no site "
        "published a usable dual row.");
  }
  RETURN_IF_ERROR(ValidateShapes(usable));

  std::vector<int> sample_sizes;
  int64_t total_sample_size = 0;
  for (const auto *payload : usable) {
    sample_sizes.push_back(payload->sample_size());
    total_sample_size += payload->sample_size();
  }
  auto scaling_factors = Scaling::GetDatasetScalingFactors(sample_sizes);

  const int n_rows = usable.front()->dual_coef_size();
  std::vector<Eigen::VectorXd> pooled_rows(n_rows);
  double intercept = 0, mse = 0, mae = 0, r2 = 0;

  for (size_t site = 0; site < usable.size(); ++site) {
    const auto &stats = *usable[site];
    const double factor = scaling_factors[site];
    for (int r = 0; r < n_rows; ++r) {
      ASSIGN_OR_RETURN(auto row, JsonOps::GetRow(stats.dual_coef(r)));
      if (site == 0) {
        pooled_rows[r] = factor * row;
      } else {
        pooled_rows[r] += factor * row;
      }
    }
    intercept += factor * stats.intercept();
    mse += factor * stats.metric_mse();
    mae += factor * stats.metric_mae();
    r2 += factor * stats.metric_r2();
  }

  KernelStats global;
  global.set_sample_size(static_cast<int32_t>(total_sample_size));
  for (const auto &row : pooled_rows) {
    JsonOps::SetRow(row, global.add_dual_coef());
  }
  global.set_intercept(intercept);
  global.set_metric_mse(mse);
  global.set_metric_rmse(std::sqrt(mse));
  global.set_metric_mae(mae);
  global.set_metric_r2(r2);

  LOG(INFO) << "Averaged dual coefficients of " << usable.size()
            << " sites, total sample size " << total_sample_size
            << ", pooled intercept " << intercept;
  LOG(INFO) << "Pooled held-out MSE: " << mse << ", MAE: " << mae
            << ", R^2: " << r2;
  return global;
}

std::vector<const KernelStats *> SampleSizeWeightedAverage::SelectUsable(
    const std::vector<const KernelStats *> &payloads) const {
  std::vector<const KernelStats *> usable;
  for (const auto *payload : payloads) {
    bool has_row = payload->dual_coef_size() > 0 &&
                   payload->dual_coef(0).values_size() > 0;
    bool finite = std::isfinite(payload->intercept()) &&
                  std::isfinite(payload->metric_mse()) &&
                  std::isfinite(payload->metric_mae()) &&
                  std::isfinite(payload->metric_r2());
    if (payload->sample_size() < 1 || !has_row || !finite) {
      LOG(WARNING) << "Skipping kernel payload with sample size "
                   << payload->sample_size() << " and "
                   << payload->dual_coef_size() << " dual rows.";
      continue;
    }
    usable.push_back(payload);
  }
  return usable;
}

absl::Status SampleSizeWeightedAverage::ValidateShapes(
    const std::vector<const KernelStats *> &payloads) const {
  const auto &first = *payloads.front();
  for (size_t site = 0; site < payloads.size(); ++site) {
    const auto &stats = *payloads[site];
    if (stats.dual_coef_size() != first.dual_coef_size()) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Dual coefficient shapes differ: ", first.dual_coef_size(),
          " rows vs ", stats.dual_coef_size(), " rows."));
    }
    for (int r = 0; r < stats.dual_coef_size(); ++r) {
      if (stats.dual_coef(r).values_size() !=
          first.dual_coef(r).values_size()) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Dual coefficient shapes differ in row ", r, ": ",
            first.dual_coef(r).values_size(), " vs ",
            stats.dual_coef(r).values_size(), " columns."));
      }
    }
  }
  return absl::OkStatus();
}

}  // namespace fedmeta::controller
