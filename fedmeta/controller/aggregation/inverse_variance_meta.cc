#include "fedmeta/controller/aggregation/inverse_variance_meta.h"

#include <glog/logging.h>
#include <omp.h>

#include <cmath>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "fedmeta/controller/aggregation/canonical_order.h"
#include "fedmeta/controller/common/macros.h"
#include "fedmeta/controller/scaling/scaling.h"
#include "fedmeta/controller/stats/distributions.h"

namespace fedmeta::controller {

namespace {

template <typename Repeated>
bool AllFinite(const Repeated &values) {
  for (double value : values) {
    if (!std::isfinite(value)) return false;
  }
  return true;
}

bool ScalarsFinite(const LinearLocalStats &stats) {
  for (double value :
       {stats.r_squared(), stats.adj_r_squared(), stats.f_statistic(),
        stats.f_pvalue(), stats.ss_model(), stats.ss_residual(),
        stats.ss_total(), stats.df_model(), stats.df_residual(),
        stats.partial_eta_squared()}) {
    if (!std::isfinite(value)) return false;
  }
  return true;
}

}  // namespace

absl::StatusOr<LinearGlobalStats> InverseVarianceMetaAnalysis::Aggregate(
    const std::vector<const LinearLocalStats *> &payloads) const {
  if (payloads.empty()) {
    return absl::NotFoundError("No local payloads to aggregate.");
  }
  RETURN_IF_ERROR(Validate(payloads));

  auto ordered = CanonicalOrder(payloads);

  LinearGlobalStats global;
  int64_t total_sample_size = 0;
  for (const auto *payload : ordered) {
    total_sample_size += payload->sample_size();
  }
  global.set_total_sample_size(static_cast<int32_t>(total_sample_size));
  global.set_sample_size(static_cast<int32_t>(total_sample_size));
  global.set_n_sites(static_cast<int32_t>(ordered.size()));
  global.set_n_group_columns(ordered.front()->n_group_columns());

  PoolCoefficients(ordered, global);
  PoolFitQuality(ordered, global);

  LOG(INFO) << "Aggregated " << global.n_sites() << " sites, total sample size "
            << global.total_sample_size();
  LOG(INFO) << "Pooled coefficients: [" << absl::StrJoin(global.coef(), ", ")
            << "]";
  LOG(INFO) << "Pooled standard errors: ["
            << absl::StrJoin(global.std_err(), ", ") << "]";
  LOG(INFO) << "Pooled p-values: [" << absl::StrJoin(global.p_values(), ", ")
            << "]";
  LOG(INFO) << "Pooled R^2: " << global.r_squared()
            << ", F: " << global.f_statistic() << " (p = " << global.f_pvalue()
            << "), partial eta^2: " << global.partial_eta_squared();

  return global;
}

absl::Status InverseVarianceMetaAnalysis::Validate(
    const std::vector<const LinearLocalStats *> &payloads) const {
  const auto &first = *payloads.front();
  const int n_coef = first.coef_size();

  for (size_t site = 0; site < payloads.size(); ++site) {
    const auto &stats = *payloads[site];
    if (stats.sample_size() < 1) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Payload ", site, " has sample size ", stats.sample_size()));
    }
    if (stats.coef_size() != n_coef || stats.std_err_size() != n_coef) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Payload ", site, " has ", stats.coef_size(), " coefficients and ",
          stats.std_err_size(), " standard errors, expected ", n_coef));
    }
    if (stats.df_model() != first.df_model()) {
      return absl::InvalidArgumentError(
          absl::StrCat("Sites disagree on df_model: ", first.df_model(),
                       " vs ", stats.df_model()));
    }
    if (stats.n_group_columns() != first.n_group_columns()) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Sites disagree on n_group_columns: ", first.n_group_columns(),
          " vs ", stats.n_group_columns()));
    }
    if (!AllFinite(stats.coef()) || !AllFinite(stats.std_err()) ||
        !ScalarsFinite(stats)) {
      return absl::InvalidArgumentError(
          absl::StrCat("Payload ", site, " has non-finite values."));
    }
    for (double se : stats.std_err()) {
      if (se < 0) {
        return absl::InvalidArgumentError(
            absl::StrCat("Payload ", site, " has a negative standard error."));
      }
    }
  }
  return absl::OkStatus();
}

void InverseVarianceMetaAnalysis::PoolCoefficients(
    const std::vector<const LinearLocalStats *> &payloads,
    LinearGlobalStats &global) const {
  const int n_coef = payloads.front()->coef_size();
  const size_t n_sites = payloads.size();

  std::vector<double> pooled_b(n_coef), pooled_se(n_coef), z(n_coef),
      p(n_coef), ci_lower(n_coef), ci_upper(n_coef);

#pragma omp parallel for
  for (int idx = 0; idx < n_coef; ++idx) {
    std::vector<double> std_errors(n_sites);
    for (size_t site = 0; site < n_sites; ++site) {
      std_errors[site] = payloads[site]->std_err(idx);
    }
    auto weights = Scaling::GetInverseVarianceFactors(std_errors);

    double total_weight = 0, weighted_sum = 0, plain_sum = 0;
    for (size_t site = 0; site < n_sites; ++site) {
      const double coef = payloads[site]->coef(idx);
      total_weight += weights[site];
      weighted_sum += coef * weights[site];
      plain_sum += coef;
    }

    if (total_weight > 0) {
      pooled_b[idx] = weighted_sum / total_weight;
      pooled_se[idx] = std::sqrt(1.0 / total_weight);
      z[idx] = pooled_se[idx] > 0 ? pooled_b[idx] / pooled_se[idx] : 0.0;
      p[idx] = pooled_se[idx] > 0 ? Distributions::NormalTwoSidedPValue(z[idx])
                                  : 1.0;
    } else {
      pooled_b[idx] = plain_sum / static_cast<double>(n_sites);
      pooled_se[idx] = 0;
      z[idx] = 0;
      p[idx] = 1.0;
    }
    ci_lower[idx] = pooled_b[idx] - kZCritical95 * pooled_se[idx];
    ci_upper[idx] = pooled_b[idx] + kZCritical95 * pooled_se[idx];
  }

  global.mutable_coef()->Assign(pooled_b.begin(), pooled_b.end());
  global.mutable_std_err()->Assign(pooled_se.begin(), pooled_se.end());
  global.mutable_z_values()->Assign(z.begin(), z.end());
  global.mutable_p_values()->Assign(p.begin(), p.end());
  global.mutable_conf_int_lower()->Assign(ci_lower.begin(), ci_lower.end());
  global.mutable_conf_int_upper()->Assign(ci_upper.begin(), ci_upper.end());
}

void InverseVarianceMetaAnalysis::PoolFitQuality(
    const std::vector<const LinearLocalStats *> &payloads,
    LinearGlobalStats &global) const {
  double ss_model = 0, ss_residual = 0, df_residual = 0;
  std::vector<int> sample_sizes;
  for (const auto *payload : payloads) {
    ss_model += payload->ss_model();
    ss_residual += payload->ss_residual();
    df_residual += payload->df_residual();
    sample_sizes.push_back(payload->sample_size());
  }
  const double ss_total = ss_model + ss_residual;
  const double df_model = payloads.front()->df_model();

  global.set_ss_model(ss_model);
  global.set_ss_residual(ss_residual);
  global.set_ss_total(ss_total);
  global.set_df_model(df_model);
  global.set_df_residual(df_residual);

  double f = 0, f_pvalue = 1.0;
  if (df_model > 0 && df_residual > 0 && ss_residual > 0) {
    f = (ss_model / df_model) / (ss_residual / df_residual);
    f_pvalue = Distributions::FUpperTailPValue(f, df_model, df_residual);
  }
  global.set_f_statistic(f);
  global.set_f_pvalue(f_pvalue);

  const double r_squared = ss_total > 0 ? ss_model / ss_total : 0.0;
  const double n = static_cast<double>(global.total_sample_size());
  const double adj_denominator = n - df_model - 1.0;
  global.set_r_squared(r_squared);
  global.set_adj_r_squared(
      adj_denominator > 0
          ? 1.0 - (1.0 - r_squared) * (n - 1.0) / adj_denominator
          : 0.0);

  auto scaling_factors = Scaling::GetDatasetScalingFactors(sample_sizes);
  double partial_eta = 0;
  for (size_t site = 0; site < payloads.size(); ++site) {
    partial_eta +=
        scaling_factors[site] * payloads[site]->partial_eta_squared();
  }
  global.set_partial_eta_squared(partial_eta);
}

}  // namespace fedmeta::controller
