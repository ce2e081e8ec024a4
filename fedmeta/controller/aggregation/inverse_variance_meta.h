#ifndef FEDMETA_FEDMETA_CONTROLLER_AGGREGATION_INVERSE_VARIANCE_META_H_
#define FEDMETA_FEDMETA_CONTROLLER_AGGREGATION_INVERSE_VARIANCE_META_H_

#include "fedmeta/controller/aggregation/aggregation_function.h"
#include "fedmeta/proto/payload.pb.h"

namespace fedmeta::controller {

/**
 * Fixed-effect meta-analysis of per-site OLS fits.
 *
 * Per coefficient:
 *   w_i = 1 / se_i^2 (0 if se_i == 0)
 *   b   = sum(b_i w_i) / sum(w_i), or mean(b_i) if sum(w_i) == 0
 *   se  = sqrt(1 / sum(w_i)), 0 if sum(w_i) == 0
 *   z   = b / se, p = 2 (1 - Phi(|z|)), CI = b -/+ 1.96 se
 *
 * Sums of squares and residual degrees of freedom add across sites (they are
 * additive over disjoint samples). df_model is structural and must agree.
 */
class InverseVarianceMetaAnalysis
    : public AggregationFunction<LinearLocalStats, LinearGlobalStats> {
 public:
  absl::StatusOr<LinearGlobalStats> Aggregate(
      const std::vector<const LinearLocalStats *> &payloads) const override;

  inline std::string Name() const override { return "InverseVarianceMeta"; }

  static constexpr double kZCritical95 = 1.96;

 private:
  absl::Status Validate(
      const std::vector<const LinearLocalStats *> &payloads) const;

  void PoolCoefficients(const std::vector<const LinearLocalStats *> &payloads,
                        LinearGlobalStats &global) const;

  void PoolFitQuality(const std::vector<const LinearLocalStats *> &payloads,
                      LinearGlobalStats &global) const;
};

}  // namespace fedmeta::controller

#endif  // FEDMETA_FEDMETA_CONTROLLER_AGGREGATION_INVERSE_VARIANCE_META_H_
