#ifndef FEDMETA_FEDMETA_CONTROLLER_AGGREGATION_SAMPLE_SIZE_AVERAGE_H_
#define FEDMETA_FEDMETA_CONTROLLER_AGGREGATION_SAMPLE_SIZE_AVERAGE_H_

#include "fedmeta/controller/aggregation/aggregation_function.h"
#include "fedmeta/proto/payload.pb.h"

namespace fedmeta::controller {

// Averages kernel model parameters with each site weighted by its sample
// size: pooled = sum(param_i * n_i) / sum(n_i). Held-out metrics are pooled
// the same way, except RMSE which is sqrt(pooled MSE).
//
// Payloads without a dual row are skipped. All remaining dual rows must have
// the same shape.
class SampleSizeWeightedAverage
    : public AggregationFunction<KernelStats, KernelStats> {
 public:
  absl::StatusOr<KernelStats> Aggregate(
      const std::vector<const KernelStats *> &payloads) const override;

  inline std::string Name() const override { return "SampleSizeAvg"; }

 private:
  std::vector<const KernelStats *> SelectUsable(
      const std::vector<const KernelStats *> &payloads) const;

  absl::Status ValidateShapes(
      const std::vector<const KernelStats *> &payloads) const;
};

}  // namespace fedmeta::controller

#endif  // FEDMETA_FEDMETA_CONTROLLER_AGGREGATION_SAMPLE_SIZE_AVERAGE_H_
