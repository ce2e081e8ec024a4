#ifndef FEDMETA_FEDMETA_CONTROLLER_SCALING_SCALING_H_
#define FEDMETA_FEDMETA_CONTROLLER_SCALING_SCALING_H_

#include <cmath>
#include <cstdint>
#include <vector>

namespace fedmeta::controller {
class Scaling {
 public:
  // Each site's share of the total sample size. All zeros if the total is 0.
  static std::vector<double> GetDatasetScalingFactors(
      const std::vector<int> &sample_sizes) {
    int64_t total_examples = 0;
    for (auto num_examples : sample_sizes) {
      total_examples += num_examples;
    }

    std::vector<double> scaling_factors(sample_sizes.size(), 0.0);
    if (total_examples <= 0) return scaling_factors;

    for (size_t i = 0; i < sample_sizes.size(); ++i) {
      scaling_factors[i] = static_cast<double>(sample_sizes[i]) /
                           static_cast<double>(total_examples);
    }
    return scaling_factors;
  }

  // 1 / se^2 per site, 0 where se is 0 or so small that 1 / se^2
  // overflows.
  static std::vector<double> GetInverseVarianceFactors(
      const std::vector<double> &std_errors) {
    std::vector<double> weights(std_errors.size(), 0.0);
    for (size_t i = 0; i < std_errors.size(); ++i) {
      const double se = std_errors[i];
      if (!(se > 0)) continue;
      const double weight = 1.0 / (se * se);
      if (std::isfinite(weight)) weights[i] = weight;
    }
    return weights;
  }
};
}  // namespace fedmeta::controller

#endif  // FEDMETA_FEDMETA_CONTROLLER_SCALING_SCALING_H_
