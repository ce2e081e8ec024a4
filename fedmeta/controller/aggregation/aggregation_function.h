#ifndef FEDMETA_FEDMETA_CONTROLLER_AGGREGATION_AGGREGATION_FUNCTION_H_
#define FEDMETA_FEDMETA_CONTROLLER_AGGREGATION_AGGREGATION_FUNCTION_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"

namespace fedmeta::controller {

// Combines the local payloads of one round into the global payload. Inputs
// are never mutated and the result does not depend on their order.
template <typename LocalStats, typename GlobalStats>
class AggregationFunction {
 public:
  virtual ~AggregationFunction() = default;

  virtual absl::StatusOr<GlobalStats> Aggregate(
      const std::vector<const LocalStats *> &payloads) const = 0;

  virtual std::string Name() const = 0;
};

}  // namespace fedmeta::controller

#endif  // FEDMETA_FEDMETA_CONTROLLER_AGGREGATION_AGGREGATION_FUNCTION_H_
