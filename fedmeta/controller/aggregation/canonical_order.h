#ifndef FEDMETA_FEDMETA_CONTROLLER_AGGREGATION_CANONICAL_ORDER_H_
#define FEDMETA_FEDMETA_CONTROLLER_AGGREGATION_CANONICAL_ORDER_H_

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace fedmeta::controller {

// Sorts payloads by their serialized bytes. Floating point sums taken in
// this order are bit-identical for any arrival order of the same set.
template <typename T>
std::vector<const T *> CanonicalOrder(const std::vector<const T *> &payloads) {
  std::vector<std::pair<std::string, const T *>> keyed;
  keyed.reserve(payloads.size());
  for (const auto *payload : payloads) {
    keyed.emplace_back(payload->SerializeAsString(), payload);
  }
  std::stable_sort(keyed.begin(), keyed.end(),
                   [](const auto &left, const auto &right) {
                     return left.first < right.first;
                   });

  std::vector<const T *> ordered;
  ordered.reserve(keyed.size());
  for (const auto &[_, payload] : keyed) ordered.push_back(payload);
  return ordered;
}

}  // namespace fedmeta::controller

#endif  // FEDMETA_FEDMETA_CONTROLLER_AGGREGATION_CANONICAL_ORDER_H_
