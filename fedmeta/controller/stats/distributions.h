#ifndef FEDMETA_FEDMETA_CONTROLLER_STATS_DISTRIBUTIONS_H_
#define FEDMETA_FEDMETA_CONTROLLER_STATS_DISTRIBUTIONS_H_

namespace fedmeta::controller {

// Thin wrappers over Boost.Math. Degenerate arguments (non-positive degrees
// of freedom, non-finite statistics) map to the conservative answer instead
// of raising, so callers can keep every payload field finite.
class Distributions {
 public:
  // P(|T| >= |t|) for T ~ Student-t(df). 1.0 when df <= 0.
  static double StudentTTwoSidedPValue(double t, double df);

  // Quantile q with P(T <= q) = probability. 0 when df <= 0.
  static double StudentTQuantile(double probability, double df);

  // P(F >= f) for F ~ F(df1, df2). 1.0 when either df <= 0 or f <= 0.
  static double FUpperTailPValue(double f, double df1, double df2);

  // 2 * (1 - Phi(|z|)).
  static double NormalTwoSidedPValue(double z);
};

}  // namespace fedmeta::controller

#endif  // FEDMETA_FEDMETA_CONTROLLER_STATS_DISTRIBUTIONS_H_
