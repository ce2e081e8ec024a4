#include "fedmeta/controller/stats/distributions.h"

#include <boost/math/distributions/fisher_f.hpp>
#include <boost/math/distributions/normal.hpp>
#include <boost/math/distributions/students_t.hpp>

#include <cmath>

namespace fedmeta::controller {

double Distributions::StudentTTwoSidedPValue(double t, double df) {
  if (!(df > 0) || std::isnan(t)) return 1.0;
  if (std::isinf(t)) return 0.0;
  auto d = boost::math::students_t(df);
  return 2.0 * boost::math::cdf(boost::math::complement(d, std::fabs(t)));
}

double Distributions::StudentTQuantile(double probability, double df) {
  if (!(df > 0) || !(probability > 0) || !(probability < 1)) return 0.0;
  auto d = boost::math::students_t(df);
  return boost::math::quantile(d, probability);
}

double Distributions::FUpperTailPValue(double f, double df1, double df2) {
  if (!(df1 > 0) || !(df2 > 0) || !(f > 0)) return 1.0;
  if (std::isinf(f)) return 0.0;
  auto d = boost::math::fisher_f(df1, df2);
  return boost::math::cdf(boost::math::complement(d, f));
}

double Distributions::NormalTwoSidedPValue(double z) {
  if (std::isnan(z)) return 1.0;
  if (std::isinf(z)) return 0.0;
  auto d = boost::math::normal(0.0, 1.0);
  return 2.0 * boost::math::cdf(boost::math::complement(d, std::fabs(z)));
}

}  // namespace fedmeta::controller
