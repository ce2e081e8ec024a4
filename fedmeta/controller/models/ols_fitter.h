#ifndef FEDMETA_FEDMETA_CONTROLLER_MODELS_OLS_FITTER_H_
#define FEDMETA_FEDMETA_CONTROLLER_MODELS_OLS_FITTER_H_

#include <Eigen/Dense>

#include "absl/status/statusor.h"

namespace fedmeta::controller {

// Result of an intercept-augmented least squares fit. Index 0 of every
// coefficient vector is the intercept, index j + 1 is column j of X.
struct OlsFit {
  Eigen::VectorXd coefficients;
  Eigen::VectorXd std_errors;
  Eigen::VectorXd t_values;
  Eigen::VectorXd p_values;
  Eigen::VectorXd conf_int_lower;
  Eigen::VectorXd conf_int_upper;

  double r_squared = 0;
  double adj_r_squared = 0;
  double f_statistic = 0;
  double f_pvalue = 1;

  double ss_model = 0;
  double ss_residual = 0;
  double ss_total = 0;
  double df_model = 0;
  double df_residual = 0;

  int n_obs = 0;
};

/**
 * Ordinary Least Squares with an intercept column prepended to X.
 *
 * Uses Eigen's ColPivHouseholderQR. Rank deficient designs and designs with
 * no residual degrees of freedom are rejected rather than producing
 * non-finite standard errors.
 *
 * Inference:
 * - se_j = sqrt(sigma^2 * [(X'X)^-1]_jj), sigma^2 = SSR / (n - p)
 * - t_j = b_j / se_j, two-sided p from Student-t(n - p)
 * - CI_j = b_j -/+ t_{1 - alpha/2, n - p} * se_j
 * - F = (SSM / df_model) / (SSR / df_residual), upper-tail p from F
 *
 * A coefficient with a zero standard error (exact fit) reports t = 0 and
 * p = 1 so that the payload stays finite.
 */
class OlsFitter {
 public:
  static absl::StatusOr<OlsFit> Fit(const Eigen::VectorXd &y,
                                    const Eigen::MatrixXd &X,
                                    double alpha = 0.05);

  // sum(t_i^2) / (sum(t_i^2) + df_residual) over coefficient indices
  // 1..n_group_columns. Valid for single-df effects only; this is not the
  // Type-III partial eta-squared. 0 when there are no group columns, the
  // indices fall outside the fit, or the denominator is 0.
  static double PartialEtaSquared(const OlsFit &fit, int n_group_columns);
};

}  // namespace fedmeta::controller

#endif  // FEDMETA_FEDMETA_CONTROLLER_MODELS_OLS_FITTER_H_
