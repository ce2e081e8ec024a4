#include "fedmeta/controller/models/ols_fitter.h"

#include <algorithm>
#include <cmath>

#include "absl/strings/str_cat.h"
#include "fedmeta/controller/stats/distributions.h"

namespace fedmeta::controller {

absl::StatusOr<OlsFit> OlsFitter::Fit(const Eigen::VectorXd &y,
                                      const Eigen::MatrixXd &X, double alpha) {
  const Eigen::Index n = X.rows();
  const Eigen::Index p = X.cols() + 1;

  if (y.size() != n) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Outcome has ", y.size(), " rows but design matrix has ", n));
  }
  if (n <= p) {
    return absl::FailedPreconditionError(
        absl::StrCat("Need more observations than parameters: n = ", n,
                     ", p = ", p));
  }
  if (!X.allFinite() || !y.allFinite()) {
    return absl::InvalidArgumentError(
        "Design matrix or outcome is not finite.");
  }

  Eigen::MatrixXd design(n, p);
  design.col(0).setOnes();
  design.rightCols(p - 1) = X;

  Eigen::ColPivHouseholderQR<Eigen::MatrixXd> qr(design);
  if (qr.rank() < p) {
    return absl::FailedPreconditionError(
        absl::StrCat("Design matrix is rank deficient: rank ", qr.rank(),
                     " < ", p, " columns."));
  }

  OlsFit fit;
  fit.n_obs = static_cast<int>(n);
  fit.coefficients = qr.solve(y);

  Eigen::VectorXd fitted = design * fit.coefficients;
  Eigen::VectorXd residuals = y - fitted;
  const double y_mean = y.mean();

  fit.ss_residual = residuals.squaredNorm();
  fit.ss_model = (fitted.array() - y_mean).square().sum();
  fit.ss_total = fit.ss_model + fit.ss_residual;
  fit.df_model = static_cast<double>(p - 1);
  fit.df_residual = static_cast<double>(n - p);

  fit.r_squared =
      fit.ss_total > 0 ? 1.0 - fit.ss_residual / fit.ss_total : 0.0;
  fit.adj_r_squared = 1.0 - (1.0 - fit.r_squared) *
                                (static_cast<double>(n) - 1.0) /
                                fit.df_residual;

  // (X'X)^-1 = P R^-1 R^-T P^T from X P = Q R.
  Eigen::MatrixXd R =
      qr.matrixQR().topLeftCorner(p, p).triangularView<Eigen::Upper>();
  Eigen::MatrixXd R_inv = R.triangularView<Eigen::Upper>().solve(
      Eigen::MatrixXd::Identity(p, p));
  Eigen::MatrixXd xtx_inv = qr.colsPermutation() *
                            (R_inv * R_inv.transpose()) *
                            qr.colsPermutation().transpose();

  const double sigma2 = fit.ss_residual / fit.df_residual;
  const double t_crit =
      Distributions::StudentTQuantile(1.0 - alpha / 2.0, fit.df_residual);

  fit.std_errors.resize(p);
  fit.t_values.resize(p);
  fit.p_values.resize(p);
  fit.conf_int_lower.resize(p);
  fit.conf_int_upper.resize(p);
  for (Eigen::Index j = 0; j < p; ++j) {
    double se = std::sqrt(std::max(0.0, sigma2 * xtx_inv(j, j)));
    double b = fit.coefficients(j);
    fit.std_errors(j) = se;
    if (se > 0) {
      fit.t_values(j) = b / se;
      fit.p_values(j) = Distributions::StudentTTwoSidedPValue(
          fit.t_values(j), fit.df_residual);
    } else {
      fit.t_values(j) = 0;
      fit.p_values(j) = 1.0;
    }
    fit.conf_int_lower(j) = b - t_crit * se;
    fit.conf_int_upper(j) = b + t_crit * se;
  }

  if (fit.df_model > 0 && fit.ss_residual > 0) {
    fit.f_statistic = (fit.ss_model / fit.df_model) /
                      (fit.ss_residual / fit.df_residual);
    fit.f_pvalue = Distributions::FUpperTailPValue(
        fit.f_statistic, fit.df_model, fit.df_residual);
  } else {
    fit.f_statistic = 0;
    fit.f_pvalue = 1.0;
  }

  if (!fit.coefficients.allFinite() || !fit.std_errors.allFinite()) {
    return absl::InternalError("Least squares solution is not finite.");
  }
  return fit;
}

double OlsFitter::PartialEtaSquared(const OlsFit &fit, int n_group_columns) {
  if (n_group_columns <= 0 || n_group_columns >= fit.t_values.size()) {
    return 0.0;
  }

  double t_squared_sum = 0;
  for (int i = 1; i <= n_group_columns; ++i) {
    t_squared_sum += fit.t_values(i) * fit.t_values(i);
  }

  double denominator = t_squared_sum + fit.df_residual;
  return denominator > 0 ? t_squared_sum / denominator : 0.0;
}

}  // namespace fedmeta::controller
