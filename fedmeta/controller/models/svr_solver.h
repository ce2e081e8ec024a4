#ifndef FEDMETA_FEDMETA_CONTROLLER_MODELS_SVR_SOLVER_H_
#define FEDMETA_FEDMETA_CONTROLLER_MODELS_SVR_SOLVER_H_

#include <cstdint>

#include <Eigen/Dense>

#include "absl/status/statusor.h"

namespace fedmeta::controller {

struct SvrParams {
  double c = 1.0;
  double epsilon = 0.1;
  // <= 0 selects "scale": 1 / (n_features * var(X)).
  double gamma = 0.0;
  double tol = 1e-3;
  int64_t max_iter = 10000000;
};

// f(x) = sum_i dual_i * exp(-gamma * |x_i - x|^2) + intercept, with x_i the
// training rows. dual_i = alpha_i - alpha_i* is 0 for non-support rows.
struct SvrModel {
  Eigen::MatrixXd training_rows;
  Eigen::VectorXd dual;
  double intercept = 0;
  double gamma = 0;
  int64_t iterations = 0;

  Eigen::VectorXd Predict(const Eigen::MatrixXd &x) const;

  int NumSupportVectors() const;
};

/**
 * epsilon-SVR with an RBF kernel.
 *
 * The dual is solved over 2n variables (alpha, alpha*) with SMO: the working
 * pair is the maximal violating index plus the partner with the best
 * second-order objective decrease, the same selection libsvm uses. The full
 * n x n kernel matrix is kept in memory.
 *
 * A warm start is a dual row from a previous fit. It is used as the initial
 * point only if it is feasible for this problem (see IsFeasibleStart);
 * otherwise the solver starts from zero.
 */
class SvrSolver {
 public:
  explicit SvrSolver(const SvrParams &params) : params_(params) {}

  absl::StatusOr<SvrModel> Fit(
      const Eigen::MatrixXd &x, const Eigen::VectorXd &y,
      const Eigen::VectorXd *warm_start = nullptr) const;

  // One entry per training row, every entry in [-C, C], entries summing to
  // zero within 1e-6 * C.
  static bool IsFeasibleStart(const Eigen::VectorXd &dual, Eigen::Index n,
                              double c);

  static double ScaleGamma(const Eigen::MatrixXd &x);

  const SvrParams &params() const { return params_; }

 private:
  SvrParams params_;
};

}  // namespace fedmeta::controller

#endif  // FEDMETA_FEDMETA_CONTROLLER_MODELS_SVR_SOLVER_H_
