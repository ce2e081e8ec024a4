#include "fedmeta/controller/models/svr_solver.h"

#include <glog/logging.h>

#include <algorithm>
#include <cmath>
#include <limits>

#include "absl/strings/str_cat.h"

namespace fedmeta::controller {

namespace {

constexpr double kTau = 1e-12;
constexpr double kInf = std::numeric_limits<double>::infinity();

Eigen::MatrixXd RbfKernel(const Eigen::MatrixXd &a, const Eigen::MatrixXd &b,
                          double gamma) {
  Eigen::VectorXd a_norms = a.rowwise().squaredNorm();
  Eigen::VectorXd b_norms = b.rowwise().squaredNorm();
  Eigen::MatrixXd distances = -2.0 * a * b.transpose();
  distances.colwise() += a_norms;
  distances.rowwise() += b_norms.transpose();
  return (-gamma * distances.array().max(0.0)).exp().matrix();
}

// Index t < n is alpha_t with label +1, index t >= n is alpha*_{t-n} with
// label -1. Q(s, t) = y_s * y_t * K(s mod n, t mod n).
class SvrDual {
 public:
  SvrDual(const Eigen::MatrixXd &kernel, const Eigen::VectorXd &y,
          double epsilon, double c)
      : kernel_(kernel), n_(y.size()), c_(c) {
    const Eigen::Index l = 2 * n_;
    sign_.resize(l);
    linear_.resize(l);
    for (Eigen::Index i = 0; i < n_; ++i) {
      sign_(i) = 1.0;
      linear_(i) = epsilon - y(i);
      sign_(i + n_) = -1.0;
      linear_(i + n_) = epsilon + y(i);
    }
    alpha_ = Eigen::VectorXd::Zero(l);
  }

  void InitFrom(const Eigen::VectorXd &dual) {
    for (Eigen::Index i = 0; i < n_; ++i) {
      alpha_(i) = std::max(dual(i), 0.0);
      alpha_(i + n_) = std::max(-dual(i), 0.0);
    }
  }

  // Returns the number of iterations run.
  int64_t Solve(double tol, int64_t max_iter) {
    const Eigen::Index l = 2 * n_;
    gradient_ = linear_;
    for (Eigen::Index t = 0; t < l; ++t) {
      if (alpha_(t) != 0) {
        for (Eigen::Index s = 0; s < l; ++s) {
          gradient_(s) += alpha_(t) * Q(t, s);
        }
      }
    }

    int64_t iter = 0;
    while (iter < max_iter) {
      Eigen::Index i, j;
      if (SelectWorkingSet(tol, i, j)) break;
      ++iter;
      UpdatePair(i, j);
    }
    if (iter >= max_iter) {
      LOG(WARNING) << "SVR solver reached max_iter = " << max_iter
                   << " before convergence.";
    }
    return iter;
  }

  Eigen::VectorXd Dual() const {
    return alpha_.head(n_) - alpha_.tail(n_);
  }

  double Intercept() const {
    const Eigen::Index l = 2 * n_;
    double upper = kInf, lower = -kInf, sum_free = 0;
    int n_free = 0;
    for (Eigen::Index t = 0; t < l; ++t) {
      double yg = sign_(t) * gradient_(t);
      if (IsUpper(t)) {
        if (sign_(t) < 0) upper = std::min(upper, yg);
        else lower = std::max(lower, yg);
      } else if (IsLower(t)) {
        if (sign_(t) > 0) upper = std::min(upper, yg);
        else lower = std::max(lower, yg);
      } else {
        ++n_free;
        sum_free += yg;
      }
    }
    double rho = n_free > 0 ? sum_free / n_free : (upper + lower) / 2.0;
    return -rho;
  }

 private:
  double Q(Eigen::Index s, Eigen::Index t) const {
    return sign_(s) * sign_(t) * kernel_(s % n_, t % n_);
  }

  bool IsUpper(Eigen::Index t) const { return alpha_(t) >= c_; }
  bool IsLower(Eigen::Index t) const { return alpha_(t) <= 0; }

  // Returns true when the KKT gap is below tol.
  bool SelectWorkingSet(double tol, Eigen::Index &out_i,
                        Eigen::Index &out_j) const {
    const Eigen::Index l = 2 * n_;
    double g_max = -kInf;
    Eigen::Index i = -1;
    for (Eigen::Index t = 0; t < l; ++t) {
      if (sign_(t) > 0) {
        if (!IsUpper(t) && -gradient_(t) >= g_max) {
          g_max = -gradient_(t);
          i = t;
        }
      } else {
        if (!IsLower(t) && gradient_(t) >= g_max) {
          g_max = gradient_(t);
          i = t;
        }
      }
    }

    double g_max2 = -kInf;
    double obj_diff_min = kInf;
    Eigen::Index j = -1;
    for (Eigen::Index t = 0; t < l && i != -1; ++t) {
      double quad, grad_diff;
      if (sign_(t) > 0) {
        if (IsLower(t)) continue;
        grad_diff = g_max + gradient_(t);
        g_max2 = std::max(g_max2, gradient_(t));
        quad = Q(i, i) + Q(t, t) - 2.0 * sign_(i) * Q(i, t);
      } else {
        if (IsUpper(t)) continue;
        grad_diff = g_max - gradient_(t);
        g_max2 = std::max(g_max2, -gradient_(t));
        quad = Q(i, i) + Q(t, t) + 2.0 * sign_(i) * Q(i, t);
      }
      if (grad_diff > 0) {
        double obj_diff = -(grad_diff * grad_diff) / (quad > 0 ? quad : kTau);
        if (obj_diff <= obj_diff_min) {
          obj_diff_min = obj_diff;
          j = t;
        }
      }
    }

    out_i = i;
    out_j = j;
    return i == -1 || j == -1 || g_max + g_max2 < tol;
  }

  void UpdatePair(Eigen::Index i, Eigen::Index j) {
    const double old_i = alpha_(i);
    const double old_j = alpha_(j);
    const double q_ij = Q(i, j);

    if (sign_(i) != sign_(j)) {
      double quad = Q(i, i) + Q(j, j) + 2.0 * q_ij;
      if (quad <= 0) quad = kTau;
      double delta = (-gradient_(i) - gradient_(j)) / quad;
      double diff = alpha_(i) - alpha_(j);
      alpha_(i) += delta;
      alpha_(j) += delta;
      if (diff > 0) {
        if (alpha_(j) < 0) {
          alpha_(j) = 0;
          alpha_(i) = diff;
        }
      } else if (alpha_(i) < 0) {
        alpha_(i) = 0;
        alpha_(j) = -diff;
      }
      if (diff > 0) {
        if (alpha_(i) > c_) {
          alpha_(i) = c_;
          alpha_(j) = c_ - diff;
        }
      } else if (alpha_(j) > c_) {
        alpha_(j) = c_;
        alpha_(i) = c_ + diff;
      }
    } else {
      double quad = Q(i, i) + Q(j, j) - 2.0 * q_ij;
      if (quad <= 0) quad = kTau;
      double delta = (gradient_(i) - gradient_(j)) / quad;
      double sum = alpha_(i) + alpha_(j);
      alpha_(i) -= delta;
      alpha_(j) += delta;
      if (sum > c_) {
        if (alpha_(i) > c_) {
          alpha_(i) = c_;
          alpha_(j) = sum - c_;
        }
      } else if (alpha_(j) < 0) {
        alpha_(j) = 0;
        alpha_(i) = sum;
      }
      if (sum > c_) {
        if (alpha_(j) > c_) {
          alpha_(j) = c_;
          alpha_(i) = sum - c_;
        }
      } else if (alpha_(i) < 0) {
        alpha_(i) = 0;
        alpha_(j) = sum;
      }
    }

    const double delta_i = alpha_(i) - old_i;
    const double delta_j = alpha_(j) - old_j;
    const Eigen::Index l = 2 * n_;
    for (Eigen::Index t = 0; t < l; ++t) {
      gradient_(t) += Q(i, t) * delta_i + Q(j, t) * delta_j;
    }
  }

  const Eigen::MatrixXd &kernel_;
  Eigen::Index n_;
  double c_;
  Eigen::VectorXd sign_;
  Eigen::VectorXd linear_;
  Eigen::VectorXd alpha_;
  Eigen::VectorXd gradient_;
};

}  // namespace

Eigen::VectorXd SvrModel::Predict(const Eigen::MatrixXd &x) const {
  if (x.rows() == 0) return Eigen::VectorXd();
  Eigen::MatrixXd kernel = RbfKernel(x, training_rows, gamma);
  Eigen::VectorXd predictions = kernel * dual;
  predictions.array() += intercept;
  return predictions;
}

int SvrModel::NumSupportVectors() const {
  return static_cast<int>((dual.array().abs() > 0.0).count());
}

bool SvrSolver::IsFeasibleStart(const Eigen::VectorXd &dual, Eigen::Index n,
                                double c) {
  if (dual.size() != n || n == 0) return false;
  if (!dual.allFinite()) return false;
  if (dual.cwiseAbs().maxCoeff() > c) return false;
  return std::fabs(dual.sum()) <= 1e-6 * c;
}

double SvrSolver::ScaleGamma(const Eigen::MatrixXd &x) {
  if (x.size() == 0 || x.cols() == 0) return 1.0;
  const double mean = x.mean();
  const double variance =
      (x.array() - mean).square().sum() / static_cast<double>(x.size());
  if (!(variance > 0)) return 1.0;
  return 1.0 / (static_cast<double>(x.cols()) * variance);
}

absl::StatusOr<SvrModel> SvrSolver::Fit(
    const Eigen::MatrixXd &x, const Eigen::VectorXd &y,
    const Eigen::VectorXd *warm_start) const {
  if (x.rows() != y.size()) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Outcome has ", y.size(), " rows but features have ", x.rows()));
  }
  if (x.rows() == 0) {
    return absl::FailedPreconditionError("No training rows to fit.");
  }
  if (!(params_.c > 0) || !(params_.epsilon >= 0) || !(params_.tol > 0)) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Invalid SVR parameters: C = ", params_.c,
        ", epsilon = ", params_.epsilon, ", tol = ", params_.tol));
  }
  if (!x.allFinite() || !y.allFinite()) {
    return absl::InvalidArgumentError("Features or outcome are not finite.");
  }

  SvrModel model;
  model.gamma = params_.gamma > 0 ? params_.gamma : ScaleGamma(x);
  model.training_rows = x;

  Eigen::MatrixXd kernel = RbfKernel(x, x, model.gamma);
  SvrDual dual(kernel, y, params_.epsilon, params_.c);

  if (warm_start != nullptr) {
    if (IsFeasibleStart(*warm_start, x.rows(), params_.c)) {
      VLOG(1) << "Warm starting SVR from a dual row of width "
              << warm_start->size();
      dual.InitFrom(*warm_start);
    } else {
      LOG(WARNING) << "Ignoring warm start: a dual row of width "
                   << warm_start->size() << " is not a feasible start for "
                   << x.rows() << " training rows with C = " << params_.c;
    }
  }

  model.iterations = dual.Solve(params_.tol, params_.max_iter);
  model.dual = dual.Dual();
  model.intercept = dual.Intercept();

  if (!model.dual.allFinite() || !std::isfinite(model.intercept)) {
    return absl::InternalError("SVR solution is not finite.");
  }
  return model;
}

}  // namespace fedmeta::controller
