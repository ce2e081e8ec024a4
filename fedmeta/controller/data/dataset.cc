#include "fedmeta/controller/data/dataset.h"

#include <glog/logging.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <numeric>
#include <random>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"

namespace fedmeta::controller {

namespace {

bool ParseRow(absl::string_view line, std::vector<double> &row) {
  row.clear();
  for (absl::string_view cell : absl::StrSplit(line, ',')) {
    double value;
    if (!absl::SimpleAtod(absl::StripAsciiWhitespace(cell), &value))
      return false;
    row.push_back(value);
  }
  return true;
}

Eigen::MatrixXd SelectRows(const Eigen::MatrixXd &x,
                           const std::vector<int> &rows) {
  Eigen::MatrixXd selected(rows.size(), x.cols());
  for (size_t i = 0; i < rows.size(); ++i) selected.row(i) = x.row(rows[i]);
  return selected;
}

Eigen::VectorXd SelectRows(const Eigen::VectorXd &y,
                           const std::vector<int> &rows) {
  Eigen::VectorXd selected(rows.size());
  for (size_t i = 0; i < rows.size(); ++i) selected(i) = y(rows[i]);
  return selected;
}

}  // namespace

DatasetSplit TrainTestSplit(const Dataset &dataset, double held_out_fraction,
                            uint32_t seed) {
  const int n = dataset.NumRows();
  std::vector<int> indices(n);
  std::iota(indices.begin(), indices.end(), 0);

  std::mt19937 generator(seed);
  std::shuffle(indices.begin(), indices.end(), generator);

  int n_test = static_cast<int>(std::ceil(held_out_fraction * n));
  n_test = std::min(n_test, n);

  std::vector<int> test_rows(indices.begin(), indices.begin() + n_test);
  std::vector<int> train_rows(indices.begin() + n_test, indices.end());

  DatasetSplit split;
  split.x_train = SelectRows(dataset.features, train_rows);
  split.y_train = SelectRows(dataset.outcome, train_rows);
  split.x_test = SelectRows(dataset.features, test_rows);
  split.y_test = SelectRows(dataset.outcome, test_rows);
  return split;
}

void StandardScaler::Fit(const Eigen::MatrixXd &x) {
  const auto n = static_cast<double>(x.rows());
  mean_ = Eigen::RowVectorXd::Zero(x.cols());
  scale_ = Eigen::RowVectorXd::Ones(x.cols());
  if (x.rows() == 0) return;

  mean_ = x.colwise().mean();
  for (Eigen::Index j = 0; j < x.cols(); ++j) {
    // Population variance, as the fitted models expect.
    double variance = (x.col(j).array() - mean_(j)).square().sum() / n;
    double sd = std::sqrt(variance);
    scale_(j) = sd > 0 ? sd : 1.0;
  }
}

Eigen::MatrixXd StandardScaler::Transform(const Eigen::MatrixXd &x) const {
  Eigen::MatrixXd scaled = x;
  scaled.rowwise() -= mean_;
  scaled.array().rowwise() /= scale_.array();
  return scaled;
}

absl::StatusOr<Dataset> CsvDatasetSource::Load() {
  std::ifstream file(path_);
  if (!file.is_open()) {
    return absl::NotFoundError(absl::StrCat("Cannot open dataset ", path_));
  }

  std::vector<std::vector<double>> rows;
  std::vector<double> row;
  std::string line;
  int line_no = 0;
  bool first_row = true;
  while (std::getline(file, line)) {
    ++line_no;
    auto stripped = absl::StripAsciiWhitespace(line);
    if (stripped.empty()) continue;
    const bool may_be_header = first_row;
    first_row = false;
    if (!ParseRow(stripped, row)) {
      if (may_be_header) {
        VLOG(1) << "Skipping header row of " << path_;
        continue;
      }
      return absl::InvalidArgumentError(
          absl::StrCat(path_, ":", line_no, ": non-numeric value"));
    }
    if (!rows.empty() && row.size() != rows.front().size()) {
      return absl::InvalidArgumentError(
          absl::StrCat(path_, ":", line_no, ": expected ",
                       rows.front().size(), " columns, found ", row.size()));
    }
    rows.push_back(row);
  }

  Dataset dataset;
  if (rows.empty()) return dataset;

  const auto n_cols = rows.front().size();
  if (n_cols < 2) {
    return absl::InvalidArgumentError(absl::StrCat(
        path_, ": need at least one feature column and an outcome column"));
  }

  dataset.features.resize(rows.size(), n_cols - 1);
  dataset.outcome.resize(rows.size());
  for (size_t i = 0; i < rows.size(); ++i) {
    for (size_t j = 0; j + 1 < n_cols; ++j) dataset.features(i, j) = rows[i][j];
    dataset.outcome(i) = rows[i][n_cols - 1];
  }
  return dataset;
}

}  // namespace fedmeta::controller
