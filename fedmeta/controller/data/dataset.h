#ifndef FEDMETA_FEDMETA_CONTROLLER_DATA_DATASET_H_
#define FEDMETA_FEDMETA_CONTROLLER_DATA_DATASET_H_

#include <cstdint>
#include <memory>
#include <string>

#include <Eigen/Dense>

#include "absl/status/statusor.h"

namespace fedmeta::controller {

// A site's local records: one row per record, outcome held separately.
struct Dataset {
  Eigen::MatrixXd features;
  Eigen::VectorXd outcome;

  int NumRows() const { return static_cast<int>(outcome.size()); }
  int NumFeatures() const { return static_cast<int>(features.cols()); }
  bool Empty() const { return outcome.size() == 0; }
};

struct DatasetSplit {
  Eigen::MatrixXd x_train;
  Eigen::VectorXd y_train;
  Eigen::MatrixXd x_test;
  Eigen::VectorXd y_test;
};

constexpr double kHeldOutFraction = 0.2;
constexpr uint32_t kSplitSeed = 42;

// Shuffles the row indices with a seeded generator and holds out
// ceil(fraction * n) rows. Same dataset and seed, same split.
DatasetSplit TrainTestSplit(const Dataset &dataset,
                            double held_out_fraction = kHeldOutFraction,
                            uint32_t seed = kSplitSeed);

// Zero mean, unit variance per column, fit on one matrix and applied to
// others. Columns with zero variance are only centered.
class StandardScaler {
 public:
  void Fit(const Eigen::MatrixXd &x);

  Eigen::MatrixXd Transform(const Eigen::MatrixXd &x) const;

  Eigen::MatrixXd FitTransform(const Eigen::MatrixXd &x) {
    Fit(x);
    return Transform(x);
  }

  const Eigen::RowVectorXd &mean() const { return mean_; }
  const Eigen::RowVectorXd &scale() const { return scale_; }

 private:
  Eigen::RowVectorXd mean_;
  Eigen::RowVectorXd scale_;
};

class DatasetSource {
 public:
  virtual ~DatasetSource() = default;

  // An empty dataset is a valid result; a missing or malformed one is not.
  virtual absl::StatusOr<Dataset> Load() = 0;

  virtual std::string Name() const = 0;
};

// Numeric CSV, last column is the outcome. A first row that does not parse
// as numbers is treated as a header.
class CsvDatasetSource : public DatasetSource {
 public:
  explicit CsvDatasetSource(std::string path) : path_(std::move(path)) {}

  absl::StatusOr<Dataset> Load() override;

  inline std::string Name() const override { return "CsvDatasetSource"; }

 private:
  std::string path_;
};

class InMemoryDatasetSource : public DatasetSource {
 public:
  explicit InMemoryDatasetSource(Dataset dataset)
      : dataset_(std::move(dataset)) {}

  absl::StatusOr<Dataset> Load() override { return dataset_; }

  inline std::string Name() const override { return "InMemoryDatasetSource"; }

 private:
  Dataset dataset_;
};

}  // namespace fedmeta::controller

#endif  // FEDMETA_FEDMETA_CONTROLLER_DATA_DATASET_H_
