#include "fedmeta/controller/data/dataset.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cmath>
#include <fstream>
#include <set>
#include <string>

namespace fedmeta::controller {
namespace {

std::string WriteFile(const std::string &name, const std::string &content) {
  std::string path = ::testing::TempDir() + "/" + name;
  std::ofstream out(path, std::ios::trunc);
  out << content;
  return path;
}

Dataset MakeDataset(int n) {
  Dataset dataset;
  dataset.features.resize(n, 2);
  dataset.outcome.resize(n);
  for (int i = 0; i < n; ++i) {
    dataset.features(i, 0) = i % 2;
    dataset.features(i, 1) = 10.0 * i;
    dataset.outcome(i) = i;
  }
  return dataset;
}

TEST(TrainTestSplit, HoldsOutCeilOfTwentyPercent) {
  auto split = TrainTestSplit(MakeDataset(10));
  EXPECT_EQ(split.x_test.rows(), 2);
  EXPECT_EQ(split.x_train.rows(), 8);

  split = TrainTestSplit(MakeDataset(11));
  EXPECT_EQ(split.x_test.rows(), 3);
  EXPECT_EQ(split.y_train.size(), 8);
}

TEST(TrainTestSplit, PartitionsEveryRowOnce) {
  auto dataset = MakeDataset(37);
  auto split = TrainTestSplit(dataset);

  std::set<double> seen;
  for (int i = 0; i < split.y_train.size(); ++i) {
    // Rows stay aligned with their outcome.
    EXPECT_DOUBLE_EQ(split.x_train(i, 1), 10.0 * split.y_train(i));
    seen.insert(split.y_train(i));
  }
  for (int i = 0; i < split.y_test.size(); ++i) seen.insert(split.y_test(i));
  EXPECT_EQ(seen.size(), 37u);
}

TEST(TrainTestSplit, IsDeterministic) {
  auto dataset = MakeDataset(50);
  auto first = TrainTestSplit(dataset);
  auto second = TrainTestSplit(dataset);
  EXPECT_EQ(first.y_test, second.y_test);
  EXPECT_EQ(first.x_train, second.x_train);

  auto reseeded = TrainTestSplit(dataset, kHeldOutFraction, kSplitSeed + 1);
  EXPECT_NE(first.y_test, reseeded.y_test);
}

TEST(StandardScaler, CentersAndScalesOnFittedData) {
  Eigen::MatrixXd train(4, 2);
  train << 1, 5, 2, 5, 3, 5, 4, 5;
  StandardScaler scaler;
  Eigen::MatrixXd scaled = scaler.FitTransform(train);

  EXPECT_NEAR(scaler.mean()(0), 2.5, 1e-12);
  EXPECT_NEAR(scaler.scale()(0), std::sqrt(1.25), 1e-12);
  // Zero variance column keeps a unit scale.
  EXPECT_DOUBLE_EQ(scaler.scale()(1), 1.0);
  EXPECT_NEAR(scaled.col(0).mean(), 0.0, 1e-12);
  EXPECT_NEAR(scaled.col(0).squaredNorm() / 4.0, 1.0, 1e-12);
  EXPECT_DOUBLE_EQ(scaled.col(1).cwiseAbs().maxCoeff(), 0.0);

  Eigen::MatrixXd test(1, 2);
  test << 2.5, 6;
  Eigen::MatrixXd scaled_test = scaler.Transform(test);
  EXPECT_DOUBLE_EQ(scaled_test(0, 0), 0.0);
  EXPECT_DOUBLE_EQ(scaled_test(0, 1), 1.0);
}

TEST(CsvDatasetSource, LoadsWithHeader) {
  auto path = WriteFile("with_header.csv",
                        "group,age,outcome\n"
                        "1,34.5,2.0\n"
                        "0,41,3.5\n"
                        "\n"
                        "1, 29 ,1.25\n");
  CsvDatasetSource source(path);
  auto dataset = source.Load();
  ASSERT_TRUE(dataset.ok()) << dataset.status();

  EXPECT_EQ(dataset->NumRows(), 3);
  EXPECT_EQ(dataset->NumFeatures(), 2);
  EXPECT_DOUBLE_EQ(dataset->features(2, 1), 29.0);
  EXPECT_DOUBLE_EQ(dataset->outcome(2), 1.25);
}

TEST(CsvDatasetSource, HeaderAfterBlankLines) {
  auto path = WriteFile("blank_then_header.csv",
                        "\n"
                        "  \n"
                        "group,outcome\n"
                        "1,2.5\n"
                        "0,4\n");
  auto dataset = CsvDatasetSource(path).Load();
  ASSERT_TRUE(dataset.ok()) << dataset.status();
  EXPECT_EQ(dataset->NumRows(), 2);
  EXPECT_DOUBLE_EQ(dataset->outcome(1), 4.0);

  // Only the first non-blank line may be a header.
  auto two_headers = WriteFile("two_headers.csv",
                               "group,outcome\n"
                               "group,outcome\n"
                               "1,2.5\n");
  EXPECT_TRUE(absl::IsInvalidArgument(
      CsvDatasetSource(two_headers).Load().status()));
}

TEST(CsvDatasetSource, LoadsWithoutHeader) {
  auto path = WriteFile("no_header.csv", "0,1,2\n3,4,5\n");
  auto dataset = CsvDatasetSource(path).Load();
  ASSERT_TRUE(dataset.ok()) << dataset.status();
  EXPECT_EQ(dataset->NumRows(), 2);
  EXPECT_DOUBLE_EQ(dataset->features(0, 0), 0.0);
  EXPECT_DOUBLE_EQ(dataset->outcome(1), 5.0);
}

TEST(CsvDatasetSource, EmptyFileIsEmptyDataset) {
  auto path = WriteFile("empty.csv", "");
  auto dataset = CsvDatasetSource(path).Load();
  ASSERT_TRUE(dataset.ok()) << dataset.status();
  EXPECT_TRUE(dataset->Empty());

  path = WriteFile("header_only.csv", "group,outcome\n");
  dataset = CsvDatasetSource(path).Load();
  ASSERT_TRUE(dataset.ok()) << dataset.status();
  EXPECT_TRUE(dataset->Empty());
}

TEST(CsvDatasetSource, MissingFileIsNotFound) {
  auto dataset =
      CsvDatasetSource(::testing::TempDir() + "/does_not_exist.csv").Load();
  EXPECT_TRUE(absl::IsNotFound(dataset.status()));
}

TEST(CsvDatasetSource, RejectsMalformedRows) {
  auto ragged = WriteFile("ragged.csv", "1,2,3\n4,5\n");
  EXPECT_TRUE(
      absl::IsInvalidArgument(CsvDatasetSource(ragged).Load().status()));

  auto text = WriteFile("text.csv", "1,2,3\n4,five,6\n");
  EXPECT_TRUE(absl::IsInvalidArgument(CsvDatasetSource(text).Load().status()));

  auto single = WriteFile("single_column.csv", "1\n2\n");
  EXPECT_TRUE(
      absl::IsInvalidArgument(CsvDatasetSource(single).Load().status()));
}

}  // namespace
}  // namespace fedmeta::controller
