#include "fedmeta/controller/core/round_lifecycle.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <glog/logging.h>

#include <mutex>
#include <random>
#include <stdexcept>

#include "fedmeta/controller/common/proto_json.h"
#include "fedmeta/controller/store/hash_map/hash_map_artifact_store.h"
#include "fedmeta/proto/payload.pb.h"

namespace fedmeta::controller {
namespace {

using fedmeta::proto::JsonOps;
using ::testing::Contains;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Not;
using ::testing::Return;
using ::testing::SizeIs;
using ::testing::Throw;

// Column 0 is a group dummy, column 1 a covariate.
Dataset GroupDataset(int n, uint32_t seed = 7) {
  std::mt19937 generator(seed);
  std::normal_distribution<double> noise(0.0, 0.5);
  Dataset dataset;
  dataset.features.resize(n, 2);
  dataset.outcome.resize(n);
  for (int i = 0; i < n; ++i) {
    double group = i % 2;
    double covariate = 0.1 * i;
    dataset.features(i, 0) = group;
    dataset.features(i, 1) = covariate;
    dataset.outcome(i) = 1.0 + 2.0 * group + 0.5 * covariate + noise(generator);
  }
  return dataset;
}

// Collects every WARNING or worse while registered.
class WarningCollector : public google::LogSink {
 public:
  WarningCollector() { google::AddLogSink(this); }
  ~WarningCollector() override { google::RemoveLogSink(this); }

  void send(google::LogSeverity severity, const char *full_filename,
            const char *base_filename, int line, const struct ::tm *tm_time,
            const char *message, size_t message_len) override {
    if (severity < google::GLOG_WARNING) return;
    std::lock_guard<std::mutex> lock(mutex_);
    warnings_.emplace_back(message, message_len);
  }

  std::vector<std::string> warnings() {
    std::lock_guard<std::mutex> lock(mutex_);
    return warnings_;
  }

 private:
  std::mutex mutex_;
  std::vector<std::string> warnings_;
};

class MockFitLifecycle : public RoundLifecycle {
 public:
  using RoundLifecycle::RoundLifecycle;

  MOCK_METHOD(absl::StatusOr<std::string>, Fit, (), (override));
};

class RoundLifecycleTest : public ::testing::Test {
 protected:
  RoundLifecycle MakeSite(const std::string &participant, DatasetSource *source,
                          RoundKey key) {
    return RoundLifecycle(std::move(key), participant,
                          ModelTask(std::in_place_type<LinearCovariateTask>, 1),
                          source, &store_);
  }

  std::vector<ParticipantBlob> Published(const RoundKey &key) {
    auto blobs = store_.ListLocal(key);
    EXPECT_TRUE(blobs.ok());
    return blobs.ok() ? *blobs : std::vector<ParticipantBlob>();
  }

  HashMapArtifactStore store_;
  RoundKey first_round_{"run-1", 1, 1};
};

TEST_F(RoundLifecycleTest, LinearSitePublishesLocalStats) {
  InMemoryDatasetSource source(GroupDataset(50));
  auto site = MakeSite("site1", &source, first_round_);

  auto status = site.Run();
  ASSERT_TRUE(status.ok()) << status;
  EXPECT_EQ(site.state(), RoundState::kPublished);

  auto blobs = Published(first_round_);
  ASSERT_THAT(blobs, SizeIs(1));
  EXPECT_EQ(blobs[0].first, "site1");

  LinearLocalStats stats;
  ASSERT_TRUE(JsonOps::FromJsonLine(blobs[0].second, &stats).ok());
  EXPECT_EQ(stats.sample_size(), 40);
  EXPECT_EQ(stats.coef_size(), 3);
  EXPECT_EQ(stats.n_group_columns(), 1);
  EXPECT_DOUBLE_EQ(stats.df_model(), 2);
  EXPECT_DOUBLE_EQ(stats.df_residual(), 37);
  EXPECT_NEAR(stats.coef(1), 2.0, 0.5);
  EXPECT_GT(stats.partial_eta_squared(), 0.0);
  EXPECT_LE(stats.partial_eta_squared(), 1.0);
}

TEST_F(RoundLifecycleTest, SmallSampleStillPublishes) {
  InMemoryDatasetSource source(GroupDataset(10));
  auto site = MakeSite("small", &source, first_round_);

  WarningCollector collector;
  auto status = site.Run();
  ASSERT_TRUE(status.ok()) << status;
  EXPECT_EQ(site.state(), RoundState::kPublished);
  EXPECT_THAT(Published(first_round_), SizeIs(1));
  EXPECT_THAT(collector.warnings(),
              Contains(HasSubstr("Sample size (10) is below minimum "
                                 "threshold (30)")));
}

TEST_F(RoundLifecycleTest, LargeSampleLogsNoAdvisory) {
  InMemoryDatasetSource source(GroupDataset(50));
  auto site = MakeSite("large", &source, first_round_);

  WarningCollector collector;
  ASSERT_TRUE(site.Run().ok());
  EXPECT_THAT(collector.warnings(),
              Not(Contains(HasSubstr("below minimum threshold"))));
}

TEST_F(RoundLifecycleTest, ThrowingFitFailsWithoutPublishing) {
  InMemoryDatasetSource source(GroupDataset(50));
  MockFitLifecycle site(first_round_, "throws",
                        ModelTask(std::in_place_type<LinearCovariateTask>, 1),
                        &source, &store_);
  EXPECT_CALL(site, Fit())
      .WillOnce(Throw(std::runtime_error("matrix is singular")));

  ASSERT_TRUE(site.PrepareData().ok());
  ASSERT_TRUE(site.Validate().ok());
  auto status = site.Training();
  EXPECT_TRUE(absl::IsInternal(status)) << status;
  EXPECT_THAT(std::string(status.message()), HasSubstr("matrix is singular"));
  EXPECT_EQ(site.state(), RoundState::kFailed);
  EXPECT_EQ(site.status(), status);
  EXPECT_THAT(Published(first_round_), IsEmpty());
}

TEST_F(RoundLifecycleTest, FitPayloadIsPublishedVerbatim) {
  InMemoryDatasetSource source(GroupDataset(50));
  MockFitLifecycle site(first_round_, "stub",
                        ModelTask(std::in_place_type<LinearCovariateTask>, 1),
                        &source, &store_);
  EXPECT_CALL(site, Fit())
      .WillOnce(Return(absl::StatusOr<std::string>("{\"sample_size\":1}")));

  ASSERT_TRUE(site.Run().ok());
  auto blobs = Published(first_round_);
  ASSERT_THAT(blobs, SizeIs(1));
  EXPECT_EQ(blobs[0].second, "{\"sample_size\":1}");
}

TEST_F(RoundLifecycleTest, EmptyDatasetFailsPrepareData) {
  InMemoryDatasetSource source{Dataset()};
  auto site = MakeSite("empty", &source, first_round_);

  auto status = site.PrepareData();
  EXPECT_TRUE(absl::IsUnavailable(status));
  EXPECT_EQ(site.state(), RoundState::kFailed);
  EXPECT_EQ(site.status(), status);
  EXPECT_THAT(Published(first_round_), IsEmpty());
}

TEST_F(RoundLifecycleTest, MissingDatasetFailsPrepareData) {
  CsvDatasetSource source(::testing::TempDir() + "/no_such_site.csv");
  auto site = MakeSite("missing", &source, first_round_);

  EXPECT_TRUE(absl::IsNotFound(site.Run()));
  EXPECT_EQ(site.state(), RoundState::kFailed);
}

TEST_F(RoundLifecycleTest, FitFailurePublishesNothing) {
  // Every row in the same group: the dummy duplicates the intercept.
  auto dataset = GroupDataset(40);
  dataset.features.col(0).setOnes();
  InMemoryDatasetSource source(dataset);
  auto site = MakeSite("collinear", &source, first_round_);

  ASSERT_TRUE(site.PrepareData().ok());
  ASSERT_TRUE(site.Validate().ok());
  auto status = site.Training();
  EXPECT_TRUE(absl::IsFailedPrecondition(status)) << status;
  EXPECT_EQ(site.state(), RoundState::kFailed);
  EXPECT_THAT(Published(first_round_), IsEmpty());
}

TEST_F(RoundLifecycleTest, StagesMustRunInOrder) {
  InMemoryDatasetSource source(GroupDataset(40));
  auto site = MakeSite("site1", &source, first_round_);

  EXPECT_TRUE(absl::IsFailedPrecondition(site.Training()));
  EXPECT_TRUE(absl::IsFailedPrecondition(site.Validate()));
  EXPECT_EQ(site.state(), RoundState::kInitial);

  ASSERT_TRUE(site.PrepareData().ok());
  EXPECT_EQ(site.state(), RoundState::kDataReady);
  EXPECT_TRUE(absl::IsFailedPrecondition(site.PrepareData()));
  EXPECT_EQ(site.state(), RoundState::kDataReady);
}

TEST_F(RoundLifecycleTest, LaterRoundNeedsPreviousGlobal) {
  InMemoryDatasetSource source(GroupDataset(40));
  RoundKey second_round{"run-1", 1, 2};
  auto site = MakeSite("site1", &source, second_round);

  ASSERT_TRUE(site.PrepareData().ok());
  EXPECT_TRUE(absl::IsNotFound(site.Validate()));
  EXPECT_EQ(site.state(), RoundState::kFailed);
  EXPECT_THAT(Published(second_round), IsEmpty());
}

TEST_F(RoundLifecycleTest, LaterRoundValidatesWithPreviousGlobal) {
  InMemoryDatasetSource source(GroupDataset(40));
  RoundKey second_round{"run-1", 1, 2};
  ASSERT_TRUE(store_
                  .WriteGlobal(first_round_,
                               R"({"total_sample_size": 64, "n_sites": 2,)"
                               R"( "coef_": [1.0, 2.0, 0.5]})")
                  .ok());
  auto site = MakeSite("site1", &source, second_round);

  auto status = site.Run();
  ASSERT_TRUE(status.ok()) << status;
  EXPECT_THAT(Published(second_round), SizeIs(1));
}

TEST_F(RoundLifecycleTest, PreviousGlobalOfOtherSequenceDoesNotCount) {
  InMemoryDatasetSource source(GroupDataset(40));
  ASSERT_TRUE(store_.WriteGlobal({"run-1", 1, 1}, "{}").ok());
  auto site = MakeSite("site1", &source, {"run-1", 2, 2});

  EXPECT_TRUE(absl::IsNotFound(site.Run()));
}

TEST_F(RoundLifecycleTest, MalformedPreviousGlobalFails) {
  InMemoryDatasetSource source(GroupDataset(40));
  ASSERT_TRUE(store_.WriteGlobal(first_round_, "{\"coef_\": [1.0").ok());
  auto site = MakeSite("site1", &source, {"run-1", 1, 2});

  EXPECT_TRUE(absl::IsInvalidArgument(site.PrepareData()));
  EXPECT_EQ(site.state(), RoundState::kFailed);
}

TEST_F(RoundLifecycleTest, AbandonedRoundPublishesNothing) {
  InMemoryDatasetSource source(GroupDataset(40));
  auto site = MakeSite("site1", &source, first_round_);

  ASSERT_TRUE(site.PrepareData().ok());
  ASSERT_TRUE(site.Validate().ok());
  site.Abandon();
  EXPECT_EQ(site.state(), RoundState::kFailed);
  EXPECT_TRUE(absl::IsCancelled(site.status()));

  EXPECT_TRUE(absl::IsFailedPrecondition(site.Training()));
  EXPECT_THAT(Published(first_round_), IsEmpty());
}

TEST_F(RoundLifecycleTest, AbandonAfterPublishIsIgnored) {
  InMemoryDatasetSource source(GroupDataset(40));
  auto site = MakeSite("site1", &source, first_round_);
  ASSERT_TRUE(site.Run().ok());

  site.Abandon();
  EXPECT_EQ(site.state(), RoundState::kPublished);
  EXPECT_THAT(Published(first_round_), SizeIs(1));
}

TEST_F(RoundLifecycleTest, SecondPublishOfSameParticipantFails) {
  InMemoryDatasetSource source(GroupDataset(40));
  auto first = MakeSite("site1", &source, first_round_);
  auto again = MakeSite("site1", &source, first_round_);

  ASSERT_TRUE(first.Run().ok());
  EXPECT_TRUE(absl::IsAlreadyExists(again.Run()));
  EXPECT_EQ(again.state(), RoundState::kFailed);
}

}  // namespace
}  // namespace fedmeta::controller
