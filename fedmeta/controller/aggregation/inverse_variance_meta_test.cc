#include "fedmeta/controller/aggregation/inverse_variance_meta.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "fedmeta/controller/common/proto_json.h"
#include "fedmeta/controller/common/proto_matchers.h"
#include "fedmeta/proto/payload.pb.h"

namespace fedmeta::controller {
namespace {

using fedmeta::proto::JsonOps;
using ::testing::DoubleNear;
using ::testing::ElementsAre;
using ::testing::proto::ApproximatelyEqualsProto;
using ::testing::proto::EqualsProto;

const char kSiteA[] = R"pb(
  sample_size: 40
  coef: 1.0
  std_err: 0.5
  ss_model: 10
  ss_residual: 30
  ss_total: 40
  df_model: 1
  df_residual: 38
  partial_eta_squared: 0.2
  n_group_columns: 1
)pb";

const char kSiteB[] = R"pb(
  sample_size: 60
  coef: 2.0
  std_err: 1.0
  ss_model: 20
  ss_residual: 50
  ss_total: 70
  df_model: 1
  df_residual: 58
  partial_eta_squared: 0.4
  n_group_columns: 1
)pb";

// Intercept plus two group dummies plus one covariate.
const char kFourCoefficients[] = R"pb(
  sample_size: 25
  coef: [ 0.5, 1.5, -0.75, 2.0 ]
  std_err: [ 0.1, 0.3, 0.2, 0.4 ]
  ss_model: 12.5
  ss_residual: 7.25
  ss_total: 19.75
  df_model: 3
  df_residual: 21
  partial_eta_squared: 0.35
  n_group_columns: 2
)pb";

LinearLocalStats Parse(const char *text) {
  return JsonOps::ParseTextOrDie<LinearLocalStats>(text);
}

class InverseVarianceMetaTest : public ::testing::Test {
 protected:
  InverseVarianceMetaAnalysis meta_;
};

TEST_F(InverseVarianceMetaTest, TwoSitesPoolByInverseVariance) {
  auto a = Parse(kSiteA);
  auto b = Parse(kSiteB);

  auto global = meta_.Aggregate({&a, &b});
  ASSERT_TRUE(global.ok()) << global.status();

  // Weights 4 and 1.
  EXPECT_THAT(global->coef(), ElementsAre(DoubleNear(1.2, 1e-12)));
  EXPECT_THAT(global->std_err(),
              ElementsAre(DoubleNear(std::sqrt(0.2), 1e-12)));
  EXPECT_THAT(global->z_values(), ElementsAre(DoubleNear(2.683282, 1e-6)));
  EXPECT_THAT(global->p_values(), ElementsAre(DoubleNear(0.0072904, 1e-6)));
  EXPECT_THAT(global->conf_int_lower(),
              ElementsAre(DoubleNear(0.3234614, 1e-6)));
  EXPECT_THAT(global->conf_int_upper(),
              ElementsAre(DoubleNear(2.0765386, 1e-6)));
  EXPECT_EQ(global->total_sample_size(), 100);
  EXPECT_EQ(global->n_sites(), 2);
  EXPECT_EQ(global->n_group_columns(), 1);
}

TEST_F(InverseVarianceMetaTest, PooledFitQuality) {
  auto a = Parse(kSiteA);
  auto b = Parse(kSiteB);

  auto global = meta_.Aggregate({&a, &b});
  ASSERT_TRUE(global.ok()) << global.status();

  EXPECT_DOUBLE_EQ(global->ss_model(), 30);
  EXPECT_DOUBLE_EQ(global->ss_residual(), 80);
  EXPECT_DOUBLE_EQ(global->ss_total(), 110);
  EXPECT_DOUBLE_EQ(global->df_model(), 1);
  EXPECT_DOUBLE_EQ(global->df_residual(), 96);
  EXPECT_DOUBLE_EQ(global->f_statistic(), 36);
  EXPECT_GT(global->f_pvalue(), 0);
  EXPECT_LT(global->f_pvalue(), 1e-6);
  EXPECT_NEAR(global->r_squared(), 30.0 / 110.0, 1e-12);
  EXPECT_NEAR(global->adj_r_squared(), 0.2653061, 1e-6);
  // (40 * 0.2 + 60 * 0.4) / 100
  EXPECT_NEAR(global->partial_eta_squared(), 0.32, 1e-12);
}

TEST_F(InverseVarianceMetaTest, TwoSitesGlobalPayload) {
  auto a = Parse(kSiteA);
  auto b = Parse(kSiteB);

  auto global = meta_.Aggregate({&a, &b});
  ASSERT_TRUE(global.ok()) << global.status();

  // F(1, 96) = 36 leaves an upper tail far below the margin.
  EXPECT_LT(global->f_pvalue(), 1e-6);
  global->clear_f_pvalue();

  auto expected = JsonOps::ParseTextOrDie<LinearGlobalStats>(R"pb(
    total_sample_size: 100
    n_sites: 2
    sample_size: 100
    coef: 1.2
    std_err: 0.4472136
    z_values: 2.6832816
    p_values: 0.0072904
    conf_int_lower: 0.3234614
    conf_int_upper: 2.0765386
    r_squared: 0.2727273
    adj_r_squared: 0.2653061
    f_statistic: 36
    ss_model: 30
    ss_residual: 80
    ss_total: 110
    df_model: 1
    df_residual: 96
    partial_eta_squared: 0.32
    n_group_columns: 1
  )pb");
  EXPECT_THAT(*global, ApproximatelyEqualsProto(expected, 0.0, 1e-6));
}

TEST_F(InverseVarianceMetaTest, ZeroStandardErrorGetsZeroWeight) {
  auto a = Parse(kSiteA);
  auto exact = Parse(kSiteB);
  exact.set_coef(0, 100.0);
  exact.set_std_err(0, 0.0);

  auto global = meta_.Aggregate({&a, &exact});
  ASSERT_TRUE(global.ok()) << global.status();

  // Only site A carries weight.
  EXPECT_DOUBLE_EQ(global->coef(0), 1.0);
  EXPECT_DOUBLE_EQ(global->std_err(0), 0.5);
  EXPECT_TRUE(std::isfinite(global->z_values(0)));
  EXPECT_TRUE(std::isfinite(global->p_values(0)));
}

TEST_F(InverseVarianceMetaTest, AllZeroStandardErrorsFallBackToMean) {
  auto a = Parse(kSiteA);
  auto b = Parse(kSiteB);
  a.set_std_err(0, 0.0);
  b.set_std_err(0, 0.0);

  auto global = meta_.Aggregate({&a, &b});
  ASSERT_TRUE(global.ok()) << global.status();

  EXPECT_DOUBLE_EQ(global->coef(0), 1.5);
  EXPECT_DOUBLE_EQ(global->std_err(0), 0.0);
  EXPECT_DOUBLE_EQ(global->z_values(0), 0.0);
  EXPECT_DOUBLE_EQ(global->p_values(0), 1.0);
  EXPECT_DOUBLE_EQ(global->conf_int_lower(0), 1.5);
  EXPECT_DOUBLE_EQ(global->conf_int_upper(0), 1.5);
}

TEST_F(InverseVarianceMetaTest, ResultDoesNotDependOnArrivalOrder) {
  auto a = Parse(kSiteA);
  auto b = Parse(kSiteB);
  auto c = Parse(kSiteB);
  c.set_coef(0, -0.3);
  c.set_std_err(0, 0.7);
  c.set_sample_size(33);

  auto forward = meta_.Aggregate({&a, &b, &c});
  auto backward = meta_.Aggregate({&c, &b, &a});
  auto shuffled = meta_.Aggregate({&b, &c, &a});
  ASSERT_TRUE(forward.ok());
  ASSERT_TRUE(backward.ok());
  ASSERT_TRUE(shuffled.ok());

  EXPECT_THAT(*backward, EqualsProto(*forward));
  EXPECT_THAT(*shuffled, EqualsProto(*forward));
}

TEST_F(InverseVarianceMetaTest, SingleSiteIsIdentity) {
  auto site = Parse(kFourCoefficients);

  auto global = meta_.Aggregate({&site});
  ASSERT_TRUE(global.ok()) << global.status();

  ASSERT_EQ(global->coef_size(), 4);
  for (int i = 0; i < 4; ++i) {
    EXPECT_NEAR(global->coef(i), site.coef(i), 1e-12);
    EXPECT_NEAR(global->std_err(i), site.std_err(i), 1e-12);
  }
  EXPECT_EQ(global->total_sample_size(), site.sample_size());
  EXPECT_EQ(global->n_sites(), 1);
  EXPECT_NEAR(global->partial_eta_squared(), site.partial_eta_squared(),
              1e-12);
}

TEST_F(InverseVarianceMetaTest, SumsOfSquaresAndDegreesOfFreedomAdd) {
  std::vector<LinearLocalStats> sites;
  for (int i = 0; i < 5; ++i) {
    auto site = Parse(kFourCoefficients);
    site.set_ss_model(0.1 + 1.7 * i);
    site.set_ss_residual(3.3 / (i + 1));
    site.set_df_residual(10 + 3 * i);
    site.set_partial_eta_squared(0.15 * i);
    sites.push_back(site);
  }
  std::vector<const LinearLocalStats *> payloads;
  double df_residual = 0;
  for (const auto &site : sites) {
    payloads.push_back(&site);
    df_residual += site.df_residual();
  }

  auto global = meta_.Aggregate(payloads);
  ASSERT_TRUE(global.ok()) << global.status();

  EXPECT_EQ(global->ss_total(), global->ss_model() + global->ss_residual());
  EXPECT_DOUBLE_EQ(global->df_residual(), df_residual);
  EXPECT_GE(global->partial_eta_squared(), 0.0);
  EXPECT_LE(global->partial_eta_squared(), 1.0);
}

TEST_F(InverseVarianceMetaTest, ZeroResidualDegreesOfFreedomGuardsF) {
  auto a = Parse(kSiteA);
  a.set_df_residual(0);
  a.set_ss_residual(0);

  auto global = meta_.Aggregate({&a});
  ASSERT_TRUE(global.ok()) << global.status();

  EXPECT_DOUBLE_EQ(global->f_statistic(), 0.0);
  EXPECT_DOUBLE_EQ(global->f_pvalue(), 1.0);
  EXPECT_DOUBLE_EQ(global->r_squared(), 1.0);
}

TEST_F(InverseVarianceMetaTest, EmptyInputIsNotFound) {
  auto global = meta_.Aggregate({});
  EXPECT_TRUE(absl::IsNotFound(global.status()));
}

TEST_F(InverseVarianceMetaTest, RejectsCoefficientCountMismatch) {
  auto a = Parse(kSiteA);
  auto wide = Parse(kFourCoefficients);
  wide.set_df_model(1);
  wide.set_n_group_columns(1);

  auto global = meta_.Aggregate({&a, &wide});
  EXPECT_TRUE(absl::IsInvalidArgument(global.status()));
}

TEST_F(InverseVarianceMetaTest, RejectsDisagreeingModelDegreesOfFreedom) {
  auto a = Parse(kSiteA);
  auto b = Parse(kSiteB);
  b.set_df_model(2);

  auto global = meta_.Aggregate({&a, &b});
  EXPECT_TRUE(absl::IsInvalidArgument(global.status()));
}

TEST_F(InverseVarianceMetaTest, RejectsNegativeOrNonFiniteInputs) {
  auto a = Parse(kSiteA);
  auto negative = Parse(kSiteB);
  negative.set_std_err(0, -1.0);
  EXPECT_TRUE(
      absl::IsInvalidArgument(meta_.Aggregate({&a, &negative}).status()));

  auto nan = Parse(kSiteB);
  nan.set_coef(0, std::nan(""));
  EXPECT_TRUE(absl::IsInvalidArgument(meta_.Aggregate({&a, &nan}).status()));

  auto empty_site = Parse(kSiteB);
  empty_site.set_sample_size(0);
  EXPECT_TRUE(
      absl::IsInvalidArgument(meta_.Aggregate({&a, &empty_site}).status()));
}

TEST_F(InverseVarianceMetaTest, InputsAreNotMutated) {
  auto a = Parse(kSiteA);
  auto b = Parse(kSiteB);
  const auto a_before = a;
  const auto b_before = b;

  ASSERT_TRUE(meta_.Aggregate({&b, &a}).ok());

  EXPECT_THAT(a, EqualsProto(a_before));
  EXPECT_THAT(b, EqualsProto(b_before));
}

}  // namespace
}  // namespace fedmeta::controller
