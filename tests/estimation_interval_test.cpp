#include "estimation_interval.hpp"
#include "test_utils.hpp"

#include <cmath>
#include <gtest/gtest.h>

using namespace settings_review;
using namespace settings_review::test_utils;

namespace {

// Interval over [from, to] minutes with linear series.
EstimationInterval
make_interval(EstimationIntervalType type,
              double from,
              double to,
              double glucose_slope,
              double insulin_slope,
              double basal_slope,
              std::optional<double> entered = std::nullopt,
              std::optional<double> observed = std::nullopt) {
    return EstimationInterval(minutes(from),
                              minutes(to),
                              type,
                              glucose_series(from, to, [=](double m) { return 150.0 + glucose_slope * (m - from); }),
                              effect_series(from, to, [=](double m) { return insulin_slope * m; }),
                              effect_series(from, to, [=](double m) { return basal_slope * m; }),
                              entered,
                              observed);
}

} // namespace

class EstimationIntervalTest : public ::testing::Test {
  protected:
    // Fasting hour where glucose falls exactly as the insulin effect predicts:
    // dG = -30, dI = 30, dB = 18.
    EstimationInterval exact_fasting_ =
      make_interval(EstimationIntervalType::Fasting, 0.0, 60.0, -0.5, -0.5, 0.3);
};

TEST_F(EstimationIntervalTest, GeneralEstimatorComputesDeltas) {
    auto result = exact_fasting_.estimate_parameter_multipliers();
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(exact_fasting_.delta_glucose.has_value());
    EXPECT_NEAR(*exact_fasting_.delta_glucose, -30.0, 1e-9);
    EXPECT_NEAR(*exact_fasting_.delta_glucose_insulin, 30.0, 1e-9);
    EXPECT_NEAR(*exact_fasting_.delta_glucose_basal, 18.0, 1e-9);

    ASSERT_TRUE(exact_fasting_.constraint.has_value());
    EXPECT_NEAR(exact_fasting_.constraint->a, 30.0, 1e-9);
    EXPECT_DOUBLE_EQ(exact_fasting_.constraint->b, 0.0);
    EXPECT_NEAR(exact_fasting_.constraint->c, 18.0, 1e-9);
    EXPECT_NEAR(exact_fasting_.constraint->d, 48.0, 1e-9);
}

TEST_F(EstimationIntervalTest, ConsistentPredictionGivesNominalMultipliers) {
    auto result = exact_fasting_.estimate_parameter_multipliers();
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->insulin_sensitivity_multiplier, 1.0, 1e-9);
    EXPECT_NEAR(result->carb_ratio_multiplier, 1.0, 1e-9);
    EXPECT_NEAR(result->carb_sensitivity_multiplier, 1.0, 1e-9);
    EXPECT_NEAR(result->basal_multiplier, 1.0, 1e-9);
    EXPECT_EQ(result->start_date, minutes(0.0));
    EXPECT_EQ(result->end_date, minutes(60.0));
    ASSERT_TRUE(exact_fasting_.estimated_multipliers.has_value());
}

TEST_F(EstimationIntervalTest, TooFewGlucoseSamplesLeavesResultUnset) {
    // 0, 5, ..., 20: five samples
    EstimationInterval interval = make_interval(EstimationIntervalType::Fasting, 0.0, 20.0, -0.5, -0.5, 0.3);
    ASSERT_EQ(interval.glucose.size(), 5u);

    EXPECT_FALSE(interval.estimate_parameter_multipliers().has_value());
    EXPECT_FALSE(interval.estimated_multipliers.has_value());
    EXPECT_FALSE(interval.delta_glucose.has_value());

    // Six samples are enough.
    EstimationInterval longer = make_interval(EstimationIntervalType::Fasting, 0.0, 25.0, -0.5, -0.5, 0.3);
    EXPECT_TRUE(longer.estimate_parameter_multipliers().has_value());
}

TEST_F(EstimationIntervalTest, MinimumSampleCountIsConfigurable) {
    EstimationInterval interval = make_interval(EstimationIntervalType::Fasting, 0.0, 20.0, -0.5, -0.5, 0.3);
    EXPECT_TRUE(interval.estimate_parameter_multipliers(3).has_value());
}

TEST_F(EstimationIntervalTest, MissingEffectSeriesLeavesResultUnset) {
    EstimationInterval interval = exact_fasting_;
    interval.basal_effect.clear();
    EXPECT_FALSE(interval.estimate_parameter_multipliers().has_value());

    interval = exact_fasting_;
    interval.insulin_effect.clear();
    EXPECT_FALSE(interval.estimate_parameter_multipliers().has_value());
}

TEST_F(EstimationIntervalTest, GeneralEstimatorUsesObservedCarbRatio) {
    // dG = +30, dI = 30, dB = 18, observed/entered = 1/4 so the ratio is 2.
    EstimationInterval interval =
      make_interval(EstimationIntervalType::CarbAbsorption, 0.0, 60.0, 0.5, -0.5, 0.3, 40.0, 10.0);
    auto result = interval.estimate_parameter_multipliers();
    ASSERT_TRUE(result.has_value());

    const double a = -30.0, b = 2.0 * (30.0 + 30.0), c = 18.0, d = 48.0;
    ASSERT_TRUE(interval.constraint.has_value());
    EXPECT_NEAR(interval.constraint->b, b, 1e-9);

    Eigen::Vector3d expected = project_to_plane(a, b, c, d);
    EXPECT_NEAR(result->insulin_sensitivity_multiplier, 1.0 / expected(0), 1e-9);
    EXPECT_NEAR(result->carb_ratio_multiplier, 1.0 / expected(1), 1e-9);
    EXPECT_NEAR(result->basal_multiplier, expected(2), 1e-9);
    EXPECT_DOUBLE_EQ(result->carb_sensitivity_multiplier, result->insulin_sensitivity_multiplier);
}

TEST_F(EstimationIntervalTest, GeneralEstimatorIgnoresCarbsWithoutEnteredAmount) {
    EstimationInterval interval =
      make_interval(EstimationIntervalType::CarbAbsorption, 0.0, 60.0, 0.5, -0.5, 0.3, 0.0, 10.0);
    ASSERT_TRUE(interval.estimate_parameter_multipliers().has_value());
    EXPECT_DOUBLE_EQ(interval.constraint->b, 0.0);

    EstimationInterval no_observed =
      make_interval(EstimationIntervalType::CarbAbsorption, 0.0, 60.0, 0.5, -0.5, 0.3, 40.0, 0.0);
    ASSERT_TRUE(no_observed.estimate_parameter_multipliers().has_value());
    EXPECT_DOUBLE_EQ(no_observed.constraint->b, 0.0);
}

TEST_F(EstimationIntervalTest, FastingEstimatorProjectsOntoLine) {
    // dG = -15, dI = 30, dB = 18
    EstimationInterval interval = make_interval(EstimationIntervalType::Fasting, 0.0, 60.0, -0.25, -0.5, 0.3);
    auto result = interval.estimate_parameters_during_fasting();
    ASSERT_TRUE(result.has_value());

    Eigen::Vector2d expected = project_to_line(18.0, 15.0, 48.0);
    EXPECT_NEAR(result->basal_multiplier, expected(0), 1e-9);
    EXPECT_NEAR(result->insulin_sensitivity_multiplier, 1.0 / expected(1), 1e-9);
    EXPECT_DOUBLE_EQ(result->carb_sensitivity_multiplier, result->insulin_sensitivity_multiplier);
    EXPECT_DOUBLE_EQ(result->carb_ratio_multiplier, 1.0);
    EXPECT_FALSE(interval.constraint.has_value());
}

TEST_F(EstimationIntervalTest, FastingEstimatorOnConsistentDataIsNominal) {
    auto result = exact_fasting_.estimate_parameters_during_fasting();
    ASSERT_TRUE(result.has_value());
    EXPECT_NEAR(result->basal_multiplier, 1.0, 1e-9);
    EXPECT_NEAR(result->insulin_sensitivity_multiplier, 1.0, 1e-9);
}

TEST_F(EstimationIntervalTest, CarbEstimatorProjectsOntoLine) {
    // dG = +30, dI = 30: counteraction 60, csf weight 0.5, cr weight 0.5; ratio sqrt(40/10) = 2
    EstimationInterval interval =
      make_interval(EstimationIntervalType::CarbAbsorption, 0.0, 60.0, 0.5, -0.5, 0.3, 40.0, 10.0);
    auto result = interval.estimate_parameters_for_carb_entries();
    ASSERT_TRUE(result.has_value());

    Eigen::Vector2d expected = project_to_line(0.5, 0.5, 2.0); // (2, 2)
    EXPECT_NEAR(expected(0), 2.0, 1e-12);
    EXPECT_NEAR(result->carb_sensitivity_multiplier, 1.0 / expected(0), 1e-9);
    EXPECT_NEAR(result->carb_ratio_multiplier, expected(1), 1e-9);
    EXPECT_NEAR(result->insulin_sensitivity_multiplier, expected(1) / expected(0), 1e-9);
    EXPECT_DOUBLE_EQ(result->basal_multiplier, 1.0);
}

TEST_F(EstimationIntervalTest, CarbEstimatorNeedsEnteredCarbs) {
    EXPECT_FALSE(exact_fasting_.estimate_parameters_for_carb_entries().has_value());
    EXPECT_FALSE(exact_fasting_.delta_glucose.has_value());
}

TEST_F(EstimationIntervalTest, CarbEstimatorKeepsDeltasWhenCounteractionIsZero) {
    // dG = -30 and dI = 30 cancel.
    EstimationInterval interval =
      make_interval(EstimationIntervalType::CarbAbsorption, 0.0, 60.0, -0.5, -0.5, 0.3, 40.0, 30.0);
    EXPECT_FALSE(interval.estimate_parameters_for_carb_entries().has_value());
    EXPECT_TRUE(interval.delta_glucose.has_value());
    EXPECT_FALSE(interval.estimated_multipliers.has_value());
}

TEST_F(EstimationIntervalTest, ByIntervalTypeSelectsEstimator) {
    EstimationInterval fasting = make_interval(EstimationIntervalType::Fasting, 0.0, 60.0, -0.25, -0.5, 0.3);
    auto fasting_result = fasting.estimate_parameters(EstimatorKind::ByIntervalType);
    ASSERT_TRUE(fasting_result.has_value());
    EXPECT_DOUBLE_EQ(fasting_result->carb_ratio_multiplier, 1.0);

    EstimationInterval absorbing =
      make_interval(EstimationIntervalType::CarbAbsorption, 0.0, 60.0, 0.5, -0.5, 0.3, 40.0, 10.0);
    auto absorbing_result = absorbing.estimate_parameters(EstimatorKind::ByIntervalType);
    ASSERT_TRUE(absorbing_result.has_value());
    EXPECT_DOUBLE_EQ(absorbing_result->basal_multiplier, 1.0);
}

TEST_F(EstimationIntervalTest, ClearEstimatesDropsResults) {
    ASSERT_TRUE(exact_fasting_.estimate_parameters().has_value());
    exact_fasting_.clear_estimates();
    EXPECT_FALSE(exact_fasting_.estimated_multipliers.has_value());
    EXPECT_FALSE(exact_fasting_.constraint.has_value());
    EXPECT_FALSE(exact_fasting_.delta_glucose.has_value());
}
