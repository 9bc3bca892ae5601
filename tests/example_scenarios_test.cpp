#include "combined_estimator.hpp"
#include "settings_review/example_scenarios.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace settings_review;
using namespace settings_review::examples;

TEST(ExampleScenariosTest, SeriesShareTheSamplingGrid) {
    SessionInputs inputs = make_meal_scenario();

    // 0, 5, ..., 360 minutes
    ASSERT_EQ(inputs.series.glucose.size(), 73u);
    EXPECT_EQ(inputs.series.insulin_effect.size(), 73u);
    EXPECT_EQ(inputs.series.basal_effect.size(), 73u);
    EXPECT_EQ(inputs.series.glucose.front().start_date, inputs.start_date);
    EXPECT_EQ(inputs.series.glucose.back().start_date, inputs.end_date);
    for (const auto &sample : inputs.series.glucose) { EXPECT_EQ(sample.start_date, sample.end_date); }
    EXPECT_DOUBLE_EQ(inputs.series.glucose.front().value, 110.0);
    EXPECT_DOUBLE_EQ(inputs.series.basal_effect.front().value, 0.0);
    EXPECT_DOUBLE_EQ(inputs.series.insulin_effect.front().value, 0.0);
}

TEST(ExampleScenariosTest, ExactSettingsGiveNominalMultipliers) {
    DosingProfile profile;
    MealEvent correction;
    correction.bolus_units = 1.0;
    correction.absorption_minutes = 60.0;

    SessionInputs inputs = simulate_scenario(profile, profile, { correction });
    ASSERT_EQ(inputs.carb_records.size(), 1u);
    EXPECT_DOUBLE_EQ(inputs.carb_records[0].observed_carbs.value(), 0.0);

    auto session = make_session(inputs);
    session->update_parameter_estimates();
    ASSERT_EQ(session->intervals().size(), 2u);
    ASSERT_EQ(session->estimated_interval_count(), 2u);
    for (const auto &interval : session->intervals()) {
        const auto &m = *interval.estimated_multipliers;
        EXPECT_NEAR(m.insulin_sensitivity_multiplier, 1.0, 1e-6);
        EXPECT_NEAR(m.carb_ratio_multiplier, 1.0, 1e-6);
        EXPECT_NEAR(m.basal_multiplier, 1.0, 1e-6);
    }
}

TEST(ExampleScenariosTest, FastingScenarioPointsToHigherBasal) {
    auto session = make_session(make_fasting_scenario());
    session->update_parameter_estimates();

    ASSERT_EQ(session->intervals().size(), 1u);
    const auto &interval = session->intervals()[0];
    EXPECT_EQ(interval.type, EstimationIntervalType::Fasting);
    // Rise of ISF * 0.2 U/h over six hours, no insulin effect.
    EXPECT_NEAR(*interval.delta_glucose, 60.0, 1e-6);
    EXPECT_NEAR(*interval.delta_glucose_insulin, 0.0, 1e-9);
    EXPECT_NEAR(*interval.delta_glucose_basal, 300.0, 1e-9);

    ASSERT_TRUE(interval.estimated_multipliers.has_value());
    EXPECT_GT(interval.estimated_multipliers->basal_multiplier, 1.0);
    EXPECT_GT(interval.estimated_multipliers->insulin_sensitivity_multiplier, 1.0);

    // The projected point satisfies the interval's constraint.
    const auto &plane = *interval.constraint;
    double x = 1.0 / interval.estimated_multipliers->insulin_sensitivity_multiplier;
    double y = 1.0 / interval.estimated_multipliers->carb_ratio_multiplier;
    double z = interval.estimated_multipliers->basal_multiplier;
    EXPECT_NEAR(plane.a * x + plane.b * y + plane.c * z, plane.d, 1e-6);

    auto combined = CombinedMultiplierEstimator().estimate(*session);
    ASSERT_TRUE(combined.has_value());
    EXPECT_GT(combined->basal_multiplier, 1.0);
}

TEST(ExampleScenariosTest, MealScenarioSplitsAroundLunch) {
    SessionInputs inputs = make_meal_scenario();
    ASSERT_EQ(inputs.carb_records.size(), 1u);
    const auto &record = inputs.carb_records[0];
    EXPECT_DOUBLE_EQ(record.entered_carbs.value(), 45.0);
    EXPECT_DOUBLE_EQ(record.estimated_time_remaining.value(), 0.0);
    // Most of the meal is absorbed, scaled up by CSF_actual / CSF_set = 1.1.
    EXPECT_GT(record.observed_carbs.value(), 40.0);
    EXPECT_LT(record.observed_carbs.value(), 49.5);

    auto session = make_session(inputs);
    session->update_parameter_estimates();

    const auto &intervals = session->intervals();
    ASSERT_EQ(intervals.size(), 3u);
    EXPECT_EQ(intervals[0].end_date, intervals[1].start_date);
    EXPECT_EQ(intervals[1].type, EstimationIntervalType::CarbAbsorption);
    EXPECT_EQ(intervals[1].end_date - intervals[1].start_date, std::chrono::minutes(120));
    EXPECT_EQ(session->estimated_interval_count(), 3u);
    test_utils::EXPECT_TILES_WINDOW(*session);
}

TEST(ExampleScenariosTest, MealStillAbsorbingAtEndIsActive) {
    DosingProfile profile;
    MealEvent snack;
    snack.start_minutes = 330.0;
    snack.carbs = 15.0;
    snack.bolus_units = 1.0;
    snack.absorption_minutes = 60.0;

    SessionInputs inputs = simulate_scenario(profile, profile, { snack });
    ASSERT_EQ(inputs.carb_records.size(), 1u);
    EXPECT_DOUBLE_EQ(inputs.carb_records[0].estimated_time_remaining.value(), 1800.0);
    EXPECT_EQ(inputs.carb_records[0].observed_end.value(), inputs.end_date);

    auto session = make_session(inputs);
    session->assemble();
    ASSERT_EQ(session->intervals().size(), 1u);
    EXPECT_EQ(session->end_date(), inputs.carb_records[0].observed_start.value());
}

TEST(ExampleScenariosTest, InvalidOptionsThrow) {
    DosingProfile profile;
    ScenarioOptions options;
    options.duration_minutes = 0.0;
    EXPECT_THROW(simulate_scenario(profile, profile, {}, options), std::invalid_argument);

    DosingProfile broken;
    broken.carb_sensitivity = 0.0;
    EXPECT_THROW(simulate_scenario(profile, broken, {}), std::invalid_argument);
}
