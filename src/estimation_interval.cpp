#include "estimation_interval.hpp"
#include <cmath>
#include <iostream>
#include <utility>

namespace settings_review {

std::string
to_string(EstimationIntervalType type) {
    switch (type) {
        case EstimationIntervalType::Fasting:
            return "fasting";
        case EstimationIntervalType::CarbAbsorption:
            return "carbAbsorption";
    }
    return "unknown";
}

EstimationInterval::EstimationInterval(TimePoint start_date,
                                       TimePoint end_date,
                                       EstimationIntervalType type,
                                       GlucoseSeries glucose,
                                       EffectSeries insulin_effect,
                                       EffectSeries basal_effect,
                                       std::optional<double> entered_carbs,
                                       std::optional<double> observed_carbs)
  : start_date(start_date)
  , end_date(end_date)
  , type(type)
  , glucose(std::move(glucose))
  , insulin_effect(std::move(insulin_effect))
  , basal_effect(std::move(basal_effect))
  , entered_carbs(entered_carbs)
  , observed_carbs(observed_carbs) {}

std::optional<EstimatedMultipliers>
EstimationInterval::estimate_parameters(EstimatorKind kind, int min_glucose_samples, bool verbose) {
    switch (kind) {
        case EstimatorKind::General:
            return estimate_parameter_multipliers(min_glucose_samples, verbose);
        case EstimatorKind::Fasting:
            return estimate_parameters_during_fasting(min_glucose_samples, verbose);
        case EstimatorKind::CarbAbsorption:
            return estimate_parameters_for_carb_entries(min_glucose_samples, verbose);
        case EstimatorKind::ByIntervalType:
            if (type == EstimationIntervalType::Fasting) {
                return estimate_parameters_during_fasting(min_glucose_samples, verbose);
            }
            return estimate_parameters_for_carb_entries(min_glucose_samples, verbose);
    }
    return std::nullopt;
}

void
EstimationInterval::clear_estimates() {
    delta_glucose.reset();
    delta_glucose_insulin.reset();
    delta_glucose_basal.reset();
    constraint.reset();
    estimated_multipliers.reset();
}

std::optional<EstimationInterval::GlucoseDeltas>
EstimationInterval::compute_deltas(int min_glucose_samples, const char *tag, bool verbose) {
    GlucoseSeries glucose_in_range = filter_date_range(glucose, start_date, end_date);
    EffectSeries insulin_in_range = filter_date_range(insulin_effect, start_date, end_date);
    EffectSeries basal_in_range = filter_date_range(basal_effect, start_date, end_date);

    if (static_cast<int>(glucose_in_range.size()) < min_glucose_samples) {
        if (verbose) {
            std::cout << "  [EstimationInterval::" << tag << "] Skipped: " << glucose_in_range.size()
                      << " glucose samples, need " << min_glucose_samples << "." << std::endl;
        }
        return std::nullopt;
    }
    if (insulin_in_range.empty() || basal_in_range.empty()) {
        if (verbose) {
            std::cout << "  [EstimationInterval::" << tag << "] Skipped: insulin or basal effect not available."
                      << std::endl;
        }
        return std::nullopt;
    }

    double start_glucose = glucose_in_range.front().value;
    double end_glucose = glucose_in_range.back().value;
    if (verbose) {
        std::cout << "  [EstimationInterval::" << tag << "] startGlucose: " << start_glucose
                  << ", endGlucose: " << end_glucose << std::endl;
    }

    GlucoseDeltas deltas;
    deltas.glucose = end_glucose - start_glucose;
    // Insulin effects are negative and decreasing, so start - end is the drop attributed to insulin.
    deltas.insulin = insulin_in_range.front().value - insulin_in_range.back().value;
    deltas.basal = basal_in_range.back().value - basal_in_range.front().value;

    delta_glucose = deltas.glucose;
    delta_glucose_insulin = deltas.insulin;
    delta_glucose_basal = deltas.basal;
    return deltas;
}

EstimatedMultipliers
EstimationInterval::make_multipliers(double basal, double isf, double csf, double cr) const {
    EstimatedMultipliers multipliers;
    multipliers.start_date = start_date;
    multipliers.end_date = end_date;
    multipliers.basal_multiplier = basal;
    multipliers.insulin_sensitivity_multiplier = isf;
    multipliers.carb_sensitivity_multiplier = csf;
    multipliers.carb_ratio_multiplier = cr;
    return multipliers;
}

std::optional<EstimatedMultipliers>
EstimationInterval::estimate_parameter_multipliers(int min_glucose_samples, bool verbose) {
    auto deltas = compute_deltas(min_glucose_samples, "general", verbose);
    if (!deltas) { return std::nullopt; }

    double actual_over_observed_ratio = 0.0;
    if (entered_carbs && observed_carbs && *entered_carbs > 0.0 && *observed_carbs > 0.0) {
        double observed_over_entered_ratio = *observed_carbs / *entered_carbs;
        // The entered/observed mismatch is split evenly between a carb-counting error and a
        // parameter mismatch, hence the square root.
        actual_over_observed_ratio = std::sqrt(1.0 / observed_over_entered_ratio);
    }

    PlaneConstraint plane;
    plane.a = -deltas->glucose;                                               // insulin weight
    plane.b = actual_over_observed_ratio * (deltas->glucose + deltas->insulin); // carb weight
    plane.c = deltas->basal;                                                  // basal weight
    plane.d = deltas->insulin + deltas->basal;
    constraint = plane;

    // x = 1 / ISF multiplier, y = 1 / CR multiplier, z = basal multiplier
    Eigen::Vector3d p = project_to_plane(plane);
    double insulin_sensitivity_multiplier = 1.0 / p(0);
    double carb_ratio_multiplier = 1.0 / p(1);

    estimated_multipliers =
      make_multipliers(p(2), insulin_sensitivity_multiplier, insulin_sensitivity_multiplier, carb_ratio_multiplier);
    return estimated_multipliers;
}

std::optional<EstimatedMultipliers>
EstimationInterval::estimate_parameters_during_fasting(int min_glucose_samples, bool verbose) {
    auto deltas = compute_deltas(min_glucose_samples, "fasting", verbose);
    if (!deltas) { return std::nullopt; }

    // x = basal multiplier, y = 1 / ISF multiplier
    Eigen::Vector2d p = project_to_line(deltas->basal, -deltas->glucose, deltas->basal + deltas->insulin);
    double insulin_sensitivity_multiplier = 1.0 / p(1);

    estimated_multipliers = make_multipliers(p(0), insulin_sensitivity_multiplier, insulin_sensitivity_multiplier, 1.0);
    return estimated_multipliers;
}

std::optional<EstimatedMultipliers>
EstimationInterval::estimate_parameters_for_carb_entries(int min_glucose_samples, bool verbose) {
    if (!entered_carbs || !observed_carbs || *entered_carbs <= 0.0) {
        if (verbose) {
            std::cout << "  [EstimationInterval::carbAbsorption] Skipped: no entered carbs." << std::endl;
        }
        return std::nullopt;
    }

    auto deltas = compute_deltas(min_glucose_samples, "carbAbsorption", verbose);
    if (!deltas) { return std::nullopt; }

    double observed_over_entered_ratio = *observed_carbs / *entered_carbs;
    double delta_glucose_counteraction = deltas->glucose + deltas->insulin;
    if (delta_glucose_counteraction == 0.0 || observed_over_entered_ratio == 0.0) {
        if (verbose) {
            std::cout << "  [EstimationInterval::carbAbsorption] Skipped: zero counteraction or no observed carbs."
                      << std::endl;
        }
        return std::nullopt;
    }

    double actual_over_observed_ratio = std::sqrt(1.0 / observed_over_entered_ratio);
    double csf_weight = deltas->glucose / delta_glucose_counteraction;
    double cr_weight = 1.0 - csf_weight;

    // x = 1 / CSF multiplier, y = CR multiplier
    Eigen::Vector2d p = project_to_line(csf_weight, cr_weight, actual_over_observed_ratio);
    double carb_sensitivity_multiplier = 1.0 / p(0);
    double carb_ratio_multiplier = p(1);
    double insulin_sensitivity_multiplier = carb_ratio_multiplier / p(0);

    estimated_multipliers =
      make_multipliers(1.0, insulin_sensitivity_multiplier, carb_sensitivity_multiplier, carb_ratio_multiplier);
    return estimated_multipliers;
}

} // namespace settings_review
