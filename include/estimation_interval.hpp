#ifndef ESTIMATION_INTERVAL_HPP
#define ESTIMATION_INTERVAL_HPP

#include "estimation_config.hpp"
#include "glucose_series.hpp"
#include "projection_solver.hpp"
#include <optional>
#include <string>

namespace settings_review {

enum class EstimationIntervalType { Fasting, CarbAbsorption };

std::string
to_string(EstimationIntervalType type);

/**
 * @brief Multipliers estimated over [start_date, end_date].
 *
 * Each value multiplies the corresponding current setting; 1.0 means no correction.
 */
struct EstimatedMultipliers {
    TimePoint start_date;
    TimePoint end_date;
    double basal_multiplier = 1.0;
    double insulin_sensitivity_multiplier = 1.0;
    double carb_sensitivity_multiplier = 1.0;
    double carb_ratio_multiplier = 1.0;
};

/**
 * @brief A contiguous part of the session that is either fasting or absorbing carbs.
 *
 * Holds the input series sliced to its bounds and, after estimation, the glucose deltas
 * and the estimated multipliers. Bounds and slices are only changed by
 * EstimationIntervalList while a session is assembled.
 */
class EstimationInterval {
  public:
    EstimationInterval(TimePoint start_date,
                       TimePoint end_date,
                       EstimationIntervalType type,
                       GlucoseSeries glucose,
                       EffectSeries insulin_effect,
                       EffectSeries basal_effect,
                       std::optional<double> entered_carbs = std::nullopt,
                       std::optional<double> observed_carbs = std::nullopt);

    TimePoint start_date;
    TimePoint end_date;
    EstimationIntervalType type;

    GlucoseSeries glucose;
    EffectSeries insulin_effect;
    EffectSeries basal_effect;

    std::optional<double> entered_carbs;  ///< grams, summed over merged entries
    std::optional<double> observed_carbs; ///< grams, summed over merged entries

    std::optional<double> delta_glucose;
    std::optional<double> delta_glucose_insulin;
    std::optional<double> delta_glucose_basal;
    std::optional<PlaneConstraint> constraint; ///< Set by the general estimator.
    std::optional<EstimatedMultipliers> estimated_multipliers;

    /**
     * @brief Runs the estimator selected by kind and stores the result in place.
     *
     * Requires exclusive access to the interval. Insufficient data leaves the result unset.
     *
     * @return The stored multipliers, or std::nullopt when the interval could not be estimated.
     */
    std::optional<EstimatedMultipliers> estimate_parameters(EstimatorKind kind = EstimatorKind::General,
                                                            int min_glucose_samples = 6,
                                                            bool verbose = false);

    /**
     * @brief Plane projection of (1/ISF multiplier, 1/CR multiplier, basal multiplier).
     *
     * insulin weight = -dG, carb weight = r * (dG + dI), basal weight = dB, rhs = dI + dB,
     * where r = sqrt(entered / observed) for absorption intervals and 0 otherwise.
     */
    std::optional<EstimatedMultipliers> estimate_parameter_multipliers(int min_glucose_samples = 6,
                                                                       bool verbose = false);

    /**
     * @brief Line projection of (basal multiplier, 1/ISF multiplier); CR multiplier fixed at 1.
     */
    std::optional<EstimatedMultipliers> estimate_parameters_during_fasting(int min_glucose_samples = 6,
                                                                           bool verbose = false);

    /**
     * @brief Line projection of (1/CSF multiplier, CR multiplier); basal multiplier fixed at 1.
     *
     * Needs positive entered carbs, non-zero observed carbs and non-zero counteraction.
     */
    std::optional<EstimatedMultipliers> estimate_parameters_for_carb_entries(int min_glucose_samples = 6,
                                                                             bool verbose = false);

    /// Drops every result of a previous estimation.
    void clear_estimates();

  private:
    struct GlucoseDeltas {
        double glucose = 0.0;
        double insulin = 0.0;
        double basal = 0.0;
    };

    // Shared precondition check and delta computation; stores the deltas on success.
    std::optional<GlucoseDeltas> compute_deltas(int min_glucose_samples, const char *tag, bool verbose);

    EstimatedMultipliers make_multipliers(double basal, double isf, double csf, double cr) const;
};

} // namespace settings_review

#endif // ESTIMATION_INTERVAL_HPP
