#ifndef EXAMPLE_SCENARIOS_HPP
#define EXAMPLE_SCENARIOS_HPP

#include "session_io.hpp"
#include <vector>

namespace settings_review {
namespace examples {

/**
 * @brief Dosing parameters of a simulated person (or of their current settings).
 */
struct DosingProfile {
    double insulin_sensitivity = 50.0; ///< mg/dL per U
    double carb_sensitivity = 4.0;     ///< mg/dL per g
    double basal_rate = 1.0;           ///< U/h
};

/**
 * @brief A logged meal with its bolus, both given at the same minute.
 */
struct MealEvent {
    double start_minutes = 0.0;
    double carbs = 0.0;       ///< grams entered
    double bolus_units = 0.0; ///< U
    double absorption_minutes = 60.0;
};

struct ScenarioOptions {
    double duration_minutes = 360.0;
    double sample_interval_minutes = 5.0;
    double initial_glucose = 110.0;
    double insulin_time_constant = 55.0;  ///< minutes, per compartment
    double carb_time_constant_fraction = 1.0 / 3.0; ///< gut time constant as a fraction of absorption_minutes
    double start_seconds = 1563235200.0;  ///< epoch seconds of minute 0
};

/**
 * @brief Simulates glucose for a person and derives the effect series the current settings predict.
 *
 * Model (time in minutes), integrated with fixed-step RK4:
 *   dI1/dt = -I1/tau, dI2/dt = (I1 - I2)/tau          net insulin on board (boluses)
 *   dA/dt  = I2/tau                                    cumulative insulin activity
 *   dQ/dt  = -Q/tau_c, dC/dt = Q/tau_c                 carbs in gut, absorbed carbs
 *   dG/dt  = ISF*(basal_needed - basal_scheduled)/60 - ISF*I2/tau + CSF*Q/tau_c
 * using the actual profile. The insulin effect is -ISF_set*A, the basal effect
 * ISF_set*basal_scheduled/60*t, and each meal becomes a carb record whose observed carbs
 * are the absorbed grams scaled by CSF_actual/CSF_set. A meal whose absorption extends
 * past the end of the simulation is reported as still absorbing.
 *
 * @param actual The parameters the simulated body follows.
 * @param settings The parameters the predictions are made with; basal_rate is the schedule.
 */
SessionInputs
simulate_scenario(const DosingProfile &actual,
                  const DosingProfile &settings,
                  const std::vector<MealEvent> &meals,
                  const ScenarioOptions &options = ScenarioOptions());

/// A day segment with a single meal at minute 60, actual parameters off from the settings.
SessionInputs
make_meal_scenario();

/// No meals; the actual basal need is 20% above the schedule.
SessionInputs
make_fasting_scenario();

} // namespace examples
} // namespace settings_review

#endif // EXAMPLE_SCENARIOS_HPP
