#include "settings_review/example_scenarios.hpp"
#include <algorithm>
#include <boost/numeric/odeint.hpp>
#include <cmath>
#include <stdexcept>

namespace settings_review {
namespace examples {

namespace odeint = boost::numeric::odeint;

namespace {

using state_type = std::vector<double>;

// State layout: [I1, I2, A, G, Q_0 ... Q_{n-1}]
constexpr std::size_t kInsulinFirst = 0;
constexpr std::size_t kInsulinSecond = 1;
constexpr std::size_t kActivity = 2;
constexpr std::size_t kGlucose = 3;
constexpr std::size_t kFirstGut = 4;

struct GlucoseModel {
    const DosingProfile &actual;
    double scheduled_basal_rate;
    double insulin_time_constant;
    std::vector<double> gut_time_constants;

    void operator()(const state_type &x, state_type &dxdt, double /* t */) const {
        double activity = x[kInsulinSecond] / insulin_time_constant;
        dxdt[kInsulinFirst] = -x[kInsulinFirst] / insulin_time_constant;
        dxdt[kInsulinSecond] = (x[kInsulinFirst] - x[kInsulinSecond]) / insulin_time_constant;
        dxdt[kActivity] = activity;

        double absorption = 0.0;
        for (std::size_t k = 0; k < gut_time_constants.size(); ++k) {
            double rate = x[kFirstGut + k] / gut_time_constants[k];
            dxdt[kFirstGut + k] = -rate;
            absorption += rate;
        }

        dxdt[kGlucose] = actual.insulin_sensitivity * (actual.basal_rate - scheduled_basal_rate) / 60.0 -
                         actual.insulin_sensitivity * activity + actual.carb_sensitivity * absorption;
    }
};

TimePoint
at_minute(const ScenarioOptions &options, double minutes) {
    return time_from_seconds(options.start_seconds + minutes * 60.0);
}

} // namespace

SessionInputs
simulate_scenario(const DosingProfile &actual,
                  const DosingProfile &settings,
                  const std::vector<MealEvent> &meals,
                  const ScenarioOptions &options) {
    if (options.duration_minutes <= 0.0 || options.sample_interval_minutes <= 0.0) {
        throw std::invalid_argument("Scenario duration and sample interval must be positive.");
    }
    if (settings.carb_sensitivity == 0.0) { throw std::invalid_argument("Carb sensitivity setting cannot be zero."); }

    const double dt = 1.0; // minutes
    const int n_steps = static_cast<int>(std::round(options.duration_minutes / dt));
    const int sample_every = std::max(1, static_cast<int>(std::round(options.sample_interval_minutes / dt)));

    GlucoseModel model{ actual, settings.basal_rate, options.insulin_time_constant, {} };
    for (const auto &meal : meals) {
        model.gut_time_constants.push_back(std::max(dt, meal.absorption_minutes * options.carb_time_constant_fraction));
    }

    state_type state(kFirstGut + meals.size(), 0.0);
    state[kGlucose] = options.initial_glucose;

    // history[i] is the state at minute i, after the events of that minute.
    std::vector<state_type> history;
    history.reserve(n_steps + 1);

    odeint::runge_kutta4<state_type> stepper;
    double t = 0.0;
    for (int step = 0; step <= n_steps; ++step) {
        for (std::size_t k = 0; k < meals.size(); ++k) {
            if (static_cast<int>(std::round(meals[k].start_minutes / dt)) == step) {
                state[kInsulinFirst] += meals[k].bolus_units;
                state[kFirstGut + k] += meals[k].carbs;
            }
        }
        history.push_back(state);
        if (step < n_steps) {
            stepper.do_step(model, state, t, dt);
            t += dt;
        }
    }

    SessionInputs inputs;
    inputs.start_date = at_minute(options, 0.0);
    inputs.end_date = at_minute(options, n_steps * dt);

    for (int step = 0; step <= n_steps; step += sample_every) {
        double minutes = step * dt;
        TimePoint when = at_minute(options, minutes);
        const state_type &x = history[step];

        inputs.series.glucose.push_back(GlucoseSample{ when, when, x[kGlucose] });
        inputs.series.insulin_effect.push_back(GlucoseEffect{ when, when, -settings.insulin_sensitivity * x[kActivity] });
        inputs.series.basal_effect.push_back(
          GlucoseEffect{ when, when, settings.insulin_sensitivity * settings.basal_rate / 60.0 * minutes });
    }

    const double observed_scale = actual.carb_sensitivity / settings.carb_sensitivity;
    for (std::size_t k = 0; k < meals.size(); ++k) {
        const MealEvent &meal = meals[k];
        double end_minutes = meal.start_minutes + meal.absorption_minutes;
        double observed_end_minutes = std::min(end_minutes, n_steps * dt);
        int end_step = std::clamp(static_cast<int>(std::round(observed_end_minutes / dt)), 0, n_steps);

        CarbAbsorptionRecord record;
        record.observed_start = at_minute(options, meal.start_minutes);
        record.observed_end = at_minute(options, observed_end_minutes);
        record.entered_carbs = meal.carbs;
        record.observed_carbs = observed_scale * (meal.carbs - history[end_step][kFirstGut + k]);
        record.estimated_time_remaining = std::max(0.0, end_minutes - n_steps * dt) * 60.0;
        inputs.carb_records.push_back(record);
    }
    return inputs;
}

SessionInputs
make_meal_scenario() {
    DosingProfile settings;
    DosingProfile actual;
    actual.insulin_sensitivity = 60.0;
    actual.carb_sensitivity = 4.4;
    actual.basal_rate = 1.1;

    MealEvent lunch;
    lunch.start_minutes = 60.0;
    lunch.carbs = 45.0;
    lunch.bolus_units = 3.5;
    lunch.absorption_minutes = 120.0;
    return simulate_scenario(actual, settings, { lunch });
}

SessionInputs
make_fasting_scenario() {
    DosingProfile settings;
    DosingProfile actual;
    actual.basal_rate = 1.2;
    return simulate_scenario(actual, settings, {});
}

} // namespace examples
} // namespace settings_review
