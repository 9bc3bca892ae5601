#ifndef ESTIMATION_CONFIG_HPP
#define ESTIMATION_CONFIG_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace settings_review {

/**
 * @brief Selects which per-interval estimator runs during the session pipeline.
 */
enum class EstimatorKind {
    General,        ///< Plane projection on every interval regardless of type.
    Fasting,        ///< Line projection on basal and ISF only.
    CarbAbsorption, ///< Line projection on CSF and CR only.
    ByIntervalType  ///< Fasting estimator on fasting intervals, carb estimator on absorption intervals.
};

std::string
to_string(EstimatorKind kind);

/**
 * @brief Parses "general", "fasting", "carb_absorption" or "by_interval_type".
 * @throws std::invalid_argument on any other name.
 */
EstimatorKind
estimator_kind_from_string(const std::string &name);

struct CombinedEstimateOptions {
    bool enabled = true;
    double prior_weight = 1.0; ///< Weight of the pull toward the nominal multipliers.
    int max_iterations = 50;
};

struct ReportOptions {
    std::string time_format = "%Y-%m-%d %H:%M:%S"; ///< strftime format for interval bounds
    bool utc = true;
};

struct EstimationConfig {
    int min_glucose_samples = 6;
    EstimatorKind estimator = EstimatorKind::General;
    bool verbose = false;
    CombinedEstimateOptions combined;
    ReportOptions report;

    /**
     * @brief Checks value ranges.
     * @throws std::invalid_argument if a value is out of range.
     */
    void validate() const;
};

void
to_json(nlohmann::json &j, const EstimationConfig &config);

/**
 * @brief Reads a config object; absent keys keep their defaults.
 * @throws nlohmann::json::exception on type mismatches, std::invalid_argument on bad values.
 */
void
from_json(const nlohmann::json &j, EstimationConfig &config);

/**
 * @brief Loads and validates a JSON configuration file.
 * @throws std::runtime_error if the file cannot be read or parsed.
 */
EstimationConfig
load_estimation_config(const std::string &path);

} // namespace settings_review

#endif // ESTIMATION_CONFIG_HPP
