#include "estimation_config.hpp"
#include <fstream>
#include <stdexcept>

namespace settings_review {

std::string
to_string(EstimatorKind kind) {
    switch (kind) {
        case EstimatorKind::General:
            return "general";
        case EstimatorKind::Fasting:
            return "fasting";
        case EstimatorKind::CarbAbsorption:
            return "carb_absorption";
        case EstimatorKind::ByIntervalType:
            return "by_interval_type";
    }
    return "unknown";
}

EstimatorKind
estimator_kind_from_string(const std::string &name) {
    if (name == "general") { return EstimatorKind::General; }
    if (name == "fasting") { return EstimatorKind::Fasting; }
    if (name == "carb_absorption") { return EstimatorKind::CarbAbsorption; }
    if (name == "by_interval_type") { return EstimatorKind::ByIntervalType; }
    throw std::invalid_argument("Unknown estimator '" + name + "'.");
}

void
EstimationConfig::validate() const {
    // The estimators need a first and a last reading that are distinct samples.
    if (min_glucose_samples < 2) {
        throw std::invalid_argument("min_glucose_samples must be at least 2, got " +
                                    std::to_string(min_glucose_samples) + ".");
    }
    if (combined.prior_weight < 0.0) { throw std::invalid_argument("combined.prior_weight must be non-negative."); }
    if (combined.max_iterations <= 0) { throw std::invalid_argument("combined.max_iterations must be positive."); }
    if (report.time_format.empty()) { throw std::invalid_argument("report.time_format cannot be empty."); }
}

void
to_json(nlohmann::json &j, const EstimationConfig &config) {
    j = nlohmann::json{ { "min_glucose_samples", config.min_glucose_samples },
                        { "estimator", to_string(config.estimator) },
                        { "verbose", config.verbose },
                        { "combined",
                          { { "enabled", config.combined.enabled },
                            { "prior_weight", config.combined.prior_weight },
                            { "max_iterations", config.combined.max_iterations } } },
                        { "report", { { "time_format", config.report.time_format }, { "utc", config.report.utc } } } };
}

void
from_json(const nlohmann::json &j, EstimationConfig &config) {
    config.min_glucose_samples = j.value("min_glucose_samples", config.min_glucose_samples);
    if (j.contains("estimator")) { config.estimator = estimator_kind_from_string(j.at("estimator").get<std::string>()); }
    config.verbose = j.value("verbose", config.verbose);

    if (j.contains("combined")) {
        const auto &combined = j.at("combined");
        config.combined.enabled = combined.value("enabled", config.combined.enabled);
        config.combined.prior_weight = combined.value("prior_weight", config.combined.prior_weight);
        config.combined.max_iterations = combined.value("max_iterations", config.combined.max_iterations);
    }
    if (j.contains("report")) {
        const auto &report = j.at("report");
        config.report.time_format = report.value("time_format", config.report.time_format);
        config.report.utc = report.value("utc", config.report.utc);
    }
    config.validate();
}

EstimationConfig
load_estimation_config(const std::string &path) {
    std::ifstream input(path);
    if (!input) { throw std::runtime_error("[EstimationConfig] Cannot open config file '" + path + "'."); }

    EstimationConfig config;
    try {
        nlohmann::json parsed = nlohmann::json::parse(input);
        config = parsed.get<EstimationConfig>();
    } catch (const nlohmann::json::exception &e) {
        throw std::runtime_error("[EstimationConfig] Invalid config file '" + path + "': " + e.what());
    } catch (const std::invalid_argument &e) {
        throw std::runtime_error("[EstimationConfig] Invalid value in '" + path + "': " + e.what());
    }
    return config;
}

} // namespace settings_review
