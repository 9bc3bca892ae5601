#include "diagnostic_report.hpp"
#include <iomanip>
#include <sstream>

namespace settings_review {

namespace {

std::string
format_value(const std::optional<double> &value, int precision, const char *suffix = "") {
    if (!value) { return kUnavailable; }
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << *value << suffix;
    return out.str();
}

std::optional<double>
multiplier_field(const std::optional<EstimatedMultipliers> &multipliers, double EstimatedMultipliers::*field) {
    if (!multipliers) { return std::nullopt; }
    return (*multipliers).*field;
}

void
write_multipliers(std::ostringstream &out, const std::optional<EstimatedMultipliers> &multipliers) {
    out << " ISF multiplier: "
        << format_value(multiplier_field(multipliers, &EstimatedMultipliers::insulin_sensitivity_multiplier), 3) << "\n";
    out << " CR multiplier: "
        << format_value(multiplier_field(multipliers, &EstimatedMultipliers::carb_ratio_multiplier), 3) << "\n";
    out << " CSF multiplier: "
        << format_value(multiplier_field(multipliers, &EstimatedMultipliers::carb_sensitivity_multiplier), 3) << "\n";
    out << " Basal multiplier: "
        << format_value(multiplier_field(multipliers, &EstimatedMultipliers::basal_multiplier), 3) << "\n";
}

nlohmann::json
optional_to_json(const std::optional<double> &value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json
multipliers_to_json(const std::optional<EstimatedMultipliers> &multipliers) {
    if (!multipliers) { return nullptr; }
    return { { "start", seconds_since_epoch(multipliers->start_date) },
             { "end", seconds_since_epoch(multipliers->end_date) },
             { "basal_multiplier", multipliers->basal_multiplier },
             { "insulin_sensitivity_multiplier", multipliers->insulin_sensitivity_multiplier },
             { "carb_sensitivity_multiplier", multipliers->carb_sensitivity_multiplier },
             { "carb_ratio_multiplier", multipliers->carb_ratio_multiplier } };
}

} // namespace

std::string
render_report(const EstimationSession &session,
              const ReportOptions &options,
              const std::optional<EstimatedMultipliers> &combined) {
    std::ostringstream out;
    out << "## Settings Review\n";
    out << session.status() << "\n";
    out << "Window: " << format_time_point(session.start_date(), options.time_format, options.utc) << " - "
        << format_time_point(session.end_date(), options.time_format, options.utc) << "\n";

    for (const auto &interval : session.intervals()) {
        out << "\n ---------- \n";
        out << " " << format_time_point(interval.start_date, options.time_format, options.utc) << ", "
            << format_time_point(interval.end_date, options.time_format, options.utc) << ", " << to_string(interval.type)
            << "\n";
        out << " entered carbs: " << format_value(interval.entered_carbs, 1, " g")
            << ", observed carbs: " << format_value(interval.observed_carbs, 1, " g") << "\n";
        out << " deltaBG: " << format_value(interval.delta_glucose, 1) << "\n";
        out << " deltaBGinsulin: " << format_value(interval.delta_glucose_insulin, 1) << "\n";
        out << " deltaBGbasal: " << format_value(interval.delta_glucose_basal, 1) << "\n";
        write_multipliers(out, interval.estimated_multipliers);
    }

    if (combined) {
        out << "\n ========== \n";
        out << " Combined estimate, " << format_time_point(combined->start_date, options.time_format, options.utc)
            << ", " << format_time_point(combined->end_date, options.time_format, options.utc) << "\n";
        write_multipliers(out, combined);
    }
    return out.str();
}

nlohmann::json
render_report_json(const EstimationSession &session, const std::optional<EstimatedMultipliers> &combined) {
    nlohmann::json intervals = nlohmann::json::array();
    for (const auto &interval : session.intervals()) {
        intervals.push_back({ { "start", seconds_since_epoch(interval.start_date) },
                              { "end", seconds_since_epoch(interval.end_date) },
                              { "type", to_string(interval.type) },
                              { "glucose_samples", interval.glucose.size() },
                              { "entered_carbs", optional_to_json(interval.entered_carbs) },
                              { "observed_carbs", optional_to_json(interval.observed_carbs) },
                              { "delta_glucose", optional_to_json(interval.delta_glucose) },
                              { "delta_glucose_insulin", optional_to_json(interval.delta_glucose_insulin) },
                              { "delta_glucose_basal", optional_to_json(interval.delta_glucose_basal) },
                              { "multipliers", multipliers_to_json(interval.estimated_multipliers) } });
    }

    return { { "status", session.status() },
             { "start", seconds_since_epoch(session.start_date()) },
             { "end", seconds_since_epoch(session.end_date()) },
             { "intervals", intervals },
             { "combined", multipliers_to_json(combined) } };
}

} // namespace settings_review
