#ifndef SESSION_IO_HPP
#define SESSION_IO_HPP

#include "carb_absorption.hpp"
#include "estimation_config.hpp"
#include "interval_assembler.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace settings_review {

/**
 * @brief Everything needed to construct an EstimationSession.
 */
struct SessionInputs {
    TimePoint start_date;
    TimePoint end_date;
    SessionSeries series;
    std::vector<CarbAbsorptionRecord> carb_records;
};

/**
 * @brief Reads session inputs from a JSON document.
 *
 * Expected layout (times in epoch seconds):
 *   { "start": t, "end": t,
 *     "glucose": [{"start": t, "end": t, "value": mg/dL}, ...],
 *     "insulin_effect": [...], "basal_effect": [...],
 *     "carb_records": [{"observed_start": t, "observed_end": t, "entered_carbs": g,
 *                       "observed_carbs": g, "estimated_time_remaining": s}, ...] }
 * Record fields may be absent or null. A sample without "end" ends at its start.
 *
 * @throws std::runtime_error if the window or a sample is malformed.
 */
SessionInputs
parse_session_inputs(const nlohmann::json &document);

/**
 * @brief Reads and parses a session input file.
 * @throws std::runtime_error if the file cannot be read or is malformed.
 */
SessionInputs
load_session_inputs(const std::string &path);

/// Serializes inputs in the layout accepted by parse_session_inputs().
nlohmann::json
session_inputs_to_json(const SessionInputs &inputs);

/// Creates a session over the inputs' window and series.
std::unique_ptr<EstimationSession>
make_session(const SessionInputs &inputs, const EstimationConfig &config = EstimationConfig());

} // namespace settings_review

#endif // SESSION_IO_HPP
