#ifndef DIAGNOSTIC_REPORT_HPP
#define DIAGNOSTIC_REPORT_HPP

#include "estimation_config.hpp"
#include "estimation_interval.hpp"
#include "interval_assembler.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace settings_review {

/// Marker printed in place of a value that was not computed.
inline constexpr const char *kUnavailable = "unavailable";

/**
 * @brief Human-readable report of an assembled (and possibly estimated) session.
 *
 * A "## Settings Review" header and the status, then one block per interval with its
 * bounds, type, carb totals, glucose deltas and multipliers. The combined estimate, when
 * given, closes the report.
 */
std::string
render_report(const EstimationSession &session,
              const ReportOptions &options = ReportOptions(),
              const std::optional<EstimatedMultipliers> &combined = std::nullopt);

/**
 * @brief The same content as render_report() as a JSON document.
 *
 * Times are epoch seconds; values that were not computed are null.
 */
nlohmann::json
render_report_json(const EstimationSession &session,
                   const std::optional<EstimatedMultipliers> &combined = std::nullopt);

} // namespace settings_review

#endif // DIAGNOSTIC_REPORT_HPP
