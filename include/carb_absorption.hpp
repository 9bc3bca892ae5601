#ifndef CARB_ABSORPTION_HPP
#define CARB_ABSORPTION_HPP

#include "glucose_series.hpp"
#include <optional>
#include <string>
#include <vector>

namespace settings_review {

/**
 * @brief Absorption status of one logged meal, as reported by the carb model.
 *
 * Every field may be missing; a record without all five is skipped during assembly.
 */
struct CarbAbsorptionRecord {
    std::optional<TimePoint> observed_start;
    std::optional<TimePoint> observed_end;
    std::optional<double> entered_carbs;            ///< grams
    std::optional<double> observed_carbs;           ///< grams absorbed according to counteraction
    std::optional<double> estimated_time_remaining; ///< seconds, > 0 while still absorbing
};

/**
 * @brief Fully populated view of a CarbAbsorptionRecord.
 */
struct CarbEntry {
    TimePoint start;
    TimePoint end;
    double entered_carbs = 0.0;
    double observed_carbs = 0.0;
    double time_remaining = 0.0;

    bool is_active() const { return time_remaining > 0.0; }
};

/**
 * @brief Extracts a CarbEntry from a record.
 *
 * @param record The record to read.
 * @param error Receives a description of the first missing or inconsistent field.
 * @return The entry, or std::nullopt if a field is missing or observed_end < observed_start.
 */
std::optional<CarbEntry>
extract_carb_entry(const CarbAbsorptionRecord &record, std::string &error);

} // namespace settings_review

#endif // CARB_ABSORPTION_HPP
