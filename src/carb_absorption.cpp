#include "carb_absorption.hpp"

namespace settings_review {

std::optional<CarbEntry>
extract_carb_entry(const CarbAbsorptionRecord &record, std::string &error) {
    if (!record.observed_start) {
        error = "observed start not available";
        return std::nullopt;
    }
    if (!record.observed_end) {
        error = "observed end not available";
        return std::nullopt;
    }
    if (!record.entered_carbs) {
        error = "entered carbs not available";
        return std::nullopt;
    }
    if (!record.observed_carbs) {
        error = "observed carbs not available";
        return std::nullopt;
    }
    if (!record.estimated_time_remaining) {
        error = "estimated time remaining not available";
        return std::nullopt;
    }
    if (*record.observed_end < *record.observed_start) {
        error = "observed end precedes observed start";
        return std::nullopt;
    }

    CarbEntry entry;
    entry.start = *record.observed_start;
    entry.end = *record.observed_end;
    entry.entered_carbs = *record.entered_carbs;
    entry.observed_carbs = *record.observed_carbs;
    entry.time_remaining = *record.estimated_time_remaining;
    return entry;
}

} // namespace settings_review
