#ifndef INTERVAL_ASSEMBLER_HPP
#define INTERVAL_ASSEMBLER_HPP

#include "carb_absorption.hpp"
#include "estimation_config.hpp"
#include "estimation_interval.hpp"
#include "glucose_series.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace settings_review {

/**
 * @brief Read-only input series shared by all intervals of a session.
 */
struct SessionSeries {
    GlucoseSeries glucose;
    EffectSeries insulin_effect;
    EffectSeries basal_effect;
};

/**
 * @brief Ordered, gap-free list of estimation intervals under construction.
 *
 * All edits go through the explicit operations below, each of which re-slices the
 * affected interval against the bound series.
 */
class EstimationIntervalList {
  public:
    explicit EstimationIntervalList(const SessionSeries &series);

    bool empty() const { return intervals_.empty(); }
    std::size_t size() const { return intervals_.size(); }
    const EstimationInterval &operator[](std::size_t index) const { return intervals_[index]; }
    EstimationInterval &operator[](std::size_t index) { return intervals_[index]; }
    const EstimationInterval &back() const { return intervals_.back(); }

    std::vector<EstimationInterval>::iterator begin() { return intervals_.begin(); }
    std::vector<EstimationInterval>::iterator end() { return intervals_.end(); }
    std::vector<EstimationInterval>::const_iterator begin() const { return intervals_.begin(); }
    std::vector<EstimationInterval>::const_iterator end() const { return intervals_.end(); }

    void append_fasting(TimePoint start, TimePoint end);
    void append_carb_absorption(TimePoint start, TimePoint end, double entered_carbs, double observed_carbs);

    /// Sets the end of the last interval.
    void close_last(TimePoint end);

    /**
     * @brief Merges an absorption entry into the last interval.
     *
     * Bounds become the union of both spans and the carb totals are summed.
     */
    void merge_into_last(TimePoint start, TimePoint end, double entered_carbs, double observed_carbs);

    /**
     * @brief Erases every carb absorption interval ending after cut.
     * @return The earlier of cut and the starts of the erased intervals.
     */
    TimePoint remove_absorptions_ending_after(TimePoint cut);

    /// Drops intervals starting at or after end and clips the last remaining one.
    void truncate(TimePoint end);

    void clear() { intervals_.clear(); }

  private:
    void reslice(EstimationInterval &interval) const;

    const SessionSeries &series_;
    std::vector<EstimationInterval> intervals_;
};

/**
 * @brief One review of the dosing settings over a fixed, already collected window.
 *
 * assemble() partitions the window into fasting and carb absorption intervals;
 * estimate_parameters() then fills in the multipliers of each interval. Both mutate
 * the session and require exclusive access to it for their duration.
 */
class EstimationSession {
  public:
    EstimationSession(TimePoint start_date, TimePoint end_date, EstimationConfig config = EstimationConfig());

    // The interval list refers to series_, so a session is not copyable or movable.
    EstimationSession(const EstimationSession &) = delete;
    EstimationSession &operator=(const EstimationSession &) = delete;

    void set_glucose(GlucoseSeries glucose) { series_.glucose = std::move(glucose); }
    void set_insulin_effect(EffectSeries insulin_effect) { series_.insulin_effect = std::move(insulin_effect); }
    void set_basal_effect(EffectSeries basal_effect) { series_.basal_effect = std::move(basal_effect); }
    void set_carb_records(std::vector<CarbAbsorptionRecord> records) { carb_records_ = std::move(records); }

    /**
     * @brief Builds the interval list from the carb records.
     *
     * Restores the window given at construction, so repeated calls give the same result.
     * A collapsed window (start == end) after the call means no usable intervals.
     */
    void assemble();

    /// Estimates every assembled interval with the configured estimator.
    void estimate_parameters();

    /// assemble() followed by estimate_parameters().
    void update_parameter_estimates();

    TimePoint start_date() const { return start_date_; }
    TimePoint end_date() const { return end_date_; }
    const std::string &status() const { return status_; }
    const EstimationIntervalList &intervals() const { return intervals_; }
    EstimationIntervalList &intervals() { return intervals_; }
    const SessionSeries &series() const { return series_; }
    const EstimationConfig &config() const { return config_; }

    /// Intervals that received a multiplier set.
    std::size_t estimated_interval_count() const;

  private:
    // End of the assembled territory.
    TimePoint running_end() const;

    // Handles an entry still absorbing at the end of the window; always ends the pass.
    void finish_at_active_entry(const CarbEntry &entry);

    void append_status(const std::string &line);
    void log(const std::string &message) const;

    TimePoint initial_start_date_;
    TimePoint initial_end_date_;
    TimePoint start_date_;
    TimePoint end_date_;
    EstimationConfig config_;
    SessionSeries series_;
    std::vector<CarbAbsorptionRecord> carb_records_;
    EstimationIntervalList intervals_;
    std::string status_;
};

} // namespace settings_review

#endif // INTERVAL_ASSEMBLER_HPP
