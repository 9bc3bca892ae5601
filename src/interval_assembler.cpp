#include "interval_assembler.hpp"
#include <algorithm> // For std::min, std::max
#include <iostream>

namespace settings_review {

// --- EstimationIntervalList --- //

EstimationIntervalList::EstimationIntervalList(const SessionSeries &series)
  : series_(series) {}

void
EstimationIntervalList::reslice(EstimationInterval &interval) const {
    interval.glucose = filter_date_range(series_.glucose, interval.start_date, interval.end_date);
    interval.insulin_effect = filter_date_range(series_.insulin_effect, interval.start_date, interval.end_date);
    interval.basal_effect = filter_date_range(series_.basal_effect, interval.start_date, interval.end_date);
}

void
EstimationIntervalList::append_fasting(TimePoint start, TimePoint end) {
    intervals_.emplace_back(start,
                            end,
                            EstimationIntervalType::Fasting,
                            filter_date_range(series_.glucose, start, end),
                            filter_date_range(series_.insulin_effect, start, end),
                            filter_date_range(series_.basal_effect, start, end));
}

void
EstimationIntervalList::append_carb_absorption(TimePoint start,
                                               TimePoint end,
                                               double entered_carbs,
                                               double observed_carbs) {
    intervals_.emplace_back(start,
                            end,
                            EstimationIntervalType::CarbAbsorption,
                            filter_date_range(series_.glucose, start, end),
                            filter_date_range(series_.insulin_effect, start, end),
                            filter_date_range(series_.basal_effect, start, end),
                            entered_carbs,
                            observed_carbs);
}

void
EstimationIntervalList::close_last(TimePoint end) {
    EstimationInterval &last = intervals_.back();
    last.end_date = end;
    reslice(last);
}

void
EstimationIntervalList::merge_into_last(TimePoint start,
                                        TimePoint end,
                                        double entered_carbs,
                                        double observed_carbs) {
    EstimationInterval &last = intervals_.back();
    last.start_date = std::min(last.start_date, start);
    last.end_date = std::max(last.end_date, end);
    last.entered_carbs = last.entered_carbs.value_or(0.0) + entered_carbs;
    last.observed_carbs = last.observed_carbs.value_or(0.0) + observed_carbs;
    reslice(last);
}

TimePoint
EstimationIntervalList::remove_absorptions_ending_after(TimePoint cut) {
    auto it = intervals_.begin();
    while (it != intervals_.end()) {
        if (it->type == EstimationIntervalType::CarbAbsorption && it->end_date > cut) {
            cut = std::min(cut, it->start_date);
            it = intervals_.erase(it);
        } else {
            ++it;
        }
    }
    return cut;
}

void
EstimationIntervalList::truncate(TimePoint end) {
    while (!intervals_.empty() && intervals_.back().start_date >= end) { intervals_.pop_back(); }
    if (!intervals_.empty() && intervals_.back().end_date > end) { close_last(end); }
}

// --- EstimationSession --- //

EstimationSession::EstimationSession(TimePoint start_date, TimePoint end_date, EstimationConfig config)
  : initial_start_date_(start_date)
  , initial_end_date_(end_date)
  , start_date_(start_date)
  , end_date_(end_date)
  , config_(std::move(config))
  , intervals_(series_) {
    config_.validate();
}

TimePoint
EstimationSession::running_end() const {
    return intervals_.empty() ? start_date_ : intervals_.back().end_date;
}

void
EstimationSession::append_status(const std::string &line) {
    if (!status_.empty()) { status_ += "\n"; }
    status_ += line;
}

void
EstimationSession::log(const std::string &message) const {
    if (config_.verbose) { std::cout << "[IntervalAssembler] " << message << std::endl; }
}

void
EstimationSession::assemble() {
    start_date_ = initial_start_date_;
    end_date_ = initial_end_date_;
    intervals_.clear();
    status_.clear();

    log("Assembling " + std::to_string(carb_records_.size()) + " carb records, startDate: " +
        format_time_point(start_date_) + ", endDate: " + format_time_point(end_date_));

    for (std::size_t index = 0; index < carb_records_.size(); ++index) {
        std::string error;
        std::optional<CarbEntry> entry = extract_carb_entry(carb_records_[index], error);
        if (!entry) {
            std::cerr << "[IntervalAssembler] Warning: skipping carb record " << index << ": " << error << std::endl;
            append_status("*** Err: carb record " + std::to_string(index) + " skipped, " + error);
            continue;
        }

        // An entry still absorbing when the window ends cannot be estimated and ends the pass.
        if (entry->is_active() || entry->end > end_date_) {
            finish_at_active_entry(*entry);
            return;
        }

        if (!intervals_.empty() && entry->start < intervals_.back().start_date) {
            std::cerr << "[IntervalAssembler] Warning: skipping out-of-order carb record " << index << std::endl;
            append_status("*** Err: carb record " + std::to_string(index) + " skipped, out of order");
            continue;
        }

        if (entry->start < start_date_) {
            start_date_ = std::max(entry->end, start_date_);
            log("Detected entry prior to start, moved start to " + format_time_point(start_date_));
            continue;
        }

        if (intervals_.empty()) {
            if (entry->start > start_date_) {
                intervals_.append_fasting(start_date_, entry->start);
                log("Added first fasting interval ending at " + format_time_point(entry->start));
            }
            intervals_.append_carb_absorption(entry->start, entry->end, entry->entered_carbs, entry->observed_carbs);
            log("Added first carbAbsorption interval at " + format_time_point(entry->start));
        } else if (intervals_.back().type == EstimationIntervalType::Fasting) {
            intervals_.close_last(entry->start);
            intervals_.append_carb_absorption(entry->start, entry->end, entry->entered_carbs, entry->observed_carbs);
            log("Added new carbAbsorption interval at " + format_time_point(entry->start));
        } else if (entry->start > intervals_.back().end_date) {
            intervals_.append_fasting(intervals_.back().end_date, entry->start);
            intervals_.append_carb_absorption(entry->start, entry->end, entry->entered_carbs, entry->observed_carbs);
            log("Added fasting interval followed by carbAbsorption interval ending at " + format_time_point(entry->end));
        } else {
            intervals_.merge_into_last(entry->start, entry->end, entry->entered_carbs, entry->observed_carbs);
            log("Merged carbs of entry ending at " + format_time_point(entry->end));
        }
    }

    TimePoint assembled_end = running_end();
    if (assembled_end < end_date_) {
        intervals_.append_fasting(assembled_end, end_date_);
        log("Added trailing fasting interval starting at " + format_time_point(assembled_end));
        append_status("*** Estimation interval assembly completed with a trailing fasting interval");
    } else {
        append_status("*** Estimation interval assembly completed");
    }
    log("Completed assembly, startDate: " + format_time_point(start_date_) +
        ", endDate: " + format_time_point(end_date_));
}

void
EstimationSession::finish_at_active_entry(const CarbEntry &entry) {
    log("Detected active entry starting at " + format_time_point(entry.start));

    if (entry.start < start_date_) {
        // Nothing in the window is free of the active absorption.
        end_date_ = start_date_;
        intervals_.clear();
        std::cerr << "[IntervalAssembler] Active carb absorption started before start of estimation, no intervals."
                  << std::endl;
        append_status("*** Err: active carb absorption started before start of estimation");
        return;
    }

    TimePoint assembled_end = running_end();

    if (entry.start > end_date_) {
        if (assembled_end < end_date_) {
            intervals_.append_fasting(assembled_end, end_date_);
            log("Added trailing fasting interval starting at " + format_time_point(assembled_end));
        }
        append_status("*** Estimation interval assembly completed, active absorption detected after estimation end");
        return;
    }

    if (entry.start > assembled_end) {
        end_date_ = entry.start;
        intervals_.append_fasting(assembled_end, end_date_);
        log("Added trailing fasting interval starting at " + format_time_point(assembled_end));
        append_status("*** Estimation interval assembly completed with a fasting interval, active absorption "
                      "detected before estimation end");
        return;
    }

    // The active entry overlaps assembled territory: drop the absorptions it cuts into.
    TimePoint cut = intervals_.remove_absorptions_ending_after(entry.start);
    intervals_.truncate(cut);
    end_date_ = cut;
    append_status("*** Completed assembly of estimation intervals after trimming out active absorptions");
    log("Assembly completed after trimming trailing absorptions, startDate: " + format_time_point(start_date_) +
        ", endDate: " + format_time_point(end_date_));
}

void
EstimationSession::estimate_parameters() {
    for (auto &interval : intervals_) {
        interval.clear_estimates();
        interval.estimate_parameters(config_.estimator, config_.min_glucose_samples, config_.verbose);
    }
}

void
EstimationSession::update_parameter_estimates() {
    assemble();
    log("Number of estimation intervals: " + std::to_string(intervals_.size()));
    estimate_parameters();
}

std::size_t
EstimationSession::estimated_interval_count() const {
    return static_cast<std::size_t>(
      std::count_if(intervals_.begin(), intervals_.end(), [](const EstimationInterval &interval) {
          return interval.estimated_multipliers.has_value();
      }));
}

} // namespace settings_review
