#ifndef GLUCOSE_SERIES_HPP
#define GLUCOSE_SERIES_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace settings_review {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/**
 * @brief A single glucose reading in mg/dL.
 *
 * CGM readings are instantaneous, so start_date and end_date usually coincide.
 */
struct GlucoseSample {
    TimePoint start_date;
    TimePoint end_date;
    double value = 0.0; ///< mg/dL
};

/**
 * @brief A point of a predicted glucose-effect curve.
 *
 * The value is the cumulative glucose contribution (mg/dL) of the modeled process
 * (insulin action or basal delivery) up to end_date.
 */
struct GlucoseEffect {
    TimePoint start_date;
    TimePoint end_date;
    double value = 0.0; ///< mg/dL
};

using GlucoseSeries = std::vector<GlucoseSample>;
using EffectSeries = std::vector<GlucoseEffect>;

/**
 * @brief Returns the samples of an ordered series that overlap [start, end].
 *
 * A sample is dropped when it ends before start or begins after end. A missing bound
 * leaves that side of the range open.
 */
template<typename Sample>
std::vector<Sample>
filter_date_range(const std::vector<Sample> &series, std::optional<TimePoint> start, std::optional<TimePoint> end) {
    std::vector<Sample> result;
    for (const auto &sample : series) {
        if (start && sample.end_date < *start) { continue; }
        if (end && sample.start_date > *end) { continue; }
        result.push_back(sample);
    }
    return result;
}

// Convenience conversions used by the JSON layer and the tests.
inline TimePoint
time_from_seconds(double seconds_since_epoch) {
    return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds_since_epoch)));
}

inline double
seconds_since_epoch(TimePoint t) {
    return std::chrono::duration<double>(t.time_since_epoch()).count();
}

/**
 * @brief Formats a time point with a strftime-style format, in UTC or local time.
 */
std::string
format_time_point(TimePoint t, const std::string &format = "%Y-%m-%d %H:%M:%S", bool utc = true);

} // namespace settings_review

#endif // GLUCOSE_SERIES_HPP
