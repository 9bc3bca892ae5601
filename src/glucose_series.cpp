#include "glucose_series.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace settings_review {

std::string
format_time_point(TimePoint t, const std::string &format, bool utc) {
    std::time_t seconds = Clock::to_time_t(t);
    std::tm broken_down{};
    if (utc) {
        gmtime_r(&seconds, &broken_down);
    } else {
        localtime_r(&seconds, &broken_down);
    }
    std::ostringstream out;
    out << std::put_time(&broken_down, format.c_str());
    return out.str();
}

} // namespace settings_review
