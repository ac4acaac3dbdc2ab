#include "time_utils.hpp"

#include <iomanip>
#include <sstream>

namespace aegis {

std::tm to_utc_tm(Clock::time_point tp) {
    std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm;
}

std::string format_utc(Clock::time_point tp, const char* fmt) {
    std::tm tm = to_utc_tm(tp);
    char buf[64];
    std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf);
}

std::string log_timestamp(Clock::time_point tp) {
    return format_utc(tp, "%Y-%m-%d %H:%M:%S");
}

std::string utc_date(Clock::time_point tp) {
    return format_utc(tp, "%Y-%m-%d");
}

std::string iso_timestamp(Clock::time_point tp) {
    using namespace std::chrono;
    const auto micros = duration_cast<microseconds>(tp.time_since_epoch()).count() % 1000000;
    std::ostringstream oss;
    oss << format_utc(tp, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0')
        << (micros < 0 ? micros + 1000000 : micros);
    return oss.str();
}

std::optional<Clock::time_point> parse_log_timestamp(const std::string& s) {
    std::tm tm{};
    std::istringstream iss(s);
    iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (iss.fail()) return std::nullopt;
    std::time_t t = timegm(&tm);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return Clock::from_time_t(t);
}

int weekday_index(const std::tm& tm) {
    return (tm.tm_wday + 6) % 7;
}

}  // namespace aegis
