#include "time_resolution.h"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace cloudpulse {

namespace {

constexpr auto kDefaultSpan = std::chrono::hours(1);

auto ToUtcTm(TimePoint tp) -> std::tm {
    auto tt = Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    return tm;
}

auto ParseOffsetSeconds(const std::string& rest, long& offset) -> bool {
    if (rest.empty() || rest == "Z" || rest == "z") {
        offset = 0;
        return true;
    }
    if (rest.size() != 6 || (rest[0] != '+' && rest[0] != '-') || rest[3] != ':') {
        return false;
    }
    for (size_t i : {1, 2, 4, 5}) {
        if (!std::isdigit(static_cast<unsigned char>(rest[i]))) return false;
    }
    long hours = std::stol(rest.substr(1, 2));
    long minutes = std::stol(rest.substr(4, 2));
    offset = (hours * 3600 + minutes * 60) * (rest[0] == '-' ? -1 : 1);
    return true;
}

} // namespace

auto ParseIsoTime(const std::string& iso) -> std::optional<TimePoint> {
    if (iso.size() < 19) { return std::nullopt; }
    std::tm tm{};
    std::istringstream ss(iso.substr(0, 19));
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }

    std::string rest = iso.substr(19);
    if (!rest.empty() && rest[0] == '.') {
        size_t i = 1;
        while (i < rest.size() && std::isdigit(static_cast<unsigned char>(rest[i]))) { ++i; }
        if (i == 1) { return std::nullopt; }
        rest = rest.substr(i);
    }
    long offset = 0;
    if (!ParseOffsetSeconds(rest, offset)) {
        return std::nullopt;
    }

    std::time_t tt = timegm(&tm);
    return Clock::from_time_t(tt) - std::chrono::seconds(offset);
}

auto FormatUtc(TimePoint tp, const char* pattern) -> std::string {
    std::tm tm = ToUtcTm(tp);
    std::ostringstream oss;
    oss << std::put_time(&tm, pattern);
    return oss.str();
}

auto FormatIsoTime(TimePoint tp) -> std::string {
    return FormatUtc(tp, "%Y-%m-%dT%H:%M:%SZ");
}

auto FormatIsoTimeMillis(TimePoint tp) -> std::string {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    if (secs > tp) { secs -= std::chrono::seconds(1); }
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
    std::ostringstream oss;
    oss << FormatUtc(secs, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setw(3) << std::setfill('0') << ms << "Z";
    return oss.str();
}

auto FloorToHour(TimePoint tp) -> TimePoint {
    auto tt = Clock::to_time_t(tp);
    if (Clock::from_time_t(tt) > tp) { tt -= 1; }
    tt -= ((tt % 3600) + 3600) % 3600;
    return Clock::from_time_t(tt);
}

auto ResolveWindow(const std::optional<std::string>& start_time,
                   const std::optional<std::string>& end_time,
                   TimePoint now) -> TimeWindow {
    std::optional<TimePoint> start;
    std::optional<TimePoint> end;
    if (start_time.has_value()) {
        start = ParseIsoTime(*start_time);
        if (!start.has_value()) {
            throw std::invalid_argument("Invalid start_time: " + *start_time);
        }
    }
    if (end_time.has_value()) {
        end = ParseIsoTime(*end_time);
        if (!end.has_value()) {
            throw std::invalid_argument("Invalid end_time: " + *end_time);
        }
    }

    if (start.has_value() && end.has_value()) {
        return TimeWindow(*start, *end);
    }
    if (start.has_value()) {
        return TimeWindow(*start, *start + kDefaultSpan);
    }
    if (end.has_value()) {
        return TimeWindow(*end - kDefaultSpan, *end);
    }
    return TimeWindow(now - kDefaultSpan, now);
}

} // namespace cloudpulse
