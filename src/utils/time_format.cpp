#include "collabscribe/utils/time_format.hpp"
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace collabscribe {
namespace utils {

namespace {

int64_t toRoundedMillis(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        return 0;
    }
    return static_cast<int64_t>(std::llround(seconds * 1000.0));
}

std::string formatClock(double seconds, char millisSeparator) {
    int64_t total_ms = toRoundedMillis(seconds);
    int64_t hours = total_ms / 3600000;
    int64_t minutes = (total_ms / 60000) % 60;
    int64_t secs = (total_ms / 1000) % 60;
    int64_t millis = total_ms % 1000;

    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "%02lld:%02lld:%02lld%c%03lld",
                  static_cast<long long>(hours), static_cast<long long>(minutes),
                  static_cast<long long>(secs), millisSeparator,
                  static_cast<long long>(millis));
    return buffer;
}

} // namespace

std::chrono::system_clock::time_point truncateToMillis(std::chrono::system_clock::time_point tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch());
    if (std::chrono::system_clock::time_point(ms) > tp) {
        ms -= std::chrono::milliseconds(1);
    }
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(ms));
}

std::string formatIso8601(std::chrono::system_clock::time_point tp) {
    auto truncated = truncateToMillis(tp);
    auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(truncated);
    if (seconds > truncated) {
        seconds -= std::chrono::seconds(1);
    }
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(truncated - seconds).count();

    std::time_t time = std::chrono::system_clock::to_time_t(seconds);
    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << 'Z';
    return out.str();
}

bool parseIso8601(const std::string& text, std::chrono::system_clock::time_point& out) {
    std::tm utc{};
    std::istringstream in(text);
    in >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return false;
    }

    int64_t millis = 0;
    if (in.peek() == '.') {
        in.get();
        int digits = 0;
        while (std::isdigit(in.peek())) {
            int digit = in.get() - '0';
            if (digits < 3) {
                millis = millis * 10 + digit;
            }
            ++digits;
        }
        if (digits == 0) {
            return false;
        }
        for (int i = digits; i < 3; ++i) {
            millis *= 10;
        }
    }
    if (in.peek() == 'Z') {
        in.get();
    }
    if (in.peek() != std::char_traits<char>::eof()) {
        return false;
    }

    std::time_t seconds = timegm(&utc);
    out = std::chrono::system_clock::from_time_t(seconds) +
          std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::milliseconds(millis));
    return true;
}

std::string formatMinutesSeconds(double seconds) {
    int64_t whole = (std::isfinite(seconds) && seconds > 0.0) ? static_cast<int64_t>(seconds) : 0;
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%02lld:%02lld",
                  static_cast<long long>(whole / 60), static_cast<long long>(whole % 60));
    return buffer;
}

std::string formatSrtTimestamp(double seconds) {
    return formatClock(seconds, ',');
}

std::string formatVttTimestamp(double seconds) {
    return formatClock(seconds, '.');
}

} // namespace utils
} // namespace collabscribe
