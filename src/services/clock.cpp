#include "syncgate/clock.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>

namespace syncgate {

int64_t SystemClock::now() const {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string format_utc(int64_t epoch_seconds) {
    std::time_t t = static_cast<std::time_t>(epoch_seconds);
    std::tm tm_utc{};
    gmtime_r(&t, &tm_utc);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm_utc);
    return buffer;
}

std::optional<int64_t> parse_utc(const std::string& text) {
    std::tm tm_utc{};
    int consumed = 0;
    int fields = std::sscanf(text.c_str(), "%4d-%2d-%2d %2d:%2d:%2d%n",
                             &tm_utc.tm_year, &tm_utc.tm_mon, &tm_utc.tm_mday,
                             &tm_utc.tm_hour, &tm_utc.tm_min, &tm_utc.tm_sec, &consumed);
    if (fields != 6 || static_cast<size_t>(consumed) != text.size()) {
        return std::nullopt;
    }
    tm_utc.tm_year -= 1900;
    tm_utc.tm_mon -= 1;
    return static_cast<int64_t>(timegm(&tm_utc));
}

} // namespace syncgate
