#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace syncgate {

// Wall-clock source in whole seconds since the Unix epoch. Breaker windows
// and TTLs are computed against this so tests can move time explicitly.
class Clock {
public:
    virtual ~Clock() = default;
    virtual int64_t now() const = 0;
};

class SystemClock : public Clock {
public:
    int64_t now() const override;
};

// "YYYY-MM-DD HH:MM:SS" in UTC, the format the jobs table accepts for timestamps
std::string format_utc(int64_t epoch_seconds);

// Inverse of format_utc; nullopt unless the text is exactly that shape
std::optional<int64_t> parse_utc(const std::string& text);

} // namespace syncgate
