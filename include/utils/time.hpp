#pragma once

#include <chrono>
#include <string>

namespace PhishLedger {

/**
 * @brief High-resolution timer and high-level timing utilities.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    Timer() : start_(Clock::now()) {}

    /**
     * @brief Reset the timer to the current time.
     */
    void reset() {
        start_ = Clock::now();
    }

    /**
     * @brief Get elapsed milliseconds since last reset or construction.
     */
    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

private:
    TimePoint start_;
};

/**
 * @brief Inclusive [start, end] window over analysis dates, as UTC ISO-8601 strings
 */
struct DateRange {
    std::string start;
    std::string end;

    /**
     * @brief Build a range from user input
     *
     * Accepts "YYYY-MM-DD" or "YYYY-MM-DD[T| ]HH:MM[:SS[.ffffff]]" followed
     * by nothing, "Z", or a UTC offset (+HH, +HHMM, +HH:MM). Offsets are
     * converted to UTC. A date-only start means 00:00:00, a date-only end
     * means 23:59:59.
     * @throws ValidationError on malformed bounds or start after end
     */
    static DateRange parse(const std::string& start, const std::string& end);
};

/**
 * @brief Normalize one date bound to UTC "YYYY-MM-DDTHH:MM:SS[.ffffff]Z"
 * @throws ValidationError on malformed input or a result outside years 1-9999
 */
std::string parse_date_bound(const std::string& value, bool end_of_day);

} // namespace PhishLedger
