/**
 * @file time.cpp
 * @brief Date bound parsing and UTC normalization
 */

#include <utils/time.hpp>
#include <utils/text.hpp>
#include <errors.hpp>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace PhishLedger {

namespace {

bool read_number(const std::string& s, size_t pos, size_t len, int min, int max, int& out) {
    if (pos + len > s.size()) return false;
    int value = 0;
    for (size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        value = value * 10 + (s[i] - '0');
    }
    if (value < min || value > max) return false;
    out = value;
    return true;
}

int days_in_month(int year, int month) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return (month == 2 && leap) ? 29 : days[month - 1];
}

// Move a calendar date by one day in either direction
void step_day(int& year, int& month, int& day, int delta) {
    day += delta;
    if (day < 1) {
        if (--month < 1) {
            month = 12;
            --year;
        }
        day = days_in_month(year, month);
    } else if (day > days_in_month(year, month)) {
        day = 1;
        if (++month > 12) {
            month = 1;
            ++year;
        }
    }
}

// "YYYY-MM-DDTHH:MM:SS" plus the fraction padded to six digits
std::string sortable_key(const std::string& bound) {
    std::string fraction;
    if (bound.size() > 19 && bound[19] == '.') {
        size_t end = bound.find('Z', 20);
        fraction = bound.substr(20, end == std::string::npos ? std::string::npos : end - 20);
    }
    fraction.resize(6, '0');
    return bound.substr(0, 19) + "." + fraction;
}

} // namespace

std::string parse_date_bound(const std::string& raw, bool end_of_day) {
    const std::string value = trim(raw);
    const std::string error = "Invalid date (expected YYYY-MM-DD[THH:MM[:SS[.ffffff]]][Z|+HH:MM]): '" + raw + "'";

    int year = 0, month = 0, day = 0;
    if (!read_number(value, 0, 4, 1, 9999, year) || value.size() < 10 || value[4] != '-' ||
        !read_number(value, 5, 2, 1, 12, month) || value[7] != '-' ||
        !read_number(value, 8, 2, 1, 31, day) || day > days_in_month(year, month)) {
        throw ValidationError(error);
    }

    if (value.size() == 10) {
        return value + (end_of_day ? "T23:59:59Z" : "T00:00:00Z");
    }

    if (value[10] != 'T' && value[10] != ' ') throw ValidationError(error);

    int hour = 0, minute = 0, second = 0;
    if (!read_number(value, 11, 2, 0, 23, hour) || value.size() < 16 || value[13] != ':' ||
        !read_number(value, 14, 2, 0, 59, minute)) {
        throw ValidationError(error);
    }

    size_t pos = 16;
    std::string seconds = ":00";
    if (pos < value.size() && value[pos] == ':') {
        if (!read_number(value, pos + 1, 2, 0, 59, second)) throw ValidationError(error);
        seconds = value.substr(pos, 3);
        pos += 3;

        if (pos < value.size() && value[pos] == '.') {
            size_t frac_end = pos + 1;
            while (frac_end < value.size() && std::isdigit(static_cast<unsigned char>(value[frac_end]))) {
                ++frac_end;
            }
            if (frac_end == pos + 1 || frac_end - pos - 1 > 6) throw ValidationError(error);
            seconds += value.substr(pos, frac_end - pos);
            pos = frac_end;
        }
    }

    // Optional designator: Z, or an offset as +HH, +HHMM or +HH:MM
    int offset_minutes = 0;
    if (pos < value.size()) {
        char sign = value[pos];
        if (sign == 'Z') {
            if (pos + 1 != value.size()) throw ValidationError(error);
        } else if (sign == '+' || sign == '-') {
            int offset_hours = 0, offset_mins = 0;
            size_t rest = value.size() - pos - 1;
            if (!read_number(value, pos + 1, 2, 0, 23, offset_hours)) throw ValidationError(error);
            if (rest == 4) {
                if (!read_number(value, pos + 3, 2, 0, 59, offset_mins)) throw ValidationError(error);
            } else if (rest == 5) {
                if (value[pos + 3] != ':' || !read_number(value, pos + 4, 2, 0, 59, offset_mins)) {
                    throw ValidationError(error);
                }
            } else if (rest != 2) {
                throw ValidationError(error);
            }
            offset_minutes = (sign == '+' ? 1 : -1) * (offset_hours * 60 + offset_mins);
        } else {
            throw ValidationError(error);
        }
    }

    int minutes = hour * 60 + minute - offset_minutes;
    if (minutes < 0) {
        minutes += 24 * 60;
        step_day(year, month, day, -1);
    } else if (minutes >= 24 * 60) {
        minutes -= 24 * 60;
        step_day(year, month, day, 1);
    }
    if (year < 1 || year > 9999) throw ValidationError(error);

    std::ostringstream out;
    out << std::setfill('0')
        << std::setw(4) << year << '-' << std::setw(2) << month << '-' << std::setw(2) << day
        << 'T' << std::setw(2) << minutes / 60 << ':' << std::setw(2) << minutes % 60
        << seconds << 'Z';
    return out.str();
}

DateRange DateRange::parse(const std::string& start, const std::string& end) {
    DateRange range;
    range.start = parse_date_bound(start, false);
    range.end = parse_date_bound(end, true);

    if (sortable_key(range.start) > sortable_key(range.end)) {
        throw ValidationError("Date range start " + range.start + " is after end " + range.end);
    }
    return range;
}

} // namespace PhishLedger
