#include "airline/types.hpp"

#include <cctype>
#include <cstdio>

namespace airline {

namespace {

// Parses exactly `width` decimal digits starting at text[pos]
bool parse_fixed_digits(const std::string& text, std::size_t pos, std::size_t width, int& out) {
    if (pos + width > text.size()) return false;
    int value = 0;
    for (std::size_t i = pos; i < pos + width; ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(c)) return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

} // namespace

int days_in_month(int year, int month) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2 && is_leap_year(year)) return 29;
    return kDays[month - 1];
}

bool Date::try_parse(const std::string& text, Date& out) {
    // Expected format: YYYY-MM-DD
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return false;

    Date d;
    if (!parse_fixed_digits(text, 0, 4, d.year)) return false;
    if (!parse_fixed_digits(text, 5, 2, d.month)) return false;
    if (!parse_fixed_digits(text, 8, 2, d.day)) return false;

    if (d.year < 1) return false;
    const int dim = days_in_month(d.year, d.month);
    if (dim == 0 || d.day < 1 || d.day > dim) return false;

    out = d;
    return true;
}

std::string Date::to_string() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

Date Date::next_day() const {
    Date d = *this;
    if (++d.day > days_in_month(d.year, d.month)) {
        d.day = 1;
        if (++d.month > 12) {
            d.month = 1;
            ++d.year;
        }
    }
    return d;
}

bool TimeOfDay::try_parse(const std::string& text, TimeOfDay& out) {
    // Accepts HH:MM and HH:MM:SS
    if (text.size() != 5 && text.size() != 8) return false;
    if (text[2] != ':') return false;

    TimeOfDay t;
    if (!parse_fixed_digits(text, 0, 2, t.hour)) return false;
    if (!parse_fixed_digits(text, 3, 2, t.minute)) return false;
    if (text.size() == 8) {
        if (text[5] != ':') return false;
        if (!parse_fixed_digits(text, 6, 2, t.second)) return false;
    }

    if (t.hour > 23 || t.minute > 59 || t.second > 59) return false;
    out = t;
    return true;
}

std::string TimeOfDay::to_string() const {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", hour, minute, second);
    return buf;
}

const char* to_string(SeatStatus status) {
    switch (status) {
        case SeatStatus::Available: return "AVAILABLE";
        case SeatStatus::Booked: return "BOOKED";
        case SeatStatus::Unavailable: return "UNAVAILABLE";
    }
    return "UNAVAILABLE";
}

bool try_parse_seat_status(const std::string& text, SeatStatus& out) {
    if (text == "AVAILABLE") {
        out = SeatStatus::Available;
    } else if (text == "BOOKED") {
        out = SeatStatus::Booked;
    } else if (text == "UNAVAILABLE") {
        out = SeatStatus::Unavailable;
    } else {
        return false;
    }
    return true;
}

} // namespace airline
