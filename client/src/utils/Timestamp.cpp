#include "utils/Timestamp.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

// Reads exactly `n` digits at `pos`.
static bool readDigits(const std::string& s, std::size_t& pos, int n, int& out) {
    if (pos + n > s.size()) return false;
    int v = 0;
    for (int i = 0; i < n; ++i) {
        char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        v = v * 10 + (c - '0');
    }
    pos += n;
    out = v;
    return true;
}

static bool isLeap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

static int daysInMonth(int y, int m) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && isLeap(y)) ? 29 : kDays[m - 1];
}

// Days since 1970-01-01 for a proleptic Gregorian date.
static std::int64_t daysFromCivil(int y, int m, int d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

std::optional<std::int64_t> parseIsoTimestampMs(const std::string& text) {
    std::size_t pos = 0;
    int year, month, day;

    if (!readDigits(text, pos, 4, year)) return std::nullopt;
    if (pos >= text.size() || text[pos++] != '-') return std::nullopt;
    if (!readDigits(text, pos, 2, month)) return std::nullopt;
    if (pos >= text.size() || text[pos++] != '-') return std::nullopt;
    if (!readDigits(text, pos, 2, day)) return std::nullopt;

    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > daysInMonth(year, month)) return std::nullopt;

    int hour = 0, minute = 0, second = 0, millis = 0;
    int offsetMinutes = 0;

    if (pos < text.size()) {
        if (text[pos] != 'T' && text[pos] != ' ') return std::nullopt;
        ++pos;
        if (!readDigits(text, pos, 2, hour)) return std::nullopt;
        if (pos >= text.size() || text[pos++] != ':') return std::nullopt;
        if (!readDigits(text, pos, 2, minute)) return std::nullopt;
        if (pos < text.size() && text[pos] == ':') {
            ++pos;
            if (!readDigits(text, pos, 2, second)) return std::nullopt;
        }
        if (hour > 23 || minute > 59 || second > 60) return std::nullopt;

        // Fraction: keep milliseconds, ignore finer digits.
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            int digits = 0;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                if (digits < 3) millis = millis * 10 + (text[pos] - '0');
                ++digits;
                ++pos;
            }
            if (digits == 0) return std::nullopt;
            for (int i = digits; i < 3; ++i) millis *= 10;
        }

        if (pos < text.size()) {
            char c = text[pos];
            if (c == 'Z' || c == 'z') {
                ++pos;
            } else if (c == '+' || c == '-') {
                ++pos;
                int oh, om = 0;
                if (!readDigits(text, pos, 2, oh)) return std::nullopt;
                if (pos < text.size() && text[pos] == ':') {
                    ++pos;
                    if (!readDigits(text, pos, 2, om)) return std::nullopt;
                } else if (pos < text.size() && !readDigits(text, pos, 2, om)) {
                    return std::nullopt;
                }
                if (oh > 23 || om > 59) return std::nullopt;
                offsetMinutes = (oh * 60 + om) * (c == '-' ? -1 : 1);
            }
        }
        if (pos != text.size()) return std::nullopt;
    }

    std::int64_t secs = daysFromCivil(year, month, day) * 86400
                      + hour * 3600 + minute * 60 + second
                      - static_cast<std::int64_t>(offsetMinutes) * 60;
    return secs * 1000 + millis;
}

std::string nowIso8601() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}
