#include "hcert/types.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>

namespace hcert {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2 ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool is_leap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int days_in_month(int y, int m) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap(y)) return 29;
    return days[m - 1];
}

bool read_digits(const std::string& s, size_t pos, size_t count, int& out) {
    if (pos + count > s.size()) return false;
    int v = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    return true;
}

bool to_tm(const Timestamp& ts, std::tm& out) {
    std::time_t t = static_cast<std::time_t>(ts.epoch_seconds);
#ifdef _WIN32
    return gmtime_s(&out, &t) == 0;
#else
    return gmtime_r(&t, &out) != nullptr;
#endif
}

std::string format_with(const Timestamp& ts, const char* fmt) {
    std::tm tm_buf{};
    if (!to_tm(ts, tm_buf)) {
        return std::to_string(ts.epoch_seconds);
    }
    char buffer[64];
    size_t n = std::strftime(buffer, sizeof(buffer), fmt, &tm_buf);
    return std::string(buffer, n);
}

} // namespace

std::string format_rfc3339(const Timestamp& ts) {
    return format_with(ts, "%Y-%m-%dT%H:%M:%SZ");
}

std::string format_rfc2822(const Timestamp& ts) {
    // %a and %b are locale dependent; the C locale gives English names
    return format_with(ts, "%a, %d %b %Y %H:%M:%S +0000");
}

std::optional<Timestamp> parse_rfc3339(const std::string& text) {
    // YYYY-MM-DDTHH:MM:SS[.frac](Z|+HH:MM|-HH:MM)
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!read_digits(text, 0, 4, year) || text.size() < 20) return std::nullopt;
    if (text[4] != '-' || !read_digits(text, 5, 2, month)) return std::nullopt;
    if (text[7] != '-' || !read_digits(text, 8, 2, day)) return std::nullopt;
    if ((text[10] != 'T' && text[10] != 't') || !read_digits(text, 11, 2, hour)) return std::nullopt;
    if (text[13] != ':' || !read_digits(text, 14, 2, minute)) return std::nullopt;
    if (text[16] != ':' || !read_digits(text, 17, 2, second)) return std::nullopt;

    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > days_in_month(year, month)) return std::nullopt;
    if (hour > 23 || minute > 59 || second > 60) return std::nullopt;

    size_t pos = 19;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        size_t start = pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) ++pos;
        if (pos == start) return std::nullopt;
    }
    if (pos >= text.size()) return std::nullopt;

    int64_t offset_seconds = 0;
    char zone = text[pos];
    if (zone == 'Z' || zone == 'z') {
        ++pos;
    } else if (zone == '+' || zone == '-') {
        int oh = 0, om = 0;
        if (!read_digits(text, pos + 1, 2, oh) || pos + 3 >= text.size() || text[pos + 3] != ':' ||
            !read_digits(text, pos + 4, 2, om)) {
            return std::nullopt;
        }
        if (oh > 23 || om > 59) return std::nullopt;
        offset_seconds = (oh * 3600 + om * 60) * (zone == '+' ? 1 : -1);
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != text.size()) return std::nullopt;

    int64_t days = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second - offset_seconds;
    return Timestamp{secs};
}

} // namespace hcert
