#include "wiredoc/build_timestamp.h"

#include <chrono>
#include <cstdio>
#include <ctime>

#include "wiredoc/build_error.h"
#include "wiredoc/text_util.h"

namespace WireDoc {

static const char* const MONTH_NAMES[12] = {
    "January", "February", "March", "April", "May", "June",
    "July", "August", "September", "October", "November", "December"
};

static bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

static int days_in_month(int year, int month) {
    static const int DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) return 29;
    return DAYS[month - 1];
}

// Reads exactly `width` digits at pos
static bool read_digits(const std::string& text, size_t pos, size_t width, int& value) {
    if (pos + width > text.size()) return false;
    value = 0;
    for (size_t i = pos; i < pos + width; ++i) {
        char c = text[i];
        if (c < '0' || c > '9') return false;
        value = value * 10 + (c - '0');
    }
    return true;
}

BuildTimestamp BuildTimestamp::parse(const std::string& text) {
    std::string s = trim(text);
    BuildTimestamp ts;

    // 0123456789012345678
    // YYYY-MM-DD HH:MM:SS
    bool ok = (s.size() == 16 || s.size() == 19) &&
              read_digits(s, 0, 4, ts.year_) && s[4] == '-' &&
              read_digits(s, 5, 2, ts.month_) && s[7] == '-' &&
              read_digits(s, 8, 2, ts.day_) && (s[10] == ' ' || s[10] == 'T') &&
              read_digits(s, 11, 2, ts.hour_) && s[13] == ':' &&
              read_digits(s, 14, 2, ts.minute_);
    if (ok && s.size() == 19) {
        ok = s[16] == ':' && read_digits(s, 17, 2, ts.second_);
    }
    if (ok) {
        ok = ts.month_ >= 1 && ts.month_ <= 12 &&
             ts.day_ >= 1 && ts.day_ <= days_in_month(ts.year_, ts.month_) &&
             ts.hour_ <= 23 && ts.minute_ <= 59 && ts.second_ <= 59;
    }

    if (!ok) {
        throw BuildError(issue(ErrorCode::INVALID_CONFIG)
            .because("invalid timestamp '" + text + "' (expected YYYY-MM-DD HH:MM[:SS])"));
    }
    return ts;
}

BuildTimestamp BuildTimestamp::now() {
    auto time_t_now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

    std::tm tm_buf{};
#if defined(_WIN32)
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    BuildTimestamp ts;
    ts.year_ = tm_buf.tm_year + 1900;
    ts.month_ = tm_buf.tm_mon + 1;
    ts.day_ = tm_buf.tm_mday;
    ts.hour_ = tm_buf.tm_hour;
    ts.minute_ = tm_buf.tm_min;
    ts.second_ = tm_buf.tm_sec > 59 ? 59 : tm_buf.tm_sec;
    return ts;
}

std::string BuildTimestamp::display() const {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%d %s %04d at %02d:%02d",
                  day_, MONTH_NAMES[month_ - 1], year_, hour_, minute_);
    return std::string(buf);
}

std::string BuildTimestamp::pdfDate() const {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "D:%04d%02d%02d%02d%02d%02d",
                  year_, month_, day_, hour_, minute_, second_);
    return std::string(buf);
}

std::string BuildTimestamp::iso() const {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d",
                  year_, month_, day_, hour_, minute_, second_);
    return std::string(buf);
}

} // namespace WireDoc
