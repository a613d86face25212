#ifndef WIREDOC_BUILD_TIMESTAMP_H
#define WIREDOC_BUILD_TIMESTAMP_H

#include <string>

namespace WireDoc {

// Wall-clock time of a build. The only value of a build that depends on the
// environment; a fixed value makes output reproducible.
class BuildTimestamp {
public:
    BuildTimestamp() = default;

    // "YYYY-MM-DD HH:MM" or "YYYY-MM-DD HH:MM:SS", space or 'T' separator.
    // Throws BuildError(InvalidConfig).
    static BuildTimestamp parse(const std::string& text);

    // Local time of the machine
    static BuildTimestamp now();

    // "6 October 2025 at 15:56"
    std::string display() const;

    // "D:20251006155600"
    std::string pdfDate() const;

    // "2025-10-06 15:56:00"
    std::string iso() const;

    int year() const { return year_; }
    int month() const { return month_; }
    int day() const { return day_; }
    int hour() const { return hour_; }
    int minute() const { return minute_; }
    int second() const { return second_; }

private:
    int year_ = 1970;
    int month_ = 1;
    int day_ = 1;
    int hour_ = 0;
    int minute_ = 0;
    int second_ = 0;
};

} // namespace WireDoc

#endif // WIREDOC_BUILD_TIMESTAMP_H
