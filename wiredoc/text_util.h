#ifndef WIREDOC_TEXT_UTIL_H
#define WIREDOC_TEXT_UTIL_H

#include <string>
#include <vector>

namespace WireDoc {

// Trim whitespace from both ends
std::string trim(const std::string& str);

std::string to_lower(std::string str);

// Collapse whitespace runs, trim, and fold typographic quotes (U+2019,
// U+201C, U+201D) to ASCII. Room, tab, track and zone names are compared in
// this form.
std::string normalise_name(const std::string& name);

// Strict numeric parsing: the whole string must be consumed
bool parse_double(const std::string& text, double& value);
bool parse_int(const std::string& text, int& value);

// ============================================================================
// Page specifications: "all", "5", "1-3", "1-3,7,9-10" (1-based, in order)
// ============================================================================

struct PageRange {
    int first = 1;
    int last = 1;                       // inclusive; equal to first for a single page
};

// Ranges are kept as written and never expanded here
struct PageSpec {
    bool all = false;
    std::vector<PageRange> ranges;
};

bool parse_page_spec(const std::string& text, PageSpec& spec, std::string& error);

// ============================================================================
// CSV
// ============================================================================

struct CsvRecord {
    int line = 0;                       // 1-based line where the record starts
    std::vector<std::string> fields;
};

// Reads RFC 4180 style CSV: quoted fields may contain commas, doubled quotes
// and line breaks. Blank lines are skipped. A leading UTF-8 BOM is ignored.
bool parse_csv_text(const std::string& text, std::vector<CsvRecord>& records, std::string& error);

// Case-insensitive header lookup, -1 when absent
int column_index(const std::vector<std::string>& header, const std::string& name);

// Escape a CSV field (quotes if contains comma, quote, or newline)
std::string csv_escape(const std::string& value);

} // namespace WireDoc

#endif // WIREDOC_TEXT_UTIL_H
