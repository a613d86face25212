#include "wiredoc/text_util.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace WireDoc {

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string normalise_name(const std::string& name) {
    // Fold the three typographic quotes first (UTF-8: E2 80 99 / 9C / 9D)
    std::string folded;
    folded.reserve(name.size());
    for (size_t i = 0; i < name.size(); ++i) {
        if (i + 2 < name.size() &&
            static_cast<unsigned char>(name[i]) == 0xE2 &&
            static_cast<unsigned char>(name[i + 1]) == 0x80) {
            unsigned char c = static_cast<unsigned char>(name[i + 2]);
            if (c == 0x99) { folded += '\''; i += 2; continue; }
            if (c == 0x9C || c == 0x9D) { folded += '"'; i += 2; continue; }
        }
        folded += name[i];
    }

    std::string out;
    out.reserve(folded.size());
    bool pending_space = false;
    for (char ch : folded) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += ch;
    }
    return out;
}

bool parse_double(const std::string& text, double& value) {
    std::string t = trim(text);
    if (t.empty()) return false;
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(t.c_str(), &end);
    if (errno != 0 || end != t.c_str() + t.size() || !std::isfinite(v)) {
        return false;
    }
    value = v;
    return true;
}

bool parse_int(const std::string& text, int& value) {
    std::string t = trim(text);
    if (t.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(t.c_str(), &end, 10);
    if (errno != 0 || end != t.c_str() + t.size() || v < -2147483647L || v > 2147483647L) {
        return false;
    }
    value = static_cast<int>(v);
    return true;
}

// ============================================================================
// Page specifications
// ============================================================================

bool parse_page_spec(const std::string& text, PageSpec& spec, std::string& error) {
    spec = PageSpec{};
    std::string trimmed = trim(text);

    if (trimmed.empty() || to_lower(trimmed) == "all") {
        spec.all = true;
        return true;
    }

    std::istringstream ss(trimmed);
    std::string token;
    while (std::getline(ss, token, ',')) {
        token = trim(token);
        if (token.empty()) {
            error = "empty entry in page list '" + trimmed + "'";
            return false;
        }

        size_t dash = token.find('-');
        if (dash != std::string::npos) {
            int first = 0;
            int last = 0;
            if (!parse_int(token.substr(0, dash), first) || !parse_int(token.substr(dash + 1), last)) {
                error = "invalid page range '" + token + "'";
                return false;
            }
            if (first < 1 || last < first) {
                error = "page range '" + token + "' must be ascending and start at 1 or above";
                return false;
            }
            spec.ranges.push_back(PageRange{first, last});
        } else {
            int page = 0;
            if (!parse_int(token, page) || page < 1) {
                error = "invalid page number '" + token + "'";
                return false;
            }
            spec.ranges.push_back(PageRange{page, page});
        }
    }

    return true;
}

// ============================================================================
// CSV
// ============================================================================

bool parse_csv_text(const std::string& text, std::vector<CsvRecord>& records, std::string& error) {
    records.clear();

    size_t pos = 0;
    if (text.size() >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        pos = 3;
    }

    int line = 1;
    CsvRecord current;
    current.line = line;
    std::string field;
    bool in_quotes = false;
    bool field_was_quoted = false;

    auto end_field = [&]() {
        current.fields.push_back(field);
        field.clear();
        field_was_quoted = false;
    };
    auto end_record = [&]() {
        end_field();
        bool blank = current.fields.size() == 1 && trim(current.fields[0]).empty();
        if (!blank) {
            records.push_back(std::move(current));
        }
        current = CsvRecord{};
        current.line = line;
    };

    for (; pos < text.size(); ++pos) {
        char c = text[pos];

        if (in_quotes) {
            if (c == '"') {
                if (pos + 1 < text.size() && text[pos + 1] == '"') {
                    field += '"';
                    ++pos;
                } else {
                    in_quotes = false;
                }
            } else {
                if (c == '\n') ++line;
                if (c != '\r') field += c;
            }
            continue;
        }

        if (c == '"') {
            if (!trim(field).empty() || field_was_quoted) {
                error = "unexpected quote on line " + std::to_string(line);
                return false;
            }
            field.clear();
            in_quotes = true;
            field_was_quoted = true;
        } else if (c == ',') {
            end_field();
        } else if (c == '\n') {
            ++line;
            end_record();
        } else if (c != '\r') {
            field += c;
        }
    }

    if (in_quotes) {
        error = "unterminated quoted field starting on line " + std::to_string(current.line);
        return false;
    }
    if (!field.empty() || !current.fields.empty()) {
        end_record();
    }
    return true;
}

int column_index(const std::vector<std::string>& header, const std::string& name) {
    std::string wanted = to_lower(name);
    for (size_t i = 0; i < header.size(); ++i) {
        if (to_lower(trim(header[i])) == wanted) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

std::string csv_escape(const std::string& value) {
    if (value.find_first_of(",\"\n\r") == std::string::npos) {
        return value;
    }
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out += "\"\"";
        else out += c;
    }
    out += "\"";
    return out;
}

} // namespace WireDoc
