#include "wiredoc/zone_data.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "wiredoc/build_error.h"
#include "wiredoc/text_util.h"

namespace fs = std::filesystem;

namespace WireDoc {

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

ZoneTable parse_zone_table(const std::string& csv_text, const std::string& tab, const std::string& source_name) {
    std::vector<CsvRecord> records;
    std::string error;
    if (!parse_csv_text(csv_text, records, error)) {
        throw BuildError(issue(ErrorCode::INVALID_CONFIG).in_tab(tab).at_path(source_name).because(error));
    }
    if (records.empty()) {
        throw BuildError(issue(ErrorCode::INVALID_CONFIG).in_tab(tab).at_path(source_name)
            .because("zone table is empty (header row required)"));
    }

    ZoneTable table;
    table.tab = tab;
    table.path = source_name;
    table.header = records.front().fields;

    std::string current_zone;
    for (size_t i = 1; i < records.size(); ++i) {
        const auto& fields = records[i].fields;
        if (fields.size() > 1 && !trim(fields[1]).empty()) {
            current_zone = normalise_name(fields[1]);
            table.zones.insert(current_zone);
        }
        if (fields.empty() || trim(fields[0]).empty()) continue;

        table.rows.push_back(ZoneRow{current_zone, fields});
    }
    return table;
}

CsvZoneDataProvider::CsvZoneDataProvider(std::vector<ZoneTable> tables, PageLayout layout)
    : tables_(std::move(tables)), writer_(layout) {
    for (const auto& t : tables_) {
        zones_.insert(t.zones.begin(), t.zones.end());
    }
}

CsvZoneDataProvider CsvZoneDataProvider::load(const std::string& directory, const TabTable& tabs) {
    std::vector<BuildIssue> issues;

    std::error_code ec;
    if (!fs::is_directory(directory, ec)) {
        throw BuildError(issue(ErrorCode::INVALID_CONFIG).at_path(directory)
            .because("CSV data directory does not exist"));
    }

    std::vector<std::string> files;
    for (const auto& entry : fs::directory_iterator(directory, ec)) {
        if (entry.is_regular_file(ec)) files.push_back(entry.path().filename().string());
    }
    std::sort(files.begin(), files.end());

    std::vector<ZoneTable> tables;
    for (const auto& tab : tabs.tabs()) {
        std::vector<std::string> matches;
        for (const auto& name : files) {
            if (ends_with(name, ".csv") && starts_with(normalise_name(name), tab.name)) {
                matches.push_back(name);
            }
        }

        if (matches.empty()) {
            issues.push_back(issue(ErrorCode::INVALID_CONFIG).in_tab(tab.name).at_path(directory)
                .because("no CSV file found for tab"));
            continue;
        }
        if (matches.size() > 1) {
            std::string list;
            for (const auto& m : matches) list += (list.empty() ? "" : ", ") + m;
            issues.push_back(issue(ErrorCode::INVALID_CONFIG).in_tab(tab.name).at_path(directory)
                .because("ambiguous choice of CSV files for tab: " + list));
            continue;
        }

        std::string path = (fs::path(directory) / matches.front()).string();
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            issues.push_back(issue(ErrorCode::INVALID_CONFIG).in_tab(tab.name).at_path(path)
                .because("cannot open zone table"));
            continue;
        }
        std::ostringstream content;
        content << file.rdbuf();

        try {
            tables.push_back(parse_zone_table(content.str(), tab.name, path));
        } catch (const BuildError& e) {
            issues.insert(issues.end(), e.issues().begin(), e.issues().end());
        }
    }

    throw_if_any(issues);
    return CsvZoneDataProvider(std::move(tables));
}

bool CsvZoneDataProvider::hasZone(const std::string& zone) const {
    return zones_.count(zone) > 0;
}

TableDocument CsvZoneDataProvider::document(const RoomSpec& room, const BuildTimestamp& timestamp) const {
    std::set<std::string> wanted;
    for (const auto& z : room.zones) wanted.insert(normalise_name(z));

    TableDocument doc;
    doc.title = room.name;
    doc.footer_left = room.name;
    doc.footer_centre = "Generated on " + timestamp.display();

    for (const auto& t : tables_) {
        TableSection section;
        section.heading = t.tab;
        section.header = t.header;
        for (const auto& r : t.rows) {
            if (wanted.count(r.zone)) section.rows.push_back(r.cells);
        }
        doc.sections.push_back(std::move(section));
    }
    return doc;
}

std::shared_ptr<QPDF> CsvZoneDataProvider::dataPages(const RoomSpec& room, const BuildTimestamp& timestamp) const {
    return writer_.render(document(room, timestamp));
}

} // namespace WireDoc
