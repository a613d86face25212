#include "wiredoc/config.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

#include <yaml-cpp/yaml.h>

#include "wiredoc/build_error.h"

namespace fs = std::filesystem;

namespace WireDoc {

// ============================================================================
// Table lookups
// ============================================================================

const Track* TabEntry::findTrack(const std::string& track_name) const {
    for (const auto& t : tracks) {
        if (t.name == track_name) return &t;
    }
    return nullptr;
}

const CropRegion* CropTable::find(const std::string& room, const std::string& tab,
                                  const std::string& track) const {
    const CropRegion* tab_wide = nullptr;
    for (const auto& r : rows_) {
        if (r.room != room || r.tab != tab) continue;
        if (r.track == track) return &r;
        if (r.applies_to_all_tracks() && !tab_wide) tab_wide = &r;
    }
    return tab_wide;
}

bool CropTable::hasPair(const std::string& room, const std::string& tab) const {
    for (const auto& r : rows_) {
        if (r.room == room && r.tab == tab) return true;
    }
    return false;
}

const TabEntry* TabTable::find(const std::string& name) const {
    for (const auto& t : tabs_) {
        if (t.name == name) return &t;
    }
    return nullptr;
}

std::string PackConfig::resolvePath(const std::string& path) const {
    if (path.empty()) return path;
    fs::path p(path);
    if (p.is_absolute() || base_directory.empty()) return p.lexically_normal().string();
    return (fs::path(base_directory) / p).lexically_normal().string();
}

// ============================================================================
// YAML pack config
// ============================================================================

namespace {

std::string read_text_file(const std::string& path, ErrorCode code) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        throw BuildError(issue(code).at_path(path).because("file not found or unreadable"));
    }
    std::ostringstream buffer;
    buffer << f.rdbuf();
    return buffer.str();
}

// Reads a required or optional scalar string; records an issue on type errors
bool read_scalar(const YAML::Node& root, const char* key, bool required, std::string& out,
                 const std::string& source, std::vector<BuildIssue>& issues) {
    YAML::Node node = root[key];
    if (!node.IsDefined() || node.IsNull()) {
        if (required) {
            issues.push_back(issue(ErrorCode::INVALID_CONFIG).at_path(source)
                .because(std::string("required configuration field missing: ") + key));
        }
        return false;
    }
    if (!node.IsScalar()) {
        issues.push_back(issue(ErrorCode::INVALID_CONFIG).at_path(source).at_row(node.Mark().line + 1)
            .because(std::string("field '") + key + "' must be a string"));
        return false;
    }
    out = node.as<std::string>();
    return true;
}

} // namespace

PackConfig parse_pack_config(const std::string& yaml_text, const std::string& base_directory,
                             const std::string& source_name) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw BuildError(issue(ErrorCode::INVALID_CONFIG).at_path(source_name)
            .at_row(e.mark.line >= 0 ? e.mark.line + 1 : 0)
            .because("YAML parse error: " + e.msg));
    }

    if (!root.IsMap()) {
        throw BuildError(issue(ErrorCode::INVALID_CONFIG).at_path(source_name)
            .because("top level must be a mapping"));
    }

    PackConfig config;
    config.base_directory = base_directory;
    config.title = fs::path(source_name).stem().string();

    std::vector<BuildIssue> issues;

    read_scalar(root, "title", false, config.title, source_name, issues);
    read_scalar(root, "crops_file", true, config.crops_file, source_name, issues);
    read_scalar(root, "tabs_file", true, config.tabs_file, source_name, issues);
    read_scalar(root, "csv_data_directory", true, config.csv_data_directory, source_name, issues);
    read_scalar(root, "plan_pdfs_directory", true, config.plan_pdfs_directory, source_name, issues);
    read_scalar(root, "pdf_filename_pattern", false, config.pdf_filename_pattern, source_name, issues);

    if (config.pdf_filename_pattern.find("{tab}") == std::string::npos) {
        issues.push_back(issue(ErrorCode::INVALID_CONFIG).at_path(source_name)
            .because("pdf_filename_pattern must contain '{tab}': " + config.pdf_filename_pattern));
    }

    YAML::Node workers = root["workers"];
    if (workers.IsDefined() && !workers.IsNull()) {
        int n = -1;
        try {
            n = workers.as<int>();
        } catch (const YAML::BadConversion&) {
            n = -1;
        }
        if (n < 0) {
            issues.push_back(issue(ErrorCode::INVALID_CONFIG).at_path(source_name)
                .at_row(workers.Mark().line + 1)
                .because("workers must be a non-negative integer"));
        } else {
            config.workers = static_cast<unsigned>(n);
        }
    }

    YAML::Node output = root["output"];
    if (output.IsDefined() && !output.IsNull()) {
        if (output.IsMap()) {
            read_scalar(output, "working_directory", false, config.working_directory, source_name, issues);
        } else {
            issues.push_back(issue(ErrorCode::INVALID_CONFIG).at_path(source_name)
                .at_row(output.Mark().line + 1).because("'output' must be a mapping"));
        }
    }

    // Rooms: ordered, each with a unique name and a list of zones
    YAML::Node rooms = root["rooms"];
    if (!rooms.IsDefined() || rooms.IsNull()) {
        issues.push_back(issue(ErrorCode::INVALID_CONFIG).at_path(source_name)
            .because("required configuration field missing: rooms"));
    } else if (!rooms.IsSequence() || rooms.size() == 0) {
        issues.push_back(issue(ErrorCode::INVALID_CONFIG).at_path(source_name)
            .at_row(rooms.Mark().line + 1).because("'rooms' must be a non-empty list"));
    } else {
        std::set<std::string> seen;
        for (const auto& room_node : rooms) {
            int line = room_node.Mark().line + 1;
            if (!room_node.IsMap()) {
                issues.push_back(issue(ErrorCode::INVALID_CONFIG).at_path(source_name).at_row(line)
                    .because("room entry must be a mapping with 'name' and 'zones'"));
                continue;
            }

            RoomSpec room;
            YAML::Node name = room_node["name"];
            if (!name.IsDefined() || !name.IsScalar() || normalise_name(name.as<std::string>()).empty()) {
                issues.push_back(issue(ErrorCode::INVALID_CONFIG).at_path(source_name).at_row(line)
                    .because("room missing 'name' field"));
                continue;
            }
            room.name = normalise_name(name.as<std::string>());

            YAML::Node zones = room_node["zones"];
            if (!zones.IsDefined() || !zones.IsSequence()) {
                issues.push_back(issue(ErrorCode::INVALID_CONFIG).in_room(room.name).at_path(source_name)
                    .at_row(line).because("room missing 'zones' list"));
                continue;
            }
            for (const auto& z : zones) {
                if (!z.IsScalar() || normalise_name(z.as<std::string>()).empty()) {
                    issues.push_back(issue(ErrorCode::INVALID_CONFIG).in_room(room.name).at_path(source_name)
                        .at_row(z.Mark().line + 1).because("zone names must be non-empty strings"));
                    continue;
                }
                room.zones.push_back(normalise_name(z.as<std::string>()));
            }

            if (!seen.insert(room.name).second) {
                issues.push_back(issue(ErrorCode::DUPLICATE_ENTRY).in_room(room.name).at_path(source_name)
                    .at_row(line).because("room declared more than once"));
                continue;
            }
            config.rooms.push_back(std::move(room));
        }
    }

    throw_if_any(std::move(issues));
    return config;
}

PackConfig load_pack_config(const std::string& path) {
    std::string text = read_text_file(path, ErrorCode::INVALID_CONFIG);
    fs::path base = fs::absolute(fs::path(path)).parent_path();
    return parse_pack_config(text, base.string(), path);
}

// ============================================================================
// Tab table
// ============================================================================

namespace {

std::vector<CsvRecord> parse_table_text(const std::string& csv_text, const std::string& source_name) {
    std::vector<CsvRecord> records;
    std::string error;
    if (!parse_csv_text(csv_text, records, error)) {
        throw BuildError(issue(ErrorCode::INVALID_ROW).at_path(source_name).because(error));
    }
    if (records.empty()) {
        throw BuildError(issue(ErrorCode::INVALID_ROW).at_path(source_name).because("file is empty"));
    }
    return records;
}

std::string field_at(const CsvRecord& record, int col) {
    if (col < 0 || col >= static_cast<int>(record.fields.size())) return "";
    return record.fields[col];
}

} // namespace

TabTable parse_tab_table(const std::string& csv_text, const std::string& source_name) {
    std::vector<CsvRecord> records = parse_table_text(csv_text, source_name);

    const auto& header = records.front().fields;
    int col_tab = column_index(header, "Tab");
    int col_track = column_index(header, "Track");
    int col_pages = column_index(header, "Pages");

    if (col_tab < 0) {
        throw BuildError(issue(ErrorCode::INVALID_ROW).at_path(source_name).at_row(records.front().line)
            .because("missing required column 'Tab' (expected: Tab,Track,Pages)"));
    }

    std::vector<BuildIssue> issues;
    std::vector<TabEntry> tabs;

    for (size_t i = 1; i < records.size(); ++i) {
        const CsvRecord& rec = records[i];

        std::string tab_name = normalise_name(field_at(rec, col_tab));
        if (tab_name.empty()) {
            issues.push_back(issue(ErrorCode::INVALID_ROW).at_path(source_name).at_row(rec.line)
                .because("empty Tab"));
            continue;
        }

        Track track;
        track.name = normalise_name(field_at(rec, col_track));
        if (track.name.empty()) track.name = "plan";

        std::string error;
        if (!parse_page_spec(field_at(rec, col_pages), track.pages, error)) {
            issues.push_back(issue(ErrorCode::INVALID_ROW).in_tab(tab_name).in_track(track.name)
                .at_path(source_name).at_row(rec.line).because("Pages: " + error));
            continue;
        }

        auto it = std::find_if(tabs.begin(), tabs.end(),
                               [&](const TabEntry& t) { return t.name == tab_name; });
        if (it == tabs.end()) {
            TabEntry entry;
            entry.name = tab_name;
            tabs.push_back(entry);
            it = tabs.end() - 1;
        }
        if (it->findTrack(track.name)) {
            issues.push_back(issue(ErrorCode::DUPLICATE_ENTRY).in_tab(tab_name).in_track(track.name)
                .at_path(source_name).at_row(rec.line).because("track declared more than once"));
            continue;
        }
        it->tracks.push_back(std::move(track));
    }

    if (tabs.empty() && issues.empty()) {
        issues.push_back(issue(ErrorCode::INVALID_ROW).at_path(source_name).because("no tabs declared"));
    }

    throw_if_any(std::move(issues));
    return TabTable(std::move(tabs));
}

TabTable load_tab_table(const std::string& path) {
    return parse_tab_table(read_text_file(path, ErrorCode::INVALID_CONFIG), path);
}

// ============================================================================
// Crop table
// ============================================================================

CropTable parse_crop_table(const std::string& csv_text, const std::string& source_name) {
    std::vector<CsvRecord> records = parse_table_text(csv_text, source_name);

    const auto& header = records.front().fields;
    int col_room = column_index(header, "Room");
    int col_tab = column_index(header, "Tab");
    int col_track = column_index(header, "Track");
    const char* coord_names[4] = {"X0", "Y0", "X1", "Y1"};
    int col_coord[4];
    for (int c = 0; c < 4; ++c) col_coord[c] = column_index(header, coord_names[c]);

    std::vector<std::string> missing;
    if (col_room < 0) missing.push_back("Room");
    if (col_tab < 0) missing.push_back("Tab");
    for (int c = 0; c < 4; ++c) {
        if (col_coord[c] < 0) missing.push_back(coord_names[c]);
    }
    if (!missing.empty()) {
        std::string list;
        for (const auto& m : missing) list += (list.empty() ? "" : ", ") + m;
        throw BuildError(issue(ErrorCode::INVALID_ROW).at_path(source_name).at_row(records.front().line)
            .because("missing required column(s) " + list + " (expected: Room,Tab,Track,X0,Y0,X1,Y1)"));
    }

    std::vector<BuildIssue> issues;
    std::vector<CropRegion> rows;

    for (size_t i = 1; i < records.size(); ++i) {
        const CsvRecord& rec = records[i];

        CropRegion region;
        region.row = rec.line;
        region.room = normalise_name(field_at(rec, col_room));
        region.tab = normalise_name(field_at(rec, col_tab));
        region.track = normalise_name(field_at(rec, col_track));

        bool ok = true;
        if (region.room.empty() || region.tab.empty()) {
            issues.push_back(issue(ErrorCode::INVALID_ROW).in_room(region.room).in_tab(region.tab)
                .at_path(source_name).at_row(rec.line).because("Room and Tab must not be empty"));
            ok = false;
        }

        double coords[4] = {0.0, 0.0, 0.0, 0.0};
        for (int c = 0; c < 4; ++c) {
            std::string raw = field_at(rec, col_coord[c]);
            if (!parse_double(raw, coords[c])) {
                issues.push_back(issue(ErrorCode::INVALID_ROW).in_room(region.room).in_tab(region.tab)
                    .in_track(region.track).at_path(source_name).at_row(rec.line)
                    .because(std::string(coord_names[c]) + " is not a number: '" + raw + "'"));
                ok = false;
            }
        }
        if (!ok) continue;

        region.x0 = coords[0];
        region.y0 = coords[1];
        region.x1 = coords[2];
        region.y1 = coords[3];
        rows.push_back(std::move(region));
    }

    throw_if_any(std::move(issues));
    return CropTable(std::move(rows));
}

CropTable load_crop_table(const std::string& path) {
    return parse_crop_table(read_text_file(path, ErrorCode::INVALID_CONFIG), path);
}

} // namespace WireDoc
