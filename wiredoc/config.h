// config.h - Strongly typed build configuration
//
// A build is described by:
//   - the pack config (YAML): file locations, room order and zones
//   - the tab table (CSV):    tab -> ordered tracks (page lists) in the tab's plan PDF
//   - the crop table (CSV):   (room, tab, track) -> rectangle on the source page
//
// Everything is validated into these structures at load time; loaders collect
// every problem they find and throw a single BuildError.

#ifndef WIREDOC_CONFIG_H
#define WIREDOC_CONFIG_H

#include <string>
#include <vector>

#include "wiredoc/text_util.h"

namespace WireDoc {

// ============================================================================
// Data Structures
// ============================================================================

// Rectangle on a source page, in points from the top-left corner of the page
// as displayed, y growing downwards
struct CropRegion {
    std::string room;
    std::string tab;
    std::string track;          // empty = every track of the tab
    double x0 = 0.0;
    double y0 = 0.0;
    double x1 = 0.0;
    double y1 = 0.0;
    int row = 0;                // 1-based line in the crops file, 0 if built in code

    double width() const { return x1 - x0; }
    double height() const { return y1 - y0; }
    bool applies_to_all_tracks() const { return track.empty(); }
};

struct Track {
    std::string name;
    PageSpec pages;             // 1-based page numbers, or all pages
};

struct TabEntry {
    std::string name;
    std::vector<Track> tracks;  // declared order
    std::string source_path;    // filled in by source resolution

    const Track* findTrack(const std::string& track_name) const;
};

struct RoomSpec {
    std::string name;
    std::vector<std::string> zones;
};

class CropTable {
public:
    CropTable() = default;
    explicit CropTable(std::vector<CropRegion> rows) : rows_(std::move(rows)) {}

    const std::vector<CropRegion>& rows() const { return rows_; }

    // Exact (room, tab, track) match first, then the room's tab-wide row
    const CropRegion* find(const std::string& room, const std::string& tab,
                           const std::string& track) const;

    bool hasPair(const std::string& room, const std::string& tab) const;

private:
    std::vector<CropRegion> rows_;
};

class TabTable {
public:
    TabTable() = default;
    explicit TabTable(std::vector<TabEntry> tabs) : tabs_(std::move(tabs)) {}

    const std::vector<TabEntry>& tabs() const { return tabs_; }
    std::vector<TabEntry>& tabs() { return tabs_; }

    const TabEntry* find(const std::string& name) const;

private:
    std::vector<TabEntry> tabs_;
};

struct PackConfig {
    std::string title;
    std::string base_directory;         // relative paths resolve against this
    std::string crops_file;
    std::string tabs_file;
    std::string csv_data_directory;
    std::string plan_pdfs_directory;
    std::string pdf_filename_pattern = "*{tab}*.pdf";
    std::string working_directory;      // optional, for retained intermediates
    unsigned workers = 0;               // 0 = hardware concurrency
    std::vector<RoomSpec> rooms;

    // Absolute or base-relative path resolution
    std::string resolvePath(const std::string& path) const;
};

// ============================================================================
// Loaders (throw BuildError)
// ============================================================================

// Loads the YAML pack config; base_directory is set to the file's directory
PackConfig load_pack_config(const std::string& path);

// Parses YAML text; base_directory is taken as given
PackConfig parse_pack_config(const std::string& yaml_text, const std::string& base_directory,
                             const std::string& source_name = "config");

// Header: Tab, Track (optional), Pages (optional)
TabTable load_tab_table(const std::string& path);
TabTable parse_tab_table(const std::string& csv_text, const std::string& source_name);

// Header: Room, Tab, Track (optional), X0, Y0, X1, Y1
CropTable load_crop_table(const std::string& path);
CropTable parse_crop_table(const std::string& csv_text, const std::string& source_name);

} // namespace WireDoc

#endif // WIREDOC_CONFIG_H
