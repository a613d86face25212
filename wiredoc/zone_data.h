// zone_data.h - Per-room data pages built from the zone tables
//
// Each tab has a CSV export of its wiring schedule. Column 0 names the item,
// column 1 the zone it belongs to (blank = same zone as the row above). A
// room's data pages list, tab by tab, the rows whose zone is one of the room's
// zones.

#ifndef WIREDOC_ZONE_DATA_H
#define WIREDOC_ZONE_DATA_H

#include <memory>
#include <set>
#include <string>
#include <vector>

#include <qpdf/QPDF.hh>

#include "wiredoc/build_timestamp.h"
#include "wiredoc/config.h"
#include "wiredoc/table_pages.h"

namespace WireDoc {

class ZoneDataProvider {
public:
    virtual ~ZoneDataProvider() = default;

    // zone is a normalised name
    virtual bool hasZone(const std::string& zone) const = 0;

    // Data pages for one room, in a document of their own. Called from worker
    // threads, concurrently for different rooms.
    virtual std::shared_ptr<QPDF> dataPages(const RoomSpec& room, const BuildTimestamp& timestamp) const = 0;
};

struct ZoneRow {
    std::string zone;                   // normalised, carried forward
    std::vector<std::string> cells;
};

struct ZoneTable {
    std::string tab;
    std::string path;
    std::vector<std::string> header;
    std::vector<ZoneRow> rows;
    std::set<std::string> zones;        // every zone named in column 1
};

// Blank zones take the previous row's zone; rows with an empty first column
// are dropped. Header row required.
ZoneTable parse_zone_table(const std::string& csv_text, const std::string& tab, const std::string& source_name);

class CsvZoneDataProvider : public ZoneDataProvider {
public:
    explicit CsvZoneDataProvider(std::vector<ZoneTable> tables, PageLayout layout = PageLayout());

    // One CSV per tab: the file in directory whose name starts with the tab
    // name and ends in ".csv". Throws BuildError(InvalidConfig) listing every
    // tab with no file, several files or an unreadable file.
    static CsvZoneDataProvider load(const std::string& directory, const TabTable& tabs);

    bool hasZone(const std::string& zone) const override;
    std::shared_ptr<QPDF> dataPages(const RoomSpec& room, const BuildTimestamp& timestamp) const override;

    // Table content for a room, without rendering
    TableDocument document(const RoomSpec& room, const BuildTimestamp& timestamp) const;

    const std::vector<ZoneTable>& tables() const { return tables_; }

private:
    std::vector<ZoneTable> tables_;
    std::set<std::string> zones_;
    TablePageWriter writer_;
};

} // namespace WireDoc

#endif // WIREDOC_ZONE_DATA_H
