// pack_assembler.h - Build a documentation pack: per room, data pages
// followed by the room's riffled plan pages
//
// Pipeline:
//   1. validate tables (names, duplicates, crop geometry) - no file access
//   2. check that every configured zone has data
//   3. resolve each tab's plan PDF
//   4. probe sources: page numbers exist, regions inside the pages
//   5. per room, on worker threads: data pages, crops, riffle
//   6. assemble blocks in room order
//   7. write (DocumentationPack::write)

#ifndef WIREDOC_PACK_ASSEMBLER_H
#define WIREDOC_PACK_ASSEMBLER_H

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include <qpdf/QPDF.hh>

#include "wiredoc/build_error.h"
#include "wiredoc/build_timestamp.h"
#include "wiredoc/config.h"
#include "wiredoc/source_document.h"
#include "wiredoc/source_resolver.h"
#include "wiredoc/zone_data.h"

namespace WireDoc {

// Stages a build passes through, in order. Rooms are cropped and riffled
// together on worker threads, so CROPPED and SHUFFLED are both recorded once
// every room's crops and riffle are complete; they are never observed apart.
enum class BuildStage {
    LOADED,
    CROPPED,
    SHUFFLED,
    ASSEMBLED,
    SERIALIZED
};

const char* stage_name(BuildStage stage);

struct BuildOptions {
    std::string title;                          // PDF /Title
    std::string timestamp;                      // empty = current time
    unsigned workers = 0;                       // 0 = hardware concurrency
    std::string retain_directory;               // intermediates go here when set
    bool verbose = false;
    const std::atomic<bool>* cancel = nullptr;  // polled between stages and rooms
};

// One (tab, track) of a room with everything needed to crop it
struct TrackPlan {
    std::string tab;
    std::string track;
    std::string source_path;
    std::vector<int> pages;                     // 1-based, resolved against the source
    CropRegion region;
};

struct RoomPlan {
    RoomSpec room;
    std::vector<TrackPlan> tracks;              // tab order, then track order
};

struct PlanPageRef {
    std::string tab;
    std::string track;
    int source_page = 0;
    double width = 0.0;
    double height = 0.0;
};

struct PageBlock {
    std::string room;
    int data_pages = 0;
    std::vector<PlanPageRef> plan_pages;        // riffled order
};

class DocumentationPack {
public:
    const std::vector<PageBlock>& blocks() const { return blocks_; }
    int pageCount() const;
    BuildStage stage() const { return stage_; }
    const BuildTimestamp& timestamp() const { return timestamp_; }

    // Writes to a temporary file beside path and renames it into place.
    // Throws BuildError (WriteFailed, Cancelled); path is untouched on failure.
    void write(const std::string& path, const std::atomic<bool>* cancel = nullptr);

    // Serialised PDF bytes
    std::string serialize();

private:
    friend class PackAssembler;
    DocumentationPack() = default;

    std::shared_ptr<QPDF> pdf_;
    // Documents the pack's pages were copied from; stream data is read from
    // them when the pack is written
    std::vector<std::shared_ptr<QPDF>> documents_;
    std::vector<std::shared_ptr<SourceDocument>> sources_;
    std::vector<PageBlock> blocks_;
    BuildTimestamp timestamp_;
    BuildStage stage_ = BuildStage::ASSEMBLED;
};

class PackAssembler {
public:
    PackAssembler(std::vector<RoomSpec> rooms, CropTable crops, TabTable tabs,
                  const SourceResolver& resolver, const ZoneDataProvider& zones,
                  BuildOptions options);

    // Runs stages 1-4. Throws BuildError with every issue of the first failing stage.
    std::vector<RoomPlan> check();

    // Runs the whole pipeline up to ASSEMBLED
    std::unique_ptr<DocumentationPack> build();

    BuildStage stage() const { return stage_; }

private:
    struct RoomResult;

    std::vector<RoomSpec> rooms_;
    CropTable crops_;
    TabTable tabs_;
    const SourceResolver& resolver_;
    const ZoneDataProvider& zones_;
    BuildOptions options_;
    BuildStage stage_ = BuildStage::LOADED;

    bool cancelled() const;
    void throwIfCancelled(const std::string& where) const;
    void advance(BuildStage next);

    void validateTables();
    void checkZones();
    void resolveSources();
    std::vector<RoomPlan> probeSources();

    void buildRoom(const RoomPlan& plan, const BuildTimestamp& timestamp, RoomResult& result) const;
    void retainIntermediates(const RoomPlan& plan, RoomResult& result) const;
};

// Convenience wrapper: constructs a PackAssembler and builds
std::unique_ptr<DocumentationPack> build_pack(const std::vector<RoomSpec>& rooms, const CropTable& crops,
                                              const TabTable& tabs, const SourceResolver& resolver,
                                              const ZoneDataProvider& zones, const BuildOptions& options);

} // namespace WireDoc

#endif // WIREDOC_PACK_ASSEMBLER_H
