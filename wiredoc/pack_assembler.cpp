#include "wiredoc/pack_assembler.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <set>
#include <sstream>
#include <thread>
#include <tuple>

#include <qpdf/Buffer.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>

#include "wiredoc/crop_engine.h"
#include "wiredoc/riffle_shuffler.h"
#include "wiredoc/text_util.h"

namespace fs = std::filesystem;

namespace WireDoc {

static const char* const PRODUCER = "wiredoc";

const char* stage_name(BuildStage stage) {
    switch (stage) {
        case BuildStage::LOADED:     return "LOADED";
        case BuildStage::CROPPED:    return "CROPPED";
        case BuildStage::SHUFFLED:   return "SHUFFLED";
        case BuildStage::ASSEMBLED:  return "ASSEMBLED";
        case BuildStage::SERIALIZED: return "SERIALIZED";
    }
    return "UNKNOWN";
}

// Room names become file names of retained intermediates
static std::string safe_file_name(const std::string& name) {
    std::string out;
    for (unsigned char c : name) {
        out.push_back((std::isalnum(c) || c == '-' || c == '.') ? static_cast<char>(c) : '_');
    }
    return out;
}

static int page_count(QPDF& pdf) {
    return static_cast<int>(QPDFPageDocumentHelper(pdf).getAllPages().size());
}

// Issues raised below the room level (source documents, crops) lack the room
static void add_room_context(std::vector<BuildIssue>& issues, const std::string& room) {
    for (auto& i : issues) {
        if (i.room.empty()) i.room = room;
    }
}

// ============================================================================
// DocumentationPack
// ============================================================================

int DocumentationPack::pageCount() const {
    return pdf_ ? page_count(*pdf_) : 0;
}

static QPDFWriter& configure_writer(QPDFWriter& writer) {
    // /ID derived from content so identical input gives identical bytes
    writer.setDeterministicID(true);
    writer.setCompressStreams(true);
    return writer;
}

void DocumentationPack::write(const std::string& path, const std::atomic<bool>* cancel) {
    auto cancelled = [cancel]() { return cancel && cancel->load(); };
    if (cancelled()) {
        throw BuildError(issue(ErrorCode::CANCELLED).at_path(path).because("cancelled before writing"));
    }

    fs::path target(path);
    fs::path dir = target.parent_path();
    std::error_code ec;
    if (!dir.empty() && !fs::is_directory(dir, ec)) {
        throw BuildError(issue(ErrorCode::WRITE_FAILED).at_path(path)
            .because("output directory does not exist"));
    }

    std::string temp = path + ".tmp";
    try {
        QPDFWriter writer(*pdf_, temp.c_str());
        configure_writer(writer).write();
    } catch (const std::exception& e) {
        fs::remove(temp, ec);
        throw BuildError(issue(ErrorCode::WRITE_FAILED).at_path(path).because(e.what()));
    }

    if (cancelled()) {
        fs::remove(temp, ec);
        throw BuildError(issue(ErrorCode::CANCELLED).at_path(path).because("cancelled before writing"));
    }

    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        throw BuildError(issue(ErrorCode::WRITE_FAILED).at_path(path)
            .because("cannot move temporary file into place: " + ec.message()));
    }

    stage_ = BuildStage::SERIALIZED;
}

std::string DocumentationPack::serialize() {
    std::shared_ptr<Buffer> buffer;
    try {
        QPDFWriter writer(*pdf_);
        writer.setOutputMemory();
        configure_writer(writer).write();
        buffer = writer.getBufferSharedPointer();
    } catch (const std::exception& e) {
        throw BuildError(issue(ErrorCode::WRITE_FAILED).because(e.what()));
    }

    stage_ = BuildStage::SERIALIZED;
    return std::string(reinterpret_cast<const char*>(buffer->getBuffer()), buffer->getSize());
}

// ============================================================================
// PackAssembler
// ============================================================================

// Result slot of one room, written only by the worker that owns the room
struct PackAssembler::RoomResult {
    std::shared_ptr<QPDF> data_doc;
    std::shared_ptr<QPDF> plan_doc;             // cropped pages in riffled order
    std::vector<std::shared_ptr<SourceDocument>> sources;
    std::vector<PlanPageRef> plan_refs;
    std::vector<BuildIssue> issues;
    std::string retained;                       // files written for debugging
};

PackAssembler::PackAssembler(std::vector<RoomSpec> rooms, CropTable crops, TabTable tabs,
                             const SourceResolver& resolver, const ZoneDataProvider& zones,
                             BuildOptions options)
    : rooms_(std::move(rooms)), crops_(std::move(crops)), tabs_(std::move(tabs)),
      resolver_(resolver), zones_(zones), options_(std::move(options)) {}

bool PackAssembler::cancelled() const {
    return options_.cancel && options_.cancel->load();
}

void PackAssembler::throwIfCancelled(const std::string& where) const {
    if (cancelled()) {
        throw BuildError(issue(ErrorCode::CANCELLED).because("cancelled " + where));
    }
}

void PackAssembler::advance(BuildStage next) {
    if (static_cast<int>(next) <= static_cast<int>(stage_)) {
        throw std::logic_error(std::string("invalid stage transition ") + stage_name(stage_) +
                               " -> " + stage_name(next));
    }
    stage_ = next;
    if (options_.verbose) {
        std::cout << "  Stage: " << stage_name(stage_) << std::endl;
    }
}

void PackAssembler::validateTables() {
    std::vector<BuildIssue> issues;
    std::vector<BuildIssue> geometry;

    if (rooms_.empty()) {
        issues.push_back(issue(ErrorCode::INVALID_CONFIG).because("no rooms configured"));
    }

    std::set<std::string> room_names;
    for (const auto& r : rooms_) room_names.insert(r.name);

    std::set<std::tuple<std::string, std::string, std::string>> seen;
    for (const auto& row : crops_.rows()) {
        if (!room_names.count(row.room)) {
            std::cerr << "WARNING: Crop row " << row.row << " names room '" << row.room
                      << "' which is not configured; ignored" << std::endl;
            continue;
        }

        const TabEntry* tab = tabs_.find(row.tab);
        if (!tab) {
            issues.push_back(issue(ErrorCode::UNKNOWN_TAB).in_room(row.room).in_tab(row.tab)
                .at_row(row.row).because("tab is not declared in the tabs file"));
            continue;
        }
        if (!row.applies_to_all_tracks() && !tab->findTrack(row.track)) {
            issues.push_back(issue(ErrorCode::UNKNOWN_TRACK).in_room(row.room).in_tab(row.tab)
                .in_track(row.track).at_row(row.row).because("track is not declared for this tab"));
            continue;
        }
        if (!seen.insert(std::make_tuple(row.room, row.tab, row.track)).second) {
            issues.push_back(issue(ErrorCode::DUPLICATE_ENTRY).in_room(row.room).in_tab(row.tab)
                .in_track(row.track).at_row(row.row).because("crop region defined more than once"));
            continue;
        }

        if (auto bad = validate_region(row)) geometry.push_back(*bad);
    }

    for (const auto& room : rooms_) {
        for (const auto& tab : tabs_.tabs()) {
            if (!crops_.hasPair(room.name, tab.name)) {
                issues.push_back(issue(ErrorCode::MISSING_CROP_REGION).in_room(room.name).in_tab(tab.name)
                    .because("no crop region for this room and tab"));
            }
        }
    }

    issues.insert(issues.end(), geometry.begin(), geometry.end());
    throw_if_any(std::move(issues));
}

void PackAssembler::checkZones() {
    std::vector<BuildIssue> issues;
    for (const auto& room : rooms_) {
        for (const auto& zone : room.zones) {
            std::string name = normalise_name(zone);
            if (!zones_.hasZone(name)) {
                issues.push_back(issue(ErrorCode::MISSING_ZONE_DATA).in_room(room.name).in_zone(name)
                    .because("no data for zone"));
            }
        }
    }
    throw_if_any(std::move(issues));
}

void PackAssembler::resolveSources() {
    std::vector<BuildIssue> issues;
    for (auto& tab : tabs_.tabs()) {
        try {
            tab.source_path = resolver_.resolve(tab.name);
            std::cout << "INFO: Found PDF for '" << tab.name << "': "
                      << fs::path(tab.source_path).filename().string() << std::endl;
        } catch (const BuildError& e) {
            issues.insert(issues.end(), e.issues().begin(), e.issues().end());
        }
    }
    throw_if_any(std::move(issues));
}

std::vector<RoomPlan> PackAssembler::probeSources() {
    std::vector<BuildIssue> issues;

    // Pages of each (tab, track), resolved against the opened source
    std::map<std::pair<std::string, std::string>, std::vector<int>> track_pages;
    std::map<std::string, std::shared_ptr<SourceDocument>> open_sources;

    for (const auto& tab : tabs_.tabs()) {
        std::shared_ptr<SourceDocument> doc;
        try {
            doc = SourceDocument::open(tab.source_path, tab.name);
        } catch (const BuildError& e) {
            issues.insert(issues.end(), e.issues().begin(), e.issues().end());
            continue;
        }
        open_sources[tab.name] = doc;

        for (const auto& track : tab.tracks) {
            std::vector<int> pages;
            if (track.pages.all) {
                for (int p = 1; p <= doc->pageCount(); ++p) pages.push_back(p);
                if (pages.empty()) {
                    issues.push_back(issue(ErrorCode::PAGE_NOT_IN_SOURCE).in_tab(tab.name).in_track(track.name)
                        .at_path(tab.source_path).because("source PDF has no pages"));
                }
            } else {
                const int count = doc->pageCount();
                for (const auto& range : track.pages.ranges) {
                    for (int p = range.first; p <= std::min(range.last, count); ++p) {
                        pages.push_back(p);
                    }
                    // One issue per range, naming the pages past the end of the source
                    if (range.last > count) {
                        int missing = std::max(range.first, count + 1);
                        std::string which = missing == range.last
                            ? "page " + std::to_string(missing)
                            : "pages " + std::to_string(missing) + "-" + std::to_string(range.last);
                        issues.push_back(issue(ErrorCode::PAGE_NOT_IN_SOURCE).in_tab(tab.name)
                            .in_track(track.name).at_path(tab.source_path).at_page(missing)
                            .because(which + " not in source (" + std::to_string(count) + " page(s))"));
                    }
                }
            }
            track_pages[std::make_pair(tab.name, track.name)] = pages;
        }
    }

    std::vector<RoomPlan> plans;
    for (const auto& room : rooms_) {
        RoomPlan plan;
        plan.room = room;

        for (const auto& tab : tabs_.tabs()) {
            auto source = open_sources.find(tab.name);
            for (const auto& track : tab.tracks) {
                const CropRegion* region = crops_.find(room.name, tab.name, track.name);
                if (!region) continue;

                TrackPlan tp;
                tp.tab = tab.name;
                tp.track = track.name;
                tp.source_path = tab.source_path;
                tp.pages = track_pages[std::make_pair(tab.name, track.name)];
                tp.region = *region;
                tp.region.track = track.name;

                if (source != open_sources.end()) {
                    try {
                        for (int p : tp.pages) {
                            auto bounds = check_region_bounds(tp.region, source->second->visibleBox(p), p);
                            if (bounds) {
                                bounds->path = tab.source_path;
                                issues.push_back(*bounds);
                            }
                        }
                    } catch (const BuildError& e) {
                        issues.insert(issues.end(), e.issues().begin(), e.issues().end());
                    }
                }
                plan.tracks.push_back(std::move(tp));
            }
        }
        plans.push_back(std::move(plan));
    }

    throw_if_any(std::move(issues));
    return plans;
}

std::vector<RoomPlan> PackAssembler::check() {
    std::cout << "\n1. Validating tables..." << std::endl;
    if (!options_.timestamp.empty()) BuildTimestamp::parse(options_.timestamp);
    validateTables();
    std::cout << "INFO: " << rooms_.size() << " room(s), " << tabs_.tabs().size() << " tab(s), "
              << crops_.rows().size() << " crop region(s)" << std::endl;

    std::cout << "\n2. Checking zone data..." << std::endl;
    checkZones();

    std::cout << "\n3. Finding plan PDFs..." << std::endl;
    resolveSources();

    std::cout << "\n4. Checking plan pages..." << std::endl;
    std::vector<RoomPlan> plans = probeSources();
    for (const auto& plan : plans) {
        size_t pages = 0;
        for (const auto& t : plan.tracks) pages += t.pages.size();
        std::cout << "INFO: '" << plan.room.name << "': " << plan.tracks.size() << " track(s), "
                  << pages << " plan page(s)" << std::endl;
        if (plan.tracks.empty()) {
            std::cerr << "WARNING: No plan pages for room '" << plan.room.name << "'" << std::endl;
        }
    }
    return plans;
}

void PackAssembler::buildRoom(const RoomPlan& plan, const BuildTimestamp& timestamp, RoomResult& result) const {
    const std::string& room = plan.room.name;
    if (cancelled()) return;

    try {
        result.data_doc = zones_.dataPages(plan.room, timestamp);
        if (!result.data_doc || page_count(*result.data_doc) == 0) {
            result.issues.push_back(issue(ErrorCode::MISSING_ROOM_DATA).in_room(room)
                .because("no data pages produced"));
            return;
        }
    } catch (const BuildError& e) {
        result.issues.insert(result.issues.end(), e.issues().begin(), e.issues().end());
        add_room_context(result.issues, room);
        return;
    } catch (const std::exception& e) {
        result.issues.push_back(issue(ErrorCode::MISSING_ROOM_DATA).in_room(room)
            .because(std::string("data pages failed: ") + e.what()));
        return;
    }

    try {
        result.plan_doc = std::make_shared<QPDF>();
        result.plan_doc->emptyPDF();
        CropEngine engine(*result.plan_doc);

        std::map<std::string, std::shared_ptr<SourceDocument>> sources;
        std::vector<std::vector<CroppedPage>> tracks;
        std::vector<std::vector<PlanPageRef>> refs;

        for (const auto& tp : plan.tracks) {
            if (cancelled()) return;

            auto& doc = sources[tp.source_path];
            if (!doc) {
                doc = SourceDocument::open(tp.source_path, tp.tab);
                result.sources.push_back(doc);
            }

            std::vector<CroppedPage> pages;
            std::vector<PlanPageRef> page_refs;
            for (int p : tp.pages) {
                CroppedPage cp = engine.crop(*doc, p, tp.region);
                page_refs.push_back(PlanPageRef{tp.tab, tp.track, p, cp.width, cp.height});
                pages.push_back(cp);
            }
            tracks.push_back(std::move(pages));
            refs.push_back(std::move(page_refs));
        }

        std::vector<size_t> lengths;
        for (const auto& t : tracks) lengths.push_back(t.size());

        QPDFPageDocumentHelper dh(*result.plan_doc);
        for (const auto& pos : riffle_order(lengths)) {
            dh.addPage(tracks[pos.track][pos.index].page, false);
            result.plan_refs.push_back(refs[pos.track][pos.index]);
        }
    } catch (const BuildError& e) {
        result.issues.insert(result.issues.end(), e.issues().begin(), e.issues().end());
        add_room_context(result.issues, room);
        return;
    } catch (const std::exception& e) {
        result.issues.push_back(issue(ErrorCode::UNSUPPORTED_SOURCE_FORMAT).in_room(room)
            .because(std::string("cropping failed: ") + e.what()));
        return;
    }

    if (!options_.retain_directory.empty()) {
        retainIntermediates(plan, result);
    }
}

void PackAssembler::retainIntermediates(const RoomPlan& plan, RoomResult& result) const {
    const std::string stem = safe_file_name(plan.room.name);
    const fs::path dir(options_.retain_directory);
    const std::string data_path = (dir / ("data_" + stem + ".pdf")).string();
    const std::string plan_path = (dir / ("plans_" + stem + ".pdf")).string();
    const std::string list_path = (dir / ("plans_" + stem + ".csv")).string();

    try {
        QPDFWriter data_writer(*result.data_doc, data_path.c_str());
        configure_writer(data_writer).write();
        QPDFWriter plan_writer(*result.plan_doc, plan_path.c_str());
        configure_writer(plan_writer).write();
    } catch (const std::exception& e) {
        result.issues.push_back(issue(ErrorCode::WRITE_FAILED).in_room(plan.room.name)
            .at_path(options_.retain_directory).because(e.what()));
        return;
    }

    std::ofstream list(list_path);
    if (!list.is_open()) {
        result.issues.push_back(issue(ErrorCode::WRITE_FAILED).in_room(plan.room.name).at_path(list_path)
            .because("cannot create file"));
        return;
    }
    list << "Position,Tab,Track,Page,Width,Height\n";
    for (size_t i = 0; i < result.plan_refs.size(); ++i) {
        const auto& ref = result.plan_refs[i];
        list << (i + 1) << "," << csv_escape(ref.tab) << "," << csv_escape(ref.track) << ","
             << ref.source_page << "," << std::fixed << std::setprecision(2)
             << ref.width << "," << ref.height << "\n";
    }

    result.retained = data_path + ", " + plan_path + ", " + list_path;
}

std::unique_ptr<DocumentationPack> PackAssembler::build() {
    std::cout << "Starting documentation pack build..." << std::endl;

    BuildTimestamp timestamp = options_.timestamp.empty() ? BuildTimestamp::now()
                                                          : BuildTimestamp::parse(options_.timestamp);

    std::vector<RoomPlan> plans = check();
    throwIfCancelled("after validation");

    if (!options_.retain_directory.empty()) {
        std::error_code ec;
        fs::create_directories(options_.retain_directory, ec);
        if (ec) {
            throw BuildError(issue(ErrorCode::WRITE_FAILED).at_path(options_.retain_directory)
                .because("cannot create working directory: " + ec.message()));
        }
        std::cout << "INFO: Working directory: " << options_.retain_directory << std::endl;
    }

    // ---- Per-room work ----------------------------------------------------

    unsigned workers = options_.workers;
    if (workers == 0) workers = std::max(1u, std::thread::hardware_concurrency());
    workers = std::min<unsigned>(workers, static_cast<unsigned>(plans.size()));
    workers = std::max(1u, workers);

    std::cout << "\n5. Creating room pages (" << plans.size() << " room(s), "
              << workers << " worker(s))..." << std::endl;

    std::vector<RoomResult> results(plans.size());
    std::atomic<size_t> next_room{0};

    auto worker = [&]() {
        while (true) {
            size_t index = next_room.fetch_add(1);
            if (index >= plans.size() || cancelled()) break;
            buildRoom(plans[index], timestamp, results[index]);
        }
    };

    std::vector<std::thread> pool;
    for (unsigned w = 0; w < workers; ++w) pool.emplace_back(worker);
    for (auto& t : pool) t.join();

    throwIfCancelled("while creating room pages");

    std::vector<BuildIssue> issues;
    for (const auto& r : results) {
        issues.insert(issues.end(), r.issues.begin(), r.issues.end());
    }
    throw_if_any(std::move(issues));

    advance(BuildStage::CROPPED);
    advance(BuildStage::SHUFFLED);

    // ---- Assembly, in room order --------------------------------------------

    std::cout << "\n6. Combining final output..." << std::endl;

    std::unique_ptr<DocumentationPack> pack(new DocumentationPack());
    pack->timestamp_ = timestamp;
    pack->pdf_ = std::make_shared<QPDF>();
    pack->pdf_->emptyPDF();
    QPDFPageDocumentHelper out(*pack->pdf_);

    for (size_t i = 0; i < plans.size(); ++i) {
        throwIfCancelled("while assembling");
        RoomResult& r = results[i];
        const std::string& room = plans[i].room.name;

        PageBlock block;
        block.room = room;

        for (auto& page : QPDFPageDocumentHelper(*r.data_doc).getAllPages()) {
            out.addPage(page, false);
            ++block.data_pages;
        }
        std::cout << "INFO: Added " << block.data_pages << " data page(s) for '" << room << "'" << std::endl;

        std::vector<QPDFPageObjectHelper> plan_pages = QPDFPageDocumentHelper(*r.plan_doc).getAllPages();
        for (size_t p = 0; p < plan_pages.size(); ++p) {
            out.addPage(plan_pages[p], false);
            if (options_.verbose) {
                const PlanPageRef& ref = r.plan_refs[p];
                std::cout << "    " << ref.tab << " / " << ref.track << " page " << ref.source_page
                          << " (" << std::fixed << std::setprecision(1) << ref.width << " x "
                          << ref.height << " pt)" << std::endl;
            }
        }
        block.plan_pages = r.plan_refs;
        std::cout << "INFO: Added " << plan_pages.size() << " plan page(s) for '" << room << "'" << std::endl;

        if (!r.retained.empty()) {
            std::cout << "INFO: Retained " << r.retained << std::endl;
        }

        pack->blocks_.push_back(std::move(block));
        pack->documents_.push_back(r.data_doc);
        pack->documents_.push_back(r.plan_doc);
        pack->sources_.insert(pack->sources_.end(), r.sources.begin(), r.sources.end());
    }

    // Document properties
    QPDFObjectHandle trailer = pack->pdf_->getTrailer();
    QPDFObjectHandle info = pack->pdf_->makeIndirectObject(QPDFObjectHandle::newDictionary());
    trailer.replaceKey("/Info", info);
    if (!options_.title.empty()) {
        info.replaceKey("/Title", QPDFObjectHandle::newUnicodeString(options_.title));
    }
    info.replaceKey("/Producer", QPDFObjectHandle::newString(PRODUCER));
    info.replaceKey("/Creator", QPDFObjectHandle::newString(PRODUCER));
    info.replaceKey("/CreationDate", QPDFObjectHandle::newString(timestamp.pdfDate()));
    info.replaceKey("/ModDate", QPDFObjectHandle::newString(timestamp.pdfDate()));

    advance(BuildStage::ASSEMBLED);
    pack->stage_ = BuildStage::ASSEMBLED;

    std::cout << "INFO: Documentation pack has " << pack->pageCount() << " page(s)" << std::endl;
    return pack;
}

std::unique_ptr<DocumentationPack> build_pack(const std::vector<RoomSpec>& rooms, const CropTable& crops,
                                              const TabTable& tabs, const SourceResolver& resolver,
                                              const ZoneDataProvider& zones, const BuildOptions& options) {
    PackAssembler assembler(rooms, crops, tabs, resolver, zones, options);
    return assembler.build();
}

} // namespace WireDoc
