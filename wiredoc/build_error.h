// build_error.h - Error taxonomy for documentation pack builds
//
// Every failure of a build is reported as a BuildError carrying one or more
// BuildIssue records. Validation stages collect all issues before throwing so
// that a single run names every offending room, tab, track and zone.

#ifndef WIREDOC_BUILD_ERROR_H
#define WIREDOC_BUILD_ERROR_H

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace WireDoc {

// ============================================================================
// Exit Codes
// ============================================================================

constexpr int EC_SUCCESS = 0;
constexpr int EC_INVALID_ARGS = 1;
constexpr int EC_CONFIGURATION_ERROR = 2;
constexpr int EC_GEOMETRY_ERROR = 3;
constexpr int EC_SOURCE_DOCUMENT_ERROR = 4;
constexpr int EC_ASSEMBLY_ERROR = 5;
constexpr int EC_WRITE_ERROR = 6;
constexpr int EC_CANCELLED = 7;
constexpr int EC_UNKNOWN_ERROR = 10;

// ============================================================================
// Error Taxonomy
// ============================================================================

enum class ErrorKind {
    CONFIGURATION,
    GEOMETRY,
    SOURCE_DOCUMENT,
    ASSEMBLY,
    OUTPUT,
    CANCELLED
};

enum class ErrorCode {
    // Configuration
    INVALID_CONFIG,
    INVALID_ROW,
    DUPLICATE_ENTRY,
    UNKNOWN_TAB,
    UNKNOWN_TRACK,
    MISSING_CROP_REGION,
    UNRESOLVED_SOURCE,
    PAGE_NOT_IN_SOURCE,
    // Geometry
    INVALID_REGION,
    REGION_OUT_OF_BOUNDS,
    // Source documents
    SOURCE_NOT_FOUND,
    UNSUPPORTED_SOURCE_FORMAT,
    // Assembly
    MISSING_ROOM_DATA,
    MISSING_ZONE_DATA,
    // Output
    WRITE_FAILED,
    CANCELLED
};

ErrorKind kind_of(ErrorCode code);
const char* kind_name(ErrorKind kind);
const char* code_name(ErrorCode code);
int exit_code_for(ErrorKind kind);

// Rectangle in source page units, kept for error context only
struct IssueRegion {
    double x0 = 0.0;
    double y0 = 0.0;
    double x1 = 0.0;
    double y1 = 0.0;
};

struct BuildIssue {
    ErrorCode code = ErrorCode::INVALID_CONFIG;
    std::string room;
    std::string tab;
    std::string track;
    std::string zone;
    std::string path;
    int page = 0;                       // 1-based, 0 when not applicable
    int row = 0;                        // 1-based line/row in a table file, 0 when not applicable
    std::optional<IssueRegion> region;
    std::string detail;

    ErrorKind kind() const { return kind_of(code); }

    // One line, e.g. "GeometryError [RegionOutOfBounds] room 'Kitchen' tab 'E1' ..."
    std::string describe() const;
};

// Fluent construction used throughout the pipeline:
//   issue(ErrorCode::UNKNOWN_TAB).in_room(r).in_tab(t).because("...")
struct IssueBuilder {
    BuildIssue value;

    IssueBuilder& in_room(const std::string& room) { value.room = room; return *this; }
    IssueBuilder& in_tab(const std::string& tab) { value.tab = tab; return *this; }
    IssueBuilder& in_track(const std::string& track) { value.track = track; return *this; }
    IssueBuilder& in_zone(const std::string& zone) { value.zone = zone; return *this; }
    IssueBuilder& at_path(const std::string& path) { value.path = path; return *this; }
    IssueBuilder& at_page(int page) { value.page = page; return *this; }
    IssueBuilder& at_row(int row) { value.row = row; return *this; }
    IssueBuilder& with_region(double x0, double y0, double x1, double y1) {
        value.region = IssueRegion{x0, y0, x1, y1};
        return *this;
    }
    IssueBuilder& because(const std::string& detail) { value.detail = detail; return *this; }

    operator BuildIssue() const { return value; }
};

inline IssueBuilder issue(ErrorCode code) {
    IssueBuilder b;
    b.value.code = code;
    return b;
}

class BuildError : public std::runtime_error {
public:
    explicit BuildError(std::vector<BuildIssue> issues);
    explicit BuildError(const BuildIssue& single);

    const std::vector<BuildIssue>& issues() const { return issues_; }

    // Kind of the first issue; drives the CLI exit code
    ErrorKind kind() const;

private:
    std::vector<BuildIssue> issues_;

    static std::string summarize(const std::vector<BuildIssue>& issues);
};

// Throws a BuildError when issues is non-empty
void throw_if_any(std::vector<BuildIssue> issues);

} // namespace WireDoc

#endif // WIREDOC_BUILD_ERROR_H
