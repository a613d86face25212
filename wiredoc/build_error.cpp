#include "wiredoc/build_error.h"

#include <iomanip>
#include <sstream>

namespace WireDoc {

// ============================================================================
// Taxonomy lookups
// ============================================================================

ErrorKind kind_of(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_CONFIG:
        case ErrorCode::INVALID_ROW:
        case ErrorCode::DUPLICATE_ENTRY:
        case ErrorCode::UNKNOWN_TAB:
        case ErrorCode::UNKNOWN_TRACK:
        case ErrorCode::MISSING_CROP_REGION:
        case ErrorCode::UNRESOLVED_SOURCE:
        case ErrorCode::PAGE_NOT_IN_SOURCE:
            return ErrorKind::CONFIGURATION;
        case ErrorCode::INVALID_REGION:
        case ErrorCode::REGION_OUT_OF_BOUNDS:
            return ErrorKind::GEOMETRY;
        case ErrorCode::SOURCE_NOT_FOUND:
        case ErrorCode::UNSUPPORTED_SOURCE_FORMAT:
            return ErrorKind::SOURCE_DOCUMENT;
        case ErrorCode::MISSING_ROOM_DATA:
        case ErrorCode::MISSING_ZONE_DATA:
            return ErrorKind::ASSEMBLY;
        case ErrorCode::WRITE_FAILED:
            return ErrorKind::OUTPUT;
        case ErrorCode::CANCELLED:
            return ErrorKind::CANCELLED;
    }
    return ErrorKind::CONFIGURATION;
}

const char* kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CONFIGURATION:   return "ConfigurationError";
        case ErrorKind::GEOMETRY:        return "GeometryError";
        case ErrorKind::SOURCE_DOCUMENT: return "SourceDocumentError";
        case ErrorKind::ASSEMBLY:        return "AssemblyError";
        case ErrorKind::OUTPUT:          return "OutputError";
        case ErrorKind::CANCELLED:       return "Cancelled";
    }
    return "Error";
}

const char* code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_CONFIG:            return "InvalidConfig";
        case ErrorCode::INVALID_ROW:               return "InvalidRow";
        case ErrorCode::DUPLICATE_ENTRY:           return "DuplicateEntry";
        case ErrorCode::UNKNOWN_TAB:               return "UnknownTab";
        case ErrorCode::UNKNOWN_TRACK:             return "UnknownTrack";
        case ErrorCode::MISSING_CROP_REGION:       return "MissingCropRegion";
        case ErrorCode::UNRESOLVED_SOURCE:         return "UnresolvedSource";
        case ErrorCode::PAGE_NOT_IN_SOURCE:        return "PageNotInSource";
        case ErrorCode::INVALID_REGION:            return "InvalidRegion";
        case ErrorCode::REGION_OUT_OF_BOUNDS:      return "RegionOutOfBounds";
        case ErrorCode::SOURCE_NOT_FOUND:          return "SourceNotFound";
        case ErrorCode::UNSUPPORTED_SOURCE_FORMAT: return "UnsupportedSourceFormat";
        case ErrorCode::MISSING_ROOM_DATA:         return "MissingRoomData";
        case ErrorCode::MISSING_ZONE_DATA:         return "MissingZoneData";
        case ErrorCode::WRITE_FAILED:              return "WriteFailed";
        case ErrorCode::CANCELLED:                 return "Cancelled";
    }
    return "Unknown";
}

int exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CONFIGURATION:   return EC_CONFIGURATION_ERROR;
        case ErrorKind::GEOMETRY:        return EC_GEOMETRY_ERROR;
        case ErrorKind::SOURCE_DOCUMENT: return EC_SOURCE_DOCUMENT_ERROR;
        case ErrorKind::ASSEMBLY:        return EC_ASSEMBLY_ERROR;
        case ErrorKind::OUTPUT:          return EC_WRITE_ERROR;
        case ErrorKind::CANCELLED:       return EC_CANCELLED;
    }
    return EC_UNKNOWN_ERROR;
}

// ============================================================================
// BuildIssue
// ============================================================================

std::string BuildIssue::describe() const {
    std::ostringstream out;
    out << kind_name(kind()) << " [" << code_name(code) << "]";
    if (!room.empty())  out << " room '" << room << "'";
    if (!tab.empty())   out << " tab '" << tab << "'";
    if (!track.empty()) out << " track '" << track << "'";
    if (!zone.empty())  out << " zone '" << zone << "'";
    if (page > 0)       out << " page " << page;
    if (region) {
        out << std::setprecision(6) << " region (" << region->x0 << ", " << region->y0
            << ", " << region->x1 << ", " << region->y1 << ")";
    }
    if (!path.empty()) {
        out << " in " << path;
        if (row > 0) out << " row " << row;
    } else if (row > 0) {
        out << " row " << row;
    }
    if (!detail.empty()) out << ": " << detail;
    return out.str();
}

// ============================================================================
// BuildError
// ============================================================================

BuildError::BuildError(std::vector<BuildIssue> issues)
    : std::runtime_error(summarize(issues)), issues_(std::move(issues)) {}

BuildError::BuildError(const BuildIssue& single)
    : BuildError(std::vector<BuildIssue>{single}) {}

ErrorKind BuildError::kind() const {
    if (issues_.empty()) return ErrorKind::CONFIGURATION;
    return issues_.front().kind();
}

std::string BuildError::summarize(const std::vector<BuildIssue>& issues) {
    if (issues.empty()) return "build failed";
    if (issues.size() == 1) return issues.front().describe();

    std::ostringstream out;
    out << issues.size() << " problems found:";
    for (const auto& i : issues) {
        out << "\n  - " << i.describe();
    }
    return out.str();
}

void throw_if_any(std::vector<BuildIssue> issues) {
    if (!issues.empty()) {
        throw BuildError(std::move(issues));
    }
}

} // namespace WireDoc
