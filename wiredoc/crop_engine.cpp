#include "wiredoc/crop_engine.h"

#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>

#include <qpdf/QPDFObjectHandle.hh>

namespace WireDoc {

// Coordinates closer than this to the page edge count as on the edge
static constexpr double EDGE_TOLERANCE = 1e-6;

std::optional<BuildIssue> validate_region(const CropRegion& region) {
    bool finite = std::isfinite(region.x0) && std::isfinite(region.y0) &&
                  std::isfinite(region.x1) && std::isfinite(region.y1);
    std::string problem;
    if (!finite) {
        problem = "coordinates must be finite numbers";
    } else if (region.x1 <= region.x0) {
        problem = "x1 must be greater than x0";
    } else if (region.y1 <= region.y0) {
        problem = "y1 must be greater than y0";
    }
    if (problem.empty()) return std::nullopt;

    BuildIssue i = issue(ErrorCode::INVALID_REGION).in_room(region.room).in_tab(region.tab)
        .in_track(region.track).at_row(region.row)
        .with_region(region.x0, region.y0, region.x1, region.y1).because(problem);
    return i;
}

std::optional<BuildIssue> check_region_bounds(const CropRegion& region, const PageBox& box, int page_number) {
    double w = box.displayWidth();
    double h = box.displayHeight();
    if (region.x0 >= -EDGE_TOLERANCE && region.y0 >= -EDGE_TOLERANCE &&
        region.x1 <= w + EDGE_TOLERANCE && region.y1 <= h + EDGE_TOLERANCE) {
        return std::nullopt;
    }

    std::ostringstream detail;
    detail << "region exceeds page bounds 0 0 " << w << " " << h;
    BuildIssue i = issue(ErrorCode::REGION_OUT_OF_BOUNDS).in_room(region.room).in_tab(region.tab)
        .in_track(region.track).at_page(page_number).at_row(region.row)
        .with_region(region.x0, region.y0, region.x1, region.y1).because(detail.str());
    return i;
}

PageTransform crop_transform(const CropRegion& region, const PageBox& box) {
    // (u, v): displayed coordinates, origin top-left, v downwards.
    // New page: X = u - x0, Y = y1 - v.
    const double bx = box.llx;
    const double by = box.lly;
    const double W = box.width();
    const double H = box.height();

    PageTransform t;
    switch (box.rotate) {
        case 90:    // u = y - by, v = x - bx
            t = {0.0, -1.0, 1.0, 0.0, -by - region.x0, region.y1 + bx};
            break;
        case 180:   // u = W - (x - bx), v = y - by
            t = {-1.0, 0.0, 0.0, -1.0, W + bx - region.x0, region.y1 + by};
            break;
        case 270:   // u = H - (y - by), v = W - (x - bx)
            t = {0.0, 1.0, -1.0, 0.0, H + by - region.x0, region.y1 - W - bx};
            break;
        default:    // u = x - bx, v = H - (y - by)
            t = {1.0, 0.0, 0.0, 1.0, -bx - region.x0, region.y1 - H - by};
            break;
    }
    return t;
}

static std::string format_transform(const PageTransform& t) {
    std::ostringstream out;
    out.imbue(std::locale::classic());
    out << std::fixed << std::setprecision(4)
        << t.a << " " << t.b << " " << t.c << " " << t.d << " " << t.e << " " << t.f;
    return out.str();
}

CroppedPage CropEngine::crop(SourceDocument& source, int page_number, const CropRegion& region) {
    if (auto bad = validate_region(region)) {
        throw BuildError(*bad);
    }

    PageBox box = source.visibleBox(page_number);
    if (auto out_of_bounds = check_region_bounds(region, box, page_number)) {
        BuildIssue i = *out_of_bounds;
        i.path = source.path();
        throw BuildError(i);
    }

    const double width = region.width();
    const double height = region.height();

    // Form XObject in source user space; BBox is the visible box so content
    // hidden by the source's CropBox stays hidden
    QPDFPageObjectHelper src_page = source.page(page_number);
    QPDFObjectHandle form = src_page.getFormXObjectForPage(false);
    form.getDict().replaceKey("/BBox", QPDFObjectHandle::newArray(
        QPDFObjectHandle::Rectangle(box.llx, box.lly, box.urx, box.ury)));
    QPDFObjectHandle local_form = target_.copyForeignObject(form);

    std::ostringstream content;
    content.imbue(std::locale::classic());
    content << std::fixed << std::setprecision(4)
            << "q\n"
            << "0 0 " << width << " " << height << " re W n\n"
            << format_transform(crop_transform(region, box)) << " cm\n"
            << "/WdPlan Do\n"
            << "Q\n";

    QPDFObjectHandle xobjects = QPDFObjectHandle::newDictionary();
    xobjects.replaceKey("/WdPlan", local_form);
    QPDFObjectHandle resources = QPDFObjectHandle::newDictionary();
    resources.replaceKey("/XObject", xobjects);

    QPDFObjectHandle page = QPDFObjectHandle::newDictionary();
    page.replaceKey("/Type", QPDFObjectHandle::newName("/Page"));
    page.replaceKey("/MediaBox", QPDFObjectHandle::newArray(
        QPDFObjectHandle::Rectangle(0.0, 0.0, width, height)));
    page.replaceKey("/Resources", resources);
    page.replaceKey("/Contents", target_.newStream(content.str()));

    return CroppedPage{QPDFPageObjectHelper(target_.makeIndirectObject(page)), width, height};
}

} // namespace WireDoc
