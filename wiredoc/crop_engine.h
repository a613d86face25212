// crop_engine.h - Trim plan pages to a rectangle without rasterising
//
// The source page is wrapped as a form XObject and drawn, clipped and
// translated, onto a new page whose MediaBox is exactly the region's size.
// Text, vector paths, fonts and images stay as they were in the source.

#ifndef WIREDOC_CROP_ENGINE_H
#define WIREDOC_CROP_ENGINE_H

#include <optional>
#include <string>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

#include "wiredoc/build_error.h"
#include "wiredoc/config.h"
#include "wiredoc/source_document.h"

namespace WireDoc {

struct CroppedPage {
    QPDFPageObjectHelper page;
    double width = 0.0;
    double height = 0.0;
};

// Affine matrix [a b c d e f] as used by the PDF "cm" operator
struct PageTransform {
    double a = 1.0, b = 0.0, c = 0.0, d = 1.0, e = 0.0, f = 0.0;
};

// Checks x1 > x0 and y1 > y0 (finite values); needs no document
std::optional<BuildIssue> validate_region(const CropRegion& region);

// Checks the region lies inside the displayed page box (no clamping)
std::optional<BuildIssue> check_region_bounds(const CropRegion& region, const PageBox& box, int page_number);

// Maps form space (source user space) to the cropped page so that the
// region's displayed top-left corner lands on the new page's top-left corner
PageTransform crop_transform(const CropRegion& region, const PageBox& box);

class CropEngine {
public:
    // Cropped pages are created as objects of target; they are not added to
    // its page tree
    explicit CropEngine(QPDF& target) : target_(target) {}

    // Throws BuildError (InvalidRegion, RegionOutOfBounds, SourceNotFound)
    CroppedPage crop(SourceDocument& source, int page_number, const CropRegion& region);

private:
    QPDF& target_;
};

} // namespace WireDoc

#endif // WIREDOC_CROP_ENGINE_H
