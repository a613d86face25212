#ifndef WIREDOC_SOURCE_DOCUMENT_H
#define WIREDOC_SOURCE_DOCUMENT_H

#include <memory>
#include <string>
#include <vector>

#include <qpdf/QPDF.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

namespace WireDoc {

// Visible page box (CropBox, falling back to MediaBox) in PDF user space,
// plus the page's /Rotate normalised to 0, 90, 180 or 270
struct PageBox {
    double llx = 0.0;
    double lly = 0.0;
    double urx = 612.0;
    double ury = 792.0;
    int rotate = 0;

    double width() const { return urx - llx; }
    double height() const { return ury - lly; }

    // Size of the page as displayed (width/height swapped for 90 and 270)
    double displayWidth() const { return (rotate == 90 || rotate == 270) ? height() : width(); }
    double displayHeight() const { return (rotate == 90 || rotate == 270) ? width() : height(); }
};

// A plan PDF opened read-only. One instance must only be used from one thread;
// workers open their own instances of the same file.
class SourceDocument {
public:
    // Throws BuildError: SourceNotFound (missing/unreadable file) or
    // UnsupportedSourceFormat (encrypted or damaged PDF)
    static std::shared_ptr<SourceDocument> open(const std::string& path, const std::string& tab = "");

    const std::string& path() const { return path_; }
    int pageCount() const { return static_cast<int>(pages_.size()); }
    bool hasPage(int page_number) const { return page_number >= 1 && page_number <= pageCount(); }

    // 1-based; throws BuildError(SourceNotFound) for a page outside the document
    QPDFPageObjectHelper page(int page_number);
    PageBox visibleBox(int page_number);

private:
    SourceDocument() = default;

    std::shared_ptr<QPDF> qpdf_;
    std::vector<QPDFPageObjectHelper> pages_;
    std::string path_;
    std::string tab_;
};

} // namespace WireDoc

#endif // WIREDOC_SOURCE_DOCUMENT_H
