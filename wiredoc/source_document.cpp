#include "wiredoc/source_document.h"

#include <algorithm>
#include <filesystem>

#include <qpdf/QPDFExc.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>

#include "wiredoc/build_error.h"

namespace fs = std::filesystem;

namespace WireDoc {

std::shared_ptr<SourceDocument> SourceDocument::open(const std::string& path, const std::string& tab) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw BuildError(issue(ErrorCode::SOURCE_NOT_FOUND).in_tab(tab).at_path(path)
            .because("source PDF does not exist"));
    }

    std::shared_ptr<SourceDocument> doc(new SourceDocument());
    doc->path_ = path;
    doc->tab_ = tab;
    doc->qpdf_ = std::make_shared<QPDF>();

    try {
        doc->qpdf_->setSuppressWarnings(true);
        doc->qpdf_->setAttemptRecovery(false);
        doc->qpdf_->processFile(path.c_str());
    } catch (const QPDFExc& e) {
        ErrorCode code = e.getErrorCode() == qpdf_e_system ? ErrorCode::SOURCE_NOT_FOUND
                                                           : ErrorCode::UNSUPPORTED_SOURCE_FORMAT;
        throw BuildError(issue(code).in_tab(tab).at_path(path).because(e.getMessageDetail()));
    } catch (const std::exception& e) {
        throw BuildError(issue(ErrorCode::UNSUPPORTED_SOURCE_FORMAT).in_tab(tab).at_path(path)
            .because(e.what()));
    }

    if (doc->qpdf_->isEncrypted()) {
        throw BuildError(issue(ErrorCode::UNSUPPORTED_SOURCE_FORMAT).in_tab(tab).at_path(path)
            .because("encrypted PDFs are not supported"));
    }

    try {
        QPDFPageDocumentHelper dh(*doc->qpdf_);
        // Inherited /Resources, /MediaBox, /CropBox and /Rotate become explicit
        // on every page so that each page can be lifted out on its own.
        dh.pushInheritedAttributesToPage();
        doc->pages_ = dh.getAllPages();
    } catch (const std::exception& e) {
        throw BuildError(issue(ErrorCode::UNSUPPORTED_SOURCE_FORMAT).in_tab(tab).at_path(path)
            .because(std::string("damaged page tree: ") + e.what()));
    }

    return doc;
}

QPDFPageObjectHelper SourceDocument::page(int page_number) {
    if (!hasPage(page_number)) {
        throw BuildError(issue(ErrorCode::SOURCE_NOT_FOUND).in_tab(tab_).at_path(path_).at_page(page_number)
            .because("document has " + std::to_string(pageCount()) + " page(s)"));
    }
    return pages_[page_number - 1];
}

PageBox SourceDocument::visibleBox(int page_number) {
    QPDFPageObjectHelper p = page(page_number);
    PageBox box;

    QPDFObjectHandle crop = p.getCropBox();
    if (!crop.isRectangle()) {
        throw BuildError(issue(ErrorCode::UNSUPPORTED_SOURCE_FORMAT).in_tab(tab_).at_path(path_)
            .at_page(page_number).because("page has no valid MediaBox"));
    }
    QPDFObjectHandle::Rectangle r = crop.getArrayAsRectangle();
    box.llx = std::min(r.llx, r.urx);
    box.lly = std::min(r.lly, r.ury);
    box.urx = std::max(r.llx, r.urx);
    box.ury = std::max(r.lly, r.ury);

    QPDFObjectHandle rotate = p.getObjectHandle().getKey("/Rotate");
    if (rotate.isInteger()) {
        int degrees = static_cast<int>(rotate.getIntValue()) % 360;
        if (degrees < 0) degrees += 360;
        box.rotate = (degrees % 90 == 0) ? degrees : 0;
    }

    return box;
}

} // namespace WireDoc
