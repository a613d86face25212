// table_pages.h - Render tabular zone data as PDF pages
//
// Pages are drawn directly as PDF content (standard Helvetica fonts, WinAnsi
// encoding, Flate-compressed streams) into a fresh QPDF document.

#ifndef WIREDOC_TABLE_PAGES_H
#define WIREDOC_TABLE_PAGES_H

#include <memory>
#include <string>
#include <vector>

#include <qpdf/QPDF.hh>

namespace WireDoc {

struct TableSection {
    std::string heading;
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
};

struct TableDocument {
    std::string title;                  // heading on the first page
    std::vector<TableSection> sections;
    std::string footer_left;
    std::string footer_centre;          // "Page N of M" is always on the right
};

// A3 landscape, 1 inch margins
struct PageLayout {
    double width = 1190.55;
    double height = 841.89;
    double margin = 72.0;
    double font_size = 8.5;
    double title_size = 18.0;
    double heading_size = 13.0;
    double cell_padding = 6.0;
    double max_column_share = 0.5;      // widest a single column may be, as a share of the text width
};

// UTF-8 to WinAnsi (cp1252); unmappable characters become '?'
std::string encode_winansi(const std::string& utf8);

// Width in points of WinAnsi text in Helvetica or Helvetica-Bold
double measure_text(const std::string& winansi, double size, bool bold);

// Greedy word wrap to max_width; words wider than a line are split
std::vector<std::string> wrap_text(const std::string& winansi, double max_width, double size, bool bold);

// PDF string literal body: escapes ( ) \ and non-printable bytes
std::string pdf_string_escape(const std::string& winansi);

// Flate-compress a content stream; false if zlib fails
bool compress_zlib(const std::string& data, std::string& compressed);

class TablePageWriter {
public:
    explicit TablePageWriter(PageLayout layout = PageLayout()) : layout_(layout) {}

    // Always produces at least one page
    std::shared_ptr<QPDF> render(const TableDocument& doc) const;

    // Uncompressed content stream of every page, footers included
    std::vector<std::string> layoutPages(const TableDocument& doc) const;

private:
    PageLayout layout_;
};

} // namespace WireDoc

#endif // WIREDOC_TABLE_PAGES_H
