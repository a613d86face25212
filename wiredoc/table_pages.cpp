#include "wiredoc/table_pages.h"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <iomanip>
#include <locale>
#include <sstream>

#include <zlib.h>

#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

namespace WireDoc {

static const char* const FONT_REGULAR = "/F1";
static const char* const FONT_BOLD = "/F2";

// Fill for striped rows (#e0e0e0) and cell borders (#cccccc)
static constexpr double STRIPE_GRAY = 0.878;
static constexpr double BORDER_GRAY = 0.8;
static constexpr double BORDER_WIDTH = 0.75;

// ============================================================================
// Font metrics: Helvetica / Helvetica-Bold AFM widths for 0x20..0x7E
// ============================================================================

static const int HELVETICA_WIDTHS[95] = {
    278, 278, 355, 556, 556, 889, 667, 191, 333, 333, 389, 584, 278, 333, 278, 278,
    556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 278, 278, 584, 584, 584, 556,
    1015, 667, 667, 722, 722, 667, 611, 778, 722, 278, 500, 667, 556, 833, 722, 778,
    667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611, 278, 278, 278, 469, 556,
    333, 556, 556, 500, 556, 556, 278, 556, 556, 222, 222, 500, 222, 833, 556, 556,
    556, 556, 333, 500, 278, 556, 500, 722, 500, 500, 500, 334, 260, 334, 584
};

static const int HELVETICA_BOLD_WIDTHS[95] = {
    278, 333, 474, 556, 556, 889, 722, 238, 333, 333, 389, 584, 278, 333, 278, 278,
    556, 556, 556, 556, 556, 556, 556, 556, 556, 556, 333, 333, 584, 584, 584, 611,
    975, 722, 722, 722, 722, 667, 611, 778, 722, 278, 556, 722, 611, 833, 722, 778,
    667, 778, 722, 667, 611, 722, 667, 944, 667, 667, 611, 333, 278, 333, 584, 556,
    333, 556, 611, 556, 611, 556, 333, 611, 611, 278, 278, 556, 278, 889, 611, 611,
    611, 611, 389, 556, 333, 611, 556, 778, 556, 556, 500, 389, 280, 389, 584
};

static int glyph_width(unsigned char ch, bool bold) {
    if (ch >= 0x20 && ch <= 0x7E) {
        return bold ? HELVETICA_BOLD_WIDTHS[ch - 0x20] : HELVETICA_WIDTHS[ch - 0x20];
    }
    if (ch == 0xA0) return 278;
    return 556;
}

double measure_text(const std::string& winansi, double size, bool bold) {
    double units = 0.0;
    for (unsigned char ch : winansi) {
        if (ch == '\n' || ch == '\r') continue;
        units += glyph_width(ch, bold);
    }
    return units / 1000.0 * size;
}

// ============================================================================
// WinAnsi encoding
// ============================================================================

struct WinAnsiMapping {
    uint32_t codepoint;
    unsigned char code;
};

// Code points outside Latin-1 that cp1252 places in 0x80..0x9F
static const WinAnsiMapping WINANSI_EXTRA[] = {
    {0x20AC, 0x80}, {0x201A, 0x82}, {0x0192, 0x83}, {0x201E, 0x84}, {0x2026, 0x85},
    {0x2020, 0x86}, {0x2021, 0x87}, {0x02C6, 0x88}, {0x2030, 0x89}, {0x0160, 0x8A},
    {0x2039, 0x8B}, {0x0152, 0x8C}, {0x017D, 0x8E}, {0x2018, 0x91}, {0x2019, 0x92},
    {0x201C, 0x93}, {0x201D, 0x94}, {0x2022, 0x95}, {0x2013, 0x96}, {0x2014, 0x97},
    {0x02DC, 0x98}, {0x2122, 0x99}, {0x0161, 0x9A}, {0x203A, 0x9B}, {0x0153, 0x9C},
    {0x017E, 0x9E}, {0x0178, 0x9F}
};

static unsigned char winansi_code(uint32_t codepoint) {
    if (codepoint <= 0x7F) return static_cast<unsigned char>(codepoint);
    if (codepoint >= 0xA0 && codepoint <= 0xFF) return static_cast<unsigned char>(codepoint);
    for (const auto& m : WINANSI_EXTRA) {
        if (m.codepoint == codepoint) return m.code;
    }
    return '?';
}

std::string encode_winansi(const std::string& utf8) {
    std::string out;
    out.reserve(utf8.size());

    size_t i = 0;
    while (i < utf8.size()) {
        unsigned char lead = static_cast<unsigned char>(utf8[i]);
        uint32_t cp = 0;
        size_t len = 0;
        if (lead < 0x80) {
            cp = lead;
            len = 1;
        } else if ((lead >> 5) == 0x6) {
            cp = lead & 0x1F;
            len = 2;
        } else if ((lead >> 4) == 0xE) {
            cp = lead & 0x0F;
            len = 3;
        } else if ((lead >> 3) == 0x1E) {
            cp = lead & 0x07;
            len = 4;
        }

        bool valid = len > 0 && i + len <= utf8.size();
        for (size_t k = 1; valid && k < len; ++k) {
            unsigned char cont = static_cast<unsigned char>(utf8[i + k]);
            if ((cont & 0xC0) != 0x80) valid = false;
            cp = (cp << 6) | (cont & 0x3F);
        }

        if (!valid) {
            out.push_back('?');
            ++i;
            continue;
        }
        out.push_back(static_cast<char>(winansi_code(cp)));
        i += len;
    }
    return out;
}

std::string pdf_string_escape(const std::string& winansi) {
    std::string out;
    out.reserve(winansi.size() + 8);
    for (unsigned char ch : winansi) {
        if (ch == '(' || ch == ')' || ch == '\\') {
            out.push_back('\\');
            out.push_back(static_cast<char>(ch));
        } else if (ch < 0x20 || ch == 0x7F) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\%03o", ch);
            out += buf;
        } else {
            out.push_back(static_cast<char>(ch));
        }
    }
    return out;
}

std::vector<std::string> wrap_text(const std::string& winansi, double max_width, double size, bool bold) {
    std::vector<std::string> lines;
    std::istringstream paragraphs(winansi);
    std::string paragraph;

    while (std::getline(paragraphs, paragraph)) {
        std::istringstream words(paragraph);
        std::string word;
        std::string line;
        bool any_word = false;

        while (words >> word) {
            any_word = true;
            std::string candidate = line.empty() ? word : line + " " + word;
            if (measure_text(candidate, size, bold) <= max_width) {
                line = candidate;
                continue;
            }
            if (!line.empty()) {
                lines.push_back(line);
                line.clear();
            }
            // Break a word that is wider than a whole line
            while (word.size() > 1 && measure_text(word, size, bold) > max_width) {
                size_t n = 1;
                while (n < word.size() && measure_text(word.substr(0, n + 1), size, bold) <= max_width) {
                    ++n;
                }
                lines.push_back(word.substr(0, n));
                word = word.substr(n);
            }
            line = word;
        }

        if (!line.empty() || !any_word) lines.push_back(line);
    }
    return lines;
}

bool compress_zlib(const std::string& data, std::string& compressed) {
    uLongf compressed_size = compressBound(static_cast<uLong>(data.size()));
    compressed.resize(compressed_size);

    int result = compress2(reinterpret_cast<Bytef*>(&compressed[0]), &compressed_size,
                           reinterpret_cast<const Bytef*>(data.data()),
                           static_cast<uLong>(data.size()), Z_BEST_COMPRESSION);
    if (result != Z_OK) {
        compressed.clear();
        return false;
    }

    compressed.resize(compressed_size);
    return true;
}

// ============================================================================
// Layout
// ============================================================================

// One table row, wrapped to its column widths
struct LaidOutRow {
    std::vector<std::vector<std::string>> cells;
    double height = 0.0;
};

class TableLayouter {
public:
    explicit TableLayouter(const PageLayout& layout) : layout_(layout) {
        startPage();
    }

    void title(const std::string& text) {
        std::string encoded = encode_winansi(text);
        drawText(layout_.margin, cursor_ - layout_.title_size, encoded, true, layout_.title_size);
        cursor_ -= layout_.title_size * 1.8;
        has_content_ = true;
    }

    void section(const TableSection& section) {
        std::vector<double> widths = columnWidths(section);
        LaidOutRow header = layOut(section.header, widths, true);

        std::vector<LaidOutRow> rows;
        rows.reserve(section.rows.size());
        for (const auto& r : section.rows) rows.push_back(layOut(r, widths, false));

        // Keep the heading with the table header and the first row
        double heading_height = layout_.heading_size * 1.8;
        double first_row = rows.empty() ? 0.0 : std::min(rows.front().height, rowHeight(1));
        double needed = heading_height + header.height + first_row;
        if (has_content_ && cursor_ - needed < bottom()) startPage();

        drawText(layout_.margin, cursor_ - layout_.heading_size, encode_winansi(section.heading),
                 true, layout_.heading_size);
        cursor_ -= heading_height;
        has_content_ = true;

        drawRow(header, widths, true, false);

        int rows_on_page = 0;
        for (size_t i = 0; i < rows.size(); ++i) {
            // First data row is the table's second row, which is striped
            const bool striped = i % 2 == 0;
            LaidOutRow row = rows[i];
            if (rows_on_page > 0 && cursor_ - row.height < bottom()) {
                continuePage(header, widths);
                rows_on_page = 0;
            }

            // A row taller than the space left is split between lines and
            // continued below a repeated header
            while (cursor_ - row.height < bottom()) {
                LaidOutRow rest;
                drawRow(splitRow(row, std::max<size_t>(linesThatFit(), 1), rest), widths, false, striped);
                continuePage(header, widths);
                row = rest;
            }
            drawRow(row, widths, false, striped);
            ++rows_on_page;
        }

        cursor_ -= layout_.font_size * 2.5;
    }

    std::vector<std::string> finish(const std::string& footer_left, const std::string& footer_centre) {
        flushPage();

        std::vector<std::string> result;
        const size_t total = pages_.size();
        for (size_t i = 0; i < total; ++i) {
            ops_.str("");
            ops_ << pages_[i];
            drawFooter(footer_left, footer_centre, i + 1, total);
            result.push_back(ops_.str());
        }
        return result;
    }

private:
    const PageLayout& layout_;
    std::vector<std::string> pages_;
    std::ostringstream ops_;
    double cursor_ = 0.0;
    bool has_content_ = false;
    bool page_open_ = false;

    double bottom() const { return layout_.margin; }
    double textWidth() const { return layout_.width - 2.0 * layout_.margin; }
    double leading() const { return layout_.font_size * 1.2; }
    double rowHeight(size_t lines) const {
        return 2.0 * layout_.cell_padding + static_cast<double>(lines) * leading();
    }

    // Whole text lines of a row that fit between the cursor and the bottom margin
    size_t linesThatFit() const {
        double space = cursor_ - bottom() - 2.0 * layout_.cell_padding;
        return space < leading() ? 0 : static_cast<size_t>(space / leading());
    }

    // First `lines` lines of every cell; the remainder goes to rest
    LaidOutRow splitRow(const LaidOutRow& row, size_t lines, LaidOutRow& rest) const {
        LaidOutRow head;
        rest = LaidOutRow();
        size_t rest_lines = 1;
        for (const auto& cell : row.cells) {
            size_t n = std::min(lines, cell.size());
            head.cells.emplace_back(cell.begin(), cell.begin() + n);
            rest.cells.emplace_back(cell.begin() + n, cell.end());
            rest_lines = std::max(rest_lines, cell.size() - n);
        }
        head.height = rowHeight(lines);
        rest.height = rowHeight(rest_lines);
        return head;
    }

    void continuePage(const LaidOutRow& header, const std::vector<double>& widths) {
        startPage();
        drawRow(header, widths, true, false);
    }

    void flushPage() {
        if (page_open_) pages_.push_back(ops_.str());
        page_open_ = false;
    }

    void startPage() {
        flushPage();
        ops_.str("");
        ops_.clear();
        ops_.imbue(std::locale::classic());
        ops_ << std::fixed << std::setprecision(2);
        cursor_ = layout_.height - layout_.margin;
        has_content_ = false;
        page_open_ = true;
    }

    void drawText(double x, double baseline, const std::string& winansi, bool bold, double size) {
        if (winansi.empty()) return;
        ops_ << "BT " << (bold ? FONT_BOLD : FONT_REGULAR) << " " << size << " Tf "
             << x << " " << baseline << " Td (" << pdf_string_escape(winansi) << ") Tj ET\n";
    }

    std::vector<double> columnWidths(const TableSection& section) const {
        size_t columns = section.header.size();
        for (const auto& r : section.rows) columns = std::max(columns, r.size());

        const double padding = 2.0 * layout_.cell_padding;
        const double cap = textWidth() * layout_.max_column_share;
        const double minimum = padding + layout_.font_size * 2.0;

        std::vector<double> widths(columns, minimum);
        for (size_t c = 0; c < columns; ++c) {
            if (c < section.header.size()) {
                double w = measure_text(encode_winansi(section.header[c]), layout_.font_size, true) + padding;
                widths[c] = std::max(widths[c], w);
            }
            for (const auto& r : section.rows) {
                if (c >= r.size()) continue;
                double w = measure_text(encode_winansi(r[c]), layout_.font_size, false) + padding;
                widths[c] = std::max(widths[c], w);
            }
            widths[c] = std::min(widths[c], cap);
        }

        double total = 0.0;
        for (double w : widths) total += w;
        if (total > textWidth()) {
            double scale = textWidth() / total;
            for (double& w : widths) w *= scale;
        }
        return widths;
    }

    LaidOutRow layOut(const std::vector<std::string>& cells, const std::vector<double>& widths, bool bold) const {
        LaidOutRow row;
        size_t max_lines = 1;
        for (size_t c = 0; c < widths.size(); ++c) {
            std::vector<std::string> lines;
            if (c < cells.size()) {
                lines = wrap_text(encode_winansi(cells[c]), widths[c] - 2.0 * layout_.cell_padding,
                                  layout_.font_size, bold);
            }
            max_lines = std::max(max_lines, lines.size());
            row.cells.push_back(lines);
        }
        row.height = rowHeight(max_lines);
        return row;
    }

    void drawRow(const LaidOutRow& row, const std::vector<double>& widths, bool bold, bool striped) {
        const double top = cursor_;
        const double bottom_y = top - row.height;

        double total = 0.0;
        for (double w : widths) total += w;

        if (striped) {
            ops_ << STRIPE_GRAY << " g " << layout_.margin << " " << bottom_y << " "
                 << total << " " << row.height << " re f 0 g\n";
        }

        ops_ << BORDER_GRAY << " G " << BORDER_WIDTH << " w\n";
        double x = layout_.margin;
        for (size_t c = 0; c < widths.size(); ++c) {
            ops_ << x << " " << bottom_y << " " << widths[c] << " " << row.height << " re S\n";

            double baseline = top - layout_.cell_padding - layout_.font_size;
            for (const auto& line : row.cells[c]) {
                drawText(x + layout_.cell_padding, baseline, line, bold, layout_.font_size);
                baseline -= leading();
            }
            x += widths[c];
        }

        cursor_ = bottom_y;
        has_content_ = true;
    }

    void drawFooter(const std::string& left, const std::string& centre, size_t page, size_t total) {
        const double size = layout_.font_size;
        const double baseline = layout_.margin / 2.0;

        std::string l = encode_winansi(left);
        std::string c = encode_winansi(centre);
        std::string r = "Page " + std::to_string(page) + " of " + std::to_string(total);

        drawText(layout_.margin, baseline, l, false, size);
        drawText((layout_.width - measure_text(c, size, false)) / 2.0, baseline, c, false, size);
        drawText(layout_.width - layout_.margin - measure_text(r, size, false), baseline, r, false, size);
    }
};

std::vector<std::string> TablePageWriter::layoutPages(const TableDocument& doc) const {
    TableLayouter layouter(layout_);
    if (!doc.title.empty()) layouter.title(doc.title);
    for (const auto& section : doc.sections) {
        layouter.section(section);
    }
    return layouter.finish(doc.footer_left, doc.footer_centre);
}

// ============================================================================
// PDF construction
// ============================================================================

static QPDFObjectHandle standard_font(QPDF& pdf, const std::string& base_font) {
    QPDFObjectHandle font = QPDFObjectHandle::newDictionary();
    font.replaceKey("/Type", QPDFObjectHandle::newName("/Font"));
    font.replaceKey("/Subtype", QPDFObjectHandle::newName("/Type1"));
    font.replaceKey("/BaseFont", QPDFObjectHandle::newName(base_font));
    font.replaceKey("/Encoding", QPDFObjectHandle::newName("/WinAnsiEncoding"));
    return pdf.makeIndirectObject(font);
}

std::shared_ptr<QPDF> TablePageWriter::render(const TableDocument& doc) const {
    std::vector<std::string> contents = layoutPages(doc);

    auto pdf = std::make_shared<QPDF>();
    pdf->emptyPDF();

    QPDFObjectHandle fonts = QPDFObjectHandle::newDictionary();
    fonts.replaceKey(FONT_REGULAR, standard_font(*pdf, "/Helvetica"));
    fonts.replaceKey(FONT_BOLD, standard_font(*pdf, "/Helvetica-Bold"));
    QPDFObjectHandle resources = QPDFObjectHandle::newDictionary();
    resources.replaceKey("/Font", fonts);
    resources = pdf->makeIndirectObject(resources);

    QPDFPageDocumentHelper dh(*pdf);
    for (const auto& content : contents) {
        QPDFObjectHandle stream = pdf->newStream();
        std::string compressed;
        if (compress_zlib(content, compressed)) {
            stream.replaceStreamData(compressed, QPDFObjectHandle::newName("/FlateDecode"),
                                     QPDFObjectHandle::newNull());
        } else {
            stream.replaceStreamData(content, QPDFObjectHandle::newNull(), QPDFObjectHandle::newNull());
        }

        QPDFObjectHandle page = QPDFObjectHandle::newDictionary();
        page.replaceKey("/Type", QPDFObjectHandle::newName("/Page"));
        page.replaceKey("/MediaBox", QPDFObjectHandle::newArray(
            QPDFObjectHandle::Rectangle(0.0, 0.0, layout_.width, layout_.height)));
        page.replaceKey("/Resources", resources);
        page.replaceKey("/Contents", stream);
        dh.addPage(QPDFPageObjectHelper(pdf->makeIndirectObject(page)), false);
    }

    return pdf;
}

} // namespace WireDoc
