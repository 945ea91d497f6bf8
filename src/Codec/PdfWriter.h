//
// Streaming PDF 1.4 writer for documents made of one full page image per page
//

#ifndef DOCCONV_SERVER_PDFWRITER_H
#define DOCCONV_SERVER_PDFWRITER_H

#include "../Layout/LayoutEngine.h"
#include "../Lib/ByteSink.h"
#include <cstdint>
#include <string>
#include <vector>

class PdfWriter {
public:
    // The header is written to the sink immediately
    explicit PdfWriter(IByteSink& sink);

    // Emits one page holding a baseline JPEG drawn at placement. components is 1 (gray) or 3 (RGB).
    void addJpegPage(const sPlacement& placement, const std::string& jpeg,
                     uint32_t pixelWidth, uint32_t pixelHeight, uint32_t components);

    // Writes the page tree, catalog, cross reference table and trailer. No pages can be added afterwards.
    void finish();

    [[nodiscard]] auto pageCount() const -> std::size_t { return pageObjects.size(); }

private:
    auto allocateObject() -> uint32_t;
    void beginObject(uint32_t object);

    CountingByteSink out;

    // Byte offset of each object, indexed by object number. Objects 1 and 2 are filled in by finish().
    std::vector<uint64_t> offsets;
    std::vector<uint32_t> pageObjects;
    bool finished = false;
};

// Formats a PDF number with at most two decimals and no trailing zeros
auto formatPdfNumber(double value) -> std::string;

#endif //DOCCONV_SERVER_PDFWRITER_H
