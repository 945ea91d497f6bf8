//
// Streaming PDF 1.4 writer for documents made of one full page image per page
//

#include "PdfWriter.h"
#include "../Lib/Errors.h"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace {
    const uint32_t CATALOG_OBJECT = 1;
    const uint32_t PAGES_OBJECT = 2;
}

auto formatPdfNumber(double value) -> std::string {
    auto rounded = std::round(value * 100) / 100;
    if (rounded == 0) {
        // Avoid "-0"
        return "0";
    }

    std::ostringstream stream;
    stream << std::fixed << std::setprecision(2) << rounded;
    auto result = stream.str();

    result.erase(result.find_last_not_of('0') + 1);
    if (result.back() == '.') {
        result.pop_back();
    }
    return result;
}

PdfWriter::PdfWriter(IByteSink& sink) : out(sink), offsets(PAGES_OBJECT + 1, 0) {
    // The comment line of high bytes marks the file as binary for transfer tools
    out.write("%PDF-1.4\n%\xE2\xE3\xCF\xD3\n");
}

auto PdfWriter::allocateObject() -> uint32_t {
    offsets.push_back(0);
    return static_cast<uint32_t>(offsets.size() - 1);
}

void PdfWriter::beginObject(uint32_t object) {
    offsets[object] = out.offset();
    out.write(std::to_string(object) + " 0 obj\n");
}

void PdfWriter::addJpegPage(const sPlacement& placement, const std::string& jpeg,
                            uint32_t pixelWidth, uint32_t pixelHeight, uint32_t components) {
    if (finished) {
        throw eConversionError("Cannot add a page to a finished document");
    }

    auto pageObject = allocateObject();
    auto contentObject = allocateObject();
    auto imageObject = allocateObject();
    pageObjects.push_back(pageObject);

    // Placements use a top left origin, PDF user space starts at the bottom left
    auto bottom = placement.pageHeight - placement.drawY - placement.drawHeight;

    std::string content = "q\n"
            + formatPdfNumber(placement.drawWidth) + " 0 0 " + formatPdfNumber(placement.drawHeight) + " "
            + formatPdfNumber(placement.drawX) + " " + formatPdfNumber(bottom) + " cm\n"
            + "/Im0 Do\nQ\n";

    beginObject(pageObject);
    out.write("<< /Type /Page /Parent " + std::to_string(PAGES_OBJECT) + " 0 R"
              + " /MediaBox [0 0 " + formatPdfNumber(placement.pageWidth) + " " + formatPdfNumber(placement.pageHeight) + "]"
              + " /Resources << /XObject << /Im0 " + std::to_string(imageObject) + " 0 R >> >>"
              + " /Contents " + std::to_string(contentObject) + " 0 R >>\nendobj\n");

    beginObject(contentObject);
    out.write("<< /Length " + std::to_string(content.size()) + " >>\nstream\n" + content + "endstream\nendobj\n");

    beginObject(imageObject);
    out.write("<< /Type /XObject /Subtype /Image /Width " + std::to_string(pixelWidth)
              + " /Height " + std::to_string(pixelHeight)
              + " /ColorSpace " + (components == 1 ? "/DeviceGray" : "/DeviceRGB")
              + " /BitsPerComponent 8 /Filter /DCTDecode /Length " + std::to_string(jpeg.size())
              + " >>\nstream\n");
    out.write(jpeg);
    out.write("\nendstream\nendobj\n");

    out.flush();
}

void PdfWriter::finish() {
    if (finished) {
        return;
    }
    finished = true;

    beginObject(PAGES_OBJECT);
    std::string kids;
    for (const auto& page : pageObjects) {
        if (!kids.empty()) {
            kids += " ";
        }
        kids += std::to_string(page) + " 0 R";
    }
    out.write("<< /Type /Pages /Kids [" + kids + "] /Count " + std::to_string(pageObjects.size()) + " >>\nendobj\n");

    beginObject(CATALOG_OBJECT);
    out.write("<< /Type /Catalog /Pages " + std::to_string(PAGES_OBJECT) + " 0 R >>\nendobj\n");

    auto xrefOffset = out.offset();

    std::ostringstream xref;
    xref << "xref\n0 " << offsets.size() << "\n0000000000 65535 f \n";
    for (std::size_t object = 1; object < offsets.size(); object++) {
        xref << std::setw(10) << std::setfill('0') << offsets[object] << " 00000 n \n";
    }
    xref << "trailer\n<< /Size " << offsets.size() << " /Root " << CATALOG_OBJECT << " 0 R >>\n"
         << "startxref\n" << xrefOffset << "\n%%EOF\n";
    out.write(xref.str());

    out.flush();
}
