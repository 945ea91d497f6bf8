//
// Page geometry for placing one image on one page
//

#ifndef DOCCONV_SERVER_LAYOUTENGINE_H
#define DOCCONV_SERVER_LAYOUTENGINE_H

#include <string>

enum class ePageSizePolicy {
    automatic,
    a4,
    letter
};

enum class eOrientation {
    portrait,
    landscape
};

// All values are in points with the origin at the top left corner of the page
struct sPlacement {
    double pageWidth = 0;
    double pageHeight = 0;
    double drawX = 0;
    double drawY = 0;
    double drawWidth = 0;
    double drawHeight = 0;
};

// Portrait dimensions of the named presets
const double A4_WIDTH_POINTS = 595.28;
const double A4_HEIGHT_POINTS = 841.89;
const double LETTER_WIDTH_POINTS = 612;
const double LETTER_HEIGHT_POINTS = 792;

// Case-insensitive "auto", "A4" or "letter". Throws eValidationError for anything else.
auto parsePageSizePolicy(const std::string& value) -> ePageSizePolicy;

// Case-insensitive "portrait" or "landscape". Throws eValidationError for anything else.
auto parseOrientation(const std::string& value) -> eOrientation;

auto computePlacement(ePageSizePolicy policy, eOrientation orientation, double margin,
                      double imageWidth, double imageHeight) -> sPlacement;

#endif //DOCCONV_SERVER_LAYOUTENGINE_H
