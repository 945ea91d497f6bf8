//
// Page geometry for placing one image on one page
//

#include "LayoutEngine.h"
#include "../Lib/Errors.h"
#include <algorithm>
#include <boost/algorithm/string/case_conv.hpp>
#include <cmath>
#include <utility>

auto parsePageSizePolicy(const std::string& value) -> ePageSizePolicy {
    auto lowered = boost::algorithm::to_lower_copy(value);

    if (lowered.empty() || lowered == "auto") {
        return ePageSizePolicy::automatic;
    }

    if (lowered == "a4") {
        return ePageSizePolicy::a4;
    }

    if (lowered == "letter") {
        return ePageSizePolicy::letter;
    }

    throw eValidationError("pageSize must be one of auto, A4 or letter, got '" + value + "'");
}

auto parseOrientation(const std::string& value) -> eOrientation {
    auto lowered = boost::algorithm::to_lower_copy(value);

    if (lowered.empty() || lowered == "portrait") {
        return eOrientation::portrait;
    }

    if (lowered == "landscape") {
        return eOrientation::landscape;
    }

    throw eValidationError("orientation must be portrait or landscape, got '" + value + "'");
}

auto computePlacement(ePageSizePolicy policy, eOrientation orientation, double margin,
                      double imageWidth, double imageHeight) -> sPlacement {
    margin = std::max(0.0, margin);

    // Images without usable dimensions still get a one point page rather than an empty one
    auto width = std::max(1.0, std::round(imageWidth));
    auto height = std::max(1.0, std::round(imageHeight));

    sPlacement placement;

    if (policy == ePageSizePolicy::automatic) {
        // The page wraps the image, orientation has no effect here
        placement.pageWidth = width + margin * 2;
        placement.pageHeight = height + margin * 2;
        placement.drawX = margin;
        placement.drawY = margin;
        placement.drawWidth = width;
        placement.drawHeight = height;
        return placement;
    }

    auto pageWidth = policy == ePageSizePolicy::a4 ? A4_WIDTH_POINTS : LETTER_WIDTH_POINTS;
    auto pageHeight = policy == ePageSizePolicy::a4 ? A4_HEIGHT_POINTS : LETTER_HEIGHT_POINTS;
    if (orientation == eOrientation::landscape) {
        std::swap(pageWidth, pageHeight);
    }

    auto availableWidth = std::max(0.0, pageWidth - margin * 2);
    auto availableHeight = std::max(0.0, pageHeight - margin * 2);

    // Never upscale
    auto scale = std::min({availableWidth / width, availableHeight / height, 1.0});

    placement.pageWidth = pageWidth;
    placement.pageHeight = pageHeight;
    // Rounding up must not push the image past the margins (841.89 would otherwise round to 842)
    placement.drawWidth = std::max(1.0, std::min(std::round(width * scale), std::floor(availableWidth)));
    placement.drawHeight = std::max(1.0, std::min(std::round(height * scale), std::floor(availableHeight)));

    // Centred on the whole page, not just the area inside the margins
    placement.drawX = std::max(0.0, std::round((pageWidth - placement.drawWidth) / 2));
    placement.drawY = std::max(0.0, std::round((pageHeight - placement.drawHeight) / 2));

    return placement;
}
