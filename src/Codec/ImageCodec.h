//
// JPEG and PNG decoding, orientation normalisation and JPEG re-encoding
//

#ifndef DOCCONV_SERVER_IMAGECODEC_H
#define DOCCONV_SERVER_IMAGECODEC_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

enum class eImageFormat {
    jpeg,
    png
};

// Dimensions are reported as they will be drawn, after any EXIF orientation has been applied
struct sImageInfo {
    eImageFormat format = eImageFormat::jpeg;
    uint32_t width = 0;
    uint32_t height = 0;
};

// 8 bit pixels, row major, either 1 (gray) or 3 (RGB) components with no padding between rows
struct sRasterImage {
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t components = 0;
    std::vector<uint8_t> pixels;
};

// Identifies the format from the leading signature bytes. Throws eConversionError for anything that is not JPEG or PNG.
auto detectImageFormat(std::string_view bytes) -> eImageFormat;

// Reads only the image header. Throws eConversionError if the header is missing or corrupt.
auto readImageInfo(std::string_view bytes) -> sImageInfo;

// Fully decodes an image to upright pixels. PNG transparency is composited onto white.
auto decodeImage(std::string_view bytes) -> sRasterImage;

// Baseline JPEG at the given quality (1-100)
auto encodeJpeg(const sRasterImage& image, uint32_t quality) -> std::string;

// Returns the EXIF orientation (1-8) stored in the payload of an APP1 marker, or 1 if there is none
auto parseExifOrientation(std::string_view app1) -> uint16_t;

// Rotates and mirrors pixels so that an image stored with the given EXIF orientation becomes upright
auto applyOrientation(const sRasterImage& image, uint16_t orientation) -> sRasterImage;

#endif //DOCCONV_SERVER_IMAGECODEC_H
