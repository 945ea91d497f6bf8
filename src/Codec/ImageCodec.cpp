//
// JPEG and PNG decoding, orientation normalisation and JPEG re-encoding
//

#include "ImageCodec.h"
#include "../Lib/Errors.h"
#include <array>
#include <csetjmp>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
// jpeglib.h needs size_t and FILE declared first
#include <jpeglib.h>
#include <png.h>

namespace {
    const std::array<uint8_t, 3> JPEG_SIGNATURE = {0xFF, 0xD8, 0xFF};
    const std::array<uint8_t, 8> PNG_SIGNATURE = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};

    const uint16_t EXIF_ORIENTATION_TAG = 0x0112;
    const uint32_t MAX_IMAGE_DIMENSION = 65535;

    struct sJpegErrorManager {
        jpeg_error_mgr manager{};
        std::jmp_buf jump{};
        std::array<char, JMSG_LENGTH_MAX> message{};
    };

    void jpegErrorExit(j_common_ptr info) {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        auto* error = reinterpret_cast<sJpegErrorManager*>(info->err);
        (*info->err->format_message)(info, error->message.data());
        // NOLINTNEXTLINE(cert-err52-cpp)
        std::longjmp(error->jump, 1);
    }

    void jpegSilence(j_common_ptr /*info*/) {
        // libjpeg warnings (for example a missing EOI in a truncated file) are not fatal
    }

    // Everything libjpeg touches lives on the heap so it stays valid across a longjmp
    struct sJpegDecodeState {
        sJpegDecodeState() {
            info.err = jpeg_std_error(&error.manager);
            error.manager.error_exit = jpegErrorExit;
            error.manager.output_message = jpegSilence;
        }

        ~sJpegDecodeState() {
            if (created) {
                jpeg_destroy_decompress(&info);
            }
        }

        sJpegDecodeState(sJpegDecodeState const&) = delete;
        auto operator=(sJpegDecodeState const&) -> sJpegDecodeState& = delete;
        sJpegDecodeState(sJpegDecodeState&&) = delete;
        auto operator=(sJpegDecodeState&&) -> sJpegDecodeState& = delete;

        jpeg_decompress_struct info{};
        sJpegErrorManager error;
        bool created = false;
        sRasterImage image;
    };

    struct sJpegEncodeState {
        sJpegEncodeState() {
            info.err = jpeg_std_error(&error.manager);
            error.manager.error_exit = jpegErrorExit;
            error.manager.output_message = jpegSilence;
        }

        ~sJpegEncodeState() {
            if (created) {
                jpeg_destroy_compress(&info);
            }

            // jpeg_mem_dest allocates the output with malloc
            // NOLINTNEXTLINE(cppcoreguidelines-no-malloc,cppcoreguidelines-owning-memory)
            std::free(buffer);
        }

        sJpegEncodeState(sJpegEncodeState const&) = delete;
        auto operator=(sJpegEncodeState const&) -> sJpegEncodeState& = delete;
        sJpegEncodeState(sJpegEncodeState&&) = delete;
        auto operator=(sJpegEncodeState&&) -> sJpegEncodeState& = delete;

        jpeg_compress_struct info{};
        sJpegErrorManager error;
        bool created = false;
        unsigned char* buffer = nullptr;
        unsigned long size = 0;
    };

    auto hasSignature(std::string_view bytes, const auto& signature) -> bool {
        return bytes.size() >= signature.size()
            && std::memcmp(bytes.data(), signature.data(), signature.size()) == 0;
    }

    auto asJpegInput(std::string_view bytes) -> const unsigned char* {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        return reinterpret_cast<const unsigned char*>(bytes.data());
    }

    // Finds the orientation in the markers saved by jpeg_save_markers
    auto readSavedOrientation(const jpeg_decompress_struct& info) -> uint16_t {
        for (auto* marker = info.marker_list; marker != nullptr; marker = marker->next) {
            if (marker->marker == JPEG_APP0 + 1) {
                auto orientation = parseExifOrientation(
                        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
                        std::string_view(reinterpret_cast<const char*>(marker->data), marker->data_length)
                );
                if (orientation != 1) {
                    return orientation;
                }
            }
        }
        return 1;
    }

    void checkJpegColorSpace(const jpeg_decompress_struct& info) {
        if (info.jpeg_color_space == JCS_CMYK || info.jpeg_color_space == JCS_YCCK) {
            throw eConversionError("CMYK JPEG images are not supported");
        }
    }

    void checkDimensions(uint32_t width, uint32_t height) {
        if (width == 0 || height == 0 || width > MAX_IMAGE_DIMENSION || height > MAX_IMAGE_DIMENSION) {
            throw eConversionError(
                    "Image dimensions " + std::to_string(width) + "x" + std::to_string(height) + " are not supported"
            );
        }
    }

    auto readJpegInfo(std::string_view bytes) -> sImageInfo {
        auto state = std::make_unique<sJpegDecodeState>();

        if (setjmp(state->error.jump) != 0) {
            throw eConversionError("Unable to read JPEG header: " + std::string(state->error.message.data()));
        }

        jpeg_create_decompress(&state->info);
        state->created = true;
        jpeg_mem_src(&state->info, asJpegInput(bytes), bytes.size());
        jpeg_save_markers(&state->info, JPEG_APP0 + 1, 0xFFFF);
        jpeg_read_header(&state->info, TRUE);

        checkJpegColorSpace(state->info);
        checkDimensions(state->info.image_width, state->info.image_height);

        // Orientations 5 to 8 turn the image on its side
        auto orientation = readSavedOrientation(state->info);
        if (orientation >= 5) {
            return {eImageFormat::jpeg, state->info.image_height, state->info.image_width};
        }
        return {eImageFormat::jpeg, state->info.image_width, state->info.image_height};
    }

    auto decodeJpeg(std::string_view bytes) -> sRasterImage {
        auto state = std::make_unique<sJpegDecodeState>();

        if (setjmp(state->error.jump) != 0) {
            throw eConversionError("Unable to decode JPEG image: " + std::string(state->error.message.data()));
        }

        jpeg_create_decompress(&state->info);
        state->created = true;
        jpeg_mem_src(&state->info, asJpegInput(bytes), bytes.size());
        jpeg_save_markers(&state->info, JPEG_APP0 + 1, 0xFFFF);
        jpeg_read_header(&state->info, TRUE);

        checkJpegColorSpace(state->info);
        checkDimensions(state->info.image_width, state->info.image_height);

        state->info.out_color_space = state->info.num_components == 1 ? JCS_GRAYSCALE : JCS_RGB;
        jpeg_start_decompress(&state->info);

        state->image.width = state->info.output_width;
        state->image.height = state->info.output_height;
        state->image.components = static_cast<uint32_t>(state->info.output_components);
        state->image.pixels.resize(
                static_cast<std::size_t>(state->image.width) * state->image.height * state->image.components
        );

        auto stride = static_cast<std::size_t>(state->image.width) * state->image.components;
        while (state->info.output_scanline < state->info.output_height) {
            JSAMPROW row = state->image.pixels.data() + stride * state->info.output_scanline;
            jpeg_read_scanlines(&state->info, &row, 1);
        }

        auto orientation = readSavedOrientation(state->info);
        jpeg_finish_decompress(&state->info);

        if (orientation == 1) {
            return std::move(state->image);
        }
        return applyOrientation(state->image, orientation);
    }

    auto readPngInfo(std::string_view bytes) -> sImageInfo {
        png_image image{};
        image.version = PNG_IMAGE_VERSION;

        if (png_image_begin_read_from_memory(&image, bytes.data(), bytes.size()) == 0) {
            throw eConversionError("Unable to read PNG header: " + std::string(image.message));
        }

        sImageInfo info{eImageFormat::png, image.width, image.height};
        png_image_free(&image);

        checkDimensions(info.width, info.height);
        return info;
    }

    auto decodePng(std::string_view bytes) -> sRasterImage {
        png_image image{};
        image.version = PNG_IMAGE_VERSION;

        if (png_image_begin_read_from_memory(&image, bytes.data(), bytes.size()) == 0) {
            throw eConversionError("Unable to read PNG header: " + std::string(image.message));
        }

        try {
            checkDimensions(image.width, image.height);
        } catch (eConversionError&) {
            png_image_free(&image);
            throw;
        }

        // Asking for a format without alpha makes libpng composite onto the background
        auto gray = (image.format & PNG_FORMAT_FLAG_COLOR) == 0;
        image.format = gray ? PNG_FORMAT_GRAY : PNG_FORMAT_RGB;

        sRasterImage result;
        result.width = image.width;
        result.height = image.height;
        result.components = gray ? 1 : 3;
        result.pixels.resize(PNG_IMAGE_SIZE(image));

        png_color background{255, 255, 255};
        if (png_image_finish_read(&image, &background, result.pixels.data(), 0, nullptr) == 0) {
            throw eConversionError("Unable to decode PNG image: " + std::string(image.message));
        }

        return result;
    }

    auto readUint16(std::string_view data, std::size_t offset, bool bigEndian) -> uint16_t {
        auto first = static_cast<uint8_t>(data[offset]);
        auto second = static_cast<uint8_t>(data[offset + 1]);
        return bigEndian
            ? static_cast<uint16_t>((first << 8) | second)
            : static_cast<uint16_t>((second << 8) | first);
    }

    auto readUint32(std::string_view data, std::size_t offset, bool bigEndian) -> uint32_t {
        auto high = static_cast<uint32_t>(readUint16(data, offset, bigEndian));
        auto low = static_cast<uint32_t>(readUint16(data, offset + 2, bigEndian));
        return bigEndian ? (high << 16) | low : (low << 16) | high;
    }
}

auto detectImageFormat(std::string_view bytes) -> eImageFormat {
    if (hasSignature(bytes, JPEG_SIGNATURE)) {
        return eImageFormat::jpeg;
    }

    if (hasSignature(bytes, PNG_SIGNATURE)) {
        return eImageFormat::png;
    }

    throw eConversionError("Unsupported image format, only JPEG and PNG images can be converted");
}

auto readImageInfo(std::string_view bytes) -> sImageInfo {
    if (detectImageFormat(bytes) == eImageFormat::jpeg) {
        return readJpegInfo(bytes);
    }
    return readPngInfo(bytes);
}

auto decodeImage(std::string_view bytes) -> sRasterImage {
    if (detectImageFormat(bytes) == eImageFormat::jpeg) {
        return decodeJpeg(bytes);
    }
    return decodePng(bytes);
}

auto encodeJpeg(const sRasterImage& image, uint32_t quality) -> std::string {
    if (image.components != 1 && image.components != 3) {
        throw eConversionError("Only gray and RGB images can be encoded as JPEG");
    }

    if (image.pixels.size() != static_cast<std::size_t>(image.width) * image.height * image.components) {
        throw eConversionError("Pixel buffer does not match the image dimensions");
    }

    auto state = std::make_unique<sJpegEncodeState>();

    if (setjmp(state->error.jump) != 0) {
        throw eConversionError("Unable to encode JPEG image: " + std::string(state->error.message.data()));
    }

    jpeg_create_compress(&state->info);
    state->created = true;
    jpeg_mem_dest(&state->info, &state->buffer, &state->size);

    state->info.image_width = image.width;
    state->info.image_height = image.height;
    state->info.input_components = static_cast<int>(image.components);
    state->info.in_color_space = image.components == 1 ? JCS_GRAYSCALE : JCS_RGB;
    jpeg_set_defaults(&state->info);
    jpeg_set_quality(&state->info, static_cast<int>(quality), TRUE);

    jpeg_start_compress(&state->info, TRUE);

    auto stride = static_cast<std::size_t>(image.width) * image.components;
    while (state->info.next_scanline < state->info.image_height) {
        // libjpeg's row type is not const but it only reads input rows
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
        auto row = const_cast<JSAMPROW>(image.pixels.data() + stride * state->info.next_scanline);
        jpeg_write_scanlines(&state->info, &row, 1);
    }

    jpeg_finish_compress(&state->info);

    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return {reinterpret_cast<const char*>(state->buffer), state->size};
}

auto parseExifOrientation(std::string_view app1) -> uint16_t {
    // "Exif\0\0" followed by a TIFF header
    const std::size_t tiffStart = 6;
    if (app1.size() < tiffStart + 8 || app1.substr(0, 4) != "Exif") {
        return 1;
    }

    auto tiff = app1.substr(tiffStart);

    bool bigEndian = false;
    if (tiff.substr(0, 2) == "MM") {
        bigEndian = true;
    } else if (tiff.substr(0, 2) != "II") {
        return 1;
    }

    if (readUint16(tiff, 2, bigEndian) != 42) {
        return 1;
    }

    auto ifdOffset = static_cast<std::size_t>(readUint32(tiff, 4, bigEndian));
    if (ifdOffset + 2 > tiff.size()) {
        return 1;
    }

    auto entries = readUint16(tiff, ifdOffset, bigEndian);
    for (std::size_t index = 0; index < entries; index++) {
        auto entry = ifdOffset + 2 + index * 12;
        if (entry + 12 > tiff.size()) {
            break;
        }

        if (readUint16(tiff, entry, bigEndian) == EXIF_ORIENTATION_TAG) {
            // SHORT value stored in the first two bytes of the value field
            auto orientation = readUint16(tiff, entry + 8, bigEndian);
            return orientation >= 1 && orientation <= 8 ? orientation : 1;
        }
    }

    return 1;
}

auto applyOrientation(const sRasterImage& image, uint16_t orientation) -> sRasterImage {
    if (orientation <= 1 || orientation > 8) {
        return image;
    }

    auto width = image.width;
    auto height = image.height;
    auto components = image.components;
    auto transposed = orientation >= 5;

    sRasterImage result;
    result.width = transposed ? height : width;
    result.height = transposed ? width : height;
    result.components = components;
    result.pixels.resize(image.pixels.size());

    for (uint32_t outY = 0; outY < result.height; outY++) {
        for (uint32_t outX = 0; outX < result.width; outX++) {
            uint32_t sourceX = outX;
            uint32_t sourceY = outY;

            switch (orientation) {
                case 2:
                    // Mirrored horizontally
                    sourceX = width - 1 - outX;
                    break;
                case 3:
                    // Rotated 180
                    sourceX = width - 1 - outX;
                    sourceY = height - 1 - outY;
                    break;
                case 4:
                    // Mirrored vertically
                    sourceY = height - 1 - outY;
                    break;
                case 5:
                    // Transposed
                    sourceX = outY;
                    sourceY = outX;
                    break;
                case 6:
                    // Needs a 90 degree clockwise turn
                    sourceX = outY;
                    sourceY = height - 1 - outX;
                    break;
                case 7:
                    // Transversed
                    sourceX = width - 1 - outY;
                    sourceY = height - 1 - outX;
                    break;
                default:
                    // 8, needs a 90 degree anticlockwise turn
                    sourceX = width - 1 - outY;
                    sourceY = outX;
                    break;
            }

            auto from = (static_cast<std::size_t>(sourceY) * width + sourceX) * components;
            auto to = (static_cast<std::size_t>(outY) * result.width + outX) * components;
            std::memcpy(&result.pixels[to], &image.pixels[from], components);
        }
    }

    return result;
}
