#include "utils.h"

#include <chrono>
#include <fstream>
#include <memory>
#include <png.h>
#include <regex>
#include <stdexcept>
#include <zlib.h>

std::shared_ptr<std::default_random_engine> rng =
    nullptr;  // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

auto randomInt(uint64_t start, uint64_t end) -> uint64_t
{
    if (!rng)
    {
        rng = std::make_shared<std::default_random_engine>(std::chrono::system_clock::now().time_since_epoch().count());
    }

    std::uniform_int_distribution<uint64_t> rng_dist(start, end);
    return rng_dist(*rng);
}

auto generateRandomData(uint32_t count) -> std::string
{
    std::string result;
    result.reserve(count);

    for (uint32_t i = 0; i < count; i++)
    {
        result.push_back(static_cast<char>(randomInt(0, std::numeric_limits<uint8_t>::max())));
    }

    return result;
}

auto readFile(const std::filesystem::path& path) -> std::string
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
    {
        throw std::runtime_error("Failed to open " + path.string());
    }

    return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
}

void writeFile(const std::filesystem::path& path, const std::string& data)
{
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open())
    {
        throw std::runtime_error("Failed to create " + path.string());
    }
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
}

auto makeRasterImage(uint32_t width, uint32_t height, uint32_t components) -> sRasterImage
{
    sRasterImage image;
    image.width      = width;
    image.height     = height;
    image.components = components;
    image.pixels.resize(static_cast<std::size_t>(width) * height * components);

    for (uint32_t y = 0; y < height; y++)
    {
        for (uint32_t x = 0; x < width; x++)
        {
            for (uint32_t c = 0; c < components; c++)
            {
                auto offset          = (static_cast<std::size_t>(y) * width + x) * components + c;
                image.pixels[offset] = static_cast<uint8_t>((x * 7 + y * 13 + c * 59) % 256);
            }
        }
    }

    return image;
}

auto makeJpeg(uint32_t width, uint32_t height, uint32_t components) -> std::string
{
    return encodeJpeg(makeRasterImage(width, height, components), 90);
}

auto makePng(uint32_t width, uint32_t height, bool withAlpha) -> std::string
{
    auto raster = makeRasterImage(width, height, withAlpha ? 4 : 3);

    png_image image{};
    image.version = PNG_IMAGE_VERSION;
    image.width   = width;
    image.height  = height;
    image.format  = withAlpha ? PNG_FORMAT_RGBA : PNG_FORMAT_RGB;

    // The first call only reports the size needed
    png_alloc_size_t size = 0;
    if (png_image_write_to_memory(&image, nullptr, &size, 0, raster.pixels.data(), 0, nullptr) == 0)
    {
        throw std::runtime_error(std::string("Failed to size PNG: ") + image.message);
    }

    std::string result(size, '\0');
    if (png_image_write_to_memory(&image, result.data(), &size, 0, raster.pixels.data(), 0, nullptr) == 0)
    {
        throw std::runtime_error(std::string("Failed to write PNG: ") + image.message);
    }

    result.resize(size);
    return result;
}

auto withExifOrientation(const std::string& jpeg, uint16_t orientation) -> std::string
{
    // Big endian TIFF with a single IFD0 entry for tag 0x0112
    std::string payload("Exif\0\0", 6);
    payload += std::string("MM\0\x2A\0\0\0\x08", 8);
    payload += std::string("\0\x01", 2);
    payload += std::string("\x01\x12\0\x03\0\0\0\x01", 8);
    payload += static_cast<char>(orientation >> 8);
    payload += static_cast<char>(orientation & 0xFF);
    payload += std::string("\0\0", 2);
    payload += std::string("\0\0\0\0", 4);

    auto length = payload.size() + 2;
    std::string segment = "\xFF\xE1";
    segment += static_cast<char>(length >> 8);
    segment += static_cast<char>(length & 0xFF);
    segment += payload;

    return jpeg.substr(0, 2) + segment + jpeg.substr(2);
}

auto parsePdfPages(const std::string& pdf) -> std::vector<sPdfPage>
{
    static const std::regex mediaBox(R"(/Type /Page /Parent \d+ 0 R /MediaBox \[0 0 ([0-9.]+) ([0-9.]+)\])");
    static const std::regex placement(R"(q\n([0-9.]+) 0 0 ([0-9.]+) ([0-9.]+) ([0-9.]+) cm\n)");
    static const std::regex image(R"(/Subtype /Image /Width (\d+) /Height (\d+))");

    std::vector<sPdfPage> pages;
    for (auto match = std::sregex_iterator(pdf.begin(), pdf.end(), mediaBox); match != std::sregex_iterator(); ++match)
    {
        sPdfPage page;
        page.mediaWidth  = std::stod((*match)[1].str());
        page.mediaHeight = std::stod((*match)[2].str());
        pages.push_back(page);
    }

    std::size_t index = 0;
    for (auto match = std::sregex_iterator(pdf.begin(), pdf.end(), placement);
         match != std::sregex_iterator() && index < pages.size(); ++match, ++index)
    {
        pages[index].drawWidth  = std::stod((*match)[1].str());
        pages[index].drawHeight = std::stod((*match)[2].str());
        pages[index].drawX      = std::stod((*match)[3].str());
        pages[index].drawBottom = std::stod((*match)[4].str());
    }

    index = 0;
    for (auto match = std::sregex_iterator(pdf.begin(), pdf.end(), image);
         match != std::sregex_iterator() && index < pages.size(); ++match, ++index)
    {
        pages[index].pixelWidth  = static_cast<uint32_t>(std::stoul((*match)[1].str()));
        pages[index].pixelHeight = static_cast<uint32_t>(std::stoul((*match)[2].str()));
    }

    return pages;
}

namespace
{
    auto readLittle16(const std::string& data, std::size_t offset) -> uint32_t
    {
        if (offset + 2 > data.size())
        {
            throw std::runtime_error("ZIP structure truncated");
        }
        return static_cast<uint8_t>(data[offset]) | (static_cast<uint32_t>(static_cast<uint8_t>(data[offset + 1])) << 8);
    }

    auto readLittle32(const std::string& data, std::size_t offset) -> uint32_t
    {
        return readLittle16(data, offset) | (readLittle16(data, offset + 2) << 16);
    }

    auto inflateRaw(const std::string& compressed, std::size_t expectedSize) -> std::string
    {
        z_stream stream{};
        if (inflateInit2(&stream, -MAX_WBITS) != Z_OK)
        {
            throw std::runtime_error("inflateInit2 failed");
        }

        std::string result(expectedSize, '\0');

        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast,cppcoreguidelines-pro-type-const-cast)
        stream.next_in   = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.data()));
        stream.avail_in  = static_cast<uInt>(compressed.size());
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        stream.next_out  = reinterpret_cast<Bytef*>(result.data());
        stream.avail_out = static_cast<uInt>(result.size());

        auto status = inflate(&stream, Z_FINISH);
        inflateEnd(&stream);

        if (status != Z_STREAM_END)
        {
            throw std::runtime_error("inflate failed with status " + std::to_string(status));
        }

        result.resize(stream.total_out);
        return result;
    }
}

auto parseZip(const std::string& zip) -> std::vector<sZipTestEntry>
{
    const uint32_t endOfCentralDirectorySignature = 0x06054b50;
    const uint32_t centralDirectorySignature      = 0x02014b50;
    const std::size_t endOfCentralDirectorySize   = 22;

    if (zip.size() < endOfCentralDirectorySize)
    {
        throw std::runtime_error("ZIP too short");
    }

    // The archives under test never carry a comment
    auto end = zip.size() - endOfCentralDirectorySize;
    if (readLittle32(zip, end) != endOfCentralDirectorySignature)
    {
        throw std::runtime_error("ZIP end of central directory not found");
    }

    auto count  = readLittle16(zip, end + 10);
    auto offset = static_cast<std::size_t>(readLittle32(zip, end + 16));

    std::vector<sZipTestEntry> entries;
    for (uint32_t i = 0; i < count; i++)
    {
        if (readLittle32(zip, offset) != centralDirectorySignature)
        {
            throw std::runtime_error("ZIP central directory record corrupt");
        }

        sZipTestEntry entry;
        entry.method         = readLittle16(zip, offset + 10);
        entry.crc            = readLittle32(zip, offset + 16);
        auto compressedSize  = readLittle32(zip, offset + 20);
        auto size            = readLittle32(zip, offset + 24);
        auto nameLength      = readLittle16(zip, offset + 28);
        auto extraLength     = readLittle16(zip, offset + 30);
        auto commentLength   = readLittle16(zip, offset + 32);
        auto localOffset     = static_cast<std::size_t>(readLittle32(zip, offset + 42));
        entry.name           = zip.substr(offset + 46, nameLength);

        auto localNameLength  = readLittle16(zip, localOffset + 26);
        auto localExtraLength = readLittle16(zip, localOffset + 28);
        auto dataOffset       = localOffset + 30 + localNameLength + localExtraLength;

        entry.compressedSize = compressedSize;

        // Method 0 is stored, 8 is deflate
        if (entry.method == 0)
        {
            entry.data = zip.substr(dataOffset, compressedSize);
        }
        else
        {
            entry.data = inflateRaw(zip.substr(dataOffset, compressedSize), size);
        }
        entries.push_back(entry);

        offset += 46 + nameLength + extraLength + commentLength;
    }

    return entries;
}

namespace
{
    auto writeScript(const std::filesystem::path& path, const std::string& script) -> std::filesystem::path
    {
        writeFile(path, script);
        std::filesystem::permissions(
            path,
            std::filesystem::perms::owner_all | std::filesystem::perms::group_read | std::filesystem::perms::group_exec,
            std::filesystem::perm_options::replace);
        return path;
    }
}

auto writeFakeRasterizer(const std::filesystem::path& directory, const std::string& pagePng, uint32_t pageCount,
                         int exitCode) -> std::filesystem::path
{
    auto page = directory / "fake_page.png";
    writeFile(page, pagePng);

    std::stringstream script;
    script << "#!/bin/sh\n"
           << "if [ \"$1\" = \"-v\" ]; then\n"
           << "    echo \"pdftoppm version 0.0.0\" >&2\n"
           << "    exit 0\n"
           << "fi\n"
           << "for prefix; do :; done\n"
           << "i=1\n"
           << "while [ $i -le " << pageCount << " ]; do\n"
           << "    cp \"" << page.string() << "\" \"$prefix-$i.png\"\n"
           << "    printf '%s' \"$i\" >> \"$prefix-$i.png\"\n"
           << "    i=$((i + 1))\n"
           << "done\n"
           << "exit " << exitCode << "\n";

    return writeScript(directory / "fake_pdftoppm", script.str());
}

auto writeHangingRasterizer(const std::filesystem::path& directory) -> std::filesystem::path
{
    return writeScript(
        directory / "hanging_pdftoppm",
        "#!/bin/sh\n"
        "if [ \"$1\" = \"-v\" ]; then\n"
        "    exit 0\n"
        "fi\n"
        "exec sleep 60\n");
}

auto countEntriesWithPrefix(const std::filesystem::path& directory, const std::string& prefix) -> std::size_t
{
    std::size_t count = 0;

    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec))
    {
        return 0;
    }

    for (const auto& entry : std::filesystem::directory_iterator(directory))
    {
        if (entry.path().filename().string().rfind(prefix, 0) == 0)
        {
            count++;
        }
    }
    return count;
}
