#include "print_sheet.hpp"
#include "card_render/card_render.hpp"
#include "util/ImageOps.hpp"

#include <opencv2/opencv.hpp>
#include <zlib.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <regex>
#include <stdexcept>

namespace fs = std::filesystem;

namespace
{
    const std::array<const char*, 7> kImageExtensions { ".png", ".jpg", ".jpeg", ".bmp", ".gif", ".tif", ".tiff" };

    inline std::string lower(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    inline bool isImageFile(const fs::path& p)
    {
        const std::string ext = lower(p.extension().string());
        return std::any_of(kImageExtensions.begin(), kImageExtensions.end(),
                           [&](const char* e) { return ext == e; });
    }

    /* PNG pHYs chunk --------------------------------------------------------- */
    inline void putBE32(std::vector<uchar>& out, uint32_t v)
    {
        out.push_back(static_cast<uchar>(v >> 24));
        out.push_back(static_cast<uchar>(v >> 16));
        out.push_back(static_cast<uchar>(v >> 8));
        out.push_back(static_cast<uchar>(v));
    }

    // Insert a pHYs chunk (pixels per metre) right after IHDR.
    bool addPngDpi(std::vector<uchar>& png, int dpi)
    {
        // 8-byte signature + IHDR (4 len + 4 type + 13 data + 4 crc)
        const std::size_t ihdrEnd = 8 + 25;
        if (png.size() < ihdrEnd || std::string(png.begin() + 12, png.begin() + 16) != "IHDR") return false;

        const uint32_t ppm = static_cast<uint32_t>(std::lround(dpi / 0.0254));
        std::vector<uchar> chunk;
        putBE32(chunk, 9);
        const size_t typeStart = chunk.size();
        const uchar type[] = { 'p', 'H', 'Y', 's' };
        chunk.insert(chunk.end(), type, type + 4);
        putBE32(chunk, ppm);
        putBE32(chunk, ppm);
        chunk.push_back(1); // unit: metre
        const uLong crc = crc32(0L, chunk.data() + typeStart, static_cast<uInt>(chunk.size() - typeStart));
        putBE32(chunk, static_cast<uint32_t>(crc));

        png.insert(png.begin() + ihdrEnd, chunk.begin(), chunk.end());
        return true;
    }
}

std::vector<std::string> listImageFiles(const std::string& dir)
{
    std::error_code ec;
    if (!fs::is_directory(dir, ec))
        throw std::runtime_error("input folder '" + dir + "' not found or is not a directory");

    std::vector<std::string> files;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
    {
        if (it->is_regular_file(ec) && isImageFile(it->path()))
            files.push_back(it->path().string());
    }
    if (ec) throw std::runtime_error("cannot read folder '" + dir + "': " + ec.message());

    std::sort(files.begin(), files.end());
    return files;
}

SheetBatches chunkIntoSheets(const std::vector<std::string>& files, std::size_t perSheet)
{
    SheetBatches batches;
    if (perSheet == 0)
    {
        batches.leftover = files;
        return batches;
    }
    const std::size_t full = (files.size() / perSheet) * perSheet;
    for (std::size_t i = 0; i < full; i += perSheet)
        batches.sheets.emplace_back(files.begin() + i, files.begin() + i + perSheet);
    batches.leftover.assign(files.begin() + full, files.end());
    return batches;
}

std::string sanitizeNameComponent(const std::string& path)
{
    static const std::regex invalid(R"([<>:"/\\|?*\s\.]+)");
    static const std::regex repeated("_+");

    std::string name = fs::path(path).filename().string();
    const std::string::size_type dot = name.rfind('.');
    if (dot != std::string::npos && dot > 0) name = name.substr(0, dot);

    name = std::regex_replace(name, invalid, "_");
    name = std::regex_replace(name, repeated, "_");
    const auto first = name.find_first_not_of('_');
    if (first == std::string::npos) return "file";
    const auto last = name.find_last_not_of('_');
    return name.substr(first, last - first + 1);
}

std::string sheetFileName(const std::string& firstPath, const std::string& lastPath, int index)
{
    return sanitizeNameComponent(firstPath) + "_to_" + sanitizeNameComponent(lastPath) +
           "_sheet_" + std::to_string(index) + ".png";
}

cv::Mat composeSheet(const std::vector<cv::Mat>& cards, const PhysicalSpec& spec)
{
    cv::Mat sheet(spec.paperHeightPx, spec.paperWidthPx, CV_8UC4, cv::Scalar(255, 255, 255, 255));

    const std::size_t n = std::min(cards.size(), kCardsPerSheet);
    for (std::size_t i = 0; i < n; ++i)
    {
        if (cards[i].empty()) continue;
        const int row = static_cast<int>(i) / kGridColumns;
        const int col = static_cast<int>(i) % kGridColumns;
        util::alphaPaste(sheet, cards[i], cv::Point(spec.cellX(col), spec.cellY(row)));
    }

    // Cut guides at the interior cell boundaries, centred half a line width before the boundary
    const cv::Scalar color(spec.lineColorB, spec.lineColorG, spec.lineColorR, 255);
    const int w = std::max(1, spec.lineWidthPx);
    const cv::Rect page(0, 0, sheet.cols, sheet.rows);
    for (int c = 1; c < kGridColumns; ++c)
    {
        const int centre = spec.cellX(c) - w / 2;
        cv::Rect band = cv::Rect(centre - w / 2, 0, w, sheet.rows) & page;
        if (!band.empty()) sheet(band).setTo(color);
    }
    for (int r = 1; r < kGridRows; ++r)
    {
        const int centre = spec.cellY(r) - w / 2;
        cv::Rect band = cv::Rect(0, centre - w / 2, sheet.cols, w) & page;
        if (!band.empty()) sheet(band).setTo(color);
    }
    return sheet;
}

bool buildSheet(const std::vector<std::string>& chunk, const PhysicalSpec& spec, cv::Mat& sheet)
{
    std::vector<cv::Mat> cards;
    cards.reserve(chunk.size());
    int rendered = 0;
    for (const auto& path : chunk)
    {
        cv::Mat card;
        if (renderCard(path, spec, card)) ++rendered;
        else std::cerr << "[buildSheet] skipping cell for \"" << path << "\"\n";
        cards.push_back(card);
    }
    sheet = composeSheet(cards, spec);
    return rendered > 0;
}

bool saveSheet(const cv::Mat& sheet, const std::string& outPath, int dpi)
{
    const std::string ext = lower(fs::path(outPath).extension().string());
    try
    {
        std::vector<uchar> buf;
        if (ext == ".tif" || ext == ".tiff")
        {
            std::vector<int> params { cv::IMWRITE_TIFF_RESUNIT, 2, cv::IMWRITE_TIFF_XDPI, dpi,
                                      cv::IMWRITE_TIFF_YDPI, dpi };
            if (!cv::imencode(ext, sheet, buf, params)) return false;
        }
        else
        {
            if (!cv::imencode(ext.empty() ? ".png" : ext, sheet, buf)) return false;
            if ((ext.empty() || ext == ".png") && !addPngDpi(buf, dpi))
                std::cerr << "[saveSheet] WARNING: could not embed DPI in \"" << outPath << "\"\n";
        }

        std::ofstream out(outPath, std::ios::binary);
        if (!out) { std::cerr << "[saveSheet] ERROR: cannot open \"" << outPath << "\" for writing\n"; return false; }
        out.write(reinterpret_cast<const char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
        if (!out) { std::cerr << "[saveSheet] ERROR: failed to write \"" << outPath << "\"\n"; return false; }
    }
    catch (const cv::Exception& e)
    {
        std::cerr << "[saveSheet] ERROR: encoding \"" << outPath << "\": " << e.what() << "\n";
        return false;
    }
    std::cout << "[saveSheet] wrote \"" << outPath << "\" (" << sheet.cols << "x" << sheet.rows
              << " @ " << dpi << " DPI)" << std::endl;
    return true;
}
