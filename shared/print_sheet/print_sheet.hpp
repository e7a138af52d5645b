/*========================  print_sheet.hpp  ========================

   Batch side of the tool: scan a folder, group files into sheets of
   nine, compose the 3x3 page with cut guides, write it with DPI.

=====================================================================*/
#pragma once
#include "models/PhysicalSpec.hpp"

#include <opencv2/core.hpp>
#include <cstddef>
#include <string>
#include <vector>

constexpr std::size_t kCardsPerSheet = 9;
constexpr int kGridColumns = 3;
constexpr int kGridRows = 3;

struct SheetBatches
{
    std::vector<std::vector<std::string>> sheets; // each exactly perSheet paths
    std::vector<std::string> leftover;            // trailing files that do not fill a sheet
};

// Sorted image files (png, jpg, jpeg, bmp, gif, tif, tiff; any case) directly inside dir.
// Throws std::runtime_error if dir is not a readable directory.
std::vector<std::string> listImageFiles(const std::string& dir);

SheetBatches chunkIntoSheets(const std::vector<std::string>& files, std::size_t perSheet = kCardsPerSheet);

// File stem with path-hostile characters collapsed to single underscores; "file" if nothing remains.
std::string sanitizeNameComponent(const std::string& path);

// <first>_to_<last>_sheet_<index>.png
std::string sheetFileName(const std::string& firstPath, const std::string& lastPath, int index);

/**
 * @brief Lays cards out row-major on a white page and draws the cut guides.
 *        Empty Mats leave their cell blank; cards beyond nine are ignored.
 */
cv::Mat composeSheet(const std::vector<cv::Mat>& cards, const PhysicalSpec& spec);

// Renders every path with renderCard and composes the page. False if no card rendered.
bool buildSheet(const std::vector<std::string>& chunk, const PhysicalSpec& spec, cv::Mat& sheet);

// Writes the page; PNG and TIFF outputs carry the DPI as resolution metadata.
bool saveSheet(const cv::Mat& sheet, const std::string& outPath, int dpi);
