/*========================  card_render.hpp  ========================

   Per-card pipeline: load, classify, crop, resize, enhance.
   --------------------------------------------------------------------
   • declare `renderCard()` so the sheet builder and the CLI can call it
   • every result is exactly spec.cardWidthPx x spec.cardHeightPx, BGRA
   • no exception leaves these functions

=====================================================================*/
#pragma once
#include "models/PhysicalSpec.hpp"
#include "models/RenderReport.hpp"

#include <string>
namespace cv { class Mat; }

/**
 * @brief Renders one card image from a file.
 *
 * @param inPath  Absolute or relative path to the source image.
 * @param spec    Pixel constants for this run.
 * @param card    Receives the finished card (CV_8UC4, card pixel size).
 * @param report  Optional; receives the detection and fallback paths taken.
 * @return false if the file is missing or cannot be decoded.
 */
bool renderCard(const std::string& inPath, const PhysicalSpec& spec, cv::Mat& card,
                RenderReport* report = nullptr);

/**
 * @brief Same pipeline on an image already in memory.
 * @return false only for an empty source or an unusable spec.
 */
bool renderCardMat(const cv::Mat& src, const PhysicalSpec& spec, cv::Mat& card,
                   RenderReport* report = nullptr);
