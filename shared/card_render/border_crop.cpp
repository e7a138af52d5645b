#include "border_crop.hpp"
#include "util/ImageOps.hpp"

#include <opencv2/opencv.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace
{
    // Target border width expressed in source pixels
    inline double backProject(int borderPx, double scale)
    {
        if (std::abs(scale) <= 1e-6) return 0.0;
        return borderPx / scale;
    }

    inline CropPlan wholePixelPlan(const cv::Rect& r, CropPath path)
    {
        return { r, cv::Rect2d(r.x, r.y, r.width, r.height), path };
    }
}

cv::Rect resolveContentExtents(const cv::Mat& img, FrameType type, const PhysicalSpec& spec,
                               bool& contentFound, SideScan& scan)
{
    scan = SideScan::NotApplicable;
    cv::Rect box;
    contentFound = util::findContentBounds(img, spec.blackThreshold, box);
    if (!contentFound)
    {
        std::cerr << "[resolveContentExtents] WARNING: no content found, using full image\n";
        box = cv::Rect(0, 0, img.cols, img.rows);
        if (type == FrameType::ExtendedArt) scan = SideScan::NoContentBox;
        return box;
    }
    if (type != FrameType::ExtendedArt) return box;

    int sampleY = box.y + spec.extendedArtScanOffsetPx;
    if (sampleY < 0 || sampleY >= img.rows)
    {
        std::cerr << "[resolveContentExtents] WARNING: scan row y=" << sampleY
                  << " outside image height " << img.rows << ", using overall content box\n";
        scan = SideScan::OutOfBoundsFallback;
        return box;
    }

    int startX, endX;
    if (!util::findRowExtent(img, sampleY, spec.blackThreshold, startX, endX))
    {
        std::cerr << "[resolveContentExtents] WARNING: no side content at y=" << sampleY
                  << ", using overall content box\n";
        scan = SideScan::RowEmptyFallback;
        return box;
    }

    std::cout << "[resolveContentExtents] extended art: side content at y=" << sampleY
              << " from x=" << startX << " to x=" << endX << std::endl;
    scan = SideScan::RowExtent;
    box.x = startX;
    box.width = endX - startX + 1;
    return box;
}

CropPlan planBorderCrop(const cv::Size& imgSize, const cv::Rect& content, const PhysicalSpec& spec)
{
    if (content.width <= 0 || content.height <= 0)
    {
        std::cerr << "[planBorderCrop] WARNING: content box " << content
                  << " has no area, using full image\n";
        return wholePixelPlan(cv::Rect(0, 0, imgSize.width, imgSize.height), CropPath::FullImageFallback);
    }

    int artW = std::max(1, spec.cardWidthPx - spec.borderLeftPx - spec.borderRightPx);
    int artH = std::max(1, spec.cardHeightPx - spec.borderTopPx - spec.borderBottomPx);
    double scaleW = static_cast<double>(artW) / content.width;
    double scaleH = static_cast<double>(artH) / content.height;

    double x0 = std::max(0.0, content.x - backProject(spec.borderLeftPx, scaleW));
    double y0 = std::max(0.0, content.y - backProject(spec.borderTopPx, scaleH));
    double x1 = std::min<double>(imgSize.width, content.x + content.width + backProject(spec.borderRightPx, scaleW));
    double y1 = std::min<double>(imgSize.height, content.y + content.height + backProject(spec.borderBottomPx, scaleH));

    if (x1 > x0 && y1 > y0)
    {
        const int ix0 = static_cast<int>(std::floor(x0));
        const int iy0 = static_cast<int>(std::floor(y0));
        const int ix1 = static_cast<int>(std::ceil(x1));
        const int iy1 = static_cast<int>(std::ceil(y1));
        return { cv::Rect(ix0, iy0, ix1 - ix0, iy1 - iy0), cv::Rect2d(x0, y0, x1 - x0, y1 - y0),
                 CropPath::Proportional };
    }

    std::cerr << "[planBorderCrop] WARNING: proportional crop (" << x0 << "," << y0 << ","
              << x1 << "," << y1 << ") is invalid\n";
    return planContentFallback(imgSize, content);
}

CropPlan planContentFallback(const cv::Size& imgSize, const cv::Rect& content)
{
    const cv::Rect full(0, 0, imgSize.width, imgSize.height);
    if (content.width > 0 && content.height > 0 && (content & full) == content)
    {
        std::cerr << "[planContentFallback] falling back to content box " << content << "\n";
        return wholePixelPlan(content, CropPath::ContentBoxFallback);
    }
    std::cerr << "[planContentFallback] falling back to full image\n";
    return wholePixelPlan(full, CropPath::FullImageFallback);
}

CropPlan planBottomTrim(const cv::Size& imgSize, int trimPx)
{
    if (trimPx <= 0)
        return wholePixelPlan(cv::Rect(0, 0, imgSize.width, imgSize.height), CropPath::Untrimmed);

    if (trimPx >= imgSize.height)
    {
        std::cerr << "[planBottomTrim] WARNING: trim of " << trimPx << "px meets or exceeds image height "
                  << imgSize.height << "px, cropping to 1px\n";
        return wholePixelPlan(cv::Rect(0, 0, imgSize.width, 1), CropPath::BottomTrimClamped);
    }
    return wholePixelPlan(cv::Rect(0, 0, imgSize.width, imgSize.height - trimPx), CropPath::BottomTrim);
}

cv::Mat applyCropPlan(const cv::Mat& img, CropPlan& plan, const cv::Size& target)
{
    try
    {
        if (plan.path == CropPath::Proportional)
            return util::cropResizeExact(img, plan.exact, target);
        return util::resizeTo(img(plan.rect), target);
    }
    catch (const cv::Exception& e)
    {
        std::cerr << "[applyCropPlan] WARNING: crop failed (" << e.what() << "), resizing original\n";
    }
    catch (const std::invalid_argument& e)
    {
        std::cerr << "[applyCropPlan] WARNING: crop failed (" << e.what() << "), resizing original\n";
    }
    plan = wholePixelPlan(cv::Rect(0, 0, img.cols, img.rows), CropPath::OriginalResizeFallback);
    return util::resizeTo(img, target);
}
