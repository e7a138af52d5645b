#include "util/ImageOps.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace util {

cv::Mat toCanonical(const cv::Mat& img)
{
    if (img.empty()) return cv::Mat();

    cv::Mat eight;
    if (img.depth() == CV_8U) eight = img;
    else if (img.depth() == CV_16U) img.convertTo(eight, CV_8U, 1.0 / 257.0);
    else if (img.depth() == CV_32F || img.depth() == CV_64F) img.convertTo(eight, CV_8U, 255.0);
    else img.convertTo(eight, CV_8U);

    cv::Mat out;
    switch (eight.channels())
    {
    case 1: cv::cvtColor(eight, out, cv::COLOR_GRAY2BGRA); break;
    case 3: cv::cvtColor(eight, out, cv::COLOR_BGR2BGRA); break;
    case 4: out = eight.clone(); break;
    default:
        throw std::invalid_argument("toCanonical: unsupported channel count " +
                                    std::to_string(eight.channels()));
    }
    return out;
}

cv::Mat contentMask(const cv::Mat& img, int threshold)
{
    cv::Mat mask;
    if (img.empty()) return mask;
    int thr = std::clamp(threshold, 0, 255);
    if (img.channels() == 1)
        cv::inRange(img, cv::Scalar(0), cv::Scalar(thr), mask);
    else
        cv::inRange(img, cv::Scalar(0, 0, 0, 0), cv::Scalar(thr, thr, thr, 255), mask);
    cv::bitwise_not(mask, mask); // content = 255
    return mask;
}

bool findContentBounds(const cv::Mat& img, int threshold, cv::Rect& box)
{
    if (img.empty() || img.cols == 0 || img.rows == 0) return false;

    cv::Mat mask = contentMask(img, threshold);
    cv::Mat rowsMax, colsMax;
    cv::reduce(mask, rowsMax, 1, cv::REDUCE_MAX, CV_8U); // one value per row
    cv::reduce(mask, colsMax, 0, cv::REDUCE_MAX, CV_8U); // one value per column

    int top = -1, bot = -1;
    for (int r = 0; r < rowsMax.rows; ++r)
        if (rowsMax.at<uchar>(r, 0)) { if (top == -1) top = r; bot = r; }
    if (top == -1) return false;

    int left = -1, right = -1;
    for (int c = 0; c < colsMax.cols; ++c)
        if (colsMax.at<uchar>(0, c)) { if (left == -1) left = c; right = c; }

    box = cv::Rect(left, top, right - left + 1, bot - top + 1);
    return true;
}

bool findRowExtent(const cv::Mat& img, int rowY, int threshold, int& startX, int& endX)
{
    if (rowY < 0 || rowY >= img.rows)
        throw std::out_of_range("findRowExtent: row " + std::to_string(rowY) +
                                " outside image of height " + std::to_string(img.rows));

    cv::Mat mask = contentMask(img.row(rowY), threshold);
    const uchar* m = mask.ptr<uchar>(0);

    startX = -1;
    for (int x = 0; x < mask.cols; ++x)
        if (m[x]) { startX = x; break; }
    if (startX == -1) { endX = -1; return false; }

    endX = startX;
    for (int x = mask.cols - 1; x >= startX; --x)
        if (m[x]) { endX = x; break; }
    return true;
}

bool isSolidLRBorder(const cv::Mat& strip, int edgeWidth, int threshold)
{
    if (strip.empty() || strip.rows == 0 || edgeWidth <= 0) return false;
    if (edgeWidth > strip.cols / 2) return false;

    cv::Mat left = contentMask(strip.colRange(0, edgeWidth), threshold);
    if (cv::countNonZero(left) > 0) return false;

    cv::Mat right = contentMask(strip.colRange(strip.cols - edgeWidth, strip.cols), threshold);
    return cv::countNonZero(right) == 0;
}

cv::Mat resizeTo(const cv::Mat& img, const cv::Size& size)
{
    if (img.size() == size) return img.clone();
    const bool shrinkX = size.width <= img.cols;
    const bool shrinkY = size.height <= img.rows;
    cv::Mat out;
    if (shrinkX == shrinkY)
    {
        cv::resize(img, out, size, 0, 0, shrinkX ? cv::INTER_AREA : cv::INTER_LANCZOS4);
        return out;
    }
    // One axis shrinks, the other grows: filter each axis on its own
    cv::Mat tmp;
    cv::resize(img, tmp, cv::Size(size.width, img.rows), 0, 0, shrinkX ? cv::INTER_AREA : cv::INTER_LANCZOS4);
    cv::resize(tmp, out, size, 0, 0, shrinkY ? cv::INTER_AREA : cv::INTER_LANCZOS4);
    return out;
}

cv::Mat cropResizeExact(const cv::Mat& img, const cv::Rect2d& region, const cv::Size& size)
{
    const cv::Rect bounds(0, 0, img.cols, img.rows);
    const int ix0 = static_cast<int>(std::floor(region.x));
    const int iy0 = static_cast<int>(std::floor(region.y));
    const int ix1 = static_cast<int>(std::ceil(region.x + region.width));
    const int iy1 = static_cast<int>(std::ceil(region.y + region.height));
    const cv::Rect enclosing = cv::Rect(ix0, iy0, ix1 - ix0, iy1 - iy0) & bounds;
    if (enclosing.empty() || region.width <= 0.0 || region.height <= 0.0 || size.area() <= 0)
        throw std::invalid_argument("cropResizeExact: empty region");

    // Bring the enclosing pixels close to output scale with the regular filters
    const double sx = size.width / region.width;
    const double sy = size.height / region.height;
    const cv::Size approx(std::max(1, static_cast<int>(std::lround(enclosing.width * sx))),
                        std::max(1, static_cast<int>(std::lround(enclosing.height * sy))));
    cv::Mat scaled = resizeTo(img(enclosing), approx);

    // Then place the fractional region exactly with a sub-pixel affine map.
    // Inverse map in pixel-centre coordinates: src = k * (dst + 0.5) + offset - 0.5
    const double ax = static_cast<double>(scaled.cols) / enclosing.width;
    const double ay = static_cast<double>(scaled.rows) / enclosing.height;
    const double ox = (region.x - enclosing.x) * ax;
    const double oy = (region.y - enclosing.y) * ay;
    const double kx = region.width * ax / size.width;
    const double ky = region.height * ay / size.height;
    cv::Mat m = (cv::Mat_<double>(2, 3) << kx, 0.0, 0.5 * kx + ox - 0.5,
                                            0.0, ky, 0.5 * ky + oy - 0.5);
    cv::Mat out;
    cv::warpAffine(scaled, out, m, size, cv::INTER_LINEAR | cv::WARP_INVERSE_MAP, cv::BORDER_REPLICATE);
    return out;
}

namespace {
    // Apply fn to the colour planes of a BGRA/BGR image and reassemble with alpha
    template <typename Fn>
    cv::Mat mapColour(const cv::Mat& img, Fn fn)
    {
        std::vector<cv::Mat> planes;
        cv::split(img, planes);
        cv::Mat bgr;
        cv::merge(std::vector<cv::Mat>(planes.begin(), planes.begin() + 3), bgr);
        cv::Mat adjusted = fn(bgr);
        if (planes.size() < 4) return adjusted;
        std::vector<cv::Mat> outPlanes;
        cv::split(adjusted, outPlanes);
        outPlanes.push_back(planes[3]);
        cv::Mat out;
        cv::merge(outPlanes, out);
        return out;
    }
}

cv::Mat adjustBrightness(const cv::Mat& img, double factor)
{
    if (img.empty() || factor == 1.0) return img.clone();
    return mapColour(img, [factor](const cv::Mat& bgr) {
        cv::Mat out; bgr.convertTo(out, CV_8U, factor, 0.0); return out;
    });
}

cv::Mat adjustSaturation(const cv::Mat& img, double factor)
{
    if (img.empty() || factor == 1.0) return img.clone();
    return mapColour(img, [factor](const cv::Mat& bgr) {
        cv::Mat gray, gray3;
        cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
        cv::cvtColor(gray, gray3, cv::COLOR_GRAY2BGR);
        cv::Mat out;
        cv::addWeighted(bgr, factor, gray3, 1.0 - factor, 0.0, out);
        return out;
    });
}

void alphaPaste(cv::Mat& dst, const cv::Mat& src, const cv::Point& origin)
{
    cv::Rect target = cv::Rect(origin, src.size()) & cv::Rect(0, 0, dst.cols, dst.rows);
    if (target.empty()) return;
    cv::Rect from(target.x - origin.x, target.y - origin.y, target.width, target.height);

    cv::Mat s = toCanonical(src(from));
    cv::Mat d = dst(target);
    for (int y = 0; y < target.height; ++y)
    {
        const cv::Vec4b* sp = s.ptr<cv::Vec4b>(y);
        cv::Vec4b* dp = d.ptr<cv::Vec4b>(y);
        for (int x = 0; x < target.width; ++x)
        {
            int a = sp[x][3];
            if (a == 255) { dp[x] = sp[x]; continue; }
            if (a == 0) continue;
            for (int c = 0; c < 3; ++c)
                dp[x][c] = cv::saturate_cast<uchar>((sp[x][c] * a + dp[x][c] * (255 - a) + 127) / 255);
            dp[x][3] = cv::saturate_cast<uchar>(a + dp[x][3] * (255 - a) / 255);
        }
    }
}

}
