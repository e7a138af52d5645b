// Shared card rendering implementation
#include "card_render.hpp"
#include "border_crop.hpp"
#include "frame_classifier/frame_classifier.hpp"
#include "util/ImageOps.hpp"

#include <opencv2/opencv.hpp>
#include <filesystem>
#include <iostream>

namespace
{
    inline CropRect toCropRect(const cv::Rect& r) { return { r.x, r.y, r.width, r.height }; }

    // Crop by frame type and resize to the card size
    cv::Mat cropForType(const cv::Mat& img, const PhysicalSpec& spec, const cv::Size& target, RenderReport& r)
    {
        CropPlan plan;
        if (r.frameType == FrameType::Borderless)
        {
            plan = planBottomTrim(img.size(), spec.fullArtBottomCropPx);
            if (plan.path == CropPath::Untrimmed)
                std::cout << "[renderCard] full art: resizing as-is" << std::endl;
            else
                std::cout << "[renderCard] full art: trimming " << spec.fullArtBottomCropPx
                          << "px from bottom" << std::endl;
        }
        else
        {
            cv::Rect content = resolveContentExtents(img, r.frameType, spec, r.contentFound, r.sideScan);
            plan = planBorderCrop(img.size(), content, spec);
            std::cout << "[renderCard] " << toString(r.frameType) << ": content " << content
                      << " -> crop " << plan.rect << std::endl;
        }
        cv::Mat sized = applyCropPlan(img, plan, target);
        r.cropPath = plan.path;
        r.crop = toCropRect(plan.rect);
        r.preResizeWidth = plan.rect.width;
        r.preResizeHeight = plan.rect.height;
        return sized;
    }
}

bool renderCardMat(const cv::Mat& src, const PhysicalSpec& spec, cv::Mat& card, RenderReport* report)
{
    RenderReport local;
    RenderReport& r = report ? *report : local;
    r = RenderReport{};

    const cv::Size target(spec.cardWidthPx, spec.cardHeightPx);
    if (target.width <= 0 || target.height <= 0)
    {
        std::cerr << "[renderCard] ERROR: invalid card size " << target << "\n";
        return false;
    }
    if (src.empty())
    {
        std::cerr << "[renderCard] ERROR: empty source image\n";
        return false;
    }

    try
    {
        cv::Mat img = util::toCanonical(src);

        if (spec.forceStandard)
        {
            r.frameType = FrameType::Standard;
            r.forcedStandard = true;
            std::cout << "[renderCard] override: treating card as standard" << std::endl;
        }
        else
        {
            r.frameType = classifyFrame(img, spec.blackThreshold, spec.edgeCheckWidthPx);
            std::cout << "[renderCard] detected card type: " << toString(r.frameType) << std::endl;
        }

        cv::Mat sized = cropForType(img, spec, target, r);
        sized = util::adjustBrightness(sized, spec.brightness);
        sized = util::adjustSaturation(sized, spec.saturation);

        if (sized.size() != target)
        {
            std::cerr << "[renderCard] ERROR: card is " << sized.size() << ", expected " << target << "\n";
            return false;
        }
        card = sized;
        return true;
    }
    catch (const cv::Exception& e)
    {
        std::cerr << "[renderCard] ERROR: " << e.what() << "\n";
    }
    catch (const std::exception& e)
    {
        std::cerr << "[renderCard] ERROR: " << e.what() << "\n";
    }
    return false;
}

bool renderCard(const std::string& inPath, const PhysicalSpec& spec, cv::Mat& card, RenderReport* report)
{
    const std::string name = std::filesystem::path(inPath).filename().string();
    try
    {
        if (!std::filesystem::exists(inPath))
        {
            std::cerr << "[renderCard] ERROR: image file not found: " << inPath << "\n";
            return false;
        }
        cv::Mat img = cv::imread(inPath, cv::IMREAD_UNCHANGED);
        if (img.empty())
        {
            std::cerr << "[renderCard] ERROR: cannot decode \"" << inPath << "\"\n";
            return false;
        }
        std::cout << "[renderCard] processing " << name << " (" << img.cols << "x" << img.rows << ")" << std::endl;

        if (!renderCardMat(img, spec, card, report)) return false;
        std::cout << "[renderCard] finished " << name << " -> " << card.cols << "x" << card.rows << std::endl;
        return true;
    }
    catch (const cv::Exception& e)
    {
        std::cerr << "[renderCard] ERROR: processing \"" << inPath << "\": " << e.what() << "\n";
    }
    catch (const std::exception& e)
    {
        std::cerr << "[renderCard] ERROR: processing \"" << inPath << "\": " << e.what() << "\n";
    }
    return false;
}
