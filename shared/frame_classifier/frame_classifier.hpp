#pragma once
#include "models/FrameType.hpp"
namespace cv { class Mat; }

// Images shorter than this are always classified as borderless.
constexpr int kMinClassifiableHeight = 20;

struct FrameZones
{
    int topHeight {0};
    int middleTop {0};
    int middleHeight {0};
};

// Row ranges sampled by classifyFrame. Heights never exceed the image height.
FrameZones describeZones(int imageHeight, int edgeWidth);

// Label the frame style from solid left/right margins near the top and at mid-height:
//   top solid + middle solid -> Standard
//   top solid only           -> ExtendedArt
//   otherwise                -> Borderless
FrameType classifyFrame(const cv::Mat& img, int threshold, int edgeWidth);
