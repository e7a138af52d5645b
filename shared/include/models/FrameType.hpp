/**
 * @file FrameType.hpp
 * Frame styles recognised on card artwork. Each one selects a cropping strategy.
 */
#pragma once

enum class FrameType
{
    Standard = 0,     // solid black frame on all sides
    ExtendedArt = 1,  // black top/bottom cap, artwork bleeds to the side edges
    Borderless = 2,   // full-bleed artwork
};

inline const char* toString(FrameType t)
{
    switch (t)
    {
    case FrameType::Standard: return "standard";
    case FrameType::ExtendedArt: return "extended_art";
    case FrameType::Borderless: return "borderless";
    }
    return "unknown";
}
