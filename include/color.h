#pragma once

#include <cmath>
#include <cstdio>
#include <string>

// RGBA color, channels 0-255 except alpha in [0, 1]
struct Color {
    float r, g, b, a;

    // CSS rgba() notation, as consumed by web renderers
    std::string toCss() const {
        char buf[48];
        std::snprintf(buf, sizeof(buf), "rgba(%d, %d, %d, %.2f)", static_cast<int>(r),
                      static_cast<int>(g), static_cast<int>(b), a);
        return buf;
    }
};

// Bubble fill classes by sign and magnitude of the selected change
enum class BubbleTone { StrongGain, MildGain, MildLoss, StrongLoss };

// |change| at or above this is drawn in the saturated variant
constexpr double STRONG_CHANGE_PERCENT = 1.5;

inline BubbleTone classifyChange(double change) {
    bool strong = std::abs(change) >= STRONG_CHANGE_PERCENT;
    if (change >= 0.0) {
        return strong ? BubbleTone::StrongGain : BubbleTone::MildGain;
    }
    return strong ? BubbleTone::StrongLoss : BubbleTone::MildLoss;
}

inline Color toneColor(BubbleTone tone) {
    switch (tone) {
    case BubbleTone::StrongGain:
        return {180, 229, 13, 0.95f};
    case BubbleTone::MildGain:
        return {120, 200, 65, 0.9f};
    case BubbleTone::MildLoss:
        return {215, 108, 130, 0.9f};
    case BubbleTone::StrongLoss:
        return {255, 0, 0, 0.95f};
    }
    return {120, 200, 65, 0.9f};
}
