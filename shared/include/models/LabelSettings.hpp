/**
 * @file LabelSettings.hpp
 * Tunables for the labeling session: brush limits, fill policy, overlay look and output layout.
 */
#pragma once

#include <string>

struct LabelSettings
{
    // Brush
    int brushMin {1};
    int brushMax {20};
    int brushDefault {3};
    int eraseScale {2};          // eraser radius = brush radius * eraseScale

    // Fill
    bool fillIncludesStroke {false}; // add the enclosing stroke to a non-empty region

    // Overlay (BGR)
    int overlayB {250};
    int overlayG {206};
    int overlayR {135};          // light amber
    double overlayAlpha {0.45};
    int featherRadius {7};       // inward edge softening of the saved overlay; 0 = hard edge

    // Live stroke outline (BGR)
    int outlineB {60};
    int outlineG {60};
    int outlineR {255};

    // Commit
    bool allowEmptyCommit {true};

    // Output folders, created next to the selected frames folder
    std::string masksDirName {"masks"};
    std::string overlaysDirName {"overlays"};
};
