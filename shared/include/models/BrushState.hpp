/**
 * @file BrushState.hpp
 * Session-wide brush preference. Survives frame changes; only the adjust helpers mutate it.
 */
#pragma once

#include <algorithm>
#include "models/LabelSettings.hpp"
#include "models/ToolMode.hpp"

struct BrushState
{
    int radius {3};
    ToolMode mode {ToolMode::Draw};

    BrushState() = default;
    explicit BrushState(const LabelSettings& s)
        : radius(std::clamp(s.brushDefault, s.brushMin, std::max(s.brushMin, s.brushMax))) {}

    // Returns true if the radius actually changed
    bool adjust(int delta, const LabelSettings& s)
    {
        int next = std::clamp(radius + delta, s.brushMin, std::max(s.brushMin, s.brushMax));
        if (next == radius) return false;
        radius = next;
        return true;
    }
};
