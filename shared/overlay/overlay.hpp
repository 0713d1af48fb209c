/*========================  overlay.hpp  ========================

   Composition of a labeled region over its source frame.
   --------------------------------------------------------------------
   • composeOverlay(): the artifact saved at commit; pixels outside the
     region are copied from the source untouched
   • composeDisplay(): on-screen view = cached overlay + region border
     + live strokes in the outline color
   • drawHud(): one status line with a dark shadow

=====================================================================*/
#pragma once
#include <opencv2/core.hpp>
#include <string>
#include "models/LabelSettings.hpp"

/**
 * @brief Blends the overlay color into `source` wherever `region` is non-zero.
 *
 * output = (1 - a) * source + a * color, with a = overlayAlpha. When featherRadius > 0,
 * a is scaled by a Gaussian-blurred copy of the region that is cut back to the region itself,
 * so the edge fades inward and nothing outside the region changes.
 *
 * @param source  CV_8UC3 frame.
 * @param region  CV_8U mask of the same size; may be empty (no region).
 * @return A new CV_8UC3 image; `source` is never modified.
 */
cv::Mat composeOverlay(const cv::Mat& source, const cv::Mat& region, const LabelSettings& settings);

/**
 * @brief Builds the interactive view from an already composed region overlay.
 *
 * @param regionOverlay  Result of composeOverlay() for the current region.
 * @param region         Current region mask (border is drawn around it).
 * @param strokes        Live stroke buffer, painted in the outline color.
 */
cv::Mat composeDisplay(const cv::Mat& regionOverlay, const cv::Mat& region,
                       const cv::Mat& strokes, const LabelSettings& settings);

// Draws `text` at the top-left with a shadow for readability.
void drawHud(cv::Mat& display, const std::string& text);
