// Declares the vector annotation overlay drawn onto rescaled frames.

#pragma once

#include "Types.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <vector>

namespace framelab
{
    namespace AnnotationRenderer
    {
        // Text is drawn with cv::FONT_HERSHEY_SIMPLEX. A nominal font size of N
        // device pixels maps to the Hershey scale whose cap-to-baseline height
        // is N pixels, stroked with max(1, round(N / kTextWeightDivisor))
        // pixels. Stored fontSize values depend on this mapping staying fixed.
        constexpr int kTextFontFace = cv::FONT_HERSHEY_SIMPLEX;
        constexpr double kTextWeightDivisor = 15.0;

        // Widest stroke the imgproc drawing calls accept (cv::MAX_THICKNESS).
        constexpr int kMaxStrokeWidth = 32767;

        // Canvas coordinates must stay well inside int range after scaling.
        constexpr double kMaxCanvasCoordinate = 1 << 30;

        // Device stroke width for a base-frame thickness at the given scale:
        // round half away from zero, floored at one pixel.
        [[nodiscard]] int strokeWidth(double thickness, int scale);

        [[nodiscard]] double textFontScale(double fontSizePx, int weight);
        [[nodiscard]] int textWeight(double fontSizePx);

        // BGR scalar for cv drawing calls.
        [[nodiscard]] cv::Scalar toScalar(const Color& color);

        // Maps a base-frame point onto the scaled canvas.
        [[nodiscard]] cv::Point toCanvas(const Point& point, int scale);

        // Draws every annotation in list order onto the canvas, in place.
        void render(cv::Mat& canvasBgr,
                    const std::vector<AnnotationSpec>& annotations,
                    int scale);
    }
}
