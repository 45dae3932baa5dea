// Implements annotation drawing with OpenCV imgproc primitives.

#include "AnnotationRenderer.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace
{
    using framelab::AnnotationRenderer::strokeWidth;
    using framelab::AnnotationRenderer::textFontScale;
    using framelab::AnnotationRenderer::textWeight;
    using framelab::AnnotationRenderer::toCanvas;
    using framelab::AnnotationRenderer::toScalar;

    void drawShape(cv::Mat& canvas, const framelab::ShapeAnnotation& shape, int scale)
    {
        const cv::Point p1 = toCanvas(shape.start, scale);
        const cv::Point p2 = toCanvas(shape.end, scale);
        const int width = strokeWidth(shape.thickness, scale);

        // Strokes stay aliased: stroke pixels get exactly the requested colour.
        if (shape.kind == framelab::ShapeKind::Rectangle)
        {
            cv::rectangle(canvas, p1, p2, toScalar(shape.color), width, cv::LINE_8);
        }
        else
        {
            cv::line(canvas, p1, p2, toScalar(shape.color), width, cv::LINE_8);
        }
    }

    void drawText(cv::Mat& canvas, const framelab::TextAnnotation& text, int scale)
    {
        if (text.text.empty())
        {
            return;
        }

        const double sizePx = text.fontSize * scale;
        const int weight = textWeight(sizePx);
        cv::putText(canvas, text.text, toCanvas(text.pos, scale),
                    framelab::AnnotationRenderer::kTextFontFace,
                    textFontScale(sizePx, weight),
                    toScalar(text.color), weight, cv::LINE_AA);
    }

    struct AnnotationDispatch
    {
        cv::Mat& canvas;
        int scale;

        void operator()(const framelab::ShapeAnnotation& shape) const
        {
            drawShape(canvas, shape, scale);
        }

        void operator()(const framelab::TextAnnotation& text) const
        {
            drawText(canvas, text, scale);
        }
    };
}

namespace framelab
{
    namespace AnnotationRenderer
    {
        int strokeWidth(double thickness, int scale)
        {
            const long width = std::lround(thickness * scale);
            return static_cast<int>(std::max(1L, width));
        }

        int textWeight(double fontSizePx)
        {
            const long weight = std::lround(fontSizePx / kTextWeightDivisor);
            return static_cast<int>(std::max(1L, weight));
        }

        double textFontScale(double fontSizePx, int weight)
        {
            const int pixelHeight = std::max(1, static_cast<int>(std::lround(fontSizePx)));
            return cv::getFontScaleFromHeight(kTextFontFace, pixelHeight, weight);
        }

        cv::Scalar toScalar(const Color& color)
        {
            return cv::Scalar(color.b, color.g, color.r);
        }

        cv::Point toCanvas(const Point& point, int scale)
        {
            return cv::Point(static_cast<int>(std::lround(point.x * scale)),
                             static_cast<int>(std::lround(point.y * scale)));
        }

        void render(cv::Mat& canvasBgr,
                    const std::vector<AnnotationSpec>& annotations,
                    int scale)
        {
            if (canvasBgr.empty())
            {
                return;
            }

            for (const AnnotationSpec& annotation : annotations)
            {
                std::visit(AnnotationDispatch{canvasBgr, scale}, annotation);
            }
        }
    }
}
