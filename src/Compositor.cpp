// Implements the composition pipeline on top of FrameProcessor and
// AnnotationRenderer.

#include "Compositor.hpp"

#include "AnnotationRenderer.hpp"
#include "Error.hpp"
#include "FrameProcessor.hpp"
#include "ImageCodec.hpp"

#include <cmath>
#include <string>

namespace
{
    using framelab::AnnotationRenderer::kMaxCanvasCoordinate;
    using framelab::AnnotationRenderer::kMaxStrokeWidth;
    using framelab::AnnotationRenderer::kTextWeightDivisor;

    bool fitsCanvas(const framelab::Point& point, int scale)
    {
        return std::isfinite(point.x) && std::isfinite(point.y) &&
               std::fabs(point.x * scale) <= kMaxCanvasCoordinate &&
               std::fabs(point.y * scale) <= kMaxCanvasCoordinate;
    }

    [[noreturn]] void rejectAnnotation(std::size_t index, const std::string& reason)
    {
        throw framelab::Error(framelab::ErrorKind::ValidationError,
                              "Annotation " + std::to_string(index) + ": " + reason);
    }

    struct AnnotationValidator
    {
        std::size_t index;
        int scale;

        void operator()(const framelab::ShapeAnnotation& shape) const
        {
            if (!fitsCanvas(shape.start, scale) || !fitsCanvas(shape.end, scale))
            {
                rejectAnnotation(index, "coordinate is not finite or out of range");
            }
            if (!std::isfinite(shape.thickness) || shape.thickness < 1.0)
            {
                rejectAnnotation(index, "thickness must be at least 1");
            }
            if (shape.thickness * scale >= kMaxStrokeWidth + 0.5)
            {
                rejectAnnotation(index, "thickness exceeds " + std::to_string(kMaxStrokeWidth) +
                                        " device pixels at scale " + std::to_string(scale));
            }
        }

        void operator()(const framelab::TextAnnotation& text) const
        {
            if (!fitsCanvas(text.pos, scale))
            {
                rejectAnnotation(index, "coordinate is not finite or out of range");
            }
            if (!std::isfinite(text.fontSize) || text.fontSize <= 0.0)
            {
                rejectAnnotation(index, "font size must be positive");
            }
            if (text.fontSize * scale / kTextWeightDivisor >= kMaxStrokeWidth + 0.5)
            {
                rejectAnnotation(index, "font size too large at scale " + std::to_string(scale));
            }
        }
    };
}

namespace framelab
{
    namespace Compositor
    {
        void validate(const std::vector<AnnotationSpec>& annotations, int scale)
        {
            if (scale < kMinScale || scale > kMaxScale)
            {
                throw Error(ErrorKind::ValidationError,
                            "Scale must be between " + std::to_string(kMinScale) +
                            " and " + std::to_string(kMaxScale) +
                            ", got " + std::to_string(scale));
            }

            for (std::size_t i = 0; i < annotations.size(); ++i)
            {
                std::visit(AnnotationValidator{i, scale}, annotations[i]);
            }
        }

        bool isIdentity(const std::vector<FilterSpec>& filters,
                        const std::vector<AnnotationSpec>& annotations,
                        int scale)
        {
            return scale == 1 && annotations.empty() &&
                   !FrameProcessor::hasEnabledFilter(filters);
        }

        cv::Mat composeImage(const cv::Mat& frameBgr,
                             const std::vector<FilterSpec>& filters,
                             const std::vector<AnnotationSpec>& annotations,
                             int scale)
        {
            validate(annotations, scale);

            const cv::Mat filtered = FrameProcessor::applyFilters(frameBgr, filters);

            // Annotations are drawn on the upscaled canvas rather than upscaled
            // with it, so strokes and glyphs stay sharp.
            cv::Mat canvas = FrameProcessor::rescale(filtered, scale);
            AnnotationRenderer::render(canvas, annotations, scale);
            return canvas;
        }

        std::vector<unsigned char> compose(const std::vector<unsigned char>& frameBytes,
                                           const std::vector<FilterSpec>& filters,
                                           const std::vector<AnnotationSpec>& annotations,
                                           int scale)
        {
            validate(annotations, scale);

            if (isIdentity(filters, annotations, scale))
            {
                return frameBytes;
            }

            const cv::Mat decoded = ImageCodec::decodeImage(frameBytes);
            if (decoded.empty())
            {
                throw Error(ErrorKind::DecodeFailure,
                            "Input bytes are not a decodable image.");
            }

            return ImageCodec::encodePng(composeImage(decoded, filters, annotations, scale));
        }

        std::vector<unsigned char> compose(const RenderRequest& request)
        {
            return compose(request.imageBytes, request.filters,
                           request.annotations, request.scale);
        }
    }
}
