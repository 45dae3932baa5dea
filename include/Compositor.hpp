// Declares the composition pipeline: filter stack, integer upscale and
// annotation overlay, in that fixed order.

#pragma once

#include "Types.hpp"

#include <opencv2/core.hpp>

#include <vector>

namespace framelab
{
    namespace Compositor
    {
        // Rejects the whole request with Error(ValidationError) when the scale
        // is outside [kMinScale, kMaxScale] or any annotation carries a
        // non-finite or out-of-range coordinate, a thickness below 1, a
        // non-positive font size, or a stroke wider than
        // AnnotationRenderer::kMaxStrokeWidth once scaled.
        void validate(const std::vector<AnnotationSpec>& annotations, int scale);

        // True when rendering would leave the source untouched.
        [[nodiscard]] bool isIdentity(const std::vector<FilterSpec>& filters,
                                      const std::vector<AnnotationSpec>& annotations,
                                      int scale);

        // Pixel-level pipeline without the codec round trip.
        cv::Mat composeImage(const cv::Mat& frameBgr,
                             const std::vector<FilterSpec>& filters,
                             const std::vector<AnnotationSpec>& annotations,
                             int scale);

        // Renders to PNG bytes. Identity requests return the input bytes as-is.
        // Throws Error(DecodeFailure) for undecodable input and
        // Error(EncodeFailure) when the PNG cannot be produced.
        std::vector<unsigned char> compose(const std::vector<unsigned char>& frameBytes,
                                           const std::vector<FilterSpec>& filters,
                                           const std::vector<AnnotationSpec>& annotations,
                                           int scale);

        std::vector<unsigned char> compose(const RenderRequest& request);
    }
}
