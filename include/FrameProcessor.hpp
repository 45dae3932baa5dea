// Declares CPU-side filter and rescale utilities built on top of OpenCV.

#pragma once

#include "Types.hpp"

#include <opencv2/core.hpp>

#include <optional>
#include <vector>

namespace framelab
{
    namespace FrameProcessor
    {
        // Applies a single filter regardless of its enabled flag and returns a
        // new frame in BGR format. Parameters are clamped to their ranges.
        cv::Mat applyFilter(const cv::Mat& frameBgr, const FilterParams& params);

        // Runs the enabled entries of the stack in order, each one consuming the
        // output of the previous one. Disabled entries are skipped untouched.
        cv::Mat applyFilters(const cv::Mat& frameBgr,
                             const std::vector<FilterSpec>& filters);

        // Byte-level variant: decodes, filters and re-encodes as PNG. Returns
        // std::nullopt when the input cannot be decoded as an image.
        std::optional<std::vector<unsigned char>> applyFilters(
            const std::vector<unsigned char>& imageBytes,
            const std::vector<FilterSpec>& filters);

        // Resamples to scale x the input size with a Lanczos kernel. Scale 1
        // returns an unresampled copy.
        cv::Mat rescale(const cv::Mat& frameBgr, int scale);

        [[nodiscard]] bool hasEnabledFilter(const std::vector<FilterSpec>& filters);
    }
}
