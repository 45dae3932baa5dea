// Declares the image codec and file helpers used by the composition pipeline.

#pragma once

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace framelab
{
    namespace ImageCodec
    {
        // PNG zlib level used for every encode. Fixed so identical pixels give
        // identical bytes.
        constexpr int kPngCompression = 3;

        // Decodes any format OpenCV understands into a BGR frame. Returns an
        // empty matrix when the bytes are not an image.
        cv::Mat decodeImage(const std::vector<unsigned char>& bytes);

        // Encodes losslessly as PNG. Throws Error(EncodeFailure).
        std::vector<unsigned char> encodePng(const cv::Mat& frameBgr,
                                             int compression = kPngCompression);

        // Writes a PNG file, creating parent directories as needed.
        void writePng(const std::string& path, const cv::Mat& frameBgr,
                      int compression = kPngCompression);

        std::vector<unsigned char> readFileBytes(const std::string& path);
        void writeFileBytes(const std::string& path,
                            const std::vector<unsigned char>& bytes);
    }
}
