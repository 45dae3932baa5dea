// Implements image decoding and PNG encoding on top of OpenCV imgcodecs.

#include "ImageCodec.hpp"

#include "Error.hpp"

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace
{
    void ensureParentDirectory(const std::string& path)
    {
        const std::filesystem::path parent = std::filesystem::path(path).parent_path();
        if (parent.empty())
        {
            return;
        }

        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            throw framelab::Error(framelab::ErrorKind::Io,
                                  "Failed to create directory " + parent.string() +
                                  ": " + ec.message());
        }
    }
}

namespace framelab
{
    namespace ImageCodec
    {
        cv::Mat decodeImage(const std::vector<unsigned char>& bytes)
        {
            if (bytes.empty())
            {
                return cv::Mat();
            }
            return cv::imdecode(bytes, cv::IMREAD_COLOR);
        }

        std::vector<unsigned char> encodePng(const cv::Mat& frameBgr, int compression)
        {
            if (frameBgr.empty())
            {
                throw Error(ErrorKind::EncodeFailure, "Cannot encode an empty frame.");
            }

            const std::vector<int> params = {
                cv::IMWRITE_PNG_COMPRESSION, std::clamp(compression, 0, 9)
            };

            std::vector<unsigned char> encoded;
            bool ok = false;
            try
            {
                ok = cv::imencode(".png", frameBgr, encoded, params);
            }
            catch (const cv::Exception& ex)
            {
                throw Error(ErrorKind::EncodeFailure, ex.what());
            }

            if (!ok || encoded.empty())
            {
                throw Error(ErrorKind::EncodeFailure, "PNG encoder rejected the frame.");
            }
            return encoded;
        }

        void writePng(const std::string& path, const cv::Mat& frameBgr, int compression)
        {
            writeFileBytes(path, encodePng(frameBgr, compression));
        }

        std::vector<unsigned char> readFileBytes(const std::string& path)
        {
            std::ifstream file(path, std::ios::in | std::ios::binary);
            if (!file.is_open())
            {
                throw Error(ErrorKind::NotFound, "Failed to open file: " + path);
            }

            return std::vector<unsigned char>(std::istreambuf_iterator<char>(file),
                                              std::istreambuf_iterator<char>());
        }

        void writeFileBytes(const std::string& path,
                            const std::vector<unsigned char>& bytes)
        {
            ensureParentDirectory(path);

            std::ofstream file(path, std::ios::out | std::ios::binary | std::ios::trunc);
            if (!file.is_open())
            {
                throw Error(ErrorKind::Io, "Failed to create " + path);
            }

            file.write(reinterpret_cast<const char*>(bytes.data()),
                       static_cast<std::streamsize>(bytes.size()));
            if (!file)
            {
                throw Error(ErrorKind::Io, "Failed to write " + path);
            }
        }
    }
}
