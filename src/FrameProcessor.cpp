// Implements CPU-based filter and rescale routines using OpenCV.

#include "FrameProcessor.hpp"

#include "Error.hpp"
#include "ImageCodec.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <string>

namespace
{
    constexpr int kMinLevel = -100;
    constexpr int kMaxLevel = 100;
    constexpr double kMinClipLimit = 1.0;
    constexpr double kMaxClipLimit = 40.0;
    constexpr int kMinGridSize = 2;
    constexpr int kMaxGridSize = 16;

    // Weight of the chroma shift applied by the grey-world correction.
    constexpr double kWhiteBalanceGain = 1.1;

    cv::Mat toBgr(const cv::Mat& frame)
    {
        if (frame.type() == CV_8UC3)
        {
            return frame;
        }

        cv::Mat bgr;
        switch (frame.channels())
        {
            case 1:
                cv::cvtColor(frame, bgr, cv::COLOR_GRAY2BGR);
                break;
            case 4:
                cv::cvtColor(frame, bgr, cv::COLOR_BGRA2BGR);
                break;
            default:
                bgr = frame;
                break;
        }

        if (bgr.depth() != CV_8U)
        {
            bgr.convertTo(bgr, CV_8U);
        }
        return bgr;
    }

    cv::Mat applyBrightnessContrast(const cv::Mat& frameBgr,
                                    const framelab::BrightnessContrastParams& params)
    {
        const int contrast = std::clamp(params.contrast, kMinLevel, kMaxLevel);
        const int brightness = std::clamp(params.brightness, kMinLevel, kMaxLevel);

        const double alpha = 1.0 + contrast / 100.0;
        const double beta = static_cast<double>(brightness);

        // convertTo saturates to [0, 255] after scaling and offsetting.
        cv::Mat result;
        frameBgr.convertTo(result, CV_8U, alpha, beta);
        return result;
    }

    cv::Mat applyWhiteBalance(const cv::Mat& frameBgr)
    {
        cv::Mat lab;
        cv::cvtColor(frameBgr, lab, cv::COLOR_BGR2Lab);

        std::vector<cv::Mat> channels;
        cv::split(lab, channels);

        const double avgA = cv::mean(channels[1])[0];
        const double avgB = cv::mean(channels[2])[0];

        // Shift each pixel's chroma toward neutral in proportion to its
        // lightness so that shadows are barely touched.
        cv::Mat lightness;
        channels[0].convertTo(lightness, CV_32F, 1.0 / 255.0);

        cv::Mat a, b;
        channels[1].convertTo(a, CV_32F);
        channels[2].convertTo(b, CV_32F);

        a -= lightness * static_cast<float>((avgA - 128.0) * kWhiteBalanceGain);
        b -= lightness * static_cast<float>((avgB - 128.0) * kWhiteBalanceGain);

        a.convertTo(channels[1], CV_8U);
        b.convertTo(channels[2], CV_8U);

        cv::merge(channels, lab);

        cv::Mat result;
        cv::cvtColor(lab, result, cv::COLOR_Lab2BGR);
        return result;
    }

    cv::Mat applyClahe(const cv::Mat& frameBgr, const framelab::ClaheParams& params)
    {
        const double clipLimit = std::clamp(params.clipLimit, kMinClipLimit, kMaxClipLimit);
        const int gridSize = std::clamp(params.gridSize, kMinGridSize, kMaxGridSize);

        cv::Mat lab;
        cv::cvtColor(frameBgr, lab, cv::COLOR_BGR2Lab);

        std::vector<cv::Mat> channels;
        cv::split(lab, channels);

        cv::Ptr<cv::CLAHE> clahe = cv::createCLAHE(clipLimit, cv::Size(gridSize, gridSize));
        cv::Mat equalised;
        clahe->apply(channels[0], equalised);
        channels[0] = equalised;

        cv::merge(channels, lab);

        cv::Mat result;
        cv::cvtColor(lab, result, cv::COLOR_Lab2BGR);
        return result;
    }

    struct FilterDispatch
    {
        const cv::Mat& frameBgr;

        cv::Mat operator()(const framelab::BrightnessContrastParams& params) const
        {
            return applyBrightnessContrast(frameBgr, params);
        }

        cv::Mat operator()(const framelab::WhiteBalanceParams&) const
        {
            return applyWhiteBalance(frameBgr);
        }

        cv::Mat operator()(const framelab::ClaheParams& params) const
        {
            return applyClahe(frameBgr, params);
        }
    };
}

namespace framelab
{
    namespace FrameProcessor
    {
        cv::Mat applyFilter(const cv::Mat& frameBgr, const FilterParams& params)
        {
            if (frameBgr.empty())
            {
                return cv::Mat();
            }
            return std::visit(FilterDispatch{toBgr(frameBgr)}, params);
        }

        cv::Mat applyFilters(const cv::Mat& frameBgr,
                             const std::vector<FilterSpec>& filters)
        {
            if (frameBgr.empty())
            {
                return cv::Mat();
            }

            cv::Mat current = toBgr(frameBgr).clone();
            for (const FilterSpec& filter : filters)
            {
                if (!filter.enabled)
                {
                    continue;
                }
                current = applyFilter(current, filter.params);
            }
            return current;
        }

        std::optional<std::vector<unsigned char>> applyFilters(
            const std::vector<unsigned char>& imageBytes,
            const std::vector<FilterSpec>& filters)
        {
            const cv::Mat decoded = ImageCodec::decodeImage(imageBytes);
            if (decoded.empty())
            {
                return std::nullopt;
            }
            return ImageCodec::encodePng(applyFilters(decoded, filters));
        }

        cv::Mat rescale(const cv::Mat& frameBgr, int scale)
        {
            if (scale < kMinScale)
            {
                throw Error(ErrorKind::ValidationError,
                            "Scale must be at least 1, got " + std::to_string(scale));
            }

            if (scale == 1 || frameBgr.empty())
            {
                return frameBgr.clone();
            }

            cv::Mat result;
            cv::resize(frameBgr, result,
                       cv::Size(frameBgr.cols * scale, frameBgr.rows * scale),
                       0.0, 0.0, cv::INTER_LANCZOS4);
            return result;
        }

        bool hasEnabledFilter(const std::vector<FilterSpec>& filters)
        {
            return std::any_of(filters.begin(), filters.end(),
                               [](const FilterSpec& filter) { return filter.enabled; });
        }
    }
}
