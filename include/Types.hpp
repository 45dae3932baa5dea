// Copyright (c) 2025.
// This header declares shared data structures and enumerations for the frame
// capture, filtering and annotation pipeline.

#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace framelab
{
    // Upscale factors accepted by the rescale stage and persisted per frame.
    constexpr int kMinScale = 1;
    constexpr int kMaxScale = 3;

    // Enumeration describing the available image filters.
    enum class FilterType
    {
        BrightnessContrast = 0,
        WhiteBalance,
        Clahe
    };

    // Parameter bundles for individual filters. Ranges are documented next to
    // each field; values outside them are clamped when the filter runs.
    struct BrightnessContrastParams
    {
        int brightness = 0;    // [-100, 100], added to every channel.
        int contrast = 0;      // [-100, 100], gain of 1 + contrast / 100.
    };

    struct WhiteBalanceParams
    {
    };

    struct ClaheParams
    {
        double clipLimit = 2.0;    // [1, 40]
        int gridSize = 8;          // [2, 16] tiles per axis.
    };

    using FilterParams = std::variant<BrightnessContrastParams,
                                      WhiteBalanceParams,
                                      ClaheParams>;

    // One entry of a frame's filter stack. The position inside the stack is the
    // application order, so reordering is a swap of two entries.
    struct FilterSpec
    {
        bool enabled = false;
        std::string label;
        FilterParams params;

        [[nodiscard]] FilterType type() const
        {
            return static_cast<FilterType>(params.index());
        }
    };

    // 8-bit RGB colour as stored in annotation records.
    struct Color
    {
        std::uint8_t r = 0;
        std::uint8_t g = 0;
        std::uint8_t b = 0;

        bool operator==(const Color& other) const
        {
            return r == other.r && g == other.g && b == other.b;
        }
    };

    // Point in base-frame (scale = 1) pixel space.
    struct Point
    {
        double x = 0.0;
        double y = 0.0;

        bool operator==(const Point& other) const
        {
            return x == other.x && y == other.y;
        }
    };

    enum class ShapeKind
    {
        Line = 0,
        Rectangle
    };

    // Straight segment or axis-aligned rectangle outline between two corners.
    struct ShapeAnnotation
    {
        ShapeKind kind = ShapeKind::Line;
        Point start;
        Point end;
        Color color;
        double thickness = 1.0;    // Base-frame pixels, >= 1.
    };

    struct TextAnnotation
    {
        Point pos;                 // Left end of the baseline.
        std::string text;
        Color color;
        double fontSize = 16.0;    // Base-frame pixels.
    };

    using AnnotationSpec = std::variant<ShapeAnnotation, TextAnnotation>;

    // Everything the composition pipeline needs for one render.
    struct RenderRequest
    {
        std::vector<unsigned char> imageBytes;
        std::vector<FilterSpec> filters;
        std::vector<AnnotationSpec> annotations;
        int scale = 1;
    };

    struct VideoSession
    {
        std::string id;
        std::string sourcePath;
        std::string displayName;
        double frameRate = 30.0;
        double durationSeconds = -1.0;    // Negative when the container does not say.
        int width = 0;
        int height = 0;
    };

    struct Frame
    {
        std::string id;
        std::string videoId;
        double timestampSeconds = 0.0;
        std::string imagePath;
        std::string fileName;
        std::string categoryId;
        std::string note;
        std::vector<FilterSpec> filters;
        std::vector<AnnotationSpec> annotations;
        int scale = 1;
    };

    struct Category
    {
        std::string id;
        std::string name;
        std::string color;
    };

    // Stack attached to every newly captured frame: all three filters present
    // and switched off, brightness/contrast first.
    inline std::vector<FilterSpec> defaultFilterStack()
    {
        return {
            FilterSpec{false, "Brightness/Contrast", BrightnessContrastParams{}},
            FilterSpec{false, "CLAHE", ClaheParams{}},
            FilterSpec{false, "White Balance", WhiteBalanceParams{}}
        };
    }

    inline std::string toString(FilterType type)
    {
        switch (type)
        {
            case FilterType::BrightnessContrast: return "brightness_contrast";
            case FilterType::WhiteBalance: return "white_balance";
            case FilterType::Clahe: return "clahe";
        }
        return "unknown";
    }

    inline std::string toString(ShapeKind kind)
    {
        switch (kind)
        {
            case ShapeKind::Line: return "line";
            case ShapeKind::Rectangle: return "rectangle";
        }
        return "unknown";
    }
}
