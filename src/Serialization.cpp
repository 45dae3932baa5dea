// Implements the JSON mapping with nlohmann::json.

#include "Serialization.hpp"

#include "AnnotationRenderer.hpp"
#include "Error.hpp"

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <limits>
#include <type_traits>

namespace
{
    using framelab::Error;
    using framelab::ErrorKind;
    using framelab::json;

    [[noreturn]] void reject(const std::string& message)
    {
        throw Error(ErrorKind::ValidationError, message);
    }

    template <typename T>
    T readNumber(const json& node, const char* key, T fallback, bool strict)
    {
        const auto it = node.find(key);
        if (it == node.end() || it->is_null())
        {
            return fallback;
        }

        if (!it->is_number())
        {
            if (strict)
            {
                reject(std::string("Field '") + key + "' must be a number.");
            }
            return fallback;
        }

        const double value = it->get<double>();
        if (!std::isfinite(value))
        {
            if (strict)
            {
                reject(std::string("Field '") + key + "' must be finite.");
            }
            return fallback;
        }

        if constexpr (std::is_integral_v<T>)
        {
            // Out-of-range values would wrap when narrowed.
            if (value < static_cast<double>(std::numeric_limits<T>::min()) ||
                value > static_cast<double>(std::numeric_limits<T>::max()))
            {
                if (strict)
                {
                    reject(std::string("Field '") + key + "' is out of range.");
                }
                return fallback;
            }
            return static_cast<T>(std::lround(value));
        }
        else
        {
            return static_cast<T>(value);
        }
    }

    bool readBool(const json& node, const char* key, bool fallback)
    {
        const auto it = node.find(key);
        if (it == node.end() || !it->is_boolean())
        {
            return fallback;
        }
        return it->get<bool>();
    }

    std::string readString(const json& node, const char* key, const std::string& fallback = "")
    {
        const auto it = node.find(key);
        if (it == node.end() || !it->is_string())
        {
            return fallback;
        }
        return it->get<std::string>();
    }

    framelab::Point pointFromJson(const json& node, const char* key)
    {
        const auto it = node.find(key);
        if (it == node.end() || !it->is_array() || it->size() != 2 ||
            !(*it)[0].is_number() || !(*it)[1].is_number())
        {
            reject(std::string("Field '") + key + "' must be an [x, y] pair.");
        }

        const framelab::Point point{(*it)[0].get<double>(), (*it)[1].get<double>()};
        if (!std::isfinite(point.x) || !std::isfinite(point.y))
        {
            reject(std::string("Field '") + key + "' must be finite.");
        }
        return point;
    }

    json pointToJson(const framelab::Point& point)
    {
        return json::array({point.x, point.y});
    }

    framelab::Color colorFromJson(const json& node)
    {
        const auto it = node.find("color");
        if (it == node.end() || !it->is_string())
        {
            reject("Annotation colour must be a \"#rrggbb\" string.");
        }
        return framelab::Serialization::parseColor(it->get<std::string>());
    }

    int hexDigit(char c)
    {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    struct FilterParamsWriter
    {
        json& node;

        void operator()(const framelab::BrightnessContrastParams& params) const
        {
            node["brightness"] = params.brightness;
            node["contrast"] = params.contrast;
        }

        void operator()(const framelab::WhiteBalanceParams&) const
        {
        }

        void operator()(const framelab::ClaheParams& params) const
        {
            node["clipLimit"] = params.clipLimit;
            node["gridSize"] = params.gridSize;
        }
    };

    struct AnnotationWriter
    {
        json operator()(const framelab::ShapeAnnotation& shape) const
        {
            return json{
                {"type", framelab::toString(shape.kind)},
                {"start", pointToJson(shape.start)},
                {"end", pointToJson(shape.end)},
                {"color", framelab::Serialization::formatColor(shape.color)},
                {"thickness", shape.thickness}
            };
        }

        json operator()(const framelab::TextAnnotation& text) const
        {
            return json{
                {"type", "text"},
                {"pos", pointToJson(text.pos)},
                {"text", text.text},
                {"color", framelab::Serialization::formatColor(text.color)},
                {"fontSize", text.fontSize}
            };
        }
    };
}

namespace framelab
{
    namespace Serialization
    {
        Color parseColor(const std::string& hex)
        {
            if (hex.size() != 7 || hex[0] != '#')
            {
                reject("Colour '" + hex + "' is not of the form #rrggbb.");
            }

            int channels[3] = {0, 0, 0};
            for (int i = 0; i < 3; ++i)
            {
                const int hi = hexDigit(hex[1 + 2 * i]);
                const int lo = hexDigit(hex[2 + 2 * i]);
                if (hi < 0 || lo < 0)
                {
                    reject("Colour '" + hex + "' contains a non-hex digit.");
                }
                channels[i] = hi * 16 + lo;
            }

            return Color{static_cast<std::uint8_t>(channels[0]),
                         static_cast<std::uint8_t>(channels[1]),
                         static_cast<std::uint8_t>(channels[2])};
        }

        std::string formatColor(const Color& color)
        {
            char buffer[8];
            std::snprintf(buffer, sizeof(buffer), "#%02x%02x%02x", color.r, color.g, color.b);
            return std::string(buffer);
        }

        FilterSpec filterFromJson(const json& node)
        {
            if (!node.is_object())
            {
                reject("Filter entry must be an object.");
            }

            const std::string name = readString(node, "name");
            FilterSpec filter;
            filter.enabled = readBool(node, "enabled", false);
            filter.label = readString(node, "label", name);
            const bool strict = filter.enabled;

            if (name == toString(FilterType::BrightnessContrast))
            {
                BrightnessContrastParams params;
                params.brightness = readNumber(node, "brightness", params.brightness, strict);
                params.contrast = readNumber(node, "contrast", params.contrast, strict);
                filter.params = params;
            }
            else if (name == toString(FilterType::WhiteBalance))
            {
                filter.params = WhiteBalanceParams{};
            }
            else if (name == toString(FilterType::Clahe))
            {
                ClaheParams params;
                params.clipLimit = readNumber(node, "clipLimit", params.clipLimit, strict);
                params.gridSize = readNumber(node, "gridSize", params.gridSize, strict);
                filter.params = params;
            }
            else
            {
                reject("Unknown filter '" + name + "'.");
            }

            return filter;
        }

        json filterToJson(const FilterSpec& filter)
        {
            json node{
                {"name", toString(filter.type())},
                {"label", filter.label},
                {"enabled", filter.enabled}
            };
            std::visit(FilterParamsWriter{node}, filter.params);
            return node;
        }

        std::vector<FilterSpec> filtersFromJson(const json& node)
        {
            if (!node.is_array())
            {
                reject("Filter stack must be a JSON array.");
            }

            std::vector<FilterSpec> filters;
            filters.reserve(node.size());
            for (const json& entry : node)
            {
                filters.push_back(filterFromJson(entry));
            }
            return filters;
        }

        json filtersToJson(const std::vector<FilterSpec>& filters)
        {
            json node = json::array();
            for (const FilterSpec& filter : filters)
            {
                node.push_back(filterToJson(filter));
            }
            return node;
        }

        AnnotationSpec annotationFromJson(const json& node)
        {
            if (!node.is_object())
            {
                reject("Annotation entry must be an object.");
            }

            const std::string type = readString(node, "type");
            if (type == "line" || type == "rectangle")
            {
                ShapeAnnotation shape;
                shape.kind = type == "line" ? ShapeKind::Line : ShapeKind::Rectangle;
                shape.start = pointFromJson(node, "start");
                shape.end = pointFromJson(node, "end");
                shape.color = colorFromJson(node);
                shape.thickness = readNumber(node, "thickness", shape.thickness, true);
                if (shape.thickness < 1.0)
                {
                    reject("Annotation thickness must be at least 1.");
                }
                if (shape.thickness >= AnnotationRenderer::kMaxStrokeWidth + 0.5)
                {
                    reject("Annotation thickness must be at most " +
                           std::to_string(AnnotationRenderer::kMaxStrokeWidth) + ".");
                }
                return shape;
            }

            if (type == "text")
            {
                TextAnnotation text;
                text.pos = pointFromJson(node, "pos");
                text.text = readString(node, "text");
                text.color = colorFromJson(node);
                text.fontSize = readNumber(node, "fontSize", text.fontSize, true);
                if (text.fontSize <= 0.0)
                {
                    reject("Annotation font size must be positive.");
                }
                if (text.fontSize / AnnotationRenderer::kTextWeightDivisor >=
                    AnnotationRenderer::kMaxStrokeWidth + 0.5)
                {
                    reject("Annotation font size is too large.");
                }
                return text;
            }

            reject("Unknown annotation type '" + type + "'.");
        }

        json annotationToJson(const AnnotationSpec& annotation)
        {
            return std::visit(AnnotationWriter{}, annotation);
        }

        std::vector<AnnotationSpec> annotationsFromJson(const json& node)
        {
            if (!node.is_array())
            {
                reject("Annotations must be a JSON array.");
            }

            std::vector<AnnotationSpec> annotations;
            annotations.reserve(node.size());
            for (const json& entry : node)
            {
                annotations.push_back(annotationFromJson(entry));
            }
            return annotations;
        }

        json annotationsToJson(const std::vector<AnnotationSpec>& annotations)
        {
            json node = json::array();
            for (const AnnotationSpec& annotation : annotations)
            {
                node.push_back(annotationToJson(annotation));
            }
            return node;
        }

        int scaleFromJson(const json& node)
        {
            if (node.is_null())
            {
                return kMinScale;
            }
            if (!node.is_number_integer())
            {
                reject("Scale must be an integer.");
            }

            // Compare before narrowing so large unsigned values cannot wrap into range.
            const double value = node.get<double>();
            if (value < kMinScale || value > kMaxScale)
            {
                reject("Scale must be between 1 and 3.");
            }
            return static_cast<int>(value);
        }

        json frameToJson(const Frame& frame)
        {
            return json{
                {"id", frame.id},
                {"video_id", frame.videoId},
                {"cat_id", frame.categoryId},
                {"ts", frame.timestampSeconds},
                {"path", frame.fileName},
                {"fpath", frame.imagePath},
                {"note", frame.note},
                {"filters", filtersToJson(frame.filters)},
                {"annotations", annotationsToJson(frame.annotations)},
                {"scale", frame.scale}
            };
        }

        Frame frameFromJson(const json& node)
        {
            if (!node.is_object())
            {
                reject("Frame record must be an object.");
            }

            Frame frame;
            frame.id = readString(node, "id");
            frame.videoId = readString(node, "video_id");
            frame.categoryId = readString(node, "cat_id");
            frame.timestampSeconds = readNumber(node, "ts", 0.0, true);
            frame.fileName = readString(node, "path");
            frame.imagePath = readString(node, "fpath");
            frame.note = readString(node, "note");
            frame.filters = filtersFromJson(node.value("filters", json::array()));
            frame.annotations = annotationsFromJson(node.value("annotations", json::array()));
            frame.scale = scaleFromJson(node.value("scale", json()));
            return frame;
        }

        json categoryToJson(const Category& category)
        {
            return json{
                {"id", category.id},
                {"name", category.name},
                {"color", category.color}
            };
        }

        Category categoryFromJson(const json& node)
        {
            if (!node.is_object())
            {
                reject("Category must be an object.");
            }

            Category category;
            category.id = readString(node, "id");
            category.name = readString(node, "name");
            category.color = readString(node, "color", "#4f46e5");
            return category;
        }

        json loadJsonFile(const std::string& path)
        {
            std::ifstream file(path);
            if (!file.is_open())
            {
                throw Error(ErrorKind::NotFound, "Failed to open file: " + path);
            }

            try
            {
                return json::parse(file);
            }
            catch (const json::parse_error& ex)
            {
                throw Error(ErrorKind::ValidationError,
                            "Invalid JSON in " + path + ": " + ex.what());
            }
        }

        void saveJsonFile(const std::string& path, const json& node)
        {
            const std::filesystem::path parent = std::filesystem::path(path).parent_path();
            if (!parent.empty())
            {
                std::error_code ec;
                std::filesystem::create_directories(parent, ec);
                if (ec)
                {
                    throw Error(ErrorKind::Io, "Failed to create directory " + parent.string());
                }
            }

            std::ofstream file(path, std::ios::out | std::ios::trunc);
            if (!file.is_open())
            {
                throw Error(ErrorKind::Io, "Failed to create " + path);
            }

            file << node.dump(2) << '\n';
            if (!file)
            {
                throw Error(ErrorKind::Io, "Failed to write " + path);
            }
        }
    }
}
