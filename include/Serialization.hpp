// Declares the JSON mapping for filter stacks, annotations, frame records and
// categories.

#pragma once

#include "Types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace framelab
{
    using json = nlohmann::json;

    namespace Serialization
    {
        // "#rrggbb" (case-insensitive). Throws Error(ValidationError).
        Color parseColor(const std::string& hex);
        std::string formatColor(const Color& color);

        // Unknown or missing filter names are rejected. Parameters of disabled
        // filters that are missing or malformed fall back to the defaults;
        // malformed parameters of enabled filters are rejected.
        FilterSpec filterFromJson(const json& node);
        json filterToJson(const FilterSpec& filter);
        std::vector<FilterSpec> filtersFromJson(const json& node);
        json filtersToJson(const std::vector<FilterSpec>& filters);

        // Any malformed entry rejects the whole list.
        AnnotationSpec annotationFromJson(const json& node);
        json annotationToJson(const AnnotationSpec& annotation);
        std::vector<AnnotationSpec> annotationsFromJson(const json& node);
        json annotationsToJson(const std::vector<AnnotationSpec>& annotations);

        int scaleFromJson(const json& node);

        json frameToJson(const Frame& frame);
        Frame frameFromJson(const json& node);

        json categoryToJson(const Category& category);
        Category categoryFromJson(const json& node);

        // Reads and parses a JSON file. Throws Error(NotFound | ValidationError).
        json loadJsonFile(const std::string& path);
        void saveJsonFile(const std::string& path, const json& node);
    }
}
