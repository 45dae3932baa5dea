// Declares the category list frames are tagged with.

#pragma once

#include "Serialization.hpp"
#include "Types.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace framelab
{
    class CategoryStore
    {
    public:
        static constexpr const char* kDefaultId = "default";
        static constexpr const char* kDefaultName = "Uncategorized";
        static constexpr const char* kDefaultColor = "#6b7280";
        static constexpr const char* kNewCategoryColor = "#4f46e5";

        struct ImportResult
        {
            std::size_t imported = 0;
            std::size_t skipped = 0;
        };

        CategoryStore();

        [[nodiscard]] std::vector<Category> list() const;
        [[nodiscard]] std::optional<Category> find(const std::string& id) const;
        [[nodiscard]] std::optional<Category> findByName(const std::string& name) const;
        [[nodiscard]] Category defaultCategory() const;

        // Names are trimmed and must be non-empty and unique.
        // Throws Error(ValidationError).
        Category add(const std::string& name, const std::string& color = kNewCategoryColor);

        // The default category cannot be renamed or removed.
        Category rename(const std::string& id, const std::string& name);
        void remove(const std::string& id);

        // Back to the default category alone.
        void reset();

        // Merges a JSON list of {name, color}; blank or duplicate names are skipped.
        ImportResult importJson(const json& node);

        // Every category except the default one.
        [[nodiscard]] json exportJson() const;

        // A missing or unreadable file resets the store and writes it back.
        void load(const std::string& path);
        void save(const std::string& path) const;

    private:
        [[nodiscard]] bool nameTaken(const std::string& name, const std::string& exceptId) const;

        mutable std::mutex mutex_;
        std::vector<Category> categories_;
    };
}
