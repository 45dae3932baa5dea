// Implements the category list and its JSON persistence.

#include "CategoryStore.hpp"

#include "Error.hpp"
#include "FrameStore.hpp"

#include <algorithm>
#include <iostream>

namespace
{
    std::string trim(const std::string& value)
    {
        const auto first = value.find_first_not_of(" \t\r\n");
        if (first == std::string::npos)
        {
            return std::string();
        }
        const auto last = value.find_last_not_of(" \t\r\n");
        return value.substr(first, last - first + 1);
    }

    framelab::Category makeDefault()
    {
        return framelab::Category{framelab::CategoryStore::kDefaultId,
                                  framelab::CategoryStore::kDefaultName,
                                  framelab::CategoryStore::kDefaultColor};
    }
}

namespace framelab
{
    CategoryStore::CategoryStore()
    {
        categories_.push_back(makeDefault());
    }

    std::vector<Category> CategoryStore::list() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return categories_;
    }

    std::optional<Category> CategoryStore::find(const std::string& id) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = std::find_if(categories_.begin(), categories_.end(),
                                     [&](const Category& c) { return c.id == id; });
        if (it == categories_.end())
        {
            return std::nullopt;
        }
        return *it;
    }

    std::optional<Category> CategoryStore::findByName(const std::string& name) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = std::find_if(categories_.begin(), categories_.end(),
                                     [&](const Category& c) { return c.name == name; });
        if (it == categories_.end())
        {
            return std::nullopt;
        }
        return *it;
    }

    Category CategoryStore::defaultCategory() const
    {
        return makeDefault();
    }

    bool CategoryStore::nameTaken(const std::string& name, const std::string& exceptId) const
    {
        return std::any_of(categories_.begin(), categories_.end(),
                           [&](const Category& c) { return c.name == name && c.id != exceptId; });
    }

    Category CategoryStore::add(const std::string& name, const std::string& color)
    {
        const std::string trimmed = trim(name);
        if (trimmed.empty())
        {
            throw Error(ErrorKind::ValidationError, "Category name cannot be empty.");
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (nameTaken(trimmed, std::string()))
        {
            throw Error(ErrorKind::ValidationError, "Category '" + trimmed + "' already exists.");
        }

        Category category{generateId(), trimmed, color};
        categories_.push_back(category);
        return category;
    }

    Category CategoryStore::rename(const std::string& id, const std::string& name)
    {
        const std::string trimmed = trim(name);
        if (trimmed.empty())
        {
            throw Error(ErrorKind::ValidationError, "Category name cannot be empty.");
        }
        if (id == kDefaultId)
        {
            throw Error(ErrorKind::ValidationError, "The default category cannot be renamed.");
        }

        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = std::find_if(categories_.begin(), categories_.end(),
                                     [&](const Category& c) { return c.id == id; });
        if (it == categories_.end())
        {
            throw Error(ErrorKind::NotFound, "Category not found: " + id);
        }
        if (nameTaken(trimmed, id))
        {
            throw Error(ErrorKind::ValidationError, "Category '" + trimmed + "' already exists.");
        }

        it->name = trimmed;
        return *it;
    }

    void CategoryStore::remove(const std::string& id)
    {
        if (id == kDefaultId)
        {
            throw Error(ErrorKind::ValidationError, "The default category cannot be removed.");
        }

        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = std::find_if(categories_.begin(), categories_.end(),
                                     [&](const Category& c) { return c.id == id; });
        if (it == categories_.end())
        {
            throw Error(ErrorKind::NotFound, "Category not found: " + id);
        }
        categories_.erase(it);
    }

    void CategoryStore::reset()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        categories_.clear();
        categories_.push_back(makeDefault());
    }

    CategoryStore::ImportResult CategoryStore::importJson(const json& node)
    {
        if (!node.is_array())
        {
            throw Error(ErrorKind::ValidationError, "Category import must be a JSON list.");
        }

        ImportResult result;
        std::lock_guard<std::mutex> lock(mutex_);
        for (const json& entry : node)
        {
            const Category incoming = entry.is_object() ? Serialization::categoryFromJson(entry)
                                                        : Category{};
            const std::string name = trim(incoming.name);
            if (name.empty() || nameTaken(name, std::string()))
            {
                ++result.skipped;
                continue;
            }

            categories_.push_back(Category{generateId(), name, incoming.color});
            ++result.imported;
        }
        return result;
    }

    json CategoryStore::exportJson() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        json node = json::array();
        for (const Category& category : categories_)
        {
            if (category.id != kDefaultId)
            {
                node.push_back(Serialization::categoryToJson(category));
            }
        }
        return node;
    }

    void CategoryStore::load(const std::string& path)
    {
        std::vector<Category> loaded;
        try
        {
            const json node = Serialization::loadJsonFile(path);
            if (!node.is_array())
            {
                throw Error(ErrorKind::ValidationError, "Category file must hold a JSON list.");
            }
            for (const json& entry : node)
            {
                Category category = Serialization::categoryFromJson(entry);
                if (category.id.empty())
                {
                    category.id = generateId();
                }
                loaded.push_back(category);
            }
        }
        catch (const Error& ex)
        {
            std::cerr << "[Categories] " << ex.what() << "; starting from defaults." << std::endl;
            reset();
            save(path);
            return;
        }

        const bool hasDefault = std::any_of(loaded.begin(), loaded.end(),
                                            [](const Category& c) { return c.id == kDefaultId; });
        if (!hasDefault)
        {
            loaded.insert(loaded.begin(), makeDefault());
        }

        std::lock_guard<std::mutex> lock(mutex_);
        categories_ = std::move(loaded);
    }

    void CategoryStore::save(const std::string& path) const
    {
        json node = json::array();
        for (const Category& category : list())
        {
            node.push_back(Serialization::categoryToJson(category));
        }
        Serialization::saveJsonFile(path, node);
    }
}
