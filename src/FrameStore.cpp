// Implements the frame record store.

#include "FrameStore.hpp"

#include "Compositor.hpp"
#include "Error.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <random>

namespace
{
    void deleteImageFile(const std::string& path)
    {
        if (path.empty())
        {
            return;
        }

        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec)
        {
            std::cerr << "[FrameStore] Failed to delete " << path << ": " << ec.message() << std::endl;
        }
    }
}

namespace framelab
{
    std::string generateId()
    {
        static thread_local std::mt19937_64 engine(std::random_device{}());
        std::uniform_int_distribution<int> digit(0, 15);

        static constexpr char kHex[] = "0123456789abcdef";
        std::string id(32, '0');
        for (char& c : id)
        {
            c = kHex[digit(engine)];
        }
        return id;
    }

    Frame FrameStore::add(Frame frame)
    {
        if (frame.id.empty())
        {
            frame.id = generateId();
        }

        std::lock_guard<std::mutex> lock(mutex_);
        const bool duplicate = std::any_of(frames_.begin(), frames_.end(),
                                           [&](const Frame& f) { return f.id == frame.id; });
        if (duplicate)
        {
            throw Error(ErrorKind::ValidationError, "Frame id already exists: " + frame.id);
        }
        frames_.push_back(frame);
        return frame;
    }

    std::optional<Frame> FrameStore::find(const std::string& frameId) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = std::find_if(frames_.begin(), frames_.end(),
                                     [&](const Frame& f) { return f.id == frameId; });
        if (it == frames_.end())
        {
            return std::nullopt;
        }
        return *it;
    }

    Frame FrameStore::get(const std::string& frameId) const
    {
        std::optional<Frame> frame = find(frameId);
        if (!frame)
        {
            throw Error(ErrorKind::NotFound, "Frame not found: " + frameId);
        }
        return *frame;
    }

    std::vector<Frame> FrameStore::list(const std::string& videoId) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Frame> result;
        std::copy_if(frames_.begin(), frames_.end(), std::back_inserter(result),
                     [&](const Frame& f) { return f.videoId == videoId; });
        return result;
    }

    std::size_t FrameStore::count(const std::string& videoId) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<std::size_t>(
            std::count_if(frames_.begin(), frames_.end(),
                          [&](const Frame& f) { return f.videoId == videoId; }));
    }

    template <typename Mutator>
    void FrameStore::mutate(const std::string& frameId, Mutator&& mutator)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = std::find_if(frames_.begin(), frames_.end(),
                                     [&](const Frame& f) { return f.id == frameId; });
        if (it == frames_.end())
        {
            throw Error(ErrorKind::NotFound, "Frame not found: " + frameId);
        }
        mutator(*it);
    }

    void FrameStore::updateFilters(const std::string& frameId, std::vector<FilterSpec> filters)
    {
        mutate(frameId, [&](Frame& frame) { frame.filters = std::move(filters); });
    }

    void FrameStore::updateAnnotations(const std::string& frameId,
                                       std::vector<AnnotationSpec> annotations)
    {
        // Reject malformed geometry here so renders never see a partial batch.
        Compositor::validate(annotations, kMinScale);
        mutate(frameId, [&](Frame& frame) { frame.annotations = std::move(annotations); });
    }

    void FrameStore::updateScale(const std::string& frameId, int scale)
    {
        if (scale < kMinScale || scale > kMaxScale)
        {
            throw Error(ErrorKind::ValidationError,
                        "Scale must be between 1 and 3, got " + std::to_string(scale));
        }
        mutate(frameId, [&](Frame& frame) { frame.scale = scale; });
    }

    void FrameStore::updateNote(const std::string& frameId, const std::string& note)
    {
        mutate(frameId, [&](Frame& frame) { frame.note = note; });
    }

    void FrameStore::updateCategory(const std::string& frameId, const std::string& categoryId)
    {
        mutate(frameId, [&](Frame& frame) { frame.categoryId = categoryId; });
    }

    void FrameStore::remove(const std::string& frameId)
    {
        std::string imagePath;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const auto it = std::find_if(frames_.begin(), frames_.end(),
                                         [&](const Frame& f) { return f.id == frameId; });
            if (it == frames_.end())
            {
                throw Error(ErrorKind::NotFound, "Frame not found: " + frameId);
            }
            imagePath = it->imagePath;
            frames_.erase(it);
        }
        deleteImageFile(imagePath);
    }

    std::size_t FrameStore::clearVideo(const std::string& videoId, bool deleteFiles)
    {
        std::vector<std::string> paths;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const Frame& frame : frames_)
            {
                if (frame.videoId == videoId)
                {
                    paths.push_back(frame.imagePath);
                }
            }
            frames_.erase(std::remove_if(frames_.begin(), frames_.end(),
                                         [&](const Frame& f) { return f.videoId == videoId; }),
                          frames_.end());
        }

        if (deleteFiles)
        {
            for (const std::string& path : paths)
            {
                deleteImageFile(path);
            }
        }
        return paths.size();
    }

    std::size_t FrameStore::reassignCategory(const std::string& fromId, const std::string& toId)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t moved = 0;
        for (Frame& frame : frames_)
        {
            if (frame.categoryId == fromId)
            {
                frame.categoryId = toId;
                ++moved;
            }
        }
        return moved;
    }
}
