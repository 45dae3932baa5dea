// Declares the in-memory frame record store. The store owns all mutable frame
// state; the composition pipeline only ever sees snapshots taken from it.

#pragma once

#include "Types.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace framelab
{
    // 32 lowercase hex characters.
    std::string generateId();

    class FrameStore
    {
    public:
        // Stores the record, assigning an id when it has none, and returns the
        // stored copy.
        Frame add(Frame frame);

        [[nodiscard]] std::optional<Frame> find(const std::string& frameId) const;

        // Throws Error(NotFound).
        [[nodiscard]] Frame get(const std::string& frameId) const;

        // Frames of one video in capture order.
        [[nodiscard]] std::vector<Frame> list(const std::string& videoId) const;
        [[nodiscard]] std::size_t count(const std::string& videoId) const;

        // Each update replaces the field as a whole; concurrent updates of the
        // same frame are last-write-wins.
        void updateFilters(const std::string& frameId, std::vector<FilterSpec> filters);
        void updateAnnotations(const std::string& frameId, std::vector<AnnotationSpec> annotations);
        void updateScale(const std::string& frameId, int scale);
        void updateNote(const std::string& frameId, const std::string& note);
        void updateCategory(const std::string& frameId, const std::string& categoryId);

        // Drops the record and deletes its image file.
        void remove(const std::string& frameId);

        // Drops every record of a video, deleting the image files when asked.
        std::size_t clearVideo(const std::string& videoId, bool deleteFiles);

        // Moves all frames of one category to another; returns how many moved.
        std::size_t reassignCategory(const std::string& fromId, const std::string& toId);

    private:
        template <typename Mutator>
        void mutate(const std::string& frameId, Mutator&& mutator);

        mutable std::mutex mutex_;
        std::vector<Frame> frames_;
    };
}
