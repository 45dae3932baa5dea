// Declares the display-side zoom/pan transform. Stored annotation geometry is
// always in base-frame space; the view transform is applied on top for display
// and undone before anything is persisted.

#pragma once

#include "Types.hpp"

#include <vector>

namespace framelab
{
    struct ViewTransform
    {
        // Display pixels per base-frame pixel.
        double zoom = 1.0;

        // Display position of the base-frame origin.
        double panX = 0.0;
        double panY = 0.0;

        [[nodiscard]] Point toStorage(const Point& viewPoint) const;
        [[nodiscard]] Point toView(const Point& storagePoint) const;

        // Converts an annotation drawn in display coordinates, sizes included,
        // into base-frame coordinates. Throws Error(ValidationError) for a
        // non-positive zoom.
        [[nodiscard]] AnnotationSpec toStorage(const AnnotationSpec& viewAnnotation) const;
        [[nodiscard]] std::vector<AnnotationSpec> toStorage(
            const std::vector<AnnotationSpec>& viewAnnotations) const;
    };
}
