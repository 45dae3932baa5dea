// Implements the display/storage coordinate mapping.

#include "ViewTransform.hpp"

#include "Error.hpp"

#include <algorithm>
#include <cmath>

namespace
{
    void requirePositiveZoom(double zoom)
    {
        if (!std::isfinite(zoom) || zoom <= 0.0)
        {
            throw framelab::Error(framelab::ErrorKind::ValidationError,
                                  "View zoom must be a positive number.");
        }
    }
}

namespace framelab
{
    Point ViewTransform::toStorage(const Point& viewPoint) const
    {
        requirePositiveZoom(zoom);
        return Point{(viewPoint.x - panX) / zoom, (viewPoint.y - panY) / zoom};
    }

    Point ViewTransform::toView(const Point& storagePoint) const
    {
        return Point{storagePoint.x * zoom + panX, storagePoint.y * zoom + panY};
    }

    AnnotationSpec ViewTransform::toStorage(const AnnotationSpec& viewAnnotation) const
    {
        requirePositiveZoom(zoom);

        if (const auto* shape = std::get_if<ShapeAnnotation>(&viewAnnotation))
        {
            ShapeAnnotation stored = *shape;
            stored.start = toStorage(shape->start);
            stored.end = toStorage(shape->end);
            // A one-pixel stroke at high zoom must still be a valid stroke.
            stored.thickness = std::max(1.0, shape->thickness / zoom);
            return stored;
        }

        TextAnnotation stored = std::get<TextAnnotation>(viewAnnotation);
        stored.pos = toStorage(stored.pos);
        stored.fontSize = stored.fontSize / zoom;
        return stored;
    }

    std::vector<AnnotationSpec> ViewTransform::toStorage(
        const std::vector<AnnotationSpec>& viewAnnotations) const
    {
        std::vector<AnnotationSpec> stored;
        stored.reserve(viewAnnotations.size());
        for (const AnnotationSpec& annotation : viewAnnotations)
        {
            stored.push_back(toStorage(annotation));
        }
        return stored;
    }
}
