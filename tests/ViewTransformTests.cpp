#include "Error.hpp"
#include "ViewTransform.hpp"

#include <gtest/gtest.h>

using namespace framelab;

TEST(ViewTransformTest, MapsBetweenViewAndStorage)
{
    ViewTransform view;
    view.zoom = 2.0;
    view.panX = 10.0;
    view.panY = 20.0;

    EXPECT_EQ(view.toStorage(Point{30.0, 40.0}), (Point{10.0, 10.0}));
    EXPECT_EQ(view.toView(Point{10.0, 10.0}), (Point{30.0, 40.0}));
}

TEST(ViewTransformTest, ShapeSizesAreDividedByZoom)
{
    ViewTransform view;
    view.zoom = 2.0;

    ShapeAnnotation drawn;
    drawn.kind = ShapeKind::Rectangle;
    drawn.start = {20.0, 20.0};
    drawn.end = {100.0, 80.0};
    drawn.thickness = 4.0;

    const auto stored = std::get<ShapeAnnotation>(view.toStorage(AnnotationSpec{drawn}));
    EXPECT_EQ(stored.start, (Point{10.0, 10.0}));
    EXPECT_EQ(stored.end, (Point{50.0, 40.0}));
    EXPECT_DOUBLE_EQ(stored.thickness, 2.0);
    EXPECT_EQ(stored.kind, ShapeKind::Rectangle);
}

TEST(ViewTransformTest, StoredThicknessNeverDropsBelowOne)
{
    ViewTransform view;
    view.zoom = 4.0;

    ShapeAnnotation drawn;
    drawn.thickness = 1.0;
    const auto stored = std::get<ShapeAnnotation>(view.toStorage(AnnotationSpec{drawn}));
    EXPECT_DOUBLE_EQ(stored.thickness, 1.0);
}

TEST(ViewTransformTest, TextPositionAndSizeAreConverted)
{
    ViewTransform view;
    view.zoom = 2.0;
    view.panX = 4.0;

    TextAnnotation drawn;
    drawn.pos = {24.0, 30.0};
    drawn.text = "offside";
    drawn.fontSize = 32.0;

    const std::vector<AnnotationSpec> stored = view.toStorage(std::vector<AnnotationSpec>{drawn});
    ASSERT_EQ(stored.size(), 1u);
    const auto& text = std::get<TextAnnotation>(stored[0]);
    EXPECT_EQ(text.pos, (Point{10.0, 15.0}));
    EXPECT_DOUBLE_EQ(text.fontSize, 16.0);
    EXPECT_EQ(text.text, "offside");
}

TEST(ViewTransformTest, NonPositiveZoomIsRejected)
{
    ViewTransform view;
    view.zoom = 0.0;
    EXPECT_THROW((void)view.toStorage(Point{1.0, 1.0}), Error);

    view.zoom = -1.0;
    EXPECT_THROW((void)view.toStorage(AnnotationSpec{TextAnnotation{}}), Error);
}
