#include "Compositor.hpp"
#include "Error.hpp"
#include "TestSupport.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using namespace framelab;

namespace
{
    ErrorKind composeErrorKind(const RenderRequest& request)
    {
        try
        {
            (void)Compositor::compose(request);
        }
        catch (const Error& ex)
        {
            return ex.kind();
        }
        ADD_FAILURE() << "compose did not throw";
        return ErrorKind::Io;
    }

    ShapeAnnotation line(Point start, Point end, double thickness = 1.0)
    {
        ShapeAnnotation shape;
        shape.kind = ShapeKind::Line;
        shape.start = start;
        shape.end = end;
        shape.color = Color{255, 255, 0};
        shape.thickness = thickness;
        return shape;
    }

    FilterSpec brighten(int amount)
    {
        return FilterSpec{true, "Brightness/Contrast", BrightnessContrastParams{amount, 0}};
    }
}

TEST(CompositorTest, IdentityRequestReturnsInputBytes)
{
    const std::vector<unsigned char> png = test::encodeSolid(10, 10, cv::Scalar(1, 2, 3));
    EXPECT_EQ(Compositor::compose(png, defaultFilterStack(), {}, 1), png);
    EXPECT_EQ(Compositor::compose(png, {}, {}, 1), png);
}

TEST(CompositorTest, IdentityRequestDoesNotDecode)
{
    const std::vector<unsigned char> garbage = {0x01, 0x02, 0x03};
    EXPECT_EQ(Compositor::compose(garbage, defaultFilterStack(), {}, 1), garbage);
}

TEST(CompositorTest, UndecodableInputIsADecodeFailure)
{
    RenderRequest request;
    request.imageBytes = {0x01, 0x02, 0x03};
    request.filters = {brighten(10)};
    EXPECT_EQ(composeErrorKind(request), ErrorKind::DecodeFailure);
}

TEST(CompositorTest, ScaleOutsideRangeIsRejected)
{
    RenderRequest request;
    request.imageBytes = test::encodeSolid(4, 4, cv::Scalar::all(0));
    request.scale = 4;
    EXPECT_EQ(composeErrorKind(request), ErrorKind::ValidationError);

    request.scale = 0;
    EXPECT_EQ(composeErrorKind(request), ErrorKind::ValidationError);
}

TEST(CompositorTest, MalformedAnnotationRejectsTheWholeBatch)
{
    RenderRequest request;
    request.imageBytes = test::encodeSolid(4, 4, cv::Scalar::all(0));
    request.annotations = {line({0, 0}, {3, 3}), line({0, 0}, {1, 1}, 0.0)};
    EXPECT_EQ(composeErrorKind(request), ErrorKind::ValidationError);

    request.annotations = {line({0, std::numeric_limits<double>::quiet_NaN()}, {1, 1})};
    EXPECT_EQ(composeErrorKind(request), ErrorKind::ValidationError);

    TextAnnotation text;
    text.text = "x";
    text.fontSize = 0.0;
    request.annotations = {text};
    EXPECT_EQ(composeErrorKind(request), ErrorKind::ValidationError);
}

TEST(CompositorTest, StrokeWiderThanOpenCvAllowsIsRejected)
{
    RenderRequest request;
    request.imageBytes = test::encodeSolid(8, 8, cv::Scalar::all(0));

    ShapeAnnotation box = line({1, 1}, {6, 6}, 40000.0);
    box.kind = ShapeKind::Rectangle;
    request.annotations = {box};
    EXPECT_EQ(composeErrorKind(request), ErrorKind::ValidationError);

    // Would wrap negative as an int and draw a filled rectangle.
    box.thickness = 1e9;
    request.annotations = {box};
    request.scale = 3;
    EXPECT_EQ(composeErrorKind(request), ErrorKind::ValidationError);
}

TEST(CompositorTest, StrokeBoundAppliesAfterScaling)
{
    const std::vector<AnnotationSpec> stored = {line({0, 0}, {1, 1}, 11000.0)};
    EXPECT_NO_THROW(Compositor::validate(stored, 2));
    EXPECT_THROW(Compositor::validate(stored, 3), Error);

    TextAnnotation text;
    text.text = "x";
    text.fontSize = 200000.0;
    EXPECT_NO_THROW(Compositor::validate({text}, 1));
    EXPECT_THROW(Compositor::validate({text}, 3), Error);

    EXPECT_THROW(Compositor::validate({line({0, 0}, {1e12, 1})}, 1), Error);
}

TEST(CompositorTest, ComposeIsIdempotent)
{
    RenderRequest request;
    request.imageBytes = test::encodeSolid(24, 16, cv::Scalar(40, 80, 120));
    request.filters = {brighten(15), FilterSpec{true, "CLAHE", ClaheParams{}}};
    request.annotations = {line({1, 1}, {20, 12}, 2.0)};
    request.scale = 3;

    EXPECT_EQ(Compositor::compose(request), Compositor::compose(request));
}

TEST(CompositorTest, ScaledOutputHasScaledSize)
{
    RenderRequest request;
    request.imageBytes = test::encodeSolid(24, 16, cv::Scalar::all(90));
    request.scale = 2;

    const cv::Mat out = cv::imdecode(Compositor::compose(request), cv::IMREAD_COLOR);
    EXPECT_EQ(out.size(), cv::Size(48, 32));
}

TEST(CompositorTest, FiltersRunBeforeAnnotations)
{
    const cv::Mat frame(20, 20, CV_8UC3, cv::Scalar::all(50));
    const cv::Mat out = Compositor::composeImage(frame, {brighten(100)},
                                                 {line({0, 10}, {19, 10})}, 1);

    // Annotation colour is unaffected by the filter; the background is.
    EXPECT_EQ(out.at<cv::Vec3b>(10, 5), cv::Vec3b(0, 255, 255));
    EXPECT_EQ(out.at<cv::Vec3b>(2, 5), cv::Vec3b(150, 150, 150));
}

TEST(CompositorTest, IsIdentityChecksAllThreeStages)
{
    EXPECT_TRUE(Compositor::isIdentity(defaultFilterStack(), {}, 1));
    EXPECT_FALSE(Compositor::isIdentity({brighten(1)}, {}, 1));
    EXPECT_FALSE(Compositor::isIdentity({}, {line({0, 0}, {1, 1})}, 1));
    EXPECT_FALSE(Compositor::isIdentity({}, {}, 2));
}
