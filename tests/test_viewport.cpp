#include <gtest/gtest.h>
#include <g2d/viewport.hpp>

using namespace g2d;

TEST(AbsTransform, MapsCornersToNdc) {
    Matrix2d m = absTransform(200.0, 100.0);
    EXPECT_DOUBLE_EQ(m[0][0], 0.01);
    EXPECT_DOUBLE_EQ(m[0][2], -1.0);
    EXPECT_DOUBLE_EQ(m[1][1], -0.02);
    EXPECT_DOUBLE_EQ(m[1][2], 1.0);

    Context c = Context::NewAbs(200.0, 100.0);
    f32 p[2];
    c.transformPoint(0.0, 0.0, p);
    EXPECT_FLOAT_EQ(p[0], -1.0f);
    EXPECT_FLOAT_EQ(p[1], 1.0f);
    c.transformPoint(200.0, 100.0, p);
    EXPECT_FLOAT_EQ(p[0], 1.0f);
    EXPECT_FLOAT_EQ(p[1], -1.0f);
}

TEST(Context, NewViewportUsesWindowSize) {
    Viewport vp;
    vp.rect[2] = 800;
    vp.rect[3] = 600;
    vp.drawSize[0] = 800;
    vp.drawSize[1] = 600;
    vp.windowSize[0] = 400.0;
    vp.windowSize[1] = 300.0;

    Context c = Context::NewViewport(vp);
    ASSERT_TRUE(c.viewport.has_value());
    EXPECT_EQ(c.viewport->rect[2], 800);
    EXPECT_EQ(c.view, absTransform(400.0, 300.0));
    EXPECT_EQ(c.transform, c.view);
    EXPECT_EQ(*c.drawState.blend, Blend::Alpha);
}

TEST(Context, TransAndScale) {
    Context c = Context::NewAbs(100.0, 100.0).trans(50.0, 50.0).scale(2.0, 2.0);
    f32 p[2];
    c.transformPoint(0.0, 0.0, p);
    EXPECT_FLOAT_EQ(p[0], 0.0f);
    EXPECT_FLOAT_EQ(p[1], 0.0f);
    c.transformPoint(25.0, 0.0, p);
    EXPECT_FLOAT_EQ(p[0], 1.0f);
}

TEST(Multiply, IdentityIsNeutral) {
    Matrix2d m = absTransform(640.0, 480.0);
    EXPECT_EQ(multiply(identity(), m), m);
    EXPECT_EQ(multiply(m, identity()), m);
}
