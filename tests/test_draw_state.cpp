#include <gtest/gtest.h>
#include <g2d/draw_state.hpp>

using namespace g2d;

// --- Builders ---

TEST(DrawState, DefaultHasNothingSet) {
    DrawState s;
    EXPECT_FALSE(s.blend.has_value());
    EXPECT_FALSE(s.stencil.has_value());
    EXPECT_FALSE(s.scissor.has_value());
}

TEST(DrawState, NewAlpha) {
    DrawState s = DrawState::NewAlpha();
    ASSERT_TRUE(s.blend.has_value());
    EXPECT_EQ(*s.blend, Blend::Alpha);
    EXPECT_FALSE(s.stencil.has_value());
}

TEST(DrawState, ClipStatesUseFullReference) {
    DrawState clip = DrawState::NewClip();
    EXPECT_FALSE(clip.blend.has_value());
    EXPECT_EQ(*clip.stencil, Stencil::Clip(255));

    DrawState inside = DrawState::NewInside();
    EXPECT_EQ(*inside.blend, Blend::Alpha);
    EXPECT_EQ(*inside.stencil, Stencil::Inside(255));

    EXPECT_EQ(*DrawState::NewOutside().stencil, Stencil::Outside(255));
}

TEST(DrawState, WithersReturnModifiedCopy) {
    DrawState base = DrawState::NewAlpha();
    DrawState s = base.blendMultiply().withStencil(Stencil::Inside(3));
    EXPECT_EQ(*base.blend, Blend::Alpha);
    EXPECT_FALSE(base.stencil.has_value());
    EXPECT_EQ(*s.blend, Blend::Multiply);
    EXPECT_EQ(s.stencil->kind, Stencil::Kind::Inside);
    EXPECT_EQ(s.stencil->value, 3);

    EXPECT_FALSE(s.withBlend(std::nullopt).blend.has_value());
    EXPECT_EQ(*s.blendInvert().blend, Blend::Invert);
    EXPECT_EQ(*s.blendAdd().blend, Blend::Add);
}

// --- Scissor ---

TEST(ResolveScissor, AbsentIsFullExtent) {
    Rect16 r{1, 2, 3, 4};
    EXPECT_EQ(resolveScissor(std::nullopt, &r), DrawError::None);
    EXPECT_EQ(r, kFullScissor);
    EXPECT_EQ(r.w, 65535);
    EXPECT_EQ(r.h, 65535);
}

TEST(ResolveScissor, InRangeIsCopied) {
    Rect16 r;
    EXPECT_EQ(resolveScissor(ScissorRect{10, 20, 300, 400}, &r), DrawError::None);
    EXPECT_EQ(r, (Rect16{10, 20, 300, 400}));
}

TEST(ResolveScissor, BoundsAreInclusive) {
    Rect16 r;
    EXPECT_EQ(resolveScissor(ScissorRect{0, 0, 65535, 65535}, &r), DrawError::None);
    EXPECT_EQ(r, kFullScissor);
}

TEST(ResolveScissor, NegativeIsRejected) {
    Rect16 r{1, 2, 3, 4};
    EXPECT_EQ(resolveScissor(ScissorRect{-1, 0, 10, 10}, &r), DrawError::ScissorOutOfRange);
    EXPECT_EQ(r, (Rect16{1, 2, 3, 4}));
    EXPECT_EQ(resolveScissor(ScissorRect{0, 0, 10, -5}, &r), DrawError::ScissorOutOfRange);
}

TEST(ResolveScissor, TooLargeIsRejected) {
    Rect16 r;
    EXPECT_EQ(resolveScissor(ScissorRect{0, 65536, 10, 10}, &r), DrawError::ScissorOutOfRange);
    EXPECT_EQ(resolveScissor(ScissorRect{0, 0, 70000, 10}, &r), DrawError::ScissorOutOfRange);
}
