#include <gtest/gtest.h>
#include <neumorph/shadow/light_source.h>

#include <cmath>
#include <limits>

using namespace neumorph::shadow;

namespace {

const LightSource kAllSources[] = {
    LightSource::TopLeft, LightSource::TopRight,
    LightSource::BottomLeft, LightSource::BottomRight,
};

} // namespace

TEST(LightSourceTest, DirectionSignsMatchTable) {
    auto tl = resolve_offsets(LightSource::TopLeft, 6);
    EXPECT_FLOAT_EQ(tl.light.dx, -6.0f);
    EXPECT_FLOAT_EQ(tl.light.dy, -6.0f);

    auto tr = resolve_offsets(LightSource::TopRight, 6);
    EXPECT_FLOAT_EQ(tr.light.dx, 6.0f);
    EXPECT_FLOAT_EQ(tr.light.dy, -6.0f);

    auto bl = resolve_offsets(LightSource::BottomLeft, 6);
    EXPECT_FLOAT_EQ(bl.light.dx, -6.0f);
    EXPECT_FLOAT_EQ(bl.light.dy, 6.0f);

    auto br = resolve_offsets(LightSource::BottomRight, 6);
    EXPECT_FLOAT_EQ(br.light.dx, 6.0f);
    EXPECT_FLOAT_EQ(br.light.dy, 6.0f);
}

TEST(LightSourceTest, DarkOffsetIsNegatedLightOffset) {
    const float elevations[] = {0.25f, 1.0f, 6.0f, 37.5f};
    for (auto source : kAllSources) {
        for (float e : elevations) {
            auto pair = resolve_offsets(source, e);
            EXPECT_EQ(pair.dark, -pair.light);
            EXPECT_FLOAT_EQ(std::fabs(pair.light.dx), e);
            EXPECT_FLOAT_EQ(std::fabs(pair.light.dy), e);
            EXPECT_FLOAT_EQ(pair.light.length(), pair.dark.length());
            EXPECT_FALSE(pair.is_zero());
        }
    }
}

TEST(LightSourceTest, NonPositiveElevationYieldsZeroOffsets) {
    for (auto source : kAllSources) {
        EXPECT_TRUE(resolve_offsets(source, 0).is_zero());
        EXPECT_TRUE(resolve_offsets(source, -4).is_zero());
        EXPECT_TRUE(resolve_offsets(source, std::numeric_limits<float>::quiet_NaN()).is_zero());
    }
}
