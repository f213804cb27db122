#include <gtest/gtest.h>
#include <neumorph/shadow/presets.h>
#include <neumorph/shadow/style_resolver.h>

#include <limits>
#include <variant>

using namespace neumorph::shadow;
using neumorph::core::DiagnosticEmitter;
using neumorph::core::Severity;

static const Color kWhite = {255, 255, 255, 255};
static const Color kSlate = {168, 181, 199, 255};

// --- Construction ---

TEST(ShadowStyleTest, DiscreteFieldsAreKept) {
    auto style = resolve_style(kWhite, kSlate, 6, Pressed{Oval{}}, LightSource::BottomRight);
    EXPECT_EQ(style.light_color(), kWhite);
    EXPECT_EQ(style.dark_color(), kSlate);
    EXPECT_FLOAT_EQ(style.elevation(), 6.0f);
    EXPECT_EQ(style.variant(), ShapeVariant::Pressed);
    EXPECT_TRUE(std::holds_alternative<Oval>(style.corner()));
    EXPECT_EQ(style.light_source(), LightSource::BottomRight);
}

TEST(ShadowStyleTest, BundleMatchesDiscreteFields) {
    StyleBundle bundle{kWhite, kSlate, 4, Flat{RoundedCorner{8}}, LightSource::TopRight};
    auto from_bundle = resolve_style(bundle);
    auto direct = resolve_style(kWhite, kSlate, 4, Flat{RoundedCorner{8}}, LightSource::TopRight);
    EXPECT_EQ(from_bundle, direct);
    EXPECT_NE(from_bundle,
              resolve_style(kWhite, kSlate, 4, Pressed{RoundedCorner{8}}, LightSource::TopRight));
}

TEST(ShadowStyleTest, NonFiniteElevationBecomesZero) {
    auto style = resolve_style(kWhite, kSlate, std::numeric_limits<float>::infinity(),
                               Flat{Oval{}}, LightSource::TopLeft);
    EXPECT_FLOAT_EQ(style.elevation(), 0.0f);
}

TEST(ShadowStyleTest, MakeShapeSelectsVariant) {
    EXPECT_EQ(shape_variant(make_shape(ShapeVariant::Flat, Oval{})), ShapeVariant::Flat);
    EXPECT_EQ(shape_variant(make_shape(ShapeVariant::Pressed, RoundedCorner{3})),
              ShapeVariant::Pressed);
    auto corner = corner_style(make_shape(ShapeVariant::Pressed, RoundedCorner{3}));
    ASSERT_TRUE(std::holds_alternative<RoundedCorner>(corner));
    EXPECT_FLOAT_EQ(std::get<RoundedCorner>(corner).radius, 3.0f);
}

// --- Raw external fields ---

TEST(StyleResolverTest, RawFieldsResolveKnownCodes) {
    RawStyleFields raw;
    raw.light_argb = 0xFFFFFFFF;
    raw.dark_argb = 0xFFA8B5C7;
    raw.elevation = 6;
    raw.shape_variant = 1;
    raw.corner_style = 1;
    raw.light_source = 2;

    DiagnosticEmitter diagnostics;
    auto style = resolve_style(raw, &diagnostics);
    EXPECT_EQ(style.variant(), ShapeVariant::Pressed);
    EXPECT_TRUE(std::holds_alternative<Oval>(style.corner()));
    EXPECT_EQ(style.light_source(), LightSource::BottomLeft);
    EXPECT_EQ(style.dark_color(), kSlate);
    EXPECT_EQ(diagnostics.size(), 0u);
}

TEST(StyleResolverTest, UnknownShapeFallsBackToFlatSquareCorners) {
    RawStyleFields raw;
    raw.elevation = 6;
    raw.shape_variant = 7;
    raw.corner_style = 1;
    raw.corner_radius = 12;

    DiagnosticEmitter diagnostics;
    auto style = resolve_style(raw, &diagnostics);
    EXPECT_EQ(style.variant(), ShapeVariant::Flat);
    ASSERT_TRUE(std::holds_alternative<RoundedCorner>(style.corner()));
    EXPECT_FLOAT_EQ(std::get<RoundedCorner>(style.corner()).radius, 0.0f);
    ASSERT_EQ(diagnostics.size(), 1u);
    EXPECT_EQ(diagnostics.events()[0].severity, Severity::Warning);
    EXPECT_EQ(diagnostics.events()[0].stage, neumorph::core::Stage::ResolveStyle);
    EXPECT_EQ(diagnostics.events()[0].draw_id, 0u);
}

TEST(StyleResolverTest, UnknownCornerFallsBackEvenForPressed) {
    RawStyleFields raw;
    raw.shape_variant = 1;
    raw.corner_style = -3;
    DiagnosticEmitter diagnostics;
    auto style = resolve_style(raw, &diagnostics);
    EXPECT_EQ(style.variant(), ShapeVariant::Flat);
    EXPECT_EQ(diagnostics.events_by_severity(Severity::Warning).size(), 1u);
}

TEST(StyleResolverTest, UnknownLightSourceFallsBackToTopLeft) {
    RawStyleFields raw;
    raw.light_source = 12;
    DiagnosticEmitter diagnostics;
    auto style = resolve_style(raw, &diagnostics);
    EXPECT_EQ(style.light_source(), LightSource::TopLeft);
    EXPECT_EQ(diagnostics.size(), 1u);

    // Without an emitter the fallback is silent but identical
    EXPECT_EQ(resolve_style(raw), style);
}

// --- Keyword parsing ---

TEST(StyleResolverTest, ParsesKeywords) {
    EXPECT_EQ(parse_light_source(" Top-Left "), LightSource::TopLeft);
    EXPECT_EQ(parse_light_source("bottom-right"), LightSource::BottomRight);
    EXPECT_FALSE(parse_light_source("left-top").has_value());

    EXPECT_EQ(parse_shape_variant("PRESSED"), ShapeVariant::Pressed);
    EXPECT_FALSE(parse_shape_variant("raised").has_value());

    EXPECT_STREQ(light_source_name(LightSource::TopRight), "top-right");
    EXPECT_STREQ(shape_variant_name(ShapeVariant::Flat), "flat");
}

TEST(StyleResolverTest, ParsesCornerStyles) {
    auto oval = parse_corner_style("oval");
    ASSERT_TRUE(oval.has_value());
    EXPECT_TRUE(std::holds_alternative<Oval>(*oval));

    auto rounded = parse_corner_style("rounded 12px");
    ASSERT_TRUE(rounded.has_value());
    EXPECT_FLOAT_EQ(std::get<RoundedCorner>(*rounded).radius, 12.0f);

    auto paren = parse_corner_style("rounded(4.5)");
    ASSERT_TRUE(paren.has_value());
    EXPECT_FLOAT_EQ(std::get<RoundedCorner>(*paren).radius, 4.5f);

    EXPECT_FALSE(parse_corner_style("rounded").has_value());
    EXPECT_FALSE(parse_corner_style("rounded(4").has_value());
    EXPECT_FALSE(parse_corner_style("rounded12").has_value());
    EXPECT_FALSE(parse_corner_style("roundedx 4").has_value());
    EXPECT_TRUE(parse_corner_style("rounded\t12").has_value());
    EXPECT_FALSE(parse_corner_style("square").has_value());
}

TEST(StyleResolverTest, ParsesColors) {
    EXPECT_EQ(parse_color("#fff"), kWhite);
    EXPECT_EQ(parse_color("#A8B5C7"), kSlate);
    EXPECT_EQ(parse_color("#00000066"), (Color{0, 0, 0, 0x66}));
    EXPECT_EQ(parse_color("#0008"), (Color{0, 0, 0, 0x88}));
    EXPECT_EQ(parse_color("white"), kWhite);
    EXPECT_FALSE(parse_color("#12345").has_value());
    EXPECT_FALSE(parse_color("#gg0000").has_value());
    EXPECT_FALSE(parse_color("chartreuse-ish").has_value());
}

TEST(StyleResolverTest, ParsesElevation) {
    EXPECT_EQ(parse_elevation("6"), 6.0f);
    EXPECT_EQ(parse_elevation("6dp"), 6.0f);
    EXPECT_EQ(parse_elevation(" 2.5 px "), 2.5f);
    EXPECT_EQ(parse_elevation("-1"), -1.0f);
    EXPECT_FALSE(parse_elevation("six").has_value());
    EXPECT_FALSE(parse_elevation("6em").has_value());
    EXPECT_FALSE(parse_elevation("").has_value());
}

// --- Declarations ---

TEST(StyleDeclarationsTest, AppliesEveryKeyOverBase) {
    auto base = default_flat_style(Theme::Light);
    auto style = parse_style_declarations(
        "light-color: #eeeeee; dark-color: #00000066; elevation: 10dp;"
        " light-source: bottom-right; shape: pressed; corner: oval;", base);
    ASSERT_TRUE(style.has_value());
    EXPECT_EQ(style->light_color(), (Color{0xEE, 0xEE, 0xEE, 255}));
    EXPECT_EQ(style->dark_color(), (Color{0, 0, 0, 0x66}));
    EXPECT_FLOAT_EQ(style->elevation(), 10.0f);
    EXPECT_EQ(style->light_source(), LightSource::BottomRight);
    EXPECT_EQ(style->variant(), ShapeVariant::Pressed);
    EXPECT_TRUE(std::holds_alternative<Oval>(style->corner()));
}

TEST(StyleDeclarationsTest, UnspecifiedKeysKeepBase) {
    auto base = default_pressed_style(Theme::Dark);
    auto style = parse_style_declarations("elevation: 3", base);
    ASSERT_TRUE(style.has_value());
    EXPECT_FLOAT_EQ(style->elevation(), 3.0f);
    EXPECT_EQ(style->light_color(), base.light_color());
    EXPECT_EQ(style->variant(), ShapeVariant::Pressed);
    EXPECT_EQ(style->corner(), base.corner());

    auto unchanged = parse_style_declarations("  ;; ", base);
    ASSERT_TRUE(unchanged.has_value());
    EXPECT_EQ(*unchanged, base);
}

TEST(StyleDeclarationsTest, RejectsMalformedInput) {
    auto base = default_flat_style(Theme::Light);
    DiagnosticEmitter diagnostics;
    EXPECT_FALSE(parse_style_declarations("glow: 4", base, &diagnostics).has_value());
    EXPECT_FALSE(parse_style_declarations("elevation 4", base, &diagnostics).has_value());
    EXPECT_FALSE(parse_style_declarations("light-color: #zzz", base, &diagnostics).has_value());
    EXPECT_FALSE(parse_style_declarations("shape: flat; corner: hexagon", base,
                                          &diagnostics).has_value());
    EXPECT_EQ(diagnostics.events_by_severity(Severity::Error).size(), 4u);
    EXPECT_EQ(diagnostics.events_at(neumorph::core::Stage::ParseStyle).size(), 4u);
}

// --- Presets ---

TEST(PresetsTest, ThemeColors) {
    EXPECT_EQ(default_light_shadow(Theme::Light).to_argb(), 0xFFFFFFFFu);
    EXPECT_EQ(default_dark_shadow(Theme::Light).to_argb(), 0xFFA8B5C7u);
    EXPECT_EQ(default_light_shadow(Theme::Dark).to_argb(), 0x66494949u);
    EXPECT_EQ(default_dark_shadow(Theme::Dark).to_argb(), 0x66000000u);
}

TEST(PresetsTest, DefaultStyles) {
    auto flat = default_flat_style(Theme::Light);
    EXPECT_EQ(flat.variant(), ShapeVariant::Flat);
    EXPECT_FLOAT_EQ(flat.elevation(), 6.0f);
    EXPECT_EQ(flat.light_source(), LightSource::TopLeft);
    ASSERT_TRUE(std::holds_alternative<RoundedCorner>(flat.corner()));
    EXPECT_FLOAT_EQ(std::get<RoundedCorner>(flat.corner()).radius, 12.0f);

    auto pressed = default_pressed_style(Theme::Dark);
    EXPECT_EQ(pressed.variant(), ShapeVariant::Pressed);
    EXPECT_EQ(pressed.dark_color(), default_dark_shadow(Theme::Dark));
}
