#include "test_utils.hpp"

using tinge::test::VectorIsNear;

namespace palette {
    // A client color type that only knows how to reach the hubs
    struct Gray {
        float value;
    };

    tinge::SRGB to_srgb(const Gray& gray) {
        return tinge::SRGB{gray.value, gray.value, gray.value};
    }

    tinge::LinearRGB to_linear_rgb(const Gray& gray) {
        return tinge::srgb_to_linear_rgb(to_srgb(gray));
    }

    tinge::Oklab to_oklab(const Gray& gray) {
        return tinge::linear_rgb_to_oklab(to_linear_rgb(gray));
    }
}

namespace {
    static_assert(tinge::Color<tinge::SRGB>);
    static_assert(tinge::Color<tinge::HSV>);
    static_assert(tinge::Color<palette::Gray>);
    static_assert(!tinge::Color<float>);

    TEST(Convert, clientType) {
        const palette::Gray gray{0.5f};
        EXPECT_TRUE(VectorIsNear(tinge::convert<tinge::LinearRGB>(gray), tinge::LinearRGB{0.21404114f, 0.21404114f, 0.21404114f}, 1e-6f));
        EXPECT_TRUE(VectorIsNear(tinge::convert<tinge::HSL>(gray), tinge::HSL{0.f, 0.f, 0.5f}, 1e-6f));
        EXPECT_TRUE(VectorIsNear(tinge::convert<tinge::Okhsl>(gray), tinge::Okhsl{0.f, 0.f, 0.53376f}, 1e-4f));
    }

    TEST(Convert, identity) {
        const tinge::Okhsv hsv{0.3f, 0.4f, 0.5f};
        EXPECT_EQ(tinge::convert<tinge::Okhsv>(hsv), hsv);
    }

    TEST(Convert, acrossFamilies) {
        EXPECT_TRUE(VectorIsNear(tinge::convert<tinge::HSV>(tinge::Okhsl{0.0812052f, 1.f, 0.568085f}),
                tinge::HSV{0.f, 1.f, 1.f}, 1e-3f));
        EXPECT_TRUE(VectorIsNear(tinge::convert<tinge::Oklab>(tinge::HSL{0.f, 1.f, 0.5f}),
                tinge::Oklab{0.627955f, 0.224863f, 0.125846f}, 1e-4f));
        EXPECT_TRUE(VectorIsNear(tinge::convert<tinge::SRGB>(tinge::LinearRGB{1.f, 1.f, 1.f}), tinge::colors::white, 1e-6f));
    }

    class AnyColorSpace : public testing::TestWithParam<tinge::ColorSpace> {
    };

    TEST_P(AnyColorSpace, convertsToRequestedSpace) {
        const tinge::AnyColor color = tinge::SRGB{0.2f, 0.6f, 0.4f};
        const auto converted = tinge::convert(color, GetParam());
        EXPECT_EQ(tinge::color_space_of(converted), GetParam());

        const auto back = tinge::convert(converted, tinge::ColorSpace::srgb);
        EXPECT_TRUE(VectorIsNear(std::get<tinge::SRGB>(back), std::get<tinge::SRGB>(color), 1e-4f));
    }

    TEST_P(AnyColorSpace, makeColorKeepsComponents) {
        const auto color = tinge::make_color(GetParam(), {0.1f, 0.2f, 0.3f});
        EXPECT_EQ(tinge::color_space_of(color), GetParam());
        const auto components = std::visit([](const auto& value) { return tinge::to_array(value); }, color);
        EXPECT_EQ(components, (std::array<float, 3>{0.1f, 0.2f, 0.3f}));
    }

    TEST_P(AnyColorSpace, nameLooksUpSpace) {
        const auto name = tinge::color_space_name(GetParam());
        ASSERT_FALSE(name.empty());
        EXPECT_EQ(tinge::color_space_by_name.at(std::string{name}), GetParam());
    }

    INSTANTIATE_TEST_SUITE_P(Convert, AnyColorSpace, testing::Values(
        tinge::ColorSpace::srgb,
        tinge::ColorSpace::linear_rgb,
        tinge::ColorSpace::oklab,
        tinge::ColorSpace::okhsl,
        tinge::ColorSpace::okhsv,
        tinge::ColorSpace::hsl,
        tinge::ColorSpace::hsv
    ));

    TEST(Convert, linearRgbIsNamedRgb) {
        EXPECT_EQ(tinge::color_space_name(tinge::ColorSpace::linear_rgb), "rgb");
    }

    TEST(Convert, namedColorsAreSrgb) {
        EXPECT_EQ(tinge::color_by_name.size(), 8u);
        EXPECT_EQ(tinge::color_by_name.at("aqua"), tinge::colors::aqua);
    }
}
