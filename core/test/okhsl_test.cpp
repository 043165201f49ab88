#include "test_utils.hpp"

#include "lightness.hpp"

using tinge::test::VectorIsNear;

namespace {
    struct OkhslCase {
        tinge::SRGB srgb;
        tinge::Okhsl okhsl;
    };

    class OkhslReference : public testing::TestWithParam<OkhslCase> {
    };

    TEST_P(OkhslReference, fromSrgb) {
        const auto& param = GetParam();
        EXPECT_TRUE(VectorIsNear(tinge::convert<tinge::Okhsl>(param.srgb), param.okhsl, 1e-3f));
    }

    TEST_P(OkhslReference, toSrgb) {
        const auto& param = GetParam();
        EXPECT_TRUE(VectorIsNear(tinge::convert<tinge::SRGB>(param.okhsl), param.srgb, 1e-3f));
    }

    INSTANTIATE_TEST_SUITE_P(Okhsl, OkhslReference, testing::Values(
        OkhslCase{tinge::colors::red, {0.0812052f, 1.f, 0.568085f}},
        OkhslCase{tinge::colors::blue, {0.73348f, 1.f, 0.36657f}},
        OkhslCase{tinge::colors::white, {0.f, 0.f, 1.f}},
        OkhslCase{tinge::colors::black, {0.f, 0.f, 0.f}},
        OkhslCase{{0.5f, 0.5f, 0.5f}, {0.f, 0.f, 0.53376f}}
    ));

    TEST(Okhsl, toOklab) {
        EXPECT_TRUE(VectorIsNear(tinge::okhsl_to_oklab(tinge::Okhsl{0.f, 0.8f, 0.8f}),
                tinge::Oklab{0.8281324f, 0.0918761f, 0.f}, 1e-4f));
    }

    TEST(Okhsl, extremeLightnessIgnoresHueAndSaturation) {
        EXPECT_TRUE(VectorIsNear(tinge::okhsl_to_oklab(tinge::Okhsl{0.3f, 0.7f, 1.f}), tinge::Oklab{1.f, 0.f, 0.f}, 0.f));
        EXPECT_TRUE(VectorIsNear(tinge::okhsl_to_oklab(tinge::Okhsl{0.3f, 0.7f, 0.f}), tinge::Oklab{0.f, 0.f, 0.f}, 0.f));
    }

    TEST(Okhsl, zeroSaturationIsGray) {
        const auto lab = tinge::okhsl_to_oklab(tinge::Okhsl{0.6f, 0.f, 0.4f});
        EXPECT_TRUE(VectorIsNear(lab, tinge::Oklab{tinge::toe_inv(0.4f), 0.f, 0.f}, 1e-6f));
    }

    TEST(Okhsl, grayIsAchromatic) {
        for (int i = 0; i <= 10; i++) {
            const auto v = static_cast<float>(i) / 10;
            const auto hsl = tinge::convert<tinge::Okhsl>(tinge::SRGB{v, v, v});
            EXPECT_EQ(hsl.x, 0.f);
            EXPECT_EQ(hsl.y, 0.f);
            EXPECT_TRUE(VectorIsNear(tinge::convert<tinge::SRGB>(hsl), tinge::SRGB{v, v, v}, 1e-4f));
        }
    }

    TEST(Okhsl, roundTrip) {
        for (const auto& srgb : tinge::test::srgb_grid(11)) {
            const auto hsl = tinge::convert<tinge::Okhsl>(srgb);
            EXPECT_TRUE(VectorIsNear(tinge::convert<tinge::SRGB>(hsl), srgb, 1e-4f));
        }
    }

    TEST(Okhsl, staysInGamut) {
        for (int h = 0; h < 36; h++) {
            for (int s = 0; s <= 20; s++) {
                for (int l = 0; l <= 20; l++) {
                    const tinge::Okhsl hsl{static_cast<float>(h) / 36, static_cast<float>(s) / 20, static_cast<float>(l) / 20};
                    const auto rgb = tinge::convert<tinge::LinearRGB>(hsl);
                    for (int i = 0; i < 3; i++) {
                        EXPECT_GE(rgb[i], -1e-3f) << h << ' ' << s << ' ' << l;
                        EXPECT_LE(rgb[i], 1 + 1e-3f) << h << ' ' << s << ' ' << l;
                    }
                }
            }
        }
    }

    TEST(Okhsl, saturationIncreasesWithChroma) {
        const auto hue = glm::vec2{0.f, 1.f};
        auto previous = 0.f;
        for (int i = 1; i <= 10; i++) {
            const auto c = 0.01f * static_cast<float>(i);
            const auto s = tinge::oklab_to_okhsl(tinge::Oklab{0.6f, c * hue}).y;
            EXPECT_GT(s, previous);
            previous = s;
        }
    }
}
