//
// Copyright (c) 2017, Nicolas Burrus
// This software may be modified and distributed under the terms
// of the BSD license.  See the LICENSE file for details.
//

#include <Dichromat/ColorConversion.h>
#include <Dichromat/MathUtils.h>

#include <DichromatTests/Common.h>

using namespace dm;

UTEST(ColorConversion, TransferFunctionBranches)
{
    // Linear segment near zero.
    ASSERT_NEAR(srgbToLinear(0.0), 0.0, 1e-12);
    ASSERT_NEAR(srgbToLinear(0.04045), 0.04045 / 12.92, 1e-12);
    ASSERT_NEAR(linearToSrgb(0.0), 0.0, 1e-12);
    ASSERT_NEAR(linearToSrgb(0.0031308), 0.0031308 * 12.92, 1e-12);

    // Power segment.
    ASSERT_NEAR(srgbToLinear(1.0), 1.0, 1e-9);
    ASSERT_NEAR(srgbToLinear(0.5), 0.21404114, 1e-7);
    ASSERT_NEAR(linearToSrgb(1.0), 1.0, 1e-9);
    ASSERT_NEAR(linearToSrgb(0.21404114), 0.5, 1e-7);
}

UTEST(ColorConversion, LinearToSrgbClampsPowerBase)
{
    // Above 1 the base is clamped, the result stays finite.
    ASSERT_NEAR(linearToSrgb(4.0), 1.0, 1e-9);

    // Negative values take the linear branch and are left unclamped.
    ASSERT_NEAR(linearToSrgb(-0.1), -1.292, 1e-9);

    PixelEncodedRGB encoded = convertToEncodedRGB (PixelLinearRGB(1.7f, -0.2f, 0.5f));
    ASSERT_TRUE(std::isfinite(encoded.r));
    ASSERT_TRUE(std::isfinite(encoded.g));
    ASSERT_TRUE(std::isfinite(encoded.b));
    ASSERT_NEAR(encoded.r, 1.0, 1e-6);
}

UTEST(ColorConversion, EncodedRoundTrip)
{
    testing::RandomColors colors;
    for (int i = 0; i < 1000; ++i)
    {
        const PixelEncodedRGB x = colors.nextEncoded ();
        const PixelEncodedRGB y = convertToEncodedRGB (convertToLinearRGB (x));
        ASSERT_LE(testing::maxChannelDifference (x, y), 1e-4f);
    }
}

UTEST(ColorConversion, LMSRoundTrip)
{
    testing::RandomColors colors (1234);
    for (int i = 0; i < 1000; ++i)
    {
        const PixelLinearRGB x = colors.nextLinear ();
        const PixelLinearRGB y = convertToLinearRGB (convertToLMS (x));
        ASSERT_LE(testing::maxChannelDifference (x, y), 1e-4f);
    }
}

UTEST(ColorConversion, LMSMatricesAreInverses)
{
    const Matrix3f product = LMSModel::lmsToLinearRgb() * LMSModel::linearRgbToLms();
    ASSERT_LE(maxAbsDifference (product, Matrix3f::identity()), 1e-4f);

    const Matrix3f reverseProduct = LMSModel::linearRgbToLms() * LMSModel::lmsToLinearRgb();
    ASSERT_LE(maxAbsDifference (reverseProduct, Matrix3f::identity()), 1e-4f);
}

UTEST(ColorConversion, PureRedToLMS)
{
    const PixelLMS lms = convertToLMS (PixelLinearRGB(1.f, 0.f, 0.f));
    ASSERT_NEAR(lms.l, 0.31399022, 1e-6);
    ASSERT_NEAR(lms.m, 0.15537241, 1e-6);
    ASSERT_NEAR(lms.s, 0.01775239, 1e-6);
}

UTEST(ColorConversion, WhiteStaysWhiteThroughLMS)
{
    const PixelLinearRGB white = convertToLinearRGB (convertToLMS (PixelLinearRGB(1.f, 1.f, 1.f)));
    ASSERT_NEAR(white.r, 1.0, 1e-4);
    ASSERT_NEAR(white.g, 1.0, 1e-4);
    ASSERT_NEAR(white.b, 1.0, 1e-4);
}

UTEST(ColorConversion, StorageRoundTripWithinOneCode)
{
    int numExact = 0;
    for (int v = 0; v < 256; ++v)
    {
        const PixelSRGB p (uint8_t(v), uint8_t(255 - v), uint8_t(v / 2));
        const PixelSRGB back = convertToSRGB (convertToLinearRGB (p));
        ASSERT_TRUE(testing::pixelsAreSimilar (back, p, 1));
        // Truncation can only lose, never gain.
        for (int c = 0; c < 3; ++c)
            ASSERT_LE(int(back.v[c]), int(p.v[c]));
        if (back == p)
            ++numExact;
    }
    ASSERT_GT(numExact, 240);

    // The ends of the range survive exactly.
    ASSERT_TRUE(convertToSRGB (convertToLinearRGB (PixelSRGB(0, 255, 0))) == PixelSRGB(0, 255, 0));
}

UTEST(ColorConversion, QuantizeClampsAndTruncates)
{
    const PixelSRGB p = quantize (PixelEncodedRGB(-0.5f, 1.5f, 0.5f));
    ASSERT_EQ(int(p.r), 0);
    ASSERT_EQ(int(p.g), 255);
    // 127.5 truncates to 127.
    ASSERT_EQ(int(p.b), 127);

    const PixelSRGB q = quantize (PixelEncodedRGB(0.999f, 0.6f, 1.f));
    ASSERT_EQ(int(q.r), 254);
    ASSERT_EQ(int(q.g), 153);
    ASSERT_EQ(int(q.b), 255);

    const PixelEncodedRGB n = normalize (PixelSRGB(0, 255, 51));
    ASSERT_NEAR(n.r, 0.0, 1e-7);
    ASSERT_NEAR(n.g, 1.0, 1e-7);
    ASSERT_NEAR(n.b, 0.2, 1e-7);
}

UTEST(ColorConversion, ClampToUnit)
{
    const PixelLinearRGB p = clampToUnit (PixelLinearRGB(-0.25f, 0.5f, 1.25f));
    ASSERT_TRUE(p == PixelLinearRGB(0.f, 0.5f, 1.f));
}

UTEST(ColorConversion, ImageOverloadsMatchPixelVersions)
{
    const ImageSRGB input = testing::makeColorSpanImage (32, 4);
    const ImageSRGB inputCopy = input;

    const ImageLinearRGB linear = convertToLinearRGB (normalize (input));
    const ImageLMS lms = convertToLMS (linear);
    const ImageLinearRGB linearBack = convertToLinearRGB (lms);
    const ImageSRGB output = quantize (convertToEncodedRGB (clampToUnit (linearBack)));

    ASSERT_TRUE(haveSameSize (output, input));
    ASSERT_TRUE(input == inputCopy);

    for (int r = 0; r < input.height(); ++r)
    for (int c = 0; c < input.width(); ++c)
    {
        const PixelLinearRGB expected = convertToLinearRGB (input(c, r));
        ASSERT_LE(testing::maxChannelDifference (linear(c, r), expected), 1e-7f);
    }

    ASSERT_TRUE(testing::imagesAreSimilar (input, output, 1));
    ASSERT_TRUE(convertToSRGB (linear) == quantize (convertToEncodedRGB (linear)));
}

UTEST_MAIN();
