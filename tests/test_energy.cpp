/*  Carver - Content-aware image resizing
    Author: Stavros Kladis <stavroskladis@hotmail.com>
    Copyright © 2025 Stavros Kladis
*/
/**
 * @file test_energy.cpp
 * @brief Unit tests for the energy functions in image_processing.hpp
 */

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "image_processing.hpp"
#include "test_helpers.hpp"

class SobelEnergyTest : public ::testing::Test {
  protected:
    SobelEnergy sobel_;

    // 6x4 image: columns 0..2 black, columns 3..5 white
    PixelBuffer verticalEdge_;

    // 4x6 image: rows 0..2 black, rows 3..5 white
    PixelBuffer horizontalEdge_;

    void SetUp() override {
        verticalEdge_ = PixelBuffer(6, 4);
        for (int y = 0; y < 4; ++y) {
            for (int x = 3; x < 6; ++x) {
                float *p = verticalEdge_.at(x, y);
                p[0] = p[1] = p[2] = 1.0f;
            }
        }
        horizontalEdge_ = transposeBuffer(verticalEdge_);
    }
};

// ============================================================================
// Full map
// ============================================================================

TEST_F(SobelEnergyTest, DimensionsMatchBuffer) {
    PixelBuffer buffer = makeGradientBuffer(9, 5);
    auto energy = sobel_.compute(buffer);
    ASSERT_NE(energy, nullptr);
    EXPECT_EQ(energy->width, 9);
    EXPECT_EQ(energy->height, 5);
    EXPECT_EQ(energy->values.size(), 45u);
}

TEST_F(SobelEnergyTest, UniformImageHasZeroEnergy) {
    auto energy = sobel_.compute(makeUniformBuffer(8, 8, 0.6f));
    ASSERT_NE(energy, nullptr);
    for (float v : energy->values) {
        EXPECT_NEAR(v, 0.0f, 1e-6f);
    }
}

TEST_F(SobelEnergyTest, EnergyIsNonNegative) {
    auto energy = sobel_.compute(makeNoiseBuffer(16, 12, 3));
    ASSERT_NE(energy, nullptr);
    for (float v : energy->values) {
        EXPECT_GE(v, 0.0f);
    }
}

TEST_F(SobelEnergyTest, VerticalEdge) {
    auto energy = sobel_.compute(verticalEdge_);
    ASSERT_NE(energy, nullptr);

    // A hard black/white step: Gx = 1, Gy = 0 -> sqrt(1 / 2)
    const float edge = 1.0f / std::sqrt(2.0f);
    for (int y = 0; y < 4; ++y) {
        EXPECT_NEAR(energy->at(0, y), 0.0f, 1e-6f);
        EXPECT_NEAR(energy->at(1, y), 0.0f, 1e-6f);
        EXPECT_NEAR(energy->at(2, y), edge, 1e-5f);
        EXPECT_NEAR(energy->at(3, y), edge, 1e-5f);
        EXPECT_NEAR(energy->at(4, y), 0.0f, 1e-6f);
        EXPECT_NEAR(energy->at(5, y), 0.0f, 1e-6f);
    }
}

TEST_F(SobelEnergyTest, HorizontalEdge) {
    auto energy = sobel_.compute(horizontalEdge_);
    ASSERT_NE(energy, nullptr);

    const float edge = 1.0f / std::sqrt(2.0f);
    for (int x = 0; x < 4; ++x) {
        EXPECT_NEAR(energy->at(x, 1), 0.0f, 1e-6f);
        EXPECT_NEAR(energy->at(x, 2), edge, 1e-5f);
        EXPECT_NEAR(energy->at(x, 3), edge, 1e-5f);
        EXPECT_NEAR(energy->at(x, 4), 0.0f, 1e-6f);
    }
}

TEST_F(SobelEnergyTest, GreenWeighsMoreThanBlue) {
    // Same step in a single channel: luminance weighting makes the green edge stronger
    PixelBuffer green(4, 4);
    PixelBuffer blue(4, 4);
    for (int y = 0; y < 4; ++y) {
        for (int x = 2; x < 4; ++x) {
            green.at(x, y)[1] = 1.0f;
            blue.at(x, y)[2] = 1.0f;
        }
    }
    auto green_energy = sobel_.compute(green);
    auto blue_energy = sobel_.compute(blue);
    ASSERT_NE(green_energy, nullptr);
    ASSERT_NE(blue_energy, nullptr);
    EXPECT_GT(green_energy->at(1, 1), blue_energy->at(1, 1));
}

TEST_F(SobelEnergyTest, SingleRowAndSingleColumn) {
    auto row = sobel_.compute(makeNoiseBuffer(7, 1, 5));
    auto column = sobel_.compute(makeNoiseBuffer(1, 7, 5));
    ASSERT_NE(row, nullptr);
    ASSERT_NE(column, nullptr);
    EXPECT_EQ(row->values.size(), 7u);
    EXPECT_EQ(column->values.size(), 7u);
}

TEST_F(SobelEnergyTest, RejectsInvalidBuffer) {
    EXPECT_EQ(sobel_.compute(PixelBuffer()), nullptr);
    EXPECT_EQ(sobel_.compute(PixelBuffer(0, 4)), nullptr);

    PixelBuffer broken(3, 3);
    broken.pixels.resize(5);
    EXPECT_EQ(sobel_.compute(broken), nullptr);
}

// ============================================================================
// Single pixel
// ============================================================================

TEST_F(SobelEnergyTest, ComputeAtAgreesWithCompute) {
    PixelBuffer buffer = makeNoiseBuffer(13, 9, 21);
    auto energy = sobel_.compute(buffer);
    ASSERT_NE(energy, nullptr);

    for (int y = 0; y < buffer.height; ++y) {
        for (int x = 0; x < buffer.width; ++x) {
            EXPECT_NEAR(sobel_.computeAt(buffer, x, y), energy->at(x, y), 1e-5f)
                << "at (" << x << ", " << y << ")";
        }
    }
}

// ============================================================================
// Energy method selection
// ============================================================================

TEST(EnergyMethodTest, Parse) {
    EnergyMethod method = EnergyMethod::Sobel;
    EXPECT_TRUE(parseEnergyMethod("auto", method));
    EXPECT_EQ(method, EnergyMethod::Auto);
    EXPECT_TRUE(parseEnergyMethod("SoBeL", method));
    EXPECT_EQ(method, EnergyMethod::Sobel);

    EXPECT_FALSE(parseEnergyMethod("laplace", method));
    EXPECT_FALSE(parseEnergyMethod("", method));
    EXPECT_EQ(method, EnergyMethod::Sobel);
}

TEST(EnergyMethodTest, AutoResolvesToSobel) {
    auto computer = makeEnergyComputer(EnergyMethod::Auto);
    ASSERT_NE(computer, nullptr);
    EXPECT_STREQ(computer->name(), "sobel");
    EXPECT_STREQ(makeEnergyComputer(EnergyMethod::Sobel)->name(), "sobel");
}

TEST(EnergyMethodTest, Names) {
    EXPECT_STREQ(energyMethodName(EnergyMethod::Auto), "auto");
    EXPECT_STREQ(energyMethodName(EnergyMethod::Sobel), "sobel");
}

// ============================================================================
// Incremental updates
// ============================================================================

TEST(RemoveSeamFromEnergyTest, DropsSeamColumn) {
    EnergyMap map = makeEnergyMap(3, 2, {1, 2, 3,
                                         4, 5, 6});
    ASSERT_TRUE(removeSeamFromEnergy(map, {1, 2}));
    EXPECT_EQ(map.width, 2);
    EXPECT_EQ(map.height, 2);
    EXPECT_EQ(map.values, (std::vector<float>{1, 3, 4, 5}));
}

TEST(RemoveSeamFromEnergyTest, RejectsMismatchedSeam) {
    EnergyMap map = makeEnergyMap(3, 2, {1, 2, 3, 4, 5, 6});
    EXPECT_FALSE(removeSeamFromEnergy(map, {0}));
    EXPECT_FALSE(removeSeamFromEnergy(map, {0, 3}));
    EXPECT_FALSE(removeSeamFromEnergy(map, {-1, 0}));

    // Untouched after failures
    EXPECT_EQ(map.width, 3);
    EXPECT_EQ(map.values.size(), 6u);
}

TEST(UpdateEnergyMapTest, MatchesFullRecompute) {
    SobelEnergy sobel;
    PixelBuffer buffer = makeNoiseBuffer(14, 10, 7);

    // Remove a few seams, patching the map each time, and compare against a fresh map
    auto energy = sobel.compute(buffer);
    ASSERT_NE(energy, nullptr);

    for (int i = 0; i < 4; ++i) {
        Seam seam;
        ASSERT_TRUE(findLowestEnergySeamDP(*energy, seam));

        PixelBuffer next;
        ASSERT_TRUE(removeSeam(buffer, seam.columns, next));
        buffer = std::move(next);

        ASSERT_TRUE(removeSeamFromEnergy(*energy, seam.columns));
        ASSERT_TRUE(updateEnergyMapAroundSeam(*energy, seam.columns, buffer, sobel));

        auto fresh = sobel.compute(buffer);
        ASSERT_NE(fresh, nullptr);
        ASSERT_EQ(energy->width, fresh->width);
        for (size_t k = 0; k < fresh->values.size(); ++k) {
            EXPECT_NEAR(energy->values[k], fresh->values[k], 1e-5f) << "seam " << i << " index " << k;
        }
    }
}

TEST(UpdateEnergyMapTest, RejectsSizeMismatch) {
    SobelEnergy sobel;
    PixelBuffer buffer = makeNoiseBuffer(5, 4, 1);
    EnergyMap map(6, 4);
    EXPECT_FALSE(updateEnergyMapAroundSeam(map, {0, 0, 0, 0}, buffer, sobel));

    EnergyMap sized(5, 4);
    EXPECT_FALSE(updateEnergyMapAroundSeam(sized, {0, 0}, buffer, sobel));
}
