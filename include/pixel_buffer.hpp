/*  Carver - Content-aware image resizing
    Author: Stavros Kladis <stavroskladis@hotmail.com>
    Copyright © 2025 Stavros Kladis
*/
#pragma once

#include <cstddef>
#include <vector>

/**
 * @brief Dense RGB image with floating-point samples in [0, 1]
 *
 * Pixels are stored in row-major order, three interleaved channels per pixel:
 * [R1,G1,B1, R2,G2,B2, ...]. The sample for channel c of pixel (x, y) lives at
 * index (y * width + x) * kChannels + c.
 *
 * A buffer is owned by whoever holds it. Every transformation in the carving pipeline
 * (transpose, seam removal) produces a new buffer instead of editing this one.
 */
struct PixelBuffer {
    static constexpr int kChannels = 3;

    int width = 0;
    int height = 0;
    std::vector<float> pixels;

    PixelBuffer() = default;

    // Zero-filled (black) buffer of the given size
    PixelBuffer(int width, int height);

    // True when both dimensions are >= 1 and the sample count matches them
    bool valid() const;

    size_t sampleCount() const {
        return static_cast<size_t>(width) * static_cast<size_t>(height) * kChannels;
    }

    float *at(int x, int y) {
        return pixels.data() + (static_cast<size_t>(y) * width + x) * kChannels;
    }

    const float *at(int x, int y) const {
        return pixels.data() + (static_cast<size_t>(y) * width + x) * kChannels;
    }

    bool operator==(const PixelBuffer &other) const;
    bool operator!=(const PixelBuffer &other) const { return !(*this == other); }
};

/**
 * @brief Returns the transpose of a buffer (rows become columns)
 *
 * Pixel (x, y) of the input ends up at (y, x) of the result, which is height x width.
 * This is a full copy, not a view, so the result never aliases the input.
 *
 * @param buffer Input buffer
 * @return The transposed buffer, or an empty (invalid) buffer if the input is invalid
 */
PixelBuffer transposeBuffer(const PixelBuffer &buffer);
