/*  Carver - Content-aware image resizing
    Author: Stavros Kladis <stavroskladis@hotmail.com>
    Copyright © 2025 Stavros Kladis
*/
#include <opencv2/core.hpp>

#include "pixel_buffer.hpp"

PixelBuffer::PixelBuffer(int width, int height)
    : width(width), height(height),
      pixels(static_cast<size_t>(width > 0 ? width : 0) * (height > 0 ? height : 0) * kChannels,
             0.0f) {}

bool PixelBuffer::valid() const {
    return width >= 1 && height >= 1 && pixels.size() == sampleCount();
}

bool PixelBuffer::operator==(const PixelBuffer &other) const {
    return width == other.width && height == other.height && pixels == other.pixels;
}

PixelBuffer transposeBuffer(const PixelBuffer &buffer) {
    if (!buffer.valid()) {
        return PixelBuffer();
    }

    PixelBuffer result(buffer.height, buffer.width);

    // Wrap both buffers in cv::Mat headers (no copy) and let OpenCV do the transpose.
    // CV_32FC3 -> 3-channels x 32 bit float each, exactly our sample layout.
    cv::Mat src(buffer.height, buffer.width, CV_32FC3, const_cast<float *>(buffer.pixels.data()));
    cv::Mat dst(result.height, result.width, CV_32FC3, result.pixels.data());
    cv::transpose(src, dst);

    return result;
}
