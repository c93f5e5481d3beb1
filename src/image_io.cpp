/*  Carver - Content-aware image resizing
    Author: Stavros Kladis <stavroskladis@hotmail.com>
    Copyright © 2025 Stavros Kladis
*/
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <opencv2/core.hpp>
#include <spdlog/spdlog.h>

#include "image_io.hpp"

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace {

constexpr int kJpegQuality = 95;

std::string lowercaseExtension(const std::string &path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace

PixelBuffer bufferFromBytes(const unsigned char *bytes, int width, int height) {
    if (!bytes || width <= 0 || height <= 0) {
        return PixelBuffer();
    }

    PixelBuffer buffer(width, height);

    // Both cv::Mat objects are headers over existing memory; convertTo writes straight into
    // the buffer since size and type already match
    cv::Mat src(height, width, CV_8UC3, const_cast<unsigned char *>(bytes));
    cv::Mat dst(height, width, CV_32FC3, buffer.pixels.data());
    src.convertTo(dst, CV_32F, 1.0 / 255.0);

    return buffer;
}

std::vector<unsigned char> bufferToBytes(const PixelBuffer &buffer) {
    if (!buffer.valid()) {
        return {};
    }

    std::vector<unsigned char> bytes(buffer.sampleCount());

    // convertTo saturates: values are rounded and clamped to 0..255
    cv::Mat src(buffer.height, buffer.width, CV_32FC3, const_cast<float *>(buffer.pixels.data()));
    cv::Mat dst(buffer.height, buffer.width, CV_8UC3, bytes.data());
    src.convertTo(dst, CV_8U, 255.0);

    return bytes;
}

bool loadImage(const std::string &path, PixelBuffer &buffer) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        spdlog::error("Input not found: {}", path);
        return false;
    }

    // Force 3 channels: grayscale and RGBA inputs are expanded / flattened to RGB
    int width, height, channels;
    unsigned char *pixels = stbi_load(path.c_str(), &width, &height, &channels, STBI_rgb);

    if (!pixels) {
        spdlog::error("Failed to open image '{}': {}", path, stbi_failure_reason());
        return false;
    }

    buffer = bufferFromBytes(pixels, width, height);
    stbi_image_free(pixels);

    spdlog::debug("Loaded {} ({}x{}, {} channels in file)", path, width, height, channels);
    return buffer.valid();
}

bool saveImage(const std::string &path, const PixelBuffer &buffer) {
    if (!buffer.valid()) {
        spdlog::error("Refusing to save an empty image to {}", path);
        return false;
    }

    const std::string ext = lowercaseExtension(path);
    if (ext != ".png" && ext != ".jpg" && ext != ".jpeg" && ext != ".bmp" && ext != ".tga") {
        spdlog::error("Unsupported output format '{}' (use .png, .jpg, .bmp or .tga)", ext);
        return false;
    }

    const std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            spdlog::error("Cannot create directory {}: {}", parent.string(), ec.message());
            return false;
        }
    }

    const std::vector<unsigned char> bytes = bufferToBytes(buffer);
    const int channels = PixelBuffer::kChannels;

    int ok = 0;
    if (ext == ".png") {
        ok = stbi_write_png(path.c_str(), buffer.width, buffer.height, channels, bytes.data(),
                            buffer.width * channels);
    }
    else if (ext == ".jpg" || ext == ".jpeg") {
        ok = stbi_write_jpg(path.c_str(), buffer.width, buffer.height, channels, bytes.data(),
                            kJpegQuality);
    }
    else if (ext == ".bmp") {
        ok = stbi_write_bmp(path.c_str(), buffer.width, buffer.height, channels, bytes.data());
    }
    else {
        ok = stbi_write_tga(path.c_str(), buffer.width, buffer.height, channels, bytes.data());
    }

    if (!ok) {
        spdlog::error("Failed to write image: {}", path);
        return false;
    }
    return true;
}
