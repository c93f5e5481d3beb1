/*  Carver - Content-aware image resizing
    Author: Stavros Kladis <stavroskladis@hotmail.com>
    Copyright © 2025 Stavros Kladis
*/
#include <algorithm> // for std::clamp, std::min, std::max
#include <cctype>    // for std::tolower
#include <chrono>    // for timing
#include <cmath>     // for std::sqrt
#include <cstring>   // for memmove
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

#include "image_processing.hpp"

namespace {

// Luminance weights for the grayscale conversion (ITU-R BT.709)
constexpr float kLumaR = 0.2125f;
constexpr float kLumaG = 0.7154f;
constexpr float kLumaB = 0.0721f;

// The 3x3 Sobel kernels are scaled by 1/4 and the magnitude is divided by sqrt(2), so a
// hard black/white edge has an energy of about 0.707 regardless of the image size.
constexpr float kSobelScale = 0.25f;
const float kMagnitudeScale = 1.0f / std::sqrt(2.0f);

// Sobel kernels for manual computation
const int sobelX[3][3] = {{-1, 0, 1}, {-2, 0, 2}, {-1, 0, 1}};

const int sobelY[3][3] = {{-1, -2, -1}, {0, 0, 0}, {1, 2, 1}};

// Rows narrower than this are filled on the calling thread; for wider rows the work is split
// across the OpenCV thread pool.
constexpr int kParallelMinWidth = 1024;

float rgbToGray(const float *rgb) {
    return kLumaR * rgb[0] + kLumaG * rgb[1] + kLumaB * rgb[2];
}

} // namespace

// OpenCV implementation of the energy map computation
std::unique_ptr<EnergyMap> SobelEnergy::compute(const PixelBuffer &buffer) const {

#ifdef DEBUG
    auto start = std::chrono::high_resolution_clock::now();
#endif

    if (!buffer.valid()) {
        return nullptr;
    }

    // wrap the pixel buffer in a cv::Mat header (no copy)
    // CV_32FC3 -> 3-channels x 32 bit float each
    cv::Mat src(buffer.height, buffer.width, CV_32FC3, const_cast<float *>(buffer.pixels.data()));

    // Convert to 1 channel grayscale: a 1x3 transform matrix is a weighted sum of the channels
    cv::Mat gray;
    cv::transform(src, gray, cv::Matx13f(kLumaR, kLumaG, kLumaB));

    cv::Mat gx; // horizontal gradient (how much brightness changes left-to-right)
    cv::Mat gy; // vertical gradient (how much brightness changes top-to-bottom)

    // BORDER_REFLECT mirrors the outermost pixel (fedcba|abcdef), which for a 3x3 kernel is the
    // same as clamping to the border. computeAt() relies on that.
    cv::Sobel(gray, gx, CV_32F, 1, 0, 3, kSobelScale, 0.0, cv::BORDER_REFLECT);
    cv::Sobel(gray, gy, CV_32F, 0, 1, 3, kSobelScale, 0.0, cv::BORDER_REFLECT);

    // The result map owns the memory; the cv::Mat below is only a header over it
    auto result = std::make_unique<EnergyMap>(buffer.width, buffer.height);
    cv::Mat energy(buffer.height, buffer.width, CV_32FC1, result->values.data());

    // E = sqrt((gx^2 + gy^2) / 2)
    cv::magnitude(gx, gy, energy);
    energy.convertTo(energy, CV_32F, kMagnitudeScale);

#ifdef DEBUG
    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
    spdlog::debug("SobelEnergy::compute: {}x{} image took {} μs", buffer.width, buffer.height,
                  duration.count());
#endif

    return result;
}

// Calculate energy for a single pixel manually for the center pixel (x,y) of the 3x3 neighborhood.
float SobelEnergy::computeAt(const PixelBuffer &buffer, int x, int y) const {
    float gx = 0.0f, gy = 0.0f;

    // ky (rows) outer, kx (columns) inner matches the row-major memory layout
    for (int ky = -1; ky <= 1; ky++) {
        for (int kx = -1; kx <= 1; kx++) {

            // Clamping border pixels to ensure every pixel has a full 3x3 neighborhood
            int nx = std::clamp(x + kx, 0, buffer.width - 1);
            int ny = std::clamp(y + ky, 0, buffer.height - 1);

            float gray = rgbToGray(buffer.at(nx, ny));

            gx += gray * sobelX[ky + 1][kx + 1];
            gy += gray * sobelY[ky + 1][kx + 1];
        }
    }

    gx *= kSobelScale;
    gy *= kSobelScale;

    return std::sqrt(gx * gx + gy * gy) * kMagnitudeScale;
}

std::unique_ptr<EnergyComputer> makeEnergyComputer(EnergyMethod method) {
    switch (method) {
    case EnergyMethod::Auto:
    case EnergyMethod::Sobel:
        return std::make_unique<SobelEnergy>();
    }
    return std::make_unique<SobelEnergy>();
}

bool parseEnergyMethod(const std::string &text, EnergyMethod &method) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "auto") {
        method = EnergyMethod::Auto;
        return true;
    }
    if (lower == "sobel") {
        method = EnergyMethod::Sobel;
        return true;
    }
    return false;
}

const char *energyMethodName(EnergyMethod method) {
    switch (method) {
    case EnergyMethod::Auto:
        return "auto";
    case EnergyMethod::Sobel:
        return "sobel";
    }
    return "unknown";
}

bool removeSeamFromEnergy(EnergyMap &energy, const std::vector<int> &seam) {
    const int old_width = energy.width;
    const int height = energy.height;

    if (old_width <= 1 || height <= 0 || seam.size() != static_cast<size_t>(height)) {
        return false;
    }
    if (energy.values.size() != static_cast<size_t>(old_width) * static_cast<size_t>(height)) {
        return false;
    }
    for (int seam_x : seam) {
        if (seam_x < 0 || seam_x >= old_width) {
            return false;
        }
    }

    const int new_width = old_width - 1;

    // Compact each row from old_width -> new_width, skipping the seam element.
    for (int y = 0; y < height; y++) {
        const int seam_x = seam[y];

        float *src_row = energy.values.data() + static_cast<size_t>(y) * old_width;
        float *dst_row = energy.values.data() + static_cast<size_t>(y) * new_width;

        // Copy left side (0..seam_x-1)
        if (seam_x > 0) {
            memmove(dst_row, src_row, static_cast<size_t>(seam_x) * sizeof(float));
        }

        // Copy right side (seam_x+1..old_width-1) into dst starting at seam_x
        const int right_count = old_width - seam_x - 1;
        if (right_count > 0) {
            memmove(dst_row + seam_x, src_row + seam_x + 1,
                    static_cast<size_t>(right_count) * sizeof(float));
        }
    }

    energy.width = new_width;
    energy.values.resize(static_cast<size_t>(new_width) * static_cast<size_t>(height));
    return true;
}

// Incremental energy map update around removed seam (instead of recalculating the whole energy map)
bool updateEnergyMapAroundSeam(EnergyMap &energy, const std::vector<int> &seam,
                               const PixelBuffer &buffer, const EnergyComputer &computer) {
    const int width = buffer.width;
    const int height = buffer.height;

    if (!buffer.valid() || energy.width != width || energy.height != height ||
        energy.values.size() != static_cast<size_t>(width) * height ||
        seam.size() != static_cast<size_t>(height)) {
        return false;
    }

    for (int y = 0; y < height; y++) {

        // The 3x3 neighbourhood of (x, y) spans rows y-1..y+1, so the seam positions of those
        // rows decide which pixels now see different neighbours
        int lo = seam[y];
        int hi = seam[y];
        for (int r = std::max(0, y - 1); r <= std::min(height - 1, y + 1); r++) {
            lo = std::min(lo, seam[r]);
            hi = std::max(hi, seam[r]);
        }

        for (int x = std::max(0, lo - 1); x <= std::min(width - 1, hi); x++) {
            energy.values[static_cast<size_t>(y) * width + x] = computer.computeAt(buffer, x, y);
        }
    }

    return true;
}

void buildCumulativeEnergy(const EnergyMap &energy, std::vector<float> &cumulative,
                           std::vector<int> &backtrack) {
    const int width = energy.width;
    const int height = energy.height;
    const size_t size = static_cast<size_t>(width) * height;

    cumulative.assign(size, 0.0f);
    backtrack.assign(size, 0);

    // Row 0 of M is row 0 of the energy map
    std::copy(energy.values.begin(), energy.values.begin() + width, cumulative.begin());

    // Every cell of a row depends only on the row above, never on its own row
    for (int y = 1; y < height; y++) {
        const float *prev = cumulative.data() + static_cast<size_t>(y - 1) * width;
        const float *current_energy = energy.values.data() + static_cast<size_t>(y) * width;
        float *current = cumulative.data() + static_cast<size_t>(y) * width;
        int *back = backtrack.data() + static_cast<size_t>(y) * width;

        auto fillColumns = [&](const cv::Range &range) {
            for (int x = range.start; x < range.end; x++) {

                // Start with the straight parent (always exists), then let the left parent win
                // ties and the right parent win only when strictly smaller
                float min_parent_energy = prev[x];
                int offset = 0;

                if (x > 0 && prev[x - 1] <= min_parent_energy) {
                    min_parent_energy = prev[x - 1];
                    offset = -1;
                }
                if (x < width - 1 && prev[x + 1] < min_parent_energy) {
                    min_parent_energy = prev[x + 1];
                    offset = 1;
                }

                current[x] = current_energy[x] + min_parent_energy;
                back[x] = offset;
            }
        };

        if (width >= kParallelMinWidth) {
            cv::parallel_for_(cv::Range(0, width), fillColumns);
        }
        else {
            fillColumns(cv::Range(0, width));
        }
    }
}

// The dynamic-programming version keeps a cumulative table of all possible paths and
// back-tracks to get the global optimum.
// Complexity: O(width x height) - we have to fill the table for each pixel in the image.
bool findLowestEnergySeamDP(const EnergyMap &energy, Seam &seam_out) {

#ifdef DEBUG
    auto start = std::chrono::high_resolution_clock::now();
#endif

    const int width = energy.width;
    const int height = energy.height;

    if (width <= 0 || height <= 0 ||
        energy.values.size() != static_cast<size_t>(width) * static_cast<size_t>(height)) {
        return false;
    }

    std::vector<float> dp;
    std::vector<int> backtrack;
    buildCumulativeEnergy(energy, dp, backtrack);

    // Scan every column in the bottom row and find the cheapest path (leftmost on ties)
    const size_t bottomOffset = static_cast<size_t>(height - 1) * width;
    float min_energy = dp[bottomOffset];
    int end_x = 0;
    for (int x = 1; x < width; x++) {
        if (dp[bottomOffset + x] < min_energy) {
            min_energy = dp[bottomOffset + x];
            end_x = x;
        }
    }

    // Backtrack (bottom row height-1 -> top row 0) following the recorded parent offsets
    seam_out.columns.resize(height);
    seam_out.columns[height - 1] = end_x;
    for (int y = height - 1; y > 0; y--) {
        const int x = seam_out.columns[y];
        seam_out.columns[y - 1] = x + backtrack[static_cast<size_t>(y) * width + x];
    }
    seam_out.cost = min_energy;

#ifdef DEBUG
    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
    spdlog::debug("findLowestEnergySeamDP: {}x{} image took {} μs", width, height,
                  duration.count());
#endif

    return true;
}

// Removes a seam from the image. Returns true if the seam is valid, false otherwise.
bool removeSeam(const PixelBuffer &input, const std::vector<int> &seam, PixelBuffer &output) {

#ifdef DEBUG
    auto start = std::chrono::high_resolution_clock::now();
#endif

    if (!input.valid() || input.width <= 1 || seam.size() != static_cast<size_t>(input.height)) {
        return false;
    }

    // Validate the whole seam before touching anything
    for (int seam_x : seam) {
        if (seam_x < 0 || seam_x >= input.width) {
            return false;
        }
    }

    const int channels = PixelBuffer::kChannels;
    const int old_width = input.width;
    PixelBuffer result(old_width - 1, input.height);

    for (int y = 0; y < input.height; y++) {

        const int seam_x = seam[y];
        const float *src_row = input.at(0, y);
        float *dst_row = result.at(0, y);

        // Copy pixels left of the seam (0 .. seam_x-1)
        std::copy(src_row, src_row + static_cast<size_t>(seam_x) * channels, dst_row);

        // Copy pixels right of the seam (seam_x+1 .. old_width-1), shifted left by one
        std::copy(src_row + static_cast<size_t>(seam_x + 1) * channels,
                  src_row + static_cast<size_t>(old_width) * channels,
                  dst_row + static_cast<size_t>(seam_x) * channels);
    }

    output = std::move(result);

#ifdef DEBUG
    auto end = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end - start);
    spdlog::debug("removeSeam: {}x{} image took {} μs", old_width, input.height,
                  duration.count());
#endif

    return true;
}
