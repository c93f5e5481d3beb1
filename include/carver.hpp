/*  Carver - Content-aware image resizing
    Author: Stavros Kladis <stavroskladis@hotmail.com>
    Copyright © 2025 Stavros Kladis
*/
#pragma once

#include <atomic>
#include <functional>
#include <optional>

#include "image_processing.hpp"
#include "pixel_buffer.hpp"

// Result of a carve request
enum class CarveStatus {
    Ok,
    InvalidTarget,     // target <= 0 or larger than the original dimension
    InvalidBuffer,     // input buffer has a zero dimension or inconsistent data
    DimensionMismatch, // a seam did not fit the buffer it was applied to (internal error)
    Cancelled,         // the cancel flag was raised between two seams
};

const char *carveStatusMessage(CarveStatus status);

// Which dimension a reduction phase shrinks
enum class CarveAxis { Width, Height };

/**
 * @brief Progress snapshot, reported after every removed seam
 *
 * width and height are the current image dimensions in the original orientation, also while
 * the height phase runs on the transposed buffer.
 */
struct CarveProgress {
    CarveAxis axis = CarveAxis::Width;
    int seams_removed = 0;
    int seams_total = 0;
    int width = 0;
    int height = 0;
};

/**
 * @brief How the energy map is maintained between two seams
 *
 * Full recomputes the whole map after every removal. Incremental computes it once per phase
 * and afterwards only recomputes the band of pixels around each removed seam.
 */
enum class EnergyUpdate { Full, Incremental };

struct CarveOptions {
    EnergyMethod energy_method = EnergyMethod::Auto;
    EnergyUpdate energy_update = EnergyUpdate::Full;

    // Called after every removed seam. May be empty.
    std::function<void(const CarveProgress &)> on_progress;

    // Checked before every seam; when it reads true the carve stops with Cancelled.
    const std::atomic<bool> *cancel = nullptr;
};

/**
 * @brief Iteratively remove vertical seams until the buffer is target_width wide.
 *
 * The orientation-agnostic reduction loop. The height phase of carveImage() runs it on a
 * transposed buffer; axis only affects how progress is reported.
 *
 * @param buffer       Input buffer (not modified)
 * @param target_width Desired width, 1 <= target_width <= buffer.width
 * @param computer     Energy function
 * @param options      Energy update mode, progress callback and cancel flag
 * @param axis         Axis reported in the progress callback
 * @param output       Receives the reduced buffer; untouched unless Ok is returned
 */
CarveStatus reduceWidth(const PixelBuffer &buffer, int target_width, const EnergyComputer &computer,
                        const CarveOptions &options, CarveAxis axis, PixelBuffer &output);

/**
 * @brief Content-aware resize of a buffer to the requested dimensions
 *
 * Width is reduced fully first; then the buffer is transposed, its height reduced with the
 * same vertical-seam loop, and the result transposed back. An unspecified dimension is left
 * unchanged. Targets are validated before any seam is removed, so a failed call does no work.
 *
 * @param input         Input buffer (not modified)
 * @param target_width  Desired width, if any
 * @param target_height Desired height, if any
 * @param output        Receives the carved buffer; untouched unless Ok is returned
 * @param options       See CarveOptions
 */
CarveStatus carveImage(const PixelBuffer &input, std::optional<int> target_width,
                       std::optional<int> target_height, PixelBuffer &output,
                       const CarveOptions &options = CarveOptions());
