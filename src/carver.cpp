/*  Carver - Content-aware image resizing
    Author: Stavros Kladis <stavroskladis@hotmail.com>
    Copyright © 2025 Stavros Kladis
*/
#include <chrono> // for timing
#include <spdlog/spdlog.h>

#include "carver.hpp"

const char *carveStatusMessage(CarveStatus status) {
    switch (status) {
    case CarveStatus::Ok:
        return "ok";
    case CarveStatus::InvalidTarget:
        return "target size must be > 0 and not larger than the image (enlarging is not "
               "supported)";
    case CarveStatus::InvalidBuffer:
        return "image buffer is empty or inconsistent";
    case CarveStatus::DimensionMismatch:
        return "seam does not match the image it was applied to";
    case CarveStatus::Cancelled:
        return "carving was cancelled";
    }
    return "unknown error";
}

CarveStatus reduceWidth(const PixelBuffer &buffer, int target_width, const EnergyComputer &computer,
                        const CarveOptions &options, CarveAxis axis, PixelBuffer &output) {
    if (!buffer.valid()) {
        return CarveStatus::InvalidBuffer;
    }
    if (target_width <= 0 || target_width > buffer.width) {
        return CarveStatus::InvalidTarget;
    }

#ifdef DEBUG
    auto seam_carving_start = std::chrono::high_resolution_clock::now();
#endif

    // Work on a copy so the caller's buffer stays intact whatever happens below
    PixelBuffer current = buffer;
    const int seams_total = buffer.width - target_width;
    int seams_removed = 0;

    std::unique_ptr<EnergyMap> energy;
    Seam seam;

    while (current.width > target_width) {

        if (options.cancel && options.cancel->load()) {
            return CarveStatus::Cancelled;
        }

        // Full mode recomputes the map from scratch every iteration. Incremental mode only
        // computes it on the first iteration and patches it after each removal (see below).
        if (!energy || options.energy_update == EnergyUpdate::Full) {
            energy = computer.compute(current);
            if (!energy) {
                return CarveStatus::InvalidBuffer;
            }
        }

        if (!findLowestEnergySeamDP(*energy, seam)) {
            return CarveStatus::InvalidBuffer;
        }

        PixelBuffer next;
        if (!removeSeam(current, seam.columns, next)) {
            return CarveStatus::DimensionMismatch;
        }
        current = std::move(next);
        seams_removed++;

        if (options.energy_update == EnergyUpdate::Incremental && current.width > target_width) {
            if (!removeSeamFromEnergy(*energy, seam.columns) ||
                !updateEnergyMapAroundSeam(*energy, seam.columns, current, computer)) {
                return CarveStatus::DimensionMismatch;
            }
        }

        if (options.on_progress) {
            CarveProgress progress;
            progress.axis = axis;
            progress.seams_removed = seams_removed;
            progress.seams_total = seams_total;
            // The height phase runs on a transposed buffer: swap back for the report
            progress.width = axis == CarveAxis::Width ? current.width : current.height;
            progress.height = axis == CarveAxis::Width ? current.height : current.width;
            options.on_progress(progress);
        }
    }

#ifdef DEBUG
    auto seam_carving_end = std::chrono::high_resolution_clock::now();
    auto seam_carving_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        seam_carving_end - seam_carving_start);
    spdlog::debug("reduceWidth: {} seams, {}x{} -> {}x{} took {} ms", seams_removed, buffer.width,
                  buffer.height, current.width, current.height, seam_carving_duration.count());
#endif

    output = std::move(current);
    return CarveStatus::Ok;
}

CarveStatus carveImage(const PixelBuffer &input, std::optional<int> target_width,
                       std::optional<int> target_height, PixelBuffer &output,
                       const CarveOptions &options) {
    if (!input.valid()) {
        return CarveStatus::InvalidBuffer;
    }

    // Validate both targets up front so a bad height never costs a width phase
    if (target_width && (*target_width <= 0 || *target_width > input.width)) {
        return CarveStatus::InvalidTarget;
    }
    if (target_height && (*target_height <= 0 || *target_height > input.height)) {
        return CarveStatus::InvalidTarget;
    }

    std::unique_ptr<EnergyComputer> computer = makeEnergyComputer(options.energy_method);
    PixelBuffer current = input;

    // Width first, then height. Seam carving does not commute, so this order is part of the
    // result.
    if (target_width && *target_width != current.width) {
        PixelBuffer reduced;
        CarveStatus status =
            reduceWidth(current, *target_width, *computer, options, CarveAxis::Width, reduced);
        if (status != CarveStatus::Ok) {
            return status;
        }
        current = std::move(reduced);
    }

    // Horizontal seams are vertical seams of the transposed image
    if (target_height && *target_height != current.height) {
        PixelBuffer transposed = transposeBuffer(current);
        PixelBuffer reduced;
        CarveStatus status = reduceWidth(transposed, *target_height, *computer, options,
                                         CarveAxis::Height, reduced);
        if (status != CarveStatus::Ok) {
            return status;
        }
        current = transposeBuffer(reduced);
    }

    output = std::move(current);
    return CarveStatus::Ok;
}
