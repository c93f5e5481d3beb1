/*  Carver - Content-aware image resizing
    Author: Stavros Kladis <stavroskladis@hotmail.com>
    Copyright © 2025 Stavros Kladis
*/
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "pixel_buffer.hpp"

/**
 * @brief Per-pixel importance map, row-major: values[y * width + x]
 *
 * Always has the dimensions of the buffer it was computed from. All values are >= 0.
 */
struct EnergyMap {
    int width = 0;
    int height = 0;
    std::vector<float> values;

    EnergyMap() = default;
    EnergyMap(int width, int height)
        : width(width), height(height), values(static_cast<size_t>(width) * height, 0.0f) {}

    float at(int x, int y) const { return values[static_cast<size_t>(y) * width + x]; }
};

/**
 * @brief A vertical seam: one column index per row, plus its total energy
 *
 * columns[y] is the x-coordinate of the seam pixel in row y. Adjacent entries differ by at
 * most 1.
 */
struct Seam {
    std::vector<int> columns;
    float cost = 0.0f;
};

/**
 * @brief Interface for energy functions
 *
 * The seam search only ever sees the EnergyMap, so a new energy function is added by
 * implementing this interface and registering it in makeEnergyComputer().
 */
class EnergyComputer {
  public:
    virtual ~EnergyComputer() = default;

    /**
     * @brief Computes the full energy map of a buffer
     * @param buffer Input RGB buffer
     * @return Energy map of identical dimensions, or nullptr if the buffer is invalid
     *         (zero width/height or inconsistent sample count)
     */
    virtual std::unique_ptr<EnergyMap> compute(const PixelBuffer &buffer) const = 0;

    /**
     * @brief Calculates the energy of a single pixel
     *
     * Must agree with the value compute() produces for the same pixel. Used for incremental
     * energy map updates, so it is expected to be cheap. The caller guarantees that the
     * buffer is valid and (x, y) is inside it.
     */
    virtual float computeAt(const PixelBuffer &buffer, int x, int y) const = 0;

    virtual const char *name() const = 0;
};

/**
 * @brief Gradient magnitude energy using Sobel operators
 *
 * The function performs:
 * 1. RGB to grayscale conversion (0.2125*Red + 0.7154*Green + 0.0721*Blue)
 * 2. Sobel gradient computation (X and Y directions, 3x3 kernel scaled by 1/4,
 *    reflected borders)
 * 3. Energy map calculation: sqrt((Gx^2 + Gy^2) / 2)
 *
 * compute() runs on OpenCV, computeAt() applies the same kernels by hand.
 */
class SobelEnergy : public EnergyComputer {
  public:
    std::unique_ptr<EnergyMap> compute(const PixelBuffer &buffer) const override;
    float computeAt(const PixelBuffer &buffer, int x, int y) const override;
    const char *name() const override { return "sobel"; }
};

/**
 * @brief Energy functions selectable from the command line
 *
 * Auto picks the default energy function, which currently is Sobel.
 */
enum class EnergyMethod { Auto, Sobel };

// Builds the energy function for a method (never returns nullptr)
std::unique_ptr<EnergyComputer> makeEnergyComputer(EnergyMethod method);

// Parses "auto" / "sobel" (case-insensitive). Returns false for anything else.
bool parseEnergyMethod(const std::string &text, EnergyMethod &method);

const char *energyMethodName(EnergyMethod method);

/**
 * @brief Removes the same vertical seam from an energy map (in-place).
 *
 * After removing a seam from the pixel buffer (width shrinks by 1), the energy map must also
 * shrink by 1 column per row. If we don't, subsequent seam searches will interpret the energy
 * buffer with the wrong row stride, causing seams to drift/bias (often to one side).
 *
 * @param energy Energy map in row-major order, still at the old width
 * @param seam   Seam x-coordinates in the OLD width (one per row)
 * @return true on success, false on invalid input (the map is left untouched)
 */
bool removeSeamFromEnergy(EnergyMap &energy, const std::vector<int> &seam);

/**
 * @brief Incrementally updates energy map around a removed seam
 *
 * Call after the seam was removed from both the buffer and the energy map. Only the pixels
 * whose 3x3 neighbourhood changed are recomputed: in row y these are the new columns
 * [min(seam[y-1..y+1]) - 1, max(seam[y-1..y+1])].
 *
 * @param energy   Energy map with the seam already removed (same size as buffer)
 * @param seam     x-coordinates of the removed seam, in the old width
 * @param buffer   Pixel buffer with the seam already removed
 * @param computer Energy function used to recompute single pixels
 * @return false if the sizes of energy, seam and buffer do not agree
 */
bool updateEnergyMapAroundSeam(EnergyMap &energy, const std::vector<int> &seam,
                               const PixelBuffer &buffer, const EnergyComputer &computer);

/**
 * @brief Fills the cumulative energy table M and the backtrack table
 *
 * M[0][x] = energy[0][x] and M[y][x] = energy[y][x] + min(M[y-1][x-1], M[y-1][x], M[y-1][x+1]),
 * with neighbours outside the map treated as +infinity. backtrack[y * width + x] holds the
 * offset (-1, 0 or +1) of the chosen parent in the row above; row 0 holds 0.
 *
 * Ties are resolved in a fixed order: left (-1), then straight (0), then right (+1).
 *
 * @param energy     Energy map (must be non-empty)
 * @param cumulative Output, resized to width * height
 * @param backtrack  Output, resized to width * height
 */
void buildCumulativeEnergy(const EnergyMap &energy, std::vector<float> &cumulative,
                           std::vector<int> &backtrack);

/**
 * @brief Finds the lowest energy vertical seam using Dynamic Programming for global optimality.
 *
 * The algorithm works by:
 * 1. Building the cumulative energy table from top to bottom (buildCumulativeEnergy)
 * 2. Picking the minimum of the bottom row (leftmost on ties)
 * 3. Walking the backtrack table upwards to recover the seam
 *
 * @param energy   Energy map, row-major
 * @param seam_out Output: one column per row and the seam's total cost (the minimum of M's
 *                 last row)
 * @return false if the energy map is empty or inconsistent
 */
bool findLowestEnergySeamDP(const EnergyMap &energy, Seam &seam_out);

/**
 * @brief Removes a vertical seam from the image data
 *
 * Row y of the output is row y of the input without the pixel at seam[y]; the pixels right of
 * it shift left by one. The input buffer is not modified.
 *
 * @param input  Source buffer (width >= 2)
 * @param seam   x-coordinates of pixels to remove, one per row
 * @param output Receives the (width - 1) x height result; untouched on failure
 * @return false if the seam length does not match the height, a column is out of range or
 *         the input cannot lose a column
 */
bool removeSeam(const PixelBuffer &input, const std::vector<int> &seam, PixelBuffer &output);
