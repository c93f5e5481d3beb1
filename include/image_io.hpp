/*  Carver - Content-aware image resizing
    Author: Stavros Kladis <stavroskladis@hotmail.com>
    Copyright © 2025 Stavros Kladis
*/
#pragma once

#include <string>
#include <vector>

#include "pixel_buffer.hpp"

// Load an image from disk as RGB and normalize its samples to [0, 1]. Logs and returns false
// on failure (missing file, undecodable data).
bool loadImage(const std::string &path, PixelBuffer &buffer);

/**
 * @brief Write a buffer to disk, picking the encoder from the file extension
 *
 * Supported extensions (case-insensitive): .png, .jpg/.jpeg (quality 95), .bmp, .tga.
 * Missing parent directories are created.
 *
 * @return false (after logging the reason) for an invalid buffer, an unknown extension or a
 *         failed write
 */
bool saveImage(const std::string &path, const PixelBuffer &buffer);

// Convert 8-bit interleaved RGB data to a float buffer (divide by 255)
PixelBuffer bufferFromBytes(const unsigned char *bytes, int width, int height);

// Convert a float buffer to 8-bit interleaved RGB (scale by 255, round, clamp to 0..255)
std::vector<unsigned char> bufferToBytes(const PixelBuffer &buffer);
