#pragma once

#include "PixelBuffer.h"

// Pixel operations used by texture synthesis. All functions are pure and
// return new buffers; samples outside the image clamp to the edge.

namespace LabPBR {
namespace ImageFilters {

// Rec.601 luma, single channel. Gray input is returned unchanged (alpha dropped).
PixelBuffer toGrayscale(const PixelBuffer& image);

// Separable gaussian blur on every channel. sigma <= 0 returns a copy.
PixelBuffer gaussianBlur(const PixelBuffer& image, float sigma);

// out = clamp(v * multiplier + offset) on colour channels, alpha untouched
PixelBuffer linear(const PixelBuffer& image, float multiplier, float offset);

// Contrast around mid-gray: linear(c, 128 - 128c)
PixelBuffer contrast(const PixelBuffer& image, float factor);

// Multiply colour channels, clamp to 0..255
PixelBuffer brightness(const PixelBuffer& image, float factor);

// 255 - v on colour channels
PixelBuffer invert(const PixelBuffer& image);

// Nearest-neighbour resample to the target size
PixelBuffer resampleNearest(const PixelBuffer& image, uint32_t width, uint32_t height);

} // namespace ImageFilters
} // namespace LabPBR
