#pragma once

// Image decode/encode adapter over lodepng (PNG) and stb_image (JPEG, TGA, BMP)

#include "PixelBuffer.h"
#include "core/Result.h"
#include <cstdint>
#include <string>
#include <vector>

namespace LabPBR {

enum class ImageFormat {
    PNG,
    JPEG,
    TGA,
    TIFF,
    BMP,
    Unknown
};

const char* imageFormatName(ImageFormat format);

namespace ImageCodec {

// Detect the container format from magic bytes. TGA has no signature, so
// the filename hint (may be empty) is consulted for it.
ImageFormat detectFormat(const std::vector<uint8_t>& bytes, const std::string& filenameHint = "");

// Decode keeping the native channel count (palette PNGs expand to RGB/RGBA,
// 16-bit PNGs are reduced to 8 bits). Fails with DecodeError.
Result<PixelBuffer> decode(const std::vector<uint8_t>& bytes, const std::string& filenameHint = "");

// Encode as 8-bit PNG matching the buffer's channel count
Result<std::vector<uint8_t>> encodePng(const PixelBuffer& image);

} // namespace ImageCodec

} // namespace LabPBR
