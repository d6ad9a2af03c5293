#pragma once

// Decoded 8-bit raster shared by every stage of the pipeline.
// Channels are interleaved row-major; 1 = gray, 2 = gray+alpha, 3 = RGB, 4 = RGBA.

#include <cstddef>
#include <cstdint>
#include <vector>

namespace LabPBR {

class PixelBuffer {
public:
    PixelBuffer() = default;

    // Throws std::invalid_argument when bytes.size() != width*height*channels
    // or channels is outside 1..4.
    PixelBuffer(uint32_t width, uint32_t height, uint32_t channels, std::vector<uint8_t> bytes);

    // Buffer filled with a single value in every channel
    static PixelBuffer filled(uint32_t width, uint32_t height, uint32_t channels, uint8_t value);

    uint32_t width() const { return width_; }
    uint32_t height() const { return height_; }
    uint32_t channels() const { return channels_; }
    const std::vector<uint8_t>& bytes() const { return bytes_; }

    size_t pixelCount() const { return static_cast<size_t>(width_) * height_; }
    bool empty() const { return pixelCount() == 0; }

    uint8_t at(uint32_t x, uint32_t y, uint32_t channel) const {
        return bytes_[(static_cast<size_t>(y) * width_ + x) * channels_ + channel];
    }

    // Clamp-to-edge sample, coordinates outside the image snap to the nearest pixel
    uint8_t sampleClamped(int32_t x, int32_t y, uint32_t channel) const;

    // Expand to RGBA: gray replicates into RGB, missing alpha reads as 255
    PixelBuffer toRGBA() const;

private:
    uint32_t width_ = 0;
    uint32_t height_ = 0;
    uint32_t channels_ = 0;
    std::vector<uint8_t> bytes_;
};

} // namespace LabPBR
