#include "PixelBuffer.h"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace LabPBR {

PixelBuffer::PixelBuffer(uint32_t width, uint32_t height, uint32_t channels, std::vector<uint8_t> bytes)
    : width_(width), height_(height), channels_(channels), bytes_(std::move(bytes)) {
    if (channels_ < 1 || channels_ > 4) {
        throw std::invalid_argument("PixelBuffer: unsupported channel count " + std::to_string(channels_));
    }
    size_t expected = static_cast<size_t>(width_) * height_ * channels_;
    if (bytes_.size() != expected) {
        throw std::invalid_argument("PixelBuffer: expected " + std::to_string(expected) +
                                    " bytes, got " + std::to_string(bytes_.size()));
    }
}

PixelBuffer PixelBuffer::filled(uint32_t width, uint32_t height, uint32_t channels, uint8_t value) {
    std::vector<uint8_t> bytes(static_cast<size_t>(width) * height * channels, value);
    return PixelBuffer(width, height, channels, std::move(bytes));
}

uint8_t PixelBuffer::sampleClamped(int32_t x, int32_t y, uint32_t channel) const {
    int32_t cx = std::clamp(x, 0, static_cast<int32_t>(width_) - 1);
    int32_t cy = std::clamp(y, 0, static_cast<int32_t>(height_) - 1);
    return at(static_cast<uint32_t>(cx), static_cast<uint32_t>(cy), channel);
}

PixelBuffer PixelBuffer::toRGBA() const {
    if (channels_ == 4) {
        return *this;
    }

    size_t count = pixelCount();
    std::vector<uint8_t> rgba(count * 4);
    for (size_t i = 0; i < count; ++i) {
        const uint8_t* src = &bytes_[i * channels_];
        uint8_t* dst = &rgba[i * 4];
        switch (channels_) {
            case 1:
                dst[0] = dst[1] = dst[2] = src[0];
                dst[3] = 255;
                break;
            case 2:
                dst[0] = dst[1] = dst[2] = src[0];
                dst[3] = src[1];
                break;
            case 3:
                dst[0] = src[0];
                dst[1] = src[1];
                dst[2] = src[2];
                dst[3] = 255;
                break;
            default:
                break;
        }
    }
    return PixelBuffer(width_, height_, 4, std::move(rgba));
}

} // namespace LabPBR
