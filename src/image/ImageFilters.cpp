#include "ImageFilters.h"
#include <algorithm>
#include <cmath>

namespace LabPBR {
namespace ImageFilters {

namespace {

uint8_t clampByte(float v) {
    return static_cast<uint8_t>(std::clamp(std::lround(v), 0L, 255L));
}

// Alpha is the last channel of 2- and 4-channel buffers
uint32_t colorChannels(const PixelBuffer& image) {
    uint32_t c = image.channels();
    return (c == 2 || c == 4) ? c - 1 : c;
}

std::vector<float> gaussianKernel(float sigma) {
    int radius = std::max(1, static_cast<int>(std::ceil(sigma * 3.0f)));
    std::vector<float> kernel(2 * radius + 1);
    float sum = 0.0f;
    for (int i = -radius; i <= radius; ++i) {
        float w = std::exp(-(i * i) / (2.0f * sigma * sigma));
        kernel[i + radius] = w;
        sum += w;
    }
    for (float& w : kernel) {
        w /= sum;
    }
    return kernel;
}

template<typename Fn>
PixelBuffer mapColor(const PixelBuffer& image, Fn fn) {
    std::vector<uint8_t> out = image.bytes();
    uint32_t channels = image.channels();
    uint32_t color = colorChannels(image);
    for (size_t i = 0; i < image.pixelCount(); ++i) {
        for (uint32_t c = 0; c < color; ++c) {
            uint8_t& v = out[i * channels + c];
            v = fn(v);
        }
    }
    return PixelBuffer(image.width(), image.height(), channels, std::move(out));
}

} // namespace

PixelBuffer toGrayscale(const PixelBuffer& image) {
    uint32_t channels = image.channels();
    std::vector<uint8_t> gray(image.pixelCount());
    const std::vector<uint8_t>& src = image.bytes();

    for (size_t i = 0; i < image.pixelCount(); ++i) {
        const uint8_t* p = &src[i * channels];
        if (channels < 3) {
            gray[i] = p[0];
        } else {
            gray[i] = clampByte(0.299f * p[0] + 0.587f * p[1] + 0.114f * p[2]);
        }
    }
    return PixelBuffer(image.width(), image.height(), 1, std::move(gray));
}

PixelBuffer gaussianBlur(const PixelBuffer& image, float sigma) {
    if (sigma <= 0.0f || image.empty()) {
        return image;
    }

    std::vector<float> kernel = gaussianKernel(sigma);
    int radius = static_cast<int>(kernel.size() / 2);
    int width = static_cast<int>(image.width());
    int height = static_cast<int>(image.height());
    uint32_t channels = image.channels();

    // Horizontal pass into floats, vertical pass back to bytes
    std::vector<float> temp(image.bytes().size());
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            for (uint32_t c = 0; c < channels; ++c) {
                float acc = 0.0f;
                for (int k = -radius; k <= radius; ++k) {
                    acc += kernel[k + radius] * image.sampleClamped(x + k, y, c);
                }
                temp[(static_cast<size_t>(y) * width + x) * channels + c] = acc;
            }
        }
    }

    std::vector<uint8_t> out(image.bytes().size());
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            for (uint32_t c = 0; c < channels; ++c) {
                float acc = 0.0f;
                for (int k = -radius; k <= radius; ++k) {
                    int sy = std::clamp(y + k, 0, height - 1);
                    acc += kernel[k + radius] * temp[(static_cast<size_t>(sy) * width + x) * channels + c];
                }
                out[(static_cast<size_t>(y) * width + x) * channels + c] = clampByte(acc);
            }
        }
    }
    return PixelBuffer(image.width(), image.height(), channels, std::move(out));
}

PixelBuffer linear(const PixelBuffer& image, float multiplier, float offset) {
    return mapColor(image, [=](uint8_t v) { return clampByte(v * multiplier + offset); });
}

PixelBuffer contrast(const PixelBuffer& image, float factor) {
    return linear(image, factor, 128.0f - 128.0f * factor);
}

PixelBuffer brightness(const PixelBuffer& image, float factor) {
    return mapColor(image, [=](uint8_t v) { return clampByte(v * factor); });
}

PixelBuffer invert(const PixelBuffer& image) {
    return mapColor(image, [](uint8_t v) { return static_cast<uint8_t>(255 - v); });
}

PixelBuffer resampleNearest(const PixelBuffer& image, uint32_t width, uint32_t height) {
    if (image.width() == width && image.height() == height) {
        return image;
    }
    if (image.empty() || width == 0 || height == 0) {
        return PixelBuffer::filled(width, height, std::max(1u, image.channels()), 0);
    }

    uint32_t channels = image.channels();
    std::vector<uint8_t> out(static_cast<size_t>(width) * height * channels);
    for (uint32_t y = 0; y < height; ++y) {
        uint32_t sy = std::min(image.height() - 1,
                               static_cast<uint32_t>((static_cast<uint64_t>(y) * image.height()) / height));
        for (uint32_t x = 0; x < width; ++x) {
            uint32_t sx = std::min(image.width() - 1,
                                   static_cast<uint32_t>((static_cast<uint64_t>(x) * image.width()) / width));
            for (uint32_t c = 0; c < channels; ++c) {
                out[(static_cast<size_t>(y) * width + x) * channels + c] = image.at(sx, sy, c);
            }
        }
    }
    return PixelBuffer(width, height, channels, std::move(out));
}

} // namespace ImageFilters
} // namespace LabPBR
