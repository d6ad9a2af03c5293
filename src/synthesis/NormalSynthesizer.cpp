#include "NormalSynthesizer.h"
#include <glm/glm.hpp>
#include <algorithm>
#include <cmath>

namespace LabPBR {

const char* normalConventionName(NormalConvention convention) {
    return convention == NormalConvention::OpenGL ? "opengl" : "directx";
}

std::optional<NormalConvention> parseNormalConvention(const std::string& name) {
    if (name == "directx") return NormalConvention::DirectX;
    if (name == "opengl") return NormalConvention::OpenGL;
    return std::nullopt;
}

const char* gradientKernelName(GradientKernel kernel) {
    return kernel == GradientKernel::CentralDiff ? "central" : "sobel";
}

std::optional<GradientKernel> parseGradientKernel(const std::string& name) {
    if (name == "sobel") return GradientKernel::Sobel;
    if (name == "central") return GradientKernel::CentralDiff;
    return std::nullopt;
}

namespace NormalSynthesizer {

namespace {

uint8_t encodeComponent(float v) {
    return static_cast<uint8_t>(std::clamp(std::lround((v + 1.0f) * 127.5f), 0L, 255L));
}

// dh/dx and dh/dy in raw byte units
glm::vec2 gradient(const PixelBuffer& depth, int x, int y, GradientKernel kernel) {
    auto h = [&](int sx, int sy) { return static_cast<float>(depth.sampleClamped(sx, sy, 0)); };

    if (kernel == GradientKernel::CentralDiff) {
        return glm::vec2(h(x + 1, y) - h(x - 1, y),
                         h(x, y + 1) - h(x, y - 1));
    }

    float tl = h(x - 1, y - 1), t = h(x, y - 1), tr = h(x + 1, y - 1);
    float l  = h(x - 1, y),                       r  = h(x + 1, y);
    float bl = h(x - 1, y + 1), b = h(x, y + 1), br = h(x + 1, y + 1);

    float dx = (tr + 2.0f * r + br) - (tl + 2.0f * l + bl);
    float dy = (bl + 2.0f * b + br) - (tl + 2.0f * t + tr);
    return glm::vec2(dx, dy);
}

} // namespace

PixelBuffer synthesize(const PixelBuffer& depth, const NormalSynthesisOptions& options) {
    const float strength = std::max(MIN_STRENGTH, options.strength);
    const int width = static_cast<int>(depth.width());
    const int height = static_cast<int>(depth.height());

    std::vector<uint8_t> out(depth.pixelCount() * 3);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            glm::vec2 g = gradient(depth, x, y, options.kernel) / 255.0f * strength;

            // Image rows grow downward: -dh/drow is the image-down (DirectX Y-) component
            float nx = -g.x;
            float ny = options.convention == NormalConvention::OpenGL ? g.y : -g.y;
            float nz = std::sqrt(std::max(0.0f, 1.0f - nx * nx - ny * ny));

            size_t idx = (static_cast<size_t>(y) * width + x) * 3;
            out[idx + 0] = encodeComponent(nx);
            out[idx + 1] = encodeComponent(ny);
            out[idx + 2] = static_cast<uint8_t>(std::clamp(std::lround(nz * 255.0f), 0L, 255L));
        }
    }
    return PixelBuffer(depth.width(), depth.height(), 3, std::move(out));
}

} // namespace NormalSynthesizer

} // namespace LabPBR
