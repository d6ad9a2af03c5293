#pragma once

#include "image/PixelBuffer.h"
#include <optional>
#include <string>

namespace LabPBR {

// Green channel direction of the produced normal map.
// DirectX (LabPBR's convention): green grows toward image-down (Y-).
// OpenGL: green grows toward image-up (Y+).
// Red always follows nx = -dh/dx.
enum class NormalConvention {
    DirectX,
    OpenGL
};

enum class GradientKernel {
    Sobel,          // 8-neighbour
    CentralDiff     // 4-neighbour
};

const char* normalConventionName(NormalConvention convention);
std::optional<NormalConvention> parseNormalConvention(const std::string& name);

const char* gradientKernelName(GradientKernel kernel);
std::optional<GradientKernel> parseGradientKernel(const std::string& name);

struct NormalSynthesisOptions {
    float strength = 1.0f;      // Floored to MIN_STRENGTH
    NormalConvention convention = NormalConvention::DirectX;
    GradientKernel kernel = GradientKernel::Sobel;
};

namespace NormalSynthesizer {

constexpr float MIN_STRENGTH = 0.1f;

// Depth/height buffer (channel 0 is read) to an RGB8 tangent-space normal map.
// Edges clamp; a flat buffer gives (128, 128, 255).
PixelBuffer synthesize(const PixelBuffer& depth, const NormalSynthesisOptions& options = {});

} // namespace NormalSynthesizer

} // namespace LabPBR
