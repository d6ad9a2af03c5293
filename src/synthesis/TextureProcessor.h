#pragma once

#include "DepthEstimator.h"
#include "NormalSynthesizer.h"
#include "core/Result.h"
#include "image/PixelBuffer.h"
#include "jobs/ConversionSettings.h"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace LabPBR {

// PNG-encoded maps generated from one source image.
// Maps that were not requested are empty, never missing.
struct MaterialMapSet {
    std::vector<uint8_t> baseColor;
    std::vector<uint8_t> normal;       // RGB tangent-space normal
    std::vector<uint8_t> specular;     // LabPBR packed RGBA
    std::vector<uint8_t> height;       // Gray
    std::vector<uint8_t> ao;           // Gray

    size_t generatedCount() const;
};

/**
 * TextureProcessor - derives the material maps for one source image
 *
 * Every step reads only the decoded source (and the depth buffer), so steps
 * are independent. When a depth estimator is attached it is asked once per
 * image if a normal or height map is requested, and its failure fails the image.
 */
class TextureProcessor {
public:
    explicit TextureProcessor(std::shared_ptr<DepthEstimator> depthEstimator = nullptr,
                              NormalConvention convention = NormalConvention::DirectX,
                              GradientKernel kernel = GradientKernel::Sobel);

    Result<MaterialMapSet> process(const std::vector<uint8_t>& encodedImage,
                                   const ConversionSettings& settings,
                                   const std::string& filenameHint = "") const;

    Result<MaterialMapSet> processImage(const PixelBuffer& source, const ConversionSettings& settings) const;

    bool hasDepthEstimator() const { return depthEstimator_ != nullptr; }

    // Individual steps
    static PixelBuffer baseColor(const PixelBuffer& source, float contrast);
    static PixelBuffer roughness(const PixelBuffer& source, float intensity, bool invert);
    static PixelBuffer approximateHeight(const PixelBuffer& source, float heightDepth);
    static PixelBuffer ambientOcclusion(const PixelBuffer& source, float aoRadius);

private:
    std::shared_ptr<DepthEstimator> depthEstimator_;
    NormalConvention convention_;
    GradientKernel kernel_;
};

} // namespace LabPBR
