#include "TextureProcessor.h"
#include "image/ImageCodec.h"
#include "image/ImageFilters.h"
#include "labpbr/LabPBRPacker.h"
#include <algorithm>
#include <cmath>
#include <optional>

namespace LabPBR {

namespace {

constexpr float HEIGHT_BLUR_SIGMA = 1.0f;
constexpr float AO_BRIGHTNESS = 0.7f;

// Encode into the slot, leaving the error for the caller
Status encodeInto(const PixelBuffer& image, std::vector<uint8_t>& slot) {
    Result<std::vector<uint8_t>> png = ImageCodec::encodePng(image);
    if (!png) {
        return Status::failure(png.error());
    }
    slot = std::move(png).value();
    return Status::ok();
}

} // namespace

size_t MaterialMapSet::generatedCount() const {
    size_t count = 0;
    for (const auto* map : {&baseColor, &normal, &specular, &height, &ao}) {
        if (!map->empty()) ++count;
    }
    return count;
}

TextureProcessor::TextureProcessor(std::shared_ptr<DepthEstimator> depthEstimator,
                                   NormalConvention convention,
                                   GradientKernel kernel)
    : depthEstimator_(std::move(depthEstimator))
    , convention_(convention)
    , kernel_(kernel) {}

PixelBuffer TextureProcessor::baseColor(const PixelBuffer& source, float contrast) {
    return ImageFilters::contrast(source, contrast);
}

PixelBuffer TextureProcessor::roughness(const PixelBuffer& source, float intensity, bool invert) {
    PixelBuffer gray = ImageFilters::toGrayscale(source);
    if (invert) {
        gray = ImageFilters::invert(gray);
    }
    return ImageFilters::brightness(gray, intensity);
}

PixelBuffer TextureProcessor::approximateHeight(const PixelBuffer& source, float heightDepth) {
    PixelBuffer gray = ImageFilters::toGrayscale(source);
    return ImageFilters::brightness(ImageFilters::gaussianBlur(gray, HEIGHT_BLUR_SIGMA), heightDepth);
}

PixelBuffer TextureProcessor::ambientOcclusion(const PixelBuffer& source, float aoRadius) {
    float radius = std::max(1.0f, std::round(aoRadius * 10.0f));
    PixelBuffer gray = ImageFilters::toGrayscale(source);
    return ImageFilters::brightness(ImageFilters::gaussianBlur(gray, radius), AO_BRIGHTNESS);
}

Result<MaterialMapSet> TextureProcessor::process(const std::vector<uint8_t>& encodedImage,
                                                 const ConversionSettings& settings,
                                                 const std::string& filenameHint) const {
    Result<PixelBuffer> decoded = ImageCodec::decode(encodedImage, filenameHint);
    if (!decoded) {
        return Result<MaterialMapSet>::failure(decoded.error());
    }
    return processImage(decoded.value(), settings);
}

Result<MaterialMapSet> TextureProcessor::processImage(const PixelBuffer& source,
                                                      const ConversionSettings& settings) const {
    if (source.width() == 0 || source.height() == 0) {
        return Result<MaterialMapSet>::failure(ErrorKind::InvalidDimensions,
                                               "Source image has no width or height");
    }

    std::optional<PixelBuffer> depth;
    if (depthEstimator_ && (settings.generateNormal || settings.generateHeight)) {
        Result<PixelBuffer> estimated = depthEstimator_->estimate(source.toRGBA());
        if (!estimated) {
            return Result<MaterialMapSet>::failure(estimated.error());
        }
        depth = ImageFilters::resampleNearest(estimated.value(), source.width(), source.height());
    }

    MaterialMapSet maps;
    std::vector<Status> steps;

    if (settings.generateBaseColor) {
        steps.push_back(encodeInto(baseColor(source, settings.baseColorContrast), maps.baseColor));
    }

    if (settings.generateRoughness) {
        PixelBuffer rough = roughness(source, settings.roughnessIntensity, settings.roughnessInvert);
        steps.push_back(encodeInto(LabPBRPacker::packSpecular(rough), maps.specular));
    }

    if (settings.generateHeight) {
        PixelBuffer height = depth ? *depth : approximateHeight(source, settings.heightDepth);
        steps.push_back(encodeInto(height, maps.height));
    }

    if (settings.generateNormal) {
        NormalSynthesisOptions options;
        options.strength = settings.normalStrength;
        options.convention = convention_;
        options.kernel = kernel_;
        PixelBuffer heightSource = depth ? *depth : ImageFilters::toGrayscale(source);
        steps.push_back(encodeInto(NormalSynthesizer::synthesize(heightSource, options), maps.normal));
    }

    if (settings.generateAO) {
        steps.push_back(encodeInto(ambientOcclusion(source, settings.aoRadius), maps.ao));
    }

    for (const Status& step : steps) {
        if (!step) {
            return Result<MaterialMapSet>::failure(step.error());
        }
    }

    return Result<MaterialMapSet>::success(std::move(maps));
}

} // namespace LabPBR
