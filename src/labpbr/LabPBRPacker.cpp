#include "LabPBRPacker.h"
#include "image/ImageCodec.h"
#include "image/ImageFilters.h"
#include "synthesis/TextureProcessor.h"
#include <algorithm>
#include <optional>

namespace LabPBR {
namespace LabPBRPacker {

namespace {

Result<std::optional<PixelBuffer>> decodeOptional(const std::vector<uint8_t>& png) {
    if (png.empty()) {
        return Result<std::optional<PixelBuffer>>::success(std::nullopt);
    }
    Result<PixelBuffer> decoded = ImageCodec::decode(png);
    if (!decoded) {
        return Result<std::optional<PixelBuffer>>::failure(decoded.error());
    }
    return Result<std::optional<PixelBuffer>>::success(std::move(decoded).value());
}

PixelBuffer matchSize(const PixelBuffer& image, const PixelBuffer& target) {
    return ImageFilters::resampleNearest(image, target.width(), target.height());
}

} // namespace

PixelBuffer packSpecular(const PixelBuffer& roughness) {
    std::vector<uint8_t> out(roughness.pixelCount() * 4);
    for (size_t i = 0; i < roughness.pixelCount(); ++i) {
        uint8_t r = roughness.bytes()[i * roughness.channels()];
        out[i * 4 + 0] = static_cast<uint8_t>(255 - r);
        out[i * 4 + 1] = DEFAULT_DIELECTRIC_F0;
        out[i * 4 + 2] = 0;
        out[i * 4 + 3] = 0;
    }
    return PixelBuffer(roughness.width(), roughness.height(), 4, std::move(out));
}

PixelBuffer packNormal(const PixelBuffer& normal, const PixelBuffer* ao, const PixelBuffer* height) {
    std::optional<PixelBuffer> aoSized;
    std::optional<PixelBuffer> heightSized;
    if (ao) aoSized = matchSize(*ao, normal);
    if (height) heightSized = matchSize(*height, normal);

    const uint32_t nc = normal.channels();
    std::vector<uint8_t> out(normal.pixelCount() * 4);
    for (size_t i = 0; i < normal.pixelCount(); ++i) {
        out[i * 4 + 0] = normal.bytes()[i * nc];
        out[i * 4 + 1] = nc > 1 ? normal.bytes()[i * nc + 1] : normal.bytes()[i * nc];
        out[i * 4 + 2] = aoSized ? aoSized->bytes()[i * aoSized->channels()] : 255;
        // Height 0 breaks parallax occlusion, keep it at 1 or above
        out[i * 4 + 3] = heightSized
            ? std::max<uint8_t>(1, heightSized->bytes()[i * heightSized->channels()])
            : 255;
    }
    return PixelBuffer(normal.width(), normal.height(), 4, std::move(out));
}

Result<std::vector<PackedTexture>> packOutputs(const MaterialMapSet& maps, const std::string& sourcePath) {
    using Outputs = std::vector<PackedTexture>;
    Outputs outputs;

    if (!maps.baseColor.empty()) {
        outputs.push_back({labPBRFilename(sourcePath, TextureRole::Base), TextureRole::Base, maps.baseColor});
    }
    if (!maps.specular.empty()) {
        outputs.push_back({labPBRFilename(sourcePath, TextureRole::Specular), TextureRole::Specular, maps.specular});
    }

    if (maps.normal.empty()) {
        if (!maps.height.empty()) {
            outputs.push_back({labPBRFilename(sourcePath, TextureRole::Height), TextureRole::Height, maps.height});
        }
        if (!maps.ao.empty()) {
            outputs.push_back({labPBRFilename(sourcePath, TextureRole::AmbientOcclusion),
                               TextureRole::AmbientOcclusion, maps.ao});
        }
        return Result<Outputs>::success(std::move(outputs));
    }

    Result<std::optional<PixelBuffer>> normal = decodeOptional(maps.normal);
    if (!normal) return Result<Outputs>::failure(normal.error());
    Result<std::optional<PixelBuffer>> ao = decodeOptional(maps.ao);
    if (!ao) return Result<Outputs>::failure(ao.error());
    Result<std::optional<PixelBuffer>> height = decodeOptional(maps.height);
    if (!height) return Result<Outputs>::failure(height.error());

    const PixelBuffer* aoPtr = ao.value() ? &*ao.value() : nullptr;
    const PixelBuffer* heightPtr = height.value() ? &*height.value() : nullptr;
    PixelBuffer packed = packNormal(*normal.value(), aoPtr, heightPtr);

    Result<std::vector<uint8_t>> encoded = ImageCodec::encodePng(packed);
    if (!encoded) return Result<Outputs>::failure(encoded.error());

    outputs.push_back({labPBRFilename(sourcePath, TextureRole::Normal), TextureRole::Normal,
                       std::move(encoded).value()});
    return Result<Outputs>::success(std::move(outputs));
}

} // namespace LabPBRPacker
} // namespace LabPBR
