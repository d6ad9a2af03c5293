#pragma once

#include "LabPBRFormat.h"
#include "core/Result.h"
#include "image/PixelBuffer.h"
#include <string>
#include <vector>

namespace LabPBR {

struct MaterialMapSet;

// One file of the converted output, already PNG encoded
struct PackedTexture {
    std::string path;
    TextureRole role = TextureRole::Base;
    std::vector<uint8_t> bytes;
};

/**
 * LabPBRPacker - lays generated maps out in LabPBR channels
 *
 *   _s  R = smoothness (255 - roughness), G = F0 10, B = 0, A = 0
 *   _n  R/G = normal XY, B = AO (255 without AO), A = height >= 1 (255 without height)
 *
 * Height and AO without a normal map are written on their own as _h / _ao.
 */
namespace LabPBRPacker {

// roughness is read from channel 0
PixelBuffer packSpecular(const PixelBuffer& roughness);

// ao and height may be nullptr; they are resampled to the normal map size if needed
PixelBuffer packNormal(const PixelBuffer& normal, const PixelBuffer* ao, const PixelBuffer* height);

// Output files for one source texture, named after sourcePath
Result<std::vector<PackedTexture>> packOutputs(const MaterialMapSet& maps, const std::string& sourcePath);

} // namespace LabPBRPacker

} // namespace LabPBR
