#pragma once

#include "MaterialCatalog.h"
#include "core/Result.h"
#include "image/PixelBuffer.h"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace LabPBR {

struct MaterialMatch {
    std::string name;
    std::string category;
    uint8_t f0 = 0;
    std::optional<double> reflectance;  // Percent
    std::optional<double> ior;
    std::optional<RGB8> rgbF0;
    double difference = 0.0;
    std::string notes;
};

// Aggregate statistics of a LabPBR specular texture.
// Optional fields stay empty when the population they average over is empty.
struct MaterialReport {
    uint32_t width = 0;
    uint32_t height = 0;

    double avgRed = 0.0;
    double avgRedPct = 0.0;
    double avgGreen = 0.0;
    double avgBlue = 0.0;
    double avgAlpha = 0.0;

    double greenF0CoveragePct = 0.0;
    double greenMetalCoveragePct = 0.0;
    std::optional<double> avgF0Encoded;
    std::optional<double> avgF0Percent;
    std::optional<uint8_t> topMetalCode;
    std::optional<std::string> topMetalName;

    double porosityCoveragePct = 0.0;
    double sssCoveragePct = 0.0;
    std::optional<double> avgPorosityPct;
    std::optional<double> avgSSSPct;

    double avgEmissionPct = 0.0;

    std::optional<MaterialMatch> closestMaterial;
    std::map<uint8_t, uint32_t> redDistribution;
    std::vector<std::string> warnings;
};

namespace MaterialAnalyzer {

// Single pass over an RGBA view of the image (gray replicates, missing alpha is 255)
MaterialReport analyze(const PixelBuffer& image);

// Decode then analyze; DecodeError when the bytes are not an image
Result<MaterialReport> analyzeEncoded(const std::vector<uint8_t>& bytes, const std::string& filenameHint = "");

} // namespace MaterialAnalyzer

} // namespace LabPBR
