#include "MaterialAnalyzer.h"
#include "LabPBRFormat.h"
#include "image/ImageCodec.h"
#include <cmath>

namespace LabPBR {
namespace MaterialAnalyzer {

namespace {

double toPercent(double value, double max) {
    if (max == 0.0) return 0.0;
    return value / max * 100.0;
}

double emissionPctFromAlpha(double alpha) {
    return alpha == 255.0 ? 0.0 : alpha / MAX_EMISSION * 100.0;
}

MaterialMatch matchFor(double avgF0Encoded) {
    const CatalogMaterial& best = MaterialCatalog::nearest(static_cast<float>(avgF0Encoded));

    MaterialMatch match;
    match.name = best.name;
    match.category = best.category;
    match.f0 = best.f0;
    if (best.f0Percent) {
        match.reflectance = *best.f0Percent;
    } else if (best.ior) {
        match.reflectance = MaterialCatalog::f0PercentFromIOR(*best.ior);
    }
    if (best.ior) {
        match.ior = *best.ior;
    }
    match.rgbF0 = best.rgbF0;
    match.difference = std::fabs(avgF0Encoded - best.f0);
    match.notes = best.notes;
    return match;
}

} // namespace

MaterialReport analyze(const PixelBuffer& image) {
    MaterialReport report;
    report.width = image.width();
    report.height = image.height();

    const size_t totalPixels = image.pixelCount();
    if (totalPixels == 0) {
        report.warnings.push_back("Green channel has no LabPBR content (expected F0 or metal codes).");
        report.warnings.push_back("Texture has no pixel data.");
        return report;
    }

    PixelBuffer rgba = image.toRGBA();
    const std::vector<uint8_t>& data = rgba.bytes();

    uint64_t sumR = 0, sumG = 0, sumB = 0, sumA = 0;
    uint64_t f0Count = 0, f0Sum = 0, metalCount = 0;
    std::map<uint8_t, uint32_t> metalBins;
    uint64_t porosityCount = 0, sssCount = 0;
    double porositySum = 0.0, sssSum = 0.0;

    for (size_t i = 0; i < totalPixels; ++i) {
        uint8_t r = data[i * 4 + 0];
        uint8_t g = data[i * 4 + 1];
        uint8_t b = data[i * 4 + 2];
        uint8_t a = data[i * 4 + 3];

        sumR += r;
        sumG += g;
        sumB += b;
        sumA += a;
        ++report.redDistribution[r];

        if (isDielectricF0(g)) {
            ++f0Count;
            f0Sum += g;
        } else {
            ++metalCount;
            ++metalBins[g];
        }

        if (b <= MAX_POROSITY) {
            ++porosityCount;
            porositySum += porosityFraction(b);
        } else {
            ++sssCount;
            sssSum += sssFraction(b);
        }
    }

    const double n = static_cast<double>(totalPixels);
    report.avgRed = sumR / n;
    report.avgRedPct = toPercent(report.avgRed, 255.0);
    report.avgGreen = sumG / n;
    report.avgBlue = sumB / n;
    report.avgAlpha = sumA / n;

    if (f0Count > 0) {
        report.avgF0Encoded = static_cast<double>(f0Sum) / f0Count;
        report.avgF0Percent = toPercent(*report.avgF0Encoded, 255.0);
    }

    // Mode of the metal histogram, map order resolves ties to the lowest code
    uint32_t topCount = 0;
    for (const auto& [code, count] : metalBins) {
        if (count > topCount) {
            topCount = count;
            report.topMetalCode = code;
        }
    }
    if (report.topMetalCode) {
        if (const char* name = metalName(*report.topMetalCode)) {
            report.topMetalName = name;
        }
    }

    report.greenF0CoveragePct = toPercent(static_cast<double>(f0Count), n);
    report.greenMetalCoveragePct = toPercent(static_cast<double>(metalCount), n);
    report.porosityCoveragePct = toPercent(static_cast<double>(porosityCount), n);
    report.sssCoveragePct = toPercent(static_cast<double>(sssCount), n);
    if (porosityCount > 0) {
        report.avgPorosityPct = porositySum / porosityCount * 100.0;
    }
    if (sssCount > 0) {
        report.avgSSSPct = sssSum / sssCount * 100.0;
    }
    report.avgEmissionPct = emissionPctFromAlpha(report.avgAlpha);

    if (report.avgF0Encoded) {
        report.closestMaterial = matchFor(*report.avgF0Encoded);
    }

    if (report.greenF0CoveragePct == 0.0 && report.greenMetalCoveragePct == 0.0) {
        report.warnings.push_back("Green channel has no LabPBR content (expected F0 or metal codes).");
    }
    if (report.greenF0CoveragePct > 0.0 && report.greenMetalCoveragePct > 0.0) {
        report.warnings.push_back("Texture mixes dielectric F0 and metal codes; ensure masks are intentional.");
    }
    if (report.topMetalCode && !isPredefinedMetal(*report.topMetalCode)) {
        report.warnings.push_back("Green channel uses metal codes outside the standard 230-237 range.");
    }
    if (report.avgF0Encoded && *report.avgF0Encoded > MAX_DIELECTRIC_F0) {
        report.warnings.push_back("Average F0 exceeds dielectric range; clamp to 0-229 for non-metals.");
    }
    if (report.avgAlpha >= 250.0 && report.avgAlpha != 255.0) {
        report.warnings.push_back("High alpha values imply strong emission; verify emission intent.");
    }
    if (report.sssCoveragePct > 0.0 && report.porosityCoveragePct > 0.0) {
        report.warnings.push_back("Blue channel mixes porosity and SSS; verify masks are separated.");
    }

    return report;
}

Result<MaterialReport> analyzeEncoded(const std::vector<uint8_t>& bytes, const std::string& filenameHint) {
    Result<PixelBuffer> decoded = ImageCodec::decode(bytes, filenameHint);
    if (!decoded) {
        return Result<MaterialReport>::failure(decoded.error());
    }
    return Result<MaterialReport>::success(analyze(decoded.value()));
}

} // namespace MaterialAnalyzer
} // namespace LabPBR
