#include "LabPBRFormat.h"
#include <array>

namespace LabPBR {

namespace {

constexpr std::array<MetalCode, 8> METAL_CODES = {{
    {230, "Iron"},
    {231, "Gold"},
    {232, "Aluminum"},
    {233, "Chrome"},
    {234, "Copper"},
    {235, "Lead"},
    {236, "Platinum"},
    {237, "Silver"},
}};

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

struct PathParts {
    std::string dir;   // Includes the trailing '/'
    std::string stem;
    std::string ext;   // Includes the '.'
};

PathParts splitPath(const std::string& path) {
    PathParts parts;
    size_t slash = path.find_last_of("/\\");
    std::string file = path;
    if (slash != std::string::npos) {
        parts.dir = path.substr(0, slash + 1);
        file = path.substr(slash + 1);
    }
    size_t dot = file.find_last_of('.');
    if (dot != std::string::npos && dot > 0) {
        parts.stem = file.substr(0, dot);
        parts.ext = file.substr(dot);
    } else {
        parts.stem = file;
    }
    return parts;
}

} // namespace

const char* metalName(uint8_t code) {
    for (const auto& metal : METAL_CODES) {
        if (metal.code == code) return metal.name;
    }
    return nullptr;
}

bool isDielectricF0(uint8_t green) {
    return green <= MAX_DIELECTRIC_F0;
}

bool isPredefinedMetal(uint8_t green) {
    return green >= FIRST_METAL_CODE && green <= LAST_METAL_CODE;
}

bool isReservedF0(uint8_t green) {
    return green > LAST_METAL_CODE && green < ALBEDO_METAL_CODE;
}

float porosityFraction(uint8_t blue) {
    return static_cast<float>(blue) / MAX_POROSITY;
}

float sssFraction(uint8_t blue) {
    return static_cast<float>(blue - FIRST_SSS) / 190.0f;
}

const char* textureRoleName(TextureRole role) {
    switch (role) {
        case TextureRole::Base:             return "base";
        case TextureRole::Normal:           return "normal";
        case TextureRole::Specular:         return "specular";
        case TextureRole::Emission:         return "emission";
        case TextureRole::Height:           return "height";
        case TextureRole::AmbientOcclusion: return "ao";
    }
    return "base";
}

const char* textureKindName(TextureKind kind) {
    switch (kind) {
        case TextureKind::Specular: return "specular";
        case TextureKind::Normal:   return "normal";
        case TextureKind::Unknown:  return "unknown";
    }
    return "unknown";
}

std::optional<TextureKind> parseTextureKind(const std::string& name) {
    if (name == "specular") return TextureKind::Specular;
    if (name == "normal") return TextureKind::Normal;
    if (name == "unknown") return TextureKind::Unknown;
    return std::nullopt;
}

TextureRole detectTextureType(const std::string& path) {
    const std::string stem = splitPath(path).stem;
    if (endsWith(stem, "_n")) return TextureRole::Normal;
    if (endsWith(stem, "_s")) return TextureRole::Specular;
    if (endsWith(stem, "_e")) return TextureRole::Emission;
    if (endsWith(stem, "_h")) return TextureRole::Height;
    if (endsWith(stem, "_ao")) return TextureRole::AmbientOcclusion;
    return TextureRole::Base;
}

TextureKind validatorKindFor(TextureRole role) {
    switch (role) {
        case TextureRole::Normal:   return TextureKind::Normal;
        case TextureRole::Specular: return TextureKind::Specular;
        default:                    return TextureKind::Unknown;
    }
}

std::string labPBRFilename(const std::string& path, TextureRole role) {
    PathParts parts = splitPath(path);
    std::string suffix;
    switch (role) {
        case TextureRole::Base:             break;
        case TextureRole::Normal:           suffix = "_n"; break;
        case TextureRole::Specular:         suffix = "_s"; break;
        case TextureRole::Emission:         suffix = "_e"; break;
        case TextureRole::Height:           suffix = "_h"; break;
        case TextureRole::AmbientOcclusion: suffix = "_ao"; break;
    }
    return parts.dir + parts.stem + suffix + ".png";
}

} // namespace LabPBR
