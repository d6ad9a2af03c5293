#pragma once

// LabPBR 1.3 channel constants and filename conventions shared by the
// validator, the analyzer, the packer and the resource pack codec.

#include <cstdint>
#include <optional>
#include <string>

namespace LabPBR {

constexpr const char* LABPBR_SPEC_VERSION = "1.3";

// Green channel (F0 / metalness)
constexpr uint8_t MAX_DIELECTRIC_F0 = 229;
constexpr uint8_t FIRST_METAL_CODE = 230;
constexpr uint8_t LAST_METAL_CODE = 237;
constexpr uint8_t ALBEDO_METAL_CODE = 255;  // Metal using albedo as F0

// Blue channel: 0..64 porosity, 65..255 subsurface scattering
constexpr uint8_t MAX_POROSITY = 64;
constexpr uint8_t FIRST_SSS = 65;

// Alpha channel: 0..254 emission, 255 is ignored by shaders
constexpr uint8_t MAX_EMISSION = 254;

// Default dielectric F0 written to generated specular maps (~4%)
constexpr uint8_t DEFAULT_DIELECTRIC_F0 = 10;

struct MetalCode {
    uint8_t code;
    const char* name;
};

// Named metals 230..237 in their fixed order, nullptr for any other value
const char* metalName(uint8_t code);

bool isDielectricF0(uint8_t green);
bool isPredefinedMetal(uint8_t green);
bool isReservedF0(uint8_t green);   // 238..254

float porosityFraction(uint8_t blue);  // v / 64
float sssFraction(uint8_t blue);       // (v - 65) / 190

enum class TextureRole {
    Base,
    Normal,             // _n
    Specular,           // _s
    Emission,           // _e
    Height,             // _h
    AmbientOcclusion    // _ao
};

const char* textureRoleName(TextureRole role);

// Kind passed to the channel validator
enum class TextureKind {
    Specular,
    Normal,
    Unknown
};

const char* textureKindName(TextureKind kind);
std::optional<TextureKind> parseTextureKind(const std::string& name);

// Role from the filename suffix before the extension
TextureRole detectTextureType(const std::string& path);

TextureKind validatorKindFor(TextureRole role);

// "<dir>/<stem><suffix>.png"; Base keeps the stem and only normalizes the
// extension, since every produced map is written as PNG.
std::string labPBRFilename(const std::string& path, TextureRole role);

} // namespace LabPBR
