#pragma once

#include "core/Result.h"
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>

namespace LabPBR {

enum class InputType {
    Single,
    Sequence,
    ResourcePack
};

const char* inputTypeName(InputType type);
std::optional<InputType> parseInputType(const std::string& name);

/**
 * ConversionSettings - per-job options for texture synthesis
 *
 * Loaded from JSON. Missing keys keep their defaults and unknown keys are
 * ignored; wrong types, out-of-range numbers and unknown enum strings are a
 * SettingsError.
 */
struct ConversionSettings {
    bool generateBaseColor = true;
    bool generateRoughness = true;
    bool generateNormal = true;
    bool generateHeight = true;
    bool generateAO = true;

    float baseColorContrast = 1.2f;     // [0, 2]
    float roughnessIntensity = 0.8f;    // [0, 1]
    bool roughnessInvert = false;
    float normalStrength = 1.0f;        // [0, 3]
    float heightDepth = 0.25f;          // [0, 1]
    float aoRadius = 0.5f;              // [0, 1]

    InputType inputType = InputType::Single;

    static Result<ConversionSettings> fromJson(const nlohmann::json& j);

    // An empty string yields the defaults
    static Result<ConversionSettings> fromJsonString(const std::string& jsonString);

    nlohmann::json toJson() const;
};

} // namespace LabPBR
