#include "ConversionSettings.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace LabPBR {

const char* inputTypeName(InputType type) {
    switch (type) {
        case InputType::Single:       return "single";
        case InputType::Sequence:     return "sequence";
        case InputType::ResourcePack: return "resourcepack";
    }
    return "single";
}

std::optional<InputType> parseInputType(const std::string& name) {
    if (name == "single") return InputType::Single;
    if (name == "sequence") return InputType::Sequence;
    if (name == "resourcepack") return InputType::ResourcePack;
    return std::nullopt;
}

namespace {

Status settingsError(const std::string& message) {
    return Status::failure(ErrorKind::SettingsError, message);
}

Status readBool(const json& j, const char* key, bool& out) {
    if (!j.contains(key)) return Status::ok();
    const json& v = j.at(key);
    if (!v.is_boolean()) {
        return settingsError(std::string(key) + " must be a boolean");
    }
    out = v.get<bool>();
    return Status::ok();
}

Status readRange(const json& j, const char* key, float minValue, float maxValue, float& out) {
    if (!j.contains(key)) return Status::ok();
    const json& v = j.at(key);
    if (!v.is_number()) {
        return settingsError(std::string(key) + " must be a number");
    }
    float value = v.get<float>();
    if (value < minValue || value > maxValue) {
        return settingsError(std::string(key) + " must be between " + json(minValue).dump() +
                             " and " + json(maxValue).dump());
    }
    out = value;
    return Status::ok();
}

} // namespace

Result<ConversionSettings> ConversionSettings::fromJson(const json& j) {
    if (!j.is_object()) {
        return Result<ConversionSettings>::failure(ErrorKind::SettingsError, "Settings must be a JSON object");
    }

    ConversionSettings s;
    const Status checks[] = {
        readBool(j, "generateBaseColor", s.generateBaseColor),
        readBool(j, "generateRoughness", s.generateRoughness),
        readBool(j, "generateNormal", s.generateNormal),
        readBool(j, "generateHeight", s.generateHeight),
        readBool(j, "generateAO", s.generateAO),
        readRange(j, "baseColorContrast", 0.0f, 2.0f, s.baseColorContrast),
        readRange(j, "roughnessIntensity", 0.0f, 1.0f, s.roughnessIntensity),
        readBool(j, "roughnessInvert", s.roughnessInvert),
        readRange(j, "normalStrength", 0.0f, 3.0f, s.normalStrength),
        readRange(j, "heightDepth", 0.0f, 1.0f, s.heightDepth),
        readRange(j, "aoRadius", 0.0f, 1.0f, s.aoRadius),
    };
    for (const Status& check : checks) {
        if (!check) {
            return Result<ConversionSettings>::failure(check.error());
        }
    }

    if (j.contains("inputType")) {
        const json& v = j.at("inputType");
        std::optional<InputType> type = v.is_string() ? parseInputType(v.get<std::string>()) : std::nullopt;
        if (!type) {
            return Result<ConversionSettings>::failure(ErrorKind::SettingsError,
                "inputType must be one of single, sequence, resourcepack");
        }
        s.inputType = *type;
    }

    return Result<ConversionSettings>::success(s);
}

Result<ConversionSettings> ConversionSettings::fromJsonString(const std::string& jsonString) {
    if (jsonString.empty()) {
        return Result<ConversionSettings>::success(ConversionSettings{});
    }

    try {
        json j = json::parse(jsonString);
        return fromJson(j);
    } catch (const json::exception& e) {
        return Result<ConversionSettings>::failure(ErrorKind::SettingsError,
            std::string("Invalid settings JSON: ") + e.what());
    }
}

json ConversionSettings::toJson() const {
    return json{
        {"generateBaseColor", generateBaseColor},
        {"generateRoughness", generateRoughness},
        {"generateNormal", generateNormal},
        {"generateHeight", generateHeight},
        {"generateAO", generateAO},
        {"baseColorContrast", baseColorContrast},
        {"roughnessIntensity", roughnessIntensity},
        {"roughnessInvert", roughnessInvert},
        {"normalStrength", normalStrength},
        {"heightDepth", heightDepth},
        {"aoRadius", aoRadius},
        {"inputType", inputTypeName(inputType)},
    };
}

} // namespace LabPBR
