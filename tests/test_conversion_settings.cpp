#include <doctest/doctest.h>
#include "jobs/ConversionSettings.h"
#include "service/ServiceConfig.h"
#include <nlohmann/json.hpp>

using namespace LabPBR;

TEST_SUITE("ConversionSettings") {
    TEST_CASE("empty string gives the defaults") {
        Result<ConversionSettings> settings = ConversionSettings::fromJsonString("");
        REQUIRE(settings);
        const ConversionSettings& s = settings.value();
        CHECK(s.generateBaseColor);
        CHECK(s.generateRoughness);
        CHECK(s.generateNormal);
        CHECK(s.generateHeight);
        CHECK(s.generateAO);
        CHECK(s.baseColorContrast == doctest::Approx(1.2f));
        CHECK(s.roughnessIntensity == doctest::Approx(0.8f));
        CHECK_FALSE(s.roughnessInvert);
        CHECK(s.normalStrength == doctest::Approx(1.0f));
        CHECK(s.heightDepth == doctest::Approx(0.25f));
        CHECK(s.aoRadius == doctest::Approx(0.5f));
        CHECK(s.inputType == InputType::Single);
    }

    TEST_CASE("partial JSON overrides only the given keys") {
        Result<ConversionSettings> settings = ConversionSettings::fromJsonString(
            R"({"generateAO": false, "normalStrength": 2.5, "inputType": "resourcepack", "futureKey": 1})");
        REQUIRE(settings);
        CHECK_FALSE(settings.value().generateAO);
        CHECK(settings.value().normalStrength == doctest::Approx(2.5f));
        CHECK(settings.value().inputType == InputType::ResourcePack);
        CHECK(settings.value().generateNormal);
    }

    TEST_CASE("range and type violations are SettingsError") {
        const char* invalid[] = {
            R"({"baseColorContrast": 2.5})",
            R"({"roughnessIntensity": -0.1})",
            R"({"normalStrength": 3.01})",
            R"({"heightDepth": "deep"})",
            R"({"generateNormal": 1})",
            R"({"inputType": "folder"})",
            R"([1, 2, 3])",
        };
        for (const char* text : invalid) {
            CAPTURE(text);
            Result<ConversionSettings> settings = ConversionSettings::fromJsonString(text);
            REQUIRE_FALSE(settings);
            CHECK(settings.error().kind == ErrorKind::SettingsError);
        }
    }

    TEST_CASE("range bounds are inclusive") {
        Result<ConversionSettings> settings = ConversionSettings::fromJsonString(
            R"({"baseColorContrast": 0, "normalStrength": 3, "aoRadius": 1})");
        REQUIRE(settings);
        CHECK(settings.value().normalStrength == doctest::Approx(3.0f));
    }

    TEST_CASE("malformed JSON") {
        Result<ConversionSettings> settings = ConversionSettings::fromJsonString("{not json");
        REQUIRE_FALSE(settings);
        CHECK(settings.error().kind == ErrorKind::SettingsError);
        CHECK(settings.error().message.rfind("Invalid settings JSON", 0) == 0);
    }

    TEST_CASE("toJson feeds back into fromJson") {
        ConversionSettings original;
        original.roughnessInvert = true;
        original.inputType = InputType::Sequence;

        nlohmann::json j = original.toJson();
        CHECK(j["inputType"] == "sequence");

        Result<ConversionSettings> parsed = ConversionSettings::fromJson(j);
        REQUIRE(parsed);
        CHECK(parsed.value().roughnessInvert);
        CHECK(parsed.value().inputType == InputType::Sequence);
    }
}

TEST_SUITE("ServiceConfig") {
    TEST_CASE("defaults") {
        ServiceConfig config;
        CHECK(config.workerCount == 2);
        CHECK(config.normalConvention == NormalConvention::DirectX);
        CHECK(config.gradientKernel == GradientKernel::Sobel);
        CHECK(config.depthRetry.maxRetries == 5);
        CHECK(config.depthModel == "jingheya/lotus-depth-g-v1-0");
        CHECK(config.pack.packFormat == 15);
    }

    TEST_CASE("loads every section") {
        ServiceConfig config = ServiceConfig::loadFromJsonString(R"({
            "workerCount": 4,
            "normalConvention": "opengl",
            "gradientKernel": "central",
            "depth": {"maxRetries": 2, "maxWaitSeconds": 10, "model": "org/other-depth"},
            "pack": {"format": 34, "description": "Custom"}
        })");
        CHECK(config.workerCount == 4);
        CHECK(config.normalConvention == NormalConvention::OpenGL);
        CHECK(config.gradientKernel == GradientKernel::CentralDiff);
        CHECK(config.depthRetry.maxRetries == 2);
        CHECK(config.depthRetry.maxWaitSeconds == doctest::Approx(10.0f));
        CHECK(config.depthRetry.defaultWaitSeconds == doctest::Approx(5.0f));
        CHECK(config.depthModel == "org/other-depth");
        CHECK(config.pack.packFormat == 34);
        CHECK(config.pack.description == "Custom");
    }

    TEST_CASE("bad values fall back") {
        ServiceConfig config = ServiceConfig::loadFromJsonString(R"({"workerCount": 0, "normalConvention": "metal"})");
        CHECK(config.workerCount == 1);
        CHECK(config.normalConvention == NormalConvention::DirectX);

        ServiceConfig broken = ServiceConfig::loadFromJsonString("{{{");
        CHECK(broken.workerCount == 2);

        ServiceConfig missing = ServiceConfig::loadFromFile("/nonexistent/labpbr-config.json");
        CHECK(missing.workerCount == 2);
    }
}
