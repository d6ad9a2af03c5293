#include <doctest/doctest.h>
#include "labpbr/MaterialAnalyzer.h"
#include "TestFixtures.h"
#include <algorithm>
#include <cmath>

using namespace LabPBR;
using TestFixtures::solidRGBA;

namespace {

bool hasWarning(const MaterialReport& report, const std::string& text) {
    return std::find(report.warnings.begin(), report.warnings.end(), text) != report.warnings.end();
}

} // namespace

TEST_SUITE("MaterialAnalyzer") {
    TEST_CASE("uniform dielectric") {
        MaterialReport report = MaterialAnalyzer::analyze(solidRGBA(4, 4, 128, 10, 0, 255));

        CHECK(report.width == 4);
        CHECK(report.height == 4);
        CHECK(report.avgRed == doctest::Approx(128.0));
        CHECK(report.avgGreen == doctest::Approx(10.0));
        CHECK(report.greenF0CoveragePct == doctest::Approx(100.0));
        CHECK(report.greenMetalCoveragePct == doctest::Approx(0.0));
        REQUIRE(report.avgF0Encoded.has_value());
        CHECK(*report.avgF0Encoded == doctest::Approx(10.0));
        CHECK(*report.avgF0Percent == doctest::Approx(10.0 / 255.0 * 100.0));
        CHECK_FALSE(report.topMetalCode.has_value());

        // Alpha 255 is "no emission"
        CHECK(report.avgEmissionPct == doctest::Approx(0.0));

        // Blue 0 is porosity 0
        CHECK(report.porosityCoveragePct == doctest::Approx(100.0));
        CHECK(*report.avgPorosityPct == doctest::Approx(0.0));
        CHECK_FALSE(report.avgSSSPct.has_value());

        REQUIRE(report.closestMaterial.has_value());
        CHECK(report.closestMaterial->difference == doctest::Approx(0.0));
        CHECK(report.closestMaterial->f0 == 10);

        REQUIRE(report.redDistribution.size() == 1);
        CHECK(report.redDistribution.at(128) == 16);
        CHECK(report.warnings.empty());
    }

    TEST_CASE("albedo metal code 255") {
        MaterialReport report = MaterialAnalyzer::analyze(solidRGBA(2, 2, 255, 255, 0, 0));

        CHECK(report.greenMetalCoveragePct == doctest::Approx(100.0));
        CHECK(report.greenF0CoveragePct == doctest::Approx(0.0));
        REQUIRE(report.topMetalCode.has_value());
        CHECK(*report.topMetalCode == 255);
        CHECK_FALSE(report.topMetalName.has_value());
        CHECK_FALSE(report.avgF0Encoded.has_value());
        CHECK_FALSE(report.closestMaterial.has_value());
        CHECK(hasWarning(report, "Green channel uses metal codes outside the standard 230-237 range."));
    }

    TEST_CASE("predefined metal is named") {
        MaterialReport report = MaterialAnalyzer::analyze(solidRGBA(2, 2, 255, 231, 0, 0));
        REQUIRE(report.topMetalName.has_value());
        CHECK(*report.topMetalName == "Gold");
        CHECK_FALSE(hasWarning(report, "Green channel uses metal codes outside the standard 230-237 range."));
    }

    TEST_CASE("mixed dielectric and metal pixels") {
        std::vector<uint8_t> bytes = {
            200, 10, 0, 0,
            200, 230, 0, 0,
            200, 230, 0, 0,
            200, 234, 0, 0,
        };
        MaterialReport report = MaterialAnalyzer::analyze(PixelBuffer(2, 2, 4, bytes));

        CHECK(report.greenF0CoveragePct == doctest::Approx(25.0));
        CHECK(report.greenMetalCoveragePct == doctest::Approx(75.0));
        CHECK(*report.topMetalCode == 230);
        CHECK(*report.topMetalName == "Iron");
        CHECK(hasWarning(report, "Texture mixes dielectric F0 and metal codes; ensure masks are intentional."));
    }

    TEST_CASE("porosity and subsurface scattering split on blue 64/65") {
        std::vector<uint8_t> bytes = {
            0, 10, 64, 0,
            0, 10, 65, 0,
        };
        MaterialReport report = MaterialAnalyzer::analyze(PixelBuffer(2, 1, 4, bytes));
        CHECK(report.porosityCoveragePct == doctest::Approx(50.0));
        CHECK(report.sssCoveragePct == doctest::Approx(50.0));
        CHECK(*report.avgPorosityPct == doctest::Approx(100.0));
        CHECK(*report.avgSSSPct == doctest::Approx(0.0));
        CHECK(hasWarning(report, "Blue channel mixes porosity and SSS; verify masks are separated."));
    }

    TEST_CASE("emission from alpha") {
        MaterialReport report = MaterialAnalyzer::analyze(solidRGBA(2, 2, 0, 10, 0, 127));
        CHECK(report.avgEmissionPct == doctest::Approx(50.0));

        MaterialReport bright = MaterialAnalyzer::analyze(solidRGBA(2, 2, 0, 10, 0, 254));
        CHECK(bright.avgEmissionPct == doctest::Approx(100.0));
        CHECK(hasWarning(bright, "High alpha values imply strong emission; verify emission intent."));
    }

    TEST_CASE("empty image yields no NaN") {
        MaterialReport report = MaterialAnalyzer::analyze(PixelBuffer());
        CHECK(report.width == 0);
        CHECK_FALSE(std::isnan(report.avgRed));
        CHECK_FALSE(std::isnan(report.greenF0CoveragePct));
        CHECK_FALSE(report.avgF0Encoded.has_value());
        CHECK_FALSE(report.closestMaterial.has_value());
        CHECK(hasWarning(report, "Texture has no pixel data."));
    }

    TEST_CASE("analyzeEncoded reports decode errors") {
        Result<MaterialReport> bad = MaterialAnalyzer::analyzeEncoded(TestFixtures::textBytes("nope"));
        REQUIRE_FALSE(bad);
        CHECK(bad.error().kind == ErrorKind::DecodeError);

        Result<MaterialReport> good = MaterialAnalyzer::analyzeEncoded(TestFixtures::solidPng(2, 2, 10, 10, 0, 0));
        REQUIRE(good);
        CHECK(good.value().avgGreen == doctest::Approx(10.0));
    }
}
