#include <doctest/doctest.h>
#include "synthesis/TextureProcessor.h"
#include "TestFixtures.h"
#include <atomic>

using namespace LabPBR;

namespace {

class FailingDepthEstimator : public DepthEstimator {
public:
    Result<PixelBuffer> estimate(const PixelBuffer&) override {
        return Result<PixelBuffer>::failure(ErrorKind::DepthUnavailable, "Model test/depth is busy");
    }
    std::string name() const override { return "failing"; }
};

class CountingDepthEstimator : public DepthEstimator {
public:
    explicit CountingDepthEstimator(PixelBuffer depth) : depth_(std::move(depth)) {}

    Result<PixelBuffer> estimate(const PixelBuffer&) override {
        ++calls;
        return Result<PixelBuffer>::success(depth_);
    }
    std::string name() const override { return "counting"; }

    std::atomic<int> calls{0};

private:
    PixelBuffer depth_;
};

ConversionSettings nothingEnabled() {
    ConversionSettings settings;
    settings.generateBaseColor = false;
    settings.generateRoughness = false;
    settings.generateNormal = false;
    settings.generateHeight = false;
    settings.generateAO = false;
    return settings;
}

} // namespace

TEST_SUITE("TextureProcessor") {
    TEST_CASE("default settings produce every map at source size") {
        TextureProcessor processor;
        std::vector<uint8_t> source = TestFixtures::encodeRGBA(TestFixtures::solidRGBA(8, 4, 120, 90, 60, 255));

        Result<MaterialMapSet> maps = processor.process(source, ConversionSettings{});
        REQUIRE(maps);
        CHECK(maps.value().generatedCount() == 5);

        for (const auto* map : {&maps.value().baseColor, &maps.value().normal, &maps.value().specular,
                                &maps.value().height, &maps.value().ao}) {
            Result<PixelBuffer> decoded = ImageCodec::decode(*map);
            REQUIRE(decoded);
            CHECK(decoded.value().width() == 8);
            CHECK(decoded.value().height() == 4);
        }

        Result<PixelBuffer> specular = ImageCodec::decode(maps.value().specular);
        REQUIRE(specular.value().channels() == 4);
        CHECK(specular.value().at(0, 0, 1) == DEFAULT_DIELECTRIC_F0);
        CHECK(specular.value().at(0, 0, 3) == 0);

        // A flat source has no slope
        Result<PixelBuffer> normal = ImageCodec::decode(maps.value().normal);
        CHECK(normal.value().at(3, 2, 0) == 128);
        CHECK(normal.value().at(3, 2, 2) == 255);
    }

    TEST_CASE("disabled maps are empty") {
        TextureProcessor processor;
        Result<MaterialMapSet> maps = processor.processImage(TestFixtures::rampRGB(4, 4), nothingEnabled());
        REQUIRE(maps);
        CHECK(maps.value().generatedCount() == 0);
        CHECK(maps.value().baseColor.empty());
        CHECK(maps.value().normal.empty());
    }

    TEST_CASE("zero-size source is InvalidDimensions") {
        TextureProcessor processor;
        Result<MaterialMapSet> maps = processor.processImage(PixelBuffer(), ConversionSettings{});
        REQUIRE_FALSE(maps);
        CHECK(maps.error().kind == ErrorKind::InvalidDimensions);
    }

    TEST_CASE("undecodable source is DecodeError") {
        TextureProcessor processor;
        Result<MaterialMapSet> maps = processor.process(TestFixtures::textBytes("xyz"), ConversionSettings{});
        REQUIRE_FALSE(maps);
        CHECK(maps.error().kind == ErrorKind::DecodeError);
    }

    TEST_CASE("depth estimator failure fails the image") {
        TextureProcessor processor(std::make_shared<FailingDepthEstimator>());
        Result<MaterialMapSet> maps = processor.processImage(TestFixtures::rampRGB(4, 4), ConversionSettings{});
        REQUIRE_FALSE(maps);
        CHECK(maps.error().kind == ErrorKind::DepthUnavailable);
    }

    TEST_CASE("estimator is only asked when normals or height are wanted") {
        auto estimator = std::make_shared<CountingDepthEstimator>(PixelBuffer::filled(2, 2, 1, 50));
        TextureProcessor processor(estimator);

        ConversionSettings settings = nothingEnabled();
        settings.generateBaseColor = true;
        settings.generateAO = true;
        REQUIRE(processor.processImage(TestFixtures::rampRGB(4, 4), settings));
        CHECK(estimator->calls.load() == 0);

        settings.generateHeight = true;
        REQUIRE(processor.processImage(TestFixtures::rampRGB(4, 4), settings));
        CHECK(estimator->calls.load() == 1);
    }

    TEST_CASE("estimated depth is resampled to the source and used as height") {
        auto estimator = std::make_shared<CountingDepthEstimator>(PixelBuffer::filled(2, 2, 1, 50));
        TextureProcessor processor(estimator);

        ConversionSettings settings = nothingEnabled();
        settings.generateHeight = true;
        Result<MaterialMapSet> maps = processor.processImage(TestFixtures::rampRGB(8, 8), settings);
        REQUIRE(maps);

        Result<PixelBuffer> height = ImageCodec::decode(maps.value().height);
        REQUIRE(height);
        CHECK(height.value().width() == 8);
        CHECK(height.value().channels() == 1);
        CHECK(height.value().at(7, 7, 0) == 50);
    }

    TEST_CASE("roughness inversion and intensity") {
        PixelBuffer gray(1, 1, 1, {200});
        CHECK(TextureProcessor::roughness(gray, 1.0f, false).at(0, 0, 0) == 200);
        CHECK(TextureProcessor::roughness(gray, 1.0f, true).at(0, 0, 0) == 55);
        CHECK(TextureProcessor::roughness(gray, 0.5f, false).at(0, 0, 0) == 100);
    }

    TEST_CASE("base colour with contrast 1 is unchanged") {
        PixelBuffer source = TestFixtures::rampRGB(4, 1);
        CHECK(TextureProcessor::baseColor(source, 1.0f).bytes() == source.bytes());
    }

    TEST_CASE("contrast stretches around 128 and clamps") {
        PixelBuffer source(2, 1, 3, {100, 100, 100, 200, 200, 200});
        PixelBuffer stretched = TextureProcessor::baseColor(source, 2.0f);
        CHECK(stretched.at(0, 0, 0) == 72);
        CHECK(stretched.at(1, 0, 0) == 255);

        PixelBuffer flattened = TextureProcessor::baseColor(source, 0.0f);
        CHECK(flattened.at(0, 0, 0) == 128);
        CHECK(flattened.at(1, 0, 2) == 128);
    }

    TEST_CASE("base colour contrast keeps alpha") {
        TextureProcessor processor;
        ConversionSettings settings = nothingEnabled();
        settings.generateBaseColor = true;
        settings.baseColorContrast = 2.0f;

        Result<MaterialMapSet> maps = processor.process(TestFixtures::solidPng(4, 4, 100, 200, 128, 90), settings);
        REQUIRE(maps);
        Result<PixelBuffer> base = ImageCodec::decode(maps.value().baseColor);
        REQUIRE(base);
        REQUIRE(base.value().channels() == 4);
        CHECK(base.value().at(1, 1, 0) == 72);
        CHECK(base.value().at(1, 1, 1) == 255);
        CHECK(base.value().at(1, 1, 2) == 128);
        CHECK(base.value().at(1, 1, 3) == 90);
    }

    TEST_CASE("approximate height scales by heightDepth") {
        PixelBuffer gray = PixelBuffer::filled(4, 4, 1, 200);
        CHECK(TextureProcessor::approximateHeight(gray, 1.0f).at(2, 2, 0) == 200);
        CHECK(TextureProcessor::approximateHeight(gray, 0.25f).at(2, 2, 0) == 50);
        CHECK(TextureProcessor::approximateHeight(gray, 0.0f).at(2, 2, 0) == 0);

        TextureProcessor processor;
        ConversionSettings settings = nothingEnabled();
        settings.generateHeight = true;
        settings.heightDepth = 0.5f;
        Result<MaterialMapSet> maps = processor.process(TestFixtures::solidPng(4, 4, 200, 200, 200, 255), settings);
        REQUIRE(maps);
        Result<PixelBuffer> height = ImageCodec::decode(maps.value().height);
        REQUIRE(height);
        CHECK(height.value().at(0, 0, 0) == 100);
        CHECK(height.value().at(3, 3, 0) == 100);
    }

    TEST_CASE("ambient occlusion darkens to 70 percent") {
        PixelBuffer gray = PixelBuffer::filled(4, 4, 1, 200);
        PixelBuffer ao = TextureProcessor::ambientOcclusion(gray, 0.5f);
        REQUIRE(ao.channels() == 1);
        CHECK(ao.at(0, 0, 0) == 140);
        CHECK(ao.at(3, 3, 0) == 140);

        TextureProcessor processor;
        ConversionSettings settings = nothingEnabled();
        settings.generateAO = true;
        settings.aoRadius = 0.0f;
        Result<MaterialMapSet> maps = processor.process(TestFixtures::solidPng(4, 4, 200, 200, 200, 255), settings);
        REQUIRE(maps);
        Result<PixelBuffer> decoded = ImageCodec::decode(maps.value().ao);
        REQUIRE(decoded);
        CHECK(decoded.value().at(2, 1, 0) == 140);
    }

    TEST_CASE("ambient occlusion radius is aoRadius * 10, at least 1") {
        // Black left half, white right half
        std::vector<uint8_t> bytes;
        for (uint32_t y = 0; y < 8; ++y) {
            for (uint32_t x = 0; x < 8; ++x) {
                bytes.push_back(x < 4 ? 0 : 255);
            }
        }
        PixelBuffer step(8, 8, 1, bytes);

        PixelBuffer zero = TextureProcessor::ambientOcclusion(step, 0.0f);
        PixelBuffer tenth = TextureProcessor::ambientOcclusion(step, 0.1f);
        PixelBuffer half = TextureProcessor::ambientOcclusion(step, 0.5f);

        // A zero radius still blurs with radius 1
        CHECK(zero.bytes() == tenth.bytes());
        CHECK(zero.at(3, 4, 0) > 0);
        CHECK(zero.at(3, 4, 0) < 179);
        CHECK(zero.bytes() != half.bytes());

        // Wider blur pulls more light across the edge
        CHECK(half.at(1, 4, 0) > zero.at(1, 4, 0));
    }
}
