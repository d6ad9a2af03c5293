#include <doctest/doctest.h>
#include "image/ImageCodec.h"
#include "image/ImageFilters.h"
#include "image/PixelBuffer.h"
#include "TestFixtures.h"
#include <stdexcept>

using namespace LabPBR;

TEST_SUITE("PixelBuffer") {
    TEST_CASE("constructor rejects mismatched sizes") {
        CHECK_THROWS_AS(PixelBuffer(2, 2, 4, std::vector<uint8_t>(15)), std::invalid_argument);
        CHECK_THROWS_AS(PixelBuffer(1, 1, 5, std::vector<uint8_t>(5)), std::invalid_argument);
        CHECK_NOTHROW(PixelBuffer(2, 2, 1, std::vector<uint8_t>(4)));
    }

    TEST_CASE("sampleClamped snaps to the edge") {
        PixelBuffer image(2, 1, 1, {10, 20});
        CHECK(image.sampleClamped(-5, 0, 0) == 10);
        CHECK(image.sampleClamped(7, 3, 0) == 20);
    }

    TEST_CASE("toRGBA expands gray and missing alpha") {
        PixelBuffer gray(1, 1, 1, {42});
        PixelBuffer rgba = gray.toRGBA();
        CHECK(rgba.channels() == 4);
        CHECK(rgba.at(0, 0, 0) == 42);
        CHECK(rgba.at(0, 0, 2) == 42);
        CHECK(rgba.at(0, 0, 3) == 255);

        PixelBuffer grayAlpha(1, 1, 2, {7, 9});
        CHECK(grayAlpha.toRGBA().at(0, 0, 3) == 9);
    }
}

TEST_SUITE("ImageCodec") {
    TEST_CASE("detectFormat from magic bytes") {
        std::vector<uint8_t> png = TestFixtures::solidPng(1, 1, 0, 0, 0, 255);
        CHECK(ImageCodec::detectFormat(png) == ImageFormat::PNG);
        CHECK(ImageCodec::detectFormat({0xFF, 0xD8, 0xFF, 0xE0}) == ImageFormat::JPEG);
        CHECK(ImageCodec::detectFormat({'I', 'I', 0x2A, 0x00}) == ImageFormat::TIFF);
        CHECK(ImageCodec::detectFormat({'B', 'M', 0, 0}) == ImageFormat::BMP);

        // TGA has no signature
        CHECK(ImageCodec::detectFormat({0, 0, 2, 0}, "block.TGA") == ImageFormat::TGA);
        CHECK(ImageCodec::detectFormat({0, 0, 2, 0}) == ImageFormat::Unknown);
    }

    TEST_CASE("PNG round trip keeps the channel layout") {
        // Uniform alpha would be folded away by an auto-converting encoder
        PixelBuffer source = TestFixtures::solidRGBA(4, 4, 200, 10, 0, 0);
        Result<std::vector<uint8_t>> png = ImageCodec::encodePng(source);
        REQUIRE(png);

        Result<PixelBuffer> decoded = ImageCodec::decode(png.value());
        REQUIRE(decoded);
        CHECK(decoded.value().channels() == 4);
        CHECK(decoded.value().bytes() == source.bytes());

        PixelBuffer gray = PixelBuffer::filled(3, 2, 1, 77);
        Result<PixelBuffer> grayDecoded = ImageCodec::decode(ImageCodec::encodePng(gray).value());
        REQUIRE(grayDecoded);
        CHECK(grayDecoded.value().channels() == 1);
        CHECK(grayDecoded.value().width() == 3);
    }

    TEST_CASE("decode failures are DecodeError") {
        Result<PixelBuffer> empty = ImageCodec::decode({});
        REQUIRE_FALSE(empty);
        CHECK(empty.error().kind == ErrorKind::DecodeError);

        Result<PixelBuffer> garbage = ImageCodec::decode(TestFixtures::textBytes("not an image at all"));
        REQUIRE_FALSE(garbage);
        CHECK(garbage.error().kind == ErrorKind::DecodeError);

        Result<PixelBuffer> tiff = ImageCodec::decode({'I', 'I', 0x2A, 0x00, 8, 0, 0, 0});
        REQUIRE_FALSE(tiff);
        CHECK(tiff.error().kind == ErrorKind::DecodeError);
    }

    TEST_CASE("encodePng refuses an empty buffer") {
        Result<std::vector<uint8_t>> png = ImageCodec::encodePng(PixelBuffer());
        REQUIRE_FALSE(png);
        CHECK(png.error().kind == ErrorKind::InvalidDimensions);
    }
}

TEST_SUITE("ImageFilters") {
    TEST_CASE("toGrayscale uses Rec.601 luma") {
        PixelBuffer red(1, 1, 3, {255, 0, 0});
        CHECK(ImageFilters::toGrayscale(red).at(0, 0, 0) == 76);

        PixelBuffer white(1, 1, 4, {255, 255, 255, 0});
        PixelBuffer gray = ImageFilters::toGrayscale(white);
        CHECK(gray.channels() == 1);
        CHECK(gray.at(0, 0, 0) == 255);
    }

    TEST_CASE("contrast pivots around mid-gray and leaves alpha alone") {
        PixelBuffer image(2, 1, 2, {128, 50, 200, 60});
        PixelBuffer out = ImageFilters::contrast(image, 2.0f);
        CHECK(out.at(0, 0, 0) == 128);
        CHECK(out.at(0, 0, 1) == 50);
        CHECK(out.at(1, 0, 0) == 255);   // 200*2 - 128 clamps
        CHECK(out.at(1, 0, 1) == 60);
    }

    TEST_CASE("brightness and invert") {
        PixelBuffer image(1, 1, 1, {100});
        CHECK(ImageFilters::brightness(image, 0.5f).at(0, 0, 0) == 50);
        CHECK(ImageFilters::brightness(image, 3.0f).at(0, 0, 0) == 255);
        CHECK(ImageFilters::invert(image).at(0, 0, 0) == 155);
    }

    TEST_CASE("gaussianBlur keeps a flat image flat") {
        PixelBuffer flat = PixelBuffer::filled(5, 5, 1, 90);
        PixelBuffer blurred = ImageFilters::gaussianBlur(flat, 2.0f);
        for (uint8_t v : blurred.bytes()) {
            CHECK(v == 90);
        }
    }

    TEST_CASE("gaussianBlur spreads a single bright pixel") {
        PixelBuffer image = PixelBuffer::filled(5, 5, 1, 0);
        std::vector<uint8_t> bytes = image.bytes();
        bytes[2 * 5 + 2] = 255;
        PixelBuffer spike(5, 5, 1, bytes);

        PixelBuffer blurred = ImageFilters::gaussianBlur(spike, 1.0f);
        CHECK(blurred.at(2, 2, 0) < 255);
        CHECK(blurred.at(1, 2, 0) > 0);
        CHECK(blurred.at(2, 2, 0) > blurred.at(1, 2, 0));
    }

    TEST_CASE("resampleNearest") {
        PixelBuffer image(2, 1, 1, {10, 20});
        PixelBuffer wide = ImageFilters::resampleNearest(image, 4, 2);
        CHECK(wide.width() == 4);
        CHECK(wide.height() == 2);
        CHECK(wide.at(0, 1, 0) == 10);
        CHECK(wide.at(1, 0, 0) == 10);
        CHECK(wide.at(2, 0, 0) == 20);
        CHECK(wide.at(3, 1, 0) == 20);
    }
}
