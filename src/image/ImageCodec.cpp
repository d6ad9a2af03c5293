#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>
#include "ImageCodec.h"
#include "core/ScopeGuard.h"
#include <lodepng.h>
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cctype>
#include <limits>

namespace LabPBR {

const char* imageFormatName(ImageFormat format) {
    switch (format) {
        case ImageFormat::PNG:     return "png";
        case ImageFormat::JPEG:    return "jpeg";
        case ImageFormat::TGA:     return "tga";
        case ImageFormat::TIFF:    return "tiff";
        case ImageFormat::BMP:     return "bmp";
        case ImageFormat::Unknown: return "unknown";
    }
    return "unknown";
}

namespace ImageCodec {

namespace {

bool hasExtension(const std::string& path, const std::string& ext) {
    if (path.size() < ext.size()) return false;
    std::string pathExt = path.substr(path.size() - ext.size());
    std::transform(pathExt.begin(), pathExt.end(), pathExt.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return pathExt == ext;
}

bool startsWith(const std::vector<uint8_t>& bytes, std::initializer_list<uint8_t> magic) {
    if (bytes.size() < magic.size()) return false;
    return std::equal(magic.begin(), magic.end(), bytes.begin());
}

Result<PixelBuffer> decodePng(const std::vector<uint8_t>& bytes) {
    lodepng::State state;
    unsigned width = 0;
    unsigned height = 0;

    unsigned error = lodepng_inspect(&width, &height, &state, bytes.data(), bytes.size());
    if (error) {
        return Result<PixelBuffer>::failure(ErrorKind::DecodeError,
            std::string("PNG header error: ") + lodepng_error_text(error));
    }

    // Keep the native layout so validators see the real channel count
    const LodePNGColorMode& color = state.info_png.color;
    bool grey = lodepng_is_greyscale_type(&color) != 0;
    bool alpha = lodepng_can_have_alpha(&color) != 0;
    uint32_t channels = (grey ? 1u : 3u) + (alpha ? 1u : 0u);

    if (grey) {
        state.info_raw.colortype = alpha ? LCT_GREY_ALPHA : LCT_GREY;
    } else {
        state.info_raw.colortype = alpha ? LCT_RGBA : LCT_RGB;
    }
    state.info_raw.bitdepth = 8;
    state.decoder.color_convert = 1;

    std::vector<unsigned char> pixels;
    error = lodepng::decode(pixels, width, height, state, bytes);
    if (error) {
        return Result<PixelBuffer>::failure(ErrorKind::DecodeError,
            std::string("PNG decode error: ") + lodepng_error_text(error));
    }

    return Result<PixelBuffer>::success(PixelBuffer(width, height, channels, std::move(pixels)));
}

Result<PixelBuffer> decodeWithStb(const std::vector<uint8_t>& bytes) {
    if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return Result<PixelBuffer>::failure(ErrorKind::DecodeError, "Image too large to decode");
    }

    int width = 0;
    int height = 0;
    int channels = 0;
    stbi_uc* pixels = stbi_load_from_memory(bytes.data(), static_cast<int>(bytes.size()),
                                            &width, &height, &channels, 0);
    if (!pixels) {
        const char* reason = stbi_failure_reason();
        return Result<PixelBuffer>::failure(ErrorKind::DecodeError,
            std::string("Image decode error: ") + (reason ? reason : "unknown"));
    }

    auto pixelGuard = makeScopeGuard([&]() { stbi_image_free(pixels); });

    size_t size = static_cast<size_t>(width) * height * channels;
    std::vector<uint8_t> data(pixels, pixels + size);
    return Result<PixelBuffer>::success(PixelBuffer(static_cast<uint32_t>(width),
                                                    static_cast<uint32_t>(height),
                                                    static_cast<uint32_t>(channels),
                                                    std::move(data)));
}

} // namespace

ImageFormat detectFormat(const std::vector<uint8_t>& bytes, const std::string& filenameHint) {
    if (startsWith(bytes, {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A})) return ImageFormat::PNG;
    if (startsWith(bytes, {0xFF, 0xD8, 0xFF})) return ImageFormat::JPEG;
    if (startsWith(bytes, {'I', 'I', 0x2A, 0x00}) || startsWith(bytes, {'M', 'M', 0x00, 0x2A})) {
        return ImageFormat::TIFF;
    }
    if (startsWith(bytes, {'B', 'M'})) return ImageFormat::BMP;
    if (hasExtension(filenameHint, ".tga")) return ImageFormat::TGA;
    return ImageFormat::Unknown;
}

Result<PixelBuffer> decode(const std::vector<uint8_t>& bytes, const std::string& filenameHint) {
    if (bytes.empty()) {
        return Result<PixelBuffer>::failure(ErrorKind::DecodeError, "Image data is empty");
    }

    ImageFormat format = detectFormat(bytes, filenameHint);
    switch (format) {
        case ImageFormat::PNG:
            return decodePng(bytes);
        case ImageFormat::TIFF:
            return Result<PixelBuffer>::failure(ErrorKind::DecodeError, "TIFF images are not supported");
        default:
            // JPEG, BMP, TGA and anything stb_image can sniff on its own
            return decodeWithStb(bytes);
    }
}

Result<std::vector<uint8_t>> encodePng(const PixelBuffer& image) {
    if (image.empty()) {
        return Result<std::vector<uint8_t>>::failure(ErrorKind::InvalidDimensions,
                                                    "Cannot encode an image without pixels");
    }

    LodePNGColorType colorType = LCT_RGBA;
    switch (image.channels()) {
        case 1: colorType = LCT_GREY; break;
        case 2: colorType = LCT_GREY_ALPHA; break;
        case 3: colorType = LCT_RGB; break;
        default: colorType = LCT_RGBA; break;
    }

    // No auto conversion, a uniform alpha channel must stay in the file
    lodepng::State state;
    state.info_raw.colortype = colorType;
    state.info_raw.bitdepth = 8;
    state.info_png.color.colortype = colorType;
    state.info_png.color.bitdepth = 8;
    state.encoder.auto_convert = 0;

    std::vector<unsigned char> png;
    unsigned error = lodepng::encode(png, image.bytes(), image.width(), image.height(), state);
    if (error) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ImageCodec: PNG encode failed: %s",
                     lodepng_error_text(error));
        return Result<std::vector<uint8_t>>::failure(ErrorKind::ProcessingError,
            std::string("PNG encode error: ") + lodepng_error_text(error));
    }
    return Result<std::vector<uint8_t>>::success(std::move(png));
}

} // namespace ImageCodec

} // namespace LabPBR
