#include "ChannelValidator.h"
#include <glm/glm.hpp>
#include <algorithm>
#include <cmath>
#include <exception>

namespace LabPBR {

const char* issueLevelName(IssueLevel level) {
    switch (level) {
        case IssueLevel::Error:   return "error";
        case IssueLevel::Warning: return "warning";
        case IssueLevel::Info:    return "info";
    }
    return "info";
}

bool ValidationResult::isValid() const {
    return count(IssueLevel::Error) == 0;
}

size_t ValidationResult::count(IssueLevel level) const {
    return static_cast<size_t>(std::count_if(issues.begin(), issues.end(),
        [level](const ValidationIssue& issue) { return issue.level == level; }));
}

std::optional<IssueLevel> ValidationResult::worstLevel() const {
    if (issues.empty()) return std::nullopt;
    if (count(IssueLevel::Error) > 0) return IssueLevel::Error;
    if (count(IssueLevel::Warning) > 0) return IssueLevel::Warning;
    return IssueLevel::Info;
}

namespace ChannelValidator {

namespace {

// Normal checks only look at the first pixels of the image
constexpr size_t NORMAL_SAMPLE_COUNT = 100;
constexpr float NORMAL_LENGTH_TOLERANCE = 0.1f;

// Specular rules address R, G and B directly
constexpr uint32_t MIN_SPECULAR_CHANNELS = 3;

// Gray+alpha keeps alpha at index 1, RGBA at index 3
std::optional<uint32_t> alphaIndex(uint32_t channels) {
    if (channels == 4) return 3u;
    if (channels == 2) return 1u;
    return std::nullopt;
}

bool isPowerOfTwo(uint32_t n) {
    return n > 0 && (n & (n - 1)) == 0;
}

ValidationIssue makeIssue(IssueLevel level, std::string message, std::string suggestion,
                          const char* channel = nullptr, std::optional<int> value = std::nullopt) {
    ValidationIssue issue;
    issue.level = level;
    issue.message = std::move(message);
    issue.suggestion = std::move(suggestion);
    if (channel) {
        issue.channel = channel;
    }
    issue.value = value;
    return issue;
}

void validateSpecularChannels(const PixelBuffer& image, std::vector<ValidationIssue>& issues) {
    const uint32_t channels = image.channels();
    const std::vector<uint8_t>& data = image.bytes();
    const size_t pixelCount = image.pixelCount();

    const std::optional<uint32_t> alpha = alphaIndex(channels);

    // Red (smoothness) spans the full byte range, nothing to check

    for (size_t i = 0; i < pixelCount; ++i) {
        uint8_t f0 = data[i * channels + 1];
        if (isReservedF0(f0)) {
            issues.push_back(makeIssue(IssueLevel::Error, "Invalid F0 value range detected",
                "F0 values should be 0-229 for dielectrics, 230-237 for predefined metals or 255 for albedo metals",
                "green", f0));
            break;
        }
    }

    for (size_t i = 0; i < pixelCount; ++i) {
        uint8_t green = data[i * channels + 1];
        uint8_t blue = data[i * channels + 2];
        // Porosity / SSS only applies to dielectrics; metals reserve the channel
        if (!isDielectricF0(green) && blue != 0) {
            issues.push_back(makeIssue(IssueLevel::Warning, "Blue channel should be 0 for metals in LabPBR v1.3",
                "Set blue channel to 0 for metal materials", "blue", blue));
            break;
        }
    }

    if (alpha) {
        for (size_t i = 0; i < pixelCount; ++i) {
            uint8_t emission = data[i * channels + *alpha];
            if (emission > MAX_EMISSION) {
                issues.push_back(makeIssue(IssueLevel::Error, "Emission value of 255 will be ignored",
                    "Use emission values 0-254, where 254 is 100% emissive", "alpha", emission));
                break;
            }
        }
    }
}

void validateNormalChannels(const PixelBuffer& image, std::vector<ValidationIssue>& issues) {
    const uint32_t channels = image.channels();
    const std::vector<uint8_t>& data = image.bytes();
    const size_t sampleCount = std::min(NORMAL_SAMPLE_COUNT, image.pixelCount());
    const std::optional<uint32_t> alpha = alphaIndex(channels);

    if (channels >= 3) {
        for (size_t i = 0; i < sampleCount; ++i) {
            float nx = data[i * channels] / 255.0f * 2.0f - 1.0f;
            float ny = data[i * channels + 1] / 255.0f * 2.0f - 1.0f;
            float nz = std::sqrt(std::max(0.0f, 1.0f - nx * nx - ny * ny));
            float length = glm::length(glm::vec3(nx, ny, nz));
            if (std::fabs(length - 1.0f) > NORMAL_LENGTH_TOLERANCE) {
                issues.push_back(makeIssue(IssueLevel::Warning, "Normal vectors may not be properly normalized",
                    "Ensure normal map is generated correctly"));
                break;
            }
        }
    }

    if (channels >= 3 && sampleCount > 0) {
        bool hasVariation = false;
        uint8_t firstBlue = data[2];
        for (size_t i = 1; i < sampleCount; ++i) {
            if (data[i * channels + 2] != firstBlue) {
                hasVariation = true;
                break;
            }
        }
        if (!hasVariation) {
            issues.push_back(makeIssue(IssueLevel::Info, "Blue channel appears to be unused",
                "Consider storing ambient occlusion in the blue channel", "blue"));
        }
    }

    if (alpha) {
        for (size_t i = 0; i < sampleCount; ++i) {
            uint8_t height = data[i * channels + *alpha];
            if (height == 0) {
                issues.push_back(makeIssue(IssueLevel::Warning, "Height map contains value 0 which may cause POM issues",
                    "Use minimum value of 1 instead of 0 for height maps", "alpha", height));
                break;
            }
        }
    }
}

ValidationResult failedValidation(const std::string& reason) {
    ValidationResult result;
    result.issues.push_back(makeIssue(IssueLevel::Error, "Failed to validate texture: " + reason,
                                      "Check if the file is a valid image"));
    return result;
}

} // namespace

ValidationResult validatePixels(const PixelBuffer& image, TextureKind kind, ImageFormat format) {
    ValidationResult result;

    if (format != ImageFormat::PNG) {
        result.issues.push_back(makeIssue(IssueLevel::Warning,
            "Texture should be in PNG format for best compatibility", "Convert to PNG format"));
    }

    if (!isPowerOfTwo(image.width()) || !isPowerOfTwo(image.height())) {
        result.issues.push_back(makeIssue(IssueLevel::Warning,
            "Texture dimensions should be power of 2 for optimal performance",
            "Consider resizing to nearest power of 2 dimensions"));
    }

    bool specular = (kind == TextureKind::Specular || kind == TextureKind::Unknown) &&
                    image.channels() >= MIN_SPECULAR_CHANNELS;
    if (specular) {
        validateSpecularChannels(image, result.issues);
    }
    if (kind == TextureKind::Normal) {
        validateNormalChannels(image, result.issues);
    }

    return result;
}

ValidationResult validate(const std::vector<uint8_t>& encodedBytes, TextureKind kind,
                          const std::string& filenameHint) {
    try {
        Result<PixelBuffer> decoded = ImageCodec::decode(encodedBytes, filenameHint);
        if (!decoded) {
            return failedValidation(decoded.error().message);
        }
        return validatePixels(decoded.value(), kind, ImageCodec::detectFormat(encodedBytes, filenameHint));
    } catch (const std::exception& e) {
        return failedValidation(e.what());
    }
}

} // namespace ChannelValidator

} // namespace LabPBR
