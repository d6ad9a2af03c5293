#pragma once

#include "LabPBRFormat.h"
#include "image/ImageCodec.h"
#include "image/PixelBuffer.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace LabPBR {

enum class IssueLevel {
    Error,
    Warning,
    Info
};

const char* issueLevelName(IssueLevel level);

struct ValidationIssue {
    IssueLevel level = IssueLevel::Info;
    std::string message;
    std::optional<std::string> channel;     // "red", "green", "blue", "alpha"
    std::optional<int> value;
    std::optional<std::string> suggestion;
};

struct ValidationResult {
    std::vector<ValidationIssue> issues;
    std::string specVersion = LABPBR_SPEC_VERSION;

    // True iff no issue has level Error
    bool isValid() const;

    size_t count(IssueLevel level) const;

    // Error > Warning > Info; nullopt when there are no issues
    std::optional<IssueLevel> worstLevel() const;
};

/**
 * ChannelValidator - checks textures against the LabPBR 1.3 channel contract
 *
 * Each rule reports its first violation only. The validator never fails:
 * undecodable input becomes a single error issue.
 */
namespace ChannelValidator {

ValidationResult validate(const std::vector<uint8_t>& encodedBytes, TextureKind kind = TextureKind::Unknown,
                          const std::string& filenameHint = "");

ValidationResult validatePixels(const PixelBuffer& image, TextureKind kind, ImageFormat format);

} // namespace ChannelValidator

} // namespace LabPBR
