#pragma once

#include "pack/ResourcePackCodec.h"
#include "synthesis/DepthEstimator.h"
#include "synthesis/NormalSynthesizer.h"
#include <cstdint>
#include <string>

namespace LabPBR {

/**
 * ServiceConfig - process-wide settings of the conversion service
 *
 * JSON layout (all keys optional):
 * {
 *   "workerCount": 2,
 *   "normalConvention": "directx" | "opengl",
 *   "gradientKernel": "sobel" | "central",
 *   "depth": { "maxRetries": 5, "defaultWaitSeconds": 5, "maxWaitSeconds": 30, "model": "..." },
 *   "pack": { "format": 15, "description": "..." }
 * }
 */
struct ServiceConfig {
    uint32_t workerCount = 2;
    NormalConvention normalConvention = NormalConvention::DirectX;
    GradientKernel gradientKernel = GradientKernel::Sobel;
    DepthRetryPolicy depthRetry;
    std::string depthModel = RemoteDepthEstimator::DEFAULT_MODEL;
    PackDescriptor pack;

    // Defaults are kept for missing keys, and for the whole config when the
    // file cannot be read or parsed (logged)
    static ServiceConfig loadFromFile(const std::string& path);
    static ServiceConfig loadFromJsonString(const std::string& jsonString);
};

} // namespace LabPBR
