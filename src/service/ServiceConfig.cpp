#include "ServiceConfig.h"
#include <nlohmann/json.hpp>
#include <SDL3/SDL_log.h>
#include <fstream>

using json = nlohmann::json;

namespace LabPBR {

ServiceConfig ServiceConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ServiceConfig: Failed to open config file: %s", path.c_str());
        return ServiceConfig{};
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());
    return loadFromJsonString(content);
}

ServiceConfig ServiceConfig::loadFromJsonString(const std::string& jsonString) {
    ServiceConfig config;

    try {
        json j = json::parse(jsonString);

        config.workerCount = j.value("workerCount", config.workerCount);
        if (config.workerCount == 0) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "ServiceConfig: workerCount 0 raised to 1");
            config.workerCount = 1;
        }

        std::string convention = j.value("normalConvention", std::string(normalConventionName(config.normalConvention)));
        if (auto parsed = parseNormalConvention(convention)) {
            config.normalConvention = *parsed;
        } else {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "ServiceConfig: unknown normalConvention '%s', using directx",
                        convention.c_str());
        }

        std::string kernel = j.value("gradientKernel", std::string(gradientKernelName(config.gradientKernel)));
        if (auto parsed = parseGradientKernel(kernel)) {
            config.gradientKernel = *parsed;
        } else {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "ServiceConfig: unknown gradientKernel '%s', using sobel",
                        kernel.c_str());
        }

        // Depth estimation service
        if (j.contains("depth")) {
            const auto& depth = j["depth"];
            config.depthRetry.maxRetries = depth.value("maxRetries", config.depthRetry.maxRetries);
            config.depthRetry.defaultWaitSeconds = depth.value("defaultWaitSeconds", config.depthRetry.defaultWaitSeconds);
            config.depthRetry.maxWaitSeconds = depth.value("maxWaitSeconds", config.depthRetry.maxWaitSeconds);
            config.depthModel = depth.value("model", config.depthModel);
        }

        // Output pack.mcmeta
        if (j.contains("pack")) {
            const auto& pack = j["pack"];
            config.pack.packFormat = pack.value("format", config.pack.packFormat);
            config.pack.description = pack.value("description", config.pack.description);
        }

        SDL_Log("ServiceConfig: %u workers, %s normals, %s kernel", config.workerCount,
                normalConventionName(config.normalConvention), gradientKernelName(config.gradientKernel));

    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ServiceConfig: JSON parse error: %s", e.what());
        return ServiceConfig{};
    }

    return config;
}

} // namespace LabPBR
