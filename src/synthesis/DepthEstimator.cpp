#include "DepthEstimator.h"
#include "image/ImageCodec.h"
#include "image/ImageFilters.h"
#include <nlohmann/json.hpp>
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <thread>

namespace LabPBR {

namespace {

Result<PixelBuffer> unavailable(std::string message) {
    SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "DepthEstimator: %s", message.c_str());
    return Result<PixelBuffer>::failure(ErrorKind::DepthUnavailable, std::move(message));
}

std::string bodyText(const std::vector<uint8_t>& body) {
    return std::string(body.begin(), body.end());
}

} // namespace

StaticDepthEstimator::StaticDepthEstimator(PixelBuffer depth)
    : depth_(std::move(depth)) {}

Result<PixelBuffer> StaticDepthEstimator::estimate(const PixelBuffer& /*image*/) {
    if (depth_.empty()) {
        return unavailable("Static depth buffer is empty");
    }
    if (depth_.channels() == 1) {
        return Result<PixelBuffer>::success(depth_);
    }
    return Result<PixelBuffer>::success(ImageFilters::toGrayscale(depth_));
}

RemoteDepthEstimator::RemoteDepthEstimator(std::shared_ptr<DepthTransport> transport,
                                           DepthRetryPolicy policy,
                                           std::string model,
                                           SleepFunction sleep)
    : transport_(std::move(transport))
    , policy_(policy)
    , model_(std::move(model))
    , sleep_(std::move(sleep)) {
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
    }
}

std::chrono::milliseconds RemoteDepthEstimator::retryDelay(const DepthResponse& response) const {
    float waitSeconds = policy_.defaultWaitSeconds;

    nlohmann::json payload = nlohmann::json::parse(response.body.begin(), response.body.end(), nullptr, false);
    if (!payload.is_discarded() && payload.is_object() && payload.contains("estimated_time") &&
        payload["estimated_time"].is_number()) {
        float estimated = payload["estimated_time"].get<float>();
        if (estimated > 0.0f) {
            waitSeconds = std::min(estimated, policy_.maxWaitSeconds);
        }
    }
    return std::chrono::milliseconds(static_cast<int64_t>(waitSeconds * 1000.0f));
}

Result<PixelBuffer> RemoteDepthEstimator::estimate(const PixelBuffer& image) {
    if (!transport_) {
        return unavailable("No depth transport configured");
    }

    Result<std::vector<uint8_t>> png = ImageCodec::encodePng(image);
    if (!png) {
        return unavailable("Failed to encode depth request: " + png.error().message);
    }

    DepthRequest request;
    request.model = model_;
    request.body = std::move(png).value();

    for (uint32_t attempt = 0; attempt < policy_.maxRetries; ++attempt) {
        Result<DepthResponse> sent = transport_->post(request);
        if (!sent) {
            return unavailable("Depth request failed: " + sent.error().message);
        }
        const DepthResponse& response = sent.value();

        if (response.status == 429 || response.status == 503) {
            std::chrono::milliseconds wait = retryDelay(response);
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION,
                        "DepthEstimator: %s busy (HTTP %d), retry %u/%u in %lld ms",
                        model_.c_str(), response.status, attempt + 1, policy_.maxRetries,
                        static_cast<long long>(wait.count()));
            sleep_(wait);
            continue;
        }

        if (response.status < 200 || response.status >= 300) {
            std::string text = bodyText(response.body);
            return unavailable("Depth request failed (" + std::to_string(response.status) + "): " +
                               (text.empty() ? "no response body" : text));
        }

        if (response.contentType.find("application/json") != std::string::npos) {
            nlohmann::json payload = nlohmann::json::parse(response.body.begin(), response.body.end(), nullptr, false);
            if (!payload.is_discarded() && payload.is_object() && payload.contains("error") &&
                payload["error"].is_string()) {
                return unavailable(payload["error"].get<std::string>());
            }
            return unavailable("Unexpected response from depth model");
        }

        if (response.body.empty() || response.contentType.rfind("image/", 0) != 0) {
            return unavailable("Depth model returned unexpected content type: " +
                               (response.contentType.empty() ? std::string("unknown") : response.contentType));
        }

        Result<PixelBuffer> decoded = ImageCodec::decode(response.body);
        if (!decoded) {
            return unavailable("Depth model returned an undecodable image: " + decoded.error().message);
        }
        return Result<PixelBuffer>::success(ImageFilters::toGrayscale(decoded.value()));
    }

    return unavailable("Model " + model_ + " is busy. Please try again in a moment.");
}

} // namespace LabPBR
