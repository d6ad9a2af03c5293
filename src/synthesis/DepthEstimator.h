#pragma once

#include "core/Result.h"
#include "image/PixelBuffer.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace LabPBR {

/**
 * DepthEstimator - produces a single-channel depth/height buffer for an image
 *
 * Failures are reported as DepthUnavailable and fail the image being processed.
 * Implementations must be safe to call from several worker threads.
 */
class DepthEstimator {
public:
    virtual ~DepthEstimator() = default;

    virtual Result<PixelBuffer> estimate(const PixelBuffer& image) = 0;

    virtual std::string name() const = 0;
};

// Returns a fixed depth buffer, e.g. one loaded from disk
class StaticDepthEstimator : public DepthEstimator {
public:
    explicit StaticDepthEstimator(PixelBuffer depth);

    Result<PixelBuffer> estimate(const PixelBuffer& image) override;
    std::string name() const override { return "static"; }

private:
    PixelBuffer depth_;
};

// ============================================================================
// Remote inference endpoint
// ============================================================================

struct DepthRequest {
    std::string model;
    std::string contentType = "image/png";
    std::string accept = "image/png";
    std::vector<uint8_t> body;
};

struct DepthResponse {
    int status = 0;
    std::string contentType;
    std::vector<uint8_t> body;
};

// Carries one POST to the inference service. A failure means the request
// never produced an HTTP response.
class DepthTransport {
public:
    virtual ~DepthTransport() = default;
    virtual Result<DepthResponse> post(const DepthRequest& request) = 0;
};

struct DepthRetryPolicy {
    uint32_t maxRetries = 5;
    float defaultWaitSeconds = 5.0f;   // When the service gives no estimated_time
    float maxWaitSeconds = 30.0f;
};

/**
 * RemoteDepthEstimator - depth from a hosted model
 *
 * Sends the image as PNG. 429/503 responses are retried after the service's
 * estimated_time (capped) until the retry budget runs out. A JSON body is an
 * error; the body must otherwise be an image/ content type.
 */
class RemoteDepthEstimator : public DepthEstimator {
public:
    using SleepFunction = std::function<void(std::chrono::milliseconds)>;

    static constexpr const char* DEFAULT_MODEL = "jingheya/lotus-depth-g-v1-0";

    RemoteDepthEstimator(std::shared_ptr<DepthTransport> transport,
                         DepthRetryPolicy policy = {},
                         std::string model = DEFAULT_MODEL,
                         SleepFunction sleep = {});

    Result<PixelBuffer> estimate(const PixelBuffer& image) override;
    std::string name() const override { return "remote:" + model_; }

private:
    std::chrono::milliseconds retryDelay(const DepthResponse& response) const;

    std::shared_ptr<DepthTransport> transport_;
    DepthRetryPolicy policy_;
    std::string model_;
    SleepFunction sleep_;
};

} // namespace LabPBR
