#pragma once

#include "JobRepository.h"
#include "core/CancellationToken.h"
#include "core/Result.h"
#include "pack/ResourcePackCodec.h"
#include "synthesis/TextureProcessor.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace LabPBR {

struct JobInput {
    std::string jobId;
    std::string filename;
    std::vector<uint8_t> bytes;
    ConversionSettings settings;
    CancellationToken cancellation;
};

/**
 * ConversionJobRunner - drives one job from pending to a terminal state
 *
 * Archives (".zip" or inputType resourcepack) are extracted and each texture
 * entry is processed in turn; anything else is a single image. Per file:
 * synthesize maps, pack them, validate the packed _s and _n textures and
 * persist a TextureFileRecord. Non-texture archive entries are carried over
 * and the output archive is assembled at the end.
 *
 * run() blocks; callers put it on the JobWorkerPool. Every state change goes
 * through JobRepository::apply. Any failure fails the job and keeps the
 * records already written.
 */
class ConversionJobRunner {
public:
    using NowFunction = std::function<Clock::time_point()>;

    ConversionJobRunner(std::shared_ptr<JobRepository> repository,
                        std::shared_ptr<const TextureProcessor> processor,
                        PackDescriptor packDescriptor = {},
                        NowFunction now = {});

    // Returns the error the job failed with, ok when it completed
    Status run(const JobInput& input) const;

private:
    struct SourceFile {
        std::string name;
        std::string path;
        const std::vector<uint8_t>* bytes = nullptr;
    };

    Status execute(const JobInput& input) const;
    Status processFile(const JobInput& input, const SourceFile& file, uint32_t index, uint32_t total,
                       uint32_t& texturesGenerated) const;
    Status checkCancelled(const JobInput& input) const;

    Status publish(const std::string& jobId, const JobEvent& event) const;
    Status task(const std::string& jobId, std::string name, uint32_t step,
                std::optional<uint32_t> totalImages = std::nullopt,
                std::optional<int> progress = std::nullopt) const;
    Status log(const std::string& jobId, LogLevel level, std::string message) const;

    std::shared_ptr<JobRepository> repository_;
    std::shared_ptr<const TextureProcessor> processor_;
    PackDescriptor packDescriptor_;
    NowFunction now_;
};

} // namespace LabPBR
