#pragma once

#include "JobTypes.h"
#include "core/Result.h"
#include "pack/ResourcePackCodec.h"
#include <optional>
#include <string>
#include <vector>

namespace LabPBR {

/**
 * JobRepository - storage for conversion jobs and what they produce
 *
 * Job state only changes through apply(), which folds a JobEvent under the
 * job's own lock; readers get snapshots. Implementations must be thread-safe.
 */
class JobRepository {
public:
    virtual ~JobRepository() = default;

    // New pending job, returns its id
    virtual std::string createJob(const std::string& filename, const ConversionSettings& settings,
                                  Clock::time_point createdAt) = 0;

    virtual Status apply(const std::string& jobId, const JobEvent& event) = 0;

    virtual std::optional<ConversionJob> job(const std::string& jobId) const = 0;
    virtual std::optional<ProcessingStatus> status(const std::string& jobId) const = 0;

    // Newest first
    virtual std::vector<ConversionJob> jobs() const = 0;

    // Assigns and returns the record id; 0 when the job does not exist
    virtual uint64_t addTextureFile(TextureFileRecord record) = 0;
    virtual std::vector<TextureFileRecord> textureFiles(const std::string& jobId) const = 0;

    // Files that go into the job's output archive
    virtual bool addOutputFile(const std::string& jobId, ArchiveEntry file) = 0;
    virtual std::vector<ArchiveEntry> outputFiles(const std::string& jobId) const = 0;

    virtual bool storeArchive(const std::string& jobId, std::vector<uint8_t> archive) = 0;
    virtual std::optional<std::vector<uint8_t>> archive(const std::string& jobId) const = 0;
};

} // namespace LabPBR
