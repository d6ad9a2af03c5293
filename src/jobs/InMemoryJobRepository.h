#pragma once

#include "JobRepository.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace LabPBR {

// Process-local JobRepository. A registry lock guards the id -> slot map and
// every slot has its own mutex, so jobs never wait on each other.
class InMemoryJobRepository : public JobRepository {
public:
    InMemoryJobRepository() = default;

    InMemoryJobRepository(const InMemoryJobRepository&) = delete;
    InMemoryJobRepository& operator=(const InMemoryJobRepository&) = delete;

    std::string createJob(const std::string& filename, const ConversionSettings& settings,
                          Clock::time_point createdAt) override;

    Status apply(const std::string& jobId, const JobEvent& event) override;

    std::optional<ConversionJob> job(const std::string& jobId) const override;
    std::optional<ProcessingStatus> status(const std::string& jobId) const override;
    std::vector<ConversionJob> jobs() const override;

    uint64_t addTextureFile(TextureFileRecord record) override;
    std::vector<TextureFileRecord> textureFiles(const std::string& jobId) const override;

    bool addOutputFile(const std::string& jobId, ArchiveEntry file) override;
    std::vector<ArchiveEntry> outputFiles(const std::string& jobId) const override;

    bool storeArchive(const std::string& jobId, std::vector<uint8_t> archive) override;
    std::optional<std::vector<uint8_t>> archive(const std::string& jobId) const override;

private:
    struct JobSlot {
        uint64_t sequence = 0;
        mutable std::mutex mutex;
        JobState state;
        std::vector<TextureFileRecord> records;
        std::vector<ArchiveEntry> outputs;
        std::optional<std::vector<uint8_t>> archive;
    };

    std::shared_ptr<JobSlot> find(const std::string& jobId) const;

    mutable std::mutex registryMutex_;
    std::unordered_map<std::string, std::shared_ptr<JobSlot>> slots_;
    uint64_t nextJobSequence_ = 1;   // Guarded by registryMutex_
    std::atomic<uint64_t> nextRecordId_{1};
};

} // namespace LabPBR
