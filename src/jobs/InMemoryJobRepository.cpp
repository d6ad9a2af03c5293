#include "InMemoryJobRepository.h"
#include <SDL3/SDL_log.h>
#include <algorithm>

namespace LabPBR {

std::shared_ptr<InMemoryJobRepository::JobSlot> InMemoryJobRepository::find(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(registryMutex_);
    auto it = slots_.find(jobId);
    return it == slots_.end() ? nullptr : it->second;
}

std::string InMemoryJobRepository::createJob(const std::string& filename, const ConversionSettings& settings,
                                             Clock::time_point createdAt) {
    auto slot = std::make_shared<JobSlot>();

    std::lock_guard<std::mutex> lock(registryMutex_);
    slot->sequence = nextJobSequence_++;
    std::string id = std::to_string(slot->sequence);
    slot->state = makeJobState(id, filename, settings, createdAt);
    slots_[id] = slot;
    return id;
}

Status InMemoryJobRepository::apply(const std::string& jobId, const JobEvent& event) {
    auto slot = find(jobId);
    if (!slot) {
        return Status::failure(ErrorKind::ProcessingError, "Job " + jobId + " not found");
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    Status applied = applyJobEvent(slot->state, event);
    if (!applied) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "InMemoryJobRepository: %s",
                    applied.error().message.c_str());
    }
    return applied;
}

std::optional<ConversionJob> InMemoryJobRepository::job(const std::string& jobId) const {
    auto slot = find(jobId);
    if (!slot) return std::nullopt;
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->state.job;
}

std::optional<ProcessingStatus> InMemoryJobRepository::status(const std::string& jobId) const {
    auto slot = find(jobId);
    if (!slot) return std::nullopt;
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->state.status;
}

std::vector<ConversionJob> InMemoryJobRepository::jobs() const {
    std::vector<std::shared_ptr<JobSlot>> snapshot;
    {
        std::lock_guard<std::mutex> lock(registryMutex_);
        snapshot.reserve(slots_.size());
        for (const auto& [id, slot] : slots_) {
            snapshot.push_back(slot);
        }
    }

    std::sort(snapshot.begin(), snapshot.end(), [](const auto& a, const auto& b) {
        return a->sequence > b->sequence;
    });

    std::vector<ConversionJob> result;
    result.reserve(snapshot.size());
    for (const auto& slot : snapshot) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        result.push_back(slot->state.job);
    }

    // Creation time first, creation order breaks ties
    std::stable_sort(result.begin(), result.end(), [](const ConversionJob& a, const ConversionJob& b) {
        return a.createdAt > b.createdAt;
    });
    return result;
}

uint64_t InMemoryJobRepository::addTextureFile(TextureFileRecord record) {
    auto slot = find(record.jobId);
    if (!slot) return 0;

    record.id = nextRecordId_++;
    std::lock_guard<std::mutex> lock(slot->mutex);
    slot->records.push_back(std::move(record));
    return slot->records.back().id;
}

std::vector<TextureFileRecord> InMemoryJobRepository::textureFiles(const std::string& jobId) const {
    auto slot = find(jobId);
    if (!slot) return {};
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->records;
}

bool InMemoryJobRepository::addOutputFile(const std::string& jobId, ArchiveEntry file) {
    auto slot = find(jobId);
    if (!slot) return false;
    std::lock_guard<std::mutex> lock(slot->mutex);
    slot->outputs.push_back(std::move(file));
    return true;
}

std::vector<ArchiveEntry> InMemoryJobRepository::outputFiles(const std::string& jobId) const {
    auto slot = find(jobId);
    if (!slot) return {};
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->outputs;
}

bool InMemoryJobRepository::storeArchive(const std::string& jobId, std::vector<uint8_t> archive) {
    auto slot = find(jobId);
    if (!slot) return false;
    std::lock_guard<std::mutex> lock(slot->mutex);
    slot->archive = std::move(archive);
    return true;
}

std::optional<std::vector<uint8_t>> InMemoryJobRepository::archive(const std::string& jobId) const {
    auto slot = find(jobId);
    if (!slot) return std::nullopt;
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->archive;
}

} // namespace LabPBR
