#pragma once

#include "ServiceConfig.h"
#include "core/CancellationToken.h"
#include "core/Result.h"
#include "core/threading/JobWorkerPool.h"
#include "jobs/ConversionJobRunner.h"
#include "jobs/JobRepository.h"
#include "labpbr/ChannelValidator.h"
#include "labpbr/MaterialAnalyzer.h"
#include "synthesis/DepthEstimator.h"
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace LabPBR {

struct FileValidation {
    std::string filename;
    std::string path;
    size_t size = 0;
    ValidationResult validation;
};

// An issue tagged with the file it came from
struct ReportIssue {
    ValidationIssue issue;
    std::string filename;
    std::string path;
};

struct ValidationReport {
    bool isValid = true;                // No file has an error-level issue
    std::string specVersion = LABPBR_SPEC_VERSION;
    uint32_t totalFiles = 0;
    uint32_t textureFiles = 0;
    std::vector<FileValidation> fileDetails;
    std::vector<ReportIssue> issues;

    size_t count(IssueLevel level) const;
};

enum class DownloadStatus {
    Ok,
    NotFound,
    NotCompleted
};

struct DownloadResult {
    DownloadStatus status = DownloadStatus::NotFound;
    std::string message;
    std::vector<uint8_t> bytes;
    std::string filename;       // "<stem>_labpbr.zip"
};

/**
 * ConversionService - entry point for conversions, validation and analysis
 *
 * Owns the worker pool. Conversions run as pool tasks through the
 * ConversionJobRunner; validate() and analyze() also run on the pool and
 * hand back futures, so pixel work never runs on the caller's thread.
 */
class ConversionService {
public:
    /**
     * Factory: repository defaults to an InMemoryJobRepository, no depth
     * estimator means height and normals come from the image itself.
     * Returns nullptr if the worker pool cannot be started.
     */
    static std::unique_ptr<ConversionService> create(const ServiceConfig& config,
                                                     std::shared_ptr<DepthEstimator> depthEstimator = nullptr,
                                                     std::shared_ptr<JobRepository> repository = nullptr);

    ~ConversionService();

    ConversionService(const ConversionService&) = delete;
    ConversionService& operator=(const ConversionService&) = delete;

    // UploadError for a missing name or empty data, SettingsError for bad settings
    Result<std::string> submit(const std::string& filename, std::vector<uint8_t> bytes,
                               const std::string& settingsJson = "");

    std::optional<ProcessingStatus> status(const std::string& jobId) const;
    std::optional<ConversionJob> job(const std::string& jobId) const;
    std::vector<ConversionJob> jobs() const;
    std::vector<TextureFileRecord> files(const std::string& jobId) const;

    DownloadResult download(const std::string& jobId) const;

    std::future<ValidationReport> validate(const std::string& filename, std::vector<uint8_t> bytes);
    std::future<Result<MaterialReport>> analyze(std::vector<uint8_t> bytes, const std::string& filenameHint = "");

    // False when the job is unknown or already finished
    bool cancel(const std::string& jobId);

    void waitForIdle();

    // Queued conversions fail, queued validate/analyze futures get a shutdown result
    void shutdown();

    // Jobs that can still be cancelled
    size_t trackedJobCount() const;

    const ServiceConfig& config() const { return config_; }

private:
    ConversionService(const ServiceConfig& config,
                      std::unique_ptr<JobWorkerPool> pool,
                      std::shared_ptr<JobRepository> repository,
                      std::shared_ptr<const TextureProcessor> processor);

    void failUnstartedJob(const std::string& jobId);
    void releaseToken(const std::string& jobId);

    static ValidationReport buildValidationReport(const std::string& filename, const std::vector<uint8_t>& bytes);

    ServiceConfig config_;
    std::unique_ptr<JobWorkerPool> pool_;
    std::shared_ptr<JobRepository> repository_;
    std::shared_ptr<const ConversionJobRunner> runner_;

    mutable std::mutex tokensMutex_;
    std::unordered_map<std::string, CancellationToken> tokens_;
};

} // namespace LabPBR
