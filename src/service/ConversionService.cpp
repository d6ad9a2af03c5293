#include "ConversionService.h"
#include "jobs/InMemoryJobRepository.h"
#include "pack/ResourcePackCodec.h"
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <exception>

namespace LabPBR {

namespace {

// Validation and analysis jump ahead of queued conversions
constexpr int PRIORITY_INTERACTIVE = 0;
constexpr int PRIORITY_CONVERSION = 10;

constexpr const char* SHUTTING_DOWN = "Conversion service is shutting down";

std::string downloadName(const std::string& filename) {
    std::string base = filename;
    size_t slash = base.find_last_of("/\\");
    if (slash != std::string::npos) {
        base = base.substr(slash + 1);
    }
    size_t dot = base.find_last_of('.');
    if (dot != std::string::npos && dot > 0) {
        base = base.substr(0, dot);
    }
    return base + "_labpbr.zip";
}

std::string basename(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

ValidationReport shutdownReport(const std::string& filename) {
    ValidationReport report;
    ValidationIssue issue;
    issue.level = IssueLevel::Error;
    issue.message = "Validation service is shutting down";
    report.issues.push_back({issue, basename(filename), filename});
    report.isValid = false;
    return report;
}

Result<MaterialReport> shutdownAnalysis() {
    return Result<MaterialReport>::failure(ErrorKind::ProcessingError, "Analysis service is shutting down");
}

} // namespace

size_t ValidationReport::count(IssueLevel level) const {
    return static_cast<size_t>(std::count_if(issues.begin(), issues.end(),
        [level](const ReportIssue& tagged) { return tagged.issue.level == level; }));
}

std::unique_ptr<ConversionService> ConversionService::create(const ServiceConfig& config,
                                                             std::shared_ptr<DepthEstimator> depthEstimator,
                                                             std::shared_ptr<JobRepository> repository) {
    auto pool = JobWorkerPool::create(config.workerCount);
    if (!pool) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ConversionService: failed to start worker pool");
        return nullptr;
    }

    if (!repository) {
        repository = std::make_shared<InMemoryJobRepository>();
    }

    if (depthEstimator) {
        SDL_Log("ConversionService: depth estimator %s attached", depthEstimator->name().c_str());
    }
    auto processor = std::make_shared<TextureProcessor>(std::move(depthEstimator),
                                                        config.normalConvention,
                                                        config.gradientKernel);

    return std::unique_ptr<ConversionService>(
        new ConversionService(config, std::move(pool), std::move(repository), std::move(processor)));
}

ConversionService::ConversionService(const ServiceConfig& config,
                                     std::unique_ptr<JobWorkerPool> pool,
                                     std::shared_ptr<JobRepository> repository,
                                     std::shared_ptr<const TextureProcessor> processor)
    : config_(config)
    , pool_(std::move(pool))
    , repository_(std::move(repository))
    , runner_(std::make_shared<ConversionJobRunner>(repository_, std::move(processor), config.pack)) {}

ConversionService::~ConversionService() {
    shutdown();
}

Result<std::string> ConversionService::submit(const std::string& filename, std::vector<uint8_t> bytes,
                                              const std::string& settingsJson) {
    if (filename.empty()) {
        return Result<std::string>::failure(ErrorKind::UploadError, "No file uploaded");
    }
    if (bytes.empty()) {
        return Result<std::string>::failure(ErrorKind::UploadError, "Empty file uploaded");
    }

    Result<ConversionSettings> settings = ConversionSettings::fromJsonString(settingsJson);
    if (!settings) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "ConversionService: rejected %s: %s",
                    filename.c_str(), settings.error().message.c_str());
        return Result<std::string>::failure(settings.error());
    }

    std::string jobId = repository_->createJob(filename, settings.value(), Clock::now());

    JobInput input;
    input.jobId = jobId;
    input.filename = filename;
    input.bytes = std::move(bytes);
    input.settings = settings.value();
    {
        std::lock_guard<std::mutex> lock(tokensMutex_);
        tokens_[jobId] = input.cancellation;
    }

    SDL_Log("ConversionService: job %s queued for %s (%zu bytes)", jobId.c_str(), filename.c_str(),
            input.bytes.size());

    auto runner = runner_;
    bool queued = pool_->submit("convert-" + jobId, [this, runner, input = std::move(input)]() {
        Status result = runner->run(input);
        if (!result) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "ConversionService: job %s ended with %s",
                        input.jobId.c_str(), errorKindName(result.error().kind));
        }
        releaseToken(input.jobId);
    }, PRIORITY_CONVERSION, [this, jobId]() {
        failUnstartedJob(jobId);
    });

    if (!queued) {
        failUnstartedJob(jobId);
        return Result<std::string>::failure(ErrorKind::ProcessingError, SHUTTING_DOWN);
    }

    return Result<std::string>::success(jobId);
}

std::optional<ProcessingStatus> ConversionService::status(const std::string& jobId) const {
    return repository_->status(jobId);
}

std::optional<ConversionJob> ConversionService::job(const std::string& jobId) const {
    return repository_->job(jobId);
}

std::vector<ConversionJob> ConversionService::jobs() const {
    return repository_->jobs();
}

std::vector<TextureFileRecord> ConversionService::files(const std::string& jobId) const {
    return repository_->textureFiles(jobId);
}

DownloadResult ConversionService::download(const std::string& jobId) const {
    DownloadResult result;

    std::optional<ConversionJob> found = repository_->job(jobId);
    if (!found) {
        result.status = DownloadStatus::NotFound;
        result.message = "Conversion job not found";
        return result;
    }
    if (found->status != JobStatus::Completed) {
        result.status = DownloadStatus::NotCompleted;
        result.message = "Conversion not completed";
        return result;
    }

    std::optional<std::vector<uint8_t>> archive = repository_->archive(jobId);
    if (!archive) {
        result.status = DownloadStatus::NotCompleted;
        result.message = "Conversion not completed";
        return result;
    }

    result.status = DownloadStatus::Ok;
    result.bytes = std::move(*archive);
    result.filename = downloadName(found->filename);
    return result;
}

ValidationReport ConversionService::buildValidationReport(const std::string& filename,
                                                          const std::vector<uint8_t>& bytes) {
    ValidationReport report;

    auto addFile = [&report](const std::string& name, const std::string& path, const std::vector<uint8_t>& data) {
        TextureKind kind = validatorKindFor(detectTextureType(path));
        FileValidation detail;
        detail.filename = name;
        detail.path = path;
        detail.size = data.size();
        detail.validation = ChannelValidator::validate(data, kind, path);

        for (const auto& issue : detail.validation.issues) {
            report.issues.push_back({issue, name, path});
        }
        ++report.textureFiles;
        report.fileDetails.push_back(std::move(detail));
    };

    if (ResourcePackCodec::isArchiveFilename(filename)) {
        Result<std::vector<ArchiveEntry>> entries = ResourcePackCodec::extractEntries(bytes);
        if (!entries) {
            ValidationIssue issue;
            issue.level = IssueLevel::Error;
            issue.message = "Failed to read archive: " + entries.error().message;
            issue.suggestion = "Check that the file is a valid ZIP archive";
            report.issues.push_back({issue, basename(filename), filename});
        } else {
            for (const auto& entry : entries.value()) {
                ++report.totalFiles;
                if (entry.isTexture) {
                    addFile(entry.name, entry.path, entry.bytes);
                }
            }
        }
    } else {
        report.totalFiles = 1;
        addFile(basename(filename), filename, bytes);
    }

    report.isValid = report.count(IssueLevel::Error) == 0;
    SDL_Log("ConversionService: validated %s: %u textures, %zu errors, %zu warnings", filename.c_str(),
            report.textureFiles, report.count(IssueLevel::Error), report.count(IssueLevel::Warning));
    return report;
}

std::future<ValidationReport> ConversionService::validate(const std::string& filename, std::vector<uint8_t> bytes) {
    auto promise = std::make_shared<std::promise<ValidationReport>>();
    std::future<ValidationReport> future = promise->get_future();

    bool queued = pool_->submit("validate-" + filename, [promise, filename, bytes = std::move(bytes)]() {
        try {
            promise->set_value(buildValidationReport(filename, bytes));
        } catch (const std::exception&) {
            promise->set_exception(std::current_exception());
        }
    }, PRIORITY_INTERACTIVE, [promise, filename]() {
        promise->set_value(shutdownReport(filename));
    });

    if (!queued) {
        promise->set_value(shutdownReport(filename));
    }
    return future;
}

std::future<Result<MaterialReport>> ConversionService::analyze(std::vector<uint8_t> bytes,
                                                               const std::string& filenameHint) {
    auto promise = std::make_shared<std::promise<Result<MaterialReport>>>();
    std::future<Result<MaterialReport>> future = promise->get_future();

    bool queued = pool_->submit("analyze", [promise, filenameHint, bytes = std::move(bytes)]() {
        try {
            promise->set_value(MaterialAnalyzer::analyzeEncoded(bytes, filenameHint));
        } catch (const std::exception&) {
            promise->set_exception(std::current_exception());
        }
    }, PRIORITY_INTERACTIVE, [promise]() {
        promise->set_value(shutdownAnalysis());
    });

    if (!queued) {
        promise->set_value(shutdownAnalysis());
    }
    return future;
}

bool ConversionService::cancel(const std::string& jobId) {
    std::optional<ConversionJob> found = repository_->job(jobId);
    if (!found || isTerminal(found->status)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(tokensMutex_);
    auto it = tokens_.find(jobId);
    if (it == tokens_.end()) {
        return false;
    }
    it->second.cancel();
    SDL_Log("ConversionService: cancellation requested for job %s", jobId.c_str());
    return true;
}

void ConversionService::failUnstartedJob(const std::string& jobId) {
    // Leave no job stuck in pending
    Clock::time_point now = Clock::now();
    Status started = repository_->apply(jobId, JobStarted{now});
    if (started) {
        Status failed = repository_->apply(jobId, Failed{now, SHUTTING_DOWN});
        if (!failed) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ConversionService: could not fail job %s",
                         jobId.c_str());
        }
    }
    releaseToken(jobId);
}

void ConversionService::releaseToken(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(tokensMutex_);
    tokens_.erase(jobId);
}

size_t ConversionService::trackedJobCount() const {
    std::lock_guard<std::mutex> lock(tokensMutex_);
    return tokens_.size();
}

void ConversionService::waitForIdle() {
    if (pool_) {
        pool_->waitForIdle();
    }
}

void ConversionService::shutdown() {
    if (pool_) {
        pool_->shutdown();
    }
}

} // namespace LabPBR
