#include "ConversionJobRunner.h"
#include "labpbr/ChannelValidator.h"
#include "labpbr/LabPBRPacker.h"
#include <SDL3/SDL_log.h>
#include <exception>

namespace LabPBR {

namespace {

// Steps reported in ProcessingStatus (totalSteps = 5)
constexpr uint32_t STEP_EXTRACT = 1;
constexpr uint32_t STEP_PROCESS = 2;
constexpr uint32_t STEP_VALIDATE = 3;
constexpr uint32_t STEP_PACKAGE = 4;

constexpr int PROGRESS_FILES_START = 10;
constexpr int PROGRESS_FILES_END = 90;

} // namespace

ConversionJobRunner::ConversionJobRunner(std::shared_ptr<JobRepository> repository,
                                         std::shared_ptr<const TextureProcessor> processor,
                                         PackDescriptor packDescriptor,
                                         NowFunction now)
    : repository_(std::move(repository))
    , processor_(std::move(processor))
    , packDescriptor_(std::move(packDescriptor))
    , now_(std::move(now)) {
    if (!now_) {
        now_ = [] { return Clock::now(); };
    }
}

Status ConversionJobRunner::publish(const std::string& jobId, const JobEvent& event) const {
    return repository_->apply(jobId, event);
}

Status ConversionJobRunner::task(const std::string& jobId, std::string name, uint32_t step,
                                 std::optional<uint32_t> totalImages, std::optional<int> progress) const {
    Clock::time_point at = now_();
    Status started = publish(jobId, TaskStarted{at, name, step, totalImages, progress});
    if (!started) return started;
    return publish(jobId, LogAppended{at, LogLevel::Info, std::move(name)});
}

Status ConversionJobRunner::log(const std::string& jobId, LogLevel level, std::string message) const {
    return publish(jobId, LogAppended{now_(), level, std::move(message)});
}

Status ConversionJobRunner::checkCancelled(const JobInput& input) const {
    if (input.cancellation.isCancelled()) {
        return Status::failure(ErrorKind::Cancelled, "Conversion cancelled");
    }
    return Status::ok();
}

Status ConversionJobRunner::run(const JobInput& input) const {
    Status started = publish(input.jobId, JobStarted{now_()});
    if (!started) {
        return started;
    }
    SDL_Log("ConversionJobRunner: job %s started (%s)", input.jobId.c_str(), input.filename.c_str());

    Status result = Status::ok();
    try {
        result = execute(input);
    } catch (const std::exception& e) {
        result = Status::failure(ErrorKind::ProcessingError, e.what());
    }

    if (!result) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ConversionJobRunner: job %s failed: %s",
                     input.jobId.c_str(), result.error().describe().c_str());
        Status failed = publish(input.jobId, Failed{now_(), result.error().message});
        if (!failed) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ConversionJobRunner: could not record failure of job %s",
                         input.jobId.c_str());
        }
        return result;
    }

    Status completed = publish(input.jobId, Completed{now_()});
    if (!completed) {
        return completed;
    }
    SDL_Log("ConversionJobRunner: job %s completed", input.jobId.c_str());
    return Status::ok();
}

Status ConversionJobRunner::execute(const JobInput& input) const {
    Status status = checkCancelled(input);
    if (!status) return status;

    const bool isArchive = ResourcePackCodec::isArchiveFilename(input.filename) ||
                           input.settings.inputType == InputType::ResourcePack;

    std::vector<ArchiveEntry> entries;
    std::vector<SourceFile> files;

    if (isArchive) {
        status = task(input.jobId, "Extracting resource pack...", STEP_EXTRACT, std::nullopt, 5);
        if (!status) return status;

        Result<std::vector<ArchiveEntry>> extracted = ResourcePackCodec::extractEntries(input.bytes);
        if (!extracted) {
            return Status::failure(extracted.error());
        }
        entries = std::move(extracted).value();

        for (const auto& entry : entries) {
            if (entry.isTexture) {
                files.push_back({entry.name, entry.path, &entry.bytes});
            } else if (!repository_->addOutputFile(input.jobId, entry)) {
                return Status::failure(ErrorKind::ProcessingError, "Job " + input.jobId + " not found");
            }
        }

        status = publish(input.jobId, TaskStarted{now_(), "Processing textures...", STEP_PROCESS,
                                                  static_cast<uint32_t>(files.size()), PROGRESS_FILES_START});
        if (!status) return status;
        status = log(input.jobId, LogLevel::Success, "Found " + std::to_string(files.size()) + " texture files");
        if (!status) return status;
    } else {
        status = task(input.jobId, "Processing single image...", STEP_PROCESS, 1u, PROGRESS_FILES_START);
        if (!status) return status;
        files.push_back({input.filename, input.filename, &input.bytes});
    }

    uint32_t texturesGenerated = 0;
    const uint32_t total = static_cast<uint32_t>(files.size());
    for (uint32_t i = 0; i < total; ++i) {
        status = checkCancelled(input);
        if (!status) return status;

        status = processFile(input, files[i], i, total, texturesGenerated);
        if (!status) return status;
    }

    status = checkCancelled(input);
    if (!status) return status;

    status = task(input.jobId, "Creating output package...", STEP_PACKAGE, std::nullopt, PROGRESS_FILES_END);
    if (!status) return status;

    Result<std::vector<uint8_t>> archive =
        ResourcePackCodec::assemble(repository_->outputFiles(input.jobId), packDescriptor_);
    if (!archive) {
        return Status::failure(archive.error());
    }
    if (!repository_->storeArchive(input.jobId, std::move(archive).value())) {
        return Status::failure(ErrorKind::ProcessingError, "Job " + input.jobId + " not found");
    }
    return Status::ok();
}

Status ConversionJobRunner::processFile(const JobInput& input, const SourceFile& file, uint32_t index,
                                        uint32_t total, uint32_t& texturesGenerated) const {
    Status status = task(input.jobId, "Processing " + file.name + "...", STEP_PROCESS);
    if (!status) return status;

    Result<MaterialMapSet> maps = processor_->process(*file.bytes, input.settings, file.path);
    if (!maps) {
        return Status::failure(maps.error().kind, file.path + ": " + maps.error().message);
    }

    Result<std::vector<PackedTexture>> packed = LabPBRPacker::packOutputs(maps.value(), file.path);
    if (!packed) {
        return Status::failure(packed.error().kind, file.path + ": " + packed.error().message);
    }

    status = publish(input.jobId, TaskStarted{now_(), "Validating textures...", STEP_VALIDATE});
    if (!status) return status;

    // Validate what a shader pack would load: the packed _s and _n textures
    ValidationResult validation;
    for (const auto& texture : packed.value()) {
        if (texture.role != TextureRole::Specular && texture.role != TextureRole::Normal) {
            continue;
        }
        ValidationResult result = ChannelValidator::validate(texture.bytes, validatorKindFor(texture.role),
                                                             texture.path);
        validation.issues.insert(validation.issues.end(), result.issues.begin(), result.issues.end());
    }

    TextureFileRecord record;
    record.jobId = input.jobId;
    record.originalPath = file.path;
    record.textureType = detectTextureType(file.path);
    record.validationStatus = validationStatusFor(validation);
    record.validationIssues = validation.issues;
    if (!packed.value().empty()) {
        record.convertedPath = packed.value().front().path;
    }
    if (repository_->addTextureFile(record) == 0) {
        return Status::failure(ErrorKind::ProcessingError, "Job " + input.jobId + " not found");
    }

    for (const auto& texture : packed.value()) {
        ArchiveEntry output;
        output.path = texture.path;
        size_t slash = texture.path.find_last_of('/');
        output.name = slash == std::string::npos ? texture.path : texture.path.substr(slash + 1);
        output.bytes = texture.bytes;
        output.isTexture = true;
        if (!repository_->addOutputFile(input.jobId, std::move(output))) {
            return Status::failure(ErrorKind::ProcessingError, "Job " + input.jobId + " not found");
        }
    }
    texturesGenerated += static_cast<uint32_t>(packed.value().size());

    FileProgressed progressed;
    progressed.at = now_();
    progressed.fileName = file.name;
    progressed.imagesProcessed = index + 1;
    progressed.texturesGenerated = texturesGenerated;
    progressed.progress = PROGRESS_FILES_START +
        static_cast<int>((PROGRESS_FILES_END - PROGRESS_FILES_START) * (index + 1) / total);
    for (const auto& issue : validation.issues) {
        if (issue.level == IssueLevel::Warning) {
            progressed.warnings.push_back(file.path + ": " + issue.message);
        }
    }
    status = publish(input.jobId, progressed);
    if (!status) return status;

    SDL_Log("ConversionJobRunner: job %s processed %s (%zu maps, %s)", input.jobId.c_str(), file.path.c_str(),
            packed.value().size(), validationStatusName(record.validationStatus));

    LogLevel level = record.validationStatus == ValidationStatus::Valid ? LogLevel::Success : LogLevel::Warning;
    return log(input.jobId, level, "Processed " + file.name + ": " + std::to_string(packed.value().size()) +
               " maps, validation " + validationStatusName(record.validationStatus));
}

} // namespace LabPBR
