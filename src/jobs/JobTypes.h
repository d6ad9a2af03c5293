#pragma once

#include "ConversionSettings.h"
#include "core/Result.h"
#include "labpbr/ChannelValidator.h"
#include "labpbr/LabPBRFormat.h"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace LabPBR {

using Clock = std::chrono::system_clock;

// "2026-01-31T12:00:00.000Z"
std::string formatIsoTimestamp(Clock::time_point time);

enum class JobStatus {
    Pending,
    Processing,
    Completed,
    Failed
};

const char* jobStatusName(JobStatus status);
bool isTerminal(JobStatus status);

enum class LogLevel {
    Info,
    Success,
    Warning,
    Error
};

const char* logLevelName(LogLevel level);

struct ProcessingLog {
    std::string timestamp;
    LogLevel level = LogLevel::Info;
    std::string message;
};

struct ProcessingStatus {
    std::string currentTask = "Initializing...";
    int progress = 0;
    uint32_t currentStep = 0;
    uint32_t totalSteps = 5;
    uint32_t imagesProcessed = 0;
    uint32_t totalImages = 0;
    uint32_t texturesGenerated = 0;
    int64_t elapsedTime = 0;            // Milliseconds since the job was created
    std::vector<ProcessingLog> logs;    // Append-only
};

struct ConversionJob {
    std::string id;
    std::string filename;
    JobStatus status = JobStatus::Pending;
    ConversionSettings settings;
    int progress = 0;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    Clock::time_point createdAt;
    std::optional<Clock::time_point> completedAt;
};

enum class ValidationStatus {
    Valid,
    Warning,
    Error
};

const char* validationStatusName(ValidationStatus status);

// Worst issue level of a validation result
ValidationStatus validationStatusFor(const ValidationResult& result);

// One processed source texture of a job
struct TextureFileRecord {
    uint64_t id = 0;
    std::string jobId;
    std::string originalPath;
    TextureRole textureType = TextureRole::Base;
    ValidationStatus validationStatus = ValidationStatus::Valid;
    std::vector<ValidationIssue> validationIssues;
    std::optional<std::string> convertedPath;
};

// ============================================================================
// Job events
// ============================================================================
// The job state only changes by folding these events, in order.

struct JobStarted {
    Clock::time_point at;
};

struct TaskStarted {
    Clock::time_point at;
    std::string task;
    uint32_t step = 0;
    std::optional<uint32_t> totalImages;
    std::optional<int> progress;
};

struct FileProgressed {
    Clock::time_point at;
    std::string fileName;
    uint32_t imagesProcessed = 0;
    uint32_t texturesGenerated = 0;     // Running total
    int progress = 0;
    std::vector<std::string> warnings;
};

struct LogAppended {
    Clock::time_point at;
    LogLevel level = LogLevel::Info;
    std::string message;
};

struct Completed {
    Clock::time_point at;
};

struct Failed {
    Clock::time_point at;
    std::string message;
};

using JobEvent = std::variant<JobStarted, TaskStarted, FileProgressed, LogAppended, Completed, Failed>;

const char* jobEventName(const JobEvent& event);

struct JobState {
    ConversionJob job;
    ProcessingStatus status;
};

// Fresh pending job with its initial status log
JobState makeJobState(std::string id, std::string filename, ConversionSettings settings, Clock::time_point createdAt);

/**
 * Fold one event into the state.
 *
 *   pending --JobStarted--> processing --Completed--> completed
 *                           processing --Failed-----> failed
 *
 * Events that do not fit the current state (anything after a terminal state,
 * progress before the job started) are rejected and leave the state untouched.
 */
Status applyJobEvent(JobState& state, const JobEvent& event);

} // namespace LabPBR
