#include "JobTypes.h"
#include <algorithm>
#include <cstdio>
#include <ctime>

namespace LabPBR {

std::string formatIsoTimestamp(Clock::time_point time) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
    std::time_t seconds = static_cast<std::time_t>(ms / 1000);
    int millis = static_cast<int>(ms % 1000);
    if (millis < 0) {
        millis += 1000;
        --seconds;
    }

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec, millis);
    return buffer;
}

const char* jobStatusName(JobStatus status) {
    switch (status) {
        case JobStatus::Pending:    return "pending";
        case JobStatus::Processing: return "processing";
        case JobStatus::Completed:  return "completed";
        case JobStatus::Failed:     return "failed";
    }
    return "pending";
}

bool isTerminal(JobStatus status) {
    return status == JobStatus::Completed || status == JobStatus::Failed;
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Info:    return "info";
        case LogLevel::Success: return "success";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error:   return "error";
    }
    return "info";
}

const char* validationStatusName(ValidationStatus status) {
    switch (status) {
        case ValidationStatus::Valid:   return "valid";
        case ValidationStatus::Warning: return "warning";
        case ValidationStatus::Error:   return "error";
    }
    return "valid";
}

ValidationStatus validationStatusFor(const ValidationResult& result) {
    if (result.count(IssueLevel::Error) > 0) return ValidationStatus::Error;
    if (result.count(IssueLevel::Warning) > 0) return ValidationStatus::Warning;
    return ValidationStatus::Valid;
}

const char* jobEventName(const JobEvent& event) {
    static const char* const names[] = {
        "JobStarted", "TaskStarted", "FileProgressed", "LogAppended", "Completed", "Failed"
    };
    return names[event.index()];
}

JobState makeJobState(std::string id, std::string filename, ConversionSettings settings, Clock::time_point createdAt) {
    JobState state;
    state.job.id = std::move(id);
    state.job.filename = std::move(filename);
    state.job.settings = settings;
    state.job.createdAt = createdAt;
    state.status.logs.push_back({formatIsoTimestamp(createdAt), LogLevel::Info, "Job queued"});
    return state;
}

namespace {

class EventApplier {
public:
    explicit EventApplier(JobState& state) : state_(state) {}

    Status operator()(const JobStarted& e) {
        if (state_.job.status != JobStatus::Pending) {
            return reject("JobStarted");
        }
        state_.job.status = JobStatus::Processing;
        touch(e.at);
        log(e.at, LogLevel::Info, "Processing started");
        return Status::ok();
    }

    Status operator()(const TaskStarted& e) {
        if (state_.job.status != JobStatus::Processing) {
            return reject("TaskStarted");
        }
        state_.status.currentTask = e.task;
        state_.status.currentStep = e.step;
        if (e.totalImages) {
            state_.status.totalImages = *e.totalImages;
        }
        if (e.progress) {
            setProgress(*e.progress);
        }
        touch(e.at);
        return Status::ok();
    }

    Status operator()(const FileProgressed& e) {
        if (state_.job.status != JobStatus::Processing) {
            return reject("FileProgressed");
        }
        state_.status.imagesProcessed = e.imagesProcessed;
        state_.status.texturesGenerated = e.texturesGenerated;
        setProgress(e.progress);
        state_.job.warnings.insert(state_.job.warnings.end(), e.warnings.begin(), e.warnings.end());
        touch(e.at);
        return Status::ok();
    }

    Status operator()(const LogAppended& e) {
        if (isTerminal(state_.job.status)) {
            return reject("LogAppended");
        }
        touch(e.at);
        log(e.at, e.level, e.message);
        return Status::ok();
    }

    Status operator()(const Completed& e) {
        if (state_.job.status != JobStatus::Processing) {
            return reject("Completed");
        }
        state_.job.status = JobStatus::Completed;
        state_.job.completedAt = e.at;
        setProgress(100);
        state_.status.currentTask = "Complete!";
        state_.status.currentStep = state_.status.totalSteps;
        touch(e.at);
        log(e.at, LogLevel::Success, "Processing completed successfully");
        return Status::ok();
    }

    Status operator()(const Failed& e) {
        if (state_.job.status != JobStatus::Processing) {
            return reject("Failed");
        }
        state_.job.status = JobStatus::Failed;
        state_.job.errors.push_back(e.message);
        state_.status.currentTask = "Failed";
        touch(e.at);
        log(e.at, LogLevel::Error, "Processing failed: " + e.message);
        return Status::ok();
    }

private:
    Status reject(const char* eventName) const {
        return Status::failure(ErrorKind::ProcessingError,
            std::string(eventName) + " is not valid for job " + state_.job.id +
            " in state " + jobStatusName(state_.job.status));
    }

    // Progress never moves backwards
    void setProgress(int progress) {
        int clamped = std::clamp(progress, 0, 100);
        state_.job.progress = std::max(state_.job.progress, clamped);
        state_.status.progress = state_.job.progress;
    }

    void touch(Clock::time_point at) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(at - state_.job.createdAt).count();
        state_.status.elapsedTime = std::max<int64_t>(state_.status.elapsedTime, elapsed);
    }

    void log(Clock::time_point at, LogLevel level, std::string message) {
        state_.status.logs.push_back({formatIsoTimestamp(at), level, std::move(message)});
    }

    JobState& state_;
};

} // namespace

Status applyJobEvent(JobState& state, const JobEvent& event) {
    // Each handler checks the transition before touching the state
    return std::visit(EventApplier(state), event);
}

} // namespace LabPBR
