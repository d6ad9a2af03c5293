#include "JsonExport.h"

using json = nlohmann::json;

namespace LabPBR {
namespace JsonExport {

namespace {

template<typename T>
json optionalValue(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

json rgbJson(const std::optional<RGB8>& rgb) {
    if (!rgb) return nullptr;
    return json{{"r", rgb->r}, {"g", rgb->g}, {"b", rgb->b}};
}

} // namespace

json toJson(const ValidationIssue& issue) {
    json j = {
        {"level", issueLevelName(issue.level)},
        {"message", issue.message},
    };
    if (issue.channel) j["channel"] = *issue.channel;
    if (issue.value) j["value"] = *issue.value;
    if (issue.suggestion) j["suggestion"] = *issue.suggestion;
    return j;
}

json toJson(const ValidationResult& result) {
    json issues = json::array();
    for (const auto& issue : result.issues) {
        issues.push_back(toJson(issue));
    }
    return json{
        {"isValid", result.isValid()},
        {"issues", issues},
        {"version", result.specVersion},
    };
}

json toJson(const ValidationReport& report) {
    json issues = json::array();
    for (const auto& tagged : report.issues) {
        json j = toJson(tagged.issue);
        j["filename"] = tagged.filename;
        j["path"] = tagged.path;
        issues.push_back(std::move(j));
    }

    json details = json::array();
    for (const auto& file : report.fileDetails) {
        details.push_back({
            {"filename", file.filename},
            {"path", file.path},
            {"size", file.size},
            {"validation", toJson(file.validation)},
        });
    }

    return json{
        {"isValid", report.isValid},
        {"issues", issues},
        {"version", report.specVersion},
        {"totalFiles", report.totalFiles},
        {"textureFiles", report.textureFiles},
        {"fileDetails", details},
    };
}

json toJson(const MaterialMatch& match) {
    return json{
        {"name", match.name},
        {"category", match.category},
        {"f0", match.f0},
        {"reflectance", optionalValue(match.reflectance)},
        {"ior", optionalValue(match.ior)},
        {"rgbF0", rgbJson(match.rgbF0)},
        {"difference", match.difference},
        {"notes", match.notes},
    };
}

json toJson(const MaterialReport& report) {
    json distribution = json::object();
    for (const auto& [value, count] : report.redDistribution) {
        distribution[std::to_string(value)] = count;
    }

    return json{
        {"width", report.width},
        {"height", report.height},
        {"avgRed", report.avgRed},
        {"avgRedPct", report.avgRedPct},
        {"avgGreen", report.avgGreen},
        {"avgBlue", report.avgBlue},
        {"avgAlpha", report.avgAlpha},
        {"greenF0CoveragePct", report.greenF0CoveragePct},
        {"greenMetalCoveragePct", report.greenMetalCoveragePct},
        {"avgF0Encoded", optionalValue(report.avgF0Encoded)},
        {"avgF0Percent", optionalValue(report.avgF0Percent)},
        {"topMetalCode", optionalValue(report.topMetalCode)},
        {"topMetalName", optionalValue(report.topMetalName)},
        {"porosityCoveragePct", report.porosityCoveragePct},
        {"sssCoveragePct", report.sssCoveragePct},
        {"avgPorosityPct", optionalValue(report.avgPorosityPct)},
        {"avgSSSPct", optionalValue(report.avgSSSPct)},
        {"avgEmissionPct", report.avgEmissionPct},
        {"closestMaterial", report.closestMaterial ? toJson(*report.closestMaterial) : json(nullptr)},
        {"redDistribution", distribution},
        {"warnings", report.warnings},
    };
}

json toJson(const ConversionJob& job) {
    return json{
        {"id", job.id},
        {"filename", job.filename},
        {"status", jobStatusName(job.status)},
        {"progress", job.progress},
        {"settings", job.settings.toJson()},
        {"errors", job.errors},
        {"warnings", job.warnings},
        {"createdAt", formatIsoTimestamp(job.createdAt)},
        {"completedAt", job.completedAt ? json(formatIsoTimestamp(*job.completedAt)) : json(nullptr)},
    };
}

json toJson(const ProcessingStatus& status) {
    json logs = json::array();
    for (const auto& entry : status.logs) {
        logs.push_back({
            {"timestamp", entry.timestamp},
            {"level", logLevelName(entry.level)},
            {"message", entry.message},
        });
    }
    return json{
        {"currentTask", status.currentTask},
        {"progress", status.progress},
        {"totalSteps", status.totalSteps},
        {"currentStep", status.currentStep},
        {"imagesProcessed", status.imagesProcessed},
        {"totalImages", status.totalImages},
        {"texturesGenerated", status.texturesGenerated},
        {"elapsedTime", status.elapsedTime},
        {"logs", logs},
    };
}

json toJson(const TextureFileRecord& record) {
    json issues = json::array();
    for (const auto& issue : record.validationIssues) {
        issues.push_back(toJson(issue));
    }
    return json{
        {"id", record.id},
        {"jobId", record.jobId},
        {"originalPath", record.originalPath},
        {"textureType", textureRoleName(record.textureType)},
        {"validationStatus", validationStatusName(record.validationStatus)},
        {"validationIssues", issues},
        {"convertedPath", optionalValue(record.convertedPath)},
    };
}

json toJson(const ProcessingError& error) {
    return json{
        {"error", errorKindName(error.kind)},
        {"message", error.message},
    };
}

} // namespace JsonExport
} // namespace LabPBR
