#pragma once

// JSON views of service results, in the field names clients expect
// (camelCase, "version" for the LabPBR spec version, ISO-8601 UTC times)

#include "ConversionService.h"
#include "jobs/JobTypes.h"
#include "labpbr/ChannelValidator.h"
#include "labpbr/MaterialAnalyzer.h"
#include <nlohmann/json.hpp>

namespace LabPBR {
namespace JsonExport {

nlohmann::json toJson(const ValidationIssue& issue);
nlohmann::json toJson(const ValidationResult& result);
nlohmann::json toJson(const ValidationReport& report);
nlohmann::json toJson(const MaterialMatch& match);
nlohmann::json toJson(const MaterialReport& report);
nlohmann::json toJson(const ConversionJob& job);
nlohmann::json toJson(const ProcessingStatus& status);
nlohmann::json toJson(const TextureFileRecord& record);
nlohmann::json toJson(const ProcessingError& error);

} // namespace JsonExport
} // namespace LabPBR
