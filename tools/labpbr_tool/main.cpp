#include "image/ImageCodec.h"
#include "service/ConversionService.h"
#include "service/JsonExport.h"
#include "service/ServiceConfig.h"
#include "synthesis/DepthEstimator.h"
#include <SDL3/SDL_log.h>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

void printUsage(const char* programName) {
    SDL_Log("LabPBR texture tool");
    SDL_Log("Usage: %s <command> [options]", programName);
    SDL_Log("");
    SDL_Log("Commands:");
    SDL_Log("  convert               Generate LabPBR maps for an image or resource pack");
    SDL_Log("  validate              Check textures against the LabPBR 1.3 channel layout");
    SDL_Log("  analyze               Report F0, metal, porosity and emission statistics of a specular map");
    SDL_Log("");
    SDL_Log("Options:");
    SDL_Log("  --input <path>        Image or .zip resource pack (required)");
    SDL_Log("  --output <path>       Output archive for convert (default: <stem>_labpbr.zip)");
    SDL_Log("  --settings <path>     Conversion settings JSON file");
    SDL_Log("  --config <path>       Service config JSON file");
    SDL_Log("  --depth <path>        Depth map PNG used for height and normals");
    SDL_Log("  --help                Show this help message");
    SDL_Log("");
    SDL_Log("Results are printed to stdout as JSON.");
}

struct ToolOptions {
    std::string command;
    std::string inputPath;
    std::string outputPath;
    std::string settingsPath;
    std::string configPath;
    std::string depthPath;
};

bool parseArguments(int argc, char* argv[], ToolOptions& opts) {
    if (argc < 2) {
        return false;
    }

    opts.command = argv[1];
    if (opts.command == "--help" || opts.command == "-h") {
        return false;
    }
    if (opts.command != "convert" && opts.command != "validate" && opts.command != "analyze") {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Unknown command: %s", opts.command.c_str());
        return false;
    }

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            return false;
        }
        else if (arg == "--input" && i + 1 < argc) {
            opts.inputPath = argv[++i];
        }
        else if (arg == "--output" && i + 1 < argc) {
            opts.outputPath = argv[++i];
        }
        else if (arg == "--settings" && i + 1 < argc) {
            opts.settingsPath = argv[++i];
        }
        else if (arg == "--config" && i + 1 < argc) {
            opts.configPath = argv[++i];
        }
        else if (arg == "--depth" && i + 1 < argc) {
            opts.depthPath = argv[++i];
        }
        else {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Unknown argument: %s", arg.c_str());
            return false;
        }
    }

    if (opts.inputPath.empty()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Missing required argument: --input");
        return false;
    }

    return true;
}

bool readFile(const std::string& path, std::vector<uint8_t>& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to open %s", path.c_str());
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    return true;
}

bool writeFile(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to create %s", path.c_str());
        return false;
    }
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return file.good();
}

int runConvert(LabPBR::ConversionService& service, const ToolOptions& opts, std::vector<uint8_t> input) {
    std::string settingsJson;
    if (!opts.settingsPath.empty()) {
        std::vector<uint8_t> settingsBytes;
        if (!readFile(opts.settingsPath, settingsBytes)) {
            return 1;
        }
        settingsJson.assign(settingsBytes.begin(), settingsBytes.end());
    }

    LabPBR::Result<std::string> submitted = service.submit(opts.inputPath, std::move(input), settingsJson);
    if (!submitted) {
        std::cout << LabPBR::JsonExport::toJson(submitted.error()).dump(2) << std::endl;
        return 1;
    }

    const std::string& jobId = submitted.value();
    service.waitForIdle();

    std::optional<LabPBR::ConversionJob> job = service.job(jobId);
    std::optional<LabPBR::ProcessingStatus> status = service.status(jobId);
    if (!job || !status) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Job %s disappeared", jobId.c_str());
        return 1;
    }

    nlohmann::json files = nlohmann::json::array();
    for (const auto& record : service.files(jobId)) {
        files.push_back(LabPBR::JsonExport::toJson(record));
    }

    nlohmann::json result = {
        {"job", LabPBR::JsonExport::toJson(*job)},
        {"status", LabPBR::JsonExport::toJson(*status)},
        {"files", files},
    };

    LabPBR::DownloadResult download = service.download(jobId);
    if (download.status == LabPBR::DownloadStatus::Ok) {
        std::string outputPath = opts.outputPath.empty() ? download.filename : opts.outputPath;
        if (!writeFile(outputPath, download.bytes)) {
            return 1;
        }
        result["output"] = outputPath;
        SDL_Log("Wrote %s (%zu bytes)", outputPath.c_str(), download.bytes.size());
    }

    std::cout << result.dump(2) << std::endl;
    return job->status == LabPBR::JobStatus::Completed ? 0 : 1;
}

int runValidate(LabPBR::ConversionService& service, const ToolOptions& opts, std::vector<uint8_t> input) {
    LabPBR::ValidationReport report = service.validate(opts.inputPath, std::move(input)).get();
    std::cout << LabPBR::JsonExport::toJson(report).dump(2) << std::endl;
    return report.isValid ? 0 : 2;
}

int runAnalyze(LabPBR::ConversionService& service, const ToolOptions& opts, std::vector<uint8_t> input) {
    LabPBR::Result<LabPBR::MaterialReport> report = service.analyze(std::move(input), opts.inputPath).get();
    if (!report) {
        std::cout << LabPBR::JsonExport::toJson(report.error()).dump(2) << std::endl;
        return 1;
    }
    std::cout << LabPBR::JsonExport::toJson(report.value()).dump(2) << std::endl;
    return 0;
}

int main(int argc, char* argv[]) {
    ToolOptions opts;

    if (!parseArguments(argc, argv, opts)) {
        printUsage(argv[0]);
        return 1;
    }

    LabPBR::ServiceConfig config;
    if (!opts.configPath.empty()) {
        config = LabPBR::ServiceConfig::loadFromFile(opts.configPath);
    }

    std::shared_ptr<LabPBR::DepthEstimator> depthEstimator;
    if (!opts.depthPath.empty()) {
        std::vector<uint8_t> depthBytes;
        if (!readFile(opts.depthPath, depthBytes)) {
            return 1;
        }
        LabPBR::Result<LabPBR::PixelBuffer> depth = LabPBR::ImageCodec::decode(depthBytes, opts.depthPath);
        if (!depth) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to load depth map %s: %s",
                         opts.depthPath.c_str(), depth.error().message.c_str());
            return 1;
        }
        depthEstimator = std::make_shared<LabPBR::StaticDepthEstimator>(std::move(depth).value());
    }

    std::vector<uint8_t> input;
    if (!readFile(opts.inputPath, input)) {
        return 1;
    }

    auto service = LabPBR::ConversionService::create(config, depthEstimator);
    if (!service) {
        return 1;
    }

    if (opts.command == "convert") {
        return runConvert(*service, opts, std::move(input));
    }
    if (opts.command == "validate") {
        return runValidate(*service, opts, std::move(input));
    }
    return runAnalyze(*service, opts, std::move(input));
}
