#include "ResourcePackCodec.h"
#include "core/ScopeGuard.h"
#include <miniz.h>
#include <nlohmann/json.hpp>
#include <SDL3/SDL_log.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <unordered_map>

namespace LabPBR {
namespace ResourcePackCodec {

namespace {

const char* const TEXTURE_EXTENSIONS[] = {".png", ".jpg", ".jpeg", ".tiff", ".tga"};

std::string lowerExtension(const std::string& path) {
    size_t slash = path.find_last_of('/');
    size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "";
    }
    std::string ext = path.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string basename(const std::string& path) {
    size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string zipError(mz_zip_archive& zip) {
    return mz_zip_get_error_string(mz_zip_get_last_error(&zip));
}

} // namespace

bool isTexturePath(const std::string& path) {
    std::string ext = lowerExtension(path);
    for (const char* textureExt : TEXTURE_EXTENSIONS) {
        if (ext == textureExt) return true;
    }
    return false;
}

bool isArchiveFilename(const std::string& filename) {
    return lowerExtension(filename) == ".zip";
}

bool isSafeEntryPath(const std::string& path) {
    if (path.empty() || path[0] == '/' || path[0] == '\\') return false;
    if (path.size() > 1 && path[1] == ':') return false;  // Drive letter

    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find_first_of("/\\", start);
        if (end == std::string::npos) end = path.size();
        if (path.compare(start, end - start, "..") == 0 && end - start == 2) {
            return false;
        }
        start = end + 1;
    }
    return true;
}

Result<std::vector<ArchiveEntry>> extractEntries(const std::vector<uint8_t>& archive) {
    using Entries = std::vector<ArchiveEntry>;

    if (archive.empty()) {
        return Result<Entries>::failure(ErrorKind::DecodeError, "Archive is empty");
    }

    mz_zip_archive zip;
    memset(&zip, 0, sizeof(zip));

    if (!mz_zip_reader_init_mem(&zip, archive.data(), archive.size(), 0)) {
        return Result<Entries>::failure(ErrorKind::DecodeError, "Failed to open ZIP archive: " + zipError(zip));
    }
    auto zipGuard = makeScopeGuard([&]() { mz_zip_reader_end(&zip); });

    Entries entries;
    mz_uint numFiles = mz_zip_reader_get_num_files(&zip);

    for (mz_uint i = 0; i < numFiles; i++) {
        if (mz_zip_reader_is_file_a_directory(&zip, i)) {
            continue;
        }

        mz_zip_archive_file_stat fileStat;
        if (!mz_zip_reader_file_stat(&zip, i, &fileStat)) {
            return Result<Entries>::failure(ErrorKind::DecodeError,
                "Failed to read ZIP entry " + std::to_string(i) + ": " + zipError(zip));
        }

        std::string path = fileStat.m_filename;
        if (!isSafeEntryPath(path)) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "ResourcePackCodec: skipping unsafe entry path: %s",
                        path.c_str());
            continue;
        }

        size_t uncompSize = static_cast<size_t>(fileStat.m_uncomp_size);
        std::vector<uint8_t> buffer(uncompSize);
        if (uncompSize > 0 && !mz_zip_reader_extract_to_mem(&zip, i, buffer.data(), uncompSize, 0)) {
            return Result<Entries>::failure(ErrorKind::DecodeError,
                "Failed to extract " + path + ": " + zipError(zip));
        }

        ArchiveEntry entry;
        entry.name = basename(path);
        entry.path = path;
        entry.bytes = std::move(buffer);
        entry.isTexture = isTexturePath(path);
        entries.push_back(std::move(entry));
    }

    return Result<Entries>::success(std::move(entries));
}

Result<std::vector<ArchiveEntry>> extractResourcePack(const std::vector<uint8_t>& archive) {
    Result<std::vector<ArchiveEntry>> all = extractEntries(archive);
    if (!all) {
        return all;
    }

    std::vector<ArchiveEntry> textures;
    for (auto& entry : all.value()) {
        if (entry.isTexture) {
            textures.push_back(std::move(entry));
        }
    }
    SDL_Log("ResourcePackCodec: extracted %zu textures from %zu entries",
            textures.size(), all.value().size());
    return Result<std::vector<ArchiveEntry>>::success(std::move(textures));
}

std::string packMcmeta(const PackDescriptor& descriptor) {
    nlohmann::json j = {
        {"pack", {
            {"pack_format", descriptor.packFormat},
            {"description", descriptor.description},
        }},
    };
    return j.dump(2);
}

Result<std::vector<uint8_t>> assemble(const std::vector<ArchiveEntry>& files, const PackDescriptor& descriptor) {
    using Bytes = std::vector<uint8_t>;

    // Last write wins per path, first-seen order is kept
    std::vector<const ArchiveEntry*> ordered;
    std::unordered_map<std::string, size_t> indexByPath;
    for (const auto& file : files) {
        auto it = indexByPath.find(file.path);
        if (it != indexByPath.end()) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "ResourcePackCodec: duplicate path %s, keeping the later file",
                        file.path.c_str());
            ordered[it->second] = &file;
            continue;
        }
        indexByPath[file.path] = ordered.size();
        ordered.push_back(&file);
    }

    ArchiveEntry generatedMeta;
    if (indexByPath.find(PACK_MCMETA) == indexByPath.end()) {
        std::string meta = packMcmeta(descriptor);
        generatedMeta.name = PACK_MCMETA;
        generatedMeta.path = PACK_MCMETA;
        generatedMeta.bytes.assign(meta.begin(), meta.end());
        ordered.insert(ordered.begin(), &generatedMeta);
    }

    mz_zip_archive zip;
    memset(&zip, 0, sizeof(zip));

    if (!mz_zip_writer_init_heap(&zip, 0, 0)) {
        return Result<Bytes>::failure(ErrorKind::ProcessingError, "Failed to create ZIP archive: " + zipError(zip));
    }
    auto zipGuard = makeScopeGuard([&]() { mz_zip_writer_end(&zip); });

    for (const ArchiveEntry* file : ordered) {
        if (!isSafeEntryPath(file->path)) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "ResourcePackCodec: not writing unsafe path %s",
                        file->path.c_str());
            continue;
        }
        if (!mz_zip_writer_add_mem(&zip, file->path.c_str(), file->bytes.data(), file->bytes.size(),
                                   MZ_DEFAULT_COMPRESSION)) {
            return Result<Bytes>::failure(ErrorKind::ProcessingError,
                "Failed to add " + file->path + " to archive: " + zipError(zip));
        }
    }

    void* heapData = nullptr;
    size_t heapSize = 0;
    if (!mz_zip_writer_finalize_heap_archive(&zip, &heapData, &heapSize)) {
        return Result<Bytes>::failure(ErrorKind::ProcessingError, "Failed to finalize archive: " + zipError(zip));
    }
    auto heapGuard = makeScopeGuard([&]() { mz_free(heapData); });

    const uint8_t* begin = static_cast<const uint8_t*>(heapData);
    Bytes out(begin, begin + heapSize);
    SDL_Log("ResourcePackCodec: assembled archive with %zu files (%zu bytes)", ordered.size(), out.size());
    return Result<Bytes>::success(std::move(out));
}

} // namespace ResourcePackCodec
} // namespace LabPBR
