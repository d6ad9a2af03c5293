#pragma once

#include "core/Result.h"
#include <cstdint>
#include <string>
#include <vector>

namespace LabPBR {

struct ArchiveEntry {
    std::string name;       // Basename
    std::string path;       // Full relative path inside the archive
    std::vector<uint8_t> bytes;
    bool isTexture = false;
};

struct PackDescriptor {
    int packFormat = 15;
    std::string description = "LabPBR converted resource pack";
};

/**
 * ResourcePackCodec - zip archive access for resource packs (miniz, in memory)
 *
 * Entries are classified as textures by extension (.png .jpg .jpeg .tiff .tga,
 * case-insensitive). Directory entries are skipped, and so are entries whose
 * path is absolute or climbs out of the archive with "..".
 */
namespace ResourcePackCodec {

constexpr const char* PACK_MCMETA = "pack.mcmeta";

bool isTexturePath(const std::string& path);
bool isArchiveFilename(const std::string& filename);
bool isSafeEntryPath(const std::string& path);

// Every file entry, textures and otherwise
Result<std::vector<ArchiveEntry>> extractEntries(const std::vector<uint8_t>& archive);

// Texture entries only
Result<std::vector<ArchiveEntry>> extractResourcePack(const std::vector<uint8_t>& archive);

// pack.mcmeta body, pretty-printed JSON
std::string packMcmeta(const PackDescriptor& descriptor);

// Zip the files. A pack.mcmeta is generated unless one is among the files.
// When two files share a path the later one wins.
Result<std::vector<uint8_t>> assemble(const std::vector<ArchiveEntry>& files,
                                      const PackDescriptor& descriptor = {});

} // namespace ResourcePackCodec

} // namespace LabPBR
