#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace LabPBR {

struct RGB8 {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

struct CatalogMaterial {
    std::string name;
    std::string category;
    uint8_t f0 = 0;                     // Encoded F0, or the metal code for metals
    std::optional<float> f0Percent;     // Dielectrics only
    std::optional<float> ior;           // Dielectrics only
    std::optional<RGB8> rgbF0;          // Metals only
    std::string notes;
};

/**
 * MaterialCatalog - static reference materials for F0 matching
 *
 * Categories keep a fixed order (liquids, surfaces, plastics, gems,
 * transparents, human, building, woods, paints, metals) and entries keep
 * their order within a category, so nearest-match ties resolve the same way
 * every time.
 */
namespace MaterialCatalog {

// ((n-1)/(n+1))^2 * 100
float f0PercentFromIOR(float ior);

// round(percent * 2.55)
uint8_t encodeF0(float f0Percent);

const std::vector<std::string>& categories();

// Every entry flattened in category order
const std::vector<CatalogMaterial>& all();

std::vector<CatalogMaterial> byCategory(const std::string& category);

// Entry minimising |encodedF0 - f0|, first wins on ties
const CatalogMaterial& nearest(float encodedF0);

} // namespace MaterialCatalog

} // namespace LabPBR
