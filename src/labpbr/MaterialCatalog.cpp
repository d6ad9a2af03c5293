#include "MaterialCatalog.h"
#include <cmath>

namespace LabPBR {
namespace MaterialCatalog {

namespace {

struct DielectricDef {
    const char* category;
    const char* name;
    float ior;
    const char* notes;
};

struct MetalDef {
    const char* name;
    uint8_t code;
    RGB8 rgb;
    const char* notes;
};

const DielectricDef DIELECTRICS[] = {
    {"liquids", "Water (20C)", 1.333f, "Clear fresh water"},
    {"liquids", "Ice (-10C)", 1.31f, ""},
    {"liquids", "Milk (turbid)", 1.35f, "Scattering dominates; F0 driven by base fluid"},
    {"liquids", "Ethanol (alcohol)", 1.361f, ""},
    {"liquids", "Vegetable oil", 1.47f, ""},
    {"liquids", "Glycerin (~75% sugar-like)", 1.473f, ""},
    {"liquids", "Sucrose solution (~50%)", 1.42f, "Representative for syrups"},

    {"surfaces", "PTFE (Teflon)", 1.35f, ""},
    {"surfaces", "Human skin (epidermis)", 1.50f, "Topcoat only; SSS dominates appearance"},
    {"surfaces", "Rubber", 1.52f, ""},
    {"surfaces", "Cellulose (paper/wood fibers)", 1.47f, ""},
    {"surfaces", "Polystyrene", 1.59f, ""},
    {"surfaces", "Nylon", 1.53f, ""},
    {"surfaces", "Ceramic glaze (gloss)", 1.52f, ""},
    {"surfaces", "Asphalt (binder)", 1.52f, "Macro-rough; low spec visually"},

    {"plastics", "PMMA (Acrylic/Plexiglas)", 1.49f, ""},
    {"plastics", "Polycarbonate (PC)", 1.585f, ""},
    {"plastics", "PVC", 1.54f, ""},
    {"plastics", "ABS", 1.54f, ""},

    {"gems", "Quartz (SiO2)", 1.544f, ""},
    {"gems", "Halite (rock salt)", 1.544f, ""},
    {"gems", "Amethyst (quartz)", 1.544f, ""},
    {"gems", "Amber", 1.55f, ""},
    {"gems", "Jadeite", 1.66f, ""},
    {"gems", "Emerald (beryl)", 1.58f, ""},
    {"gems", "Sapphire (corundum)", 1.76f, ""},
    {"gems", "Ruby (corundum)", 1.76f, ""},
    {"gems", "Topaz", 1.62f, ""},
    {"gems", "Cubic zirconia", 2.15f, ""},
    {"gems", "Diamond", 2.417f, ""},

    {"transparents", "Fused silica", 1.458f, ""},
    {"transparents", "Borosilicate (Pyrex)", 1.47f, ""},
    {"transparents", "Soda-lime glass", 1.52f, ""},
    {"transparents", "Flint glass (dense)", 1.62f, ""},
    {"transparents", "Crystal (lead glass)", 1.70f, ""},

    {"human", "Tears/Saliva (aqueous)", 1.336f, ""},
    {"human", "Cornea", 1.376f, ""},
    {"human", "Eye lens", 1.406f, ""},
    {"human", "Tooth dentin", 1.54f, ""},
    {"human", "Tooth enamel", 1.62f, ""},
    {"human", "Hair (surface)", 1.55f, ""},

    {"building", "Concrete (binder)", 1.52f, "Macro-rough, porous"},
    {"building", "Granite (polished)", 1.60f, ""},
    {"building", "Marble (polished)", 1.49f, ""},
    {"building", "Porcelain tile (glaze)", 1.52f, ""},

    {"woods", "Bare wood (cellulose)", 1.47f, "Finish changes gloss only"},
    {"woods", "Varnished wood", 1.52f, ""},
    {"woods", "Oiled wood", 1.47f, ""},

    {"paints", "Matte paint (binder)", 1.52f, "Microfacet roughness high"},
    {"paints", "Gloss clearcoat", 1.52f, ""},
};

const MetalDef METALS[] = {
    {"Iron", 230, {196, 199, 199}, "Gray, slightly bluish"},
    {"Gold", 231, {255, 215, 0}, "Rich yellow tone"},
    {"Aluminum", 232, {224, 223, 219}, "Light gray, near-white"},
    {"Chrome", 233, {236, 236, 236}, "Neutral reflective silver"},
    {"Copper", 234, {184, 115, 51}, "Warm reddish-brown"},
    {"Lead", 235, {140, 140, 140}, "Dull gray, low reflectance"},
    {"Platinum", 236, {229, 228, 226}, "Pale silvery-white"},
    {"Silver", 237, {245, 245, 245}, "Bright, nearly white metal"},
};

std::vector<CatalogMaterial> buildCatalog() {
    std::vector<CatalogMaterial> materials;
    for (const auto& def : DIELECTRICS) {
        CatalogMaterial m;
        m.name = def.name;
        m.category = def.category;
        m.ior = def.ior;
        m.f0Percent = f0PercentFromIOR(def.ior);
        m.f0 = encodeF0(*m.f0Percent);
        m.notes = def.notes;
        materials.push_back(std::move(m));
    }
    for (const auto& def : METALS) {
        CatalogMaterial m;
        m.name = def.name;
        m.category = "metals";
        m.f0 = def.code;
        m.rgbF0 = def.rgb;
        m.notes = def.notes;
        materials.push_back(std::move(m));
    }
    return materials;
}

} // namespace

float f0PercentFromIOR(float ior) {
    float r = (ior - 1.0f) / (ior + 1.0f);
    return r * r * 100.0f;
}

uint8_t encodeF0(float f0Percent) {
    return static_cast<uint8_t>(std::lround(f0Percent * 2.55f));
}

const std::vector<std::string>& categories() {
    static const std::vector<std::string> names = {
        "liquids", "surfaces", "plastics", "gems", "transparents",
        "human", "building", "woods", "paints", "metals"
    };
    return names;
}

const std::vector<CatalogMaterial>& all() {
    static const std::vector<CatalogMaterial> catalog = buildCatalog();
    return catalog;
}

std::vector<CatalogMaterial> byCategory(const std::string& category) {
    std::vector<CatalogMaterial> result;
    for (const auto& m : all()) {
        if (m.category == category) {
            result.push_back(m);
        }
    }
    return result;
}

const CatalogMaterial& nearest(float encodedF0) {
    const auto& catalog = all();
    const CatalogMaterial* best = &catalog.front();
    float bestDiff = std::fabs(encodedF0 - best->f0);
    for (const auto& m : catalog) {
        float diff = std::fabs(encodedF0 - m.f0);
        if (diff < bestDiff) {
            best = &m;
            bestDiff = diff;
        }
    }
    return *best;
}

} // namespace MaterialCatalog
} // namespace LabPBR
