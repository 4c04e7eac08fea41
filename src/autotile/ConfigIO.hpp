#pragma once

#include "autotile/AutoTilemap.hpp"
#include "autotile/Config.hpp"
#include "autotile/Json.hpp"

#include <string>

namespace autotile {

// JSON helpers for AutoTilemapConfig.
//
// Overrides use merge semantics: missing keys leave the existing config unchanged.
// A present "rulesets" array replaces the whole ruleset list.
//
// Layout (snake_case keys):
//   {
//     "tilesheet": "terrain.png",
//     "tile_width": 16, "tile_height": 16,
//     "map_width": 32, "map_height": 32,
//     "rulesets": [
//       { "tile_id": 4, "grid": ["*****", "**.**", "*.#.*", "**.**", "*****"] }
//     ]
//   }
std::string AutoTilemapConfigToJson(const AutoTilemapConfig& cfg, int indentSpaces = 2);

bool ApplyAutoTilemapConfigJson(const JsonValue& root, AutoTilemapConfig& ioCfg, std::string& outError);

// Both sides in [1, kMaxMapDim].
bool ValidateMapSize(int w, int h, std::string& outError);

bool ParseRulesetJson(const JsonValue& v, AutoTileRuleset& outRuleset, std::string& outError);

bool LoadAutoTilemapConfigJsonFile(const std::string& path, AutoTilemapConfig& ioCfg, std::string& outError);
bool WriteAutoTilemapConfigJsonFile(const std::string& path, const AutoTilemapConfig& cfg, std::string& outError,
                                    int indentSpaces = 2);

AutoTilemap MakeAutoTilemap(const AutoTilemapConfig& cfg);

} // namespace autotile
