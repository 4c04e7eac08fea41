#pragma once

#include "autotile/AutoTileRuleset.hpp"

#include <string>
#include <vector>

namespace autotile {

// Largest accepted map width/height; larger sizes are rejected at load time.
constexpr int kMaxMapDim = 4096;

struct AutoTilemapConfig {
  // Label of the tilesheet texture; resolved by the renderer.
  std::string tilesheet = "tilesheet";

  // Size of one tile in pixels.
  int tileWidth = 16;
  int tileHeight = 16;

  int mapWidth = 32;
  int mapHeight = 32;

  // Evaluated in order; the first match wins.
  std::vector<AutoTileRuleset> rulesets;
};

} // namespace autotile
