#pragma once

#include "autotile/Types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace autotile {

// Per-cell occupancy marker used as autotiling input.
enum class AutoTile : std::uint8_t {
  None = 0,
  Tile = 1,
};

// Expected neighbour state inside a ruleset pattern. Any = don't care.
enum class AutoTileRulesetValue : std::uint8_t {
  None = 0,
  Tile = 1,
  Any = 2,
};

const char* ToString(AutoTile t);
const char* ToString(AutoTileRulesetValue v);

constexpr int kRulesetGridSize = 5;
constexpr int kRulesetGridCenter = kRulesetGridSize / 2;

using RulesetGrid = std::array<std::array<AutoTileRulesetValue, kRulesetGridSize>, kRulesetGridSize>;

// A neighbourhood pattern plus the tile it produces.
//
// grid[x][y] covers offsets -2..+2 around the evaluated cell, so grid[2][2] is the
// cell itself and is never read (the cell must be occupied for any ruleset to fire).
// Most rulesets only care about the inner 3x3 ring; fill the outer ring with Any.
//
// Example, a tile with no orthogonal neighbours (as rows, y going down):
//   * * * * *
//   * * . * *
//   * . # . *
//   * * . * *
//   * * * * *
struct AutoTileRuleset {
  TileId tileId = 0;
  RulesetGrid grid{};

  // Tests the 5x5 area centred on (x, y).
  //
  // Neighbours outside the map resolve to Any, and only an Any pattern cell equals Any,
  // so a concrete None/Tile expectation never matches past the map edge.
  bool matches(const std::vector<AutoTile>& autotiles, int mapWidth, int mapHeight, int x, int y) const;

  // Pattern filled with a single value.
  static AutoTileRuleset Filled(TileId tileId, AutoTileRulesetValue value);

  // Build from five rows of five characters: '#' = Tile, '.' = None, '*' or '?' = Any.
  // Row r, column c maps to grid[c][r]. The centre character is accepted but ignored.
  static bool FromRows(TileId tileId, const std::vector<std::string>& rows, AutoTileRuleset& outRuleset,
                       std::string& outError);

  // Inverse of FromRows.
  std::vector<std::string> toRows() const;

  AutoTileRulesetValue& at(int rx, int ry) { return grid[static_cast<std::size_t>(rx)][static_cast<std::size_t>(ry)]; }
  AutoTileRulesetValue at(int rx, int ry) const
  {
    return grid[static_cast<std::size_t>(rx)][static_cast<std::size_t>(ry)];
  }
};

} // namespace autotile
