#include "autotile/AutoTileRuleset.hpp"

#include "autotile/GridIndex.hpp"

#include <sstream>
#include <utility>

namespace autotile {

namespace {

// Resolve the value a neighbour presents to a pattern cell.
AutoTileRulesetValue NeighbourValue(const std::vector<AutoTile>& autotiles, int mapWidth, int mapHeight, int x, int y)
{
  std::size_t idx = 0;
  if (!TileIndex(x, y, mapWidth, mapHeight, idx)) return AutoTileRulesetValue::Any;

  switch (autotiles[idx]) {
  case AutoTile::None: return AutoTileRulesetValue::None;
  case AutoTile::Tile: return AutoTileRulesetValue::Tile;
  }
  return AutoTileRulesetValue::None;
}

bool ParsePatternChar(char c, AutoTileRulesetValue& out)
{
  switch (c) {
  case '#': out = AutoTileRulesetValue::Tile; return true;
  case '.': out = AutoTileRulesetValue::None; return true;
  case '*':
  case '?': out = AutoTileRulesetValue::Any; return true;
  default: return false;
  }
}

char PatternChar(AutoTileRulesetValue v)
{
  switch (v) {
  case AutoTileRulesetValue::Tile: return '#';
  case AutoTileRulesetValue::None: return '.';
  case AutoTileRulesetValue::Any: return '*';
  }
  return '*';
}

} // namespace

const char* ToString(AutoTile t)
{
  switch (t) {
  case AutoTile::None: return "None";
  case AutoTile::Tile: return "Tile";
  default: return "UnknownAutoTile";
  }
}

const char* ToString(AutoTileRulesetValue v)
{
  switch (v) {
  case AutoTileRulesetValue::None: return "None";
  case AutoTileRulesetValue::Tile: return "Tile";
  case AutoTileRulesetValue::Any: return "Any";
  default: return "UnknownRulesetValue";
  }
}

bool AutoTileRuleset::matches(const std::vector<AutoTile>& autotiles, int mapWidth, int mapHeight, int x,
                              int y) const
{
  std::size_t idx = 0;
  if (!TileIndex(x, y, mapWidth, mapHeight, idx)) return false;
  if (autotiles[idx] != AutoTile::Tile) return false;

  for (int rx = 0; rx < kRulesetGridSize; ++rx) {
    for (int ry = 0; ry < kRulesetGridSize; ++ry) {
      if (rx == kRulesetGridCenter && ry == kRulesetGridCenter) continue;

      const AutoTileRulesetValue expected = at(rx, ry);
      if (expected == AutoTileRulesetValue::Any) continue;

      const AutoTileRulesetValue actual =
          NeighbourValue(autotiles, mapWidth, mapHeight, x + rx - kRulesetGridCenter, y + ry - kRulesetGridCenter);
      if (expected != actual) return false;
    }
  }

  return true;
}

AutoTileRuleset AutoTileRuleset::Filled(TileId tileId, AutoTileRulesetValue value)
{
  AutoTileRuleset r;
  r.tileId = tileId;
  for (auto& column : r.grid) column.fill(value);
  return r;
}

bool AutoTileRuleset::FromRows(TileId tileId, const std::vector<std::string>& rows, AutoTileRuleset& outRuleset,
                               std::string& outError)
{
  if (rows.size() != static_cast<std::size_t>(kRulesetGridSize)) {
    std::ostringstream oss;
    oss << "ruleset " << tileId << ": expected " << kRulesetGridSize << " rows, got " << rows.size();
    outError = oss.str();
    return false;
  }

  AutoTileRuleset r;
  r.tileId = tileId;
  for (int ry = 0; ry < kRulesetGridSize; ++ry) {
    const std::string& row = rows[static_cast<std::size_t>(ry)];
    if (row.size() != static_cast<std::size_t>(kRulesetGridSize)) {
      std::ostringstream oss;
      oss << "ruleset " << tileId << ": row " << ry << " must have " << kRulesetGridSize << " characters";
      outError = oss.str();
      return false;
    }
    for (int rx = 0; rx < kRulesetGridSize; ++rx) {
      const char c = row[static_cast<std::size_t>(rx)];
      if (!ParsePatternChar(c, r.at(rx, ry))) {
        std::ostringstream oss;
        oss << "ruleset " << tileId << ": invalid pattern character '" << c << "' at row " << ry << ", column "
            << rx;
        outError = oss.str();
        return false;
      }
    }
  }

  outRuleset = r;
  return true;
}

std::vector<std::string> AutoTileRuleset::toRows() const
{
  std::vector<std::string> rows;
  rows.reserve(static_cast<std::size_t>(kRulesetGridSize));
  for (int ry = 0; ry < kRulesetGridSize; ++ry) {
    std::string row;
    for (int rx = 0; rx < kRulesetGridSize; ++rx) {
      row.push_back(PatternChar(at(rx, ry)));
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

} // namespace autotile
