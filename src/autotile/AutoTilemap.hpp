#pragma once

#include "autotile/AutoTileRuleset.hpp"
#include "autotile/Tilemap.hpp"
#include "autotile/Types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace autotile {

// Occupancy grid + ordered rulesets that bake into a Tilemap.
//
// Edits to occupancy are lazy: nothing in the tilemap changes until bake() (or
// bakeAround() for local edits) runs. Rulesets are evaluated in insertion order and
// the first match wins, so add them from most to least specific.
//
// Not thread-safe; serialize access externally.
class AutoTilemap {
public:
  AutoTilemap() = default;
  AutoTilemap(TextureKey tilesheet, TileSize tileSize, int mapWidth, int mapHeight,
              std::vector<AutoTileRuleset> rulesets = {});

  int width() const { return m_tilemap.width(); }
  int height() const { return m_tilemap.height(); }
  const TextureKey& tilesheet() const { return m_tilemap.tilesheet(); }
  TileSize tileSize() const { return m_tilemap.tileSize(); }

  bool inBounds(int x, int y) const { return m_tilemap.inBounds(x, y); }

  // Occupancy editing.
  bool setTile(int x, int y, std::string& outError);
  bool setNone(int x, int y, std::string& outError);
  bool setAutotile(int x, int y, AutoTile value, std::string& outError);
  bool getAutotile(int x, int y, AutoTile& outValue, std::string& outError) const;

  const std::vector<AutoTile>& autotiles() const { return m_autotiles; }

  // Ruleset management. Lookups and removal pick the first ruleset with a matching tile id.
  void addRuleset(const AutoTileRuleset& ruleset);
  std::optional<AutoTileRuleset> removeRuleset(TileId tileId);
  const AutoTileRuleset* getRuleset(TileId tileId) const;
  const std::vector<AutoTileRuleset>& rulesets() const { return m_rulesets; }
  void clearRulesets() { m_rulesets.clear(); }

  // Tile id the rulesets select for (x, y), or std::nullopt when nothing matches.
  bool computeTileId(int x, int y, std::optional<TileId>& outTileId, std::string& outError) const;

  // Recompute every cell of the tilemap from occupancy + rulesets.
  bool bake(std::string& outError);

  // Recompute only the cells whose result can depend on (x, y): its 5x5 neighbourhood.
  // Useful after single-cell edits.
  bool bakeAround(int x, int y, std::string& outError);

  // Baked tile id (from the last bake), not a fresh computation.
  bool getTileId(int x, int y, std::optional<TileId>& outTileId, std::string& outError) const;
  const std::vector<std::optional<TileId>>& tiles() const { return m_tilemap.tiles(); }

  const Tilemap& tilemap() const { return m_tilemap; }

private:
  bool bakeCell(int x, int y, std::string& outError);

  Tilemap m_tilemap;
  std::vector<AutoTileRuleset> m_rulesets;
  std::vector<AutoTile> m_autotiles;
};

} // namespace autotile
