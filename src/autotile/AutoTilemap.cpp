#include "autotile/AutoTilemap.hpp"

#include "autotile/GridIndex.hpp"

#include <algorithm>
#include <utility>

namespace autotile {

AutoTilemap::AutoTilemap(TextureKey tilesheet, TileSize tileSize, int mapWidth, int mapHeight,
                         std::vector<AutoTileRuleset> rulesets)
    : m_tilemap(std::move(tilesheet), tileSize, mapWidth, mapHeight)
    , m_rulesets(std::move(rulesets))
    , m_autotiles(static_cast<std::size_t>(m_tilemap.width()) * static_cast<std::size_t>(m_tilemap.height()),
                  AutoTile::None)
{
}

bool AutoTilemap::setTile(int x, int y, std::string& outError) { return setAutotile(x, y, AutoTile::Tile, outError); }

bool AutoTilemap::setNone(int x, int y, std::string& outError) { return setAutotile(x, y, AutoTile::None, outError); }

bool AutoTilemap::setAutotile(int x, int y, AutoTile value, std::string& outError)
{
  std::size_t idx = 0;
  if (!TileIndex(x, y, width(), height(), idx, outError)) return false;
  m_autotiles[idx] = value;
  return true;
}

bool AutoTilemap::getAutotile(int x, int y, AutoTile& outValue, std::string& outError) const
{
  std::size_t idx = 0;
  if (!TileIndex(x, y, width(), height(), idx, outError)) return false;
  outValue = m_autotiles[idx];
  return true;
}

void AutoTilemap::addRuleset(const AutoTileRuleset& ruleset)
{
  m_rulesets.push_back(ruleset);
}

std::optional<AutoTileRuleset> AutoTilemap::removeRuleset(TileId tileId)
{
  auto it = std::find_if(m_rulesets.begin(), m_rulesets.end(),
                         [tileId](const AutoTileRuleset& r) { return r.tileId == tileId; });
  if (it == m_rulesets.end()) return std::nullopt;

  AutoTileRuleset removed = *it;
  m_rulesets.erase(it);
  return removed;
}

const AutoTileRuleset* AutoTilemap::getRuleset(TileId tileId) const
{
  for (const AutoTileRuleset& r : m_rulesets) {
    if (r.tileId == tileId) return &r;
  }
  return nullptr;
}

bool AutoTilemap::computeTileId(int x, int y, std::optional<TileId>& outTileId, std::string& outError) const
{
  std::size_t idx = 0;
  if (!TileIndex(x, y, width(), height(), idx, outError)) return false;

  outTileId.reset();
  for (const AutoTileRuleset& r : m_rulesets) {
    if (r.matches(m_autotiles, width(), height(), x, y)) {
      outTileId = r.tileId;
      break;
    }
  }
  return true;
}

bool AutoTilemap::bakeCell(int x, int y, std::string& outError)
{
  std::optional<TileId> id;
  if (!computeTileId(x, y, id, outError)) return false;
  return m_tilemap.setTile(x, y, id, outError);
}

bool AutoTilemap::bake(std::string& outError)
{
  outError.clear();
  for (int y = 0; y < height(); ++y) {
    for (int x = 0; x < width(); ++x) {
      if (!bakeCell(x, y, outError)) return false;
    }
  }
  return true;
}

bool AutoTilemap::bakeAround(int x, int y, std::string& outError)
{
  outError.clear();
  if (!inBounds(x, y)) {
    outError = BoundsErrorMessage(x, y, width(), height());
    return false;
  }

  const int x0 = std::max(0, x - kRulesetGridCenter);
  const int y0 = std::max(0, y - kRulesetGridCenter);
  const int x1 = std::min(width() - 1, x + kRulesetGridCenter);
  const int y1 = std::min(height() - 1, y + kRulesetGridCenter);

  for (int ny = y0; ny <= y1; ++ny) {
    for (int nx = x0; nx <= x1; ++nx) {
      if (!bakeCell(nx, ny, outError)) return false;
    }
  }
  return true;
}

bool AutoTilemap::getTileId(int x, int y, std::optional<TileId>& outTileId, std::string& outError) const
{
  return m_tilemap.getTile(x, y, outTileId, outError);
}

} // namespace autotile
