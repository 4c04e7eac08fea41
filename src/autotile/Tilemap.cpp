#include "autotile/Tilemap.hpp"

#include "autotile/GridIndex.hpp"

#include <algorithm>
#include <utility>

namespace autotile {

Tilemap::Tilemap(TextureKey tilesheet, TileSize tileSize, int w, int h)
    : m_tilesheet(std::move(tilesheet))
    , m_tileSize(tileSize)
    , m_w(std::max(0, w))
    , m_h(std::max(0, h))
    , m_tiles(static_cast<std::size_t>(m_w) * static_cast<std::size_t>(m_h))
{
}

bool Tilemap::setTile(int x, int y, std::optional<TileId> tileId, std::string& outError)
{
  std::size_t idx = 0;
  if (!TileIndex(x, y, m_w, m_h, idx, outError)) return false;
  m_tiles[idx] = tileId;
  return true;
}

bool Tilemap::getTile(int x, int y, std::optional<TileId>& outTileId, std::string& outError) const
{
  std::size_t idx = 0;
  if (!TileIndex(x, y, m_w, m_h, idx, outError)) return false;
  outTileId = m_tiles[idx];
  return true;
}

void Tilemap::clear()
{
  std::fill(m_tiles.begin(), m_tiles.end(), std::nullopt);
}

} // namespace autotile
