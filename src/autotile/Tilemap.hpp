#pragma once

#include "autotile/Types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace autotile {

// Final tile-id storage that the renderer draws from.
//
// One optional TileId per cell; std::nullopt means nothing is drawn there.
class Tilemap {
public:
  Tilemap() = default;
  Tilemap(TextureKey tilesheet, TileSize tileSize, int w, int h);

  int width() const { return m_w; }
  int height() const { return m_h; }
  const TextureKey& tilesheet() const { return m_tilesheet; }
  TileSize tileSize() const { return m_tileSize; }

  bool inBounds(int x, int y) const { return x >= 0 && y >= 0 && x < m_w && y < m_h; }

  bool setTile(int x, int y, std::optional<TileId> tileId, std::string& outError);
  bool getTile(int x, int y, std::optional<TileId>& outTileId, std::string& outError) const;

  const std::vector<std::optional<TileId>>& tiles() const { return m_tiles; }

  // Reset every cell to "no tile".
  void clear();

private:
  TextureKey m_tilesheet;
  TileSize m_tileSize;
  int m_w = 0;
  int m_h = 0;
  std::vector<std::optional<TileId>> m_tiles;
};

} // namespace autotile
