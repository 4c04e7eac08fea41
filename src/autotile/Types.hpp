#pragma once

#include <cstdint>
#include <string>

namespace autotile {

// Identifier of a tile graphic inside a tilesheet.
using TileId = std::uint32_t;

// Simple integer cell coordinate.
struct Point {
  int x = 0;
  int y = 0;
};

// Size of one tile in pixels.
struct TileSize {
  int w = 0;
  int h = 0;
};

inline bool operator==(const TileSize& a, const TileSize& b) { return a.w == b.w && a.h == b.h; }
inline bool operator!=(const TileSize& a, const TileSize& b) { return !(a == b); }

// Opaque handle to a tilesheet texture.
//
// The core never dereferences it; the renderer resolves the label to a loaded texture.
struct TextureKey {
  std::string label;
};

inline bool operator==(const TextureKey& a, const TextureKey& b) { return a.label == b.label; }
inline bool operator!=(const TextureKey& a, const TextureKey& b) { return !(a == b); }

} // namespace autotile
