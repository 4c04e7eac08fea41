#pragma once

#include <cstddef>
#include <string>

namespace autotile {

// Row-major flat index of (x, y) in a width x height grid.
//
// Returns false when the coordinate lies outside [0, width) x [0, height).
// Negative coordinates are rejected by the same check, so callers walking signed
// neighbour offsets can pass them straight through.
bool TileIndex(int x, int y, int width, int height, std::size_t& outIndex);

// Same as above, but also produces a bounds error message on failure.
bool TileIndex(int x, int y, int width, int height, std::size_t& outIndex, std::string& outError);

std::string BoundsErrorMessage(int x, int y, int width, int height);

} // namespace autotile
