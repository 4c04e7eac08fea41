#include "autotile/GridIndex.hpp"

#include <sstream>

namespace autotile {

bool TileIndex(int x, int y, int width, int height, std::size_t& outIndex)
{
  if (x < 0 || y < 0 || x >= width || y >= height) return false;
  outIndex = static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x);
  return true;
}

bool TileIndex(int x, int y, int width, int height, std::size_t& outIndex, std::string& outError)
{
  if (!TileIndex(x, y, width, height, outIndex)) {
    outError = BoundsErrorMessage(x, y, width, height);
    return false;
  }
  return true;
}

std::string BoundsErrorMessage(int x, int y, int width, int height)
{
  std::ostringstream oss;
  oss << "tile (" << x << ", " << y << ") out of bounds for " << width << "x" << height << " grid";
  return oss.str();
}

} // namespace autotile
