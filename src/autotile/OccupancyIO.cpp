#include "autotile/OccupancyIO.hpp"

#include "autotile/ConfigIO.hpp"

#include <fstream>
#include <sstream>
#include <utility>

namespace autotile {

bool ParseOccupancyText(const std::string& text, int& outW, int& outH, std::vector<AutoTile>& outCells,
                        std::string& outError)
{
  outError.clear();

  std::vector<std::string> rows;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    rows.push_back(line);
  }
  while (!rows.empty() && rows.back().empty()) rows.pop_back();

  if (rows.empty()) {
    outError = "occupancy map is empty";
    return false;
  }

  const std::size_t w = rows.front().size();
  if (w == 0) {
    outError = "occupancy row 0 is empty";
    return false;
  }
  if (w > static_cast<std::size_t>(kMaxMapDim) || rows.size() > static_cast<std::size_t>(kMaxMapDim)) {
    outError = "occupancy map larger than " + std::to_string(kMaxMapDim) + "x" + std::to_string(kMaxMapDim);
    return false;
  }

  std::vector<AutoTile> cells;
  cells.reserve(w * rows.size());
  for (std::size_t y = 0; y < rows.size(); ++y) {
    const std::string& row = rows[y];
    if (row.size() != w) {
      std::ostringstream oss;
      oss << "occupancy row " << y << " has " << row.size() << " cells, expected " << w;
      outError = oss.str();
      return false;
    }
    for (std::size_t x = 0; x < w; ++x) {
      const char c = row[x];
      if (c == '#') {
        cells.push_back(AutoTile::Tile);
      } else if (c == '.') {
        cells.push_back(AutoTile::None);
      } else {
        std::ostringstream oss;
        oss << "invalid occupancy character '" << c << "' at (" << x << ", " << y << ")";
        outError = oss.str();
        return false;
      }
    }
  }

  outW = static_cast<int>(w);
  outH = static_cast<int>(rows.size());
  outCells = std::move(cells);
  return true;
}

bool LoadOccupancyFile(const std::string& path, int& outW, int& outH, std::vector<AutoTile>& outCells,
                       std::string& outError)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "Unable to open occupancy map: " + path;
    return false;
  }
  std::ostringstream buf;
  buf << f.rdbuf();

  if (!ParseOccupancyText(buf.str(), outW, outH, outCells, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

bool ApplyOccupancy(AutoTilemap& map, const std::vector<AutoTile>& cells, int w, int h, std::string& outError)
{
  outError.clear();
  if (w != map.width() || h != map.height() || cells.size() != map.autotiles().size()) {
    std::ostringstream oss;
    oss << "occupancy size " << w << "x" << h << " does not match map size " << map.width() << "x" << map.height();
    outError = oss.str();
    return false;
  }

  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      const AutoTile v = cells[static_cast<std::size_t>(y) * static_cast<std::size_t>(w) + static_cast<std::size_t>(x)];
      if (!map.setAutotile(x, y, v, outError)) return false;
    }
  }
  return true;
}

std::string OccupancyToText(const AutoTilemap& map)
{
  std::string out;
  const std::vector<AutoTile>& cells = map.autotiles();
  for (int y = 0; y < map.height(); ++y) {
    for (int x = 0; x < map.width(); ++x) {
      const AutoTile v = cells[static_cast<std::size_t>(y) * static_cast<std::size_t>(map.width()) +
                               static_cast<std::size_t>(x)];
      out.push_back(v == AutoTile::Tile ? '#' : '.');
    }
    out.push_back('\n');
  }
  return out;
}

} // namespace autotile
