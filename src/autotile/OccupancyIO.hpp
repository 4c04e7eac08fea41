#pragma once

#include "autotile/AutoTilemap.hpp"

#include <string>
#include <vector>

namespace autotile {

// Plain-text occupancy maps: one line per row, '#' = Tile, '.' = None.
// Trailing blank lines are ignored; every row must have the same length.
bool ParseOccupancyText(const std::string& text, int& outW, int& outH, std::vector<AutoTile>& outCells,
                        std::string& outError);

bool LoadOccupancyFile(const std::string& path, int& outW, int& outH, std::vector<AutoTile>& outCells,
                       std::string& outError);

// Copy a parsed occupancy grid into a map of the same size.
bool ApplyOccupancy(AutoTilemap& map, const std::vector<AutoTile>& cells, int w, int h, std::string& outError);

std::string OccupancyToText(const AutoTilemap& map);

} // namespace autotile
