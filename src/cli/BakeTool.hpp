#pragma once

// autotile_bake implementation, split from main() so tests can drive it.

#include "autotile/AutoTilemap.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace autotile::cli {

// Run the tool with argv[1..] as `args`. Results go to `out`, diagnostics to `err`.
// Returns the process exit code: 0 ok, 1 runtime failure, 2 usage error.
int RunBake(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

// One line per row, tile ids right-aligned, '.' for no tile.
std::string FormatTileGrid(const AutoTilemap& map);

// {"tilesheet", "width", "height", "tiles": [id | null, ...]} in row-major order.
std::string TilesToJson(const AutoTilemap& map);

} // namespace autotile::cli
