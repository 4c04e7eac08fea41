#include "cli/BakeTool.hpp"

#include "cli/CliParse.hpp"

#include "autotile/ConfigIO.hpp"
#include "autotile/Json.hpp"
#include "autotile/LogTee.hpp"
#include "autotile/OccupancyIO.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <optional>
#include <ostream>
#include <sstream>

namespace autotile::cli {

namespace {

void PrintHelp(std::ostream& out)
{
  out << "autotile_bake (headless autotile baker)\n\n"
      << "Usage:\n"
      << "  autotile_bake --config <rules.json> [--map <occupancy.txt> | --size <WxH> [--fill]] [options]\n\n"
      << "Options:\n"
      << "  --config <path>        Tilemap config with ordered rulesets (JSON).\n"
      << "  --map <path>           Occupancy map, one row per line ('#' = tile, '.' = empty).\n"
      << "                         Its size overrides map_width/map_height from the config.\n"
      << "  --size <WxH>           Override the map size when no --map is given.\n"
      << "  --fill                 With --size: mark every cell occupied.\n"
      << "  --remove <tile_id>     Remove the first ruleset with this tile id before baking (repeatable).\n"
      << "  --json <out.json>      Write the baked tile ids as JSON.\n"
      << "  --log <path>           Duplicate stdout/stderr into a rotated log file.\n"
      << "  --quiet                Suppress the tile grid on stdout (errors still print).\n"
      << "  -h, --help             Show this help.\n";
}

std::string TileCell(const std::optional<TileId>& id)
{
  return id ? std::to_string(*id) : std::string(".");
}

bool WriteTextFile(const std::string& path, const std::string& text)
{
  if (!EnsureParentDir(path)) return false;
  std::ofstream f(path, std::ios::binary);
  if (!f) return false;
  f << text;
  return static_cast<bool>(f);
}

} // namespace

std::string FormatTileGrid(const AutoTilemap& map)
{
  const auto& tiles = map.tiles();
  std::size_t cellW = 1;
  for (const auto& id : tiles) cellW = std::max(cellW, TileCell(id).size());

  std::ostringstream oss;
  for (int y = 0; y < map.height(); ++y) {
    for (int x = 0; x < map.width(); ++x) {
      const std::string cell =
          TileCell(tiles[static_cast<std::size_t>(y) * static_cast<std::size_t>(map.width()) + static_cast<std::size_t>(x)]);
      if (x > 0) oss << ' ';
      oss << std::string(cellW - cell.size(), ' ') << cell;
    }
    oss << "\n";
  }
  return oss.str();
}

std::string TilesToJson(const AutoTilemap& map)
{
  std::ostringstream oss;
  oss << "{\n";
  oss << "  \"tilesheet\": \"" << JsonEscape(map.tilesheet().label) << "\",\n";
  oss << "  \"width\": " << map.width() << ",\n";
  oss << "  \"height\": " << map.height() << ",\n";
  oss << "  \"tiles\": [";
  const auto& tiles = map.tiles();
  for (std::size_t i = 0; i < tiles.size(); ++i) {
    if (i > 0) oss << ", ";
    if (tiles[i]) {
      oss << *tiles[i];
    } else {
      oss << "null";
    }
  }
  oss << "]\n";
  oss << "}\n";
  return oss.str();
}

int RunBake(const std::vector<std::string>& args, std::ostream& out, std::ostream& err)
{
  std::string configPath;
  std::string mapPath;
  std::string outJson;
  std::string logPath;
  std::vector<TileId> removeIds;
  int sizeW = 0;
  int sizeH = 0;
  bool fill = false;
  bool quiet = false;

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    auto requireValue = [&](std::string& value) -> bool {
      if (i + 1 >= args.size()) {
        err << arg << " requires a value\n";
        return false;
      }
      value = args[++i];
      return true;
    };

    if (arg == "-h" || arg == "--help") {
      PrintHelp(out);
      return 0;
    }
    if (arg == "--quiet") {
      quiet = true;
      continue;
    }
    if (arg == "--fill") {
      fill = true;
      continue;
    }
    if (arg == "--config") {
      if (!requireValue(configPath)) return 2;
      continue;
    }
    if (arg == "--map") {
      if (!requireValue(mapPath)) return 2;
      continue;
    }
    if (arg == "--json") {
      if (!requireValue(outJson)) return 2;
      continue;
    }
    if (arg == "--log") {
      if (!requireValue(logPath)) return 2;
      continue;
    }
    if (arg == "--size") {
      std::string v;
      if (!requireValue(v)) return 2;
      if (!ParseWxH(v, &sizeW, &sizeH)) {
        err << "invalid --size (expected WxH): " << v << "\n";
        return 2;
      }
      std::string sizeErr;
      if (!ValidateMapSize(sizeW, sizeH, sizeErr)) {
        err << "invalid --size: " << sizeErr << "\n";
        return 2;
      }
      continue;
    }
    if (arg == "--remove") {
      std::string v;
      if (!requireValue(v)) return 2;
      std::uint32_t id = 0;
      if (!ParseU32(v, &id)) {
        err << "invalid --remove tile id: " << v << "\n";
        return 2;
      }
      removeIds.push_back(id);
      continue;
    }

    err << "unknown option: " << arg << "\n";
    return 2;
  }

  if (configPath.empty()) {
    PrintHelp(err);
    return 2;
  }
  if (!mapPath.empty() && sizeW > 0) {
    err << "--map and --size are mutually exclusive\n";
    return 2;
  }
  if (!mapPath.empty() && fill) {
    err << "--fill only applies to --size maps\n";
    return 2;
  }

  LogTee logTee;
  if (!logPath.empty()) {
    LogTeeOptions opt;
    opt.path = logPath;
    std::string logErr;
    if (!logTee.start(opt, logErr)) {
      err << "failed to start log: " << logErr << "\n";
      return 1;
    }
  }

  std::string e;
  AutoTilemapConfig cfg;
  if (!LoadAutoTilemapConfigJsonFile(configPath, cfg, e)) {
    err << "failed to load config: " << e << "\n";
    return 1;
  }

  std::vector<AutoTile> cells;
  if (!mapPath.empty()) {
    if (!LoadOccupancyFile(mapPath, cfg.mapWidth, cfg.mapHeight, cells, e)) {
      err << "failed to load map: " << e << "\n";
      return 1;
    }
  } else if (sizeW > 0) {
    cfg.mapWidth = sizeW;
    cfg.mapHeight = sizeH;
  }

  AutoTilemap map = MakeAutoTilemap(cfg);
  if (!cells.empty()) {
    if (!ApplyOccupancy(map, cells, cfg.mapWidth, cfg.mapHeight, e)) {
      err << "failed to apply map: " << e << "\n";
      return 1;
    }
  } else if (fill) {
    for (int y = 0; y < map.height(); ++y) {
      for (int x = 0; x < map.width(); ++x) {
        if (!map.setTile(x, y, e)) {
          err << "failed to fill map: " << e << "\n";
          return 1;
        }
      }
    }
  }

  for (TileId id : removeIds) {
    if (!map.removeRuleset(id)) {
      err << "warning: no ruleset with tile id " << id << "\n";
    }
  }

  if (!map.bake(e)) {
    err << "bake failed: " << e << "\n";
    return 1;
  }

  if (!quiet) {
    err << "baked " << map.width() << "x" << map.height() << " map with " << map.rulesets().size()
        << " rulesets\n";
    out << FormatTileGrid(map);
  }

  if (!outJson.empty() && !WriteTextFile(outJson, TilesToJson(map))) {
    err << "failed to write JSON: " << outJson << "\n";
    return 1;
  }

  return 0;
}

} // namespace autotile::cli
