#include "autotile/ConfigIO.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <utility>

namespace autotile {

namespace {

bool ApplyString(const JsonValue& root, const char* key, std::string& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true; // missing => keep
  if (!v->isString()) {
    err = std::string("expected string for key '") + key + "'";
    return false;
  }
  io = v->stringValue;
  return true;
}

bool ApplyPositiveI32(const JsonValue& root, const char* key, int& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true;
  if (!v->isNumber()) {
    err = std::string("expected number for key '") + key + "'";
    return false;
  }
  const double d = v->numberValue;
  if (!std::isfinite(d) || d != std::floor(d) || d < 1.0 ||
      d > static_cast<double>(std::numeric_limits<int>::max())) {
    err = std::string("expected positive integer for key '") + key + "'";
    return false;
  }
  io = static_cast<int>(d);
  return true;
}

void Indent(std::ostringstream& oss, int n)
{
  for (int i = 0; i < n; ++i) oss << ' ';
}

} // namespace

bool ValidateMapSize(int w, int h, std::string& outError)
{
  if (w < 1 || h < 1 || w > kMaxMapDim || h > kMaxMapDim) {
    outError = "map size " + std::to_string(w) + "x" + std::to_string(h) + " outside 1.." +
               std::to_string(kMaxMapDim);
    return false;
  }
  return true;
}

bool ParseRulesetJson(const JsonValue& v, AutoTileRuleset& outRuleset, std::string& outError)
{
  if (!v.isObject()) {
    outError = "ruleset must be an object";
    return false;
  }

  const JsonValue* id = FindJsonMember(v, "tile_id");
  if (!id || !id->isNumber()) {
    outError = "ruleset requires numeric 'tile_id'";
    return false;
  }
  const double d = id->numberValue;
  if (!std::isfinite(d) || d != std::floor(d) || d < 0.0 ||
      d > static_cast<double>(std::numeric_limits<TileId>::max())) {
    outError = "ruleset 'tile_id' must be an unsigned 32-bit integer";
    return false;
  }
  const TileId tileId = static_cast<TileId>(d);

  const JsonValue* grid = FindJsonMember(v, "grid");
  if (!grid || !grid->isArray()) {
    outError = "ruleset " + std::to_string(tileId) + " requires a 'grid' array of row strings";
    return false;
  }

  std::vector<std::string> rows;
  rows.reserve(grid->arrayValue.size());
  for (const JsonValue& row : grid->arrayValue) {
    if (!row.isString()) {
      outError = "ruleset " + std::to_string(tileId) + ": grid rows must be strings";
      return false;
    }
    rows.push_back(row.stringValue);
  }

  return AutoTileRuleset::FromRows(tileId, rows, outRuleset, outError);
}

bool ApplyAutoTilemapConfigJson(const JsonValue& root, AutoTilemapConfig& ioCfg, std::string& outError)
{
  outError.clear();
  if (!root.isObject()) {
    outError = "config root must be a JSON object";
    return false;
  }

  // Work on a copy so a failed override leaves the caller's config untouched.
  AutoTilemapConfig cfg = ioCfg;
  if (!ApplyString(root, "tilesheet", cfg.tilesheet, outError)) return false;
  if (!ApplyPositiveI32(root, "tile_width", cfg.tileWidth, outError)) return false;
  if (!ApplyPositiveI32(root, "tile_height", cfg.tileHeight, outError)) return false;
  if (!ApplyPositiveI32(root, "map_width", cfg.mapWidth, outError)) return false;
  if (!ApplyPositiveI32(root, "map_height", cfg.mapHeight, outError)) return false;
  if (!ValidateMapSize(cfg.mapWidth, cfg.mapHeight, outError)) return false;

  if (const JsonValue* rs = FindJsonMember(root, "rulesets")) {
    if (!rs->isArray()) {
      outError = "expected array for key 'rulesets'";
      return false;
    }
    std::vector<AutoTileRuleset> rulesets;
    rulesets.reserve(rs->arrayValue.size());
    for (std::size_t i = 0; i < rs->arrayValue.size(); ++i) {
      AutoTileRuleset r;
      std::string err;
      if (!ParseRulesetJson(rs->arrayValue[i], r, err)) {
        outError = "rulesets[" + std::to_string(i) + "]: " + err;
        return false;
      }
      rulesets.push_back(r);
    }
    cfg.rulesets = std::move(rulesets);
  }

  ioCfg = std::move(cfg);
  return true;
}

std::string AutoTilemapConfigToJson(const AutoTilemapConfig& cfg, int indentSpaces)
{
  const int ind = std::max(0, indentSpaces);
  std::ostringstream oss;
  oss << "{\n";
  Indent(oss, ind);
  oss << "\"tilesheet\": \"" << JsonEscape(cfg.tilesheet) << "\",\n";
  Indent(oss, ind);
  oss << "\"tile_width\": " << cfg.tileWidth << ",\n";
  Indent(oss, ind);
  oss << "\"tile_height\": " << cfg.tileHeight << ",\n";
  Indent(oss, ind);
  oss << "\"map_width\": " << cfg.mapWidth << ",\n";
  Indent(oss, ind);
  oss << "\"map_height\": " << cfg.mapHeight << ",\n";
  Indent(oss, ind);
  oss << "\"rulesets\": [";
  for (std::size_t i = 0; i < cfg.rulesets.size(); ++i) {
    const AutoTileRuleset& r = cfg.rulesets[i];
    oss << (i == 0 ? "\n" : ",\n");
    Indent(oss, ind * 2);
    oss << "{\"tile_id\": " << r.tileId << ", \"grid\": [";
    const std::vector<std::string> rows = r.toRows();
    for (std::size_t k = 0; k < rows.size(); ++k) {
      if (k > 0) oss << ", ";
      oss << "\"" << rows[k] << "\"";
    }
    oss << "]}";
  }
  if (!cfg.rulesets.empty()) {
    oss << "\n";
    Indent(oss, ind);
  }
  oss << "]\n";
  oss << "}\n";
  return oss.str();
}

bool LoadAutoTilemapConfigJsonFile(const std::string& path, AutoTilemapConfig& ioCfg, std::string& outError)
{
  outError.clear();
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "Unable to open config file: " + path;
    return false;
  }
  std::ostringstream buf;
  buf << f.rdbuf();

  JsonValue root;
  if (!ParseJson(buf.str(), root, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  if (!ApplyAutoTilemapConfigJson(root, ioCfg, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

bool WriteAutoTilemapConfigJsonFile(const std::string& path, const AutoTilemapConfig& cfg, std::string& outError,
                                    int indentSpaces)
{
  outError.clear();
  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "Unable to open config file for writing: " + path;
    return false;
  }
  f << AutoTilemapConfigToJson(cfg, indentSpaces);
  if (!f) {
    outError = "Write failed: " + path;
    return false;
  }
  return true;
}

AutoTilemap MakeAutoTilemap(const AutoTilemapConfig& cfg)
{
  return AutoTilemap(TextureKey{cfg.tilesheet}, TileSize{cfg.tileWidth, cfg.tileHeight}, cfg.mapWidth,
                     cfg.mapHeight, cfg.rulesets);
}

} // namespace autotile
