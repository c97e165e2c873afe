#include "RegionExporter.hpp"

#include <climits>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace regions {

using json = nlohmann::json;

namespace {

void requireObject(const json &j, const std::string &where) {
  if (!j.is_object()) {
    throw std::runtime_error(where + " must be an object");
  }
}

const json &requireField(const json &j, const char *key,
                         const std::string &where) {
  if (!j.contains(key)) {
    throw std::runtime_error(where + " missing required field: " +
                             std::string(key));
  }
  return j.at(key);
}

std::string requireString(const json &j, const char *key,
                          const std::string &where) {
  const json &v = requireField(j, key, where);
  if (!v.is_string()) {
    throw std::runtime_error(where + "." + key + " must be a string");
  }
  return v.get<std::string>();
}

int requireNonNegativeInt(const json &j, const char *key,
                          const std::string &where) {
  const json &v = requireField(j, key, where);
  if (!v.is_number_integer() || v.get<long long>() < 0 ||
      v.get<long long>() > INT_MAX) {
    throw std::runtime_error(where + "." + key +
                             " must be a non-negative integer");
  }
  return v.get<int>();
}

Rect requireRect(const json &j, const std::string &where) {
  const json &v = requireField(j, "rect", where);
  if (!v.is_array() || v.size() != 4) {
    throw std::runtime_error(where + ".rect must be an array of 4 numbers");
  }
  for (size_t i = 0; i < 4; ++i) {
    if (!v.at(i).is_number()) {
      std::ostringstream oss;
      oss << where << ".rect[" << i << "] must be a number";
      throw std::runtime_error(oss.str());
    }
  }
  return Rect{v.at(0).get<double>(), v.at(1).get<double>(),
              v.at(2).get<double>(), v.at(3).get<double>()};
}

} // namespace

nlohmann::ordered_json regionsToJson(const RegionMap &regions) {
  nlohmann::ordered_json out = nlohmann::ordered_json::object();
  for (const auto &region : regions) {
    nlohmann::ordered_json entry;
    entry["type"] = kindCode(region.kind);
    entry["ordinal"] = region.ordinal;
    entry["page"] = region.pageIndex;
    entry["rect"] = {region.rect.x0, region.rect.y0, region.rect.x1,
                     region.rect.y1};
    out[region.id] = std::move(entry);
  }
  return out;
}

std::string serializeRegions(const RegionMap &regions, int indent) {
  return regionsToJson(regions).dump(indent);
}

void writeRegionsJson(const RegionMap &regions,
                      const std::filesystem::path &path) {
  std::filesystem::path partial = path;
  partial += ".partial";

  {
    std::ofstream out(partial, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("failed to open output file: " +
                               partial.string());
    }
    out << serializeRegions(regions) << "\n";
    out.flush();
    if (!out) {
      out.close();
      std::error_code ec;
      std::filesystem::remove(partial, ec);
      throw std::runtime_error("failed to write output file: " +
                               partial.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(partial, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(partial, ignored);
    throw std::runtime_error("failed to move output into place: " +
                             path.string() + ": " + ec.message());
  }
}

RegionMap regionsFromJson(const json &j) {
  requireObject(j, "root");

  RegionMap out;
  for (auto it = j.begin(); it != j.end(); ++it) {
    const std::string where = "root[\"" + it.key() + "\"]";
    requireObject(it.value(), where);

    Region region;
    std::string type = requireString(it.value(), "type", where);
    if (!parseKind(type, region.kind)) {
      throw std::runtime_error(where + ".type has unknown kind: " + type);
    }
    region.ordinal = requireNonNegativeInt(it.value(), "ordinal", where);
    region.pageIndex = requireNonNegativeInt(it.value(), "page", where);
    region.rect = requireRect(it.value(), where);
    region.id = makeRegionId(region.kind, region.ordinal);
    if (region.id != it.key()) {
      throw std::runtime_error(where + " does not match its type/ordinal (" +
                               region.id + ")");
    }
    if (!out.insert(std::move(region))) {
      throw std::runtime_error(where + " is a duplicate region id");
    }
  }
  return out;
}

RegionMap readRegionsJson(const std::filesystem::path &path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("failed to open regions file: " + path.string());
  }

  json j;
  try {
    in >> j;
  } catch (const std::exception &e) {
    throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
  }
  return regionsFromJson(j);
}

std::filesystem::path defaultExportPath(const std::filesystem::path &pdfPath) {
  std::filesystem::path out = pdfPath;
  out += ".regions.json";
  return out;
}

} // namespace regions
