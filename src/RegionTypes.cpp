#include "RegionTypes.hpp"

#include <algorithm>
#include <utility>

namespace regions {

Rect unite(const Rect &a, const Rect &b) {
  Rect r;
  r.x0 = std::min(a.x0, b.x0);
  r.y0 = std::min(a.y0, b.y0);
  r.x1 = std::max(a.x1, b.x1);
  r.y1 = std::max(a.y1, b.y1);
  return r;
}

bool contains(const Rect &r, const Point &p) {
  return r.x0 <= p.x && p.x <= r.x1 && r.y0 <= p.y && p.y <= r.y1;
}

bool contains(const Rect &outer, const Rect &inner) {
  return outer.x0 <= inner.x0 && outer.y0 <= inner.y0 &&
         inner.x1 <= outer.x1 && inner.y1 <= outer.y1;
}

const char *kindCode(MarkerKind kind) {
  switch (kind) {
  case MarkerKind::Experience:
    return "exp";
  case MarkerKind::Project:
    return "pr";
  case MarkerKind::Skill:
    return "sk";
  }
  return "exp";
}

bool parseKind(const std::string &code, MarkerKind &kind) {
  if (code == "exp") {
    kind = MarkerKind::Experience;
  } else if (code == "pr") {
    kind = MarkerKind::Project;
  } else if (code == "sk") {
    kind = MarkerKind::Skill;
  } else {
    return false;
  }
  return true;
}

std::string makeRegionId(MarkerKind kind, int ordinal) {
  return std::string(kindCode(kind)) + ":" + std::to_string(ordinal);
}

bool RegionMap::insert(Region region) {
  if (m_index.count(region.id) != 0) {
    return false;
  }
  m_index.emplace(region.id, m_regions.size());
  m_regions.push_back(std::move(region));
  return true;
}

const Region *RegionMap::find(const std::string &id) const {
  auto it = m_index.find(id);
  if (it == m_index.end()) {
    return nullptr;
  }
  return &m_regions[it->second];
}

bool RegionMap::contains(const std::string &id) const {
  return m_index.count(id) != 0;
}

std::vector<const Region *> RegionMap::onPage(int pageIndex) const {
  std::vector<const Region *> out;
  for (const auto &region : m_regions) {
    if (region.pageIndex == pageIndex) {
      out.push_back(&region);
    }
  }
  return out;
}

void RegionMap::clear() {
  m_regions.clear();
  m_index.clear();
}

} // namespace regions
