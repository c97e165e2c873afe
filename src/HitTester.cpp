#include "HitTester.hpp"

namespace regions {

const Region *hitTest(const RegionMap &regions, int pageIndex,
                      const Point &displayPos, const ScaleMapper &mapper) {
  return hitTestDocument(regions, pageIndex, mapper.toDocument(displayPos));
}

const Region *hitTestDocument(const RegionMap &regions, int pageIndex,
                              const Point &documentPos) {
  for (const auto &region : regions) {
    if (region.pageIndex != pageIndex) {
      continue;
    }
    if (contains(region.rect, documentPos)) {
      return &region;
    }
  }
  return nullptr;
}

} // namespace regions
