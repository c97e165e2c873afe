#ifndef REGION_HIT_TESTER_HPP
#define REGION_HIT_TESTER_HPP

#include "RegionTypes.hpp"
#include "ScaleMapper.hpp"

namespace regions {

/**
 * @brief Find the region under a display-space position
 *
 * The position is mapped back to document points with the inverse of the
 * mapper's scale, then the regions on @p pageIndex are scanned in map order
 * and the first one containing the point (edges included) is returned.
 *
 * @return The hit region, or nullptr if the point is outside every region
 */
const Region *hitTest(const RegionMap &regions, int pageIndex,
                      const Point &displayPos, const ScaleMapper &mapper);

/// Same as above with the point already in document space.
const Region *hitTestDocument(const RegionMap &regions, int pageIndex,
                              const Point &documentPos);

} // namespace regions

#endif // REGION_HIT_TESTER_HPP
