#ifndef REGION_VIEWER_STATE_HPP
#define REGION_VIEWER_STATE_HPP

#include "ScaleMapper.hpp"

#include <string>

namespace regions {

/**
 * @brief Display area the viewer fits pages into
 *
 * The window is resized to every rendered image, so its size is not the
 * area to fit pages into. The target starts at the fallback viewport and
 * changes only when the window size differs from the one last requested
 * through expect(), which is a resize by the user.
 */
class ViewportTracker {
public:
  explicit ViewportTracker(const ScaleConfig &config = ScaleConfig());

  /**
   * @brief Report the current window size
   * @return true if the target changed and the page should be re-rendered
   */
  bool observe(const ViewportSize &window);

  /// Record the size the window was just resized to.
  void expect(const ViewportSize &imageSize) { m_expected = imageSize; }

  /// Area handed to ScaleMapper::update().
  const ViewportSize &target() const { return m_target; }

private:
  int m_minViewport;
  ViewportSize m_target;
  ViewportSize m_expected;
};

/**
 * @brief Window title for a page
 *
 * "<path>  page <n>/<count>  [<mode> <scale>x]  <hovered id>"
 */
std::string viewerTitle(const std::string &documentPath, int pageIndex,
                        int pageCount, FitMode mode, double scale,
                        const std::string &hoveredId);

/// Window title after a click printed a region's text to the terminal.
std::string clickedTitle(const std::string &regionId);

} // namespace regions

#endif // REGION_VIEWER_STATE_HPP
