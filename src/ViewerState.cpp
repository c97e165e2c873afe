#include "ViewerState.hpp"

#include <cstdio>

namespace regions {

namespace {

bool sameSize(const ViewportSize &a, const ViewportSize &b) {
  return a.width == b.width && a.height == b.height;
}

} // namespace

ViewportTracker::ViewportTracker(const ScaleConfig &config)
    : m_minViewport(config.minViewport), m_target(config.fallbackViewport) {}

bool ViewportTracker::observe(const ViewportSize &window) {
  // Windows that are not laid out yet report a tiny size
  if (window.width <= m_minViewport || window.height <= m_minViewport) {
    return false;
  }
  if (sameSize(window, m_expected)) {
    return false;
  }

  // The window manager may clamp a resize; accept its size once
  m_expected = window;
  if (sameSize(window, m_target)) {
    return false;
  }
  m_target = window;
  return true;
}

std::string viewerTitle(const std::string &documentPath, int pageIndex,
                        int pageCount, FitMode mode, double scale,
                        const std::string &hoveredId) {
  char title[512];
  std::snprintf(title, sizeof(title), "%s  page %d/%d  [%s %.2fx]  %s",
                documentPath.c_str(), pageIndex + 1, pageCount,
                fitModeName(mode), scale, hoveredId.c_str());
  return title;
}

std::string clickedTitle(const std::string &regionId) {
  return "Printed: " + regionId;
}

} // namespace regions
