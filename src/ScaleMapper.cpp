#include "ScaleMapper.hpp"

#include <algorithm>
#include <cmath>

namespace regions {

const char *fitModeName(FitMode mode) {
  switch (mode) {
  case FitMode::Natural:
    return "natural";
  case FitMode::FitWidth:
    return "fit_width";
  case FitMode::FitHeight:
    return "fit_height";
  }
  return "natural";
}

bool parseFitMode(const std::string &name, FitMode &mode) {
  if (name == "natural") {
    mode = FitMode::Natural;
  } else if (name == "fit_width") {
    mode = FitMode::FitWidth;
  } else if (name == "fit_height") {
    mode = FitMode::FitHeight;
  } else {
    return false;
  }
  return true;
}

FitMode nextFitMode(FitMode mode) {
  switch (mode) {
  case FitMode::Natural:
    return FitMode::FitWidth;
  case FitMode::FitWidth:
    return FitMode::FitHeight;
  case FitMode::FitHeight:
    return FitMode::Natural;
  }
  return FitMode::Natural;
}

ScaleMapper::ScaleMapper(FitMode mode, const ScaleConfig &config)
    : m_mode(mode), m_config(config), m_scale(clamp(config.naturalScale)) {}

double ScaleMapper::update(const PageSize &page, const ViewportSize &viewport) {
  // A viewport that has not been laid out yet reports a tiny size
  double availW = viewport.width;
  double availH = viewport.height;
  if (viewport.width <= m_config.minViewport ||
      viewport.height <= m_config.minViewport) {
    availW = m_config.fallbackViewport.width;
    availH = m_config.fallbackViewport.height;
  }

  double s = m_config.naturalScale;
  if (m_mode == FitMode::FitWidth && page.width > 0) {
    s = availW / page.width;
  } else if (m_mode == FitMode::FitHeight && page.height > 0) {
    s = availH / page.height;
  }

  m_scale = clamp(s);
  return m_scale;
}

void ScaleMapper::setScale(double scale) { m_scale = clamp(scale); }

Rect ScaleMapper::toDisplay(const Rect &rect) const {
  return Rect{rect.x0 * m_scale, rect.y0 * m_scale, rect.x1 * m_scale,
              rect.y1 * m_scale};
}

Point ScaleMapper::toDisplay(const Point &point) const {
  return Point{point.x * m_scale, point.y * m_scale};
}

Point ScaleMapper::toDocument(const Point &point) const {
  return Point{point.x / m_scale, point.y / m_scale};
}

double ScaleMapper::clamp(double scale) const {
  if (!std::isfinite(scale)) {
    scale = m_config.naturalScale;
  }
  double floor = m_config.minScale > 0 ? m_config.minScale : 0.2;
  return std::max(floor, scale);
}

} // namespace regions
