#ifndef REGION_SCALE_MAPPER_HPP
#define REGION_SCALE_MAPPER_HPP

#include "RegionTypes.hpp"

#include <string>

namespace regions {

/**
 * @brief Policy for choosing the display scale of a page
 */
enum class FitMode {
  Natural,  ///< Fixed scale (ScaleConfig::naturalScale)
  FitWidth, ///< Page width fills the viewport width
  FitHeight ///< Page height fills the viewport height
};

/// "natural", "fit_width" or "fit_height".
const char *fitModeName(FitMode mode);

/**
 * @brief Parse a fit mode name
 * @return true and sets @p mode if @p name is a known mode
 */
bool parseFitMode(const std::string &name, FitMode &mode);

/// Next mode in the order natural, fit_width, fit_height.
FitMode nextFitMode(FitMode mode);

/**
 * @brief Size of the display area in pixels
 */
struct ViewportSize {
  int width = 0;
  int height = 0;
};

/**
 * @brief Tunables for scale computation
 */
struct ScaleConfig {
  double naturalScale = 1.5; ///< Scale used in FitMode::Natural (~108 dpi)
  double minScale = 0.2;     ///< Lower clamp for every computed scale
  int minViewport = 50; ///< Viewports this small are treated as not laid out
  ViewportSize fallbackViewport{1728, 972}; ///< Used when not laid out
};

/**
 * @brief Maps between document points and display pixels
 *
 * display = document * scale. The scale is recomputed through update()
 * whenever the fit mode or the viewport changes.
 */
class ScaleMapper {
public:
  explicit ScaleMapper(FitMode mode = FitMode::Natural,
                       const ScaleConfig &config = ScaleConfig());

  /**
   * @brief Recompute the scale for a page shown in a viewport
   * @return The new scale
   */
  double update(const PageSize &page, const ViewportSize &viewport);

  /// Use a fixed scale regardless of fit mode (clamped like any other).
  void setScale(double scale);

  double scale() const { return m_scale; }

  FitMode fitMode() const { return m_mode; }
  void setFitMode(FitMode mode) { m_mode = mode; }

  const ScaleConfig &config() const { return m_config; }

  Rect toDisplay(const Rect &rect) const;
  Point toDisplay(const Point &point) const;
  Point toDocument(const Point &point) const;

private:
  double clamp(double scale) const;

  FitMode m_mode;
  ScaleConfig m_config;
  double m_scale;
};

} // namespace regions

#endif // REGION_SCALE_MAPPER_HPP
