#ifndef REGION_OVERLAY_RENDERER_HPP
#define REGION_OVERLAY_RENDERER_HPP

#include "DocumentBackend.hpp"
#include "RegionTypes.hpp"
#include "ScaleMapper.hpp"

#include <opencv2/core.hpp>

#include <string>

namespace regions {

/**
 * @brief Colors and stroke of the region overlay
 */
struct OverlayStyle {
  cv::Scalar strokeColor{0, 0, 255}; ///< Border color (BGR), red
  cv::Scalar fillColor{0, 0, 0};     ///< Fill color (BGR), black
  double fillOpacity = 40.0 / 255.0; ///< 0 = no fill, 1 = opaque
  int minThickness = 1;              ///< Border thickness floor in pixels
  double thicknessPerScale = 2.0;    ///< Border thickness = scale * this
};

/**
 * @brief Border thickness in pixels for a given scale
 */
int strokeThickness(const OverlayStyle &style, double scale);

/// Red outline without fill, one pixel per unit of scale (debug PNGs).
OverlayStyle debugOverlayStyle();

/// Black outline over a light black tint (interactive viewer).
OverlayStyle viewerOverlayStyle();

/**
 * @brief Draw the regions of one page over a rendered page image
 *
 * Each region's rectangle is mapped to display space with @p mapper, filled
 * with the style's semi-transparent color and outlined.
 *
 * @param page Rendered page (BGR); not modified
 * @return A new image with the overlay drawn
 */
cv::Mat drawRegionOverlay(const cv::Mat &page, const RegionMap &regions,
                          int pageIndex, const ScaleMapper &mapper,
                          const OverlayStyle &style = OverlayStyle());

/**
 * @brief Destination of a rendered overlay
 */
class OverlaySink {
public:
  virtual ~OverlaySink() = default;

  /**
   * @brief Consume an overlay image
   * @return false if the image could not be delivered
   */
  virtual bool present(const cv::Mat &image, int pageIndex) = 0;

  /// Description of the last failure.
  const std::string &errorMessage() const { return m_errorMessage; }

protected:
  std::string m_errorMessage;
};

/**
 * @brief Writes overlays to an image file (format from the extension)
 */
class ImageFileSink : public OverlaySink {
public:
  explicit ImageFileSink(std::string outputPath);

  bool present(const cv::Mat &image, int pageIndex) override;

  const std::string &outputPath() const { return m_outputPath; }

private:
  std::string m_outputPath;
};

/**
 * @brief Shows overlays in a HighGUI window
 */
class WindowSink : public OverlaySink {
public:
  explicit WindowSink(std::string windowName);

  bool present(const cv::Mat &image, int pageIndex) override;

  const std::string &windowName() const { return m_windowName; }

private:
  std::string m_windowName;
};

/**
 * @brief Rasterizes pages and draws the region overlay on them
 */
class OverlayRenderer {
public:
  OverlayRenderer(const DocumentBackend &backend, const RegionMap &regions,
                  const OverlayStyle &style = OverlayStyle());

  /**
   * @brief Rasterize @p pageIndex at the mapper's scale and draw the overlay
   * @return The overlay image, or an empty Mat if rasterization failed
   */
  cv::Mat render(int pageIndex, const ScaleMapper &mapper) const;

  /**
   * @brief Render and hand the result to @p sink
   * @return false if rendering failed or the sink rejected the image
   */
  bool renderTo(OverlaySink &sink, int pageIndex,
                const ScaleMapper &mapper) const;

private:
  const DocumentBackend &m_backend;
  const RegionMap &m_regions;
  OverlayStyle m_style;
};

} // namespace regions

#endif // REGION_OVERLAY_RENDERER_HPP
