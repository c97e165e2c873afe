#include "OverlayRenderer.hpp"

#include <opencv2/highgui.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

namespace regions {

namespace {

cv::Rect toPixelRect(const Rect &display, const cv::Size &bounds) {
  int x0 = cvRound(display.x0);
  int y0 = cvRound(display.y0);
  int x1 = cvRound(display.x1);
  int y1 = cvRound(display.y1);
  cv::Rect r(x0, y0, std::max(0, x1 - x0), std::max(0, y1 - y0));
  return r & cv::Rect(0, 0, bounds.width, bounds.height);
}

} // namespace

int strokeThickness(const OverlayStyle &style, double scale) {
  return std::max(style.minThickness,
                  static_cast<int>(style.thicknessPerScale * scale));
}

OverlayStyle debugOverlayStyle() {
  OverlayStyle style;
  style.strokeColor = cv::Scalar(0, 0, 255);
  style.fillOpacity = 0.0;
  style.thicknessPerScale = 1.0;
  return style;
}

OverlayStyle viewerOverlayStyle() {
  OverlayStyle style;
  style.strokeColor = cv::Scalar(0, 0, 0);
  style.fillColor = cv::Scalar(0, 0, 0);
  style.fillOpacity = 40.0 / 255.0;
  style.thicknessPerScale = 2.0;
  return style;
}

cv::Mat drawRegionOverlay(const cv::Mat &page, const RegionMap &regions,
                          int pageIndex, const ScaleMapper &mapper,
                          const OverlayStyle &style) {
  cv::Mat base;
  if (page.channels() == 1) {
    cv::cvtColor(page, base, cv::COLOR_GRAY2BGR);
  } else if (page.channels() == 4) {
    cv::cvtColor(page, base, cv::COLOR_BGRA2BGR);
  } else {
    base = page.clone();
  }

  std::vector<cv::Rect> boxes;
  for (const Region *region : regions.onPage(pageIndex)) {
    cv::Rect box = toPixelRect(mapper.toDisplay(region->rect), base.size());
    if (box.width > 0 && box.height > 0) {
      boxes.push_back(box);
    }
  }

  // Blend the fill only inside each box so the rest of the page is untouched
  double alpha = std::clamp(style.fillOpacity, 0.0, 1.0);
  if (alpha > 0.0) {
    for (const auto &box : boxes) {
      cv::Mat roi = base(box);
      cv::Mat tint(roi.size(), roi.type(), style.fillColor);
      cv::addWeighted(tint, alpha, roi, 1.0 - alpha, 0.0, roi);
    }
  }

  int thickness = strokeThickness(style, mapper.scale());
  for (const auto &box : boxes) {
    cv::rectangle(base, box, style.strokeColor, thickness);
  }

  return base;
}

ImageFileSink::ImageFileSink(std::string outputPath)
    : m_outputPath(std::move(outputPath)) {}

bool ImageFileSink::present(const cv::Mat &image, int pageIndex) {
  m_errorMessage.clear();

  // Encode next to the target and rename, so a failed write leaves no file
  std::filesystem::path target(m_outputPath);
  std::filesystem::path partial = target.parent_path() /
                                  (target.stem().string() + ".partial" +
                                   target.extension().string());
  bool written = false;
  try {
    written = cv::imwrite(partial.string(), image);
  } catch (const cv::Exception &e) {
    m_errorMessage = "Failed to write overlay " + m_outputPath + ": " + e.what();
  }
  if (!written) {
    if (m_errorMessage.empty()) {
      m_errorMessage = "Failed to write overlay for page " +
                       std::to_string(pageIndex + 1) + ": " + m_outputPath;
    }
    std::error_code ec;
    std::filesystem::remove(partial, ec);
    return false;
  }

  std::error_code ec;
  std::filesystem::rename(partial, target, ec);
  if (ec) {
    m_errorMessage = "Failed to move overlay into place " + m_outputPath +
                     ": " + ec.message();
    std::filesystem::remove(partial, ec);
    return false;
  }
  return true;
}

WindowSink::WindowSink(std::string windowName)
    : m_windowName(std::move(windowName)) {}

bool WindowSink::present(const cv::Mat &image, int /*pageIndex*/) {
  m_errorMessage.clear();
  try {
    cv::imshow(m_windowName, image);
  } catch (const cv::Exception &e) {
    m_errorMessage = std::string("Failed to show overlay: ") + e.what();
    return false;
  }
  return true;
}

OverlayRenderer::OverlayRenderer(const DocumentBackend &backend,
                                 const RegionMap &regions,
                                 const OverlayStyle &style)
    : m_backend(backend), m_regions(regions), m_style(style) {}

cv::Mat OverlayRenderer::render(int pageIndex,
                                const ScaleMapper &mapper) const {
  cv::Mat page = m_backend.rasterize(pageIndex, mapper.scale());
  if (page.empty()) {
    return cv::Mat();
  }
  return drawRegionOverlay(page, m_regions, pageIndex, mapper, m_style);
}

bool OverlayRenderer::renderTo(OverlaySink &sink, int pageIndex,
                               const ScaleMapper &mapper) const {
  cv::Mat image = render(pageIndex, mapper);
  if (image.empty()) {
    return false;
  }
  return sink.present(image, pageIndex);
}

} // namespace regions
