#ifndef REGION_DOCUMENT_BACKEND_HPP
#define REGION_DOCUMENT_BACKEND_HPP

#include "RegionTypes.hpp"

#include <opencv2/core.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace regions {

/**
 * @brief Rendering/document backend used by the region engine
 *
 * A backend owns one open document. It reports ordered text fragments with
 * their rectangles, the natural size of each page, and rasterizes pages at a
 * requested scale. Nothing else in the engine touches the PDF library.
 */
class DocumentBackend {
public:
  virtual ~DocumentBackend() = default;

  /// Number of pages in the open document.
  virtual int pageCount() const = 0;

  /**
   * @brief Natural page size in document points
   * @param pageIndex 0-based page index
   */
  virtual PageSize pageSize(int pageIndex) const = 0;

  /**
   * @brief Ordered text fragments of a page
   *
   * Fragments have non-empty trimmed text and top-left origin rectangles.
   * @param pageIndex 0-based page index
   */
  virtual std::vector<Fragment> fragments(int pageIndex) const = 0;

  /**
   * @brief Rasterize a page
   * @param pageIndex 0-based page index
   * @param scale Display pixels per document point
   * @return BGR image (CV_8UC3), or an empty Mat if rendering failed
   */
  virtual cv::Mat rasterize(int pageIndex, double scale) const = 0;
};

/**
 * @brief Opens a document and returns a backend that owns it
 *
 * Throws std::runtime_error if the document cannot be opened.
 */
using BackendFactory =
    std::function<std::unique_ptr<DocumentBackend>(const std::string &path)>;

} // namespace regions

#endif // REGION_DOCUMENT_BACKEND_HPP
