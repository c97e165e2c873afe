#ifndef REGION_ANALYSIS_HPP
#define REGION_ANALYSIS_HPP

#include "DocumentBackend.hpp"
#include "FragmentExtractor.hpp"
#include "OverlayRenderer.hpp"
#include "RegionResolver.hpp"
#include "RegionTypes.hpp"
#include "ScaleMapper.hpp"

#include <opencv2/core.hpp>

#include <memory>
#include <string>
#include <vector>

namespace regions {

/**
 * @brief Configuration options for a region analysis session
 */
struct AnalysisConfig {
  ExtractionConfig extraction; ///< Fragment grouping
  ScaleConfig scale;           ///< Fit-mode scale computation
  OverlayStyle overlay;        ///< Overlay colors and stroke
  bool verbose = false;        ///< Log DEBUG details to std::cerr
};

/**
 * @brief Result of loading a document
 */
struct LoadResult {
  bool success = false;        ///< Whether the document was loaded
  std::string errorMessage;    ///< Error message if failed
  int pageCount = 0;           ///< Pages in the document
  int regionCount = 0;         ///< Regions resolved
  double processingTimeMs = 0; ///< Load + resolution time in milliseconds
};

/**
 * @brief Result of rendering a page overlay
 */
struct RenderResult {
  bool success = false;     ///< Whether rendering succeeded
  std::string errorMessage; ///< Error message if failed
  cv::Mat image;            ///< Rendered page with regions drawn (BGR)
  std::string outputPath;   ///< Written file, for exportOverlayPNG()
  double scale = 0;         ///< Scale the page was rendered at
};

/**
 * @brief Result of exporting regions to JSON
 */
struct ExportResult {
  bool success = false;     ///< Whether the file was written
  std::string errorMessage; ///< Error message if failed
  std::string outputPath;   ///< Written file
  int regionCount = 0;      ///< Regions written
};

/**
 * @brief One document-processing session
 *
 * Owns the loaded document and the id -> Region map built from it. Loading
 * a new document releases the previous one and rebuilds the map from
 * scratch; there is never a partially updated map.
 *
 * Example usage:
 * @code
 * regions::RegionAnalysis analysis;
 * auto loaded = analysis.openDocument("build/main.pdf");
 * if (loaded.success) {
 *     for (const auto *region : analysis.sortedRegions()) {
 *         std::cout << region->id << ": " << region->text << std::endl;
 *     }
 *     analysis.exportRegions();
 * }
 * @endcode
 */
class RegionAnalysis {
public:
  /**
   * @brief Session that opens documents with Poppler
   */
  explicit RegionAnalysis(const AnalysisConfig &config = AnalysisConfig());

  /**
   * @brief Session with a custom backend factory
   * @param config Session configuration
   * @param factory Opens a document; throws std::runtime_error on failure
   */
  RegionAnalysis(const AnalysisConfig &config, BackendFactory factory);

  ~RegionAnalysis();

  // The session owns a document handle
  RegionAnalysis(const RegionAnalysis &) = delete;
  RegionAnalysis &operator=(const RegionAnalysis &) = delete;

  RegionAnalysis(RegionAnalysis &&other) noexcept;
  RegionAnalysis &operator=(RegionAnalysis &&other) noexcept;

  /**
   * @brief Load a document and resolve its regions
   *
   * Any previously loaded document is released first. On failure the
   * session is left empty. Finding no regions is not a failure; a notice is
   * printed instead.
   *
   * @param path Path to the document
   * @return LoadResult with page and region counts
   */
  LoadResult openDocument(const std::string &path);

  /**
   * @brief Release the document and clear the regions
   */
  void closeDocument();

  bool isOpen() const;

  /// Path of the loaded document, empty if none.
  const std::string &documentPath() const { return m_documentPath; }

  /// Pages in the loaded document, 0 if none.
  int pageCount() const;

  /**
   * @brief Natural size of a page
   * @return Zero size if no document is loaded or the page does not exist
   */
  PageSize pageSize(int pageIndex) const;

  /// Regions of the loaded document in resolution order.
  const RegionMap &regions() const { return m_regions; }

  /// Counters from the last resolution.
  const ResolveStats &stats() const { return m_stats; }

  /// Regions ordered by kind code, then ordinal.
  std::vector<const Region *> sortedRegions() const;

  /**
   * @brief Render a page with its regions drawn on top
   * @param pageIndex 0-based page index
   * @param scale Display pixels per document point
   */
  RenderResult renderOverlay(int pageIndex, double scale);

  /**
   * @brief Render a page overlay to a sink (file or window)
   */
  RenderResult renderOverlayTo(OverlaySink &sink, int pageIndex, double scale);

  /**
   * @brief Render a page overlay and write it as an image file
   * @param pageIndex 0-based page index
   * @param scale Display pixels per document point
   * @param outputPath Target file; empty = debug_overlay_page<N>.png next
   * to the document
   */
  RenderResult exportOverlayPNG(int pageIndex, double scale,
                                const std::string &outputPath = "");

  /**
   * @brief Write the regions as JSON
   * @param outputPath Target file; empty = "<document>.regions.json"
   */
  ExportResult exportRegions(const std::string &outputPath = "") const;

  /**
   * @brief Region under a display-space position
   * @param pageIndex Page shown
   * @param displayPos Pointer position in display pixels
   * @param scale Scale the page is shown at
   * @return The region, or nullptr
   */
  const Region *hitTest(int pageIndex, const Point &displayPos,
                        double scale) const;

  const AnalysisConfig &getConfig() const { return m_config; }

private:
  bool checkPage(int pageIndex, std::string &errorMessage) const;

  AnalysisConfig m_config;                    ///< Current configuration
  BackendFactory m_factory;                   ///< Opens documents
  std::unique_ptr<DocumentBackend> m_backend; ///< Loaded document
  std::string m_documentPath;                 ///< Path of loaded document
  RegionMap m_regions;                        ///< Resolved regions
  ResolveStats m_stats;                       ///< Last resolution counters
};

/// Default overlay path: debug_overlay_page<N>.png beside the document.
std::string defaultOverlayPath(const std::string &documentPath,
                               int pageIndex);

} // namespace regions

#endif // REGION_ANALYSIS_HPP
