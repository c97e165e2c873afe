#ifndef REGION_POPPLER_BACKEND_HPP
#define REGION_POPPLER_BACKEND_HPP

#include "DocumentBackend.hpp"
#include "FragmentExtractor.hpp"

#include <memory>
#include <string>
#include <vector>

namespace poppler {
class document;
class image;
class page;
} // namespace poppler

namespace regions {

/**
 * @brief DocumentBackend over a PDF opened with Poppler
 *
 * Text comes from poppler::page::text_list() and is grouped into fragments
 * with groupWords(). Pages are rendered with poppler::page_renderer and
 * converted to BGR cv::Mat. Coordinates are top-left origin points of the
 * crop box, the space both the text list and the renderer use.
 *
 * The Poppler document is owned by the backend and released with it.
 *
 * Example usage:
 * @code
 * auto backend = regions::PopplerBackend::open("build/main.pdf");
 * for (int p = 0; p < backend->pageCount(); ++p) {
 *     for (const auto &fragment : backend->fragments(p)) {
 *         std::cout << fragment.text << std::endl;
 *     }
 * }
 * @endcode
 */
class PopplerBackend : public DocumentBackend {
public:
  /**
   * @brief Open a PDF file
   * @param pdfPath Path to the PDF file
   * @param config Fragment grouping options
   * @param verbose Log extraction details to std::cerr
   * @throws std::runtime_error if the file is missing, unreadable, locked
   * or has no pages
   */
  static std::unique_ptr<PopplerBackend>
  open(const std::string &pdfPath,
       const ExtractionConfig &config = ExtractionConfig(),
       bool verbose = false);

  ~PopplerBackend() override;

  PopplerBackend(const PopplerBackend &) = delete;
  PopplerBackend &operator=(const PopplerBackend &) = delete;

  int pageCount() const override;
  PageSize pageSize(int pageIndex) const override;
  std::vector<Fragment> fragments(int pageIndex) const override;
  cv::Mat rasterize(int pageIndex, double scale) const override;

  /// Words of a page as reported by Poppler, in extraction order.
  std::vector<WordBox> words(int pageIndex) const;

  const std::string &path() const { return m_path; }

  /// Poppler version string.
  static std::string popplerVersion();

private:
  PopplerBackend(std::unique_ptr<poppler::document> document, std::string path,
                 const ExtractionConfig &config, bool verbose);

  /// @throws std::out_of_range / std::runtime_error
  std::unique_ptr<poppler::page> loadPage(int pageIndex) const;

  std::unique_ptr<poppler::document> m_document; ///< Open Poppler document
  std::string m_path;                            ///< Source file
  ExtractionConfig m_config;                     ///< Grouping options
  bool m_verbose;                                ///< Extraction logging
};

/**
 * @brief Convert a rendered Poppler image into a BGR cv::Mat
 * @return Deep copy of the pixels, or an empty Mat for unsupported formats
 */
cv::Mat popplerImageToMat(const poppler::image &image);

} // namespace regions

#endif // REGION_POPPLER_BACKEND_HPP
