#include "PopplerBackend.hpp"

#include <opencv2/imgproc.hpp>

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <utility>

// Poppler C++ wrapper
#include <poppler-document.h>
#include <poppler-image.h>
#include <poppler-page-renderer.h>
#include <poppler-page.h>
#include <poppler-version.h>

namespace regions {

std::unique_ptr<PopplerBackend> PopplerBackend::open(const std::string &pdfPath,
                                                     const ExtractionConfig &config,
                                                     bool verbose) {
  if (!std::filesystem::exists(pdfPath)) {
    throw std::runtime_error("PDF not found: " + pdfPath);
  }

  std::unique_ptr<poppler::document> doc(
      poppler::document::load_from_file(pdfPath));

  if (!doc) {
    throw std::runtime_error("Failed to load PDF file: " + pdfPath);
  }

  if (doc->is_locked()) {
    throw std::runtime_error("PDF file is password protected: " + pdfPath);
  }

  if (doc->pages() < 1) {
    throw std::runtime_error("PDF has no pages: " + pdfPath);
  }

  if (verbose) {
    std::cerr << "DEBUG: Opened " << pdfPath << " with " << doc->pages()
              << " pages" << std::endl;
  }

  return std::unique_ptr<PopplerBackend>(
      new PopplerBackend(std::move(doc), pdfPath, config, verbose));
}

PopplerBackend::PopplerBackend(std::unique_ptr<poppler::document> document,
                               std::string path,
                               const ExtractionConfig &config, bool verbose)
    : m_document(std::move(document)), m_path(std::move(path)),
      m_config(config), m_verbose(verbose) {}

PopplerBackend::~PopplerBackend() = default;

int PopplerBackend::pageCount() const { return m_document->pages(); }

std::unique_ptr<poppler::page> PopplerBackend::loadPage(int pageIndex) const {
  if (pageIndex < 0 || pageIndex >= m_document->pages()) {
    throw std::out_of_range("Page " + std::to_string(pageIndex + 1) +
                            " out of range (document has " +
                            std::to_string(m_document->pages()) + " pages)");
  }

  std::unique_ptr<poppler::page> page(m_document->create_page(pageIndex));
  if (!page) {
    throw std::runtime_error("Failed to create page " +
                             std::to_string(pageIndex + 1));
  }
  return page;
}

PageSize PopplerBackend::pageSize(int pageIndex) const {
  std::unique_ptr<poppler::page> page = loadPage(pageIndex);
  poppler::rectf pageRect = page->page_rect();
  return PageSize{pageRect.width(), pageRect.height()};
}

std::vector<WordBox> PopplerBackend::words(int pageIndex) const {
  std::unique_ptr<poppler::page> page = loadPage(pageIndex);

  std::vector<poppler::text_box> textBoxes = page->text_list();
  if (m_verbose) {
    std::cerr << "DEBUG: Found " << textBoxes.size() << " text boxes on page "
              << (pageIndex + 1) << std::endl;
  }

  std::vector<WordBox> out;
  out.reserve(textBoxes.size());

  for (auto &textBox : textBoxes) {
    poppler::byte_array textBytes = textBox.text().to_utf8();
    std::string text(textBytes.begin(), textBytes.end());

    if (text.empty()) {
      continue;
    }

    // Text list boxes are already top-left origin, same as the renderer
    poppler::rectf bbox = textBox.bbox();

    WordBox word;
    word.rect = Rect{bbox.left(), bbox.top(), bbox.right(), bbox.bottom()};
    word.text = std::move(text);
    word.hasSpaceAfter = textBox.has_space_after();
    out.push_back(std::move(word));
  }

  return out;
}

std::vector<Fragment> PopplerBackend::fragments(int pageIndex) const {
  std::vector<Fragment> out = groupWords(words(pageIndex), pageIndex, m_config);

  if (m_verbose) {
    std::cerr << "DEBUG: Grouped page " << (pageIndex + 1) << " into "
              << out.size() << " " << extractionLevelName(m_config.level)
              << " fragments" << std::endl;
  }
  return out;
}

cv::Mat PopplerBackend::rasterize(int pageIndex, double scale) const {
  if (!poppler::page_renderer::can_render()) {
    std::cerr << "Poppler was built without a rendering backend" << std::endl;
    return cv::Mat();
  }

  std::unique_ptr<poppler::page> page = loadPage(pageIndex);

  // Create page renderer with antialiasing
  poppler::page_renderer renderer;
  renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
  renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
  renderer.set_image_format(poppler::image::format_argb32);

  // 72 points per inch, so the resolution for a scale is 72 * scale dpi
  double dpi = 72.0 * scale;
  poppler::image popplerImage = renderer.render_page(page.get(), dpi, dpi);

  if (!popplerImage.is_valid()) {
    std::cerr << "Failed to render page " << (pageIndex + 1) << std::endl;
    return cv::Mat();
  }

  if (m_verbose) {
    std::cerr << "DEBUG: Rendered page " << (pageIndex + 1) << " at " << dpi
              << " dpi (" << popplerImage.width() << " x "
              << popplerImage.height() << ")" << std::endl;
  }

  return popplerImageToMat(popplerImage);
}

std::string PopplerBackend::popplerVersion() {
  return poppler::version_string();
}

cv::Mat popplerImageToMat(const poppler::image &image) {
  int width = image.width();
  int height = image.height();

  cv::Mat mat;

  switch (image.format()) {
  case poppler::image::format_argb32: {
    // ARGB32 is stored as BGRA bytes on little-endian hosts
    mat = cv::Mat(height, width, CV_8UC4, const_cast<char *>(image.const_data()),
                  image.bytes_per_row())
              .clone();
    cv::cvtColor(mat, mat, cv::COLOR_BGRA2BGR);
    break;
  }
  case poppler::image::format_rgb24: {
    mat = cv::Mat(height, width, CV_8UC3, const_cast<char *>(image.const_data()),
                  image.bytes_per_row())
              .clone();
    cv::cvtColor(mat, mat, cv::COLOR_RGB2BGR);
    break;
  }
  case poppler::image::format_bgr24: {
    mat = cv::Mat(height, width, CV_8UC3, const_cast<char *>(image.const_data()),
                  image.bytes_per_row())
              .clone();
    break;
  }
  case poppler::image::format_gray8: {
    mat = cv::Mat(height, width, CV_8UC1, const_cast<char *>(image.const_data()),
                  image.bytes_per_row())
              .clone();
    cv::cvtColor(mat, mat, cv::COLOR_GRAY2BGR);
    break;
  }
  default:
    break;
  }

  return mat;
}

} // namespace regions
