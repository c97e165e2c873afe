#include "RegionAnalysis.hpp"

#include "HitTester.hpp"
#include "PopplerBackend.hpp"
#include "RegionExporter.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <system_error>
#include <utility>

namespace regions {

namespace {

BackendFactory popplerFactory(const AnalysisConfig &config) {
  ExtractionConfig extraction = config.extraction;
  bool verbose = config.verbose;
  return [extraction, verbose](const std::string &path) {
    return std::unique_ptr<DocumentBackend>(
        PopplerBackend::open(path, extraction, verbose));
  };
}

} // namespace

RegionAnalysis::RegionAnalysis(const AnalysisConfig &config)
    : m_config(config), m_factory(popplerFactory(config)) {}

RegionAnalysis::RegionAnalysis(const AnalysisConfig &config,
                               BackendFactory factory)
    : m_config(config), m_factory(std::move(factory)) {}

RegionAnalysis::~RegionAnalysis() = default;

RegionAnalysis::RegionAnalysis(RegionAnalysis &&other) noexcept
    : m_config(std::move(other.m_config)),
      m_factory(std::move(other.m_factory)),
      m_backend(std::move(other.m_backend)),
      m_documentPath(std::move(other.m_documentPath)),
      m_regions(std::move(other.m_regions)), m_stats(other.m_stats) {
  other.m_stats = ResolveStats();
}

RegionAnalysis &RegionAnalysis::operator=(RegionAnalysis &&other) noexcept {
  if (this != &other) {
    m_config = std::move(other.m_config);
    m_factory = std::move(other.m_factory);
    m_backend = std::move(other.m_backend);
    m_documentPath = std::move(other.m_documentPath);
    m_regions = std::move(other.m_regions);
    m_stats = other.m_stats;
    other.m_stats = ResolveStats();
  }
  return *this;
}

LoadResult RegionAnalysis::openDocument(const std::string &path) {
  LoadResult result;
  result.success = false;

  auto startTime = std::chrono::high_resolution_clock::now();

  // The previous document goes away even if the new one fails to load
  closeDocument();

  try {
    std::unique_ptr<DocumentBackend> backend = m_factory(path);
    if (!backend) {
      result.errorMessage = "Failed to open document: " + path;
      return result;
    }

    RegionMap resolved;
    ResolveStats stats = resolveDocument(*backend, resolved, m_config.verbose);

    m_backend = std::move(backend);
    m_documentPath = path;
    m_regions = std::move(resolved);
    m_stats = stats;

    result.pageCount = m_backend->pageCount();
    result.regionCount = static_cast<int>(m_regions.size());
    result.success = true;

    if (m_regions.empty()) {
      std::cerr << "No regions found. Make sure [BEGIN ...]/[END ...] "
                   "markers exist."
                << std::endl;
    }
    if (m_stats.unterminatedBegins > 0) {
      std::cerr << "WARNING: " << m_stats.unterminatedBegins
                << " BEGIN marker(s) had no matching END and were dropped"
                << std::endl;
    }
  } catch (const std::exception &e) {
    closeDocument();
    result.errorMessage = std::string("Failed to open document: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

void RegionAnalysis::closeDocument() {
  m_backend.reset();
  m_documentPath.clear();
  m_regions.clear();
  m_stats = ResolveStats();
}

bool RegionAnalysis::isOpen() const { return m_backend != nullptr; }

int RegionAnalysis::pageCount() const {
  return m_backend ? m_backend->pageCount() : 0;
}

PageSize RegionAnalysis::pageSize(int pageIndex) const {
  if (!m_backend || pageIndex < 0 || pageIndex >= m_backend->pageCount()) {
    return PageSize();
  }
  try {
    return m_backend->pageSize(pageIndex);
  } catch (const std::exception &e) {
    std::cerr << "Failed to get size of page " << (pageIndex + 1) << ": "
              << e.what() << std::endl;
    return PageSize();
  }
}

std::vector<const Region *> RegionAnalysis::sortedRegions() const {
  std::vector<const Region *> out;
  out.reserve(m_regions.size());
  for (const auto &region : m_regions) {
    out.push_back(&region);
  }

  std::sort(out.begin(), out.end(), [](const Region *a, const Region *b) {
    int cmp = std::strcmp(kindCode(a->kind), kindCode(b->kind));
    if (cmp != 0) {
      return cmp < 0;
    }
    return a->ordinal < b->ordinal;
  });
  return out;
}

bool RegionAnalysis::checkPage(int pageIndex, std::string &errorMessage) const {
  if (!m_backend) {
    errorMessage = "No document loaded";
    return false;
  }
  if (pageIndex < 0 || pageIndex >= m_backend->pageCount()) {
    errorMessage = "Page " + std::to_string(pageIndex + 1) +
                   " out of range (document has " +
                   std::to_string(m_backend->pageCount()) + " pages)";
    return false;
  }
  return true;
}

RenderResult RegionAnalysis::renderOverlay(int pageIndex, double scale) {
  RenderResult result;
  result.success = false;

  if (!checkPage(pageIndex, result.errorMessage)) {
    return result;
  }

  try {
    ScaleMapper mapper(FitMode::Natural, m_config.scale);
    mapper.setScale(scale);
    result.scale = mapper.scale();

    OverlayRenderer renderer(*m_backend, m_regions, m_config.overlay);
    result.image = renderer.render(pageIndex, mapper);
    if (result.image.empty()) {
      result.errorMessage =
          "Failed to render page " + std::to_string(pageIndex + 1);
      return result;
    }
    result.success = true;
  } catch (const std::exception &e) {
    result.errorMessage = std::string("Overlay rendering failed: ") + e.what();
  }

  return result;
}

RenderResult RegionAnalysis::renderOverlayTo(OverlaySink &sink, int pageIndex,
                                             double scale) {
  RenderResult result = renderOverlay(pageIndex, scale);
  if (!result.success) {
    return result;
  }

  if (!sink.present(result.image, pageIndex)) {
    result.success = false;
    result.errorMessage = sink.errorMessage();
  }
  return result;
}

RenderResult RegionAnalysis::exportOverlayPNG(int pageIndex, double scale,
                                              const std::string &outputPath) {
  std::string target = outputPath.empty()
                           ? defaultOverlayPath(m_documentPath, pageIndex)
                           : outputPath;

  std::filesystem::path parent = std::filesystem::path(target).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      RenderResult result;
      result.errorMessage = "Failed to create directory " + parent.string() +
                            ": " + ec.message();
      return result;
    }
  }

  ImageFileSink sink(target);
  RenderResult result = renderOverlayTo(sink, pageIndex, scale);
  if (result.success) {
    result.outputPath = target;
  }
  return result;
}

ExportResult RegionAnalysis::exportRegions(const std::string &outputPath) const {
  ExportResult result;
  result.success = false;

  if (!m_backend) {
    result.errorMessage = "No document loaded";
    return result;
  }

  std::filesystem::path target = outputPath.empty()
                                     ? defaultExportPath(m_documentPath)
                                     : std::filesystem::path(outputPath);

  try {
    writeRegionsJson(m_regions, target);
    result.outputPath = target.string();
    result.regionCount = static_cast<int>(m_regions.size());
    result.success = true;
  } catch (const std::exception &e) {
    result.errorMessage = std::string("Export failed: ") + e.what();
  }

  return result;
}

const Region *RegionAnalysis::hitTest(int pageIndex, const Point &displayPos,
                                      double scale) const {
  ScaleMapper mapper(FitMode::Natural, m_config.scale);
  mapper.setScale(scale);
  return regions::hitTest(m_regions, pageIndex, displayPos, mapper);
}

std::string defaultOverlayPath(const std::string &documentPath,
                               int pageIndex) {
  std::filesystem::path dir = std::filesystem::path(documentPath).parent_path();
  std::string name =
      "debug_overlay_page" + std::to_string(pageIndex + 1) + ".png";
  return (dir / name).string();
}

} // namespace regions
