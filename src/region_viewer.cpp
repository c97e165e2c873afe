#include "RegionAnalysis.hpp"
#include "ViewerState.hpp"

#include <opencv2/highgui.hpp>

#include <iostream>
#include <string>

namespace {

namespace ViewerConfig {
constexpr const char *WINDOW_NAME = "Region Viewer";
constexpr int WAIT_MS = 30;
} // namespace ViewerConfig

namespace Key {
constexpr int NEXT = 'n';
constexpr int PREV = 'p';
constexpr int MODE = 'm';
constexpr int SAVE = 's';
constexpr int OPEN = 'o';
constexpr int QUIT = 'q';
constexpr int ESC = 27;
} // namespace Key

/**
 * @brief Interactive HighGUI front end over a RegionAnalysis session
 *
 * Shows one page at a time with its regions drawn on top. Hovering a region
 * names it in the window title; clicking prints its text to stdout. Nothing
 * is put on the clipboard.
 */
class OverlayViewer {
public:
  OverlayViewer(regions::RegionAnalysis &analysis, regions::FitMode mode)
      : m_analysis(analysis),
        m_mapper(mode, analysis.getConfig().scale),
        m_sink(ViewerConfig::WINDOW_NAME),
        m_viewport(analysis.getConfig().scale) {
    cv::namedWindow(ViewerConfig::WINDOW_NAME, cv::WINDOW_NORMAL);
    cv::setMouseCallback(ViewerConfig::WINDOW_NAME, &OverlayViewer::mouseCallback,
                         this);
  }

  ~OverlayViewer() { cv::destroyWindow(ViewerConfig::WINDOW_NAME); }

  OverlayViewer(const OverlayViewer &) = delete;
  OverlayViewer &operator=(const OverlayViewer &) = delete;

  void run() {
    render();

    while (true) {
      int key = cv::waitKey(ViewerConfig::WAIT_MS);

      // Closing the window ends the loop like 'q'
      if (cv::getWindowProperty(ViewerConfig::WINDOW_NAME,
                                cv::WND_PROP_VISIBLE) < 1) {
        break;
      }

      if (key == Key::QUIT || key == Key::ESC) {
        break;
      } else if (key == Key::NEXT) {
        if (m_page + 1 < m_analysis.pageCount()) {
          m_page++;
          render();
        }
      } else if (key == Key::PREV) {
        if (m_page > 0) {
          m_page--;
          render();
        }
      } else if (key == Key::MODE) {
        m_mapper.setFitMode(regions::nextFitMode(m_mapper.fitMode()));
        render();
      } else if (key == Key::SAVE) {
        saveRegions();
      } else if (key == Key::OPEN) {
        openFromStdin();
      } else if (m_mapper.fitMode() != regions::FitMode::Natural) {
        pollViewport();
      }
    }
  }

private:
  static void mouseCallback(int event, int x, int y, int /*flags*/,
                            void *userdata) {
    auto *self = static_cast<OverlayViewer *>(userdata);
    if (event == cv::EVENT_MOUSEMOVE) {
      self->onHover(x, y);
    } else if (event == cv::EVENT_LBUTTONDOWN) {
      self->onClick(x, y);
    }
  }

  const regions::Region *regionAt(int x, int y) const {
    if (!m_analysis.isOpen()) {
      return nullptr;
    }
    return m_analysis.hitTest(m_page, regions::Point{double(x), double(y)},
                              m_mapper.scale());
  }

  void onHover(int x, int y) {
    const regions::Region *region = regionAt(x, y);
    std::string id = region ? region->id : std::string();
    if (id == m_hoveredId) {
      return;
    }
    m_hoveredId = id;
    updateTitle();
  }

  void onClick(int x, int y) {
    const regions::Region *region = regionAt(x, y);
    if (region == nullptr) {
      return;
    }
    std::cout << "\n=== CLICKED " << region->id << " ===\n"
              << region->text << std::endl;
    cv::setWindowTitle(ViewerConfig::WINDOW_NAME,
                       regions::clickedTitle(region->id));
  }

  regions::ViewportSize currentViewport() const {
    cv::Rect rect = cv::getWindowImageRect(ViewerConfig::WINDOW_NAME);
    return regions::ViewportSize{rect.width, rect.height};
  }

  void pollViewport() {
    if (m_viewport.observe(currentViewport())) {
      render();
    }
  }

  void render() {
    m_hoveredId.clear();

    if (!m_analysis.isOpen()) {
      updateTitle();
      return;
    }

    double scale =
        m_mapper.update(m_analysis.pageSize(m_page), m_viewport.target());
    auto rendered = m_analysis.renderOverlayTo(m_sink, m_page, scale);
    if (!rendered.success) {
      std::cerr << rendered.errorMessage << std::endl;
    } else {
      cv::resizeWindow(ViewerConfig::WINDOW_NAME, rendered.image.cols,
                       rendered.image.rows);
      m_viewport.expect(
          regions::ViewportSize{rendered.image.cols, rendered.image.rows});
    }
    updateTitle();
  }

  void updateTitle() {
    if (!m_analysis.isOpen()) {
      cv::setWindowTitle(ViewerConfig::WINDOW_NAME,
                         "No document loaded (press o to open)");
      return;
    }

    cv::setWindowTitle(ViewerConfig::WINDOW_NAME,
                       regions::viewerTitle(m_analysis.documentPath(), m_page,
                                            m_analysis.pageCount(),
                                            m_mapper.fitMode(),
                                            m_mapper.scale(), m_hoveredId));
  }

  void saveRegions() {
    auto exported = m_analysis.exportRegions();
    if (exported.success) {
      std::cout << "Saved " << exported.regionCount << " regions to "
                << exported.outputPath << std::endl;
    } else {
      std::cerr << exported.errorMessage << std::endl;
    }
  }

  void openFromStdin() {
    std::cout << "Open PDF: " << std::flush;
    std::string path;
    if (!std::getline(std::cin, path) || path.empty()) {
      return;
    }

    auto loaded = m_analysis.openDocument(path);
    if (!loaded.success) {
      std::cerr << loaded.errorMessage << std::endl;
    } else {
      std::cout << "Found " << loaded.regionCount << " regions across "
                << loaded.pageCount << " pages." << std::endl;
    }
    m_page = 0;
    render();
  }

  regions::RegionAnalysis &m_analysis;
  regions::ScaleMapper m_mapper;
  regions::WindowSink m_sink;
  regions::ViewportTracker m_viewport;
  int m_page = 0;
  std::string m_hoveredId;
};

void printUsage(const char *programName) {
  std::cout << "Usage: " << programName << " [pdf_path] [options]\n"
            << "\nOptions:\n"
            << "  -f, --fit <mode>  Initial fit mode: natural, fit_width, "
               "fit_height (default: fit_height)\n"
            << "  -v, --verbose     Print extraction details\n"
            << "  -h, --help        Show this help message\n"
            << "\nKeys:\n"
            << "  n / p   next / previous page\n"
            << "  m       cycle fit mode\n"
            << "  click   print the region's text to the terminal\n"
            << "  s       save regions JSON next to the PDF\n"
            << "  o       open another PDF (path read from the terminal)\n"
            << "  q, Esc  quit\n";
}

} // namespace

int main(int argc, char *argv[]) {
  std::string pdfPath;
  regions::FitMode mode = regions::FitMode::FitHeight;
  regions::AnalysisConfig config;

  config.overlay = regions::viewerOverlayStyle();

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "-f" || arg == "--fit") {
      if (i + 1 < argc) {
        std::string name = argv[++i];
        if (!regions::parseFitMode(name, mode)) {
          std::cerr << "Error: unknown fit mode '" << name << "'\n";
          return 1;
        }
      } else {
        std::cerr << "Error: --fit requires an argument\n";
        return 1;
      }
    } else if (arg == "-v" || arg == "--verbose") {
      config.verbose = true;
    } else if (arg[0] != '-') {
      pdfPath = arg;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  regions::RegionAnalysis analysis(config);

  if (!pdfPath.empty()) {
    auto loaded = analysis.openDocument(pdfPath);
    if (!loaded.success) {
      std::cerr << loaded.errorMessage << "\n";
      return 1;
    }
    std::cout << "Found " << loaded.regionCount << " regions across "
              << loaded.pageCount << " pages.\n";
  }

  try {
    OverlayViewer viewer(analysis, mode);
    viewer.run();
  } catch (const cv::Exception &e) {
    std::cerr << "Viewer error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
