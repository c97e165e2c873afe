#include "PopplerBackend.hpp"
#include "RegionAnalysis.hpp"

#include <cstdio>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <pdf_path> [options]\n"
      << "\nOptions:\n"
      << "  -o, --output <path>     JSON output path (default: "
         "<pdf>.regions.json)\n"
      << "      --no-json           Do not write the regions JSON\n"
      << "  -p, --page <n>          Page for the debug overlay, 1-based "
         "(default: 1)\n"
      << "  -z, --zoom <f>          Debug overlay scale (default: 2.0)\n"
      << "  -d, --debug-png <path>  Debug overlay path (default: "
         "debug_overlay_page<n>.png beside the PDF)\n"
      << "      --no-png            Do not write the debug overlay\n"
      << "  -l, --level <level>     Fragment grouping: word, line, block "
         "(default: block)\n"
      << "  -v, --verbose           Print extraction details\n"
      << "  -h, --help              Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " build/main.pdf\n"
      << "  " << programName << " build/main.pdf -p 2 -z 3\n"
      << "  " << programName << " build/main.pdf --no-png -o regions.json\n";
}

static std::string formatRect(const regions::Rect &r) {
  char buffer[128];
  std::snprintf(buffer, sizeof(buffer), "(%.1f, %.1f, %.1f, %.1f)", r.x0, r.y0,
                r.x1, r.y1);
  return buffer;
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::string pdfPath;
  std::string jsonPath;
  std::string pngPath;
  bool writeJson = true;
  bool writePng = true;
  int pageNumber = 1;
  double zoom = 2.0;
  regions::AnalysisConfig config;
  config.overlay = regions::debugOverlayStyle();

  // Parse command line arguments
  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "-h" || arg == "--help") {
        printUsage(argv[0]);
        return 0;
      } else if (arg == "-o" || arg == "--output") {
        if (i + 1 < argc) {
          jsonPath = argv[++i];
        } else {
          std::cerr << "Error: --output requires an argument\n";
          return 1;
        }
      } else if (arg == "--no-json") {
        writeJson = false;
      } else if (arg == "-p" || arg == "--page") {
        if (i + 1 < argc) {
          pageNumber = std::stoi(argv[++i]);
        } else {
          std::cerr << "Error: --page requires an argument\n";
          return 1;
        }
      } else if (arg == "-z" || arg == "--zoom") {
        if (i + 1 < argc) {
          zoom = std::stod(argv[++i]);
        } else {
          std::cerr << "Error: --zoom requires an argument\n";
          return 1;
        }
      } else if (arg == "-d" || arg == "--debug-png") {
        if (i + 1 < argc) {
          pngPath = argv[++i];
        } else {
          std::cerr << "Error: --debug-png requires an argument\n";
          return 1;
        }
      } else if (arg == "--no-png") {
        writePng = false;
      } else if (arg == "-l" || arg == "--level") {
        if (i + 1 < argc) {
          std::string level = argv[++i];
          if (!regions::parseExtractionLevel(level, config.extraction.level)) {
            std::cerr << "Error: unknown level '" << level
                      << "' (expected word, line or block)\n";
            return 1;
          }
        } else {
          std::cerr << "Error: --level requires an argument\n";
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
  } catch (const std::exception &e) {
    std::cerr << "Error: invalid numeric argument (" << e.what() << ")\n";
    return 1;
  }

  if (pdfPath.empty()) {
    std::cerr << "Error: No PDF path provided\n";
    printUsage(argv[0]);
    return 1;
  }

  if (pageNumber < 1) {
    std::cerr << "Error: --page must be 1 or greater\n";
    return 1;
  }

  if (!(zoom > 0)) {
    std::cerr << "Error: --zoom must be positive\n";
    return 1;
  }

  // Display version info
  std::cout << "=== Region Analysis ===\n"
            << "Poppler version: " << regions::PopplerBackend::popplerVersion()
            << "\n"
            << "OpenCV version: " << CV_VERSION << "\n"
            << "Fragment level: "
            << regions::extractionLevelName(config.extraction.level) << "\n"
            << "=======================\n\n";

  regions::RegionAnalysis analysis(config);

  std::cout << "Loading PDF: " << pdfPath << "\n";
  auto loaded = analysis.openDocument(pdfPath);

  if (!loaded.success) {
    std::cerr << loaded.errorMessage << "\n";
    return 1;
  }

  std::cout << "Found " << loaded.regionCount << " regions across "
            << loaded.pageCount << " pages.\n";

  for (const auto *region : analysis.sortedRegions()) {
    std::cout << "  " << std::left << std::setw(8) << region->id << std::right
              << " page=" << (region->pageIndex + 1)
              << " rect=" << formatRect(region->rect)
              << " text_len=" << region->text.size() << "\n";
  }

  const auto &stats = analysis.stats();
  if (config.verbose) {
    std::cerr << "DEBUG: unterminated=" << stats.unterminatedBegins
              << " orphan_ends=" << stats.orphanEnds
              << " duplicate_begins=" << stats.duplicateBegins
              << " duplicate_ids=" << stats.duplicateIds
              << " outside_page=" << stats.outsidePage << std::endl;
  }

  int status = 0;

  if (writeJson) {
    auto exported = analysis.exportRegions(jsonPath);
    if (exported.success) {
      std::cout << "\nWrote " << exported.regionCount << " regions to "
                << exported.outputPath << "\n";
    } else {
      std::cerr << exported.errorMessage << "\n";
      status = 1;
    }
  }

  if (writePng) {
    int pageIndex = pageNumber - 1;
    auto rendered = analysis.exportOverlayPNG(pageIndex, zoom, pngPath);
    if (rendered.success) {
      std::cout << "Wrote debug overlay to " << rendered.outputPath << " ("
                << rendered.image.cols << " x " << rendered.image.rows
                << ")\n";
    } else {
      std::cerr << rendered.errorMessage << "\n";
      status = 1;
    }
  }

  std::cout << "\nProcessing time: " << std::fixed << std::setprecision(2)
            << loaded.processingTimeMs << " ms\n";

  return status;
}
