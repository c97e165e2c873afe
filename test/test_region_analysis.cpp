#include "Mocks.hpp"
#include "RegionAnalysis.hpp"
#include "RegionExporter.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <stdexcept>

namespace fs = std::filesystem;

/**
 * Session over in-memory documents: the factory hands out a mock backend
 * for every path registered in m_documents and throws for the rest.
 */
struct RegionAnalysisTest : public testing::Test {
  RegionAnalysisTest()
      : analysis(AnalysisConfig(), [this](const std::string &path) {
          return openFake(path);
        }) {
    m_WorkingDir = fs::current_path() / "test-data-analysis";
    if (fs::is_directory(m_WorkingDir)) {
      (void)fs::remove_all(m_WorkingDir);
    }
    fs::create_directories(m_WorkingDir);
  }

  ~RegionAnalysisTest() {
    std::error_code ec;
    fs::remove_all(m_WorkingDir, ec);
  }

  std::unique_ptr<DocumentBackend> openFake(const std::string &path) {
    auto it = m_documents.find(path);
    if (it == m_documents.end()) {
      throw std::runtime_error("PDF not found: " + path);
    }
    auto backend = std::make_unique<NiceMock<MockBackend>>();
    fakePages(*backend, it->second);
    return backend;
  }

  std::string addDocument(const std::string &name,
                          std::vector<std::vector<Fragment>> pages) {
    std::string path = (m_WorkingDir / name).string();
    m_documents[path] = std::move(pages);
    return path;
  }

  fs::path m_WorkingDir;
  std::map<std::string, std::vector<std::vector<Fragment>>> m_documents;
  RegionAnalysis analysis;
};

TEST_F(RegionAnalysisTest, OpenResolvesRegions) {
  std::string pdf = addDocument(
      "resume.pdf",
      {{frag(0, 10, 10, 50, 30, "[BEGIN sk:2] C++ [END sk:2]"),
        frag(0, 10, 40, 50, 60, "[BEGIN exp:1] Lead [END exp:1]")},
       {frag(1, 0, 0, 10, 10, "[BEGIN exp:0] Intern [END exp:0]"),
        frag(1, 0, 20, 10, 30, "[BEGIN pr:1] Tool [END pr:1]")}});

  auto loaded = analysis.openDocument(pdf);
  ASSERT_TRUE(loaded.success) << loaded.errorMessage;
  EXPECT_EQ(loaded.pageCount, 2);
  EXPECT_EQ(loaded.regionCount, 4);
  EXPECT_GE(loaded.processingTimeMs, 0.0);

  EXPECT_TRUE(analysis.isOpen());
  EXPECT_EQ(analysis.documentPath(), pdf);
  EXPECT_EQ(analysis.pageCount(), 2);
  EXPECT_DOUBLE_EQ(analysis.pageSize(0).height, 200.0);
  EXPECT_EQ(analysis.stats().resolved, 4);

  auto sorted = analysis.sortedRegions();
  ASSERT_EQ(sorted.size(), 4u);
  EXPECT_EQ(sorted[0]->id, "exp:0");
  EXPECT_EQ(sorted[1]->id, "exp:1");
  EXPECT_EQ(sorted[2]->id, "pr:1");
  EXPECT_EQ(sorted[3]->id, "sk:2");
}

TEST_F(RegionAnalysisTest, ZeroRegionsIsNotAnError) {
  std::string pdf = addDocument("plain.pdf", {{frag(0, 0, 0, 10, 10, "text")}});
  auto loaded = analysis.openDocument(pdf);
  EXPECT_TRUE(loaded.success);
  EXPECT_EQ(loaded.regionCount, 0);
  EXPECT_TRUE(analysis.regions().empty());
}

TEST_F(RegionAnalysisTest, LoadFailureLeavesSessionEmpty) {
  std::string pdf = addDocument(
      "resume.pdf", {{frag(0, 0, 0, 10, 10, "[BEGIN exp:1] a [END exp:1]")}});
  ASSERT_TRUE(analysis.openDocument(pdf).success);
  ASSERT_EQ(analysis.regions().size(), 1u);

  auto failed = analysis.openDocument((m_WorkingDir / "missing.pdf").string());
  EXPECT_FALSE(failed.success);
  EXPECT_NE(failed.errorMessage.find("missing.pdf"), std::string::npos);

  EXPECT_FALSE(analysis.isOpen());
  EXPECT_TRUE(analysis.regions().empty());
  EXPECT_TRUE(analysis.documentPath().empty());
  EXPECT_EQ(analysis.pageCount(), 0);
  EXPECT_EQ(analysis.hitTest(0, Point{10, 10}, 1.0), nullptr);
  EXPECT_FALSE(analysis.exportRegions().success);
  EXPECT_FALSE(analysis.renderOverlay(0, 1.0).success);
}

TEST_F(RegionAnalysisTest, ReloadRebuildsMap) {
  std::string first = addDocument(
      "a.pdf", {{frag(0, 0, 0, 10, 10, "[BEGIN exp:1] a [END exp:1]")}});
  std::string second = addDocument(
      "b.pdf", {{frag(0, 0, 0, 10, 10, "[BEGIN pr:3] b [END pr:3]")}});

  ASSERT_TRUE(analysis.openDocument(first).success);
  ASSERT_TRUE(analysis.openDocument(second).success);

  EXPECT_EQ(analysis.regions().size(), 1u);
  EXPECT_FALSE(analysis.regions().contains("exp:1"));
  EXPECT_TRUE(analysis.regions().contains("pr:3"));
  EXPECT_EQ(analysis.documentPath(), second);
}

TEST_F(RegionAnalysisTest, CloseDocument) {
  std::string pdf = addDocument(
      "a.pdf", {{frag(0, 0, 0, 10, 10, "[BEGIN exp:1] a [END exp:1]")}});
  ASSERT_TRUE(analysis.openDocument(pdf).success);
  analysis.closeDocument();
  EXPECT_FALSE(analysis.isOpen());
  EXPECT_TRUE(analysis.regions().empty());
  EXPECT_EQ(analysis.stats().resolved, 0);
}

TEST_F(RegionAnalysisTest, HitTestAtScale) {
  std::string pdf = addDocument(
      "a.pdf", {{frag(0, 10, 10, 50, 30, "[BEGIN exp:1] a [END exp:1]")}});
  ASSERT_TRUE(analysis.openDocument(pdf).success);

  const Region *hit = analysis.hitTest(0, Point{60, 40}, 2.0);
  ASSERT_NE(hit, nullptr);
  EXPECT_EQ(hit->id, "exp:1");
  EXPECT_EQ(analysis.hitTest(0, Point{60, 40}, 0.5), nullptr);
  EXPECT_EQ(analysis.hitTest(1, Point{60, 40}, 2.0), nullptr);
}

TEST_F(RegionAnalysisTest, ExportRegionsNextToDocument) {
  std::string pdf = addDocument(
      "resume.pdf", {{frag(0, 10, 10, 50, 30, "[BEGIN exp:1] a [END exp:1]")}});
  ASSERT_TRUE(analysis.openDocument(pdf).success);

  auto exported = analysis.exportRegions();
  ASSERT_TRUE(exported.success) << exported.errorMessage;
  EXPECT_EQ(exported.outputPath, pdf + ".regions.json");
  EXPECT_EQ(exported.regionCount, 1);

  RegionMap back = readRegionsJson(exported.outputPath);
  ASSERT_TRUE(back.contains("exp:1"));
  EXPECT_EQ(back.find("exp:1")->rect, (Rect{10, 10, 50, 30}));
}

TEST_F(RegionAnalysisTest, ExportFailureIsReported) {
  std::string pdf = addDocument(
      "resume.pdf", {{frag(0, 10, 10, 50, 30, "[BEGIN exp:1] a [END exp:1]")}});
  ASSERT_TRUE(analysis.openDocument(pdf).success);

  fs::path target = m_WorkingDir / "no-dir" / "out.json";
  auto exported = analysis.exportRegions(target.string());
  EXPECT_FALSE(exported.success);
  EXPECT_FALSE(exported.errorMessage.empty());
  EXPECT_FALSE(fs::exists(target));
}

TEST_F(RegionAnalysisTest, RenderOverlay) {
  std::string pdf = addDocument(
      "resume.pdf", {{frag(0, 10, 10, 50, 30, "[BEGIN exp:1] a [END exp:1]")}});
  ASSERT_TRUE(analysis.openDocument(pdf).success);

  auto rendered = analysis.renderOverlay(0, 2.0);
  ASSERT_TRUE(rendered.success) << rendered.errorMessage;
  EXPECT_DOUBLE_EQ(rendered.scale, 2.0);
  EXPECT_EQ(rendered.image.size(), cv::Size(200, 400));
  EXPECT_EQ(rendered.image.at<cv::Vec3b>(40, 50), cv::Vec3b(215, 215, 215));

  auto outOfRange = analysis.renderOverlay(3, 2.0);
  EXPECT_FALSE(outOfRange.success);
  EXPECT_NE(outOfRange.errorMessage.find("out of range"), std::string::npos);
}

TEST_F(RegionAnalysisTest, ExportOverlayPngDefaultPath) {
  std::string pdf = addDocument(
      "resume.pdf", {{frag(0, 10, 10, 50, 30, "[BEGIN exp:1] a [END exp:1]")}});
  ASSERT_TRUE(analysis.openDocument(pdf).success);

  auto rendered = analysis.exportOverlayPNG(0, 2.0);
  ASSERT_TRUE(rendered.success) << rendered.errorMessage;
  EXPECT_EQ(fs::path(rendered.outputPath),
            m_WorkingDir / "debug_overlay_page1.png");
  EXPECT_TRUE(fs::exists(rendered.outputPath));
}

TEST(RegionAnalysisPaths, DefaultOverlayPath) {
  EXPECT_EQ(fs::path(defaultOverlayPath("build/main.pdf", 1)),
            fs::path("build/debug_overlay_page2.png"));
}
