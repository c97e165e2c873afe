#include "Mocks.hpp"
#include "RegionResolver.hpp"

TEST(RegionResolver, SameFragment) {
  auto page = resolvePage({frag(0, 5, 6, 50, 20, "[BEGIN exp:1] hello [END exp:1]")});
  ASSERT_EQ(page.regions.size(), 1u);

  const Region &region = page.regions[0];
  EXPECT_EQ(region.id, "exp:1");
  EXPECT_EQ(region.text, "hello");
  EXPECT_EQ(region.rect, (Rect{5, 6, 50, 20}));
  EXPECT_EQ(region.kind, MarkerKind::Experience);
  EXPECT_EQ(region.ordinal, 1);
  EXPECT_EQ(page.stats.resolved, 1);
}

TEST(RegionResolver, CrossFragmentUnion) {
  auto page = resolvePage({frag(0, 0, 0, 10, 10, "[BEGIN pr:2] Parser"),
                           frag(0, 0, 10, 10, 20, "in C++"),
                           frag(0, 0, 20, 10, 30, "shipped [END pr:2]")});
  ASSERT_EQ(page.regions.size(), 1u);
  EXPECT_EQ(page.regions[0].id, "pr:2");
  EXPECT_EQ(page.regions[0].rect, (Rect{0, 0, 10, 30}));
  EXPECT_EQ(page.regions[0].text, "Parser\nin C++\nshipped");
}

TEST(RegionResolver, UnionTakesExtremesOfEveryFragment) {
  auto page = resolvePage({frag(0, 20, 5, 40, 15, "[BEGIN sk:1]"),
                           frag(0, 2, 14, 30, 22, "wide"),
                           frag(0, 10, 21, 60, 25, "[END sk:1]")});
  ASSERT_EQ(page.regions.size(), 1u);
  EXPECT_EQ(page.regions[0].rect, (Rect{2, 5, 60, 25}));
}

TEST(RegionResolver, FragmentsOutsideRegionsAreIgnored) {
  auto page = resolvePage({frag(0, 0, 0, 10, 10, "Header"),
                           frag(0, 0, 10, 10, 20, "[BEGIN exp:1] a"),
                           frag(0, 0, 20, 10, 30, "b [END exp:1]"),
                           frag(0, 0, 30, 10, 40, "Footer")});
  ASSERT_EQ(page.regions.size(), 1u);
  EXPECT_EQ(page.regions[0].rect, (Rect{0, 10, 10, 30}));
  EXPECT_EQ(page.regions[0].text, "a\nb");
}

TEST(RegionResolver, NoMarkerLeaksIntoText) {
  auto page = resolvePage(
      {frag(0, 0, 0, 10, 10, "[BEGIN exp:1] one [BEGIN exp:2] two"),
       frag(0, 0, 10, 10, 20, "[END exp:1] three [END exp:2]"),
       frag(0, 0, 20, 10, 30, "[BEGIN sk:1][BEGIN sk:1] x [END sk:1]")});
  ASSERT_EQ(page.regions.size(), 3u);
  for (const auto &region : page.regions) {
    EXPECT_EQ(region.text.find("[BEGIN"), std::string::npos) << region.id;
    EXPECT_EQ(region.text.find("[END"), std::string::npos) << region.id;
  }
}

TEST(RegionResolver, UnterminatedBeginYieldsNothing) {
  PageResolution page;
  EXPECT_NO_THROW(page = resolvePage({frag(0, 0, 0, 10, 10, "[BEGIN exp:4] a"),
                                      frag(0, 0, 10, 10, 20, "b")}));
  EXPECT_TRUE(page.regions.empty());
  EXPECT_EQ(page.stats.unterminatedBegins, 1);
}

TEST(RegionResolver, OrphanEndIsIgnored) {
  auto page = resolvePage({frag(0, 0, 0, 10, 10, "text [END pr:9]"),
                           frag(0, 0, 10, 10, 20, "[BEGIN pr:1] x [END pr:1]")});
  ASSERT_EQ(page.regions.size(), 1u);
  EXPECT_EQ(page.regions[0].id, "pr:1");
  EXPECT_EQ(page.stats.orphanEnds, 1);
}

TEST(RegionResolver, CloseAndOpenInOneFragment) {
  auto page = resolvePage({frag(0, 0, 0, 10, 10, "[BEGIN exp:1] first"),
                           frag(0, 0, 10, 10, 20, "end [END exp:1] [BEGIN exp:2] next"),
                           frag(0, 0, 20, 10, 30, "last [END exp:2]")});
  ASSERT_EQ(page.regions.size(), 2u);

  EXPECT_EQ(page.regions[0].id, "exp:1");
  EXPECT_EQ(page.regions[0].rect, (Rect{0, 0, 10, 20}));
  EXPECT_EQ(page.regions[0].text, "first\nend   next");

  EXPECT_EQ(page.regions[1].id, "exp:2");
  EXPECT_EQ(page.regions[1].rect, (Rect{0, 10, 10, 30}));
  EXPECT_EQ(page.regions[1].text, "end   next\nlast");
}

TEST(RegionResolver, DuplicateBeginKeepsFirst) {
  auto page = resolvePage({frag(0, 0, 0, 10, 10, "[BEGIN sk:2] a"),
                           frag(0, 0, 10, 10, 20, "[BEGIN sk:2] b"),
                           frag(0, 0, 20, 10, 30, "c [END sk:2]")});
  ASSERT_EQ(page.regions.size(), 1u);
  EXPECT_EQ(page.regions[0].rect, (Rect{0, 0, 10, 30}));
  EXPECT_EQ(page.regions[0].text, "a\n b\nc");
  EXPECT_EQ(page.stats.duplicateBegins, 1);
}

TEST(RegionResolver, DuplicateIdOnPageKeepsFirst) {
  auto page = resolvePage({frag(0, 0, 0, 10, 10, "[BEGIN exp:1] a [END exp:1]"),
                           frag(0, 0, 10, 10, 20, "[BEGIN exp:1] b [END exp:1]")});
  ASSERT_EQ(page.regions.size(), 1u);
  EXPECT_EQ(page.regions[0].text, "a");
  EXPECT_EQ(page.stats.duplicateIds, 1);
}

TEST(RegionResolver, EmptyPage) {
  auto page = resolvePage({});
  EXPECT_TRUE(page.regions.empty());
  EXPECT_EQ(page.stats.resolved, 0);
}

TEST(RegionResolver, RegionsDoNotSpanPages) {
  NiceMock<MockBackend> backend;
  fakePages(backend, {{frag(0, 0, 0, 10, 10, "[BEGIN exp:1] a")},
                      {frag(1, 0, 0, 10, 10, "b [END exp:1]")}});

  RegionMap out;
  ResolveStats stats = resolveDocument(backend, out);
  EXPECT_TRUE(out.empty());
  EXPECT_EQ(stats.unterminatedBegins, 1);
  EXPECT_EQ(stats.orphanEnds, 1);
}

TEST(RegionResolver, DocumentCollectsEveryPage) {
  NiceMock<MockBackend> backend;
  fakePages(backend,
            {{frag(0, 0, 0, 10, 10, "[BEGIN exp:1] a [END exp:1]")},
             {frag(1, 5, 5, 20, 20, "[BEGIN sk:1] b [END sk:1]"),
              frag(1, 5, 20, 20, 30, "[BEGIN exp:1] again [END exp:1]")}});

  RegionMap out;
  ASSERT_TRUE(out.insert(Region{"pr:99", 0, Rect{0, 0, 1, 1}, "stale",
                    MarkerKind::Project, 99}));

  ResolveStats stats = resolveDocument(backend, out);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_FALSE(out.contains("pr:99"));

  const Region *exp1 = out.find("exp:1");
  ASSERT_NE(exp1, nullptr);
  EXPECT_EQ(exp1->pageIndex, 0);
  EXPECT_EQ(exp1->text, "a");

  const Region *sk1 = out.find("sk:1");
  ASSERT_NE(sk1, nullptr);
  EXPECT_EQ(sk1->pageIndex, 1);
  EXPECT_EQ(sk1->rect, (Rect{5, 5, 20, 20}));

  EXPECT_EQ(stats.resolved, 2);
  EXPECT_EQ(stats.duplicateIds, 1);
}

TEST(RegionResolver, RegionsFollowBeginOrder) {
  auto page = resolvePage({frag(0, 0, 0, 10, 10, "[BEGIN exp:9] a"),
                           frag(0, 0, 10, 10, 20, "[BEGIN exp:10] b"),
                           frag(0, 0, 20, 10, 30, "[END exp:9] [END exp:10]"),
                           frag(0, 0, 30, 10, 40, "[BEGIN sk:1] x [END sk:1]"),
                           frag(0, 0, 40, 10, 50, "[BEGIN pr:1] y [END pr:1]")});
  ASSERT_EQ(page.regions.size(), 4u);
  EXPECT_EQ(page.regions[0].id, "exp:9");
  EXPECT_EQ(page.regions[1].id, "exp:10");
  EXPECT_EQ(page.regions[2].id, "sk:1");
  EXPECT_EQ(page.regions[3].id, "pr:1");
}

TEST(RegionResolver, PairInsideOpenRegionComesAfterIt) {
  // sk:1 closes inside one fragment before exp:1 closes
  auto page = resolvePage({frag(0, 0, 0, 10, 10, "[BEGIN exp:1] a"),
                           frag(0, 0, 10, 10, 20, "[BEGIN sk:1] b [END sk:1]"),
                           frag(0, 0, 20, 10, 30, "c [END exp:1]")});
  ASSERT_EQ(page.regions.size(), 2u);
  EXPECT_EQ(page.regions[0].id, "exp:1");
  EXPECT_EQ(page.regions[1].id, "sk:1");
}

TEST(RegionResolver, DuplicateIdKeepsEarliestBegin) {
  // The later BEGIN closes first, the earlier one still wins
  auto page = resolvePage({frag(0, 0, 0, 10, 10, "[BEGIN pr:1] outer"),
                           frag(0, 0, 10, 10, 20,
                                "done [END pr:1] [BEGIN pr:1] in [END pr:1]")});
  ASSERT_EQ(page.regions.size(), 1u);
  EXPECT_EQ(page.regions[0].rect, (Rect{0, 0, 10, 20}));
  EXPECT_EQ(page.stats.duplicateIds, 1);
}

TEST(RegionResolver, CountsRegionsPastPageBounds) {
  NiceMock<MockBackend> backend;
  fakePages(backend, {{frag(0, 0, 0, 10, 10, "[BEGIN exp:1] a [END exp:1]"),
                       frag(0, 50, 190, 120, 210, "[BEGIN sk:1] b [END sk:1]")}});

  RegionMap out;
  ResolveStats stats = resolveDocument(backend, out);
  EXPECT_EQ(out.size(), 2u);
  EXPECT_TRUE(out.contains("sk:1"));
  EXPECT_EQ(stats.outsidePage, 1);
}
