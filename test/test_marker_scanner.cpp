#include "Mocks.hpp"
#include "MarkerScanner.hpp"

TEST(MarkerScanner, FindsBeginAndEndInOrder) {
  auto markers = scanMarkers("[BEGIN exp:1] hello [END exp:1]", 4);
  ASSERT_EQ(markers.size(), 2u);

  EXPECT_EQ(markers[0].boundary, MarkerBoundary::Begin);
  EXPECT_EQ(markers[0].kind, MarkerKind::Experience);
  EXPECT_EQ(markers[0].ordinal, 1);
  EXPECT_EQ(markers[0].offset, 0u);
  EXPECT_EQ(markers[0].length, 13u);
  EXPECT_EQ(markers[0].fragmentIndex, 4);

  EXPECT_EQ(markers[1].boundary, MarkerBoundary::End);
  EXPECT_EQ(markers[1].offset, 20u);
  EXPECT_EQ(markers[1].length, 11u);
  EXPECT_EQ(markers[1].regionId(), "exp:1");
}

TEST(MarkerScanner, AllKinds) {
  auto markers = scanMarkers("[BEGIN pr:2][END sk:10][BEGIN exp:0]");
  ASSERT_EQ(markers.size(), 3u);
  EXPECT_EQ(markers[0].regionId(), "pr:2");
  EXPECT_EQ(markers[1].regionId(), "sk:10");
  EXPECT_EQ(markers[2].regionId(), "exp:0");
  EXPECT_EQ(markers[2].fragmentIndex, -1);
}

TEST(MarkerScanner, AcceptsAnyWhitespaceRunAfterKeyword) {
  auto markers = scanMarkers("[BEGIN   exp:3] x [END\texp:3] [BEGIN\nsk:1]");
  ASSERT_EQ(markers.size(), 3u);
  EXPECT_EQ(markers[0].regionId(), "exp:3");
  EXPECT_EQ(markers[1].boundary, MarkerBoundary::End);
  EXPECT_EQ(markers[2].regionId(), "sk:1");
}

TEST(MarkerScanner, LeadingZerosKeepNumericValue) {
  auto markers = scanMarkers("[BEGIN exp:007]");
  ASSERT_EQ(markers.size(), 1u);
  EXPECT_EQ(markers[0].ordinal, 7);
  EXPECT_EQ(markers[0].regionId(), "exp:7");
}

TEST(MarkerScanner, RejectsMalformedTokens) {
  const char *samples[] = {
      "[BEGINexp:1]",         // no whitespace
      "[begin exp:1]",        // keyword case
      "[BEGIN foo:1]",        // unknown kind
      "[BEGIN exp:]",         // no ordinal
      "[BEGIN exp:-1]",       // negative
      "[BEGIN exp:1a]",       // trailing garbage
      "[BEGIN exp:1",         // unterminated
      "BEGIN exp:1]",         // no bracket
      "[BEGIN exp :1]",       // space before colon
      "[END exp:99999999999]" // does not fit an int
  };
  for (const char *sample : samples) {
    EXPECT_TRUE(scanMarkers(sample).empty()) << sample;
  }
}

TEST(MarkerScanner, MalformedTokenDoesNotHideFollowingMarker) {
  auto markers = scanMarkers("[BEGIN foo:1] [[END pr:4]");
  ASSERT_EQ(markers.size(), 1u);
  EXPECT_EQ(markers[0].boundary, MarkerBoundary::End);
  EXPECT_EQ(markers[0].regionId(), "pr:4");
  EXPECT_EQ(markers[0].offset, 15u);
}

TEST(MarkerScanner, MatchAtPosition) {
  std::string text = "abc [END sk:2] def";
  Marker marker;
  EXPECT_EQ(matchMarkerAt(text, 0, marker), 0u);
  EXPECT_EQ(matchMarkerAt(text, 4, marker), 10u);
  EXPECT_EQ(marker.kind, MarkerKind::Skill);
  EXPECT_EQ(marker.ordinal, 2);
  EXPECT_EQ(matchMarkerAt(text, 100, marker), 0u);
}

TEST(MarkerScanner, PlainTextHasNoMarkers) {
  EXPECT_TRUE(scanMarkers("").empty());
  EXPECT_TRUE(scanMarkers("Senior engineer [2019 - 2023]").empty());
}

TEST(MarkerScanner, KindIsShortLowercaseCode) {
  EXPECT_TRUE(scanMarkers("[BEGIN expx:1]").empty());
  EXPECT_TRUE(scanMarkers("[BEGIN Exp:1]").empty());
  EXPECT_TRUE(scanMarkers("[BEGIN e:1]").empty());
  EXPECT_EQ(scanMarkers("[END pr:1]").size(), 1u);
}

TEST(MarkerScanner, ManyUnfinishedPrefixesScanLinearly) {
  // Every prefix stops at the kind; none searches ahead for a ':'
  std::string text;
  for (int i = 0; i < 200000; ++i) {
    text += "[BEGIN exp ";
  }
  text += "[END sk:1]:";

  auto markers = scanMarkers(text);
  ASSERT_EQ(markers.size(), 1u);
  EXPECT_EQ(markers[0].regionId(), "sk:1");
  EXPECT_EQ(markers[0].offset, text.size() - 11);
}
