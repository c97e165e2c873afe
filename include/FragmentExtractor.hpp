#ifndef REGION_FRAGMENT_EXTRACTOR_HPP
#define REGION_FRAGMENT_EXTRACTOR_HPP

#include "RegionTypes.hpp"

#include <string>
#include <vector>

namespace regions {

/**
 * @brief How far words are grouped before they become fragments
 */
enum class ExtractionLevel {
  Word,  ///< One fragment per word reported by the backend
  Line,  ///< Words on the same baseline joined with spaces
  Block  ///< Consecutive close lines joined with newlines (default)
};

/// "word", "line" or "block".
const char *extractionLevelName(ExtractionLevel level);

/**
 * @brief Parse an extraction level name
 * @return true and sets @p level if @p name is a known level
 */
bool parseExtractionLevel(const std::string &name, ExtractionLevel &level);

/**
 * @brief Configuration for fragment extraction
 *
 * Tolerances are fractions of the current line height.
 */
struct ExtractionConfig {
  ExtractionLevel level = ExtractionLevel::Block;
  double lineTolerance = 0.5;  ///< Max vertical centre offset within a line
  double wordGapFactor = 2.0;  ///< Max horizontal gap between words of a line
  double blockGapFactor = 0.6; ///< Max vertical gap between lines of a block
};

/**
 * @brief A word as reported by the document backend
 */
struct WordBox {
  Rect rect;                 ///< Top-left origin, document points
  std::string text;          ///< UTF-8 text
  bool hasSpaceAfter = true; ///< Backend saw a space after this word
};

/**
 * @brief Group the words of a page into fragments
 *
 * Words are consumed in extraction order and only ever joined with their
 * neighbours in that order, so the fragment order follows the backend's
 * reading order. Each fragment's rectangle is the union of its words and
 * its text is trimmed; fragments whose text is empty after trimming are
 * dropped.
 *
 * @param words Words of one page in extraction order
 * @param pageIndex Stored in every fragment
 * @param config Grouping level and tolerances
 */
std::vector<Fragment> groupWords(const std::vector<WordBox> &words,
                                 int pageIndex,
                                 const ExtractionConfig &config);

} // namespace regions

#endif // REGION_FRAGMENT_EXTRACTOR_HPP
