#ifndef REGION_TYPES_HPP
#define REGION_TYPES_HPP

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace regions {

/**
 * @brief Axis-aligned rectangle in document points
 *
 * Origin is the top-left corner of the page, y grows downward. This is the
 * convention of Poppler's text list and of the rendered page images, and it
 * is used unchanged for resolution, overlay, hit testing and export.
 */
struct Rect {
  double x0 = 0.0; ///< Left edge
  double y0 = 0.0; ///< Top edge
  double x1 = 0.0; ///< Right edge
  double y1 = 0.0; ///< Bottom edge

  double width() const { return x1 - x0; }
  double height() const { return y1 - y0; }

  bool operator==(const Rect &other) const {
    return x0 == other.x0 && y0 == other.y0 && x1 == other.x1 &&
           y1 == other.y1;
  }
  bool operator!=(const Rect &other) const { return !(*this == other); }
};

/**
 * @brief A point in either document or display space
 */
struct Point {
  double x = 0.0;
  double y = 0.0;
};

/**
 * @brief Width and height of a page in document points
 */
struct PageSize {
  double width = 0.0;
  double height = 0.0;
};

/// Smallest rectangle containing both @p a and @p b.
Rect unite(const Rect &a, const Rect &b);

/// True if @p p lies inside @p r, edges included.
bool contains(const Rect &r, const Point &p);

/// True if @p inner lies completely inside @p outer, edges included.
bool contains(const Rect &outer, const Rect &inner);

/**
 * @brief One unit of extracted text on a page
 */
struct Fragment {
  int pageIndex = 0; ///< 0-based page index
  Rect rect;         ///< Bounding rectangle in document points
  std::string text;  ///< Raw extracted text, markers included
};

/**
 * @brief The fixed set of marked section kinds
 */
enum class MarkerKind {
  Experience, ///< "exp"
  Project,    ///< "pr"
  Skill       ///< "sk"
};

/// Wire code of a kind ("exp", "pr" or "sk").
const char *kindCode(MarkerKind kind);

/**
 * @brief Parse a wire code into a kind
 * @return true and sets @p kind if @p code is one of "exp", "pr", "sk"
 */
bool parseKind(const std::string &code, MarkerKind &kind);

/// Region id "{kind}:{ordinal}".
std::string makeRegionId(MarkerKind kind, int ordinal);

/**
 * @brief A resolved marked region
 */
struct Region {
  std::string id;    ///< "{kind}:{ordinal}", unique per document
  int pageIndex = 0; ///< 0-based page index
  Rect rect;         ///< Union of every fragment spanned by the region
  std::string text;  ///< Spanned text with markers removed and trimmed
  MarkerKind kind = MarkerKind::Experience;
  int ordinal = 0;
};

/**
 * @brief Insertion-ordered map from region id to Region
 *
 * Holds the regions of one loaded document. Ids are unique: inserting an id
 * that is already present is refused and the first region is kept.
 */
class RegionMap {
public:
  using const_iterator = std::vector<Region>::const_iterator;

  /**
   * @brief Add a region
   * @return false if a region with the same id is already present
   */
  bool insert(Region region);

  /// Region with the given id, or nullptr.
  const Region *find(const std::string &id) const;

  bool contains(const std::string &id) const;

  /// Regions on @p pageIndex in iteration order.
  std::vector<const Region *> onPage(int pageIndex) const;

  void clear();

  size_t size() const { return m_regions.size(); }
  bool empty() const { return m_regions.empty(); }

  const_iterator begin() const { return m_regions.begin(); }
  const_iterator end() const { return m_regions.end(); }

private:
  std::vector<Region> m_regions;
  std::unordered_map<std::string, size_t> m_index;
};

} // namespace regions

#endif // REGION_TYPES_HPP
