#ifndef REGION_MARKER_SCANNER_HPP
#define REGION_MARKER_SCANNER_HPP

#include "RegionTypes.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace regions {

/**
 * @brief Whether a marker opens or closes a region
 */
enum class MarkerBoundary {
  Begin, ///< [BEGIN kind:ordinal]
  End    ///< [END kind:ordinal]
};

/**
 * @brief A BEGIN or END token recognized inside fragment text
 *
 * Tagged by @ref boundary; kind and ordinal identify the logical region the
 * token belongs to.
 */
struct Marker {
  MarkerBoundary boundary = MarkerBoundary::Begin;
  MarkerKind kind = MarkerKind::Experience;
  int ordinal = 0;
  size_t offset = 0;         ///< Byte offset of '[' in the scanned text
  size_t length = 0;         ///< Byte length of the whole token
  int fragmentIndex = -1;    ///< Fragment the token was found in, if known

  std::string regionId() const { return makeRegionId(kind, ordinal); }
};

/**
 * @brief Find every marker token in @p text
 *
 * Recognizes exactly `[BEGIN <kind>:<ordinal>]` and `[END <kind>:<ordinal>]`
 * where kind is one of exp, pr, sk and ordinal is a non-negative decimal
 * literal that fits in an int. One or more whitespace characters separate
 * the keyword from the kind. Anything else, including negative or
 * non-numeric ordinals, is left alone as ordinary text.
 *
 * @param text Text to scan
 * @param fragmentIndex Stored in every returned marker
 * @return Markers in order of appearance
 */
std::vector<Marker> scanMarkers(const std::string &text,
                                int fragmentIndex = -1);

/**
 * @brief Try to read one marker token starting at @p pos
 * @return Token length, or 0 if no marker starts at @p pos
 */
size_t matchMarkerAt(const std::string &text, size_t pos, Marker &marker);

} // namespace regions

#endif // REGION_MARKER_SCANNER_HPP
