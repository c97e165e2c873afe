#ifndef REGION_RESOLVER_HPP
#define REGION_RESOLVER_HPP

#include "RegionTypes.hpp"

#include <vector>

namespace regions {

class DocumentBackend;

/**
 * @brief Counters collected while pairing markers
 */
struct ResolveStats {
  int resolved = 0;           ///< Regions produced
  int unterminatedBegins = 0; ///< BEGINs still open at the end of their page
  int orphanEnds = 0;         ///< ENDs with no open BEGIN
  int duplicateBegins = 0;    ///< BEGINs for a key that was already open
  int duplicateIds = 0;       ///< Regions dropped because the id existed
  int outsidePage = 0;        ///< Regions not inside their page's bounds

  ResolveStats &operator+=(const ResolveStats &other);
};

/**
 * @brief Regions resolved on one page
 */
struct PageResolution {
  std::vector<Region> regions; ///< In order of resolution
  ResolveStats stats;
};

/**
 * @brief Pair BEGIN/END markers across the ordered fragments of one page
 *
 * Fragments are visited once, in order, with an explicit table of open
 * regions keyed by (kind, ordinal):
 * - regions opened on an earlier fragment absorb each following fragment
 *   (rectangle union, text appended) and resolve at the fragment holding
 *   their END;
 * - a key with both BEGIN and END in the same fragment resolves to exactly
 *   that fragment;
 * - every other BEGIN opens a table entry seeded with its fragment.
 *
 * Regions are returned in the order of their BEGIN markers (fragment,
 * then position in the fragment). A BEGIN for a key that is already open is
 * rejected (the first one is kept). An END without an open BEGIN is ignored. Entries still open when
 * the page ends are dropped.
 *
 * @param fragments Fragments of a single page in extraction order
 * @param verbose Log each pairing decision to std::cerr
 */
PageResolution resolvePage(const std::vector<Fragment> &fragments,
                           bool verbose = false);

/**
 * @brief Resolve every page of a document into @p out
 *
 * @p out is cleared first. When two pages resolve the same id the first one
 * wins and the later region is dropped with a warning. Regions reaching
 * past their page's bounds are kept and counted in outsidePage.
 */
ResolveStats resolveDocument(const DocumentBackend &backend, RegionMap &out,
                             bool verbose = false);

} // namespace regions

#endif // REGION_RESOLVER_HPP
