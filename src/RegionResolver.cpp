#include "RegionResolver.hpp"

#include "DocumentBackend.hpp"
#include "MarkerScanner.hpp"
#include "TextNormalizer.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <set>
#include <string>
#include <utility>

namespace regions {

namespace {

// A region whose BEGIN has been seen but not its END
struct OpenRegion {
  MarkerKind kind;
  int ordinal;
  int beginFragment;
  size_t beginOffset;
  Rect rect;
  std::string text;
};

// A resolved region and where its BEGIN marker sits on the page
struct Candidate {
  int beginFragment;
  size_t beginOffset;
  Region region;
};

Region makeRegion(MarkerKind kind, int ordinal, int pageIndex, const Rect &rect,
                  const std::string &rawText) {
  Region region;
  region.id = makeRegionId(kind, ordinal);
  region.pageIndex = pageIndex;
  region.rect = rect;
  region.text = normalizeMarkedText(rawText);
  region.kind = kind;
  region.ordinal = ordinal;
  return region;
}

} // namespace

ResolveStats &ResolveStats::operator+=(const ResolveStats &other) {
  resolved += other.resolved;
  unterminatedBegins += other.unterminatedBegins;
  orphanEnds += other.orphanEnds;
  duplicateBegins += other.duplicateBegins;
  duplicateIds += other.duplicateIds;
  outsidePage += other.outsidePage;
  return *this;
}

PageResolution resolvePage(const std::vector<Fragment> &fragments,
                           bool verbose) {
  PageResolution result;
  std::map<std::string, OpenRegion> open;
  std::vector<Candidate> candidates;

  for (size_t i = 0; i < fragments.size(); i++) {
    const Fragment &fragment = fragments[i];
    std::vector<Marker> markers =
        scanMarkers(fragment.text, static_cast<int>(i));
    if (markers.empty() && open.empty()) {
      continue;
    }

    // BEGIN markers in order of appearance (one per key), END keys as a set
    std::vector<Marker> begins;
    std::set<std::string> beginIds;
    std::set<std::string> endIds;
    for (const auto &marker : markers) {
      std::string id = marker.regionId();
      if (marker.boundary == MarkerBoundary::Begin) {
        if (beginIds.insert(id).second) {
          begins.push_back(marker);
        }
      } else {
        endIds.insert(id);
      }
    }

    // Regions opened earlier absorb this fragment; close those ending here
    std::set<std::string> closedHere;
    for (auto it = open.begin(); it != open.end();) {
      OpenRegion &entry = it->second;
      entry.rect = unite(entry.rect, fragment.rect);
      entry.text += "\n";
      entry.text += fragment.text;

      if (endIds.count(it->first) != 0) {
        if (verbose) {
          std::cerr << "DEBUG: " << it->first << " spans fragments "
                    << entry.beginFragment << ".." << i << std::endl;
        }
        candidates.push_back(Candidate{
            entry.beginFragment, entry.beginOffset,
            makeRegion(entry.kind, entry.ordinal, fragment.pageIndex,
                       entry.rect, entry.text)});
        closedHere.insert(it->first);
        it = open.erase(it);
      } else {
        ++it;
      }
    }

    // Same-fragment pairs resolve to this fragment alone
    for (const auto &marker : begins) {
      if (endIds.count(marker.regionId()) != 0) {
        candidates.push_back(Candidate{
            marker.fragmentIndex, marker.offset,
            makeRegion(marker.kind, marker.ordinal, fragment.pageIndex,
                       fragment.rect, fragment.text)});
      }
    }

    for (const auto &marker : markers) {
      if (marker.boundary != MarkerBoundary::End) {
        continue;
      }
      std::string id = marker.regionId();
      if (closedHere.count(id) == 0 && beginIds.count(id) == 0) {
        if (verbose) {
          std::cerr << "DEBUG: Ignoring END " << id << " without BEGIN in "
                    << "fragment " << marker.fragmentIndex << std::endl;
        }
        result.stats.orphanEnds++;
        // Count each orphan key once per fragment
        closedHere.insert(id);
      }
    }

    // Remaining BEGINs open a cross-fragment region
    for (const auto &marker : begins) {
      std::string id = marker.regionId();
      if (endIds.count(id) != 0) {
        continue;
      }
      if (open.count(id) != 0) {
        std::cerr << "WARNING: Duplicate BEGIN " << id << " on page "
                  << (fragment.pageIndex + 1) << " in fragment "
                  << marker.fragmentIndex
                  << " while it is still open, keeping the first one"
                  << std::endl;
        result.stats.duplicateBegins++;
        continue;
      }
      open.emplace(id, OpenRegion{marker.kind, marker.ordinal,
                                  marker.fragmentIndex, marker.offset,
                                  fragment.rect, fragment.text});
    }
  }

  for (const auto &entry : open) {
    if (verbose) {
      std::cerr << "DEBUG: Dropping unterminated BEGIN " << entry.first
                << " from fragment " << entry.second.beginFragment
                << std::endl;
    }
    result.stats.unterminatedBegins++;
  }

  // Regions come out in the order of their BEGIN markers
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const Candidate &a, const Candidate &b) {
                     if (a.beginFragment != b.beginFragment) {
                       return a.beginFragment < b.beginFragment;
                     }
                     return a.beginOffset < b.beginOffset;
                   });

  std::set<std::string> emitted;
  for (auto &candidate : candidates) {
    Region &region = candidate.region;
    if (!emitted.insert(region.id).second) {
      std::cerr << "WARNING: Region " << region.id << " resolved again on page "
                << (region.pageIndex + 1) << ", keeping the first one"
                << std::endl;
      result.stats.duplicateIds++;
      continue;
    }
    if (verbose) {
      std::cerr << "DEBUG: Resolved " << region.id << " on page "
                << (region.pageIndex + 1) << " from fragment "
                << candidate.beginFragment << std::endl;
    }
    result.stats.resolved++;
    result.regions.push_back(std::move(region));
  }

  return result;
}

ResolveStats resolveDocument(const DocumentBackend &backend, RegionMap &out,
                             bool verbose) {
  out.clear();
  ResolveStats total;

  int pageCount = backend.pageCount();
  for (int pageIndex = 0; pageIndex < pageCount; pageIndex++) {
    std::vector<Fragment> fragments = backend.fragments(pageIndex);
    if (verbose) {
      std::cerr << "DEBUG: Page " << (pageIndex + 1) << " has "
                << fragments.size() << " fragments" << std::endl;
    }

    PageResolution page = resolvePage(fragments, verbose);
    total += page.stats;

    PageSize size = backend.pageSize(pageIndex);
    Rect pageRect{0.0, 0.0, size.width, size.height};
    bool checkBounds = size.width > 0 && size.height > 0;

    for (auto &region : page.regions) {
      std::string id = region.id;
      if (checkBounds && !contains(pageRect, region.rect)) {
        std::cerr << "WARNING: Region " << id << " extends past page "
                  << (pageIndex + 1) << std::endl;
        total.outsidePage++;
      }
      if (!out.insert(std::move(region))) {
        std::cerr << "WARNING: Region " << id << " on page "
                  << (pageIndex + 1)
                  << " already resolved on an earlier page, keeping the "
                     "first one"
                  << std::endl;
        total.resolved--;
        total.duplicateIds++;
      }
    }
  }

  return total;
}

} // namespace regions
