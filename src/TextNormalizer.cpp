#include "TextNormalizer.hpp"

#include "MarkerScanner.hpp"

#include <cctype>
#include <vector>

namespace regions {

std::string trimWhitespace(const std::string &text) {
  size_t start = 0;
  size_t end = text.size();
  while (start < end &&
         std::isspace(static_cast<unsigned char>(text[start]))) {
    start++;
  }
  while (end > start &&
         std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    end--;
  }
  return text.substr(start, end - start);
}

std::string normalizeMarkedText(const std::string &text) {
  std::string current = text;

  // Removing a token can splice its neighbours into a new one
  // ("[BEGIN [END exp:1]exp:2]"), so strip until nothing matches.
  std::vector<Marker> markers = scanMarkers(current);
  while (!markers.empty()) {
    std::string stripped;
    stripped.reserve(current.size());
    size_t pos = 0;
    for (const auto &marker : markers) {
      stripped.append(current, pos, marker.offset - pos);
      pos = marker.offset + marker.length;
    }
    stripped.append(current, pos, std::string::npos);

    current.swap(stripped);
    markers = scanMarkers(current);
  }

  return trimWhitespace(current);
}

} // namespace regions
