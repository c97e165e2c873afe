#include "MarkerScanner.hpp"

#include <cctype>
#include <climits>
#include <cstring>

namespace regions {

namespace {

bool startsWithAt(const std::string &text, size_t pos, const char *literal) {
  size_t n = std::strlen(literal);
  return pos + n <= text.size() && text.compare(pos, n, literal) == 0;
}

bool isSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool isDigit(char c) { return c >= '0' && c <= '9'; }

bool isLower(char c) { return c >= 'a' && c <= 'z'; }

constexpr size_t kMaxKindLength = 3;

} // namespace

size_t matchMarkerAt(const std::string &text, size_t pos, Marker &marker) {
  if (pos >= text.size() || text[pos] != '[') {
    return 0;
  }

  size_t cur = pos + 1;
  MarkerBoundary boundary;
  if (startsWithAt(text, cur, "BEGIN")) {
    boundary = MarkerBoundary::Begin;
    cur += 5;
  } else if (startsWithAt(text, cur, "END")) {
    boundary = MarkerBoundary::End;
    cur += 3;
  } else {
    return 0;
  }

  // At least one whitespace character between keyword and kind
  size_t spaceStart = cur;
  while (cur < text.size() && isSpace(text[cur])) {
    cur++;
  }
  if (cur == spaceStart) {
    return 0;
  }

  // Kind codes are at most three lowercase letters followed by ':'
  size_t kindStart = cur;
  while (cur < text.size() && cur - kindStart < kMaxKindLength &&
         isLower(text[cur])) {
    cur++;
  }
  if (cur >= text.size() || text[cur] != ':') {
    return 0;
  }
  MarkerKind kind;
  if (!parseKind(text.substr(kindStart, cur - kindStart), kind)) {
    return 0;
  }
  cur++;

  long long ordinal = 0;
  size_t digitStart = cur;
  while (cur < text.size() && isDigit(text[cur])) {
    ordinal = ordinal * 10 + (text[cur] - '0');
    if (ordinal > INT_MAX) {
      return 0;
    }
    cur++;
  }
  if (cur == digitStart) {
    return 0;
  }

  if (cur >= text.size() || text[cur] != ']') {
    return 0;
  }
  cur++;

  marker.boundary = boundary;
  marker.kind = kind;
  marker.ordinal = static_cast<int>(ordinal);
  marker.offset = pos;
  marker.length = cur - pos;
  return marker.length;
}

std::vector<Marker> scanMarkers(const std::string &text, int fragmentIndex) {
  std::vector<Marker> markers;

  size_t pos = text.find('[');
  while (pos != std::string::npos) {
    Marker marker;
    size_t len = matchMarkerAt(text, pos, marker);
    if (len > 0) {
      marker.fragmentIndex = fragmentIndex;
      markers.push_back(marker);
      pos = text.find('[', pos + len);
    } else {
      pos = text.find('[', pos + 1);
    }
  }

  return markers;
}

} // namespace regions
