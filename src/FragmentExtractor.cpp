#include "FragmentExtractor.hpp"

#include "TextNormalizer.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace regions {

namespace {

struct Line {
  Rect rect;
  std::string text;
};

double centerY(const Rect &r) { return (r.y0 + r.y1) / 2.0; }

bool continuesLine(const Line &line, const WordBox &prev, const WordBox &word,
                   const ExtractionConfig &config) {
  double lineHeight = std::max(line.rect.height(), word.rect.height());
  if (lineHeight <= 0) {
    lineHeight = 1.0;
  }

  double yDiff = std::fabs(centerY(line.rect) - centerY(word.rect));
  if (yDiff > config.lineTolerance * lineHeight) {
    return false;
  }

  // Moving back to the left means a new line (or a new column)
  double gap = word.rect.x0 - prev.rect.x1;
  return gap >= -0.5 * lineHeight && gap <= config.wordGapFactor * lineHeight;
}

bool continuesBlock(const Line &last, const Rect &block, const Line &line,
                    const ExtractionConfig &config) {
  double lineHeight = last.rect.height();
  if (lineHeight <= 0) {
    lineHeight = 1.0;
  }

  double gap = line.rect.y0 - last.rect.y1;
  if (gap < -0.5 * lineHeight || gap > config.blockGapFactor * lineHeight) {
    return false;
  }

  return line.rect.x0 <= block.x1 && line.rect.x1 >= block.x0;
}

std::vector<Line> groupLines(const std::vector<WordBox> &words,
                             const ExtractionConfig &config) {
  std::vector<Line> lines;
  const WordBox *prev = nullptr;

  for (const auto &word : words) {
    if (word.text.empty()) {
      continue;
    }

    if (prev != nullptr && !lines.empty() &&
        continuesLine(lines.back(), *prev, word, config)) {
      Line &line = lines.back();
      line.rect = unite(line.rect, word.rect);
      if (prev->hasSpaceAfter) {
        line.text += " ";
      }
      line.text += word.text;
    } else {
      lines.push_back(Line{word.rect, word.text});
    }
    prev = &word;
  }

  return lines;
}

void appendFragment(std::vector<Fragment> &out, int pageIndex, const Rect &rect,
                    const std::string &text) {
  std::string trimmed = trimWhitespace(text);
  if (trimmed.empty()) {
    return;
  }
  out.push_back(Fragment{pageIndex, rect, std::move(trimmed)});
}

} // namespace

const char *extractionLevelName(ExtractionLevel level) {
  switch (level) {
  case ExtractionLevel::Word:
    return "word";
  case ExtractionLevel::Line:
    return "line";
  case ExtractionLevel::Block:
    return "block";
  }
  return "block";
}

bool parseExtractionLevel(const std::string &name, ExtractionLevel &level) {
  if (name == "word") {
    level = ExtractionLevel::Word;
  } else if (name == "line") {
    level = ExtractionLevel::Line;
  } else if (name == "block") {
    level = ExtractionLevel::Block;
  } else {
    return false;
  }
  return true;
}

std::vector<Fragment> groupWords(const std::vector<WordBox> &words,
                                 int pageIndex,
                                 const ExtractionConfig &config) {
  std::vector<Fragment> fragments;

  if (config.level == ExtractionLevel::Word) {
    for (const auto &word : words) {
      appendFragment(fragments, pageIndex, word.rect, word.text);
    }
    return fragments;
  }

  std::vector<Line> lines = groupLines(words, config);

  if (config.level == ExtractionLevel::Line) {
    for (const auto &line : lines) {
      appendFragment(fragments, pageIndex, line.rect, line.text);
    }
    return fragments;
  }

  size_t i = 0;
  while (i < lines.size()) {
    Rect blockRect = lines[i].rect;
    std::string blockText = lines[i].text;

    size_t j = i + 1;
    while (j < lines.size() &&
           continuesBlock(lines[j - 1], blockRect, lines[j], config)) {
      blockRect = unite(blockRect, lines[j].rect);
      blockText += "\n";
      blockText += lines[j].text;
      j++;
    }

    appendFragment(fragments, pageIndex, blockRect, blockText);
    i = j;
  }

  return fragments;
}

} // namespace regions
