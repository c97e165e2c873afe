#ifndef REGION_TEXT_NORMALIZER_HPP
#define REGION_TEXT_NORMALIZER_HPP

#include <string>

namespace regions {

/// Copy of @p text without leading and trailing whitespace.
std::string trimWhitespace(const std::string &text);

/**
 * @brief Remove every marker token from @p text and trim the result
 *
 * Uses the same grammar as scanMarkers(), so malformed tokens survive as
 * literal text. Non-marker text is copied unchanged; applying the function
 * twice gives the same result as applying it once.
 */
std::string normalizeMarkedText(const std::string &text);

} // namespace regions

#endif // REGION_TEXT_NORMALIZER_HPP
