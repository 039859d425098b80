#pragma once

#include <string>
#include <string_view>
#include <unordered_set>

namespace kreuzberg::processing {

/**
 * @brief Stop words for a language given as ISO 639-1 or 639-3 code
 *
 * Lookups are lowercase. Unknown languages fall back to English.
 */
const std::unordered_set<std::string>& stopWords(std::string_view language);

bool isStopWord(std::string_view lowercaseWord, std::string_view language);

} // namespace kreuzberg::processing
