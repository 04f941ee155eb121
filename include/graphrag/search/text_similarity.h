#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace graphrag::search {

// Sorted, de-duplicated word set of a text
using TokenSet = std::vector<std::string>;

// Lowercase whitespace tokens with surrounding .,!?;:"'()[]{} stripped; empty tokens dropped
std::vector<std::string> extractWords(std::string_view text);

TokenSet makeTokenSet(std::string_view text);

// |A ∩ B| / |A ∪ B|; 0 when either set is empty
double jaccard(const TokenSet& a, const TokenSet& b);

inline double textSimilarity(std::string_view a, std::string_view b) {
    return jaccard(makeTokenSet(a), makeTokenSet(b));
}

} // namespace graphrag::search
