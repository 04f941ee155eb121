#include <graphrag/search/text_similarity.h>

#include <algorithm>
#include <cctype>

namespace graphrag::search {

namespace {
constexpr std::string_view kTrimChars = ".,!?;:\"'()[]{}";
} // namespace

std::vector<std::string> extractWords(std::string_view text) {
    std::vector<std::string> words;
    std::size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        const std::size_t start = i;
        while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        std::string_view raw = text.substr(start, i - start);

        const auto first = raw.find_first_not_of(kTrimChars);
        if (first == std::string_view::npos) {
            continue;
        }
        raw = raw.substr(first, raw.find_last_not_of(kTrimChars) - first + 1);
        if (raw.empty()) {
            continue;
        }

        std::string word(raw);
        std::transform(word.begin(), word.end(), word.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        words.push_back(std::move(word));
    }
    return words;
}

TokenSet makeTokenSet(std::string_view text) {
    auto words = extractWords(text);
    std::sort(words.begin(), words.end());
    words.erase(std::unique(words.begin(), words.end()), words.end());
    return words;
}

double jaccard(const TokenSet& a, const TokenSet& b) {
    if (a.empty() || b.empty()) {
        return 0.0;
    }
    std::size_t inter = 0;
    auto ia = a.begin();
    auto ib = b.begin();
    while (ia != a.end() && ib != b.end()) {
        if (*ia < *ib) {
            ++ia;
        } else if (*ib < *ia) {
            ++ib;
        } else {
            ++inter;
            ++ia;
            ++ib;
        }
    }
    const std::size_t uni = a.size() + b.size() - inter;
    return static_cast<double>(inter) / static_cast<double>(uni);
}

} // namespace graphrag::search
