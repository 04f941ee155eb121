#include <graphrag/extraction/entity_extractor.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace graphrag::extraction {

namespace {

bool isWordChar(unsigned char c) {
    return std::isalnum(c) != 0 || c == '_' || c == '-';
}

float clamp01(float v) {
    if (v < 0.0f)
        return 0.0f;
    if (v > 1.0f)
        return 1.0f;
    return v;
}

Result<void> checkEntry(const AliasEntry& entry) {
    if (entry.alias.empty() || entry.entityId.empty()) {
        return Error{ErrorCode::InvalidArgument, "alias and entityId must be non-empty"};
    }
    if (entry.prior < 0.0f || entry.prior > 1.0f) {
        return Error{ErrorCode::InvalidArgument, "prior must be within [0,1]"};
    }
    return {};
}

} // namespace

std::string AliasEntityExtractor::normalize(std::string_view s) {
    auto l = s.begin();
    auto r = s.end();
    while (l < r && !std::isalnum(static_cast<unsigned char>(*l)))
        ++l;
    while (r > l && !std::isalnum(static_cast<unsigned char>(*(r - 1))))
        --r;
    std::string out(l, r);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string AliasEntityExtractor::foldPlural(const std::string& s) {
    if (s.size() > 3 && s.compare(s.size() - 3, 3, "ies") == 0) {
        return s.substr(0, s.size() - 3) + "y";
    }
    // "ss" endings ("class", "process") are not plurals
    if (s.size() > 1 && s.back() == 's' && s[s.size() - 2] != 's') {
        return s.substr(0, s.size() - 1);
    }
    return s;
}

Result<void> AliasEntityExtractor::addAlias(const AliasEntry& entry) {
    if (auto ok = checkEntry(entry); !ok) {
        return ok;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    aliases_[normalize(entry.alias)].push_back(
        Target{entry.entityId, entry.type, clamp01(entry.prior)});
    return {};
}

Result<void> AliasEntityExtractor::addAliases(const std::vector<AliasEntry>& entries) {
    for (const auto& e : entries) {
        if (auto ok = checkEntry(e); !ok) {
            return ok;
        }
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& e : entries) {
        aliases_[normalize(e.alias)].push_back(Target{e.entityId, e.type, clamp01(e.prior)});
    }
    return {};
}

void AliasEntityExtractor::clearAliases() {
    std::lock_guard<std::mutex> lock(mutex_);
    aliases_.clear();
}

std::size_t AliasEntityExtractor::aliasCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return aliases_.size();
}

std::vector<AliasEntityExtractor::Token>
AliasEntityExtractor::tokenize(const std::string& text) const {
    std::vector<Token> tokens;
    std::size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && !isWordChar(static_cast<unsigned char>(text[i]))) {
            ++i;
        }
        if (i >= text.size())
            break;
        const std::size_t start = i;
        std::string tok;
        while (i < text.size() && isWordChar(static_cast<unsigned char>(text[i]))) {
            tok.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(text[i++]))));
        }
        if (config_.stopwords.count(tok) > 0) {
            continue;
        }
        tokens.push_back({std::move(tok), start, i});
    }
    return tokens;
}

std::optional<AliasEntityExtractor::Target>
AliasEntityExtractor::lookupBest(const std::string& normAlias) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = aliases_.find(normAlias);
    if (it == aliases_.end() && config_.foldPlurals) {
        it = aliases_.find(foldPlural(normAlias));
    }
    if (it == aliases_.end() || it->second.empty())
        return std::nullopt;

    // First registered target wins among equal priors
    const auto& targets = it->second;
    const Target* best = &targets.front();
    for (const auto& t : targets) {
        if (t.prior > best->prior) {
            best = &t;
        }
    }
    return *best;
}

Result<std::vector<Entity>> AliasEntityExtractor::extract(const std::string& text) const {
    if (!config_.isValid()) {
        return Error{ErrorCode::InvalidArgument, "Invalid AliasExtractorConfig"};
    }
    auto tokens = tokenize(text);
    std::vector<Entity> found;
    if (tokens.empty())
        return found;

    std::vector<bool> used(tokens.size(), false);
    const std::size_t maxN = std::min(config_.maxNgram, tokens.size());

    for (std::size_t n = maxN; n >= 1; --n) {
        for (std::size_t i = 0; i + n <= tokens.size(); ++i) {
            if (std::any_of(used.begin() + static_cast<std::ptrdiff_t>(i),
                            used.begin() + static_cast<std::ptrdiff_t>(i + n),
                            [](bool u) { return u; })) {
                continue;
            }

            std::string phrase;
            for (std::size_t j = 0; j < n; ++j) {
                if (j)
                    phrase.push_back(' ');
                phrase.append(tokens[i + j].text);
            }

            auto match = lookupBest(normalize(phrase));
            if (!match) {
                continue;
            }

            // Longer phrases are slightly more trustworthy
            const float conf = clamp01(match->prior + 0.03f * static_cast<float>(n - 1));
            if (conf < config_.minConfidence) {
                continue;
            }

            found.push_back(Entity{match->entityId, phrase, match->type, conf, tokens[i].start});
            std::fill(used.begin() + static_cast<std::ptrdiff_t>(i),
                      used.begin() + static_cast<std::ptrdiff_t>(i + n), true);
        }
        if (n == 1)
            break;
    }

    std::stable_sort(found.begin(), found.end(),
                     [](const Entity& a, const Entity& b) { return a.start < b.start; });

    std::vector<Entity> out;
    std::unordered_set<std::string> seen;
    for (auto& e : found) {
        if (seen.insert(e.id).second) {
            out.push_back(std::move(e));
        }
    }
    spdlog::debug("AliasEntityExtractor: {} entities from {} tokens", out.size(), tokens.size());
    return out;
}

} // namespace graphrag::extraction
