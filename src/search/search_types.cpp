#include <graphrag/search/search_types.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace graphrag::search {

namespace {

std::string lowerCopy(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool inUnitRange(double v) {
    return v >= 0.0 && v <= 1.0;
}

bool validMinScore(double v) {
    return std::isfinite(v) && v >= 0.0;
}

bool validRrfConstant(double v) {
    return std::isfinite(v) && v > 0.0;
}

} // namespace

const char* toString(SearchMode mode) {
    switch (mode) {
        case SearchMode::Hybrid:
            return "hybrid";
        case SearchMode::Vector:
            return "vector";
        case SearchMode::Graph:
            return "graph";
    }
    return "hybrid";
}

const char* toString(FusionStrategy strategy) {
    switch (strategy) {
        case FusionStrategy::Weighted:
            return "weighted";
        case FusionStrategy::RRF:
            return "rrf";
        case FusionStrategy::Max:
            return "max";
        case FusionStrategy::Min:
            return "min";
    }
    return "weighted";
}

const char* toString(RerankStrategy strategy) {
    switch (strategy) {
        case RerankStrategy::Score:
            return "score";
        case RerankStrategy::Diversity:
            return "diversity";
        case RerankStrategy::MMR:
            return "mmr";
    }
    return "score";
}

Result<SearchMode> parseSearchMode(std::string_view name) {
    const auto s = lowerCopy(name);
    if (s == "hybrid")
        return SearchMode::Hybrid;
    if (s == "vector")
        return SearchMode::Vector;
    if (s == "graph")
        return SearchMode::Graph;
    return Error{ErrorCode::InvalidArgument, "Unknown search mode: " + std::string(name)};
}

Result<FusionStrategy> parseFusionStrategy(std::string_view name) {
    const auto s = lowerCopy(name);
    if (s == "weighted")
        return FusionStrategy::Weighted;
    if (s == "rrf")
        return FusionStrategy::RRF;
    if (s == "max")
        return FusionStrategy::Max;
    if (s == "min")
        return FusionStrategy::Min;
    return Error{ErrorCode::InvalidArgument, "Unknown fusion strategy: " + std::string(name)};
}

Result<RerankStrategy> parseRerankStrategy(std::string_view name) {
    const auto s = lowerCopy(name);
    if (s == "score")
        return RerankStrategy::Score;
    if (s == "diversity")
        return RerankStrategy::Diversity;
    if (s == "mmr")
        return RerankStrategy::MMR;
    return Error{ErrorCode::InvalidArgument, "Unknown rerank strategy: " + std::string(name)};
}

Result<void> RetrieverConfig::validate() const {
    if (!inUnitRange(vectorWeight)) {
        return Error{ErrorCode::ValidationError, "vector weight must be within [0,1]"};
    }
    if (!inUnitRange(graphWeight)) {
        return Error{ErrorCode::ValidationError, "graph weight must be within [0,1]"};
    }
    if (maxTraverseDepth < 1) {
        return Error{ErrorCode::ValidationError, "max traverse depth must be >= 1"};
    }
    if (topK < 1) {
        return Error{ErrorCode::ValidationError, "top k must be >= 1"};
    }
    if (!inUnitRange(mmrLambda)) {
        return Error{ErrorCode::ValidationError, "mmr lambda must be within [0,1]"};
    }
    if (!validRrfConstant(rrfConstant)) {
        return Error{ErrorCode::ValidationError, "rrf constant must be a finite value > 0"};
    }
    if (!validMinScore(minScore)) {
        return Error{ErrorCode::ValidationError, "min score must be a finite value >= 0"};
    }
    return {};
}

ResolvedSearchOptions RetrieverConfig::defaults() const {
    ResolvedSearchOptions opts;
    opts.mode = mode;
    opts.k = topK;
    opts.vectorWeight = vectorWeight;
    opts.graphWeight = graphWeight;
    opts.maxTraverseDepth = maxTraverseDepth;
    opts.fusionStrategy = fusionStrategy;
    opts.rerankStrategy = rerankStrategy;
    opts.enableContextAugmentation = enableContextAugmentation;
    opts.minScore = minScore;
    opts.mmrLambda = mmrLambda;
    opts.rrfConstant = rrfConstant;
    return opts;
}

Result<ResolvedSearchOptions> resolveOptions(const ResolvedSearchOptions& defaults,
                                             const SearchOptions& overrides) {
    ResolvedSearchOptions out = defaults;

    if (overrides.mode)
        out.mode = *overrides.mode;
    if (overrides.k) {
        if (*overrides.k < 1) {
            return Error{ErrorCode::InvalidArgument, "k must be >= 1"};
        }
        out.k = *overrides.k;
    }
    if (overrides.vectorWeight) {
        if (!inUnitRange(*overrides.vectorWeight)) {
            return Error{ErrorCode::InvalidArgument, "vector weight must be within [0,1]"};
        }
        out.vectorWeight = *overrides.vectorWeight;
    }
    if (overrides.graphWeight) {
        if (!inUnitRange(*overrides.graphWeight)) {
            return Error{ErrorCode::InvalidArgument, "graph weight must be within [0,1]"};
        }
        out.graphWeight = *overrides.graphWeight;
    }
    if (overrides.maxTraverseDepth) {
        if (*overrides.maxTraverseDepth < 1) {
            return Error{ErrorCode::InvalidArgument, "max traverse depth must be >= 1"};
        }
        out.maxTraverseDepth = *overrides.maxTraverseDepth;
    }
    if (overrides.fusionStrategy)
        out.fusionStrategy = *overrides.fusionStrategy;
    if (overrides.rerankStrategy)
        out.rerankStrategy = *overrides.rerankStrategy;
    if (overrides.enableContextAugmentation)
        out.enableContextAugmentation = *overrides.enableContextAugmentation;
    if (overrides.minScore) {
        if (!validMinScore(*overrides.minScore)) {
            return Error{ErrorCode::InvalidArgument, "min score must be a finite value >= 0"};
        }
        out.minScore = *overrides.minScore;
    }
    if (overrides.mmrLambda) {
        if (!inUnitRange(*overrides.mmrLambda)) {
            return Error{ErrorCode::InvalidArgument, "mmr lambda must be within [0,1]"};
        }
        out.mmrLambda = *overrides.mmrLambda;
    }
    if (overrides.rrfConstant) {
        if (!validRrfConstant(*overrides.rrfConstant)) {
            return Error{ErrorCode::InvalidArgument, "rrf constant must be a finite value > 0"};
        }
        out.rrfConstant = *overrides.rrfConstant;
    }
    return out;
}

} // namespace graphrag::search
