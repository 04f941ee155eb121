// Catch2 tests for config file parsing, env overrides and retriever config loading

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <graphrag/config/config_loader.h>

#include "../../common/test_helpers_catch2.h"

#include <filesystem>
#include <memory>
#include <vector>

using namespace graphrag;
using namespace graphrag::config;
using graphrag::test::ScopedEnvVar;
using graphrag::test::TempDir;

namespace {

// Clears every variable the loader reads so the host environment cannot leak in
std::vector<std::unique_ptr<ScopedEnvVar>> isolateEnvironment(const std::filesystem::path& home) {
    std::vector<std::unique_ptr<ScopedEnvVar>> guards;
    for (const char* name :
         {"GRAPHRAG_CONFIG", "GRAPHRAG_VECTOR_WEIGHT", "GRAPHRAG_GRAPH_WEIGHT", "GRAPHRAG_TOP_K",
          "GRAPHRAG_MAX_DEPTH", "GRAPHRAG_FUSION", "GRAPHRAG_RERANK", "GRAPHRAG_MMR_LAMBDA",
          "GRAPHRAG_RRF_K", "GRAPHRAG_MIN_SCORE", "GRAPHRAG_CONTEXT"}) {
        guards.push_back(std::make_unique<ScopedEnvVar>(name, std::nullopt));
    }
    guards.push_back(std::make_unique<ScopedEnvVar>("XDG_CONFIG_HOME", home.string()));
    return guards;
}

} // namespace

TEST_CASE("parse_config_file: sections, dotted keys and comments", "[config][catch2]") {
    TempDir tmp;
    auto path = tmp.write("config.toml", R"(# top comment
name = "root value"

[retriever]
vector_weight = 0.7   # trailing comment
fusion = "rrf"
label = "has # inside"

[other]
retriever.top_k = 3
)");

    auto parsed = parse_config_file(path);
    REQUIRE(parsed);
    const auto& values = parsed.value();
    CHECK(values.at("name") == "root value");
    CHECK(values.at("retriever.vector_weight") == "0.7");
    CHECK(values.at("retriever.fusion") == "rrf");
    CHECK(values.at("retriever.label") == "has # inside");
    CHECK(values.at("retriever.top_k") == "3");

    CHECK(parse_config_value(path, "retriever", "fusion") == "rrf");
    CHECK(parse_config_value(path, "retriever", "missing").empty());

}

TEST_CASE("parse_config_file: missing file", "[config][catch2]") {
    auto r = parse_config_file("/nonexistent/graphrag/config.toml");
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::NotFound);
}

TEST_CASE("typed value parsing", "[config][catch2]") {
    CHECK(parse_double("w", " 0.25 ").value() == Catch::Approx(0.25));
    CHECK_FALSE(parse_double("w", "0.25x"));
    CHECK_FALSE(parse_double("w", ""));
    CHECK_FALSE(parse_double("w", "nan"));
    CHECK_FALSE(parse_double("w", "-inf"));
    CHECK_FALSE(parse_double("w", "1e999"));
    CHECK(parse_size("k", "12").value() == 12);
    CHECK_FALSE(parse_size("k", "-1"));
    CHECK_FALSE(parse_size("k", "3.5"));
    CHECK(parse_bool("b", "Yes").value());
    CHECK_FALSE(parse_bool("b", "off").value());
    auto bad = parse_bool("flag", "maybe");
    REQUIRE_FALSE(bad);
    CHECK(bad.error().code == ErrorCode::InvalidArgument);
    CHECK(bad.error().message.find("flag") != std::string::npos);
}

TEST_CASE("get_config_path: precedence", "[config][catch2]") {
    TempDir tmp;
    const auto& dir = tmp.path();
    ScopedEnvVar xdg("XDG_CONFIG_HOME", dir.string());

    {
        ScopedEnvVar env("GRAPHRAG_CONFIG", std::nullopt);
        CHECK(get_config_path() == dir / "graphrag" / "config.toml");
        CHECK(get_config_path("/explicit.toml") == std::filesystem::path("/explicit.toml"));
    }
    {
        ScopedEnvVar env("GRAPHRAG_CONFIG", std::string("/from/env.toml"));
        CHECK(get_config_path() == std::filesystem::path("/from/env.toml"));
        CHECK(get_config_path("/explicit.toml") == std::filesystem::path("/explicit.toml"));
    }
}

TEST_CASE("applySetting: known keys and aliases", "[config][catch2]") {
    search::RetrieverConfig cfg;

    REQUIRE(applySetting(cfg, "Mode", "\"graph\""));
    REQUIRE(applySetting(cfg, "max_depth", "4"));
    REQUIRE(applySetting(cfg, "rerank", "MMR"));
    REQUIRE(applySetting(cfg, "rrf_k", "30"));
    REQUIRE(applySetting(cfg, "context", "false"));
    REQUIRE(applySetting(cfg, "worker_threads", "3"));
    REQUIRE(applySetting(cfg, "something_else", "ignored"));

    CHECK(cfg.mode == search::SearchMode::Graph);
    CHECK(cfg.maxTraverseDepth == 4);
    CHECK(cfg.rerankStrategy == search::RerankStrategy::MMR);
    CHECK(cfg.rrfConstant == Catch::Approx(30.0));
    CHECK_FALSE(cfg.enableContextAugmentation);
    CHECK(cfg.workerThreads == 3);

    auto bad = applySetting(cfg, "fusion", "average");
    REQUIRE_FALSE(bad);
    CHECK(bad.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("loadRetrieverConfig: defaults without a file", "[config][catch2]") {
    TempDir tmp;
    const auto& home = tmp.path();
    auto guards = isolateEnvironment(home);

    auto cfg = loadRetrieverConfig();

    REQUIRE(cfg);
    CHECK(cfg.value().vectorWeight == Catch::Approx(0.6));
    CHECK(cfg.value().graphWeight == Catch::Approx(0.4));
    CHECK(cfg.value().topK == 10);
    CHECK(cfg.value().maxTraverseDepth == 2);
    CHECK(cfg.value().fusionStrategy == search::FusionStrategy::Weighted);
    CHECK(cfg.value().rerankStrategy == search::RerankStrategy::Score);
    CHECK(cfg.value().rrfConstant == Catch::Approx(60.0));
    CHECK(cfg.value().mmrLambda == Catch::Approx(0.5));
    CHECK(cfg.value().enableContextAugmentation);
    CHECK_FALSE(cfg.value().vectorStore);
}

TEST_CASE("loadRetrieverConfig: file then environment", "[config][catch2]") {
    TempDir tmp;
    const auto& home = tmp.path();
    auto guards = isolateEnvironment(home);
    tmp.write("graphrag/config.toml", R"([retriever]
vector_weight = 0.8
graph_weight = 0.2
top_k = 25
fusion_strategy = "max"
)");

    SECTION("file values") {
        auto cfg = loadRetrieverConfig();
        REQUIRE(cfg);
        CHECK(cfg.value().vectorWeight == Catch::Approx(0.8));
        CHECK(cfg.value().topK == 25);
        CHECK(cfg.value().fusionStrategy == search::FusionStrategy::Max);
    }

    SECTION("environment wins") {
        ScopedEnvVar topK("GRAPHRAG_TOP_K", std::string("7"));
        ScopedEnvVar fusion("GRAPHRAG_FUSION", std::string("rrf"));
        auto cfg = loadRetrieverConfig();
        REQUIRE(cfg);
        CHECK(cfg.value().topK == 7);
        CHECK(cfg.value().fusionStrategy == search::FusionStrategy::RRF);
        CHECK(cfg.value().vectorWeight == Catch::Approx(0.8));
    }

    SECTION("non-finite environment value is rejected") {
        ScopedEnvVar minScore("GRAPHRAG_MIN_SCORE", std::string("nan"));
        auto cfg = loadRetrieverConfig();
        REQUIRE_FALSE(cfg);
        CHECK(cfg.error().code == ErrorCode::InvalidArgument);
        CHECK(cfg.error().message.find("GRAPHRAG_MIN_SCORE") != std::string::npos);
    }

    SECTION("bad environment value names the variable") {
        ScopedEnvVar lambda("GRAPHRAG_MMR_LAMBDA", std::string("lots"));
        auto cfg = loadRetrieverConfig();
        REQUIRE_FALSE(cfg);
        CHECK(cfg.error().code == ErrorCode::InvalidArgument);
        CHECK(cfg.error().message.find("GRAPHRAG_MMR_LAMBDA") != std::string::npos);
    }
}

TEST_CASE("loadRetrieverConfig: explicit path must exist", "[config][catch2]") {
    TempDir tmp;
    const auto& home = tmp.path();
    auto guards = isolateEnvironment(home);

    auto missing = loadRetrieverConfig((home / "nope.toml").string());
    REQUIRE_FALSE(missing);
    CHECK(missing.error().code == ErrorCode::NotFound);

    auto path = tmp.write("custom.toml", "[retriever]\nmin_score = 0.3\n");
    auto cfg = loadRetrieverConfig(path.string());
    REQUIRE(cfg);
    CHECK(cfg.value().minScore == Catch::Approx(0.3));
}

TEST_CASE("loadRetrieverConfig: malformed file value", "[config][catch2]") {
    TempDir tmp;
    const auto& home = tmp.path();
    auto guards = isolateEnvironment(home);
    auto path = tmp.write("bad.toml", "[retriever]\ntop_k = many\n");

    auto cfg = loadRetrieverConfig(path.string());
    REQUIRE_FALSE(cfg);
    CHECK(cfg.error().code == ErrorCode::InvalidArgument);
}
