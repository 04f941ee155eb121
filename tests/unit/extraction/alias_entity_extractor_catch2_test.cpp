// Catch2 tests for dictionary-based query entity extraction

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <graphrag/extraction/entity_extractor.h>

#include <memory>

using namespace graphrag;
using namespace graphrag::extraction;

namespace {

std::unique_ptr<AliasEntityExtractor> cityExtractor(AliasExtractorConfig cfg = {}) {
    auto extractor = std::make_unique<AliasEntityExtractor>(std::move(cfg));
    REQUIRE(extractor->addAliases({{"New York City", "city:nyc", "city", 0.9f},
                                  {"NYC", "city:nyc", "city", 0.9f},
                                  {"York", "city:york", "city", 0.8f},
                                  {"library", "concept:library", "concept", 0.7f},
                                  {"graph", "concept:graph", "concept", 0.6f}}));
    return extractor;
}

} // namespace

TEST_CASE("AliasEntityExtractor: normalization and plural folding", "[extraction][catch2]") {
    CHECK(AliasEntityExtractor::normalize("  (NYC)! ") == "nyc");
    CHECK(AliasEntityExtractor::normalize("...") == "");
    CHECK(AliasEntityExtractor::foldPlural("libraries") == "library");
    CHECK(AliasEntityExtractor::foldPlural("graphs") == "graph");
    CHECK(AliasEntityExtractor::foldPlural("class") == "class");
    CHECK(AliasEntityExtractor::foldPlural("s") == "s");
}

TEST_CASE("AliasEntityExtractor: longest match wins", "[extraction][catch2]") {
    auto extractor = cityExtractor();
    auto r = extractor->extract("Restaurants in New York City tonight");

    REQUIRE(r);
    REQUIRE(r.value().size() == 1);
    const auto& e = r.value()[0];
    CHECK(e.id == "city:nyc");
    CHECK(e.name == "new york city");
    CHECK(e.start == 15);
    CHECK(e.confidence == Catch::Approx(0.96f));
}

TEST_CASE("AliasEntityExtractor: entities in mention order, de-duplicated",
          "[extraction][catch2]") {
    auto extractor = cityExtractor();
    auto r = extractor->extract("Graphs of York libraries near NYC and New York City");

    REQUIRE(r);
    REQUIRE(r.value().size() == 4);
    CHECK(r.value()[0].id == "concept:graph");
    CHECK(r.value()[1].id == "city:york");
    CHECK(r.value()[2].id == "concept:library");
    CHECK(r.value()[3].id == "city:nyc");
}

TEST_CASE("AliasEntityExtractor: confidence threshold", "[extraction][catch2]") {
    AliasExtractorConfig cfg;
    cfg.minConfidence = 0.75f;
    auto extractor = cityExtractor(cfg);

    auto r = extractor->extract("a graph about york");
    REQUIRE(r);
    REQUIRE(r.value().size() == 1);
    CHECK(r.value()[0].id == "city:york");
}

TEST_CASE("AliasEntityExtractor: stopwords and disabled folding", "[extraction][catch2]") {
    AliasExtractorConfig cfg;
    cfg.foldPlurals = false;
    cfg.stopwords = {"york"};
    auto extractor = cityExtractor(cfg);

    auto r = extractor->extract("graphs in york");
    REQUIRE(r);
    CHECK(r.value().empty());
}

TEST_CASE("AliasEntityExtractor: higher prior target wins", "[extraction][catch2]") {
    AliasEntityExtractor extractor;
    REQUIRE(extractor.addAlias({"jaguar", "animal:jaguar", "animal", 0.6f}));
    REQUIRE(extractor.addAlias({"Jaguar", "brand:jaguar", "brand", 0.8f}));
    CHECK(extractor.aliasCount() == 1);

    auto r = extractor.extract("jaguar speed");
    REQUIRE(r);
    REQUIRE(r.value().size() == 1);
    CHECK(r.value()[0].id == "brand:jaguar");
}

TEST_CASE("AliasEntityExtractor: invalid input", "[extraction][catch2]") {
    AliasEntityExtractor extractor;
    CHECK(extractor.addAlias({"", "id", "t", 0.5f}).error().code == ErrorCode::InvalidArgument);
    CHECK(extractor.addAlias({"x", "id", "t", 1.5f}).error().code == ErrorCode::InvalidArgument);
    CHECK_FALSE(extractor.addAliases({{"ok", "id", "t", 0.5f}, {"bad", "", "t", 0.5f}}));
    CHECK(extractor.aliasCount() == 0);

    AliasExtractorConfig cfg;
    cfg.maxNgram = 0;
    AliasEntityExtractor broken(cfg);
    auto r = broken.extract("anything");
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("AliasEntityExtractor: clear and empty text", "[extraction][catch2]") {
    auto extractor = cityExtractor();
    auto none = extractor->extract("   ,,, ");
    REQUIRE(none);
    CHECK(none.value().empty());

    extractor->clearAliases();
    CHECK(extractor->aliasCount() == 0);
    auto r = extractor->extract("NYC");
    REQUIRE(r);
    CHECK(r.value().empty());
}
