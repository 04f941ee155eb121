// Catch2 tests for graph context augmentation and prompt formatting

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <graphrag/search/context_augmenter.h>

#include "../../common/fake_backends.h"

using namespace graphrag;
using namespace graphrag::search;
using graphrag::test::makeNode;

namespace {

FusedResult rankedWithNodes() {
    FusedResult r;
    r.document = Document("doc-1", "Paris is the capital of France.");
    r.vectorScore = 1.0;
    r.graphScore = 0.5;
    r.fusedScore = 0.8;
    r.rank = 1;
    r.fromVector = true;
    r.fromGraph = true;
    r.relatedNodes = {makeNode("paris", "City", "Paris"), makeNode("france", "Country", "France"),
                      makeNode("paris", "City", "Paris"), makeNode("anon", "Thing", "")};
    return r;
}

} // namespace

TEST_CASE("buildContextInfo: summarises related nodes", "[search][augment][catch2]") {
    NodeDepthMap depths{{"paris", 2}, {"france", 1}};
    auto info = buildContextInfo(rankedWithNodes(), depths);

    CHECK(info.relatedEntities == std::vector<std::string>{"Paris (City)", "France (Country)"});
    CHECK(info.neighborCount == 3);
    CHECK(info.graphDepth == 1);
    CHECK(info.text == "Related Entities: Paris (City), France (Country)");
}

TEST_CASE("buildContextInfo: unknown depth defaults to one", "[search][augment][catch2]") {
    auto info = buildContextInfo(rankedWithNodes(), {});
    CHECK(info.graphDepth == 1);
}

TEST_CASE("ContextAugmenter: attaches scores, rank and context", "[search][augment][catch2]") {
    ContextAugmenter augmenter(true);
    auto doc = augmenter.augmentOne(rankedWithNodes(), {});

    REQUIRE(doc.metadataAs<double>(metadata_keys::kFusedScore) != nullptr);
    CHECK(*doc.metadataAs<double>(metadata_keys::kFusedScore) == Catch::Approx(0.8));
    CHECK(*doc.metadataAs<double>(metadata_keys::kVectorScore) == Catch::Approx(1.0));
    CHECK(*doc.metadataAs<double>(metadata_keys::kGraphScore) == Catch::Approx(0.5));
    CHECK(*doc.metadataAs<std::int64_t>(metadata_keys::kRank) == 1);
    CHECK(*doc.metadataAs<std::int64_t>(metadata_keys::kNeighborCount) == 3);
    REQUIRE(doc.graphContext.has_value());
    CHECK(doc.content == "Paris is the capital of France.");
    CHECK(doc.renderContent() ==
          "Paris is the capital of France.\n\nRelated Entities: Paris (City), France (Country)");
}

TEST_CASE("ContextAugmenter: candidates without related nodes get scores only",
          "[search][augment][catch2]") {
    FusedResult r;
    r.document = Document("plain", "text");
    r.fusedScore = 0.3;
    r.rank = 4;

    auto doc = ContextAugmenter(true).augmentOne(r, {});

    CHECK(doc.hasMetadata(metadata_keys::kFusedScore));
    CHECK(doc.hasMetadata(metadata_keys::kRank));
    CHECK_FALSE(doc.hasMetadata(metadata_keys::kRelatedEntities));
    CHECK_FALSE(doc.graphContext.has_value());
    CHECK(doc.renderContent() == "text");
}

TEST_CASE("ContextAugmenter: disabled context keeps scores", "[search][augment][catch2]") {
    auto doc = ContextAugmenter(false).augmentOne(rankedWithNodes(), {});
    CHECK(doc.hasMetadata(metadata_keys::kFusedScore));
    CHECK_FALSE(doc.hasMetadata(metadata_keys::kRelatedEntities));
    CHECK_FALSE(doc.graphContext.has_value());
}

TEST_CASE("ContextAugmenter: augmenting twice does not duplicate context",
          "[search][augment][catch2]") {
    ContextAugmenter augmenter(true);
    auto first = rankedWithNodes();
    auto once = augmenter.augmentOne(first, {});

    auto second = first;
    second.document = once;
    auto twice = augmenter.augmentOne(second, {});

    CHECK(twice.content == once.content);
    CHECK(twice.renderContent() == once.renderContent());
    CHECK(twice.metadata.size() == once.metadata.size());
}

TEST_CASE("ContextAugmenter: augment preserves order", "[search][augment][catch2]") {
    std::vector<FusedResult> ranked(3);
    for (std::size_t i = 0; i < ranked.size(); ++i) {
        ranked[i].document = Document("d" + std::to_string(i), "c");
        ranked[i].rank = i + 1;
    }
    auto docs = ContextAugmenter().augment(ranked);
    REQUIRE(docs.size() == 3);
    CHECK(docs[2].id == "d2");
    CHECK(*docs[2].metadataAs<std::int64_t>(metadata_keys::kRank) == 3);
}

TEST_CASE("enhanceWithGraphStructure: node and neighbours", "[search][augment][catch2]") {
    auto node = makeNode("berlin", "City", "Berlin", {{"population", std::int64_t{3600000}}});
    std::vector<graph::GraphNode> neighbors{makeNode("germany", "Country", "Germany"),
                                            makeNode("spree", "River", "Spree")};

    auto doc = enhanceWithGraphStructure(Document("d", "Berlin text"), &node, neighbors);

    CHECK(*doc.metadataAs<std::string>("node_id") == "berlin");
    CHECK(*doc.metadataAs<std::int64_t>("node_population") == 3600000);
    CHECK(*doc.metadataAs<std::int64_t>(metadata_keys::kNeighborCount) == 2);
    CHECK(doc.renderContent() == "Berlin text\n\nConnected to: Germany, Spree");

    auto bare = enhanceWithGraphStructure(Document("d", "x"), nullptr, {});
    CHECK(bare.metadata.empty());
    CHECK_FALSE(bare.graphContext.has_value());
}

TEST_CASE("formatContextForLLM: numbered blocks", "[search][augment][catch2]") {
    auto doc = ContextAugmenter(true).augmentOne(rankedWithNodes(), {});
    std::vector<Document> docs{doc, Document("other", "Second document")};

    auto withMeta = formatContextForLLM(docs, true);
    CHECK(withMeta.rfind("Context:\n\n", 0) == 0);
    CHECK(withMeta.find("Document 1:\nParis is the capital of France.") != std::string::npos);
    CHECK(withMeta.find("  Related Entities: Paris (City), France (Country)\n") !=
          std::string::npos);
    CHECK(withMeta.find("  Relevance Score: 0.800\n") != std::string::npos);
    CHECK(withMeta.find("Document 2:\nSecond document\n") != std::string::npos);

    auto plain = formatContextForLLM(docs, false);
    CHECK(plain.find("Metadata:") == std::string::npos);
}
