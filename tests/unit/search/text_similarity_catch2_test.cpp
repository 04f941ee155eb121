#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <graphrag/search/text_similarity.h>

using namespace graphrag::search;

TEST_CASE("extractWords: lowercases and strips punctuation", "[search][similarity][catch2]") {
    auto words = extractWords("  Hello, World! (graph) \"RAG\" ... ");
    REQUIRE(words.size() == 4);
    CHECK(words[0] == "hello");
    CHECK(words[1] == "world");
    CHECK(words[2] == "graph");
    CHECK(words[3] == "rag");
}

TEST_CASE("extractWords: keeps inner punctuation", "[search][similarity][catch2]") {
    auto words = extractWords("state-of-the-art e.g. C++");
    REQUIRE(words.size() == 3);
    CHECK(words[0] == "state-of-the-art");
    CHECK(words[1] == "e.g");
    CHECK(words[2] == "c++");
}

TEST_CASE("jaccard: set overlap", "[search][similarity][catch2]") {
    CHECK(textSimilarity("the cat sat", "the cat sat") == Catch::Approx(1.0));
    CHECK(textSimilarity("the cat sat", "The CAT, sat.") == Catch::Approx(1.0));
    CHECK(textSimilarity("a b c", "c d") == Catch::Approx(0.25));
    CHECK(textSimilarity("a b", "c d") == 0.0);
}

TEST_CASE("jaccard: empty text has no similarity", "[search][similarity][catch2]") {
    CHECK(textSimilarity("", "") == 0.0);
    CHECK(textSimilarity("word", "") == 0.0);
    CHECK(textSimilarity("...", "word") == 0.0);
}

TEST_CASE("makeTokenSet: sorted and unique", "[search][similarity][catch2]") {
    auto set = makeTokenSet("b a b c a");
    REQUIRE(set.size() == 3);
    CHECK(set[0] == "a");
    CHECK(set[1] == "b");
    CHECK(set[2] == "c");
}
