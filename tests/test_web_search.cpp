//
// KnowledgeFlow
//
// Web search parsing tests
//

#include <gtest/gtest.h>

#include "backends/SerpApiSearchProvider.h"

TEST(SerpApiSearchProviderTest, ParsesOrganicResults)
{
    const QByteArray json = R"({
        "search_metadata": {"status": "Success"},
        "organic_results": [
            {"title": "First", "snippet": "One", "link": "https://one.example"},
            {"title": "Second", "snippet": "Two", "link": "https://two.example"},
            {"title": "Third", "snippet": "Three", "link": "https://three.example"}
        ]
    })";

    const std::vector<WebSearchResult> results = SerpApiSearchProvider::parseResponse(json, 2);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].title, QStringLiteral("First"));
    EXPECT_EQ(results[1].url, QStringLiteral("https://two.example"));
    EXPECT_EQ(results[0].format(), QStringLiteral("Title: First\nSnippet: One\nURL: https://one.example"));
}

TEST(SerpApiSearchProviderTest, MissingFieldsBecomeEmpty)
{
    const std::vector<WebSearchResult> results =
        SerpApiSearchProvider::parseResponse(R"({"organic_results": [{"title": "Only title"}]})", 5);

    ASSERT_EQ(results.size(), 1u);
    EXPECT_TRUE(results[0].snippet.isEmpty());
    EXPECT_TRUE(results[0].url.isEmpty());
}

TEST(SerpApiSearchProviderTest, BadBodiesYieldNoResults)
{
    EXPECT_TRUE(SerpApiSearchProvider::parseResponse("<html>rate limited</html>", 5).empty());
    EXPECT_TRUE(SerpApiSearchProvider::parseResponse(R"({"error": "Invalid API key"})", 5).empty());
    EXPECT_TRUE(SerpApiSearchProvider::parseResponse(R"({"organic_results": []})", 5).empty());
}

TEST(SerpApiSearchProviderTest, NoKeyMeansNoRequest)
{
    SerpApiSearchProvider provider(50);
    EXPECT_TRUE(provider.search(QStringLiteral("anything"), QString(), 5).empty());
    EXPECT_TRUE(provider.search(QStringLiteral("anything"), QStringLiteral("key"), 0).empty());
}
