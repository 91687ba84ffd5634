//
// KnowledgeFlow
//
// Execution engine tests
//

#include <gtest/gtest.h>

#include <QJsonArray>
#include <QJsonObject>
#include <QSignalSpy>
#include <QTemporaryDir>

#include <memory>

#include "ExecutionEngine.h"
#include "core/DocumentCatalog.h"
#include "core/DocumentPipeline.h"
#include "core/Embedder.h"
#include "core/LLMProviderRegistry.h"
#include "core/VectorStore.h"
#include "test_fakes.h"

namespace {

WorkflowGraph directGraph(const QString& sourceType)
{
    WorkflowGraph graph;
    graph.addNode(QStringLiteral("src"), sourceType);
    graph.addNode(QStringLiteral("out"), QStringLiteral("output"));
    graph.addEdge(QStringLiteral("src"), QStringLiteral("out"));
    return graph;
}

WorkflowGraph llmGraph(const QVariantMap& llmData, bool withKnowledgeBase)
{
    WorkflowGraph graph;
    graph.addNode(QStringLiteral("q"), QStringLiteral("userQuery"));
    if (withKnowledgeBase) {
        graph.addNode(QStringLiteral("kb"), QStringLiteral("knowledgeBase"));
    }
    graph.addNode(QStringLiteral("llm"), QStringLiteral("llmEngine"), llmData);
    graph.addNode(QStringLiteral("out"), QStringLiteral("output"));
    graph.addEdge(QStringLiteral("q"), QStringLiteral("llm"));
    if (withKnowledgeBase) {
        graph.addEdge(QStringLiteral("kb"), QStringLiteral("llm"));
    }
    graph.addEdge(QStringLiteral("llm"), QStringLiteral("out"));
    return graph;
}

} // namespace

class ExecutionEngineTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(tempDir.isValid());
        embedder = std::make_shared<HashingEmbedder>(64);
        store = std::make_unique<VectorStore>(tempDir.filePath(QStringLiteral("store")), embedder);

        openai = std::make_shared<FakeBackend>(QStringLiteral("openai"));
        openai->nextResult.content = QStringLiteral("generated answer");
        providers = std::make_shared<LLMProviderRegistry>();
        providers->registerBackend(openai);

        webSearch = std::make_shared<FakeWebSearch>();
        engine = std::make_unique<ExecutionEngine>(*store, providers, webSearch, &catalog);
    }

    void ingest(const QString& ws, const QString& text, const QString& label)
    {
        DocumentPipeline pipeline(*store);
        pipeline.ingest(text, ws, label);
        catalog.addDocument(ws, label);
    }

    QTemporaryDir tempDir;
    std::shared_ptr<HashingEmbedder> embedder;
    std::unique_ptr<VectorStore> store;
    std::shared_ptr<FakeBackend> openai;
    std::shared_ptr<LLMProviderRegistry> providers;
    std::shared_ptr<FakeWebSearch> webSearch;
    InMemoryDocumentCatalog catalog;
    std::unique_ptr<ExecutionEngine> engine;
};

// Test 1 (Echo): userQuery -> output returns the query unchanged
TEST_F(ExecutionEngineTest, UserQueryEchoes)
{
    const ExecutionResult result = engine->execute(directGraph(QStringLiteral("userQuery")), QStringLiteral("w1"),
                                                   QStringLiteral("hello there"));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.response, QStringLiteral("hello there"));
    EXPECT_EQ(result.providerUsed, QStringLiteral("user"));
    EXPECT_EQ(result.modelUsed, QStringLiteral("user-query"));
    EXPECT_TRUE(result.contextUsed.isEmpty());
    EXPECT_FALSE(result.webSearchUsed);
    EXPECT_EQ(result.workspaceId, QStringLiteral("w1"));
    EXPECT_GE(result.processingTimeSeconds, 0.0);
    EXPECT_EQ(openai->calls, 0);
}

// Test 2 (Graph errors): Missing, disconnected and unsupported sources fail cleanly
TEST_F(ExecutionEngineTest, GraphErrorsBecomeFailures)
{
    WorkflowGraph noOutput;
    noOutput.addNode(QStringLiteral("q"), QStringLiteral("userQuery"));
    const ExecutionResult a = engine->execute(noOutput, QStringLiteral("w1"), QStringLiteral("q"));
    EXPECT_FALSE(a.success);
    EXPECT_EQ(a.error, QStringLiteral("No Output node found. Connect an Output node to run."));

    WorkflowGraph disconnected;
    disconnected.addNode(QStringLiteral("out"), QStringLiteral("output"));
    const ExecutionResult b = engine->execute(disconnected, QStringLiteral("w1"), QStringLiteral("q"));
    EXPECT_FALSE(b.success);
    EXPECT_TRUE(b.error.contains(QStringLiteral("not connected")));

    const ExecutionResult c = engine->execute(directGraph(QStringLiteral("imageGen")), QStringLiteral("w1"), QStringLiteral("q"));
    EXPECT_FALSE(c.success);
    EXPECT_EQ(c.error, QStringLiteral("Unsupported source 'imageGen' connected to Output"));
    EXPECT_EQ(c.processingTimeSeconds, 0.0);
}

// Test 3 (Knowledge base): Direct search joins hits with separators
TEST_F(ExecutionEngineTest, KnowledgeBaseJoinsHits)
{
    ingest(QStringLiteral("w1"), QStringLiteral("Solar panels convert sunlight to electricity."), QStringLiteral("solar.txt"));
    ingest(QStringLiteral("w1"), QStringLiteral("Wind turbines convert wind to electricity."), QStringLiteral("wind.txt"));

    const ExecutionResult result = engine->execute(directGraph(QStringLiteral("knowledgeBase")), QStringLiteral("w1"),
                                                   QStringLiteral("solar panels sunlight"));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.providerUsed, QStringLiteral("knowledge-base"));
    EXPECT_EQ(result.modelUsed, QStringLiteral("kb-search"));
    ASSERT_EQ(result.contextUsed.size(), 2);
    EXPECT_EQ(result.contextUsed.first(), QStringLiteral("Solar panels convert sunlight to electricity."));
    EXPECT_EQ(result.response, result.contextUsed.join(QStringLiteral("\n---\n")));
}

// Test 4 (Knowledge base): An empty workspace yields the sentinel text
TEST_F(ExecutionEngineTest, KnowledgeBaseWithoutMatches)
{
    const ExecutionResult result = engine->execute(directGraph(QStringLiteral("knowledgeBase")), QStringLiteral("empty"),
                                                   QStringLiteral("anything"));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.response, QStringLiteral("No matching context found."));
    EXPECT_TRUE(result.contextUsed.isEmpty());
}

// Test 5 (Top-k): The knowledge base honours the configured result count
TEST_F(ExecutionEngineTest, KnowledgeBaseTopK)
{
    ExecutionEngine::Options options;
    options.searchTopK = 1;
    ExecutionEngine limited(*store, providers, webSearch, &catalog, options);
    ingest(QStringLiteral("w1"), QStringLiteral("alpha"), QStringLiteral("a.txt"));
    ingest(QStringLiteral("w1"), QStringLiteral("beta"), QStringLiteral("b.txt"));

    const ExecutionResult result = limited.execute(directGraph(QStringLiteral("knowledgeBase")), QStringLiteral("w1"),
                                                   QStringLiteral("alpha"));

    EXPECT_EQ(result.contextUsed, QStringList {QStringLiteral("alpha")});
}

// Test 6 (Mock mode): Without an API key no provider is called
TEST_F(ExecutionEngineTest, NoApiKeyGivesPlaceholder)
{
    ingest(QStringLiteral("w1"), QStringLiteral("Doc body."), QStringLiteral("doc.txt"));

    const ExecutionResult result = engine->execute(llmGraph({}, true), QStringLiteral("w1"), QStringLiteral("What?"));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.response, QStringLiteral("This is a mock response to: What?\n\n"
                                              "Context provided: 1 documents\n\n"
                                              "Web search results: 0 results\n\n"
                                              "(No API key provided - using mock mode)"));
    EXPECT_FALSE(result.apiKeyProvided);
    EXPECT_EQ(result.providerUsed, QStringLiteral("openai"));
    EXPECT_EQ(result.modelUsed, QStringLiteral("gpt-3.5-turbo"));
    EXPECT_EQ(result.contextUsed, QStringList {QStringLiteral("Doc body.")});
    EXPECT_EQ(openai->calls, 0);
}

// Test 7 (Provider call): The prompt carries context and the resolved model
TEST_F(ExecutionEngineTest, ProviderReceivesPromptAndModel)
{
    ingest(QStringLiteral("w1"), QStringLiteral("The launch is on Friday."), QStringLiteral("plan.txt"));
    const QVariantMap data {{QStringLiteral("provider"), QStringLiteral("OpenAI")},
                            {QStringLiteral("model"), QStringLiteral("gpt-99")},
                            {QStringLiteral("api_key"), QStringLiteral("sk-test")},
                            {QStringLiteral("custom_prompt"), QStringLiteral("Answer in one word.")}};

    const ExecutionResult result = engine->execute(llmGraph(data, true), QStringLiteral("w1"), QStringLiteral("When?"));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.response, QStringLiteral("generated answer"));
    EXPECT_TRUE(result.apiKeyProvided);
    EXPECT_EQ(result.modelUsed, QStringLiteral("gpt-3.5-turbo"));
    ASSERT_EQ(openai->calls, 1);
    EXPECT_EQ(openai->lastModel, QStringLiteral("gpt-3.5-turbo"));
    EXPECT_EQ(openai->lastApiKey, QStringLiteral("sk-test"));
    EXPECT_EQ(openai->lastPrompt, QStringLiteral("Context from Knowledge Base:\nThe launch is on Friday.\n\n"
                                                 "Instructions:\nAnswer in one word.\n\n"
                                                 "Question: When?\n\nAnswer:"));
}

// Test 8 (Without knowledge base): Only knowledgeBase feeders contribute context
TEST_F(ExecutionEngineTest, LlmWithoutKnowledgeBaseHasNoContext)
{
    ingest(QStringLiteral("w1"), QStringLiteral("Should not appear."), QStringLiteral("x.txt"));

    const ExecutionResult result = engine->execute(
        llmGraph({{QStringLiteral("api_key"), QStringLiteral("k")}}, false), QStringLiteral("w1"), QStringLiteral("q"));

    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.contextUsed.isEmpty());
    EXPECT_EQ(openai->lastPrompt, QStringLiteral("Question: q\n\nAnswer:"));
}

// Test 9 (Backend error): Provider failures are reported in the response text
TEST_F(ExecutionEngineTest, ProviderErrorIsEmbeddedInResponse)
{
    openai->nextResult.hasError = true;
    openai->nextResult.errorMsg = QStringLiteral("HTTP 401: invalid key");

    const ExecutionResult result = engine->execute(
        llmGraph({{QStringLiteral("api_key"), QStringLiteral("bad")}}, false), QStringLiteral("w1"), QStringLiteral("q"));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.response, QStringLiteral("Error calling openai API: HTTP 401: invalid key"));

    openai->nextResult.hasError = false;
    openai->throwOnGenerate = true;
    const ExecutionResult thrown = engine->execute(
        llmGraph({{QStringLiteral("api_key"), QStringLiteral("bad")}}, false), QStringLiteral("w1"), QStringLiteral("q"));
    EXPECT_TRUE(thrown.success);
    EXPECT_EQ(thrown.response, QStringLiteral("Error calling openai API: connection reset"));
}

// Test 10 (Unknown provider): A keyed request to an unregistered provider is mocked
TEST_F(ExecutionEngineTest, UnknownProviderGivesMockResponse)
{
    const QVariantMap data {{QStringLiteral("provider"), QStringLiteral("mistral")},
                            {QStringLiteral("api_key"), QStringLiteral("k")}};

    const ExecutionResult result = engine->execute(llmGraph(data, false), QStringLiteral("w1"), QStringLiteral("hi"));

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.response, QStringLiteral("Mock response to: hi\n\n"
                                              "Context provided: 0 documents\n\n"
                                              "Web search results: 0 results\n\n"
                                              "(Using mistral with provided API key)"));
    EXPECT_EQ(result.providerUsed, QStringLiteral("mistral"));
    EXPECT_EQ(result.modelUsed, QStringLiteral("gpt-3.5-turbo"));
}

// Test 11 (Web search): Results are formatted into the prompt and the result
TEST_F(ExecutionEngineTest, WebSearchResultsAreUsed)
{
    webSearch->results = {WebSearchResult {QStringLiteral("T1"), QStringLiteral("S1"), QStringLiteral("U1")},
                          WebSearchResult {QStringLiteral("T2"), QStringLiteral("S2"), QStringLiteral("U2")}};
    const QVariantMap data {{QStringLiteral("api_key"), QStringLiteral("k")},
                            {QStringLiteral("use_web_search"), true},
                            {QStringLiteral("serp_api_key"), QStringLiteral("serp")}};

    const ExecutionResult result = engine->execute(llmGraph(data, false), QStringLiteral("w1"), QStringLiteral("news"));

    EXPECT_TRUE(result.webSearchUsed);
    ASSERT_EQ(result.webSearchResults.size(), 2);
    EXPECT_EQ(result.webSearchResults[0], QStringLiteral("Title: T1\nSnippet: S1\nURL: U1"));
    EXPECT_EQ(webSearch->lastQuery, QStringLiteral("news"));
    EXPECT_EQ(webSearch->lastApiKey, QStringLiteral("serp"));
    EXPECT_EQ(webSearch->lastMaxResults, 5);
    EXPECT_TRUE(openai->lastPrompt.startsWith(QStringLiteral("Web Search Results:\nTitle: T1")));
}

// Test 12 (Web search): Disabled, keyless or failing searches contribute nothing
TEST_F(ExecutionEngineTest, WebSearchSkippedOrFailing)
{
    webSearch->results = {WebSearchResult {QStringLiteral("T"), QStringLiteral("S"), QStringLiteral("U")}};

    const ExecutionResult noKey = engine->execute(
        llmGraph({{QStringLiteral("use_web_search"), true}}, false), QStringLiteral("w1"), QStringLiteral("q"));
    EXPECT_FALSE(noKey.webSearchUsed);
    EXPECT_EQ(webSearch->calls, 0);

    webSearch->throwOnSearch = true;
    const ExecutionResult failing = engine->execute(
        llmGraph({{QStringLiteral("use_web_search"), true}, {QStringLiteral("serp_api_key"), QStringLiteral("s")}}, false),
        QStringLiteral("w1"), QStringLiteral("q"));
    EXPECT_TRUE(failing.success);
    EXPECT_FALSE(failing.webSearchUsed);
    EXPECT_TRUE(failing.webSearchResults.isEmpty());
    EXPECT_EQ(webSearch->calls, 1);
}

// Test 13 (Stale tags): Catalog names recover chunks tagged for another workspace id
TEST_F(ExecutionEngineTest, CatalogRecoversStaleEntries)
{
    const QString text = QStringLiteral("Migrated chunk");
    store->addDocuments(QStringLiteral("w1"), {text}, {embedder->embedOne(text)},
                        {Metadata {{QStringLiteral("workflow_id"), QStringLiteral("legacy")},
                                   {QStringLiteral("filename"), QStringLiteral("old.pdf")}}});

    const ExecutionResult before = engine->execute(llmGraph({}, true), QStringLiteral("w1"), QStringLiteral("q"));
    EXPECT_TRUE(before.contextUsed.isEmpty());

    catalog.addDocument(QStringLiteral("w1"), QStringLiteral("old.pdf"));
    const ExecutionResult after = engine->execute(llmGraph({}, true), QStringLiteral("w1"), QStringLiteral("q"));
    EXPECT_EQ(after.contextUsed, QStringList {text});
}

// Test 14 (JSON): Invalid graph JSON is reported as a failure
TEST_F(ExecutionEngineTest, ExecuteJson)
{
    const ExecutionResult bad = engine->executeJson("{oops", QStringLiteral("w1"), QStringLiteral("q"));
    EXPECT_FALSE(bad.success);
    EXPECT_TRUE(bad.error.startsWith(QStringLiteral("Invalid graph JSON")));

    const ExecutionResult good = engine->executeJson(
        R"({"nodes":[{"id":"a","type":"userQuery"},{"id":"b","type":"output"}],"edges":[{"source":"a","target":"b"}]})",
        QStringLiteral("w1"), QStringLiteral("ping"));
    EXPECT_TRUE(good.success);
    EXPECT_EQ(good.response, QStringLiteral("ping"));
}

// Test 15 (Result JSON): Success and failure shapes
TEST_F(ExecutionEngineTest, ResultJsonShape)
{
    const QJsonObject ok = engine->execute(directGraph(QStringLiteral("userQuery")), QStringLiteral("w1"),
                                           QStringLiteral("x"))
                               .toJson();
    EXPECT_TRUE(ok.value(QStringLiteral("success")).toBool());
    EXPECT_EQ(ok.value(QStringLiteral("response")).toString(), QStringLiteral("x"));
    EXPECT_EQ(ok.value(QStringLiteral("llm_used")).toString(), QStringLiteral("user-query"));
    EXPECT_EQ(ok.value(QStringLiteral("provider")).toString(), QStringLiteral("user"));
    EXPECT_TRUE(ok.value(QStringLiteral("context_used")).isArray());
    EXPECT_EQ(ok.value(QStringLiteral("workflow_id")).toString(), QStringLiteral("w1"));
    EXPECT_FALSE(ok.contains(QStringLiteral("error")));

    const QJsonObject failed = engine->execute(WorkflowGraph(), QStringLiteral("w1"), QStringLiteral("x")).toJson();
    EXPECT_FALSE(failed.value(QStringLiteral("success")).toBool());
    EXPECT_FALSE(failed.value(QStringLiteral("error")).toString().isEmpty());
    EXPECT_FALSE(failed.contains(QStringLiteral("response")));
}

// Test 16 (Signals): Every run reports start and finish
TEST_F(ExecutionEngineTest, EmitsLifecycleSignals)
{
    QSignalSpy started(engine.get(), &ExecutionEngine::executionStarted);
    QSignalSpy finished(engine.get(), &ExecutionEngine::executionFinished);

    engine->execute(directGraph(QStringLiteral("userQuery")), QStringLiteral("w1"), QStringLiteral("x"));
    engine->execute(WorkflowGraph(), QStringLiteral("w2"), QStringLiteral("x"));

    ASSERT_EQ(started.count(), 2);
    EXPECT_EQ(started.at(0).at(0).toString(), QStringLiteral("w1"));
    ASSERT_EQ(finished.count(), 2);
    EXPECT_TRUE(finished.at(0).at(0).toBool());
    EXPECT_FALSE(finished.at(1).at(0).toBool());
}
