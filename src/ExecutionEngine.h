//
// KnowledgeFlow
//
// Copyright (c) 2025 Adrian Sutherland
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//
#pragma once

#include <QJsonObject>
#include <QObject>
#include <QString>
#include <QStringList>

#include <memory>

#include "core/WorkflowGraph.h"

class IDocumentCatalog;
class IWebSearchProvider;
class LLMProviderRegistry;
class VectorStore;
struct ResolvedPath;

/**
 * @brief Outcome of one execute() call, including provenance.
 */
struct ExecutionResult {
    bool success {false};
    QString response;
    QString error;
    QStringList contextUsed;
    QString providerUsed;
    QString modelUsed;
    QStringList webSearchResults;
    bool webSearchUsed {false};
    bool apiKeyProvided {false};
    QString workspaceId;
    double processingTimeSeconds {0.0};

    QJsonObject toJson() const;
};

/**
 * @brief Runs the active path of a workflow graph against a query.
 *
 * Dispatch on the node wired into the active Output:
 *   userQuery     -> echo the query
 *   knowledgeBase -> top-k search in the workspace collection
 *   llmEngine     -> gather knowledge-base context, optional web search,
 *                    assemble the prompt and call the provider
 *
 * execute() never throws. Graph, storage and provider failures become
 * success=false with the message in error and a processing time of 0.
 * Runs synchronously in the calling thread; signals are emitted from it.
 */
class ExecutionEngine : public QObject {
    Q_OBJECT
public:
    struct Options {
        int searchTopK {5};
        int webSearchMaxResults {5};
    };

    /**
     * @param catalog Known document names per workspace; may be null.
     * @param webSearch May be null, which disables web search.
     */
    ExecutionEngine(VectorStore& store,
                    std::shared_ptr<LLMProviderRegistry> providers,
                    std::shared_ptr<IWebSearchProvider> webSearch,
                    const IDocumentCatalog* catalog,
                    QObject* parent = nullptr);
    ExecutionEngine(VectorStore& store,
                    std::shared_ptr<LLMProviderRegistry> providers,
                    std::shared_ptr<IWebSearchProvider> webSearch,
                    const IDocumentCatalog* catalog,
                    Options options,
                    QObject* parent = nullptr);
    ~ExecutionEngine() override = default;

    ExecutionResult execute(const WorkflowGraph& graph, const QString& workspaceId, const QString& query);

    /// Parses @p graphJson first; parse errors are reported like any other failure.
    ExecutionResult executeJson(const QByteArray& graphJson, const QString& workspaceId, const QString& query);

signals:
    void executionStarted(const QString& workspaceId);
    void executionFinished(bool success);
    // Emitted for notable steps of a run
    void nodeLog(const QString& message);

private:
    ExecutionResult runUserQuery(const QString& workspaceId, const QString& query);
    ExecutionResult runKnowledgeBase(const QString& workspaceId, const QString& query);
    ExecutionResult runLlmEngine(const ResolvedPath& path, const QString& workspaceId, const QString& query);

    QStringList gatherKnowledgeContext(const ResolvedPath& path, const QString& workspaceId);
    QStringList runWebSearch(const LlmEngineConfig& cfg, const QString& query);
    QString callProvider(const LlmEngineConfig& cfg, const QString& model, const QString& prompt,
                         const QString& query, int contextCount, int webResultCount);

    ExecutionResult finish(ExecutionResult result);

    VectorStore& m_store;
    std::shared_ptr<LLMProviderRegistry> m_providers;
    std::shared_ptr<IWebSearchProvider> m_webSearch;
    const IDocumentCatalog* m_catalog;
    Options m_options;
};
