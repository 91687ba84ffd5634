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

#include "ExecutionEngine.h"

#include "backends/ILLMBackend.h"
#include "backends/IWebSearchProvider.h"
#include "core/ContextMatcher.h"
#include "core/Errors.h"
#include "core/GraphResolver.h"
#include "core/LLMProviderRegistry.h"
#include "core/ModelCatalog.h"
#include "core/PromptAssembler.h"
#include "core/VectorStore.h"
#include "logging_categories.h"
#include "string_utils.h"

#include <QElapsedTimer>
#include <QJsonArray>

namespace {

const QString kNoContextSentinel = QStringLiteral("No matching context found.");
const QString kKnowledgeSeparator = QStringLiteral("\n---\n");

double elapsedSeconds(const QElapsedTimer& timer)
{
    return static_cast<double>(timer.nsecsElapsed()) / 1e9;
}

} // namespace

QJsonObject ExecutionResult::toJson() const
{
    QJsonObject obj;
    obj.insert(QStringLiteral("success"), success);
    if (success) {
        obj.insert(QStringLiteral("response"), response);
        obj.insert(QStringLiteral("context_used"), QJsonArray::fromStringList(contextUsed));
        obj.insert(QStringLiteral("web_search_results"), QJsonArray::fromStringList(webSearchResults));
        obj.insert(QStringLiteral("web_search_used"), webSearchUsed);
        obj.insert(QStringLiteral("llm_used"), modelUsed);
        obj.insert(QStringLiteral("provider"), providerUsed);
        obj.insert(QStringLiteral("api_key_provided"), apiKeyProvided);
    } else {
        obj.insert(QStringLiteral("error"), error);
    }
    obj.insert(QStringLiteral("processing_time"), processingTimeSeconds);
    obj.insert(QStringLiteral("workflow_id"), workspaceId);
    return obj;
}

ExecutionEngine::ExecutionEngine(VectorStore& store,
                                 std::shared_ptr<LLMProviderRegistry> providers,
                                 std::shared_ptr<IWebSearchProvider> webSearch,
                                 const IDocumentCatalog* catalog,
                                 QObject* parent)
    : ExecutionEngine(store, std::move(providers), std::move(webSearch), catalog, Options(), parent)
{
}

ExecutionEngine::ExecutionEngine(VectorStore& store,
                                 std::shared_ptr<LLMProviderRegistry> providers,
                                 std::shared_ptr<IWebSearchProvider> webSearch,
                                 const IDocumentCatalog* catalog,
                                 Options options,
                                 QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_providers(std::move(providers))
    , m_webSearch(std::move(webSearch))
    , m_catalog(catalog)
    , m_options(options)
{
}

ExecutionResult ExecutionEngine::executeJson(const QByteArray& graphJson, const QString& workspaceId, const QString& query)
{
    try {
        const WorkflowGraph graph = WorkflowGraph::fromJson(graphJson);
        return execute(graph, workspaceId, query);
    } catch (const GraphParseError& e) {
        ExecutionResult failed;
        failed.workspaceId = workspaceId;
        failed.error = QString::fromUtf8(e.what());
        qCWarning(kf_engine) << "Graph JSON rejected:" << failed.error;
        return finish(failed);
    }
}

ExecutionResult ExecutionEngine::execute(const WorkflowGraph& graph, const QString& workspaceId, const QString& query)
{
    emit executionStarted(workspaceId);

    try {
        const ResolvedPath path = GraphResolver::resolve(graph);

        switch (path.upstream.type) {
        case NodeType::UserQuery:
            return finish(runUserQuery(workspaceId, query));
        case NodeType::KnowledgeBase:
            return finish(runKnowledgeBase(workspaceId, query));
        case NodeType::LlmEngine:
            return finish(runLlmEngine(path, workspaceId, query));
        case NodeType::Output:
        case NodeType::Unsupported:
            break;
        }
        throw UnsupportedSourceTypeError(path.upstream.rawType);
    } catch (const std::exception& e) {
        ExecutionResult failed;
        failed.workspaceId = workspaceId;
        failed.error = QString::fromUtf8(e.what());
        failed.processingTimeSeconds = 0.0;
        qCWarning(kf_engine) << "Execution failed for workspace" << workspaceId << ":" << failed.error;
        return finish(failed);
    }
}

ExecutionResult ExecutionEngine::finish(ExecutionResult result)
{
    emit nodeLog(result.success
                     ? QStringLiteral("Finished via %1 in %2 s")
                           .arg(result.providerUsed, QString::number(result.processingTimeSeconds))
                     : QStringLiteral("Failed: %1").arg(result.error));
    emit executionFinished(result.success);
    return result;
}

ExecutionResult ExecutionEngine::runUserQuery(const QString& workspaceId, const QString& query)
{
    QElapsedTimer timer;
    timer.start();

    ExecutionResult result;
    result.success = true;
    result.response = query;
    result.providerUsed = QStringLiteral("user");
    result.modelUsed = QStringLiteral("user-query");
    result.workspaceId = workspaceId;
    result.processingTimeSeconds = elapsedSeconds(timer);
    return result;
}

ExecutionResult ExecutionEngine::runKnowledgeBase(const QString& workspaceId, const QString& query)
{
    QElapsedTimer timer;
    timer.start();

    const std::vector<SearchHit> hits = m_store.search(workspaceId, query, m_options.searchTopK);

    ExecutionResult result;
    result.success = true;
    for (const SearchHit& hit : hits) {
        result.contextUsed << hit.text;
    }
    result.response = result.contextUsed.isEmpty() ? kNoContextSentinel
                                                    : result.contextUsed.join(kKnowledgeSeparator);
    result.providerUsed = QStringLiteral("knowledge-base");
    result.modelUsed = QStringLiteral("kb-search");
    result.workspaceId = workspaceId;
    result.processingTimeSeconds = elapsedSeconds(timer);

    emit nodeLog(QStringLiteral("Knowledge base returned %1 matches").arg(hits.size()));
    return result;
}

QStringList ExecutionEngine::gatherKnowledgeContext(const ResolvedPath& path, const QString& workspaceId)
{
    QStringList context;
    const KnowledgeContextCollector collector(m_store, m_catalog);

    for (const GraphNode& feeder : path.upstreamFeeders) {
        if (feeder.type != NodeType::KnowledgeBase) {
            qCDebug(kf_engine) << "Source" << feeder.rawType << feeder.id << "is not a Knowledge Base";
            continue;
        }
        const QStringList texts = collector.collect(workspaceId);
        emit nodeLog(QStringLiteral("Knowledge base %1 contributed %2 documents")
                         .arg(feeder.id, QString::number(texts.size())));
        context << texts;
    }
    return context;
}

QStringList ExecutionEngine::runWebSearch(const LlmEngineConfig& cfg, const QString& query)
{
    if (!cfg.useWebSearch || cfg.serpApiKey.isEmpty() || !m_webSearch) {
        return {};
    }

    QStringList formatted;
    try {
        for (const WebSearchResult& r : m_webSearch->search(query, cfg.serpApiKey, m_options.webSearchMaxResults)) {
            formatted << r.format();
        }
    } catch (const std::exception& e) {
        qCWarning(kf_websearch) << "Web search error:" << e.what();
        return {};
    }
    return formatted;
}

QString ExecutionEngine::callProvider(const LlmEngineConfig& cfg, const QString& model, const QString& prompt,
                                      const QString& query, int contextCount, int webResultCount)
{
    if (cfg.apiKey.isEmpty()) {
        return PromptAssembler::placeholderWithoutKey(query, contextCount, webResultCount);
    }

    const std::shared_ptr<ILLMBackend> backend = m_providers ? m_providers->getBackend(cfg.provider) : nullptr;
    if (!backend) {
        qCInfo(kf_provider) << "No backend for provider" << cfg.provider << "- returning mock response";
        return PromptAssembler::placeholderForUnknownProvider(query, contextCount, webResultCount, cfg.provider);
    }

    try {
        const LLMResult llm = backend->generate(prompt, model, cfg.apiKey);
        if (llm.hasError) {
            qCWarning(kf_provider) << backend->name() << "error:" << llm.errorMsg;
            return QStringLiteral("Error calling %1 API: %2").arg(cfg.provider, llm.errorMsg);
        }
        qCDebug(kf_provider) << backend->name() << "answered:" << kf::strings::elide(llm.content, 200);
        return llm.content;
    } catch (const std::exception& e) {
        qCWarning(kf_provider) << backend->name() << "threw:" << e.what();
        return QStringLiteral("Error calling %1 API: %2").arg(cfg.provider, QString::fromUtf8(e.what()));
    }
}

ExecutionResult ExecutionEngine::runLlmEngine(const ResolvedPath& path, const QString& workspaceId, const QString& query)
{
    QElapsedTimer timer;
    timer.start();

    const LlmEngineConfig cfg = path.upstream.llm.value_or(LlmEngineConfig());

    const QStringList context = gatherKnowledgeContext(path, workspaceId);
    const QString model = ModelCatalog::resolveModel(cfg.provider, cfg.model);
    const QStringList webResults = runWebSearch(cfg, query);

    PromptParts parts;
    parts.knowledgeContext = context;
    parts.webResults = webResults;
    parts.customInstructions = cfg.customPrompt;
    parts.question = query;
    const QString prompt = PromptAssembler::build(parts);

    emit nodeLog(QStringLiteral("Calling %1 (%2) with %3 context documents and %4 web results")
                     .arg(cfg.provider, model, QString::number(context.size()),
                          QString::number(webResults.size())));

    ExecutionResult result;
    result.success = true;
    result.response = callProvider(cfg, model, prompt, query, context.size(), webResults.size());
    result.contextUsed = context;
    result.webSearchResults = webResults;
    result.webSearchUsed = !webResults.isEmpty();
    result.apiKeyProvided = !cfg.apiKey.isEmpty();
    result.providerUsed = cfg.provider;
    result.modelUsed = model;
    result.workspaceId = workspaceId;
    result.processingTimeSeconds = elapsedSeconds(timer);
    return result;
}
