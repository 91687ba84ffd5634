#pragma once

#include <QMutex>
#include <QString>
#include <QStringList>

#include <stdexcept>
#include <vector>

#include "backends/ILLMBackend.h"
#include "backends/IWebSearchProvider.h"
#include "core/Embedder.h"
#include "core/ModelCatalog.h"

// Records every generate() call and answers with a canned result.
class FakeBackend : public ILLMBackend {
public:
    explicit FakeBackend(QString providerId = QStringLiteral("openai"))
        : m_id(std::move(providerId))
    {
    }

    QString id() const override { return m_id; }
    QString name() const override { return QStringLiteral("Fake ") + m_id; }
    QStringList availableModels() const override { return ModelCatalog::allowedModels(m_id); }

    LLMResult generate(const QString& prompt, const QString& modelName, const QString& apiKey) override
    {
        ++calls;
        lastPrompt = prompt;
        lastModel = modelName;
        lastApiKey = apiKey;
        if (throwOnGenerate) {
            throw std::runtime_error("connection reset");
        }
        return nextResult;
    }

    LLMResult nextResult;
    bool throwOnGenerate {false};
    int calls {0};
    QString lastPrompt;
    QString lastModel;
    QString lastApiKey;

private:
    QString m_id;
};

class FakeWebSearch : public IWebSearchProvider {
public:
    std::vector<WebSearchResult> search(const QString& query, const QString& apiKey, int maxResults) override
    {
        ++calls;
        lastQuery = query;
        lastApiKey = apiKey;
        lastMaxResults = maxResults;
        if (throwOnSearch) {
            throw std::runtime_error("search backend exploded");
        }
        std::vector<WebSearchResult> out = results;
        if (static_cast<int>(out.size()) > maxResults) {
            out.resize(static_cast<size_t>(maxResults));
        }
        return out;
    }

    std::vector<WebSearchResult> results;
    bool throwOnSearch {false};
    int calls {0};
    QString lastQuery;
    QString lastApiKey;
    int lastMaxResults {0};
};

// Embedder whose batch call fails after reporting a valid dimension.
class ThrowingEmbedder : public IEmbedder {
public:
    QString id() const override { return QStringLiteral("throwing"); }
    int dimension() const override { return 8; }
    EmbeddingVector embedOne(const QString&) const override
    {
        throw std::runtime_error("embedding service unavailable");
    }
};

// Embedder that claims one dimension but produces another.
class ShortVectorEmbedder : public IEmbedder {
public:
    QString id() const override { return QStringLiteral("short"); }
    int dimension() const override { return 8; }
    EmbeddingVector embedOne(const QString&) const override { return EmbeddingVector(4, 0.5f); }
};
