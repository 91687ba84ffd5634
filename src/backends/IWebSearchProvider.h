#pragma once

#include <QString>
#include <vector>

struct WebSearchResult {
    QString title;
    QString snippet;
    QString url;

    /// "Title: ...\nSnippet: ...\nURL: ..." as placed in prompts.
    QString format() const
    {
        return QStringLiteral("Title: %1\nSnippet: %2\nURL: %3").arg(title, snippet, url);
    }
};

/**
 * @brief Web search used to enrich llmEngine prompts.
 *
 * Implementations never throw: timeouts, transport errors and bad responses
 * all produce an empty result list.
 */
class IWebSearchProvider {
public:
    virtual ~IWebSearchProvider() = default;
    virtual std::vector<WebSearchResult> search(const QString& query, const QString& apiKey, int maxResults) = 0;
};
