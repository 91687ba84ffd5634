#pragma once

#include "IWebSearchProvider.h"

#include <QByteArray>

/**
 * @brief Google results through SerpAPI (https://serpapi.com/search).
 */
class SerpApiSearchProvider : public IWebSearchProvider {
public:
    static constexpr int kDefaultTimeoutMs = 10000;

    explicit SerpApiSearchProvider(int timeoutMs = kDefaultTimeoutMs);

    std::vector<WebSearchResult> search(const QString& query, const QString& apiKey, int maxResults) override;

    /// Reads organic_results[0..maxResults) from a SerpAPI JSON body.
    static std::vector<WebSearchResult> parseResponse(const QByteArray& json, int maxResults);

private:
    int m_timeoutMs;
};
