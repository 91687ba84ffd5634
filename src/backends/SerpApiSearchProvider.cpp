//
// KnowledgeFlow
//
// Copyright (c) 2025 Adrian Sutherland
//
#include "SerpApiSearchProvider.h"

#include "logging_categories.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include <cpr/cpr.h>

SerpApiSearchProvider::SerpApiSearchProvider(int timeoutMs)
    : m_timeoutMs(timeoutMs > 0 ? timeoutMs : kDefaultTimeoutMs)
{
}

std::vector<WebSearchResult> SerpApiSearchProvider::search(const QString& query, const QString& apiKey, int maxResults)
{
    if (apiKey.isEmpty() || maxResults <= 0) {
        return {};
    }

    qCDebug(kf_websearch) << "Performing web search for:" << query;

    auto response = cpr::Get(
        cpr::Url{"https://serpapi.com/search"},
        cpr::Parameters{
            {"q", query.toStdString()},
            {"api_key", apiKey.toStdString()},
            {"num", std::to_string(maxResults)},
            {"engine", "google"}
        },
        cpr::Timeout{m_timeoutMs}
    );

    if (response.error) {
        if (response.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
            qCWarning(kf_websearch) << "Web search timed out after" << m_timeoutMs << "ms";
        } else {
            qCWarning(kf_websearch) << "Web search network error:" << QString::fromStdString(response.error.message);
        }
        return {};
    }

    if (response.status_code != 200) {
        qCWarning(kf_websearch) << "Web search failed with status code:" << response.status_code;
        return {};
    }

    std::vector<WebSearchResult> results = parseResponse(QByteArray::fromStdString(response.text), maxResults);
    qCInfo(kf_websearch) << "Web search completed. Found" << results.size() << "results";
    return results;
}

std::vector<WebSearchResult> SerpApiSearchProvider::parseResponse(const QByteArray& json, int maxResults)
{
    std::vector<WebSearchResult> results;

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qCWarning(kf_websearch) << "Unparsable web search response:" << parseError.errorString();
        return results;
    }

    const QJsonArray organic = doc.object().value(QStringLiteral("organic_results")).toArray();
    for (const QJsonValue& value : organic) {
        if (static_cast<int>(results.size()) >= maxResults) {
            break;
        }
        const QJsonObject obj = value.toObject();
        WebSearchResult r;
        r.title = obj.value(QStringLiteral("title")).toString();
        r.snippet = obj.value(QStringLiteral("snippet")).toString();
        r.url = obj.value(QStringLiteral("link")).toString();
        results.push_back(r);
    }
    return results;
}
