//
// KnowledgeFlow
//
// Copyright (c) 2025 Adrian Sutherland
//
#include "BackendHttp.h"

#include "logging_categories.h"

#include <QJsonDocument>
#include <QJsonParseError>

namespace {

QString errorMessageFrom(const QJsonObject& obj, const QString& fallback)
{
    const QJsonValue error = obj.value(QStringLiteral("error"));
    if (error.isObject()) {
        return error.toObject().value(QStringLiteral("message")).toString(fallback);
    }
    if (error.isString()) {
        return error.toString();
    }
    return fallback;
}

LLMResult failed(LLMResult result, const QString& message)
{
    result.hasError = true;
    result.errorMsg = message;
    result.content = message;
    return result;
}

} // namespace

LLMResult BackendHttp::postJson(const std::string& url,
                                const cpr::Header& headers,
                                const QJsonObject& body,
                                const QString& providerLabel,
                                const std::function<void(const QJsonObject&, LLMResult&)>& extract)
{
    LLMResult result;

    const QByteArray jsonBytes = QJsonDocument(body).toJson(QJsonDocument::Compact);

    auto response = cpr::Post(
        cpr::Url{url},
        headers,
        cpr::Body{jsonBytes.toStdString()},
        cpr::ConnectTimeout{kConnectTimeoutMs},
        cpr::Timeout{kRequestTimeoutMs}
    );

    if (response.error) {
        const QString msg = QString::fromStdString(response.error.message);
        if (response.error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
            qCWarning(kf_provider) << providerLabel << "timeout:" << msg;
            return failed(result, QStringLiteral("%1 API Timeout").arg(providerLabel));
        }
        qCWarning(kf_provider) << providerLabel << "network error:" << msg;
        return failed(result, QStringLiteral("%1 network error: %2").arg(providerLabel, msg));
    }

    result.rawResponse = QString::fromStdString(response.text);

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(QByteArray::fromStdString(response.text), &parseError);
    const bool isJsonObject = parseError.error == QJsonParseError::NoError && doc.isObject();

    if (response.status_code != 200) {
        qCWarning(kf_provider) << providerLabel << "HTTP error" << response.status_code << "body:" << result.rawResponse;
        const QString fallback = QStringLiteral("HTTP %1").arg(response.status_code);
        return failed(result, isJsonObject ? errorMessageFrom(doc.object(), fallback) : fallback);
    }

    if (parseError.error != QJsonParseError::NoError) {
        return failed(result, QStringLiteral("JSON parse error: %1").arg(parseError.errorString()));
    }
    if (!doc.isObject()) {
        return failed(result, QStringLiteral("Invalid JSON: root is not an object"));
    }

    const QJsonObject root = doc.object();
    if (root.contains(QStringLiteral("error"))) {
        return failed(result, errorMessageFrom(root, QStringLiteral("Unknown error")));
    }

    extract(root, result);
    if (result.content.isEmpty() && !result.hasError) {
        qCWarning(kf_provider) << providerLabel << "returned no text content";
    }
    return result;
}
