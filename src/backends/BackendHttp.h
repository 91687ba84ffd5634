#pragma once

#include "ILLMBackend.h"

#include <QJsonObject>

#include <cpr/cpr.h>
#include <functional>
#include <string>

namespace BackendHttp {

// 10s connect, 60s total; generation can be slow.
constexpr int kConnectTimeoutMs = 10000;
constexpr int kRequestTimeoutMs = 60000;

/**
 * @brief POSTs @p body as JSON and normalizes the outcome into an LLMResult.
 *
 * Transport failures, non-200 statuses, unparsable bodies and in-band
 * {"error": {...}} objects all set hasError. On success @p extract reads the
 * answer and usage out of the parsed root object.
 *
 * @param providerLabel Used in error messages, e.g. "OpenAI".
 */
LLMResult postJson(const std::string& url,
                   const cpr::Header& headers,
                   const QJsonObject& body,
                   const QString& providerLabel,
                   const std::function<void(const QJsonObject& root, LLMResult& result)>& extract);

} // namespace BackendHttp
