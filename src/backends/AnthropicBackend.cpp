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
#include "AnthropicBackend.h"

#include "BackendHttp.h"
#include "core/ModelCatalog.h"

#include <QHash>
#include <QJsonArray>

QString AnthropicBackend::id() const {
    return QStringLiteral("anthropic");
}

QString AnthropicBackend::name() const {
    return QStringLiteral("Anthropic");
}

QStringList AnthropicBackend::availableModels() const {
    return ModelCatalog::allowedModels(id());
}

QString AnthropicBackend::apiModelId(const QString& modelName)
{
    static const QHash<QString, QString> aliases = {
        {QStringLiteral("claude-3-sonnet"), QStringLiteral("claude-3-sonnet-20240229")},
        {QStringLiteral("claude-3-opus"), QStringLiteral("claude-3-opus-20240229")},
        {QStringLiteral("claude-3-haiku"), QStringLiteral("claude-3-haiku-20240307")},
    };
    return aliases.value(modelName, modelName);
}

LLMResult AnthropicBackend::generate(const QString& prompt, const QString& modelName, const QString& apiKey)
{
    QJsonObject userMsg;
    userMsg.insert(QStringLiteral("role"), QStringLiteral("user"));
    userMsg.insert(QStringLiteral("content"), prompt);

    QJsonObject root;
    root.insert(QStringLiteral("model"), apiModelId(modelName));
    root.insert(QStringLiteral("max_tokens"), kMaxTokens);
    root.insert(QStringLiteral("messages"), QJsonArray{userMsg});

    cpr::Header headers{
        {"x-api-key", apiKey.toStdString()},
        {"anthropic-version", "2023-06-01"},
        {"content-type", "application/json"}
    };

    return BackendHttp::postJson(
        "https://api.anthropic.com/v1/messages", headers, root, name(),
        [](const QJsonObject& resObj, LLMResult& result) {
            // content is an array of blocks; concatenate the text ones.
            const QJsonArray contentArray = resObj.value(QStringLiteral("content")).toArray();
            for (const QJsonValue& block : contentArray) {
                const QJsonObject obj = block.toObject();
                if (obj.value(QStringLiteral("type")).toString() == QLatin1String("text")) {
                    result.content += obj.value(QStringLiteral("text")).toString();
                }
            }

            const QJsonObject usage = resObj.value(QStringLiteral("usage")).toObject();
            result.usage.inputTokens = usage.value(QStringLiteral("input_tokens")).toInt(0);
            result.usage.outputTokens = usage.value(QStringLiteral("output_tokens")).toInt(0);
            result.usage.totalTokens = result.usage.inputTokens + result.usage.outputTokens;
        });
}
