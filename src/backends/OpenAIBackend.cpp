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
#include "OpenAIBackend.h"

#include "BackendHttp.h"
#include "core/ModelCatalog.h"

#include <QJsonArray>

QString OpenAIBackend::id() const {
    return QStringLiteral("openai");
}

QString OpenAIBackend::name() const {
    return QStringLiteral("OpenAI");
}

QStringList OpenAIBackend::availableModels() const {
    return ModelCatalog::allowedModels(id());
}

LLMResult OpenAIBackend::generate(const QString& prompt, const QString& modelName, const QString& apiKey)
{
    QJsonObject userMsg;
    userMsg.insert(QStringLiteral("role"), QStringLiteral("user"));
    userMsg.insert(QStringLiteral("content"), prompt);

    QJsonObject root;
    root.insert(QStringLiteral("model"), modelName);
    root.insert(QStringLiteral("messages"), QJsonArray{userMsg});

    cpr::Header headers{
        {"Authorization", std::string("Bearer ") + apiKey.toStdString()},
        {"Content-Type", "application/json"}
    };

    return BackendHttp::postJson(
        "https://api.openai.com/v1/chat/completions", headers, root, name(),
        [](const QJsonObject& rootObj, LLMResult& result) {
            // choices[0].message.content
            const QJsonArray choices = rootObj.value(QStringLiteral("choices")).toArray();
            if (!choices.isEmpty() && choices[0].isObject()) {
                const QJsonObject message = choices[0].toObject().value(QStringLiteral("message")).toObject();
                result.content = message.value(QStringLiteral("content")).toString();
            }

            const QJsonObject usage = rootObj.value(QStringLiteral("usage")).toObject();
            result.usage.inputTokens = usage.value(QStringLiteral("prompt_tokens")).toInt(0);
            result.usage.outputTokens = usage.value(QStringLiteral("completion_tokens")).toInt(0);
            result.usage.totalTokens = usage.value(QStringLiteral("total_tokens")).toInt(0);
        });
}
