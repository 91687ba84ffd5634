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
#include "GoogleBackend.h"

#include "BackendHttp.h"
#include "core/ModelCatalog.h"

#include <QJsonArray>
#include <QUrl>

QString GoogleBackend::id() const {
    return QStringLiteral("gemini");
}

QString GoogleBackend::name() const {
    return QStringLiteral("Google Gemini");
}

QStringList GoogleBackend::availableModels() const {
    return ModelCatalog::allowedModels(id());
}

LLMResult GoogleBackend::generate(const QString& prompt, const QString& modelName, const QString& apiKey)
{
    // Models outside the Gemini list fall back to the provider default.
    const QString model = ModelCatalog::resolveModel(id(), modelName);

    // API key is passed as a query parameter, not via Authorization header.
    const std::string url = std::string("https://generativelanguage.googleapis.com/v1beta/models/")
                            + QUrl::toPercentEncoding(model).toStdString()
                            + ":generateContent?key="
                            + QUrl::toPercentEncoding(apiKey).toStdString();

    QJsonObject textPart;
    textPart.insert(QStringLiteral("text"), prompt);

    QJsonObject userContent;
    userContent.insert(QStringLiteral("role"), QStringLiteral("user"));
    userContent.insert(QStringLiteral("parts"), QJsonArray{textPart});

    QJsonObject root;
    root.insert(QStringLiteral("contents"), QJsonArray{userContent});

    cpr::Header headers{
        {"Content-Type", "application/json"}
    };

    return BackendHttp::postJson(
        url, headers, root, name(),
        [](const QJsonObject& rootObj, LLMResult& result) {
            // Concatenate candidates[0].content.parts[*].text
            const QJsonArray candidates = rootObj.value(QStringLiteral("candidates")).toArray();
            if (!candidates.isEmpty() && candidates[0].isObject()) {
                const QJsonObject candidate = candidates[0].toObject();
                const QJsonArray parts = candidate.value(QStringLiteral("content")).toObject()
                                             .value(QStringLiteral("parts")).toArray();
                QStringList texts;
                for (const QJsonValue& part : parts) {
                    const QString text = part.toObject().value(QStringLiteral("text")).toString();
                    if (!text.isEmpty()) {
                        texts << text;
                    }
                }
                result.content = texts.join(QLatin1Char(' '));

                if (result.content.isEmpty()) {
                    const QString finishReason = candidate.value(QStringLiteral("finishReason")).toString();
                    if (!finishReason.isEmpty() && finishReason != QLatin1String("STOP")) {
                        result.hasError = true;
                        result.errorMsg = QStringLiteral("Gemini returned no text (finishReason: %1)").arg(finishReason);
                        result.content = result.errorMsg;
                    }
                }
            }

            const QJsonObject usageMetadata = rootObj.value(QStringLiteral("usageMetadata")).toObject();
            result.usage.inputTokens = usageMetadata.value(QStringLiteral("promptTokenCount")).toInt(0);
            result.usage.outputTokens = usageMetadata.value(QStringLiteral("candidatesTokenCount")).toInt(0);
            result.usage.totalTokens = usageMetadata.value(QStringLiteral("totalTokenCount")).toInt(0);
        });
}
