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
#pragma once

#include <QString>
#include <QStringList>

/**
 * @brief Token usage statistics returned by LLM backends.
 */
struct LLMUsage {
    int inputTokens = 0;
    int outputTokens = 0;
    int totalTokens = 0;
};

/**
 * @brief Normalized result structure returned by all LLM backends.
 *
 * Backends never throw for provider or transport failures; they set hasError
 * and describe the failure in errorMsg.
 */
struct LLMResult {
    QString content;        ///< The actual AI response/answer text
    LLMUsage usage;         ///< Token usage statistics
    QString rawResponse;    ///< The original full JSON for debugging
    bool hasError = false;  ///< Whether an error occurred
    QString errorMsg;       ///< Error message if hasError is true
};

/**
 * @brief Abstract base class (Strategy Pattern) for generation providers.
 *
 * One implementation per provider name ("openai", "anthropic", "gemini").
 */
class ILLMBackend {
public:
    virtual ~ILLMBackend() = default;

    /**
     * @brief Returns the unique provider id used in llmEngine node data (e.g. "openai").
     */
    virtual QString id() const = 0;

    /**
     * @brief Returns the human-readable name for this backend (e.g. "Google Gemini").
     */
    virtual QString name() const = 0;

    /**
     * @brief Models this backend accepts; the allow-list from ModelCatalog.
     */
    virtual QStringList availableModels() const = 0;

    /**
     * @brief Sends a single-turn prompt and returns the normalized response.
     *
     * Synchronous; the request uses the backend's own timeout.
     *
     * @param prompt The fully assembled prompt text.
     * @param modelName An id from availableModels().
     * @param apiKey The caller's API key for the provider.
     */
    virtual LLMResult generate(const QString& prompt, const QString& modelName, const QString& apiKey) = 0;
};
