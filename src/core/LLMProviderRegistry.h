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
#include <QList>
#include <QMap>
#include <QMutex>
#include <memory>

class ILLMBackend;

/**
 * @brief Thread-safe registry mapping provider ids to generation backends.
 *
 * Owned by whoever builds the execution engine; there is no global instance.
 */
class LLMProviderRegistry {
public:
    LLMProviderRegistry() = default;
    ~LLMProviderRegistry() = default;

    LLMProviderRegistry(const LLMProviderRegistry&) = delete;
    LLMProviderRegistry& operator=(const LLMProviderRegistry&) = delete;

    /**
     * @brief A registry with the OpenAI, Anthropic and Gemini backends.
     */
    static std::shared_ptr<LLMProviderRegistry> createDefault();

    /**
     * @brief Registers a backend under its id(), replacing any previous one.
     */
    void registerBackend(std::shared_ptr<ILLMBackend> backend);

    /**
     * @brief Retrieves a backend by provider id ("google" is accepted for "gemini").
     * @return The backend, or nullptr if none is registered.
     */
    std::shared_ptr<ILLMBackend> getBackend(const QString& id) const;

    QList<std::shared_ptr<ILLMBackend>> allBackends() const;

private:
    QMap<QString, std::shared_ptr<ILLMBackend>> m_backends;
    mutable QMutex m_mutex;
};
