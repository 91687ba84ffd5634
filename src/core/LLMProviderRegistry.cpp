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

#include "LLMProviderRegistry.h"
#include "../backends/ILLMBackend.h"
#include "../backends/OpenAIBackend.h"
#include "../backends/GoogleBackend.h"
#include "../backends/AnthropicBackend.h"

#include "logging_categories.h"
#include "string_utils.h"

#include <QMutexLocker>

std::shared_ptr<LLMProviderRegistry> LLMProviderRegistry::createDefault() {
    auto registry = std::make_shared<LLMProviderRegistry>();
    registry->registerBackend(std::make_shared<OpenAIBackend>());
    registry->registerBackend(std::make_shared<AnthropicBackend>());
    registry->registerBackend(std::make_shared<GoogleBackend>());
    return registry;
}

void LLMProviderRegistry::registerBackend(std::shared_ptr<ILLMBackend> backend) {
    if (!backend) {
        qCWarning(kf_provider) << "LLMProviderRegistry::registerBackend: Attempted to register null backend";
        return;
    }

    QMutexLocker locker(&m_mutex);
    const QString id = backend->id();
    if (m_backends.contains(id)) {
        qCWarning(kf_provider) << "LLMProviderRegistry::registerBackend: Backend with id" << id << "already registered. Replacing.";
    }
    m_backends[id] = std::move(backend);
}

std::shared_ptr<ILLMBackend> LLMProviderRegistry::getBackend(const QString& id) const {
    QMutexLocker locker(&m_mutex);
    return m_backends.value(kf::strings::normalize_provider_id(id));
}

QList<std::shared_ptr<ILLMBackend>> LLMProviderRegistry::allBackends() const {
    QMutexLocker locker(&m_mutex);
    return m_backends.values();
}
