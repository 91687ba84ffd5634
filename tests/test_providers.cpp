//
// KnowledgeFlow
//
// Provider registry tests
//

#include <gtest/gtest.h>

#include <QSet>

#include "backends/AnthropicBackend.h"
#include "backends/GoogleBackend.h"
#include "backends/OpenAIBackend.h"
#include "core/LLMProviderRegistry.h"
#include "test_fakes.h"

TEST(LLMProviderRegistryTest, DefaultRegistryHasThreeBackends)
{
    const auto registry = LLMProviderRegistry::createDefault();

    QSet<QString> ids;
    for (const auto& backend : registry->allBackends()) {
        ids.insert(backend->id());
    }
    EXPECT_EQ(ids, (QSet<QString> {QStringLiteral("openai"), QStringLiteral("anthropic"), QStringLiteral("gemini")}));
}

TEST(LLMProviderRegistryTest, LookupIsNormalized)
{
    const auto registry = LLMProviderRegistry::createDefault();

    ASSERT_NE(registry->getBackend(QStringLiteral(" OpenAI ")), nullptr);
    ASSERT_NE(registry->getBackend(QStringLiteral("google")), nullptr);
    EXPECT_EQ(registry->getBackend(QStringLiteral("google"))->id(), QStringLiteral("gemini"));
    EXPECT_EQ(registry->getBackend(QStringLiteral("mistral")), nullptr);
}

TEST(LLMProviderRegistryTest, RegisteringSameIdReplaces)
{
    LLMProviderRegistry registry;
    registry.registerBackend(std::make_shared<OpenAIBackend>());
    auto fake = std::make_shared<FakeBackend>(QStringLiteral("openai"));
    registry.registerBackend(fake);
    registry.registerBackend(nullptr);

    EXPECT_EQ(registry.allBackends().size(), 1);
    EXPECT_EQ(registry.getBackend(QStringLiteral("openai")), fake);
}

TEST(LLMProviderRegistryTest, BackendsAdvertiseAllowLists)
{
    EXPECT_EQ(OpenAIBackend().availableModels().constFirst(), QStringLiteral("gpt-3.5-turbo"));
    EXPECT_EQ(GoogleBackend().availableModels().constFirst(), QStringLiteral("gemini-2.5-pro"));
    EXPECT_EQ(AnthropicBackend().availableModels().constFirst(), QStringLiteral("claude-3-sonnet"));
}

TEST(AnthropicBackendTest, FamilyNamesMapToDatedIds)
{
    EXPECT_EQ(AnthropicBackend::apiModelId(QStringLiteral("claude-3-opus")), QStringLiteral("claude-3-opus-20240229"));
    EXPECT_EQ(AnthropicBackend::apiModelId(QStringLiteral("claude-3-haiku")), QStringLiteral("claude-3-haiku-20240307"));
    EXPECT_EQ(AnthropicBackend::apiModelId(QStringLiteral("claude-custom")), QStringLiteral("claude-custom"));
}
