#include "PromptAssembler.h"

QString PromptAssembler::build(const PromptParts& parts)
{
    QString prompt;
    if (!parts.knowledgeContext.isEmpty()) {
        prompt += QStringLiteral("Context from Knowledge Base:\n") + parts.knowledgeContext.join(QLatin1Char('\n'))
                  + QStringLiteral("\n\n");
    }
    if (!parts.webResults.isEmpty()) {
        prompt += QStringLiteral("Web Search Results:\n") + parts.webResults.join(QLatin1Char('\n'))
                  + QStringLiteral("\n\n");
    }
    const QString instructions = parts.customInstructions.trimmed();
    if (!instructions.isEmpty()) {
        prompt += QStringLiteral("Instructions:\n") + instructions + QStringLiteral("\n\n");
    }
    prompt += QStringLiteral("Question: %1\n\nAnswer:").arg(parts.question);
    return prompt;
}

QString PromptAssembler::placeholderWithoutKey(const QString& question, int contextCount, int webResultCount)
{
    return QStringLiteral("This is a mock response to: %1\n\n"
                          "Context provided: %2 documents\n\n"
                          "Web search results: %3 results\n\n"
                          "(No API key provided - using mock mode)")
        .arg(question, QString::number(contextCount), QString::number(webResultCount));
}

QString PromptAssembler::placeholderForUnknownProvider(const QString& question, int contextCount, int webResultCount,
                                                       const QString& provider)
{
    return QStringLiteral("Mock response to: %1\n\n"
                          "Context provided: %2 documents\n\n"
                          "Web search results: %3 results\n\n"
                          "(Using %4 with provided API key)")
        .arg(question, QString::number(contextCount), QString::number(webResultCount), provider);
}
