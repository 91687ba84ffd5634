#pragma once

#include <QString>
#include <QStringList>

/**
 * @brief Inputs for a retrieval-augmented prompt.
 */
struct PromptParts {
    QStringList knowledgeContext;
    QStringList webResults;
    QString customInstructions;
    QString question;
};

/**
 * @brief Builds the text sent to generation providers.
 *
 * Blocks appear in a fixed order and are omitted when empty:
 * knowledge-base context, web results, custom instructions, then the question.
 */
class PromptAssembler {
public:
    static QString build(const PromptParts& parts);

    /// Response used when an llmEngine node has no API key.
    static QString placeholderWithoutKey(const QString& question, int contextCount, int webResultCount);

    /// Response used for a keyed request to a provider with no backend.
    static QString placeholderForUnknownProvider(const QString& question, int contextCount, int webResultCount,
                                                 const QString& provider);
};
