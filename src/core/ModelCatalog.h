#pragma once

#include <QString>
#include <QStringList>

/**
 * @brief Per-provider model allow-lists.
 *
 * Providers without a list of their own (including unknown ones) use the
 * OpenAI list. The first entry of every list is that provider's default.
 */
class ModelCatalog {
public:
    static QStringList allowedModels(const QString& provider);
    static QString defaultModel(const QString& provider);

    /**
     * @brief Model actually used for a request.
     *
     * The requested id is canonicalized (whitespace, outer quotes); if it is
     * empty or not in the provider's allow-list, the provider default is used.
     */
    static QString resolveModel(const QString& provider, const QString& requested);
};
