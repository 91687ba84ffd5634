#include "ModelCatalog.h"

#include "logging_categories.h"
#include "string_utils.h"

QStringList ModelCatalog::allowedModels(const QString& provider)
{
    const QString id = kf::strings::normalize_provider_id(provider);

    if (id == QLatin1String("gemini")) {
        return {
            QStringLiteral("gemini-2.5-pro"),
            QStringLiteral("gemini-2.5-flash"),
            QStringLiteral("gemini-2.5-flash-lite"),
            QStringLiteral("gemini-1.5-pro"),
            QStringLiteral("gemini-1.5-flash")
        };
    }
    if (id == QLatin1String("anthropic")) {
        return {
            QStringLiteral("claude-3-sonnet"),
            QStringLiteral("claude-3-opus"),
            QStringLiteral("claude-3-haiku")
        };
    }
    return {
        QStringLiteral("gpt-3.5-turbo"),
        QStringLiteral("gpt-4"),
        QStringLiteral("gpt-4-turbo")
    };
}

QString ModelCatalog::defaultModel(const QString& provider)
{
    return allowedModels(provider).constFirst();
}

QString ModelCatalog::resolveModel(const QString& provider, const QString& requested)
{
    const QString model = kf::strings::canonicalize_model_id(requested);
    const QStringList allowed = allowedModels(provider);
    if (!model.isEmpty() && allowed.contains(model)) {
        return model;
    }

    const QString fallback = allowed.constFirst();
    if (!model.isEmpty()) {
        qCInfo(kf_provider) << "Model" << model << "is not available for" << provider << "- using" << fallback;
    }
    return fallback;
}
