#include "AppConfig.h"

#include "logging_categories.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

#include <stdexcept>

namespace {

void readEnvInt(const char* name, int& target)
{
    const QByteArray raw = qgetenv(name);
    if (raw.isEmpty()) {
        return;
    }
    bool ok = false;
    const int value = raw.trimmed().toInt(&ok);
    if (!ok) {
        qCWarning(kf_config) << name << "is not an integer:" << raw << "- ignored";
        return;
    }
    target = value;
}

void readEnvBool(const char* name, bool& target)
{
    const QByteArray raw = qgetenv(name);
    if (raw.isEmpty()) {
        return;
    }
    const QByteArray v = raw.trimmed().toLower();
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        target = true;
    } else if (v == "0" || v == "false" || v == "no" || v == "off") {
        target = false;
    } else {
        qCWarning(kf_config) << name << "is not a boolean:" << raw << "- ignored";
    }
}

void readJsonInt(const QJsonObject& obj, const char* key, int& target)
{
    const QJsonValue value = obj.value(QLatin1String(key));
    if (value.isUndefined() || value.isNull()) {
        return;
    }
    if (!value.isDouble()) {
        qCWarning(kf_config) << "Config key" << key << "must be a number - ignored";
        return;
    }
    target = value.toInt(target);
}

void clampOrDefault(const char* label, int& value, int minValue, int maxValue, int fallback)
{
    if (value < minValue || value > maxValue) {
        qCWarning(kf_config) << label << "=" << value << "is outside [" << minValue << "," << maxValue
                             << "] - using" << fallback;
        value = fallback;
    }
}

} // namespace

QString AppConfig::defaultStorePath()
{
    QString base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (base.isEmpty()) {
        base = QDir::currentPath();
    }
    return QDir(base).filePath(QStringLiteral("vector_store"));
}

QString AppConfig::locateConfigFile()
{
    const QString fileName = QString::fromLatin1(kConfigFileName);

    const QString located = QStandardPaths::locate(QStandardPaths::AppConfigLocation, fileName);
    if (!located.isEmpty()) {
        return located;
    }

    const QString local = QDir::current().filePath(fileName);
    if (QFileInfo::exists(local)) {
        return local;
    }
    return QString();
}

AppConfig AppConfig::load(const QString& configPath)
{
    AppConfig cfg;

    QString path = configPath;
    if (path.isEmpty()) {
        path = locateConfigFile();
    } else if (!QFileInfo::exists(path)) {
        throw std::runtime_error(QStringLiteral("Config file '%1' does not exist").arg(path).toStdString());
    }

    if (!path.isEmpty()) {
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly)) {
            throw std::runtime_error(QStringLiteral("Cannot read config file '%1': %2")
                                         .arg(path, file.errorString())
                                         .toStdString());
        }
        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            throw std::runtime_error(QStringLiteral("Config file '%1' is not a JSON object: %2")
                                         .arg(path, parseError.errorString())
                                         .toStdString());
        }
        cfg.applyJson(doc.object());
        qCInfo(kf_config) << "Loaded configuration from" << path;
    }

    cfg.applyEnvironment();
    cfg.validate();
    return cfg;
}

void AppConfig::applyJson(const QJsonObject& obj)
{
    if (obj.value(QStringLiteral("store_path")).isString()) {
        storePath = obj.value(QStringLiteral("store_path")).toString();
    }
    readJsonInt(obj, "embedding_dim", embeddingDimension);
    readJsonInt(obj, "chunk_size", chunkSize);
    readJsonInt(obj, "chunk_overlap", chunkOverlap);
    readJsonInt(obj, "search_top_k", searchTopK);
    readJsonInt(obj, "web_search_timeout_ms", webSearchTimeoutMs);
    readJsonInt(obj, "web_search_max_results", webSearchMaxResults);
    if (obj.value(QStringLiteral("allow_store_reset")).isBool()) {
        allowStoreReset = obj.value(QStringLiteral("allow_store_reset")).toBool();
    }
    if (obj.value(QStringLiteral("debug")).isBool()) {
        debug = obj.value(QStringLiteral("debug")).toBool();
    }
}

void AppConfig::applyEnvironment()
{
    const QByteArray store = qgetenv("KF_STORE_PATH");
    if (!store.isEmpty()) {
        storePath = QString::fromLocal8Bit(store);
    }
    readEnvInt("KF_EMBEDDING_DIM", embeddingDimension);
    readEnvInt("KF_CHUNK_SIZE", chunkSize);
    readEnvInt("KF_CHUNK_OVERLAP", chunkOverlap);
    readEnvInt("KF_SEARCH_TOP_K", searchTopK);
    readEnvInt("KF_WEB_SEARCH_TIMEOUT_MS", webSearchTimeoutMs);
    readEnvInt("KF_WEB_SEARCH_MAX_RESULTS", webSearchMaxResults);
    readEnvBool("KF_ALLOW_STORE_RESET", allowStoreReset);
    readEnvBool("KF_DEBUG", debug);
}

void AppConfig::validate()
{
    const AppConfig defaults;

    if (storePath.trimmed().isEmpty()) {
        storePath = defaultStorePath();
    }

    clampOrDefault("embedding_dim", embeddingDimension, 1, 65536, defaults.embeddingDimension);
    clampOrDefault("search_top_k", searchTopK, 1, 100, defaults.searchTopK);
    clampOrDefault("web_search_timeout_ms", webSearchTimeoutMs, 100, 120000, defaults.webSearchTimeoutMs);
    clampOrDefault("web_search_max_results", webSearchMaxResults, 1, 20, defaults.webSearchMaxResults);

    if (chunkSize <= 0 || chunkOverlap < 0 || chunkOverlap >= chunkSize) {
        qCWarning(kf_config) << "chunk_size" << chunkSize << "/ chunk_overlap" << chunkOverlap
                             << "violate 0 <= overlap < size - using" << defaults.chunkSize << "/"
                             << defaults.chunkOverlap;
        chunkSize = defaults.chunkSize;
        chunkOverlap = defaults.chunkOverlap;
    }
}
