//
// KnowledgeFlow
//
// Vector math, blob codecs and naming helpers for the collection databases
//

#include "RagUtils.h"

#include <QtCore/QCryptographicHash>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QRegularExpression>

#include <cmath>
#include <cstring>

using namespace std;

double RagUtils::cosineSimilarity(const vector<float>& a, const vector<float>& b)
{
    if (a.empty() || b.empty() || a.size() != b.size()) {
        return 0.0;
    }

    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;

    for (size_t i = 0; i < a.size(); ++i) {
        const double va = a[i];
        const double vb = b[i];
        dot += va * vb;
        normA += va * va;
        normB += vb * vb;
    }

    if (normA == 0.0 || normB == 0.0) {
        return 0.0;
    }

    const double denom = std::sqrt(normA) * std::sqrt(normB);
    if (denom == 0.0) {
        return 0.0;
    }

    return dot / denom;
}

double RagUtils::cosineDistance(const vector<float>& a, const vector<float>& b)
{
    return 1.0 - cosineSimilarity(a, b);
}

QByteArray RagUtils::vectorToBlob(const EmbeddingVector& vec)
{
    return QByteArray(reinterpret_cast<const char*>(vec.data()),
                      static_cast<int>(vec.size() * sizeof(float)));
}

EmbeddingVector RagUtils::blobToVector(const QByteArray& blob)
{
    EmbeddingVector result;
    if (blob.isEmpty()) {
        return result;
    }

    if (blob.size() % static_cast<int>(sizeof(float)) != 0) {
        return result;
    }

    const int count = blob.size() / static_cast<int>(sizeof(float));
    result.resize(count);
    memcpy(result.data(), blob.constData(), blob.size());
    return result;
}

QString RagUtils::metadataToJson(const Metadata& metadata)
{
    return QString::fromUtf8(QJsonDocument(QJsonObject::fromVariantMap(metadata)).toJson(QJsonDocument::Compact));
}

Metadata RagUtils::metadataFromJson(const QString& json)
{
    if (json.isEmpty()) {
        return {};
    }
    const QJsonDocument doc = QJsonDocument::fromJson(json.toUtf8());
    if (!doc.isObject()) {
        return {};
    }
    return doc.object().toVariantMap();
}

QString RagUtils::collectionNameFor(const QString& workspaceId)
{
    // Lowercase only: "WS" and "ws" must not share a file on case-insensitive
    // file systems. The "h_" prefix is reserved for hashed names.
    static const QRegularExpression safeId(QStringLiteral("^[a-z0-9_-]{1,64}$"));
    if (safeId.match(workspaceId).hasMatch() && !workspaceId.startsWith(QLatin1String("h_"))) {
        return QStringLiteral("workflow_%1").arg(workspaceId);
    }
    const QByteArray digest = QCryptographicHash::hash(workspaceId.toUtf8(), QCryptographicHash::Sha1);
    return QStringLiteral("workflow_h_%1").arg(QString::fromLatin1(digest.toHex()));
}

bool RagUtils::isCorruptionMessage(const QString& sqlErrorText)
{
    static const char* const kMarkers[] = {
        "no such column",
        "no such table",
        "malformed",
        "not a database",
        "has no column named",
    };
    for (const char* marker : kMarkers) {
        if (sqlErrorText.contains(QLatin1String(marker), Qt::CaseInsensitive)) {
            return true;
        }
    }
    return false;
}
