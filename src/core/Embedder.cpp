//
// KnowledgeFlow
//
// Copyright (c) 2025 Adrian Sutherland
//
#include "Embedder.h"

#include <QCryptographicHash>
#include <QMap>
#include <QRegularExpression>
#include <QtConcurrent>

#include <cmath>
#include <stdexcept>
#include <string>

namespace {

// Batches below this size are embedded inline; spinning up the pool costs more
// than it saves for a handful of chunks.
constexpr int kParallelBatchThreshold = 32;

quint32 readBigEndian32(const QByteArray& bytes, int offset)
{
    return (static_cast<quint32>(static_cast<quint8>(bytes.at(offset))) << 24)
         | (static_cast<quint32>(static_cast<quint8>(bytes.at(offset + 1))) << 16)
         | (static_cast<quint32>(static_cast<quint8>(bytes.at(offset + 2))) << 8)
         | static_cast<quint32>(static_cast<quint8>(bytes.at(offset + 3)));
}

} // namespace

std::vector<EmbeddingVector> IEmbedder::embed(const QStringList& texts) const
{
    std::vector<EmbeddingVector> result;
    result.reserve(static_cast<size_t>(texts.size()));
    for (const QString& text : texts) {
        result.push_back(embedOne(text));
    }
    return result;
}

HashingEmbedder::HashingEmbedder(int dimension)
    : m_dimension(dimension)
{
    if (m_dimension <= 0) {
        throw std::invalid_argument("HashingEmbedder: dimension must be positive, got "
                                    + std::to_string(m_dimension));
    }
}

QString HashingEmbedder::id() const
{
    return QStringLiteral("hashing-tf-%1").arg(m_dimension);
}

int HashingEmbedder::dimension() const
{
    return m_dimension;
}

QStringList HashingEmbedder::tokenize(const QString& text)
{
    static const QRegularExpression separator(QStringLiteral("[^\\p{L}\\p{N}]+"));
    return text.toLower().split(separator, Qt::SkipEmptyParts);
}

EmbeddingVector HashingEmbedder::embedOne(const QString& text) const
{
    EmbeddingVector vec(static_cast<size_t>(m_dimension), 0.0f);

    // QMap keeps tokens sorted, so accumulation order (and therefore the exact
    // float result) does not depend on per-process hash seeds.
    QMap<QString, int> termFrequency;
    for (const QString& token : tokenize(text)) {
        ++termFrequency[token];
    }

    if (termFrequency.isEmpty()) {
        return vec;
    }

    std::vector<double> accum(static_cast<size_t>(m_dimension), 0.0);
    for (auto it = termFrequency.cbegin(); it != termFrequency.cend(); ++it) {
        const QByteArray digest = QCryptographicHash::hash(it.key().toUtf8(), QCryptographicHash::Sha1);
        const quint32 bucket = readBigEndian32(digest, 0) % static_cast<quint32>(m_dimension);
        const double sign = (static_cast<quint8>(digest.at(4)) & 0x1) ? -1.0 : 1.0;
        const double weight = 1.0 + std::log(static_cast<double>(it.value()));
        accum[bucket] += sign * weight;
    }

    double norm = 0.0;
    for (double v : accum) {
        norm += v * v;
    }
    norm = std::sqrt(norm);
    if (norm == 0.0) {
        // Opposite-signed collisions can cancel out completely.
        return vec;
    }

    for (size_t i = 0; i < accum.size(); ++i) {
        vec[i] = static_cast<float>(accum[i] / norm);
    }
    return vec;
}

std::vector<EmbeddingVector> HashingEmbedder::embed(const QStringList& texts) const
{
    if (texts.size() < kParallelBatchThreshold) {
        return IEmbedder::embed(texts);
    }

    const QList<EmbeddingVector> mapped = QtConcurrent::blockingMapped<QList<EmbeddingVector>>(
        texts, [this](const QString& text) { return embedOne(text); });

    return std::vector<EmbeddingVector>(mapped.cbegin(), mapped.cend());
}
