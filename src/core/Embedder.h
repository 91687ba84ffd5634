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
#include <QStringList>
#include <vector>

#include "CommonDataTypes.h"

/**
 * @brief Abstract base class (Strategy Pattern) for text vectorization.
 *
 * Implementations must be deterministic: the same text always produces the
 * same vector, in every process, so vectors persisted by the store stay
 * comparable with query vectors computed after a restart.
 */
class IEmbedder {
public:
    virtual ~IEmbedder() = default;

    /**
     * @brief Returns a stable identifier for the algorithm (e.g. "hashing-tf").
     */
    virtual QString id() const = 0;

    /**
     * @brief Returns the fixed output dimension D.
     */
    virtual int dimension() const = 0;

    /**
     * @brief Vectorizes a single text.
     * @return A unit-length vector, or the all-zero vector of length D when the
     *         text has no features to normalize.
     */
    virtual EmbeddingVector embedOne(const QString& text) const = 0;

    /**
     * @brief Vectorizes a batch; one vector per input, in input order.
     */
    virtual std::vector<EmbeddingVector> embed(const QStringList& texts) const;
};

/**
 * @brief Feature-hashing term-frequency embedder.
 *
 * Text is lower-cased and split into letter/digit tokens. Every token is hashed
 * with SHA-1; the digest picks a bucket in [0, D) and a sign. Bucket values
 * accumulate 1 + ln(tf) per distinct token and the result is L2-normalized.
 */
class HashingEmbedder : public IEmbedder {
public:
    static constexpr int kDefaultDimension = 384;

    explicit HashingEmbedder(int dimension = kDefaultDimension);
    ~HashingEmbedder() override = default;

    QString id() const override;
    int dimension() const override;
    EmbeddingVector embedOne(const QString& text) const override;
    std::vector<EmbeddingVector> embed(const QStringList& texts) const override;

    static QStringList tokenize(const QString& text);

private:
    int m_dimension;
};
