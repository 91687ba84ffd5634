//
// KnowledgeFlow
//
// Hashing embedder tests
//

#include <gtest/gtest.h>

#include <QString>
#include <QStringList>

#include <cmath>
#include <stdexcept>

#include "core/Embedder.h"
#include "core/RagUtils.h"

namespace {

double l2Norm(const EmbeddingVector& v)
{
    double sum = 0.0;
    for (float x : v) {
        sum += static_cast<double>(x) * x;
    }
    return std::sqrt(sum);
}

bool isZero(const EmbeddingVector& v)
{
    for (float x : v) {
        if (x != 0.0f) {
            return false;
        }
    }
    return true;
}

} // namespace

TEST(HashingEmbedderTest, ReportsDimensionAndId)
{
    HashingEmbedder embedder(128);
    EXPECT_EQ(embedder.dimension(), 128);
    EXPECT_EQ(embedder.id(), QStringLiteral("hashing-tf-128"));

    HashingEmbedder defaults;
    EXPECT_EQ(defaults.dimension(), 384);
}

TEST(HashingEmbedderTest, NonPositiveDimensionThrows)
{
    EXPECT_THROW(HashingEmbedder(0), std::invalid_argument);
    EXPECT_THROW(HashingEmbedder(-3), std::invalid_argument);
}

TEST(HashingEmbedderTest, SameTextSameVector)
{
    HashingEmbedder a(64);
    HashingEmbedder b(64);
    const QString text = QStringLiteral("Retrieval augmented generation needs stable vectors.");

    EXPECT_EQ(a.embedOne(text), b.embedOne(text));
}

TEST(HashingEmbedderTest, VectorsAreUnitLength)
{
    HashingEmbedder embedder;
    const EmbeddingVector v = embedder.embedOne(QStringLiteral("alpha beta gamma gamma delta"));

    ASSERT_EQ(v.size(), 384u);
    EXPECT_NEAR(l2Norm(v), 1.0, 1e-5);
}

TEST(HashingEmbedderTest, TextWithoutTokensGivesZeroVector)
{
    HashingEmbedder embedder(32);

    const EmbeddingVector empty = embedder.embedOne(QString());
    const EmbeddingVector punctuation = embedder.embedOne(QStringLiteral("  ... !!! ---  "));

    ASSERT_EQ(empty.size(), 32u);
    EXPECT_TRUE(isZero(empty));
    EXPECT_TRUE(isZero(punctuation));
}

TEST(HashingEmbedderTest, TokenizationIgnoresCaseAndPunctuation)
{
    HashingEmbedder embedder;
    EXPECT_EQ(embedder.embedOne(QStringLiteral("Hello, World!")),
              embedder.embedOne(QStringLiteral("hello world")));

    EXPECT_EQ(HashingEmbedder::tokenize(QStringLiteral("C3PO, r2-d2; Café")),
              (QStringList{QStringLiteral("c3po"), QStringLiteral("r2"), QStringLiteral("d2"),
                           QStringLiteral("café")}));
}

TEST(HashingEmbedderTest, BatchMatchesSingleEmbedding)
{
    HashingEmbedder embedder(96);
    QStringList texts;
    for (int i = 0; i < 50; ++i) {
        texts << QStringLiteral("document number %1 talks about topic %2").arg(i).arg(i % 7);
    }

    const std::vector<EmbeddingVector> batch = embedder.embed(texts);

    ASSERT_EQ(batch.size(), static_cast<size_t>(texts.size()));
    for (int i = 0; i < texts.size(); ++i) {
        EXPECT_EQ(batch[static_cast<size_t>(i)], embedder.embedOne(texts[i])) << "Mismatch at " << i;
    }
}

TEST(HashingEmbedderTest, SharedVocabularyIsCloser)
{
    HashingEmbedder embedder;
    const EmbeddingVector query = embedder.embedOne(QStringLiteral("solar panel efficiency"));
    const EmbeddingVector related = embedder.embedOne(QStringLiteral("Efficiency of a solar panel array on a roof"));
    const EmbeddingVector unrelated = embedder.embedOne(QStringLiteral("Medieval castles had thick stone walls"));

    EXPECT_GT(RagUtils::cosineSimilarity(query, related), RagUtils::cosineSimilarity(query, unrelated));
    EXPECT_NEAR(RagUtils::cosineDistance(query, query), 0.0, 1e-5);
}
