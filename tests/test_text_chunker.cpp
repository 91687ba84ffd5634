//
// KnowledgeFlow
//
// Text chunker tests
//

#include <gtest/gtest.h>
#include "core/TextChunker.h"
#include <QString>
#include <QStringList>

#include <stdexcept>

// Test 1 (Basic): Text shorter than chunkSize returns 1 chunk
TEST(TextChunkerTest, TextShorterThanChunkSize) {
    const QString text = QStringLiteral("This is a short text.");

    const QStringList chunks = TextChunker::split(text, 100, 10);

    ASSERT_EQ(chunks.size(), 1);
    EXPECT_EQ(chunks[0], text);
}

// Test 2 (Windows): 2500 characters at 1000/200 start at 0, 800, 1600 and 2400
TEST(TextChunkerTest, DefaultWindowsOverLongText) {
    QString text;
    for (int i = 0; i < 2500; ++i) {
        text.append(QChar('a' + (i % 26)));
    }

    const QStringList chunks = TextChunker::split(text, 1000, 200);

    ASSERT_EQ(chunks.size(), 4);
    EXPECT_EQ(chunks[0], text.mid(0, 1000));
    EXPECT_EQ(chunks[1], text.mid(800, 1000));
    EXPECT_EQ(chunks[2], text.mid(1600, 1000));
    EXPECT_EQ(chunks[3], text.mid(2400));
    EXPECT_EQ(chunks[3].length(), 100);
    EXPECT_EQ(TextChunker::expectedChunkCount(text.length(), 1000, 200), 4);
}

// Test 3 (Boundary): A text of exactly chunkSize still produces the overlap tail window
TEST(TextChunkerTest, ExactChunkSizeProducesTailWindow) {
    const QString text(1000, QChar('x'));

    const QStringList chunks = TextChunker::split(text, 1000, 200);

    ASSERT_EQ(chunks.size(), 2);
    EXPECT_EQ(chunks[0].length(), 1000);
    EXPECT_EQ(chunks[1].length(), 200);
}

// Test 4 (Overlap): The end of chunk A equals the start of chunk B
TEST(TextChunkerTest, VerifyOverlapBetweenChunks) {
    const QString text = QStringLiteral("AAAAA BBBBB CCCCC DDDDD EEEEE FFFFF GGGGG HHHHH");
    const int chunkSize = 20;
    const int chunkOverlap = 5;

    const QStringList chunks = TextChunker::split(text, chunkSize, chunkOverlap);

    ASSERT_GE(chunks.size(), 2);
    for (int i = 0; i < chunks.size() - 1; ++i) {
        if (chunks[i].length() < chunkSize) {
            continue;
        }
        EXPECT_EQ(chunks[i].right(chunkOverlap), chunks[i + 1].left(chunkOverlap))
            << "Chunks " << i << " and " << i + 1 << " do not share the overlap";
    }
}

// Test 5 (Coverage): Every character of the input lands in at least one chunk
TEST(TextChunkerTest, ChunksCoverWholeText) {
    const QString text = QStringLiteral("The quick brown fox jumps over the lazy dog. ").repeated(13);
    const int chunkSize = 37;
    const int chunkOverlap = 11;
    const int step = chunkSize - chunkOverlap;

    const QStringList chunks = TextChunker::split(text, chunkSize, chunkOverlap);

    QString rebuilt = chunks.first();
    for (int i = 1; i < chunks.size(); ++i) {
        // Each window starts step characters after the previous one.
        rebuilt = rebuilt.left(i * step) + chunks[i];
    }
    EXPECT_EQ(rebuilt, text);
    for (const QString& chunk : chunks) {
        EXPECT_LE(chunk.length(), chunkSize);
        EXPECT_FALSE(chunk.isEmpty());
    }
}

// Test 6 (Purity): Repeated calls give identical output
TEST(TextChunkerTest, SplitIsDeterministic) {
    const QString text = QStringLiteral("Lorem ipsum dolor sit amet, consectetur adipiscing elit. ").repeated(40);

    EXPECT_EQ(TextChunker::split(text, 120, 30), TextChunker::split(text, 120, 30));
}

// Test 7 (Empty): Empty input yields no chunks
TEST(TextChunkerTest, EmptyTextYieldsNoChunks) {
    EXPECT_TRUE(TextChunker::split(QString(), 1000, 200).isEmpty());
    EXPECT_EQ(TextChunker::expectedChunkCount(0, 1000, 200), 0);
}

// Test 8 (Validation): Size/overlap invariant violations throw
TEST(TextChunkerTest, InvalidArgumentsThrow) {
    const QString text = QStringLiteral("abc");
    EXPECT_THROW(TextChunker::split(text, 0, 0), std::invalid_argument);
    EXPECT_THROW(TextChunker::split(text, -5, 0), std::invalid_argument);
    EXPECT_THROW(TextChunker::split(text, 10, -1), std::invalid_argument);
    EXPECT_THROW(TextChunker::split(text, 10, 10), std::invalid_argument);
    EXPECT_THROW(TextChunker::split(text, 10, 11), std::invalid_argument);
    // Validation happens before the empty-text shortcut.
    EXPECT_THROW(TextChunker::split(QString(), 10, 10), std::invalid_argument);
}

// Test 9 (Unicode): Accented BMP text is windowed per character
TEST(TextChunkerTest, NonAsciiTextKeepsCharacters) {
    const QString text = QString::fromUtf8("\xC3\xA9t\xC3\xA9 \xC3\xA0 la plage, d\xC3\xA9j\xC3\xA0 vu");

    const QStringList chunks = TextChunker::split(text, 8, 2);

    ASSERT_FALSE(chunks.isEmpty());
    EXPECT_TRUE(chunks.first().startsWith(QString::fromUtf8("\xC3\xA9t\xC3\xA9")));
}

// Test 10 (Unicode): An astral character at a window edge stays whole
TEST(TextChunkerTest, SurrogatePairIsNeverSplit) {
    const QString emoji = QString::fromUtf8("\xF0\x9F\x98\x80");
    ASSERT_EQ(emoji.size(), 2);
    const QString text = QString(999, QLatin1Char('x')) + emoji;

    const QStringList chunks = TextChunker::split(text, 1000, 200);

    // 1000 characters fit in one window even though they take 1001 UTF-16 units.
    ASSERT_EQ(chunks.size(), 2);
    EXPECT_EQ(chunks.at(0), text);
    EXPECT_TRUE(chunks.at(1).endsWith(emoji));
    for (const QString& chunk : chunks) {
        EXPECT_FALSE(chunk.back().isHighSurrogate());
        EXPECT_FALSE(chunk.front().isLowSurrogate());
    }

    // Every window edge lands between two emoji.
    const QString allEmoji = emoji.repeated(7);
    for (const QString& chunk : TextChunker::split(allEmoji, 3, 1)) {
        EXPECT_EQ(chunk.size() % 2, 0);
        EXPECT_TRUE(chunk.startsWith(emoji));
        EXPECT_TRUE(chunk.endsWith(emoji));
    }
    EXPECT_EQ(TextChunker::split(allEmoji, 3, 1).first(), emoji.repeated(3));
}
