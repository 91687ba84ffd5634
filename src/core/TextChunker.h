#ifndef TEXTCHUNKER_H
#define TEXTCHUNKER_H

#include <QString>
#include <QStringList>

/**
 * @brief TextChunker splits extracted document text into overlapping
 *        fixed-size character windows for embedding.
 *
 * Windows do not look for word or sentence boundaries; a chunk may end in the
 * middle of a word.
 */
class TextChunker
{
public:
    static constexpr int kDefaultChunkSize = 1000;
    static constexpr int kDefaultChunkOverlap = 200;

    /**
     * @brief Split text with a sliding window.
     *
     * @param text The input text to split
     * @param chunkSize Window length in characters, must be > 0
     * @param chunkOverlap Characters shared by consecutive windows, must satisfy
     *        0 <= chunkOverlap < chunkSize
     * @return QStringList The windows in document order; empty for empty text
     * @throws std::invalid_argument when the size/overlap invariant is violated
     *
     * Window i spans [start, start + chunkSize); the next window starts at
     * start + chunkSize - chunkOverlap. Splitting stops once start reaches the
     * end of the text, so the last window may be shorter than chunkSize.
     * Positions count Unicode code points, so a surrogate pair is never split.
     */
    static QStringList split(const QString& text,
                             int chunkSize = kDefaultChunkSize,
                             int chunkOverlap = kDefaultChunkOverlap);

    /**
     * @brief Number of windows split() produces for a text of @p length characters.
     */
    static int expectedChunkCount(int length, int chunkSize, int chunkOverlap);

private:
    static void validate(int chunkSize, int chunkOverlap);
};

#endif // TEXTCHUNKER_H
