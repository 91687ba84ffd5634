#include "TextChunker.h"

#include <QVector>

#include <algorithm>
#include <stdexcept>
#include <string>

void TextChunker::validate(int chunkSize, int chunkOverlap)
{
    if (chunkSize <= 0) {
        throw std::invalid_argument("TextChunker: chunkSize must be positive, got "
                                    + std::to_string(chunkSize));
    }
    if (chunkOverlap < 0) {
        throw std::invalid_argument("TextChunker: chunkOverlap must not be negative, got "
                                    + std::to_string(chunkOverlap));
    }
    if (chunkOverlap >= chunkSize) {
        // A non-advancing window would never terminate.
        throw std::invalid_argument("TextChunker: chunkOverlap (" + std::to_string(chunkOverlap)
                                    + ") must be smaller than chunkSize ("
                                    + std::to_string(chunkSize) + ")");
    }
}

QStringList TextChunker::split(const QString& text, int chunkSize, int chunkOverlap)
{
    validate(chunkSize, chunkOverlap);

    QStringList chunks;
    if (text.isEmpty()) {
        return chunks;
    }

    // UTF-16 offset of every code point, plus the end of the text. An astral
    // character is a surrogate pair and counts as one position.
    QVector<int> offsets;
    offsets.reserve(text.size() + 1);
    for (int i = 0; i < text.size(); ++i) {
        offsets.append(i);
        if (text.at(i).isHighSurrogate() && i + 1 < text.size() && text.at(i + 1).isLowSurrogate()) {
            ++i;
        }
    }
    const int length = offsets.size();
    offsets.append(text.size());

    const int step = chunkSize - chunkOverlap;
    chunks.reserve(expectedChunkCount(length, chunkSize, chunkOverlap));

    for (int start = 0; start < length; start += step) {
        const int end = std::min(start + chunkSize, length);
        chunks.append(text.mid(offsets[start], offsets[end] - offsets[start]));
    }

    return chunks;
}

int TextChunker::expectedChunkCount(int length, int chunkSize, int chunkOverlap)
{
    validate(chunkSize, chunkOverlap);
    if (length <= 0) {
        return 0;
    }
    const int step = chunkSize - chunkOverlap;
    return (length + step - 1) / step;
}
