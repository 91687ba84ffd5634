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

#include "DocumentPipeline.h"

#include "DocumentLoader.h"
#include "Embedder.h"
#include "VectorStore.h"
#include "logging_categories.h"

#include <QElapsedTimer>

#include <stdexcept>

DocumentPipeline::DocumentPipeline(VectorStore& store)
    : DocumentPipeline(store, Options())
{
}

DocumentPipeline::DocumentPipeline(VectorStore& store, Options options)
    : m_store(store)
    , m_embedder(store.embedder())
    , m_options(options)
{
}

IngestResult DocumentPipeline::ingest(const QString& rawText, const QString& workspaceId, const QString& sourceLabel)
{
    QElapsedTimer timer;
    timer.start();

    const QStringList chunks = TextChunker::split(rawText, m_options.chunkSize, m_options.chunkOverlap);

    IngestResult result;
    result.sourceLabel = sourceLabel;
    if (chunks.isEmpty()) {
        m_store.getOrCreateCollection(workspaceId);
        qCInfo(kf_pipeline) << "No text chunks in" << sourceLabel << "for workspace" << workspaceId;
        return result;
    }

    const std::vector<EmbeddingVector> vectors = m_embedder.embed(chunks);
    if (vectors.size() != static_cast<size_t>(chunks.size())) {
        throw std::runtime_error(QStringLiteral("Embedder returned %1 vectors for %2 chunks")
                                     .arg(vectors.size())
                                     .arg(chunks.size())
                                     .toStdString());
    }

    Metadata tag;
    tag.insert(QString::fromLatin1(kMetaWorkspaceId), workspaceId);
    tag.insert(QString::fromLatin1(kMetaFilename), sourceLabel);
    const QList<Metadata> metadata(chunks.size(), tag);

    result.ids = m_store.addDocuments(workspaceId, chunks, vectors, metadata);
    result.chunkCount = result.ids.size();

    qCInfo(kf_pipeline) << "Ingested" << sourceLabel << "into workspace" << workspaceId << ":"
                        << result.chunkCount << "chunks in" << timer.elapsed() << "ms";
    return result;
}

IngestResult DocumentPipeline::ingestFile(const QString& filePath, const QString& workspaceId, const QString& sourceLabel)
{
    bool ok = false;
    const QString text = DocumentLoader::readTextFile(filePath, &ok);
    if (!ok) {
        throw std::runtime_error(QStringLiteral("Cannot read document '%1'").arg(filePath).toStdString());
    }

    const QString label = sourceLabel.isEmpty() ? DocumentLoader::sourceLabelFor(filePath) : sourceLabel;
    return ingest(text, workspaceId, label);
}
