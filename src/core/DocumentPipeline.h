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

#include "CommonDataTypes.h"
#include "TextChunker.h"

class IEmbedder;
class VectorStore;

/**
 * @brief Write path: extracted text -> chunks -> embeddings -> vector store.
 *
 * Embedding of the whole document finishes before anything is written, and the
 * write itself is one transaction, so a failing ingest leaves no chunks behind.
 * Errors from the chunker, embedder or store propagate unchanged.
 */
class DocumentPipeline {
public:
    struct Options {
        int chunkSize {TextChunker::kDefaultChunkSize};
        int chunkOverlap {TextChunker::kDefaultChunkOverlap};
    };

    /// Uses the store's own embedder, so ingest and query vectors always match.
    explicit DocumentPipeline(VectorStore& store);
    DocumentPipeline(VectorStore& store, Options options);

    /**
     * @brief Ingests one document into a workspace.
     *
     * Every chunk is tagged {workflow_id: workspaceId, filename: sourceLabel}.
     * Empty text creates the workspace collection and yields zero chunks.
     */
    IngestResult ingest(const QString& rawText, const QString& workspaceId, const QString& sourceLabel);

    /**
     * @brief Reads a UTF-8 text file and ingests it.
     * @param sourceLabel Defaults to the file name when empty.
     * @throws std::runtime_error when the file cannot be read
     */
    IngestResult ingestFile(const QString& filePath, const QString& workspaceId, const QString& sourceLabel = QString());

    const Options& options() const { return m_options; }

private:
    VectorStore& m_store;
    const IEmbedder& m_embedder;
    Options m_options;
};
