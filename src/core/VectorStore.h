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

#include <QHash>
#include <QMutex>
#include <QString>
#include <QStringList>

#include <memory>
#include <vector>

#include "CommonDataTypes.h"

class IEmbedder;

/**
 * @brief Handle to one workspace's collection.
 *
 * Handles are cheap descriptors of the backing file; they hold no open
 * connection. Every store operation opens its own uniquely named connection.
 */
class VectorCollection {
public:
    VectorCollection(QString name, QString workspaceId, QString databasePath, int dimension)
        : m_name(std::move(name))
        , m_workspaceId(std::move(workspaceId))
        , m_databasePath(std::move(databasePath))
        , m_dimension(dimension)
    {
    }

    const QString& name() const { return m_name; }
    const QString& workspaceId() const { return m_workspaceId; }
    const QString& databasePath() const { return m_databasePath; }
    int dimension() const { return m_dimension; }

private:
    QString m_name;
    QString m_workspaceId;
    QString m_databasePath;
    int m_dimension;
};

using CollectionHandle = std::shared_ptr<VectorCollection>;

struct CollectionInfo {
    QString name;
    QString workspaceId;
    int count {0};
};

/**
 * @brief Per-workspace vector store persisted as one SQLite file per workspace.
 *
 * The store owns the workspace -> collection cache (guarded by a mutex) and
 * the embedder used for query vectors. Not a singleton: create one per store
 * directory and pass it by reference.
 *
 * Errors: StorageUnavailableError when a file cannot be opened or created,
 * StorageCorruptError when a collection's schema is incompatible even after
 * the one-time reset, WorkspaceMismatchError when a collection file records
 * another workspace (never reset), std::invalid_argument for bad input.
 */
class VectorStore {
public:
    /**
     * @param storePath Directory holding the collection files; created on demand.
     * @param embedder Used by search() for query vectors and to fix the dimension.
     * @param allowReset When false, corruption is surfaced immediately instead of
     *        wiping the store directory.
     */
    VectorStore(QString storePath, std::shared_ptr<IEmbedder> embedder, bool allowReset = true);
    ~VectorStore();

    VectorStore(const VectorStore&) = delete;
    VectorStore& operator=(const VectorStore&) = delete;

    /**
     * @brief Returns the collection for @p workspaceId, creating it on first use.
     *
     * Idempotent. Concurrent first calls may both create; the deterministic file
     * name means they end up on the same file and the last cache write wins.
     */
    CollectionHandle getOrCreateCollection(const QString& workspaceId);

    /**
     * @brief Atomically appends entries to a workspace's collection.
     *
     * @param metadataList Either empty (every entry gets {workflow_id: workspaceId})
     *        or one map per text.
     * @return Fresh UUIDs, one per text, in input order.
     * @throws std::invalid_argument when lengths differ or a vector has the wrong dimension
     */
    QStringList addDocuments(const QString& workspaceId,
                             const QStringList& texts,
                             const std::vector<EmbeddingVector>& vectors,
                             const QList<Metadata>& metadataList = {});

    /**
     * @brief k nearest neighbours of @p queryText by cosine distance.
     *
     * The query is embedded with the store's embedder. Results are ordered by
     * increasing distance, ties by insertion order. An empty collection or
     * k <= 0 yields an empty list.
     */
    std::vector<SearchHit> search(const QString& workspaceId, const QString& queryText, int k = 5);

    /// search() with a precomputed query vector.
    std::vector<SearchHit> searchByVector(const QString& workspaceId, const EmbeddingVector& query, int k = 5);

    /// Removes the workspace's collection file. A missing collection is not an error.
    void deleteCollection(const QString& workspaceId);

    /// Removes every entry but keeps the (empty) collection.
    void clearCollection(const QString& workspaceId);

    /// Removes entries whose metadata filename equals @p sourceLabel.
    int deleteDocumentsBySource(const QString& workspaceId, const QString& sourceLabel);

    int count(const QString& workspaceId);

    /// Full scan in insertion order.
    std::vector<IndexEntry> getAll(const QString& workspaceId);

    std::vector<CollectionInfo> listCollections();

    const IEmbedder& embedder() const { return *m_embedder; }
    const QString& storePath() const { return m_storePath; }
    int dimension() const;

private:
    enum class RecoveryState {
        Normal,
        DetectedCorruption,
        Reset,
        Retry,
        Fatal
    };

    template <typename Fn>
    auto withRecovery(const char* operation, Fn&& fn) -> decltype(fn());

    CollectionHandle collectionFor(const QString& workspaceId);
    CollectionHandle openOrCreate(const QString& workspaceId);
    void ensureStoreDirectory() const;
    void resetStore();
    QString databasePathFor(const QString& collectionName) const;

    QString m_storePath;
    std::shared_ptr<IEmbedder> m_embedder;
    bool m_allowReset;

    QMutex m_mutex;
    QHash<QString, CollectionHandle> m_collections;
};
