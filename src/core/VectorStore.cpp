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

#include "VectorStore.h"

#include "Embedder.h"
#include "Errors.h"
#include "RagUtils.h"
#include "Logger.h"
#include "logging_categories.h"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QMutexLocker>
#include <QtCore/QUuid>
#include <QtCore/QVariant>
#include <QtSql/QSqlDatabase>
#include <QtSql/QSqlError>
#include <QtSql/QSqlQuery>

#include <algorithm>
#include <stdexcept>

namespace {

const QString kSqliteDriver = QStringLiteral("QSQLITE");

[[noreturn]] void throwSqlError(const QString& context, const QSqlError& error)
{
    const QString text = error.text();
    const QString message = QStringLiteral("%1: %2").arg(context, text);
    if (RagUtils::isCorruptionMessage(text)) {
        throw StorageCorruptError(message);
    }
    throw StorageError(message);
}

void execOrThrow(QSqlQuery& query, const QString& sql, const QString& context)
{
    if (!query.exec(sql)) {
        throwSqlError(context, query.lastError());
    }
}

// Owns one uniquely named QSQLITE connection for the duration of a single
// store operation. QSqlDatabase/QSqlQuery copies obtained from database()
// must be declared after this object so they are destroyed first.
class ScopedConnection {
public:
    explicit ScopedConnection(const QString& databasePath)
        : m_name(QStringLiteral("kf_store_%1").arg(QUuid::createUuid().toString(QUuid::Id128)))
    {
        QString openError;
        {
            QSqlDatabase db = QSqlDatabase::addDatabase(kSqliteDriver, m_name);
            db.setDatabaseName(databasePath);
            if (!db.open()) {
                openError = db.lastError().text();
            }
        }
        if (!openError.isEmpty()) {
            QSqlDatabase::removeDatabase(m_name);
            const QString message = QStringLiteral("Failed to open collection database '%1': %2")
                                        .arg(databasePath, openError);
            if (RagUtils::isCorruptionMessage(openError)) {
                throw StorageCorruptError(message);
            }
            throw StorageUnavailableError(message);
        }
    }

    ~ScopedConnection()
    {
        {
            QSqlDatabase db = QSqlDatabase::database(m_name, false);
            if (db.isOpen()) {
                db.close();
            }
        }
        QSqlDatabase::removeDatabase(m_name);
    }

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    QSqlDatabase database() const { return QSqlDatabase::database(m_name, false); }

private:
    QString m_name;
};

void verifyEntriesColumns(QSqlQuery& query, const QString& collectionName)
{
    execOrThrow(query, QStringLiteral("PRAGMA table_info(entries)"),
                QStringLiteral("Failed to inspect schema of '%1'").arg(collectionName));

    QStringList columns;
    while (query.next()) {
        columns << query.value(1).toString();
    }

    static const QStringList required = {
        QStringLiteral("seq"),
        QStringLiteral("id"),
        QStringLiteral("content"),
        QStringLiteral("embedding"),
        QStringLiteral("metadata"),
    };
    for (const QString& column : required) {
        if (!columns.contains(column)) {
            throw StorageCorruptError(QStringLiteral("Collection '%1' has an incompatible schema: no such column '%2'")
                                          .arg(collectionName, column));
        }
    }
}

} // namespace

VectorStore::VectorStore(QString storePath, std::shared_ptr<IEmbedder> embedder, bool allowReset)
    : m_storePath(std::move(storePath))
    , m_embedder(std::move(embedder))
    , m_allowReset(allowReset)
{
    if (!m_embedder) {
        throw std::invalid_argument("VectorStore requires an embedder");
    }
    if (m_storePath.isEmpty()) {
        throw std::invalid_argument("VectorStore requires a store path");
    }
    if (!QSqlDatabase::isDriverAvailable(kSqliteDriver)) {
        throw StorageUnavailableError(QStringLiteral("Qt SQL driver %1 is not available").arg(kSqliteDriver));
    }
}

VectorStore::~VectorStore() = default;

int VectorStore::dimension() const
{
    return m_embedder->dimension();
}

QString VectorStore::databasePathFor(const QString& collectionName) const
{
    return QDir(m_storePath).filePath(collectionName + QLatin1String(kCollectionFileSuffix));
}

void VectorStore::ensureStoreDirectory() const
{
    if (!QDir().mkpath(m_storePath)) {
        throw StorageUnavailableError(QStringLiteral("Cannot create vector store directory '%1'").arg(m_storePath));
    }
}

// Bounded recovery: Normal -> DetectedCorruption -> Reset -> Retry -> {Normal | Fatal}.
// At most one reset per call; a second corruption (or a disabled reset) is fatal.
template <typename Fn>
auto VectorStore::withRecovery(const char* operation, Fn&& fn) -> decltype(fn())
{
    RecoveryState state = RecoveryState::Normal;
    for (;;) {
        try {
            return fn();
        } catch (const StorageCorruptError& e) {
            if (state == RecoveryState::Retry || !m_allowReset) {
                state = RecoveryState::Fatal;
                qCCritical(kf_store) << operation << "failed, store is unusable:" << e.what();
                throw;
            }
            state = RecoveryState::DetectedCorruption;
            qCWarning(kf_store) << operation << "detected an incompatible collection:" << e.what();

            resetStore();
            state = RecoveryState::Reset;
            KF_WARN << "Vector store at " << m_storePath
                    << " was reset after a schema error; all workspaces must be re-ingested.";

            state = RecoveryState::Retry;
        }
    }
}

void VectorStore::resetStore()
{
    QMutexLocker lock(&m_mutex);
    m_collections.clear();

    QDir dir(m_storePath);
    if (!dir.exists()) {
        return;
    }

    // Only collection files are removed; the directory may be shared.
    const QStringList files = dir.entryList({QStringLiteral("workflow_*")}, QDir::Files);
    for (const QString& file : files) {
        if (!dir.remove(file)) {
            throw StorageUnavailableError(QStringLiteral("Failed to remove '%1' during store reset")
                                              .arg(dir.filePath(file)));
        }
    }
    qCWarning(kf_store) << "Removed" << files.size() << "collection files from" << m_storePath;
}

CollectionHandle VectorStore::openOrCreate(const QString& workspaceId)
{
    ensureStoreDirectory();

    const QString name = RagUtils::collectionNameFor(workspaceId);
    const QString path = databasePathFor(name);
    const int dim = dimension();

    ScopedConnection conn(path);
    QSqlDatabase db = conn.database();
    QSqlQuery query(db);

    execOrThrow(query, QString::fromLatin1(kCollectionSchemaInfo),
                QStringLiteral("Failed to create collection_info in '%1'").arg(name));
    execOrThrow(query, QString::fromLatin1(kCollectionSchemaEntries),
                QStringLiteral("Failed to create entries in '%1'").arg(name));
    verifyEntriesColumns(query, name);

    execOrThrow(query, QStringLiteral("SELECT key, value FROM collection_info"),
                QStringLiteral("Failed to read collection_info of '%1'").arg(name));
    QHash<QString, QString> info;
    while (query.next()) {
        info.insert(query.value(0).toString(), query.value(1).toString());
    }

    if (info.isEmpty()) {
        if (!query.prepare(QStringLiteral("INSERT OR REPLACE INTO collection_info (key, value) VALUES (?, ?)"))) {
            throwSqlError(QStringLiteral("Failed to prepare collection_info insert"), query.lastError());
        }
        const QList<QPair<QString, QString>> rows = {
            {QStringLiteral("workspace_id"), workspaceId},
            {QStringLiteral("schema_version"), QString::number(kCollectionSchemaVersion)},
            {QStringLiteral("dimension"), QString::number(dim)},
            {QStringLiteral("embedder"), m_embedder->id()},
        };
        for (const auto& row : rows) {
            query.addBindValue(row.first);
            query.addBindValue(row.second);
            if (!query.exec()) {
                throwSqlError(QStringLiteral("Failed to write collection_info of '%1'").arg(name), query.lastError());
            }
        }
        qCInfo(kf_store) << "Created collection" << name << "for workspace" << workspaceId;
    } else {
        if (info.value(QStringLiteral("schema_version")).toInt() != kCollectionSchemaVersion) {
            throw StorageCorruptError(QStringLiteral("Collection '%1' has schema version %2, expected %3")
                                          .arg(name, info.value(QStringLiteral("schema_version")))
                                          .arg(kCollectionSchemaVersion));
        }
        if (info.value(QStringLiteral("dimension")).toInt() != dim) {
            throw StorageCorruptError(QStringLiteral("Collection '%1' stores %2-dimensional vectors, embedder produces %3")
                                          .arg(name, info.value(QStringLiteral("dimension")))
                                          .arg(dim));
        }
        if (info.value(QStringLiteral("workspace_id")) != workspaceId) {
            throw WorkspaceMismatchError(QStringLiteral("Collection '%1' belongs to workspace '%2', not '%3'")
                                             .arg(name, info.value(QStringLiteral("workspace_id")), workspaceId));
        }
        if (info.value(QStringLiteral("embedder")) != m_embedder->id()) {
            qCWarning(kf_store) << "Collection" << name << "was built with embedder"
                                << info.value(QStringLiteral("embedder")) << "but the store uses" << m_embedder->id();
        }
    }

    return std::make_shared<VectorCollection>(name, workspaceId, path, dim);
}

CollectionHandle VectorStore::collectionFor(const QString& workspaceId)
{
    if (workspaceId.isEmpty()) {
        throw std::invalid_argument("Workspace id must not be empty");
    }

    {
        QMutexLocker lock(&m_mutex);
        const auto it = m_collections.constFind(workspaceId);
        if (it != m_collections.constEnd() && QFileInfo::exists((*it)->databasePath())) {
            return *it;
        }
    }

    CollectionHandle handle = openOrCreate(workspaceId);

    QMutexLocker lock(&m_mutex);
    m_collections.insert(workspaceId, handle);
    return handle;
}

CollectionHandle VectorStore::getOrCreateCollection(const QString& workspaceId)
{
    return withRecovery("getOrCreateCollection", [&]() { return collectionFor(workspaceId); });
}

QStringList VectorStore::addDocuments(const QString& workspaceId,
                                      const QStringList& texts,
                                      const std::vector<EmbeddingVector>& vectors,
                                      const QList<Metadata>& metadataList)
{
    if (texts.size() != static_cast<int>(vectors.size())) {
        throw std::invalid_argument(QStringLiteral("addDocuments: %1 texts but %2 vectors")
                                        .arg(texts.size())
                                        .arg(vectors.size())
                                        .toStdString());
    }
    if (!metadataList.isEmpty() && metadataList.size() != texts.size()) {
        throw std::invalid_argument(QStringLiteral("addDocuments: %1 texts but %2 metadata entries")
                                        .arg(texts.size())
                                        .arg(metadataList.size())
                                        .toStdString());
    }
    const int dim = dimension();
    for (size_t i = 0; i < vectors.size(); ++i) {
        if (static_cast<int>(vectors[i].size()) != dim) {
            throw std::invalid_argument(QStringLiteral("addDocuments: vector %1 has dimension %2, expected %3")
                                            .arg(i)
                                            .arg(vectors[i].size())
                                            .arg(dim)
                                            .toStdString());
        }
    }

    return withRecovery("addDocuments", [&]() -> QStringList {
        CollectionHandle handle = collectionFor(workspaceId);
        QStringList ids;
        if (texts.isEmpty()) {
            return ids;
        }
        ids.reserve(texts.size());

        ScopedConnection conn(handle->databasePath());
        QSqlDatabase db = conn.database();
        if (!db.transaction()) {
            throwSqlError(QStringLiteral("Failed to begin transaction on '%1'").arg(handle->name()), db.lastError());
        }

        QSqlQuery query(db);
        if (!query.prepare(QStringLiteral("INSERT INTO entries (id, content, embedding, metadata) VALUES (?, ?, ?, ?)"))) {
            const QSqlError error = query.lastError();
            db.rollback();
            throwSqlError(QStringLiteral("Failed to prepare insert on '%1'").arg(handle->name()), error);
        }

        for (int i = 0; i < texts.size(); ++i) {
            const QString id = QUuid::createUuid().toString(QUuid::WithoutBraces);
            const Metadata metadata = metadataList.isEmpty()
                ? Metadata{{QString::fromLatin1(kMetaWorkspaceId), workspaceId}}
                : metadataList.at(i);

            query.addBindValue(id);
            query.addBindValue(texts.at(i));
            query.addBindValue(RagUtils::vectorToBlob(vectors[static_cast<size_t>(i)]));
            query.addBindValue(RagUtils::metadataToJson(metadata));
            if (!query.exec()) {
                const QSqlError error = query.lastError();
                query.finish();
                db.rollback();
                throwSqlError(QStringLiteral("Failed to insert entry %1 into '%2'").arg(i).arg(handle->name()), error);
            }
            ids.append(id);
        }
        query.finish();

        if (!db.commit()) {
            const QSqlError error = db.lastError();
            db.rollback();
            throwSqlError(QStringLiteral("Failed to commit %1 entries to '%2'").arg(ids.size()).arg(handle->name()), error);
        }

        qCDebug(kf_store) << "Added" << ids.size() << "entries to" << handle->name();
        return ids;
    });
}

std::vector<SearchHit> VectorStore::search(const QString& workspaceId, const QString& queryText, int k)
{
    if (k <= 0) {
        return {};
    }
    return searchByVector(workspaceId, m_embedder->embedOne(queryText), k);
}

std::vector<SearchHit> VectorStore::searchByVector(const QString& workspaceId, const EmbeddingVector& queryVector, int k)
{
    if (k <= 0) {
        return {};
    }
    if (static_cast<int>(queryVector.size()) != dimension()) {
        throw std::invalid_argument(QStringLiteral("search: query vector has dimension %1, expected %2")
                                        .arg(queryVector.size())
                                        .arg(dimension())
                                        .toStdString());
    }

    return withRecovery("search", [&]() -> std::vector<SearchHit> {
        CollectionHandle handle = collectionFor(workspaceId);

        struct Scored {
            qint64 seq;
            SearchHit hit;
        };
        std::vector<Scored> scored;

        {
            ScopedConnection conn(handle->databasePath());
            QSqlDatabase db = conn.database();
            QSqlQuery query(db);
            execOrThrow(query, QStringLiteral("SELECT seq, content, embedding, metadata FROM entries"),
                        QStringLiteral("Failed to scan '%1'").arg(handle->name()));

            while (query.next()) {
                const EmbeddingVector vec = RagUtils::blobToVector(query.value(2).toByteArray());
                if (vec.size() != queryVector.size()) {
                    qCWarning(kf_store) << "Skipping entry" << query.value(0).toLongLong() << "in" << handle->name()
                                        << "with a malformed embedding";
                    continue;
                }
                Scored s;
                s.seq = query.value(0).toLongLong();
                s.hit.text = query.value(1).toString();
                s.hit.metadata = RagUtils::metadataFromJson(query.value(3).toString());
                s.hit.distance = RagUtils::cosineDistance(queryVector, vec);
                scored.push_back(std::move(s));
            }
        }

        std::sort(scored.begin(), scored.end(), [](const Scored& lhs, const Scored& rhs) {
            if (lhs.hit.distance == rhs.hit.distance) {
                return lhs.seq < rhs.seq;
            }
            return lhs.hit.distance < rhs.hit.distance;
        });

        std::vector<SearchHit> results;
        const size_t limit = std::min(scored.size(), static_cast<size_t>(k));
        results.reserve(limit);
        for (size_t i = 0; i < limit; ++i) {
            results.push_back(std::move(scored[i].hit));
        }
        return results;
    });
}

void VectorStore::deleteCollection(const QString& workspaceId)
{
    if (workspaceId.isEmpty()) {
        throw std::invalid_argument("deleteCollection: workspace id must not be empty");
    }

    {
        QMutexLocker lock(&m_mutex);
        m_collections.remove(workspaceId);
    }

    const QString base = databasePathFor(RagUtils::collectionNameFor(workspaceId));
    for (const QString& path : {base, base + QStringLiteral("-journal"), base + QStringLiteral("-wal"),
                                base + QStringLiteral("-shm")}) {
        if (QFile::exists(path) && !QFile::remove(path)) {
            throw StorageUnavailableError(QStringLiteral("Failed to delete '%1'").arg(path));
        }
    }
    qCInfo(kf_store) << "Deleted collection for workspace" << workspaceId;
}

void VectorStore::clearCollection(const QString& workspaceId)
{
    withRecovery("clearCollection", [&]() {
        CollectionHandle handle = collectionFor(workspaceId);
        ScopedConnection conn(handle->databasePath());
        QSqlDatabase db = conn.database();
        QSqlQuery query(db);
        execOrThrow(query, QStringLiteral("DELETE FROM entries"),
                    QStringLiteral("Failed to clear '%1'").arg(handle->name()));
        qCInfo(kf_store) << "Cleared" << query.numRowsAffected() << "entries from" << handle->name();
    });
}

int VectorStore::deleteDocumentsBySource(const QString& workspaceId, const QString& sourceLabel)
{
    return withRecovery("deleteDocumentsBySource", [&]() -> int {
        CollectionHandle handle = collectionFor(workspaceId);
        ScopedConnection conn(handle->databasePath());
        QSqlDatabase db = conn.database();

        QList<qint64> doomed;
        {
            QSqlQuery scan(db);
            execOrThrow(scan, QStringLiteral("SELECT seq, metadata FROM entries"),
                        QStringLiteral("Failed to scan '%1'").arg(handle->name()));
            while (scan.next()) {
                const Metadata metadata = RagUtils::metadataFromJson(scan.value(1).toString());
                if (metadata.value(QString::fromLatin1(kMetaFilename)).toString() == sourceLabel) {
                    doomed.append(scan.value(0).toLongLong());
                }
            }
        }

        if (doomed.isEmpty()) {
            return 0;
        }

        if (!db.transaction()) {
            throwSqlError(QStringLiteral("Failed to begin transaction on '%1'").arg(handle->name()), db.lastError());
        }
        QSqlQuery remove(db);
        if (!remove.prepare(QStringLiteral("DELETE FROM entries WHERE seq = ?"))) {
            const QSqlError error = remove.lastError();
            db.rollback();
            throwSqlError(QStringLiteral("Failed to prepare delete on '%1'").arg(handle->name()), error);
        }
        for (qint64 seq : doomed) {
            remove.addBindValue(seq);
            if (!remove.exec()) {
                const QSqlError error = remove.lastError();
                remove.finish();
                db.rollback();
                throwSqlError(QStringLiteral("Failed to delete entry %1 from '%2'").arg(seq).arg(handle->name()), error);
            }
        }
        remove.finish();
        if (!db.commit()) {
            const QSqlError error = db.lastError();
            db.rollback();
            throwSqlError(QStringLiteral("Failed to commit delete on '%1'").arg(handle->name()), error);
        }

        qCInfo(kf_store) << "Removed" << doomed.size() << "entries of" << sourceLabel << "from" << handle->name();
        return doomed.size();
    });
}

int VectorStore::count(const QString& workspaceId)
{
    return withRecovery("count", [&]() -> int {
        CollectionHandle handle = collectionFor(workspaceId);
        ScopedConnection conn(handle->databasePath());
        QSqlDatabase db = conn.database();
        QSqlQuery query(db);
        execOrThrow(query, QStringLiteral("SELECT COUNT(*) FROM entries"),
                    QStringLiteral("Failed to count '%1'").arg(handle->name()));
        return query.next() ? query.value(0).toInt() : 0;
    });
}

std::vector<IndexEntry> VectorStore::getAll(const QString& workspaceId)
{
    return withRecovery("getAll", [&]() -> std::vector<IndexEntry> {
        CollectionHandle handle = collectionFor(workspaceId);
        ScopedConnection conn(handle->databasePath());
        QSqlDatabase db = conn.database();
        QSqlQuery query(db);
        execOrThrow(query, QStringLiteral("SELECT id, content, embedding, metadata FROM entries ORDER BY seq"),
                    QStringLiteral("Failed to scan '%1'").arg(handle->name()));

        std::vector<IndexEntry> entries;
        while (query.next()) {
            IndexEntry entry;
            entry.id = query.value(0).toString();
            entry.text = query.value(1).toString();
            entry.vector = RagUtils::blobToVector(query.value(2).toByteArray());
            entry.metadata = RagUtils::metadataFromJson(query.value(3).toString());
            entries.push_back(std::move(entry));
        }
        return entries;
    });
}

std::vector<CollectionInfo> VectorStore::listCollections()
{
    return withRecovery("listCollections", [&]() -> std::vector<CollectionInfo> {
        std::vector<CollectionInfo> result;
        QDir dir(m_storePath);
        if (!dir.exists()) {
            return result;
        }

        const QString pattern = QStringLiteral("workflow_*") + QLatin1String(kCollectionFileSuffix);
        const QStringList files = dir.entryList({pattern}, QDir::Files, QDir::Name);
        for (const QString& file : files) {
            CollectionInfo info;
            info.name = file.left(file.size() - static_cast<int>(qstrlen(kCollectionFileSuffix)));

            ScopedConnection conn(dir.filePath(file));
            QSqlDatabase db = conn.database();
            QSqlQuery query(db);
            execOrThrow(query, QStringLiteral("SELECT value FROM collection_info WHERE key = 'workspace_id'"),
                        QStringLiteral("Failed to read collection_info of '%1'").arg(info.name));
            if (query.next()) {
                info.workspaceId = query.value(0).toString();
            }
            execOrThrow(query, QStringLiteral("SELECT COUNT(*) FROM entries"),
                        QStringLiteral("Failed to count '%1'").arg(info.name));
            if (query.next()) {
                info.count = query.value(0).toInt();
            }
            result.push_back(info);
        }
        return result;
    });
}
