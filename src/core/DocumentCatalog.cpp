#include "DocumentCatalog.h"

#include "Errors.h"
#include "logging_categories.h"

#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>
#include <QUuid>
#include <QVariant>
#include <QtSql/QSqlDatabase>
#include <QtSql/QSqlError>
#include <QtSql/QSqlQuery>

#include <stdexcept>

void InMemoryDocumentCatalog::addDocument(const QString& workspaceId, const QString& name)
{
    QMutexLocker lock(&m_mutex);
    QStringList& names = m_documents[workspaceId];
    if (!names.contains(name)) {
        names.append(name);
    }
}

bool InMemoryDocumentCatalog::removeDocument(const QString& workspaceId, const QString& name)
{
    QMutexLocker lock(&m_mutex);
    auto it = m_documents.find(workspaceId);
    if (it == m_documents.end()) {
        return false;
    }
    return it->removeAll(name) > 0;
}

void InMemoryDocumentCatalog::clearWorkspace(const QString& workspaceId)
{
    QMutexLocker lock(&m_mutex);
    m_documents.remove(workspaceId);
}

QStringList InMemoryDocumentCatalog::listDocumentNames(const QString& workspaceId) const
{
    QMutexLocker lock(&m_mutex);
    return m_documents.value(workspaceId);
}

namespace {

const char* const kDocumentsSchema = R"(
CREATE TABLE IF NOT EXISTS documents (
    workspace_id TEXT NOT NULL,
    filename TEXT NOT NULL,
    PRIMARY KEY (workspace_id, filename)
)
)";

// One uniquely named connection per catalog call.
class CatalogConnection {
public:
    explicit CatalogConnection(const QString& databasePath)
        : m_name(QStringLiteral("kf_catalog_%1").arg(QUuid::createUuid().toString(QUuid::Id128)))
    {
        QString openError;
        {
            QSqlDatabase db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), m_name);
            db.setDatabaseName(databasePath);
            if (!db.open()) {
                openError = db.lastError().text();
            }
        }
        if (!openError.isEmpty()) {
            QSqlDatabase::removeDatabase(m_name);
            throw StorageUnavailableError(QStringLiteral("Failed to open document catalog '%1': %2")
                                              .arg(databasePath, openError));
        }
    }

    ~CatalogConnection()
    {
        {
            QSqlDatabase db = QSqlDatabase::database(m_name, false);
            if (db.isOpen()) {
                db.close();
            }
        }
        QSqlDatabase::removeDatabase(m_name);
    }

    CatalogConnection(const CatalogConnection&) = delete;
    CatalogConnection& operator=(const CatalogConnection&) = delete;

    QSqlDatabase database() const { return QSqlDatabase::database(m_name, false); }

private:
    QString m_name;
};

void execPrepared(QSqlQuery& query, const QString& context)
{
    if (!query.exec()) {
        throw StorageError(QStringLiteral("%1: %2").arg(context, query.lastError().text()));
    }
}

void prepareOrThrow(QSqlQuery& query, const QString& sql)
{
    if (!query.prepare(sql)) {
        throw StorageError(QStringLiteral("Failed to prepare '%1': %2").arg(sql, query.lastError().text()));
    }
}

} // namespace

SqlDocumentCatalog::SqlDocumentCatalog(QString databasePath)
    : m_databasePath(std::move(databasePath))
{
    if (m_databasePath.isEmpty()) {
        throw std::invalid_argument("SqlDocumentCatalog requires a database path");
    }
    if (!QDir().mkpath(QFileInfo(m_databasePath).absolutePath())) {
        throw StorageUnavailableError(QStringLiteral("Cannot create directory for document catalog '%1'")
                                          .arg(m_databasePath));
    }

    CatalogConnection conn(m_databasePath);
    QSqlDatabase db = conn.database();
    QSqlQuery query(db);
    if (!query.exec(QString::fromLatin1(kDocumentsSchema))) {
        throw StorageError(QStringLiteral("Failed to create documents table in '%1': %2")
                               .arg(m_databasePath, query.lastError().text()));
    }
}

void SqlDocumentCatalog::addDocument(const QString& workspaceId, const QString& name)
{
    CatalogConnection conn(m_databasePath);
    QSqlDatabase db = conn.database();
    QSqlQuery query(db);
    prepareOrThrow(query, QStringLiteral("INSERT OR IGNORE INTO documents (workspace_id, filename) VALUES (?, ?)"));
    query.addBindValue(workspaceId);
    query.addBindValue(name);
    execPrepared(query, QStringLiteral("Failed to record '%1' for workspace '%2'").arg(name, workspaceId));
    qCDebug(kf_store) << "Catalog: recorded" << name << "for workspace" << workspaceId;
}

bool SqlDocumentCatalog::removeDocument(const QString& workspaceId, const QString& name)
{
    CatalogConnection conn(m_databasePath);
    QSqlDatabase db = conn.database();
    QSqlQuery query(db);
    prepareOrThrow(query, QStringLiteral("DELETE FROM documents WHERE workspace_id = ? AND filename = ?"));
    query.addBindValue(workspaceId);
    query.addBindValue(name);
    execPrepared(query, QStringLiteral("Failed to remove '%1' from workspace '%2'").arg(name, workspaceId));
    return query.numRowsAffected() > 0;
}

void SqlDocumentCatalog::clearWorkspace(const QString& workspaceId)
{
    CatalogConnection conn(m_databasePath);
    QSqlDatabase db = conn.database();
    QSqlQuery query(db);
    prepareOrThrow(query, QStringLiteral("DELETE FROM documents WHERE workspace_id = ?"));
    query.addBindValue(workspaceId);
    execPrepared(query, QStringLiteral("Failed to clear catalog of workspace '%1'").arg(workspaceId));
    qCDebug(kf_store) << "Catalog: cleared" << query.numRowsAffected() << "documents of workspace" << workspaceId;
}

QStringList SqlDocumentCatalog::listDocumentNames(const QString& workspaceId) const
{
    CatalogConnection conn(m_databasePath);
    QSqlDatabase db = conn.database();
    QSqlQuery query(db);
    prepareOrThrow(query, QStringLiteral("SELECT filename FROM documents WHERE workspace_id = ? ORDER BY rowid"));
    query.addBindValue(workspaceId);
    execPrepared(query, QStringLiteral("Failed to list documents of workspace '%1'").arg(workspaceId));

    QStringList names;
    while (query.next()) {
        names.append(query.value(0).toString());
    }
    return names;
}
