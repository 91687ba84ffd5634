#pragma once

#include <QHash>
#include <QMutex>
#include <QString>
#include <QStringList>

/// File name of the persistent catalog inside a store directory. Outside the
/// "workflow_*" pattern, so a store reset leaves it alone.
constexpr const char* kDocumentCatalogFileName = "documents.sqlite";

/**
 * @brief Source of the document names known for a workspace.
 *
 * In a deployment this is the relational metadata store that records uploads;
 * context matching uses the names to recognize chunks whose workspace tag is
 * missing or stale.
 */
class IDocumentCatalog {
public:
    virtual ~IDocumentCatalog() = default;
    virtual QStringList listDocumentNames(const QString& workspaceId) const = 0;
};

/**
 * @brief Thread-safe in-process catalog.
 */
class InMemoryDocumentCatalog : public IDocumentCatalog {
public:
    void addDocument(const QString& workspaceId, const QString& name);
    bool removeDocument(const QString& workspaceId, const QString& name);
    void clearWorkspace(const QString& workspaceId);

    QStringList listDocumentNames(const QString& workspaceId) const override;

private:
    mutable QMutex m_mutex;
    QHash<QString, QStringList> m_documents;
};

/**
 * @brief Persistent catalog in its own SQLite file, kept apart from the
 *        collection files so a store reset or a stray filename tag in an
 *        index never changes what a workspace is known to contain.
 *
 * Every call opens its own connection; errors surface as StorageError.
 */
class SqlDocumentCatalog : public IDocumentCatalog {
public:
    /// Creates the documents table in @p databasePath if needed.
    explicit SqlDocumentCatalog(QString databasePath);

    void addDocument(const QString& workspaceId, const QString& name);
    bool removeDocument(const QString& workspaceId, const QString& name);
    void clearWorkspace(const QString& workspaceId);

    /// Names in the order they were first added.
    QStringList listDocumentNames(const QString& workspaceId) const override;

    const QString& databasePath() const { return m_databasePath; }

private:
    QString m_databasePath;
};
