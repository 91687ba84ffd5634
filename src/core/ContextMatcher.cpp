//
// KnowledgeFlow
//
// Copyright (c) 2025 Adrian Sutherland
//

#include "ContextMatcher.h"

#include "DocumentCatalog.h"
#include "VectorStore.h"
#include "logging_categories.h"

#include <QHash>

bool WorkspaceIdMatcher::matches(const IndexEntry& entry, const MatchContext& context) const
{
    const QString tagged = entry.metadata.value(QString::fromLatin1(kMetaWorkspaceId)).toString();
    return !tagged.isEmpty() && tagged == context.workspaceId;
}

bool FilenameTagMatcher::matches(const IndexEntry& entry, const MatchContext& context) const
{
    const QString filename = entry.metadata.value(QString::fromLatin1(kMetaFilename)).toString();
    return !filename.isEmpty() && context.knownDocuments.contains(filename);
}

bool ContentFilenameMatcher::matches(const IndexEntry& entry, const MatchContext& context) const
{
    for (const QString& filename : context.knownDocuments) {
        if (filename.isEmpty()) {
            continue;
        }
        if (entry.text.contains(filename)) {
            return true;
        }

        QString stem = filename;
        stem.remove(QStringLiteral(".pdf")).remove(QStringLiteral(".PDF"));
        // A bare ".pdf" name would otherwise match every chunk.
        if (!stem.isEmpty() && entry.text.contains(stem)) {
            return true;
        }
    }
    return false;
}

KnowledgeContextCollector::KnowledgeContextCollector(VectorStore& store, const IDocumentCatalog* catalog)
    : KnowledgeContextCollector(store, catalog, defaultStrategies())
{
}

KnowledgeContextCollector::KnowledgeContextCollector(VectorStore& store, const IDocumentCatalog* catalog,
                                                     std::vector<std::unique_ptr<IContextMatcher>> strategies)
    : m_store(store)
    , m_catalog(catalog)
    , m_strategies(std::move(strategies))
{
}

std::vector<std::unique_ptr<IContextMatcher>> KnowledgeContextCollector::defaultStrategies()
{
    std::vector<std::unique_ptr<IContextMatcher>> strategies;
    strategies.push_back(std::make_unique<WorkspaceIdMatcher>());
    strategies.push_back(std::make_unique<FilenameTagMatcher>());
    strategies.push_back(std::make_unique<ContentFilenameMatcher>());
    return strategies;
}

QStringList KnowledgeContextCollector::collect(const QString& workspaceId) const
{
    MatchContext context;
    context.workspaceId = workspaceId;
    if (m_catalog) {
        context.knownDocuments = m_catalog->listDocumentNames(workspaceId);
    }

    const std::vector<IndexEntry> entries = m_store.getAll(workspaceId);

    QStringList texts;
    QHash<QString, int> matchedBy;
    int skipped = 0;

    for (const IndexEntry& entry : entries) {
        const IContextMatcher* winner = nullptr;
        for (const auto& strategy : m_strategies) {
            if (strategy->matches(entry, context)) {
                winner = strategy.get();
                break;
            }
        }

        if (!winner) {
            ++skipped;
            qCDebug(kf_engine) << "Context: skipped entry" << entry.id << "(no strategy matched)";
            continue;
        }

        qCDebug(kf_engine) << "Context: entry" << entry.id << "matched by" << winner->name();
        ++matchedBy[winner->name()];
        texts.append(entry.text);
    }

    qCInfo(kf_engine) << "Context for workspace" << workspaceId << ":" << texts.size() << "of" << entries.size()
                      << "entries included," << skipped << "skipped; by strategy" << matchedBy;
    return texts;
}
