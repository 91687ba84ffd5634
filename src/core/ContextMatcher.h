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
#include <QStringList>

#include <memory>
#include <vector>

#include "CommonDataTypes.h"

class IDocumentCatalog;
class VectorStore;

/**
 * @brief What a matcher knows about the workspace being executed.
 */
struct MatchContext {
    QString workspaceId;
    QStringList knownDocuments;
};

/**
 * @brief One strategy deciding whether a stored entry belongs to a workspace.
 */
class IContextMatcher {
public:
    virtual ~IContextMatcher() = default;
    virtual QString name() const = 0;
    virtual bool matches(const IndexEntry& entry, const MatchContext& context) const = 0;
};

/// Metadata workflow_id equals the workspace id.
class WorkspaceIdMatcher : public IContextMatcher {
public:
    QString name() const override { return QStringLiteral("workspace-id"); }
    bool matches(const IndexEntry& entry, const MatchContext& context) const override;
};

/// Metadata filename is one of the workspace's known documents.
class FilenameTagMatcher : public IContextMatcher {
public:
    QString name() const override { return QStringLiteral("filename-tag"); }
    bool matches(const IndexEntry& entry, const MatchContext& context) const override;
};

/**
 * @brief A known document name, or the name with ".pdf"/".PDF" removed,
 *        occurs as a substring of the chunk text.
 *
 * Prone to false positives: a chunk that merely mentions another
 * document's name is pulled in. Kept as the last resort for chunks
 * ingested without tags.
 */
class ContentFilenameMatcher : public IContextMatcher {
public:
    QString name() const override { return QStringLiteral("content-filename"); }
    bool matches(const IndexEntry& entry, const MatchContext& context) const override;
};

/**
 * @brief Gathers the knowledge-base context for an LLM node.
 *
 * Scans the whole workspace collection and keeps every entry accepted by the
 * first matching strategy, in insertion order. Entries no strategy accepts are
 * left out.
 */
class KnowledgeContextCollector {
public:
    /// @param catalog May be null; filename-based strategies then see no names.
    KnowledgeContextCollector(VectorStore& store, const IDocumentCatalog* catalog);
    KnowledgeContextCollector(VectorStore& store, const IDocumentCatalog* catalog,
                              std::vector<std::unique_ptr<IContextMatcher>> strategies);

    static std::vector<std::unique_ptr<IContextMatcher>> defaultStrategies();

    QStringList collect(const QString& workspaceId) const;

private:
    VectorStore& m_store;
    const IDocumentCatalog* m_catalog;
    std::vector<std::unique_ptr<IContextMatcher>> m_strategies;
};
