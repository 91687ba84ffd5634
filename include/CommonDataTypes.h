#pragma once

#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <vector>

using Metadata = QVariantMap;
using EmbeddingVector = std::vector<float>;

// Metadata keys written by the document pipeline and read by context matching.
constexpr const char* kMetaWorkspaceId = "workflow_id";
constexpr const char* kMetaFilename = "filename";

// One stored (id, text, vector, metadata) tuple inside a workspace collection.
struct IndexEntry {
    QString id;
    QString text;
    EmbeddingVector vector;
    Metadata metadata;
};

struct SearchHit {
    QString text;
    Metadata metadata;
    double distance {0.0}; // cosine distance, 0 = identical direction
};

struct IngestResult {
    QString sourceLabel;
    int chunkCount {0};
    QStringList ids;
};
