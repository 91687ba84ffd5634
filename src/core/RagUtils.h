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

#include <QByteArray>
#include <QString>
#include <vector>

#include "CommonDataTypes.h"

/**
 * @brief Helper utilities for working with the per-workspace SQLite collections.
 */
class RagUtils
{
public:
    /**
     * @brief Compute cosine similarity between two float vectors.
     *
     * Returns dot(a,b) / (||a|| * ||b||).
     * If either vector is empty, the sizes differ, or the magnitude is zero,
     * the function returns 0.0.
     */
    static double cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

    /**
     * @brief Cosine distance, 1 - cosineSimilarity(a, b). Range [0, 2].
     */
    static double cosineDistance(const std::vector<float>& a, const std::vector<float>& b);

    /// Raw native-endian float array, the on-disk form of an embedding.
    static QByteArray vectorToBlob(const EmbeddingVector& vec);

    /// Inverse of vectorToBlob. A blob whose size is not a multiple of
    /// sizeof(float) yields an empty vector.
    static EmbeddingVector blobToVector(const QByteArray& blob);

    /// Metadata is persisted as compact JSON.
    static QString metadataToJson(const Metadata& metadata);
    static Metadata metadataFromJson(const QString& json);

    /**
     * @brief Deterministic collection name for a workspace.
     *
     * Ids made of [a-z0-9_-] (at most 64 characters, not starting with "h_")
     * map to "workflow_<id>"; anything else maps to "workflow_h_" followed by
     * the SHA-1 hex of the UTF-8 id. Every name is a safe file name and no two
     * ids share a name, even when the file system ignores case.
     */
    static QString collectionNameFor(const QString& workspaceId);

    /**
     * @brief True when a SQLite error message means the file or its schema
     *        cannot be used as a collection.
     */
    static bool isCorruptionMessage(const QString& sqlErrorText);
};

/**
 * @brief Collection database schema.
 *
 * Every workspace lives in its own SQLite file with two tables:
 *
 * 1. `collection_info` - key/value pairs describing the collection
 *    (workspace_id, schema_version, dimension, embedder).
 *
 * 2. `entries` - one row per chunk
 *    - seq: INTEGER PRIMARY KEY AUTOINCREMENT - insertion order, used to break ties
 *    - id: TEXT UNIQUE - the UUID returned to the caller
 *    - content: TEXT - the chunk text
 *    - embedding: BLOB - raw float array (see RagUtils::vectorToBlob)
 *    - metadata: TEXT - JSON object
 *
 * QSqlQuery::exec() cannot execute multiple statements at once, so each
 * statement is its own constant.
 */
constexpr int kCollectionSchemaVersion = 1;

constexpr const char* kCollectionSchemaInfo = R"(
CREATE TABLE IF NOT EXISTS collection_info (
    key TEXT PRIMARY KEY,
    value TEXT
)
)";

constexpr const char* kCollectionSchemaEntries = R"(
CREATE TABLE IF NOT EXISTS entries (
    seq INTEGER PRIMARY KEY AUTOINCREMENT,
    id TEXT UNIQUE NOT NULL,
    content TEXT NOT NULL,
    embedding BLOB NOT NULL,
    metadata TEXT
)
)";

constexpr const char* kCollectionFileSuffix = ".sqlite";
