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
#include <stdexcept>
#include <string>

/**
 * @brief Failures of the vector store's backing medium.
 */
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const QString& message)
        : std::runtime_error(message.toStdString())
    {
    }
};

/// The store directory or a collection database cannot be opened or created.
class StorageUnavailableError : public StorageError {
public:
    using StorageError::StorageError;
};

/// A persisted collection does not match the expected schema, or SQLite
/// reports the file as malformed.
class StorageCorruptError : public StorageError {
public:
    using StorageError::StorageError;
};

/// A collection file records a different workspace than the one requested.
/// Not a schema problem, so it never triggers a store reset.
class WorkspaceMismatchError : public StorageError {
public:
    using StorageError::StorageError;
};

/**
 * @brief Graph misconfiguration. Never retried; the user has to fix the graph.
 */
class GraphError : public std::runtime_error {
public:
    explicit GraphError(const QString& message)
        : std::runtime_error(message.toStdString())
    {
    }
};

class NoOutputNodeError : public GraphError {
public:
    NoOutputNodeError()
        : GraphError(QStringLiteral("No Output node found. Connect an Output node to run."))
    {
    }
};

class DisconnectedOutputError : public GraphError {
public:
    explicit DisconnectedOutputError(const QString& outputId)
        : GraphError(QStringLiteral("Output node '%1' is not connected to any source.").arg(outputId))
    {
    }
};

class UnsupportedSourceTypeError : public GraphError {
public:
    explicit UnsupportedSourceTypeError(const QString& typeName)
        : GraphError(QStringLiteral("Unsupported source '%1' connected to Output").arg(typeName))
        , m_typeName(typeName)
    {
    }

    QString typeName() const { return m_typeName; }

private:
    QString m_typeName;
};

/// Graph JSON that cannot be turned into a WorkflowGraph at all.
class GraphParseError : public GraphError {
public:
    using GraphError::GraphError;
};
