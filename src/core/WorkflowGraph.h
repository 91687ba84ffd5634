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
#include <QHash>
#include <QJsonObject>
#include <QString>
#include <QVariantMap>

#include <optional>
#include <vector>

/**
 * @brief Node kinds the executor understands.
 *
 * Anything else parses as Unsupported; the original type string stays
 * available in GraphNode::rawType for error reporting.
 */
enum class NodeType {
    UserQuery,
    KnowledgeBase,
    LlmEngine,
    Output,
    Unsupported
};

/**
 * @brief Generation settings carried by an llmEngine node.
 */
struct LlmEngineConfig {
    QString provider {QStringLiteral("openai")};
    QString model;
    QString apiKey;
    bool useWebSearch {false};
    QString serpApiKey;
    QString customPrompt;

    /// Reads provider, model, api_key, use_web_search, serp_api_key, custom_prompt.
    static LlmEngineConfig fromVariantMap(const QVariantMap& data);
};

struct GraphNode {
    QString id;
    NodeType type {NodeType::Unsupported};
    QString rawType;
    QVariantMap data;
    std::optional<LlmEngineConfig> llm; // set for NodeType::LlmEngine only
};

struct GraphEdge {
    QString source;
    QString target;
};

/**
 * @brief Node/edge description of a workflow, in insertion order.
 */
class WorkflowGraph {
public:
    /**
     * @brief Parses graph JSON.
     *
     * Accepts either {"nodes": [...], "edges": [...]} or the stored workflow
     * shape {"components": {"nodes": [...], "edges": [...]}}.
     * @throws GraphParseError for invalid JSON, a node without an id, or duplicate ids
     */
    static WorkflowGraph fromJson(const QByteArray& json);
    static WorkflowGraph fromJsonObject(const QJsonObject& root);

    static NodeType typeFromString(const QString& type);
    static QString typeToString(NodeType type);

    /// @throws GraphParseError when a node with the same id already exists
    void addNode(const QString& id, const QString& rawType, const QVariantMap& data = {});
    void addEdge(const QString& source, const QString& target);

    const std::vector<GraphNode>& nodes() const { return m_nodes; }
    const std::vector<GraphEdge>& edges() const { return m_edges; }

    const GraphNode* findNode(const QString& id) const;
    std::vector<const GraphNode*> nodesOfType(NodeType type) const;

    /// Source nodes of edges into @p targetId, in edge order. Edges from
    /// unknown node ids are skipped.
    std::vector<const GraphNode*> incomingSources(const QString& targetId) const;

    QJsonObject toJsonObject() const;

private:
    std::vector<GraphNode> m_nodes;
    std::vector<GraphEdge> m_edges;
    QHash<QString, size_t> m_indexById;
};
