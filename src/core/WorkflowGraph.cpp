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

#include "WorkflowGraph.h"

#include "Errors.h"
#include "logging_categories.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace {

const QString kKeyProvider = QStringLiteral("provider");
const QString kKeyModel = QStringLiteral("model");
const QString kKeyApiKey = QStringLiteral("api_key");
const QString kKeyUseWebSearch = QStringLiteral("use_web_search");
const QString kKeySerpApiKey = QStringLiteral("serp_api_key");
const QString kKeyCustomPrompt = QStringLiteral("custom_prompt");

} // namespace

LlmEngineConfig LlmEngineConfig::fromVariantMap(const QVariantMap& data)
{
    LlmEngineConfig cfg;
    const QString provider = data.value(kKeyProvider).toString().trimmed();
    if (!provider.isEmpty()) {
        cfg.provider = provider.toLower();
    }
    cfg.model = data.value(kKeyModel).toString().trimmed();
    cfg.apiKey = data.value(kKeyApiKey).toString().trimmed();
    cfg.useWebSearch = data.value(kKeyUseWebSearch, false).toBool();
    cfg.serpApiKey = data.value(kKeySerpApiKey).toString().trimmed();
    cfg.customPrompt = data.value(kKeyCustomPrompt).toString();
    return cfg;
}

NodeType WorkflowGraph::typeFromString(const QString& type)
{
    if (type == QLatin1String("userQuery")) {
        return NodeType::UserQuery;
    }
    if (type == QLatin1String("knowledgeBase")) {
        return NodeType::KnowledgeBase;
    }
    if (type == QLatin1String("llmEngine")) {
        return NodeType::LlmEngine;
    }
    if (type == QLatin1String("output")) {
        return NodeType::Output;
    }
    return NodeType::Unsupported;
}

QString WorkflowGraph::typeToString(NodeType type)
{
    switch (type) {
    case NodeType::UserQuery:
        return QStringLiteral("userQuery");
    case NodeType::KnowledgeBase:
        return QStringLiteral("knowledgeBase");
    case NodeType::LlmEngine:
        return QStringLiteral("llmEngine");
    case NodeType::Output:
        return QStringLiteral("output");
    case NodeType::Unsupported:
        break;
    }
    return QStringLiteral("unsupported");
}

void WorkflowGraph::addNode(const QString& id, const QString& rawType, const QVariantMap& data)
{
    if (id.isEmpty()) {
        throw GraphParseError(QStringLiteral("Graph node without an id (type '%1')").arg(rawType));
    }
    if (m_indexById.contains(id)) {
        throw GraphParseError(QStringLiteral("Duplicate graph node id '%1'").arg(id));
    }

    GraphNode node;
    node.id = id;
    node.rawType = rawType;
    node.type = typeFromString(rawType);
    node.data = data;
    if (node.type == NodeType::LlmEngine) {
        node.llm = LlmEngineConfig::fromVariantMap(data);
    }

    m_indexById.insert(id, m_nodes.size());
    m_nodes.push_back(std::move(node));
}

void WorkflowGraph::addEdge(const QString& source, const QString& target)
{
    m_edges.push_back(GraphEdge{source, target});
}

const GraphNode* WorkflowGraph::findNode(const QString& id) const
{
    const auto it = m_indexById.constFind(id);
    if (it == m_indexById.constEnd()) {
        return nullptr;
    }
    return &m_nodes[it.value()];
}

std::vector<const GraphNode*> WorkflowGraph::nodesOfType(NodeType type) const
{
    std::vector<const GraphNode*> result;
    for (const GraphNode& node : m_nodes) {
        if (node.type == type) {
            result.push_back(&node);
        }
    }
    return result;
}

std::vector<const GraphNode*> WorkflowGraph::incomingSources(const QString& targetId) const
{
    std::vector<const GraphNode*> result;
    for (const GraphEdge& edge : m_edges) {
        if (edge.target != targetId) {
            continue;
        }
        if (const GraphNode* source = findNode(edge.source)) {
            result.push_back(source);
        } else {
            qCDebug(kf_graph) << "Ignoring edge from unknown node" << edge.source << "to" << targetId;
        }
    }
    return result;
}

WorkflowGraph WorkflowGraph::fromJson(const QByteArray& json)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        throw GraphParseError(QStringLiteral("Invalid graph JSON at offset %1: %2")
                                  .arg(parseError.offset)
                                  .arg(parseError.errorString()));
    }
    if (!doc.isObject()) {
        throw GraphParseError(QStringLiteral("Graph JSON must be an object"));
    }
    return fromJsonObject(doc.object());
}

WorkflowGraph WorkflowGraph::fromJsonObject(const QJsonObject& root)
{
    QJsonObject components = root;
    if (root.value(QStringLiteral("components")).isObject()) {
        components = root.value(QStringLiteral("components")).toObject();
    }

    WorkflowGraph graph;

    const QJsonArray nodes = components.value(QStringLiteral("nodes")).toArray();
    for (const QJsonValue& value : nodes) {
        if (!value.isObject()) {
            throw GraphParseError(QStringLiteral("Graph node entries must be objects"));
        }
        const QJsonObject obj = value.toObject();
        graph.addNode(obj.value(QStringLiteral("id")).toString(),
                      obj.value(QStringLiteral("type")).toString(),
                      obj.value(QStringLiteral("data")).toObject().toVariantMap());
    }

    const QJsonArray edges = components.value(QStringLiteral("edges")).toArray();
    for (const QJsonValue& value : edges) {
        const QJsonObject obj = value.toObject();
        const QString source = obj.value(QStringLiteral("source")).toString();
        const QString target = obj.value(QStringLiteral("target")).toString();
        if (source.isEmpty() || target.isEmpty()) {
            qCWarning(kf_graph) << "Skipping edge without source or target:" << obj;
            continue;
        }
        graph.addEdge(source, target);
    }

    qCDebug(kf_graph) << "Parsed graph with" << graph.nodes().size() << "nodes and"
                      << graph.edges().size() << "edges";
    return graph;
}

QJsonObject WorkflowGraph::toJsonObject() const
{
    QJsonArray nodes;
    for (const GraphNode& node : m_nodes) {
        QJsonObject obj;
        obj.insert(QStringLiteral("id"), node.id);
        obj.insert(QStringLiteral("type"), node.rawType);
        obj.insert(QStringLiteral("data"), QJsonObject::fromVariantMap(node.data));
        nodes.append(obj);
    }

    QJsonArray edges;
    for (const GraphEdge& edge : m_edges) {
        QJsonObject obj;
        obj.insert(QStringLiteral("source"), edge.source);
        obj.insert(QStringLiteral("target"), edge.target);
        edges.append(obj);
    }

    QJsonObject root;
    root.insert(QStringLiteral("nodes"), nodes);
    root.insert(QStringLiteral("edges"), edges);
    return root;
}
