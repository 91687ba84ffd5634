#include "GraphResolver.h"

#include "Errors.h"
#include "logging_categories.h"

ResolvedPath GraphResolver::resolve(const WorkflowGraph& graph)
{
    const std::vector<const GraphNode*> outputs = graph.nodesOfType(NodeType::Output);
    if (outputs.empty()) {
        throw NoOutputNodeError();
    }

    const GraphNode* output = outputs.front();
    if (outputs.size() > 1) {
        qCDebug(kf_graph) << "Graph has" << outputs.size() << "output nodes; using" << output->id;
    }

    const std::vector<const GraphNode*> sources = graph.incomingSources(output->id);
    if (sources.empty()) {
        throw DisconnectedOutputError(output->id);
    }

    ResolvedPath path;
    path.activeOutput = *output;
    path.upstream = *sources.front();

    if (path.upstream.type == NodeType::LlmEngine) {
        for (const GraphNode* feeder : graph.incomingSources(path.upstream.id)) {
            path.upstreamFeeders.push_back(*feeder);
        }
    }

    qCDebug(kf_graph) << "Active path:" << path.upstream.rawType << path.upstream.id << "->" << output->id
                      << "with" << path.upstreamFeeders.size() << "feeders";
    return path;
}
