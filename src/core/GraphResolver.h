#pragma once

#include <vector>

#include "WorkflowGraph.h"

/**
 * @brief The single active execution path of a graph.
 */
struct ResolvedPath {
    GraphNode activeOutput;
    GraphNode upstream;                    // first source wired into activeOutput
    std::vector<GraphNode> upstreamFeeders; // sources wired into upstream; only filled for llmEngine
};

/**
 * @brief Locates the active Output node and walks one step back.
 *
 * First-in-order wins at every choice: the first output node in node order,
 * then the first incoming edge in edge order. Fan-in and branching are not
 * evaluated.
 */
class GraphResolver {
public:
    /**
     * @throws NoOutputNodeError when the graph has no output node
     * @throws DisconnectedOutputError when the active output has no incoming edge
     */
    static ResolvedPath resolve(const WorkflowGraph& graph);
};
