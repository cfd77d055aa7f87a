#pragma once

#include "step_registry.h"
#include <optional>
#include <string>
#include <vector>

namespace monthclose::core {

// A single step in the pipeline graph
struct GraphNode {
    size_t id = 0;                          // Equals the step ordinal
    std::string key;

    // Graph relationships
    std::vector<size_t> input_nodes;        // Steps whose outputs this step consumes
    std::vector<size_t> output_nodes;       // Steps consuming this step's outputs

    bool is_root() const { return input_nodes.empty(); }
};

// Explicit DAG over the registry's steps. Branches (NFI / NF) are separate
// root chains that converge where a node has several input_nodes.
class PipelineGraph {
public:
    PipelineGraph() = default;

    // Build graph from the registry's depends_on edges
    void build_from_registry(const StepRegistry& registry);

    const std::vector<GraphNode>& nodes() const { return nodes_; }
    const GraphNode& node(size_t id) const { return nodes_[id]; }
    size_t size() const { return nodes_.size(); }

    // Node id for a step key, or nullopt
    std::optional<size_t> find(const std::string& key) const;

    // Every transitive upstream node, ascending
    std::vector<size_t> ancestors(size_t node_id) const;

    // Topological order; among ready nodes the lowest ordinal goes first,
    // so for a valid registry this is exactly ordinal order
    std::vector<size_t> execution_order() const;

private:
    std::vector<GraphNode> nodes_;
};

} // namespace monthclose::core
