#include "pipeline_graph.h"
#include <algorithm>
#include <functional>
#include <queue>

namespace monthclose::core {

void PipelineGraph::build_from_registry(const StepRegistry& registry) {
    nodes_.clear();
    nodes_.resize(registry.size());

    for (const auto& step : registry.steps()) {
        auto& node = nodes_[step.ordinal];
        node.id = step.ordinal;
        node.key = step.key;
    }

    // Registry validation guarantees every dependency exists upstream
    for (const auto& step : registry.steps()) {
        for (const auto& dep : step.depends_on) {
            size_t dep_id = registry.at(dep).ordinal;
            nodes_[step.ordinal].input_nodes.push_back(dep_id);
            nodes_[dep_id].output_nodes.push_back(step.ordinal);
        }
    }
}

std::optional<size_t> PipelineGraph::find(const std::string& key) const {
    for (const auto& node : nodes_) {
        if (node.key == key) {
            return node.id;
        }
    }
    return std::nullopt;
}

std::vector<size_t> PipelineGraph::ancestors(size_t node_id) const {
    std::vector<bool> visited(nodes_.size(), false);
    std::vector<size_t> stack;
    stack.push_back(node_id);

    while (!stack.empty()) {
        size_t current = stack.back();
        stack.pop_back();

        for (size_t id : nodes_[current].input_nodes) {
            if (!visited[id]) {
                visited[id] = true;
                stack.push_back(id);
            }
        }
    }

    std::vector<size_t> result;
    for (size_t id = 0; id < visited.size(); ++id) {
        if (visited[id]) {
            result.push_back(id);
        }
    }
    return result;
}

std::vector<size_t> PipelineGraph::execution_order() const {
    // Kahn's algorithm with a min-heap so ties follow the declared order
    std::vector<size_t> order;
    std::vector<size_t> in_degree(nodes_.size(), 0);

    for (const auto& node : nodes_) {
        in_degree[node.id] = node.input_nodes.size();
    }

    std::priority_queue<size_t, std::vector<size_t>, std::greater<size_t>> ready;
    for (const auto& node : nodes_) {
        if (node.is_root()) {
            ready.push(node.id);
        }
    }

    while (!ready.empty()) {
        size_t current = ready.top();
        ready.pop();
        order.push_back(current);

        for (size_t consumer_id : nodes_[current].output_nodes) {
            in_degree[consumer_id]--;
            if (in_degree[consumer_id] == 0) {
                ready.push(consumer_id);
            }
        }
    }

    return order;
}

} // namespace monthclose::core
