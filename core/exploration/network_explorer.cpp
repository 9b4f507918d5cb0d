#include "exploration/network_explorer.hpp"
#include "common/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>
#include <unordered_set>

namespace relnet {

namespace {

const AttributeMap kNoAttributes;

const AttributeMap& attributesOf(const Graph& graph, NodeId id) {
    const AttributeMap* attrs = graph.getNodeAttributes(id);
    return attrs ? *attrs : kNoAttributes;
}

void requireStartNode(const Graph& graph, NodeId start) {
    if (!graph.hasNode(start)) throw UnknownStartNode(start);
}

} // namespace

NetworkExplorer::NetworkExplorer(std::shared_ptr<const AlgorithmSuite> algorithms)
    : algorithms_(algorithms ? std::move(algorithms) : AlgorithmSuite::defaults()) {}

// ─── exploreByDepth ────────────────────────────────────────────

ExplorationResult NetworkExplorer::exploreByDepth(
    const Graph& graph, const ExploreByDepthOptions& options) const {
    options.validate();
    requireStartNode(graph, options.start_node);

    ExplorationResultBuilder builder;
    bool stopped = false;

    // Nodes are marked when queued, so each node and each candidate edge
    // reaches its filter at most once.
    std::unordered_set<NodeId> queued{options.start_node};
    std::deque<std::pair<NodeId, int>> queue{{options.start_node, 0}};

    while (!queue.empty() && builder.nodeCount() < static_cast<size_t>(options.max_nodes)) {
        auto [node, depth] = queue.front();
        queue.pop_front();

        if (options.node_filter && !options.node_filter(node, attributesOf(graph, node))) {
            continue;
        }
        if (options.early_termination && options.early_termination(node, depth)) {
            stopped = true;
            break;
        }

        builder.addNode(node, depth);
        if (depth >= options.max_depth) continue;

        for (EdgeId eid : graph.traversableEdges(node, options.direction)) {
            const Edge* e = graph.getEdge(eid);
            NodeId next = e->opposite(node);
            if (queued.count(next)) continue;
            if (options.edge_filter && !options.edge_filter(*e)) continue;
            queued.insert(next);
            queue.emplace_back(next, depth + 1);
        }
    }

    // Truncated only if some queued node would still have been admitted.
    // Rejected nodes are never expanded, so the queue decides it.
    bool truncated = !stopped && std::any_of(queue.begin(), queue.end(), [&](const auto& entry) {
        return !options.node_filter || options.node_filter(entry.first, attributesOf(graph, entry.first));
    });
    builder.setTruncated(truncated);
    if (options.include_edges) {
        builder.collectInducedEdges(graph, options.edge_filter);
    }
    ExplorationResult result = builder.finish();

    spdlog::debug("exploreByDepth from {}: {} nodes, {} edges, depth {}{}",
                  options.start_node, result.statistics.total_nodes,
                  result.statistics.total_edges, result.statistics.max_depth_reached,
                  result.truncated ? " (truncated)" : "");
    return result;
}

// ─── explorePreFiltered ────────────────────────────────────────

ExplorationResult NetworkExplorer::explorePreFiltered(
    const Graph& graph, const PreFilteredOptions& options) const {
    options.validate();
    requireStartNode(graph, options.start_node);

    ExplorationResultBuilder builder;
    bool truncated = false;

    algorithms_->traversal().bfs(graph, options.start_node, [&](NodeId node, int depth) {
        if (options.node_filter && !options.node_filter(node, attributesOf(graph, node))) {
            return VisitAction::SKIP;
        }
        if (builder.nodeCount() >= static_cast<size_t>(options.max_nodes)) {
            truncated = true;
            return VisitAction::STOP;
        }
        if (options.early_termination && options.early_termination(node, depth)) {
            return VisitAction::STOP;
        }
        builder.addNode(node, depth);
        return depth >= options.max_depth ? VisitAction::SKIP : VisitAction::CONTINUE;
    }, options.direction);

    builder.setTruncated(truncated);
    if (options.include_edges) {
        builder.collectInducedEdges(graph);
    }
    ExplorationResult result = builder.finish();

    spdlog::debug("explorePreFiltered from {}: {} nodes, {} edges{}",
                  options.start_node, result.statistics.total_nodes,
                  result.statistics.total_edges, result.truncated ? " (truncated)" : "");
    return result;
}

// ─── exploreByDegrees ──────────────────────────────────────────

ExplorationResult NetworkExplorer::exploreByDegrees(
    const Graph& graph, const ExploreByDegreesOptions& options) const {
    options.validate();

    ExploreByDepthOptions depth_options;
    depth_options.start_node = options.start_node;
    depth_options.max_depth = options.degrees;
    depth_options.max_nodes = options.max_nodes;

    EdgeFilter by_type;
    if (!options.relation_types.empty()) {
        by_type = relationTypeFilter(options.relation_types);
    }
    std::optional<double> threshold = options.weight_threshold;
    if (by_type || threshold) {
        depth_options.edge_filter = [by_type, threshold](const Edge& e) {
            if (by_type && !by_type(e)) return false;
            return !threshold || e.weight >= *threshold;
        };
    }

    ExplorationResult result = exploreByDepth(graph, depth_options);
    if (!options.bidirectional_only) return result;

    // Keep the start node plus nodes with both an outgoing and an incoming
    // edge inside the result.
    std::unordered_set<NodeId> members(result.nodes.begin(), result.nodes.end());
    ExplorationResultBuilder builder;
    for (NodeId id : result.nodes) {
        if (id != options.start_node) {
            bool has_out = false;
            bool has_in = false;
            for (const Edge& e : result.edges) {
                if (e.source == id && members.count(e.target)) has_out = true;
                if (e.target == id && members.count(e.source)) has_in = true;
                if (graph.isUndirected(e) && e.touches(id)) has_out = has_in = true;
            }
            if (!(has_out && has_in)) continue;
        }
        builder.addNode(id, result.depths.at(id));
    }
    for (const Edge& e : result.edges) {
        if (builder.contains(e.source) && builder.contains(e.target)) builder.addEdge(e);
    }
    builder.setTruncated(result.truncated);
    return builder.finish();
}

// ─── exploreWithFilter ─────────────────────────────────────────

ExplorationResult NetworkExplorer::exploreWithFilter(
    const Graph& graph, const ExploreWithFilterOptions& options) const {
    options.validate();
    requireStartNode(graph, options.start_node);

    // Reduce once, then walk the reduced graph with the native primitive
    const Graph* walked = &graph;
    Graph reduced;
    if (options.edge_filter) {
        reduced = filterEdges(graph, options.edge_filter);
        walked = &reduced;
    }

    ExplorationResultBuilder builder;
    bool truncated = false;
    auto visitor = [&](NodeId node, int depth) {
        if (depth > options.max_depth) return VisitAction::SKIP;
        if (options.node_filter && !options.node_filter(node, attributesOf(*walked, node), depth)) {
            return VisitAction::SKIP;
        }
        if (builder.nodeCount() >= static_cast<size_t>(options.max_nodes)) {
            truncated = true;
            return VisitAction::STOP;
        }
        builder.addNode(node, depth);
        return depth >= options.max_depth ? VisitAction::SKIP : VisitAction::CONTINUE;
    };

    if (options.order == SearchOrder::DEPTH) {
        algorithms_->traversal().dfs(*walked, options.start_node, visitor);
    } else {
        algorithms_->traversal().bfs(*walked, options.start_node, visitor);
    }

    builder.setTruncated(truncated);
    builder.collectInducedEdges(*walked);
    return builder.finish();
}

// ─── extractSubgraph ───────────────────────────────────────────

Graph NetworkExplorer::extractSubgraph(const Graph& graph, const SubgraphOptions& options) const {
    options.validate();

    std::vector<NodeId> all = graph.nodeIds();
    std::unordered_set<NodeId> selected(all.begin(), all.end());

    auto intersect = [&selected](const auto& keep) {
        for (auto it = selected.begin(); it != selected.end();) {
            if (keep.count(*it)) ++it;
            else it = selected.erase(it);
        }
    };

    if (options.nodes) intersect(*options.nodes);

    if (options.center_node) {
        ExploreByDepthOptions radius_options;
        radius_options.start_node = *options.center_node;
        radius_options.max_depth = options.radius;
        radius_options.max_nodes = INT_MAX;
        radius_options.include_edges = false;
        ExplorationResult around = exploreByDepth(graph, radius_options);
        intersect(around.depths);
    }

    if (options.min_degree || options.max_degree) {
        for (auto it = selected.begin(); it != selected.end();) {
            size_t degree = graph.degree(*it);
            bool keep = (!options.min_degree || degree >= *options.min_degree) &&
                        (!options.max_degree || degree <= *options.max_degree);
            if (keep) ++it;
            else it = selected.erase(it);
        }
    }

    Graph sub = graph.extractSubgraph(selected);
    if (options.preserve_edge_types.empty()) return sub;
    return filterEdges(sub, relationTypeFilter(options.preserve_edge_types));
}

} // namespace relnet
