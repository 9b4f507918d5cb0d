#include "exploration/progressive_explorer.hpp"
#include "common/errors.hpp"

#include <spdlog/spdlog.h>

#include <queue>
#include <unordered_set>

namespace relnet {

ProgressiveExplorer::ProgressiveExplorer(std::shared_ptr<const AlgorithmSuite> algorithms)
    : explorer_(std::move(algorithms)) {}

ExplorationResult ProgressiveExplorer::explore(
    const Graph& graph, const ProgressiveOptions& options) const {
    options.validate();
    if (!graph.hasNode(options.start_node)) throw UnknownStartNode(options.start_node);

    switch (options.strategy) {
        case ExplorationStrategy::BEST_FIRST:
            if (options.scoring) return bestFirst(graph, options);
            break;  // no scorer: plain breadth-first
        case ExplorationStrategy::RANDOM_WALK:
            return randomWalk(graph, options);
        case ExplorationStrategy::DEPTH: {
            ExploreWithFilterOptions dfs;
            dfs.start_node = options.start_node;
            dfs.order = SearchOrder::DEPTH;
            dfs.max_depth = INT_MAX;
            dfs.max_nodes = options.max_nodes;
            return explorer_.exploreWithFilter(graph, dfs);
        }
        case ExplorationStrategy::BREADTH:
            break;
    }

    ExploreByDepthOptions bfs;
    bfs.start_node = options.start_node;
    bfs.max_depth = static_cast<int>(graph.nodeCount());
    bfs.max_nodes = options.max_nodes;
    return explorer_.exploreByDepth(graph, bfs);
}

// ─── Best-first ────────────────────────────────────────────────

ExplorationResult ProgressiveExplorer::bestFirst(
    const Graph& graph, const ProgressiveOptions& options) const {
    struct Candidate {
        double score;
        uint64_t seq;
        NodeId node;
        int depth;
    };
    auto lower_priority = [](const Candidate& a, const Candidate& b) {
        if (a.score != b.score) return a.score < b.score;
        return a.seq > b.seq;
    };
    std::priority_queue<Candidate, std::vector<Candidate>, decltype(lower_priority)>
        frontier(lower_priority);

    std::unordered_set<NodeId> discovered{options.start_node};
    uint64_t seq = 0;
    frontier.push({0.0, seq++, options.start_node, 0});

    ExplorationResultBuilder builder;
    const size_t cap = static_cast<size_t>(options.max_nodes);

    while (!frontier.empty() && builder.nodeCount() < cap) {
        Candidate current = frontier.top();
        frontier.pop();
        builder.addNode(current.node, current.depth);

        for (NodeId next : graph.neighbors(current.node)) {
            if (!discovered.insert(next).second) continue;
            const AttributeMap* attrs = graph.getNodeAttributes(next);
            double score = options.scoring(next, attrs ? *attrs : AttributeMap{});
            frontier.push({score, seq++, next, current.depth + 1});
        }
    }

    builder.setTruncated(!frontier.empty());
    builder.collectInducedEdges(graph);
    return builder.finish();
}

// ─── Random walk ───────────────────────────────────────────────

ExplorationResult ProgressiveExplorer::randomWalk(
    const Graph& graph, const ProgressiveOptions& options) const {
    std::mt19937_64 rng(options.seed ? *options.seed : std::random_device{}());
    std::uniform_real_distribution<double> coin(0.0, 1.0);

    ExplorationResultBuilder builder;
    NodeId current = options.start_node;
    int steps_since_restart = 0;

    for (int visit = 0; visit < options.max_nodes; visit++) {
        builder.addNode(current, steps_since_restart);
        builder.recordVisit(current);

        bool teleport = coin(rng) < options.teleport_probability;
        std::vector<EdgeId> exits = graph.traversableEdges(current);
        if (!teleport && !exits.empty() && coin(rng) < options.walk_probability) {
            std::vector<NodeId> choices = graph.neighbors(current);
            std::uniform_int_distribution<size_t> pick(0, choices.size() - 1);
            NodeId next = choices[pick(rng)];
            for (EdgeId eid : exits) {
                const Edge* e = graph.getEdge(eid);
                if (e->opposite(current) == next) {
                    builder.addEdge(*e);
                    break;
                }
            }
            current = next;
            steps_since_restart++;
        } else {
            current = options.start_node;
            steps_since_restart = 0;
        }
    }

    ExplorationResult result = builder.finish();
    spdlog::debug("random walk from {}: {} visits over {} distinct nodes",
                  options.start_node, options.max_nodes, result.statistics.total_nodes);
    return result;
}

} // namespace relnet
