#pragma once

#include "graph/graph.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace relnet {

struct CommunityOptions {
    double resolution = 1.0;        // higher splits into more communities
    bool weighted = false;          // use edge weights instead of 1 per edge
};

/// Community id per node. Ids are dense and numbered in ascending order of
/// each community's smallest node id.
using CommunityAssignment = std::map<NodeId, int>;

struct CommunityStructure {
    CommunityAssignment communities;
    std::map<int, std::vector<NodeId>> members;
    size_t count = 0;
    double modularity = 0.0;
};

struct CommunityLevel {
    double resolution = 1.0;
    CommunityAssignment communities;
    size_t count = 0;
};

// ─── Community Algorithm ───────────────────────────────────────
// Partitions a graph into communities. Edges are treated as undirected and
// parallel edges add up. The helpers below all run detect() with default
// options.

class CommunityAlgorithm {
public:
    virtual ~CommunityAlgorithm() = default;

    virtual CommunityAssignment detect(const Graph& graph,
                                       const CommunityOptions& options = {}) const = 0;

    virtual std::string name() const = 0;

    CommunityStructure detectDetailed(const Graph& graph, const CommunityOptions& options = {}) const;

    /// -1 when the node is absent.
    int communityOf(const Graph& graph, NodeId node) const;
    /// Other members of the node's community, ascending.
    std::vector<NodeId> communityMembers(const Graph& graph, NodeId node) const;

    /// Nodes adjacent to a community other than their own, mapped to every
    /// community they touch (own included, ascending).
    std::map<NodeId, std::vector<int>> communityBridges(const Graph& graph) const;

    std::map<int, size_t> communitySizes(const Graph& graph) const;
    /// Largest first, ties by ascending community id.
    std::vector<std::pair<int, size_t>> largestCommunities(const Graph& graph, size_t top_n = 5) const;

    /// Edge count per community pair (smaller id first).
    std::map<std::pair<int, int>, size_t> interCommunityEdges(const Graph& graph) const;

    std::vector<CommunityLevel> detectHierarchical(
        const Graph& graph, const std::vector<double>& resolutions = {0.5, 1.0, 1.5, 2.0}) const;

    /// Adjacent member pairs / possible pairs; 0 below two members.
    static double cohesion(const Graph& graph, const std::vector<NodeId>& members);

    /// Newman modularity of `communities` with the given resolution.
    static double modularity(const Graph& graph, const CommunityAssignment& communities,
                             const CommunityOptions& options = {});
};

/// Local-moving phase of Louvain: nodes visited in ascending id order move
/// to the neighboring community with the largest positive modularity gain
/// until a pass moves nothing. Deterministic; no aggregation phase.
class LouvainCommunities : public CommunityAlgorithm {
public:
    CommunityAssignment detect(const Graph& graph, const CommunityOptions& options) const override;
    std::string name() const override { return "louvain"; }

    int max_passes = 15;
};

} // namespace relnet
