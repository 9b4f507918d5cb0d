#include "algorithms/community_algorithm.hpp"

#include <algorithm>
#include <numeric>
#include <set>
#include <unordered_map>

namespace relnet {

namespace {

// Undirected weighted view indexed by ascending node id.
struct Projection {
    std::vector<NodeId> ids;
    std::vector<std::map<size_t, double>> adjacent;
};

Projection project(const Graph& graph, bool weighted) {
    Projection proj;
    proj.ids = graph.nodeIds();
    proj.adjacent.resize(proj.ids.size());

    std::unordered_map<NodeId, size_t> index;
    for (size_t i = 0; i < proj.ids.size(); i++) index[proj.ids[i]] = i;

    graph.forEachEdge([&](const Edge& e) {
        double w = weighted ? e.weight : 1.0;
        size_t a = index.at(e.source);
        size_t b = index.at(e.target);
        proj.adjacent[a][b] += w;
        proj.adjacent[b][a] += w;
    });
    return proj;
}

} // namespace

// ─── Louvain local moving ──────────────────────────────────────

CommunityAssignment LouvainCommunities::detect(const Graph& graph,
                                               const CommunityOptions& options) const {
    Projection proj = project(graph, options.weighted);
    const size_t n = proj.ids.size();

    std::vector<int> community(n);
    std::iota(community.begin(), community.end(), 0);

    std::vector<double> strength(n, 0.0);
    double m2 = 0.0;
    for (size_t i = 0; i < n; i++) {
        for (const auto& [_, w] : proj.adjacent[i]) strength[i] += w;
        m2 += strength[i];
    }

    if (m2 > 0.0) {
        std::vector<double> total = strength;   // per community, starts as singletons
        bool improved = true;
        for (int pass = 0; improved && pass < max_passes; pass++) {
            improved = false;
            for (size_t i = 0; i < n; i++) {
                int current = community[i];
                total[current] -= strength[i];

                std::map<int, double> toward;
                for (const auto& [j, w] : proj.adjacent[i]) toward[community[j]] += w;

                // Strictly positive gain; ties keep the lowest community id
                int best = current;
                double best_gain = 0.0;
                for (const auto& [c, k_in] : toward) {
                    double gain = k_in / m2 -
                                  options.resolution * strength[i] * total[c] / (m2 * m2);
                    if (gain > best_gain) {
                        best_gain = gain;
                        best = c;
                    }
                }
                if (best != current) {
                    community[i] = best;
                    improved = true;
                }
                total[community[i]] += strength[i];
            }
        }
    }

    CommunityAssignment assignment;
    std::unordered_map<int, int> renumber;
    for (size_t i = 0; i < n; i++) {
        auto it = renumber.emplace(community[i], static_cast<int>(renumber.size())).first;
        assignment[proj.ids[i]] = it->second;
    }
    return assignment;
}

// ─── Helpers ───────────────────────────────────────────────────

CommunityStructure CommunityAlgorithm::detectDetailed(const Graph& graph,
                                                      const CommunityOptions& options) const {
    CommunityStructure structure;
    structure.communities = detect(graph, options);
    for (const auto& [node, c] : structure.communities) {
        structure.members[c].push_back(node);
    }
    structure.count = structure.members.size();
    structure.modularity = modularity(graph, structure.communities, options);
    return structure;
}

int CommunityAlgorithm::communityOf(const Graph& graph, NodeId node) const {
    CommunityAssignment communities = detect(graph);
    auto it = communities.find(node);
    return it != communities.end() ? it->second : -1;
}

std::vector<NodeId> CommunityAlgorithm::communityMembers(const Graph& graph, NodeId node) const {
    CommunityAssignment communities = detect(graph);
    std::vector<NodeId> members;
    auto target = communities.find(node);
    if (target == communities.end()) return members;
    for (const auto& [other, c] : communities) {
        if (c == target->second && other != node) members.push_back(other);
    }
    return members;
}

std::map<NodeId, std::vector<int>> CommunityAlgorithm::communityBridges(const Graph& graph) const {
    CommunityAssignment communities = detect(graph);
    std::map<NodeId, std::vector<int>> bridges;
    for (const auto& [node, own] : communities) {
        std::set<int> touched{own};
        for (NodeId other : graph.neighbors(node)) touched.insert(communities.at(other));
        if (touched.size() > 1) bridges[node].assign(touched.begin(), touched.end());
    }
    return bridges;
}

std::map<int, size_t> CommunityAlgorithm::communitySizes(const Graph& graph) const {
    std::map<int, size_t> sizes;
    for (const auto& [_, c] : detect(graph)) sizes[c]++;
    return sizes;
}

std::vector<std::pair<int, size_t>> CommunityAlgorithm::largestCommunities(const Graph& graph,
                                                                           size_t top_n) const {
    std::map<int, size_t> sizes = communitySizes(graph);
    std::vector<std::pair<int, size_t>> ranked(sizes.begin(), sizes.end());
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (ranked.size() > top_n) ranked.resize(top_n);
    return ranked;
}

std::map<std::pair<int, int>, size_t> CommunityAlgorithm::interCommunityEdges(const Graph& graph) const {
    CommunityAssignment communities = detect(graph);
    std::map<std::pair<int, int>, size_t> crossing;
    graph.forEachEdge([&](const Edge& e) {
        int a = communities.at(e.source);
        int b = communities.at(e.target);
        if (a != b) crossing[{std::min(a, b), std::max(a, b)}]++;
    });
    return crossing;
}

std::vector<CommunityLevel> CommunityAlgorithm::detectHierarchical(
    const Graph& graph, const std::vector<double>& resolutions) const {
    std::vector<CommunityLevel> levels;
    for (double resolution : resolutions) {
        CommunityOptions options;
        options.resolution = resolution;

        CommunityLevel level;
        level.resolution = resolution;
        level.communities = detect(graph, options);
        std::set<int> distinct;
        for (const auto& [_, c] : level.communities) distinct.insert(c);
        level.count = distinct.size();
        levels.push_back(std::move(level));
    }
    return levels;
}

double CommunityAlgorithm::cohesion(const Graph& graph, const std::vector<NodeId>& members) {
    std::vector<NodeId> unique(members);
    std::sort(unique.begin(), unique.end());
    unique.erase(std::unique(unique.begin(), unique.end()), unique.end());
    size_t n = unique.size();
    if (n < 2) return 0.0;

    size_t linked = 0;
    for (size_t i = 0; i < n; i++) {
        for (size_t j = i + 1; j < n; j++) {
            if (!graph.edgesBetween(unique[i], unique[j]).empty()) linked++;
        }
    }
    return linked / (n * (n - 1) / 2.0);
}

double CommunityAlgorithm::modularity(const Graph& graph, const CommunityAssignment& communities,
                                      const CommunityOptions& options) {
    // Q = sum over communities of in_c / 2m - resolution * (tot_c / 2m)^2
    double m2 = 0.0;
    std::unordered_map<int, double> inside;
    std::unordered_map<int, double> total;
    graph.forEachEdge([&](const Edge& e) {
        auto a = communities.find(e.source);
        auto b = communities.find(e.target);
        if (a == communities.end() || b == communities.end()) return;
        double w = options.weighted ? e.weight : 1.0;
        m2 += 2.0 * w;
        total[a->second] += w;
        total[b->second] += w;
        if (a->second == b->second) inside[a->second] += 2.0 * w;
    });
    if (m2 <= 0.0) return 0.0;

    double q = 0.0;
    for (const auto& [c, tot] : total) {
        double in = inside.count(c) ? inside.at(c) : 0.0;
        q += in / m2 - options.resolution * (tot / m2) * (tot / m2);
    }
    return q;
}

} // namespace relnet
