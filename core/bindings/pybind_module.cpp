// PyBind11 bindings for the relnet core.
// Exposes the graph store, exploration, progressive exploration and
// multi-entity discovery to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DRELNET_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "common/errors.hpp"
#include "common/relation_types.hpp"
#include "graph/graph.hpp"
#include "algorithms/algorithm_suite.hpp"
#include "exploration/network_explorer.hpp"
#include "exploration/progressive_explorer.hpp"
#include "discovery/network_discovery.hpp"
#include "discovery/bridge_analyzer.hpp"
#include "discovery/pathway_finder.hpp"

namespace py = pybind11;

PYBIND11_MODULE(relnet_bindings, m) {
    m.doc() = "relnet network exploration and discovery bindings";

    // ── Errors ──
    static py::exception<relnet::RelnetError> relnet_error(m, "RelnetError");
    py::register_exception<relnet::UnknownStartNode>(m, "UnknownStartNode", relnet_error.ptr());
    py::register_exception<relnet::InsufficientQueryEntities>(m, "InsufficientQueryEntities",
                                                              relnet_error.ptr());
    py::register_exception<relnet::InvalidBound>(m, "InvalidBound", relnet_error.ptr());

    m.attr("KINSHIP") = relnet::kKinship;
    m.attr("ASSOCIATION") = relnet::kAssociation;

    // ── Enums ──
    py::enum_<relnet::GraphMode>(m, "GraphMode")
        .value("DIRECTED", relnet::GraphMode::DIRECTED)
        .value("UNDIRECTED", relnet::GraphMode::UNDIRECTED)
        .value("MIXED", relnet::GraphMode::MIXED);

    py::enum_<relnet::TraversalDirection>(m, "TraversalDirection")
        .value("ALL", relnet::TraversalDirection::ALL)
        .value("FORWARD", relnet::TraversalDirection::FORWARD)
        .value("BACKWARD", relnet::TraversalDirection::BACKWARD);

    py::enum_<relnet::SearchOrder>(m, "SearchOrder")
        .value("BREADTH", relnet::SearchOrder::BREADTH)
        .value("DEPTH", relnet::SearchOrder::DEPTH);

    py::enum_<relnet::ExplorationStrategy>(m, "ExplorationStrategy")
        .value("BREADTH", relnet::ExplorationStrategy::BREADTH)
        .value("DEPTH", relnet::ExplorationStrategy::DEPTH)
        .value("BEST_FIRST", relnet::ExplorationStrategy::BEST_FIRST)
        .value("RANDOM_WALK", relnet::ExplorationStrategy::RANDOM_WALK);

    py::enum_<relnet::RelationMix>(m, "RelationMix")
        .value("KINSHIP", relnet::RelationMix::KINSHIP)
        .value("ASSOCIATION", relnet::RelationMix::ASSOCIATION)
        .value("MIXED", relnet::RelationMix::MIXED);

    // ── Node ──
    py::class_<relnet::Node>(m, "Node")
        .def(py::init<>())
        .def_readwrite("id", &relnet::Node::id)
        .def_readwrite("attributes", &relnet::Node::attributes)
        .def("set_attribute", &relnet::Node::setAttribute)
        .def("has_attribute", &relnet::Node::hasAttribute);

    // ── Edge ──
    py::class_<relnet::Edge>(m, "Edge")
        .def(py::init<>())
        .def(py::init<uint64_t, uint64_t, uint64_t, std::string, double>(),
             py::arg("id"), py::arg("source"), py::arg("target"),
             py::arg("relationship_type"), py::arg("weight") = 1.0)
        .def_readwrite("id", &relnet::Edge::id)
        .def_readwrite("source", &relnet::Edge::source)
        .def_readwrite("target", &relnet::Edge::target)
        .def_readwrite("relationship_type", &relnet::Edge::relationship_type)
        .def_readwrite("weight", &relnet::Edge::weight)
        .def_readwrite("undirected", &relnet::Edge::undirected)
        .def_readwrite("attributes", &relnet::Edge::attributes);

    // ── GraphMetrics ──
    py::class_<relnet::GraphMetrics>(m, "GraphMetrics")
        .def(py::init<>())
        .def_readwrite("node_count", &relnet::GraphMetrics::node_count)
        .def_readwrite("edge_count", &relnet::GraphMetrics::edge_count)
        .def_readwrite("density", &relnet::GraphMetrics::density)
        .def_readwrite("average_degree", &relnet::GraphMetrics::average_degree);

    // ── Graph ──
    py::class_<relnet::Graph>(m, "Graph")
        .def(py::init<relnet::GraphMode>(), py::arg("mode") = relnet::GraphMode::UNDIRECTED)
        .def("mode", &relnet::Graph::mode)
        .def("add_node", &relnet::Graph::addNode,
             py::arg("id"), py::arg("attributes") = relnet::AttributeMap{})
        .def("remove_node", &relnet::Graph::removeNode)
        .def("has_node", &relnet::Graph::hasNode)
        .def("get_node", py::overload_cast<uint64_t>(&relnet::Graph::getNode),
             py::return_value_policy::reference_internal)
        .def("node_ids", &relnet::Graph::nodeIds)
        .def("node_count", &relnet::Graph::nodeCount)
        .def("add_edge", &relnet::Graph::addEdge,
             py::arg("source"), py::arg("target"), py::arg("relationship_type"),
             py::arg("weight") = 1.0, py::arg("attributes") = relnet::AttributeMap{})
        .def("merge_edge", &relnet::Graph::mergeEdge)
        .def("remove_edge", &relnet::Graph::removeEdge)
        .def("has_edge", py::overload_cast<uint64_t, uint64_t>(&relnet::Graph::hasEdge, py::const_))
        .def("has_edge_id", py::overload_cast<uint64_t>(&relnet::Graph::hasEdge, py::const_))
        .def("get_edge", py::overload_cast<uint64_t>(&relnet::Graph::getEdge),
             py::return_value_policy::reference_internal)
        .def("edge_ids", &relnet::Graph::edgeIds)
        .def("edges_between", &relnet::Graph::edgesBetween)
        .def("edge_count", &relnet::Graph::edgeCount)
        .def("neighbors", &relnet::Graph::neighbors,
             py::arg("node_id"), py::arg("direction") = relnet::TraversalDirection::ALL)
        .def("degree", &relnet::Graph::degree)
        .def("metrics", &relnet::Graph::metrics)
        .def("extract_subgraph", &relnet::Graph::extractSubgraph)
        .def_static("merge", &relnet::Graph::merge)
        .def("clear", &relnet::Graph::clear)
        .def("clone", &relnet::Graph::clone);

    m.def("filter_edges", &relnet::filterEdges, py::arg("graph"), py::arg("keep"));
    m.def("relation_type_filter", &relnet::relationTypeFilter);

    // ── Algorithm results ──
    py::class_<relnet::GraphPath>(m, "GraphPath")
        .def(py::init<>())
        .def_readwrite("nodes", &relnet::GraphPath::nodes)
        .def_readwrite("edges", &relnet::GraphPath::edges)
        .def("length", &relnet::GraphPath::length);

    py::class_<relnet::StructureMetrics>(m, "StructureMetrics")
        .def(py::init<>())
        .def_readwrite("node_count", &relnet::StructureMetrics::node_count)
        .def_readwrite("edge_count", &relnet::StructureMetrics::edge_count)
        .def_readwrite("density", &relnet::StructureMetrics::density)
        .def_readwrite("average_degree", &relnet::StructureMetrics::average_degree)
        .def_readwrite("average_path_length", &relnet::StructureMetrics::average_path_length)
        .def_readwrite("average_clustering", &relnet::StructureMetrics::average_clustering)
        .def_readwrite("component_count", &relnet::StructureMetrics::component_count);

    py::class_<relnet::CentralityScores>(m, "CentralityScores")
        .def(py::init<>())
        .def_readwrite("degree", &relnet::CentralityScores::degree)
        .def_readwrite("betweenness", &relnet::CentralityScores::betweenness)
        .def_readwrite("closeness", &relnet::CentralityScores::closeness);

    py::class_<relnet::CommunityOptions>(m, "CommunityOptions")
        .def(py::init<>())
        .def_readwrite("resolution", &relnet::CommunityOptions::resolution)
        .def_readwrite("weighted", &relnet::CommunityOptions::weighted);

    py::class_<relnet::CommunityStructure>(m, "CommunityStructure")
        .def(py::init<>())
        .def_readwrite("communities", &relnet::CommunityStructure::communities)
        .def_readwrite("members", &relnet::CommunityStructure::members)
        .def_readwrite("count", &relnet::CommunityStructure::count)
        .def_readwrite("modularity", &relnet::CommunityStructure::modularity);

    py::class_<relnet::CommunityLevel>(m, "CommunityLevel")
        .def(py::init<>())
        .def_readwrite("resolution", &relnet::CommunityLevel::resolution)
        .def_readwrite("communities", &relnet::CommunityLevel::communities)
        .def_readwrite("count", &relnet::CommunityLevel::count);

    // ── Options ──
    py::class_<relnet::ExploreByDepthOptions>(m, "ExploreByDepthOptions")
        .def(py::init<>())
        .def_readwrite("start_node", &relnet::ExploreByDepthOptions::start_node)
        .def_readwrite("max_depth", &relnet::ExploreByDepthOptions::max_depth)
        .def_readwrite("max_nodes", &relnet::ExploreByDepthOptions::max_nodes)
        .def_readwrite("node_filter", &relnet::ExploreByDepthOptions::node_filter)
        .def_readwrite("edge_filter", &relnet::ExploreByDepthOptions::edge_filter)
        .def_readwrite("early_termination", &relnet::ExploreByDepthOptions::early_termination)
        .def_readwrite("direction", &relnet::ExploreByDepthOptions::direction)
        .def_readwrite("include_edges", &relnet::ExploreByDepthOptions::include_edges);

    py::class_<relnet::PreFilteredOptions>(m, "PreFilteredOptions")
        .def(py::init<>())
        .def_readwrite("start_node", &relnet::PreFilteredOptions::start_node)
        .def_readwrite("max_depth", &relnet::PreFilteredOptions::max_depth)
        .def_readwrite("max_nodes", &relnet::PreFilteredOptions::max_nodes)
        .def_readwrite("node_filter", &relnet::PreFilteredOptions::node_filter)
        .def_readwrite("early_termination", &relnet::PreFilteredOptions::early_termination)
        .def_readwrite("direction", &relnet::PreFilteredOptions::direction)
        .def_readwrite("include_edges", &relnet::PreFilteredOptions::include_edges);

    py::class_<relnet::ExploreByDegreesOptions>(m, "ExploreByDegreesOptions")
        .def(py::init<>())
        .def_readwrite("start_node", &relnet::ExploreByDegreesOptions::start_node)
        .def_readwrite("degrees", &relnet::ExploreByDegreesOptions::degrees)
        .def_readwrite("relation_types", &relnet::ExploreByDegreesOptions::relation_types)
        .def_readwrite("weight_threshold", &relnet::ExploreByDegreesOptions::weight_threshold)
        .def_readwrite("bidirectional_only", &relnet::ExploreByDegreesOptions::bidirectional_only)
        .def_readwrite("max_nodes", &relnet::ExploreByDegreesOptions::max_nodes);

    py::class_<relnet::ExploreWithFilterOptions>(m, "ExploreWithFilterOptions")
        .def(py::init<>())
        .def_readwrite("start_node", &relnet::ExploreWithFilterOptions::start_node)
        .def_readwrite("node_filter", &relnet::ExploreWithFilterOptions::node_filter)
        .def_readwrite("edge_filter", &relnet::ExploreWithFilterOptions::edge_filter)
        .def_readwrite("max_depth", &relnet::ExploreWithFilterOptions::max_depth)
        .def_readwrite("max_nodes", &relnet::ExploreWithFilterOptions::max_nodes)
        .def_readwrite("order", &relnet::ExploreWithFilterOptions::order);

    py::class_<relnet::SubgraphOptions>(m, "SubgraphOptions")
        .def(py::init<>())
        .def_readwrite("nodes", &relnet::SubgraphOptions::nodes)
        .def_readwrite("center_node", &relnet::SubgraphOptions::center_node)
        .def_readwrite("radius", &relnet::SubgraphOptions::radius)
        .def_readwrite("min_degree", &relnet::SubgraphOptions::min_degree)
        .def_readwrite("max_degree", &relnet::SubgraphOptions::max_degree)
        .def_readwrite("preserve_edge_types", &relnet::SubgraphOptions::preserve_edge_types);

    py::class_<relnet::ProgressiveOptions>(m, "ProgressiveOptions")
        .def(py::init<>())
        .def_readwrite("start_node", &relnet::ProgressiveOptions::start_node)
        .def_readwrite("strategy", &relnet::ProgressiveOptions::strategy)
        .def_readwrite("max_nodes", &relnet::ProgressiveOptions::max_nodes)
        .def_readwrite("scoring", &relnet::ProgressiveOptions::scoring)
        .def_readwrite("walk_probability", &relnet::ProgressiveOptions::walk_probability)
        .def_readwrite("teleport_probability", &relnet::ProgressiveOptions::teleport_probability)
        .def_readwrite("seed", &relnet::ProgressiveOptions::seed);

    py::class_<relnet::DiscoveryOptions>(m, "DiscoveryOptions")
        .def(py::init<>())
        .def_readwrite("query_entities", &relnet::DiscoveryOptions::query_entities)
        .def_readwrite("max_hop_distance", &relnet::DiscoveryOptions::max_hop_distance)
        .def_readwrite("include_relation_types", &relnet::DiscoveryOptions::include_relation_types)
        .def_readwrite("node_filter", &relnet::DiscoveryOptions::node_filter)
        .def_readwrite("max_bridge_entities", &relnet::DiscoveryOptions::max_bridge_entities)
        .def_readwrite("max_discovered_nodes", &relnet::DiscoveryOptions::max_discovered_nodes)
        .def_readwrite("include_discovery_paths", &relnet::DiscoveryOptions::include_discovery_paths);

    // ── Exploration results ──
    py::class_<relnet::ExplorationStatistics>(m, "ExplorationStatistics")
        .def(py::init<>())
        .def_readwrite("total_nodes", &relnet::ExplorationStatistics::total_nodes)
        .def_readwrite("total_edges", &relnet::ExplorationStatistics::total_edges)
        .def_readwrite("max_depth_reached", &relnet::ExplorationStatistics::max_depth_reached)
        .def_readwrite("average_degree", &relnet::ExplorationStatistics::average_degree);

    py::class_<relnet::ExplorationResult>(m, "ExplorationResult")
        .def(py::init<>())
        .def_readwrite("nodes", &relnet::ExplorationResult::nodes)
        .def_readwrite("depths", &relnet::ExplorationResult::depths)
        .def_readwrite("nodes_by_depth", &relnet::ExplorationResult::nodes_by_depth)
        .def_readwrite("edges", &relnet::ExplorationResult::edges)
        .def_readwrite("visit_counts", &relnet::ExplorationResult::visit_counts)
        .def_readwrite("statistics", &relnet::ExplorationResult::statistics)
        .def_readwrite("truncated", &relnet::ExplorationResult::truncated)
        .def("contains", &relnet::ExplorationResult::contains);

    // ── Discovery results ──
    py::class_<relnet::DiscoveredEntity>(m, "DiscoveredEntity")
        .def(py::init<>())
        .def_readwrite("id", &relnet::DiscoveredEntity::id)
        .def_readwrite("distance", &relnet::DiscoveredEntity::distance)
        .def_readwrite("is_query_entity", &relnet::DiscoveredEntity::is_query_entity)
        .def_readwrite("connects_to", &relnet::DiscoveredEntity::connects_to)
        .def_readwrite("distances", &relnet::DiscoveredEntity::distances)
        .def_readwrite("discovery_path", &relnet::DiscoveredEntity::discovery_path);

    py::class_<relnet::DirectConnection>(m, "DirectConnection")
        .def(py::init<>())
        .def_readwrite("entity_a", &relnet::DirectConnection::entity_a)
        .def_readwrite("entity_b", &relnet::DirectConnection::entity_b)
        .def_readwrite("relationships", &relnet::DirectConnection::relationships)
        .def_readwrite("relation_types", &relnet::DirectConnection::relation_types)
        .def_readwrite("strength", &relnet::DirectConnection::strength);

    py::class_<relnet::BridgeEntity>(m, "BridgeEntity")
        .def(py::init<>())
        .def_readwrite("id", &relnet::BridgeEntity::id)
        .def_readwrite("connects_to", &relnet::BridgeEntity::connects_to)
        .def_readwrite("distances", &relnet::BridgeEntity::distances)
        .def_readwrite("connection_types", &relnet::BridgeEntity::connection_types)
        .def_readwrite("bridge_type", &relnet::BridgeEntity::bridge_type)
        .def_readwrite("bridge_score", &relnet::BridgeEntity::bridge_score);

    py::class_<relnet::BridgeStatistics>(m, "BridgeStatistics")
        .def(py::init<>())
        .def_readwrite("total", &relnet::BridgeStatistics::total)
        .def_readwrite("by_type", &relnet::BridgeStatistics::by_type)
        .def_readwrite("average_connections", &relnet::BridgeStatistics::average_connections)
        .def_readwrite("max_connections", &relnet::BridgeStatistics::max_connections);

    py::class_<relnet::Pathway>(m, "Pathway")
        .def(py::init<>())
        .def_readwrite("from_", &relnet::Pathway::from)
        .def_readwrite("to", &relnet::Pathway::to)
        .def_readwrite("path", &relnet::Pathway::path)
        .def_readwrite("edges", &relnet::Pathway::edges)
        .def_readwrite("path_type", &relnet::Pathway::path_type)
        .def_readwrite("strength", &relnet::Pathway::strength)
        .def("length", &relnet::Pathway::length);

    py::class_<relnet::NetworkMetrics>(m, "NetworkMetrics")
        .def(py::init<>())
        .def_readwrite("total_nodes", &relnet::NetworkMetrics::total_nodes)
        .def_readwrite("query_entities", &relnet::NetworkMetrics::query_entities)
        .def_readwrite("discovered_entities", &relnet::NetworkMetrics::discovered_entities)
        .def_readwrite("total_edges", &relnet::NetworkMetrics::total_edges)
        .def_readwrite("direct_connections", &relnet::NetworkMetrics::direct_connections)
        .def_readwrite("bridge_entities", &relnet::NetworkMetrics::bridge_entities)
        .def_readwrite("pathways", &relnet::NetworkMetrics::pathways)
        .def_readwrite("density", &relnet::NetworkMetrics::density)
        .def_readwrite("average_path_length", &relnet::NetworkMetrics::average_path_length)
        .def_readwrite("component_count", &relnet::NetworkMetrics::component_count)
        .def_readwrite("community_count", &relnet::NetworkMetrics::community_count);

    py::class_<relnet::DiscoveryResult>(m, "DiscoveryResult")
        .def(py::init<>())
        .def_readwrite("query_entities", &relnet::DiscoveryResult::query_entities)
        .def_readwrite("entities", &relnet::DiscoveryResult::entities)
        .def_readwrite("edges", &relnet::DiscoveryResult::edges)
        .def_readwrite("direct_connections", &relnet::DiscoveryResult::direct_connections)
        .def_readwrite("bridge_entities", &relnet::DiscoveryResult::bridge_entities)
        .def_readwrite("pathways", &relnet::DiscoveryResult::pathways)
        .def_readwrite("metrics", &relnet::DiscoveryResult::metrics)
        .def_readwrite("truncated", &relnet::DiscoveryResult::truncated);

    // ── Engines ──
    py::class_<relnet::NetworkExplorer>(m, "NetworkExplorer")
        .def(py::init<>())
        .def("explore_by_depth", &relnet::NetworkExplorer::exploreByDepth)
        .def("explore_pre_filtered", &relnet::NetworkExplorer::explorePreFiltered)
        .def("explore_by_degrees", &relnet::NetworkExplorer::exploreByDegrees)
        .def("explore_with_filter", &relnet::NetworkExplorer::exploreWithFilter)
        .def("extract_subgraph", &relnet::NetworkExplorer::extractSubgraph);

    py::class_<relnet::ProgressiveExplorer>(m, "ProgressiveExplorer")
        .def(py::init<>())
        .def("explore", &relnet::ProgressiveExplorer::explore);

    py::class_<relnet::NetworkDiscovery>(m, "NetworkDiscovery")
        .def(py::init<>())
        .def("discover", &relnet::NetworkDiscovery::discover);

    py::class_<relnet::PathwayFinder>(m, "PathwayFinder")
        .def(py::init<>())
        .def("shortest_pathway", &relnet::PathwayFinder::shortestPathway,
             py::arg("network"), py::arg("from_"), py::arg("to"),
             py::arg("query_entities") = std::set<relnet::NodeId>{})
        .def("all_pathways", &relnet::PathwayFinder::allPathways,
             py::arg("network"), py::arg("from_"), py::arg("to"), py::arg("max_length") = 3,
             py::arg("query_entities") = std::set<relnet::NodeId>{})
        .def("pathways_through_nodes", &relnet::PathwayFinder::pathwaysThroughNodes,
             py::arg("network"), py::arg("from_"), py::arg("to"), py::arg("through"),
             py::arg("query_entities") = std::set<relnet::NodeId>{});

    m.def("bridge_statistics", &relnet::BridgeAnalyzer::statistics);
    m.def("filter_bridges_by_type", &relnet::BridgeAnalyzer::filterByType);
    m.def("filter_bridges_by_min_connections", &relnet::BridgeAnalyzer::filterByMinConnections);

    m.def("discover", [](const relnet::Graph& graph, const relnet::DiscoveryOptions& options) {
        return relnet::NetworkDiscovery().discover(graph, options);
    }, py::arg("graph"), py::arg("options"));

    // ── Default algorithm suite ──
    auto suite = [] { return relnet::AlgorithmSuite::defaults(); };

    m.def("strongly_connected_components", [suite](const relnet::Graph& graph) {
        return suite()->traversal().stronglyConnectedComponents(graph);
    });
    m.def("ancestors", [suite](const relnet::Graph& graph, relnet::NodeId node) {
        return suite()->traversal().ancestors(graph, node);
    });
    m.def("descendants", [suite](const relnet::Graph& graph, relnet::NodeId node) {
        return suite()->traversal().descendants(graph, node);
    });
    m.def("weighted_shortest_path", [suite](const relnet::Graph& graph, relnet::NodeId source,
                                            relnet::NodeId target) {
        return suite()->pathfinding().weightedShortestPath(graph, source, target);
    });

    m.def("structure_metrics", [suite](const relnet::Graph& graph) {
        return suite()->metrics().compute(graph);
    });
    m.def("centrality", [suite](const relnet::Graph& graph) {
        return suite()->metrics().centrality(graph);
    });
    m.def("eigenvector_centrality", [suite](const relnet::Graph& graph) {
        return suite()->metrics().eigenvectorCentrality(graph);
    });
    m.def("clustering", [suite](const relnet::Graph& graph, relnet::NodeId node) {
        return suite()->metrics().localClustering(graph, node);
    });
    m.def("diameter", [suite](const relnet::Graph& graph) { return suite()->metrics().diameter(graph); });
    m.def("radius", [suite](const relnet::Graph& graph) { return suite()->metrics().radius(graph); });
    m.def("weighted_degree", [suite](const relnet::Graph& graph) {
        return suite()->metrics().weightedDegree(graph);
    });

    m.def("detect_communities", [suite](const relnet::Graph& graph, const relnet::CommunityOptions& options) {
        return suite()->community().detectDetailed(graph, options);
    }, py::arg("graph"), py::arg("options") = relnet::CommunityOptions{});
    m.def("community_bridges", [suite](const relnet::Graph& graph) {
        return suite()->community().communityBridges(graph);
    });
    m.def("community_sizes", [suite](const relnet::Graph& graph) {
        return suite()->community().communitySizes(graph);
    });
    m.def("inter_community_edges", [suite](const relnet::Graph& graph) {
        return suite()->community().interCommunityEdges(graph);
    });
    m.def("detect_hierarchical_communities", [suite](const relnet::Graph& graph,
                                                     const std::vector<double>& resolutions) {
        return suite()->community().detectHierarchical(graph, resolutions);
    }, py::arg("graph"), py::arg("resolutions") = std::vector<double>{0.5, 1.0, 1.5, 2.0});
    m.def("community_cohesion", &relnet::CommunityAlgorithm::cohesion);
}
