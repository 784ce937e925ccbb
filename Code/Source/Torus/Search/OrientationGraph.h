/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef TORUS_SEARCH_ORIENTATION_GRAPH_H
#define TORUS_SEARCH_ORIENTATION_GRAPH_H

/**
 * @file OrientationGraph.h
 * @brief Directed graph over lattice vertices
 *
 * Thin wrapper around a Boost adjacency list that keys nodes by their
 * lattice coordinates. An oriented edge u -> v records that u precedes v in
 * every simplex containing both. Acyclicity of this graph is the necessary
 * condition for a consistent vertex order.
 */

#include "Core/Types.h"

#include <boost/graph/adjacency_list.hpp>

#include <functional>
#include <map>
#include <vector>

namespace torus {

class OrientationGraph {
public:
    using Graph = boost::adjacency_list<boost::setS, boost::vecS, boost::bidirectionalS, Vertex>;
    using Node = boost::graph_traits<Graph>::vertex_descriptor;

    OrientationGraph() = default;

    /// Add a node (no-op if present)
    void add_vertex(const Vertex& vertex);

    /// Add the arc u -> v, adding missing nodes
    void add_edge(const Vertex& u, const Vertex& v);

    bool has_vertex(const Vertex& vertex) const;
    bool has_edge(const Vertex& u, const Vertex& v) const;

    size_t n_vertices() const { return boost::num_vertices(graph_); }
    size_t n_edges() const { return boost::num_edges(graph_); }

    /// Nodes in lexicographic order
    std::vector<Vertex> vertices() const;

    /// Arcs in lexicographic order
    std::vector<Edge> edges() const;

    bool is_acyclic() const;

    /**
     * @brief A topological order of the nodes
     * @throws ConsistencyException if the graph has a cycle
     */
    std::vector<Vertex> topological_order() const;

    /**
     * @brief Partition into levels by longest path from a source
     *
     * Level 0 holds the nodes without predecessors; each later level holds
     * the minimal nodes once all earlier levels are removed.
     *
     * @throws ConsistencyException if the graph has a cycle
     */
    std::vector<std::vector<Vertex>> level_sets() const;

    /**
     * @brief Visit every linear extension of the partial order
     *
     * The visitor returns false to stop the enumeration. Extensions are
     * produced in lexicographic order of their node sequences.
     *
     * @return Number of extensions visited
     */
    size_t for_each_linear_extension(
        const std::function<bool(const std::vector<Vertex>&)>& visitor) const;

    /**
     * @brief Subgraph induced on the nodes accepted by @p keep
     */
    OrientationGraph induced_subgraph(const std::function<bool(const Vertex&)>& keep) const;

private:
    Graph graph_;
    std::map<Vertex, Node> nodes_;

    Node node(const Vertex& vertex);
};

} // namespace torus

#endif // TORUS_SEARCH_ORIENTATION_GRAPH_H
