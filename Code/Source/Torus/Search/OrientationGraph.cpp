/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Search/OrientationGraph.h"
#include "Core/TorusException.h"

#include <boost/graph/topological_sort.hpp>

#include <algorithm>
#include <iterator>

namespace torus {

namespace {

using Graph = OrientationGraph::Graph;
using Node = OrientationGraph::Node;

// Depth-first enumeration of linear extensions. Candidates are tried in
// lexicographic order of their coordinates.
class LinearExtensionEnumerator {
public:
    LinearExtensionEnumerator(const Graph& graph,
                              std::vector<Node> sorted_nodes,
                              const std::function<bool(const std::vector<Vertex>&)>& visitor)
        : graph_(graph),
          sorted_nodes_(std::move(sorted_nodes)),
          visitor_(visitor),
          in_degree_(boost::num_vertices(graph), 0),
          used_(boost::num_vertices(graph), false) {
        for (Node n : sorted_nodes_) {
            in_degree_[n] = static_cast<int>(boost::in_degree(n, graph_));
        }
    }

    size_t run() {
        extend();
        return count_;
    }

private:
    const Graph& graph_;
    std::vector<Node> sorted_nodes_;
    const std::function<bool(const std::vector<Vertex>&)>& visitor_;
    std::vector<int> in_degree_;
    std::vector<bool> used_;
    std::vector<Vertex> prefix_;
    size_t count_ = 0;
    bool stopped_ = false;

    void extend() {
        if (prefix_.size() == sorted_nodes_.size()) {
            ++count_;
            stopped_ = !visitor_(prefix_);
            return;
        }
        for (Node n : sorted_nodes_) {
            if (stopped_) {
                return;
            }
            if (used_[n] || in_degree_[n] != 0) {
                continue;
            }
            used_[n] = true;
            prefix_.push_back(graph_[n]);
            auto [out, out_end] = boost::out_edges(n, graph_);
            for (auto e = out; e != out_end; ++e) {
                --in_degree_[boost::target(*e, graph_)];
            }

            extend();

            for (auto e = out; e != out_end; ++e) {
                ++in_degree_[boost::target(*e, graph_)];
            }
            prefix_.pop_back();
            used_[n] = false;
        }
    }
};

} // namespace

OrientationGraph::Node OrientationGraph::node(const Vertex& vertex) {
    auto it = nodes_.find(vertex);
    if (it != nodes_.end()) {
        return it->second;
    }
    Node n = boost::add_vertex(vertex, graph_);
    nodes_.emplace(vertex, n);
    return n;
}

void OrientationGraph::add_vertex(const Vertex& vertex) {
    node(vertex);
}

void OrientationGraph::add_edge(const Vertex& u, const Vertex& v) {
    TORUS_CHECK_ARG(u != v, "self loop at " + to_string(u));
    const Node nu = node(u);
    const Node nv = node(v);
    boost::add_edge(nu, nv, graph_);
}

bool OrientationGraph::has_vertex(const Vertex& vertex) const {
    return nodes_.find(vertex) != nodes_.end();
}

bool OrientationGraph::has_edge(const Vertex& u, const Vertex& v) const {
    auto iu = nodes_.find(u);
    auto iv = nodes_.find(v);
    if (iu == nodes_.end() || iv == nodes_.end()) {
        return false;
    }
    return boost::edge(iu->second, iv->second, graph_).second;
}

std::vector<Vertex> OrientationGraph::vertices() const {
    std::vector<Vertex> result;
    result.reserve(nodes_.size());
    for (const auto& kv : nodes_) {
        result.push_back(kv.first);
    }
    return result;
}

std::vector<Edge> OrientationGraph::edges() const {
    std::vector<Edge> result;
    result.reserve(n_edges());
    auto [e, e_end] = boost::edges(graph_);
    for (; e != e_end; ++e) {
        result.emplace_back(graph_[boost::source(*e, graph_)], graph_[boost::target(*e, graph_)]);
    }
    std::sort(result.begin(), result.end());
    return result;
}

bool OrientationGraph::is_acyclic() const {
    std::vector<Node> order;
    order.reserve(n_vertices());
    try {
        boost::topological_sort(graph_, std::back_inserter(order));
    } catch (const boost::not_a_dag&) {
        return false;
    }
    return true;
}

std::vector<Vertex> OrientationGraph::topological_order() const {
    std::vector<Node> reverse_order;
    reverse_order.reserve(n_vertices());
    try {
        boost::topological_sort(graph_, std::back_inserter(reverse_order));
    } catch (const boost::not_a_dag& e) {
        TORUS_THROW(ConsistencyException, std::string("edge graph is not acyclic: ") + e.what());
    }
    std::vector<Vertex> result;
    result.reserve(reverse_order.size());
    for (auto it = reverse_order.rbegin(); it != reverse_order.rend(); ++it) {
        result.push_back(graph_[*it]);
    }
    return result;
}

std::vector<std::vector<Vertex>> OrientationGraph::level_sets() const {
    std::vector<int> level(n_vertices(), 0);
    int max_level = -1;
    for (const Vertex& v : topological_order()) {
        const Node n = nodes_.at(v);
        auto [in, in_end] = boost::in_edges(n, graph_);
        for (; in != in_end; ++in) {
            level[n] = std::max(level[n], level[boost::source(*in, graph_)] + 1);
        }
        max_level = std::max(max_level, level[n]);
    }
    std::vector<std::vector<Vertex>> result(static_cast<size_t>(max_level + 1));
    for (const auto& kv : nodes_) {
        result[static_cast<size_t>(level[kv.second])].push_back(kv.first);
    }
    return result;
}

size_t OrientationGraph::for_each_linear_extension(
    const std::function<bool(const std::vector<Vertex>&)>& visitor) const {
    TORUS_THROW_IF(!is_acyclic(), ConsistencyException,
                   "linear extensions need an acyclic graph");
    std::vector<Node> sorted_nodes;
    sorted_nodes.reserve(nodes_.size());
    for (const auto& kv : nodes_) {
        sorted_nodes.push_back(kv.second);
    }
    LinearExtensionEnumerator enumerator(graph_, std::move(sorted_nodes), visitor);
    return enumerator.run();
}

OrientationGraph OrientationGraph::induced_subgraph(
    const std::function<bool(const Vertex&)>& keep) const {
    OrientationGraph result;
    for (const auto& kv : nodes_) {
        if (keep(kv.first)) {
            result.add_vertex(kv.first);
        }
    }
    auto [e, e_end] = boost::edges(graph_);
    for (; e != e_end; ++e) {
        const Vertex& u = graph_[boost::source(*e, graph_)];
        const Vertex& v = graph_[boost::target(*e, graph_)];
        if (result.has_vertex(u) && result.has_vertex(v)) {
            result.add_edge(u, v);
        }
    }
    return result;
}

} // namespace torus
