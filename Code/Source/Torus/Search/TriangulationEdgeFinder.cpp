/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Search/TriangulationEdgeFinder.h"
#include "Core/Logger.h"
#include "Core/Simplex.h"
#include "Core/TorusException.h"
#include "Search/CubeFilter.h"
#include "Search/CubeTriangulation.h"

namespace torus {

TriangulationEdgeFinder::TriangulationEdgeFinder(BoxComplex complex,
                                                 std::vector<GroupGenerator> generators,
                                                 GroupOrbitOptions options)
    : complex_(std::move(complex)),
      generators_(std::move(generators)),
      options_(options) {
    for (const auto& g : generators_) {
        TORUS_CHECK_ARG(!g.is_affine() || g.dimension() == complex_.dimension(),
                        "generator " + g.name() + " has the wrong dimension");
    }
    const UnitCubeTriangulation unit(complex_.dimension());
    for (const Simplex& s : CubeTriangulation(unit.points()).simplices()) {
        for (size_t i = 0; i < s.size(); ++i) {
            for (size_t j = i + 1; j < s.size(); ++j) {
                unit_edges_.emplace(s[i], s[j]);
            }
        }
    }
}

OrientationGraph TriangulationEdgeFinder::unit_graph() const {
    return complex_.edge_graph().induced_subgraph(CubeFilter::unit(dimension()));
}

std::set<Edge> TriangulationEdgeFinder::triangulation_edges() const {
    const OrientationGraph graph = unit_graph();
    std::set<Edge> result;
    for (const Edge& e : unit_edges_) {
        if (!graph.has_edge(e.first, e.second) && !graph.has_edge(e.second, e.first)) {
            result.insert(e);
        }
    }
    return result;
}

Orbit TriangulationEdgeFinder::add_simplex_orbit(const Simplex& simplex) {
    return group().add_simplex_orbit(simplex);
}

bool TriangulationEdgeFinder::try_orient(const Edge& edge, bool verify_acyclic) {
    const BoxComplex::Checkpoint mark = checkpoint();
    try {
        add_simplex_orbit(Simplex{edge.first, edge.second});
    } catch (const VertexOrderError& e) {
        TORUS_LOG_DEBUG("Orientation " + to_string(edge) + " rejected: " + e.message());
        return false;
    }
    if (verify_acyclic && !complex_.edge_graph().is_acyclic()) {
        TORUS_LOG_DEBUG("Orientation " + to_string(edge) + " closes a cycle");
        rollback(mark);
        return false;
    }
    return true;
}

TriangulationEdgeFinder TriangulationEdgeFinder::with_all_edges_to_origin() const {
    TriangulationEdgeFinder result(*this);
    const Vertex origin(static_cast<size_t>(dimension()), 0);
    for (const Edge& e : triangulation_edges()) {
        if (e.first == origin) {
            result.add_simplex_orbit(Simplex{e.second, origin});
        } else if (e.second == origin) {
            result.add_simplex_orbit(Simplex{e.first, origin});
        }
    }
    result.complex_.commit();
    return result;
}

std::vector<Edge> TriangulationEdgeFinder::obvious_edges() const {
    TriangulationEdgeFinder trial(*this);
    std::vector<Edge> result;
    for (const Edge& e : triangulation_edges()) {
        const BoxComplex::Checkpoint mark = trial.checkpoint();
        const bool fit_01 = trial.try_orient(e);
        trial.rollback(mark);
        const Edge back(e.second, e.first);
        const bool fit_10 = trial.try_orient(back);
        trial.rollback(mark);

        if (fit_01 && !fit_10) {
            result.push_back(e);
        } else if (fit_10 && !fit_01) {
            result.push_back(back);
        }
    }
    return result;
}

TriangulationEdgeFinder TriangulationEdgeFinder::with_obvious_edges_added() const {
    TriangulationEdgeFinder result(*this);
    for (const Edge& e : obvious_edges()) {
        result.add_simplex_orbit(Simplex{e.first, e.second});
    }
    result.complex_.commit();
    return result;
}

TriangulationEdgeFinder TriangulationEdgeFinder::with_edge_added(const Vertex& v0,
                                                                 const Vertex& v1) const {
    TriangulationEdgeFinder result(*this);
    result.add_simplex_orbit(Simplex{v0, v1});
    result.complex_.commit();
    return result;
}

std::vector<std::vector<Vertex>> TriangulationEdgeFinder::compatible_orders() const {
    const OrientationGraph graph = unit_graph();
    const size_t n_corners = size_t(1) << static_cast<size_t>(dimension());
    TORUS_THROW_IF(graph.n_vertices() != n_corners, ConsistencyException,
                   "unit graph has " + std::to_string(graph.n_vertices()) + " of " +
                   std::to_string(n_corners) + " cube corners");

    TriangulationEdgeFinder trial(*this);
    const auto& sides = complex_.side_lengths();
    std::vector<std::vector<Vertex>> result;

    graph.for_each_linear_extension([&](const std::vector<Vertex>& order) {
        const BoxComplex::Checkpoint mark = trial.checkpoint();
        try {
            for (const Simplex& s : CubeTriangulation(order).simplices()) {
                trial.add_simplex_orbit(s);
            }
            for (size_t axis = 0; axis < sides.size(); ++axis) {
                if (sides[axis] <= 1) {
                    continue;
                }
                std::vector<Vertex> shifted;
                shifted.reserve(order.size());
                for (const Vertex& v : order) {
                    shifted.push_back(translate(v, axis, 1));
                }
                for (const Simplex& s : CubeTriangulation(shifted).simplices()) {
                    trial.add_simplex_orbit(s);
                }
            }
            result.push_back(order);
        } catch (const VertexOrderError& e) {
            TORUS_LOG_DEBUG("Cube order rejected: " + e.message());
        }
        trial.rollback(mark);
        return true;
    });
    return result;
}

std::vector<Simplex> TriangulationEdgeFinder::unit_cube_simplices() const {
    return CubeTriangulation(unit_graph().topological_order()).simplices();
}

} // namespace torus
