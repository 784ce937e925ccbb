/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef TORUS_SEARCH_TRIANGULATION_EDGE_FINDER_H
#define TORUS_SEARCH_TRIANGULATION_EDGE_FINDER_H

/**
 * @file TriangulationEdgeFinder.h
 * @brief State of the search for a group-invariant cube triangulation
 *
 * A state is a box complex built from group orbits, together with the
 * generators that act on it. The unit cube {0,1}^d must end up with every
 * edge of its reference triangulation oriented; the edges not yet present
 * in either direction are the triangulation edges still to decide.
 *
 * States are values: the with_* transitions return new states and never
 * modify the receiver.
 */

#include "Complex/BoxComplex.h"
#include "Core/Types.h"
#include "Search/OrientationGraph.h"
#include "Symmetry/GroupGenerator.h"
#include "Symmetry/GroupOrbit.h"

#include <set>
#include <vector>

namespace torus {

class TriangulationEdgeFinder {
public:
    /**
     * @param complex Starting complex (usually empty or seeded with edges)
     * @param generators Group acting on the lattice
     * @param options Orbit options; torus images are on by default
     */
    TriangulationEdgeFinder(BoxComplex complex,
                            std::vector<GroupGenerator> generators,
                            GroupOrbitOptions options = default_options());

    static GroupOrbitOptions default_options() {
        GroupOrbitOptions options;
        options.include_torus_images = true;
        return options;
    }

    const BoxComplex& complex() const { return complex_; }
    int dimension() const { return complex_.dimension(); }
    const std::vector<GroupGenerator>& generators() const { return generators_; }
    const GroupOrbitOptions& options() const { return options_; }

    /// Edge graph of the complex restricted to the unit cube corners
    OrientationGraph unit_graph() const;

    /// Edges of the reference triangulation of {0,1}^d, lexicographically oriented
    const std::set<Edge>& unit_edges() const { return unit_edges_; }

    /// unit_edges() minus the edges already present in either direction
    std::set<Edge> triangulation_edges() const;

    bool is_terminal() const { return triangulation_edges().empty(); }

    // ---- In-place transitions ----

    /**
     * @brief Insert the orbit of a simplex
     * @throws VertexOrderError (the state is left unchanged)
     */
    Orbit add_simplex_orbit(const Simplex& simplex);

    /**
     * @brief Try to orient an edge by inserting its orbit
     *
     * @param verify_acyclic Also require the full edge graph to stay acyclic
     * @return false if the orbit conflicts with a recorded vertex order or
     *         closes a cycle; the state is then unchanged
     */
    bool try_orient(const Edge& edge, bool verify_acyclic = true);

    BoxComplex::Checkpoint checkpoint() const { return complex_.checkpoint(); }
    void rollback(const BoxComplex::Checkpoint& mark) { complex_.rollback(mark); }
    void commit() { complex_.commit(); }

    // ---- Derived states ----

    /// Orient every triangulation edge through the origin towards it
    TriangulationEdgeFinder with_all_edges_to_origin() const;

    /**
     * @brief Triangulation edges with exactly one feasible orientation,
     *        returned in that orientation
     */
    std::vector<Edge> obvious_edges() const;

    TriangulationEdgeFinder with_obvious_edges_added() const;

    TriangulationEdgeFinder with_edge_added(const Vertex& v0, const Vertex& v1) const;

    /**
     * @brief Linear extensions of the unit graph usable as a cube vertex order
     *
     * An order qualifies if the cube triangulation in that order, and in its
     * unit translates along every axis of side length greater than one, can
     * be inserted orbit-wise without a vertex order conflict.
     *
     * @throws ConsistencyException if the unit graph misses a corner or has a cycle
     */
    std::vector<std::vector<Vertex>> compatible_orders() const;

    /// The reference cube triangulation ordered by a topological order of the unit graph
    std::vector<Simplex> unit_cube_simplices() const;

private:
    BoxComplex complex_;
    std::vector<GroupGenerator> generators_;
    GroupOrbitOptions options_;
    std::set<Edge> unit_edges_;

    GroupOrbit group() { return GroupOrbit(complex_, generators_, options_); }
};

} // namespace torus

#endif // TORUS_SEARCH_TRIANGULATION_EDGE_FINDER_H
