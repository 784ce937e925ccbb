/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef TORUS_COMPLEX_BOX_COMPLEX_H
#define TORUS_COMPLEX_BOX_COMPLEX_H

/**
 * @file BoxComplex.h
 * @brief Simplicial complex on the lattice points of an integer box
 *
 * The complex is populated only by insertion. Inserting a k-simplex inserts
 * all of its faces down to vertices and records the ordered boundary tuple
 * (face i omits vertex i). Every simplex, inserted or merely constructed, is
 * interned through the complex's SimplexStore so that one vertex set never
 * appears with two different orders.
 *
 * All insertions are recorded on a trail. A checkpoint taken with
 * checkpoint() can later be restored exactly with rollback(); add_simplex()
 * uses this internally so that a failed insertion leaves no trace.
 */

#include "Complex/CellComplex.h"
#include "Core/SimplexStore.h"
#include "Core/Types.h"

#include <cstddef>
#include <set>
#include <vector>

namespace torus {

class OrientationGraph;

class BoxComplex {
public:
    /**
     * @brief Empty complex over the box [0, side_0] x ... x [0, side_{d-1}]
     * @throws InvalidArgumentException for an empty, too large or
     *         non-positive list of side lengths
     */
    explicit BoxComplex(std::vector<coord_t> side_lengths);

    int dimension() const { return cells_.dimension(); }
    const std::vector<coord_t>& side_lengths() const { return side_lengths_; }

    /// Whether the vertex has the right length and lies in the closed box
    bool in_box(const Vertex& vertex) const;

    /// All lattice points of the box, lexicographically sorted
    std::vector<Vertex> points() const;

    // ------------------------
    // Construction
    // ------------------------

    /**
     * @brief Intern a simplex without inserting it
     * @throws VertexOrderError on an order conflict
     */
    const Simplex& make_simplex(const Simplex& simplex);

    /**
     * @brief Insert a simplex together with all of its faces
     *
     * Idempotent for simplices already present in the same order.
     *
     * @return The simplex in its canonical order
     * @throws OutOfBoxException if a vertex lies outside the box
     * @throws InvalidArgumentException for repeated vertices or too many vertices
     * @throws VertexOrderError if the simplex or one of its faces conflicts
     *         with a recorded order; the complex is left unchanged
     */
    Simplex add_simplex(const Simplex& simplex);

    // ------------------------
    // Queries
    // ------------------------

    bool contains(const Simplex& simplex) const { return cells_.contains(simplex); }

    /// Simplices with the given number of vertices
    const std::set<Simplex>& simplices(int n_vertices) const { return cells_.cells(n_vertices); }

    const std::vector<Simplex>& boundary(const Simplex& simplex) const {
        return cells_.boundary(simplex);
    }

    /// Recorded order for the vertex set of @p simplex, or nullptr
    const Simplex* recorded_order(const Simplex& simplex) const {
        return store_.find(SimplexKey(simplex));
    }

    const SimplexCells& cells() const { return cells_; }

    /**
     * @brief Codimension-1 simplices lying in one face of the box
     *
     * @param axis Coordinate index
     * @param inner Select the face at coordinate 0 (true) or at the side length (false)
     */
    std::vector<Simplex> facets_at_boundary(size_t axis, bool inner = true) const;

    /**
     * @brief Axis-aligned unit edges (v, v + e_i) with v in [0, side)^d
     */
    std::vector<Edge> lattice_edges() const;

    /**
     * @brief Directed graph with the vertices as nodes and the edges as arcs
     */
    OrientationGraph edge_graph() const;

    // ------------------------
    // Derived complexes
    // ------------------------

    /// Same box with every simplex in reversed vertex order
    BoxComplex reversed() const;

    /**
     * @brief Union of two complexes over the same box
     * @throws VertexOrderError if the two complexes disagree on an order
     */
    BoxComplex merged(const BoxComplex& other) const;

    // ------------------------
    // Trail
    // ------------------------

    struct Checkpoint {
        SimplexStore::Checkpoint store = 0;
        size_t inserted = 0;
    };

    Checkpoint checkpoint() const { return {store_.checkpoint(), inserted_.size()}; }

    /**
     * @brief Remove every simplex and key recorded after the checkpoint
     */
    void rollback(const Checkpoint& mark);

    /**
     * @brief Make everything recorded so far permanent
     */
    void commit();

private:
    std::vector<coord_t> side_lengths_;
    SimplexStore store_;
    SimplexCells cells_;
    std::vector<Simplex> inserted_;

    void check_insertable(const Simplex& simplex) const;
    const Simplex& insert_recursive(const Simplex& simplex);
};

} // namespace torus

#endif // TORUS_COMPLEX_BOX_COMPLEX_H
