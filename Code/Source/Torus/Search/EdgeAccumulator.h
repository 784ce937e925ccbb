/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef TORUS_SEARCH_EDGE_ACCUMULATOR_H
#define TORUS_SEARCH_EDGE_ACCUMULATOR_H

/**
 * @file EdgeAccumulator.h
 * @brief Group-invariant orientations of the axis-aligned lattice edges
 *
 * The unit edges of the box fall into orbits under the generators (torus
 * images included). Each orbit can be oriented as generated or reversed;
 * an EdgeAccumulator enumerates the combinations whose edge graph is
 * acyclic. Such a combination is a valid starting point for a
 * triangulation search.
 */

#include "Complex/BoxComplex.h"
#include "Symmetry/GroupGenerator.h"

#include <functional>
#include <vector>

namespace torus {

class EdgeAccumulator {
public:
    EdgeAccumulator(std::vector<coord_t> side_lengths, std::vector<GroupGenerator> generators);

    /**
     * @brief One complex per orbit of lattice edges, holding that orbit
     */
    const std::vector<BoxComplex>& edge_builders() const { return builders_; }

    /**
     * @brief Visit every acyclic combination of orbit orientations
     *
     * The visitor returns false to stop.
     *
     * @return Number of acyclic combinations visited
     * @throws VertexOrderError if two orbits share an edge with opposite orders
     */
    size_t for_each_acyclic_orientation(const std::function<bool(const BoxComplex&)>& visitor) const;

    /// All acyclic combinations
    std::vector<BoxComplex> acyclic_orientations() const;

private:
    std::vector<coord_t> side_lengths_;
    std::vector<GroupGenerator> generators_;
    std::vector<BoxComplex> builders_;
};

} // namespace torus

#endif // TORUS_SEARCH_EDGE_ACCUMULATOR_H
