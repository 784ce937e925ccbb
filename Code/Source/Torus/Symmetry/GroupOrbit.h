/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef TORUS_SYMMETRY_GROUP_ORBIT_H
#define TORUS_SYMMETRY_GROUP_ORBIT_H

/**
 * @file GroupOrbit.h
 * @brief Closure of simplices under a symmetry group and torus translation
 *
 * Images are reduced to the fundamental box by translating each axis by a
 * whole number of side lengths, so that the smallest coordinate on that
 * axis lies in [0, side). Every image is interned through the complex, so an
 * image that contradicts a recorded vertex order raises VertexOrderError.
 */

#include "Complex/BoxComplex.h"
#include "Core/Types.h"
#include "Symmetry/GroupGenerator.h"

#include <vector>

namespace torus {

struct GroupOrbitOptions {
    /// Also add the translates of simplices lying in a coordinate plane x_i = 0
    /// onto the opposite face x_i = side
    bool include_torus_images = false;
};

class GroupOrbit {
public:
    GroupOrbit(BoxComplex& complex,
               std::vector<GroupGenerator> generators,
               GroupOrbitOptions options = GroupOrbitOptions());

    const std::vector<GroupGenerator>& generators() const { return generators_; }
    const GroupOrbitOptions& options() const { return options_; }

    /**
     * @brief Translate a simplex into the fundamental box and intern it
     * @throws VertexOrderError on an order conflict
     */
    Simplex canonicalize(const Simplex& simplex) const;

    /**
     * @brief Breadth-first closure of the simplex under the generators
     * @throws VertexOrderError if an image conflicts with a recorded order
     * @throws ConsistencyException if the orbit exceeds MAX_ORBIT_SIZE
     */
    Orbit orbit(const Simplex& simplex) const;

    /**
     * @brief Partition the top-dimensional simplices into orbits
     *
     * Orbits are listed in order of their smallest top simplex.
     *
     * @throws InvalidGroupActionException if an orbit leaves the set of
     *         top-dimensional simplices
     */
    std::vector<Orbit> top_orbits() const;

    /**
     * @brief Insert the whole orbit of a simplex
     *
     * Either every member is inserted or, on failure, the complex is left
     * as it was.
     *
     * @return The orbit
     */
    Orbit add_simplex_orbit(const Simplex& simplex);

private:
    BoxComplex& complex_;
    std::vector<GroupGenerator> generators_;
    GroupOrbitOptions options_;

    std::vector<Simplex> torus_images(const Simplex& simplex) const;
};

} // namespace torus

#endif // TORUS_SYMMETRY_GROUP_ORBIT_H
