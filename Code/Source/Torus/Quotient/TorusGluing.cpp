/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Quotient/TorusGluing.h"
#include "Core/Logger.h"
#include "Core/Simplex.h"
#include "Core/TorusException.h"
#include "Symmetry/GroupOrbit.h"

namespace torus {

SimplexRelation torus_relation(BoxComplex& box) {
    SimplexRelation relation(box.cells());
    const auto& sides = box.side_lengths();
    for (size_t axis = 0; axis < sides.size(); ++axis) {
        for (const Simplex& facet0 : box.facets_at_boundary(axis, true)) {
            const Simplex translated = translate(facet0, axis, sides[axis]);
            TORUS_THROW_IF(box.recorded_order(translated) == nullptr, ConsistencyException,
                           "facet " + to_string(facet0) + " has no translate " +
                           to_string(translated) + " on the opposite face");
            const Simplex facet1 = box.make_simplex(translated);
            TORUS_THROW_IF(!box.contains(facet1), ConsistencyException,
                           "translate " + to_string(facet1) + " is not in the complex");
            relation.identify(facet1, facet0);
        }
    }
    return relation;
}

SimplexRelation quotient_relation(BoxComplex& box, const std::vector<GroupGenerator>& generators) {
    SimplexRelation relation = torus_relation(box);
    GroupOrbit group(box, generators);
    for (const Orbit& o : group.top_orbits()) {
        relation.identify(std::vector<Simplex>(o.begin(), o.end()));
    }
    TORUS_LOG_DEBUG("Quotient relation has " + std::to_string(relation.n_classes()) +
                    " non-trivial classes");
    return relation;
}

QuotientCells torus_cells(BoxComplex& box) {
    return torus_relation(box).quotient();
}

QuotientCells quotient_cells(BoxComplex& box, const std::vector<GroupGenerator>& generators) {
    return quotient_relation(box, generators).quotient();
}

} // namespace torus
