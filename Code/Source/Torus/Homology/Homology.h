/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef TORUS_HOMOLOGY_HOMOLOGY_H
#define TORUS_HOMOLOGY_HOMOLOGY_H

/**
 * @file Homology.h
 * @brief Integer homology of a delta complex via Smith normal form
 *
 * H_k = ker d_k / im d_{k+1}. With r_k the rank of d_k and e_1 | e_2 | ...
 * the nonzero invariant factors of d_{k+1}:
 *
 *   rank H_k    = n_k - r_k - r_{k+1}
 *   torsion H_k = the invariant factors e_i > 1
 *
 * The reduced variant replaces d_0 by the augmentation C_0 -> Z.
 */

#include "Complex/DeltaComplex.h"

#include <string>
#include <vector>

namespace torus {

struct HomologyGroup {
    int rank = 0;
    std::vector<long long> torsion;

    bool is_trivial() const { return rank == 0 && torsion.empty(); }
    bool operator==(const HomologyGroup& other) const {
        return rank == other.rank && torsion == other.torsion;
    }
};

/// "Z^2 + Z/2" style description, "0" for the trivial group
std::string to_string(const HomologyGroup& group);

/**
 * @brief Nonzero invariant factors of an integer matrix, in divisibility order
 *
 * The argument is reduced in place.
 */
std::vector<long long> smith_invariants(IntMatrix& matrix);

/**
 * @brief Homology groups H_0 ... H_d
 */
std::vector<HomologyGroup> compute_homology(const DeltaComplex& complex, bool reduced = false);

} // namespace torus

#endif // TORUS_HOMOLOGY_HOMOLOGY_H
