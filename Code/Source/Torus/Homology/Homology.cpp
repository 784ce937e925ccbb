/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Homology/Homology.h"
#include "Core/Logger.h"

#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace torus {

namespace {

// Locate the nonzero entry of smallest magnitude in the trailing block
bool find_pivot(const IntMatrix& m, Eigen::Index t, Eigen::Index& row, Eigen::Index& col) {
    long long best = 0;
    for (Eigen::Index j = t; j < m.cols(); ++j) {
        for (Eigen::Index i = t; i < m.rows(); ++i) {
            const long long a = std::llabs(m(i, j));
            if (a != 0 && (best == 0 || a < best)) {
                best = a;
                row = i;
                col = j;
            }
        }
    }
    return best != 0;
}

} // namespace

std::string to_string(const HomologyGroup& group) {
    if (group.is_trivial()) {
        return "0";
    }
    std::ostringstream oss;
    bool first = true;
    if (group.rank > 0) {
        oss << "Z";
        if (group.rank > 1) oss << "^" << group.rank;
        first = false;
    }
    for (long long e : group.torsion) {
        oss << (first ? "" : " + ") << "Z/" << e;
        first = false;
    }
    return oss.str();
}

std::vector<long long> smith_invariants(IntMatrix& m) {
    std::vector<long long> invariants;
    const Eigen::Index n = std::min(m.rows(), m.cols());

    for (Eigen::Index t = 0; t < n; ++t) {
        Eigen::Index pr = t;
        Eigen::Index pc = t;
        if (!find_pivot(m, t, pr, pc)) {
            break;
        }
        if (pr != t) m.row(t).swap(m.row(pr));
        if (pc != t) m.col(t).swap(m.col(pc));

        bool reduced = false;
        while (!reduced) {
            reduced = true;
            // Clear column t below the pivot
            for (Eigen::Index i = t + 1; i < m.rows(); ++i) {
                if (m(i, t) == 0) continue;
                const long long q = m(i, t) / m(t, t);
                m.row(i) -= q * m.row(t);
                if (m(i, t) != 0) {
                    m.row(t).swap(m.row(i));
                    reduced = false;
                }
            }
            // Clear row t right of the pivot
            for (Eigen::Index j = t + 1; j < m.cols(); ++j) {
                if (m(t, j) == 0) continue;
                const long long q = m(t, j) / m(t, t);
                m.col(j) -= q * m.col(t);
                if (m(t, j) != 0) {
                    m.col(t).swap(m.col(j));
                    reduced = false;
                }
            }
            if (!reduced) {
                continue;
            }
            // Pivot must divide the remaining block
            for (Eigen::Index i = t + 1; i < m.rows() && reduced; ++i) {
                for (Eigen::Index j = t + 1; j < m.cols(); ++j) {
                    if (m(i, j) % m(t, t) != 0) {
                        m.row(t) += m.row(i);
                        reduced = false;
                        break;
                    }
                }
            }
        }
        invariants.push_back(std::llabs(m(t, t)));
    }
    return invariants;
}

std::vector<HomologyGroup> compute_homology(const DeltaComplex& complex, bool reduced) {
    TORUS_TIMED_SCOPE("compute_homology");
    const int d = complex.dimension();

    // invariants[k] belong to d_k, k = 0 .. d+1
    std::vector<std::vector<long long>> invariants(static_cast<size_t>(d + 2));
    for (int k = 0; k <= d + 1; ++k) {
        IntMatrix bd = complex.boundary_matrix(k, reduced);
        invariants[static_cast<size_t>(k)] = smith_invariants(bd);
    }

    std::vector<HomologyGroup> groups(static_cast<size_t>(d + 1));
    for (int k = 0; k <= d; ++k) {
        const auto& in = invariants[static_cast<size_t>(k)];
        const auto& out = invariants[static_cast<size_t>(k + 1)];
        HomologyGroup& h = groups[static_cast<size_t>(k)];
        h.rank = complex.n_cells(k) - static_cast<int>(in.size()) - static_cast<int>(out.size());
        for (long long e : out) {
            if (e > 1) {
                h.torsion.push_back(e);
            }
        }
    }

    TORUS_LOG_DEBUG("Computed homology of a " + std::to_string(d) + "-dimensional complex");
    return groups;
}

} // namespace torus
