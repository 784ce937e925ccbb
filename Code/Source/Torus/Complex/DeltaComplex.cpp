/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Complex/DeltaComplex.h"
#include "Core/TorusException.h"

#include <string>

namespace torus {

DeltaComplex::DeltaComplex(int dimension)
    : dimension_(dimension),
      levels_(static_cast<size_t>(dimension + 1)) {
    TORUS_CHECK_ARG(dimension >= 0, "dimension must be non-negative");
}

void DeltaComplex::set_cells(int k, std::vector<std::vector<int>> faces) {
    TORUS_CHECK_ARG(k >= 0 && k <= dimension_,
                    "level " + std::to_string(k) + " outside [0, dimension]");
    for (const auto& f : faces) {
        TORUS_CHECK_ARG(static_cast<int>(f.size()) == (k == 0 ? 0 : k + 1),
                        "a " + std::to_string(k) + "-cell needs " + std::to_string(k + 1) + " faces");
        for (int idx : f) {
            TORUS_CHECK_ARG(k > 0 && idx >= 0 && idx < n_cells(k - 1),
                            "face index out of range");
        }
    }
    levels_[static_cast<size_t>(k)] = std::move(faces);
}

int DeltaComplex::n_cells(int k) const {
    if (k < 0 || k > dimension_) {
        return 0;
    }
    return static_cast<int>(levels_[static_cast<size_t>(k)].size());
}

const std::vector<int>& DeltaComplex::faces(int k, int cell) const {
    TORUS_CHECK_ARG(cell >= 0 && cell < n_cells(k), "cell index out of range");
    return levels_[static_cast<size_t>(k)][static_cast<size_t>(cell)];
}

void DeltaComplex::check() const {
    for (int k = 2; k <= dimension_; ++k) {
        for (int c = 0; c < n_cells(k); ++c) {
            const auto& bd = faces(k, c);
            for (int j = 1; j <= k; ++j) {
                for (int i = 0; i < j; ++i) {
                    const int lhs = faces(k - 1, bd[static_cast<size_t>(i)])[static_cast<size_t>(j - 1)];
                    const int rhs = faces(k - 1, bd[static_cast<size_t>(j)])[static_cast<size_t>(i)];
                    if (lhs != rhs) {
                        TORUS_THROW(ConsistencyException,
                                    "d_i d_j != d_{j-1} d_i for " + std::to_string(k) +
                                    "-cell " + std::to_string(c) + " (i=" + std::to_string(i) +
                                    ", j=" + std::to_string(j) + ")");
                    }
                }
            }
        }
    }
}

IntMatrix DeltaComplex::boundary_matrix(int k, bool augmented) const {
    if (k == 0) {
        IntMatrix m = IntMatrix::Zero(augmented ? 1 : 0, n_cells(0));
        if (augmented) {
            m.setOnes();
        }
        return m;
    }
    IntMatrix m = IntMatrix::Zero(n_cells(k - 1), n_cells(k));
    for (int c = 0; c < n_cells(k); ++c) {
        const auto& bd = faces(k, c);
        long long sign = 1;
        for (int idx : bd) {
            m(idx, c) += sign;
            sign = -sign;
        }
    }
    return m;
}

long long DeltaComplex::euler_characteristic() const {
    long long chi = 0;
    for (int k = 0; k <= dimension_; ++k) {
        chi += (k % 2 == 0 ? 1 : -1) * static_cast<long long>(n_cells(k));
    }
    return chi;
}

} // namespace torus
