/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef TORUS_COMPLEX_DELTA_COMPLEX_H
#define TORUS_COMPLEX_DELTA_COMPLEX_H

/**
 * @file DeltaComplex.h
 * @brief Index-based semi-simplicial complex and its integer boundary matrices
 *
 * Level k holds the k-cells; each k-cell (k >= 1) stores k+1 indices into
 * level k-1, face i omitting vertex i. Boundary matrices use the alternating
 * sign convention, so repeated faces (which appear after gluing) accumulate.
 */

#include <Eigen/Dense>

#include <cstddef>
#include <vector>

namespace torus {

using IntMatrix = Eigen::Matrix<long long, Eigen::Dynamic, Eigen::Dynamic>;

class DeltaComplex {
public:
    DeltaComplex() = default;
    explicit DeltaComplex(int dimension);

    int dimension() const { return dimension_; }

    /**
     * @brief Set the face indices of all k-cells
     */
    void set_cells(int k, std::vector<std::vector<int>> faces);

    /// Number of k-cells (0 outside [0, dimension])
    int n_cells(int k) const;

    const std::vector<int>& faces(int k, int cell) const;

    /**
     * @brief Verify d_i d_j = d_{j-1} d_i on face indices
     * @throws ConsistencyException on the first violation
     */
    void check() const;

    /**
     * @brief Matrix of the boundary map C_k -> C_{k-1}
     *
     * Rows index (k-1)-cells, columns index k-cells. For k == 0 the matrix
     * is the augmentation (a single row of ones) when @p augmented is set,
     * and has zero rows otherwise. Outside [0, dimension] the matrix is
     * empty in the direction with no cells.
     */
    IntMatrix boundary_matrix(int k, bool augmented = false) const;

    /// Euler characteristic sum_k (-1)^k n_k
    long long euler_characteristic() const;

private:
    int dimension_ = 0;
    std::vector<std::vector<std::vector<int>>> levels_;
};

} // namespace torus

#endif // TORUS_COMPLEX_DELTA_COMPLEX_H
