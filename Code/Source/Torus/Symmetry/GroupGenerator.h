/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef TORUS_SYMMETRY_GROUP_GENERATOR_H
#define TORUS_SYMMETRY_GROUP_GENERATOR_H

/**
 * @file GroupGenerator.h
 * @brief Vertex maps generating a symmetry group of the lattice
 *
 * A generator is either an integer affine map v -> A v + b or an arbitrary
 * named callable. Affine generators compose into affine generators; any
 * composition involving a callable stays a callable.
 */

#include "Core/Types.h"

#include <Eigen/Dense>

#include <functional>
#include <string>
#include <vector>

namespace torus {

class GroupGenerator {
public:
    using Matrix = Eigen::Matrix<coord_t, Eigen::Dynamic, Eigen::Dynamic>;
    using Vector = Eigen::Matrix<coord_t, Eigen::Dynamic, 1>;
    using Function = std::function<Vertex(const Vertex&)>;

    // ---- Factories ----
    static GroupGenerator identity(int dimension);

    /// v -> v + offset
    static GroupGenerator translation(const Vertex& offset);

    /// Coordinate permutation: result[i] = v[permutation[i]]
    static GroupGenerator permutation(const std::vector<int>& permutation);

    /// Negate one coordinate
    static GroupGenerator reflection(int dimension, int axis);

    /// v -> A v + b
    static GroupGenerator linear(const Matrix& A, const Vector& b = Vector());

    /// Arbitrary vertex map
    static GroupGenerator custom(std::string name, Function function);

    /// Composition: first apply @p inner, then @p outer
    static GroupGenerator compose(const GroupGenerator& outer, const GroupGenerator& inner);

    Vertex operator()(const Vertex& vertex) const;

    /// Apply to every vertex of a simplex, keeping the order
    Simplex apply(const Simplex& simplex) const;

    const std::string& name() const { return name_; }
    bool is_affine() const { return !function_; }

    /// Dimension of an affine generator (0 for custom ones)
    int dimension() const { return static_cast<int>(matrix_.rows()); }

    const Matrix& matrix() const { return matrix_; }
    const Vector& offset() const { return offset_; }

private:
    GroupGenerator() = default;

    std::string name_;
    Matrix matrix_;
    Vector offset_;
    Function function_;
};

} // namespace torus

#endif // TORUS_SYMMETRY_GROUP_GENERATOR_H
