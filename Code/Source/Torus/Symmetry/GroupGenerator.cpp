/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Symmetry/GroupGenerator.h"
#include "Core/TorusException.h"

#include <algorithm>
#include <sstream>

namespace torus {

GroupGenerator GroupGenerator::identity(int dimension) {
    TORUS_CHECK_ARG(dimension > 0, "dimension must be positive");
    GroupGenerator g;
    g.name_ = "id";
    g.matrix_ = Matrix::Identity(dimension, dimension);
    g.offset_ = Vector::Zero(dimension);
    return g;
}

GroupGenerator GroupGenerator::translation(const Vertex& offset) {
    const int d = static_cast<int>(offset.size());
    GroupGenerator g = identity(d);
    for (int i = 0; i < d; ++i) {
        g.offset_(i) = offset[static_cast<size_t>(i)];
    }
    g.name_ = "translate" + to_string(offset);
    return g;
}

GroupGenerator GroupGenerator::permutation(const std::vector<int>& permutation) {
    const int d = static_cast<int>(permutation.size());
    std::vector<int> sorted(permutation);
    std::sort(sorted.begin(), sorted.end());
    for (int i = 0; i < d; ++i) {
        TORUS_CHECK_ARG(sorted[static_cast<size_t>(i)] == i,
                        "not a permutation of 0..dimension-1");
    }
    GroupGenerator g = identity(d);
    g.matrix_.setZero();
    std::ostringstream oss;
    oss << "permute(";
    for (int i = 0; i < d; ++i) {
        g.matrix_(i, permutation[static_cast<size_t>(i)]) = 1;
        oss << (i > 0 ? "," : "") << permutation[static_cast<size_t>(i)];
    }
    oss << ")";
    g.name_ = oss.str();
    return g;
}

GroupGenerator GroupGenerator::reflection(int dimension, int axis) {
    TORUS_CHECK_ARG(axis >= 0 && axis < dimension, "reflection axis out of range");
    GroupGenerator g = identity(dimension);
    g.matrix_(axis, axis) = -1;
    g.name_ = "reflect(" + std::to_string(axis) + ")";
    return g;
}

GroupGenerator GroupGenerator::linear(const Matrix& A, const Vector& b) {
    TORUS_CHECK_ARG(A.rows() == A.cols() && A.rows() > 0, "linear part must be square");
    TORUS_CHECK_ARG(b.size() == 0 || b.size() == A.rows(), "offset has the wrong length");
    GroupGenerator g;
    g.matrix_ = A;
    g.offset_ = b.size() == 0 ? Vector(Vector::Zero(A.rows())) : b;
    std::ostringstream oss;
    oss << "affine[";
    for (Eigen::Index i = 0; i < A.rows(); ++i) {
        oss << (i > 0 ? ";" : "");
        for (Eigen::Index j = 0; j < A.cols(); ++j) {
            oss << (j > 0 ? " " : "") << A(i, j);
        }
        oss << " | " << g.offset_(i);
    }
    oss << "]";
    g.name_ = oss.str();
    return g;
}

GroupGenerator GroupGenerator::custom(std::string name, Function function) {
    TORUS_CHECK_ARG(static_cast<bool>(function), "custom generator needs a callable");
    GroupGenerator g;
    g.name_ = std::move(name);
    g.function_ = std::move(function);
    return g;
}

GroupGenerator GroupGenerator::compose(const GroupGenerator& outer, const GroupGenerator& inner) {
    if (outer.is_affine() && inner.is_affine()) {
        TORUS_CHECK_ARG(outer.dimension() == inner.dimension(),
                        "cannot compose generators of different dimension");
        GroupGenerator g;
        g.matrix_ = outer.matrix_ * inner.matrix_;
        g.offset_ = outer.matrix_ * inner.offset_ + outer.offset_;
        g.name_ = outer.name_ + "*" + inner.name_;
        return g;
    }
    return custom(outer.name_ + "*" + inner.name_,
                  [outer, inner](const Vertex& v) { return outer(inner(v)); });
}

Vertex GroupGenerator::operator()(const Vertex& vertex) const {
    if (function_) {
        Vertex image = function_(vertex);
        TORUS_CHECK_ARG(image.size() == vertex.size(),
                        "generator " + name_ + " maps " + to_string(vertex) + " to " +
                        to_string(image) + " of a different dimension");
        return image;
    }
    TORUS_CHECK_ARG(static_cast<Eigen::Index>(vertex.size()) == matrix_.cols(),
                    "generator " + name_ + " applied to vertex " + to_string(vertex) +
                    " of the wrong dimension");
    Vector v(static_cast<Eigen::Index>(vertex.size()));
    for (size_t i = 0; i < vertex.size(); ++i) {
        v(static_cast<Eigen::Index>(i)) = vertex[i];
    }
    const Vector image = matrix_ * v + offset_;
    return Vertex(image.data(), image.data() + image.size());
}

Simplex GroupGenerator::apply(const Simplex& simplex) const {
    Simplex result;
    result.reserve(simplex.size());
    for (const Vertex& v : simplex) {
        result.push_back((*this)(v));
    }
    return result;
}

} // namespace torus
