/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef TORUS_CORE_SIMPLEX_H
#define TORUS_CORE_SIMPLEX_H

/**
 * @file Simplex.h
 * @brief Canonical simplex keys and elementary simplex operations
 */

#include "Types.h"
#include <algorithm>
#include <cstddef>
#include <functional>
#include <vector>

namespace torus {

/**
 * @brief Canonical (orientation-independent) key of a simplex
 *
 * Holds the vertices of a simplex in lexicographically sorted order. Two
 * simplices share a key exactly when they span the same vertex set.
 *
 * Key properties:
 * - Order-independent (sorted vertices)
 * - Hashable for use in unordered_map
 * - Comparable for use in ordered_map
 */
class SimplexKey {
public:
    SimplexKey() = default;

    explicit SimplexKey(const Simplex& simplex)
        : vertices_(simplex) {
        std::sort(vertices_.begin(), vertices_.end());
    }

    const Simplex& vertices() const { return vertices_; }
    size_t size() const { return vertices_.size(); }

    bool operator==(const SimplexKey& other) const {
        return vertices_ == other.vertices_;
    }

    bool operator!=(const SimplexKey& other) const {
        return vertices_ != other.vertices_;
    }

    bool operator<(const SimplexKey& other) const {
        return vertices_ < other.vertices_;
    }

    struct Hash {
        size_t operator()(const SimplexKey& key) const {
            size_t hash = 0;
            for (const Vertex& v : key.vertices_) {
                for (coord_t c : v) {
                    hash ^= std::hash<coord_t>()(c) + 0x9e3779b9 + (hash << 6) + (hash >> 2);
                }
                // Separate vertices so (1,2),(3) and (1),(2,3) differ
                hash ^= 0x7f4a7c15 + (hash << 6) + (hash >> 2);
            }
            return hash;
        }
    };

private:
    Simplex vertices_;
};

// ------------------------
// Elementary operations
// ------------------------

/**
 * @brief The i-th codimension-1 face: the simplex with vertex i removed
 *
 * The remaining vertices keep their relative order.
 */
Simplex face(const Simplex& simplex, size_t i);

/**
 * @brief All codimension-1 faces, face i removing vertex i
 *
 * A vertex (single-element simplex) has no faces.
 */
std::vector<Simplex> faces(const Simplex& simplex);

/**
 * @brief Whether all vertices of the simplex are pairwise distinct
 */
bool has_distinct_vertices(const Simplex& simplex);

/**
 * @brief Translate a vertex along one coordinate axis
 */
Vertex translate(const Vertex& vertex, size_t axis, coord_t amount);

/**
 * @brief Translate every vertex of a simplex along one coordinate axis
 */
Simplex translate(const Simplex& simplex, size_t axis, coord_t amount);

/**
 * @brief Same simplex with reversed vertex order
 */
Simplex reversed(const Simplex& simplex);

/**
 * @brief Integer division rounding toward negative infinity
 */
inline coord_t floor_div(coord_t numerator, coord_t denominator) {
    coord_t q = numerator / denominator;
    if ((numerator % denominator != 0) && ((numerator < 0) != (denominator < 0))) {
        --q;
    }
    return q;
}

} // namespace torus

#endif // TORUS_CORE_SIMPLEX_H
