/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef TORUS_SEARCH_CUBE_TRIANGULATION_H
#define TORUS_SEARCH_CUBE_TRIANGULATION_H

/**
 * @file CubeTriangulation.h
 * @brief Kuhn (Freudenthal) triangulations of cubes
 *
 * The reference triangulation of {0,1}^d has one simplex per permutation p
 * of the axes: vertex i of that simplex has ones exactly on the axes
 * p_0, ..., p_{i-1}. Its vertices are therefore in lexicographic order.
 *
 * A CubeTriangulation transports the reference triangulation to an
 * axis-aligned cube and re-sorts every simplex by a prescribed vertex order.
 */

#include "Complex/BoxComplex.h"
#include "Core/Types.h"

#include <map>
#include <vector>

namespace torus {

class UnitCubeTriangulation {
public:
    explicit UnitCubeTriangulation(int dimension);

    int dimension() const { return dimension_; }

    /// Corners of {0,1}^d, lexicographically sorted
    std::vector<Vertex> points() const;

    /// One simplex per permutation, permutations in lexicographic order
    std::vector<Simplex> simplices() const;

    size_t size() const;

private:
    int dimension_;
};

class CubeTriangulation {
public:
    /**
     * @brief Triangulation of the cube spanned by the given corners
     *
     * @param ordered_vertices All 2^d corners of an axis-aligned cube with
     *        positive edge lengths, in the order the simplices should use
     * @throws InvalidArgumentException if the corners do not form such a cube
     */
    explicit CubeTriangulation(std::vector<Vertex> ordered_vertices);

    int dimension() const { return unit_.dimension(); }
    const std::vector<Vertex>& vertices() const { return vertices_; }
    const Vertex& extent_min() const { return extent_min_; }
    const Vertex& extent_max() const { return extent_max_; }

    /// Corners in lexicographic order
    std::vector<Vertex> points() const;

    const std::map<Vertex, Vertex>& unit_vertex_map() const { return unit_vertex_map_; }

    std::vector<Simplex> simplices() const;

private:
    std::vector<Vertex> vertices_;
    std::map<Vertex, size_t> sort_key_;
    Vertex extent_min_;
    Vertex extent_max_;
    UnitCubeTriangulation unit_;
    std::map<Vertex, Vertex> unit_vertex_map_;
};

/**
 * @brief Triangulate every unit cube of the box with lexicographic vertex order
 */
void add_box_triangulation(BoxComplex& box);

} // namespace torus

#endif // TORUS_SEARCH_CUBE_TRIANGULATION_H
