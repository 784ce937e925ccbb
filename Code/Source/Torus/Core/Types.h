/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef TORUS_CORE_TYPES_H
#define TORUS_CORE_TYPES_H

/**
 * @file Types.h
 * @brief Fundamental type definitions for the torus triangulation library
 *
 * Lattice vertices, ordered simplices and the status codes shared by the
 * exception hierarchy. Vertices are integer coordinate tuples; a simplex is
 * an ordered list of distinct vertices whose order carries meaning.
 */

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace torus {

// ------------------------
// Fundamental type aliases
// ------------------------
using coord_t = std::int32_t;   // lattice coordinate

/**
 * @brief Lattice point in Z^d
 */
using Vertex = std::vector<coord_t>;

/**
 * @brief Ordered simplex (k+1 distinct vertices for a k-simplex)
 */
using Simplex = std::vector<Vertex>;

/**
 * @brief Directed vertex pair (tail, head)
 */
using Edge = std::pair<Vertex, Vertex>;

/**
 * @brief Closure of a simplex under a symmetry group
 */
using Orbit = std::set<Simplex>;

/**
 * @brief Simplex table: vertex count -> simplices with that many vertices
 */
using SimplexTable = std::map<int, std::set<Simplex>>;

/**
 * @brief Boundary map: simplex -> ordered codimension-1 faces
 */
using BoundaryMap = std::map<Simplex, std::vector<Simplex>>;

// ---------
// Status codes
// ---------

/**
 * @brief Error categories reported by TorusException
 */
enum class TorusStatus : std::uint8_t {
    Success           = 0,
    InvalidArgument   = 1,
    VertexOrder       = 2,   // conflicting vertex order for one vertex set
    OutOfBox          = 3,   // vertex outside the declared box
    InvalidGroupAction = 4,  // generators do not preserve the complex
    Inconsistent      = 5,   // boundary or quotient consistency violated
    Unknown           = 255
};

inline const char* status_to_string(TorusStatus status) noexcept {
    switch (status) {
        case TorusStatus::Success:            return "Success";
        case TorusStatus::InvalidArgument:    return "Invalid argument";
        case TorusStatus::VertexOrder:        return "Vertex order conflict";
        case TorusStatus::OutOfBox:           return "Vertex outside box";
        case TorusStatus::InvalidGroupAction: return "Invalid group action";
        case TorusStatus::Inconsistent:       return "Consistency violation";
        default:                              return "Unknown error";
    }
}

// --------------------
// Formatting helpers
// --------------------
std::string to_string(const Vertex& vertex);
std::string to_string(const Simplex& simplex);
std::string to_string(const Edge& edge);
std::string to_string(const Orbit& orbit);

} // namespace torus

#endif // TORUS_CORE_TYPES_H
