/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Simplex.h"
#include <sstream>

namespace torus {

Simplex face(const Simplex& simplex, size_t i) {
    Simplex result;
    result.reserve(simplex.empty() ? 0 : simplex.size() - 1);
    for (size_t j = 0; j < simplex.size(); ++j) {
        if (j != i) {
            result.push_back(simplex[j]);
        }
    }
    return result;
}

std::vector<Simplex> faces(const Simplex& simplex) {
    std::vector<Simplex> result;
    if (simplex.size() < 2) {
        return result;
    }
    result.reserve(simplex.size());
    for (size_t i = 0; i < simplex.size(); ++i) {
        result.push_back(face(simplex, i));
    }
    return result;
}

bool has_distinct_vertices(const Simplex& simplex) {
    Simplex sorted(simplex);
    std::sort(sorted.begin(), sorted.end());
    return std::adjacent_find(sorted.begin(), sorted.end()) == sorted.end();
}

Vertex translate(const Vertex& vertex, size_t axis, coord_t amount) {
    Vertex result(vertex);
    result[axis] += amount;
    return result;
}

Simplex translate(const Simplex& simplex, size_t axis, coord_t amount) {
    Simplex result;
    result.reserve(simplex.size());
    for (const Vertex& v : simplex) {
        result.push_back(translate(v, axis, amount));
    }
    return result;
}

Simplex reversed(const Simplex& simplex) {
    return Simplex(simplex.rbegin(), simplex.rend());
}

// ============================================================================
// Formatting
// ============================================================================

std::string to_string(const Vertex& vertex) {
    std::ostringstream oss;
    oss << "(";
    for (size_t i = 0; i < vertex.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << vertex[i];
    }
    if (vertex.size() == 1) oss << ",";
    oss << ")";
    return oss.str();
}

std::string to_string(const Simplex& simplex) {
    std::ostringstream oss;
    oss << "(";
    for (size_t i = 0; i < simplex.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << to_string(simplex[i]);
    }
    oss << ")";
    return oss.str();
}

std::string to_string(const Edge& edge) {
    return to_string(edge.first) + " -> " + to_string(edge.second);
}

std::string to_string(const Orbit& orbit) {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const Simplex& s : orbit) {
        if (!first) oss << ", ";
        oss << to_string(s);
        first = false;
    }
    oss << "}";
    return oss.str();
}

} // namespace torus
