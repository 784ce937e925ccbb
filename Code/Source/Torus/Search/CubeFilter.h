/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef TORUS_SEARCH_CUBE_FILTER_H
#define TORUS_SEARCH_CUBE_FILTER_H

#include "Core/Types.h"

#include <set>
#include <vector>

namespace torus {

/**
 * @brief Selects vertices whose i-th coordinate lies in the i-th value set
 */
class CubeFilter {
public:
    explicit CubeFilter(std::vector<std::set<coord_t>> values)
        : values_(std::move(values)) {}

    /// Filter selecting the corners of the unit cube {0,1}^d
    static CubeFilter unit(int dimension) {
        return CubeFilter(std::vector<std::set<coord_t>>(static_cast<size_t>(dimension), std::set<coord_t>{0, 1}));
    }

    bool contains(const Vertex& vertex) const {
        if (vertex.size() != values_.size()) {
            return false;
        }
        for (size_t i = 0; i < values_.size(); ++i) {
            if (values_[i].count(vertex[i]) == 0) {
                return false;
            }
        }
        return true;
    }

    bool operator()(const Vertex& vertex) const { return contains(vertex); }

    std::vector<Vertex> filter(const std::vector<Vertex>& vertices) const {
        std::vector<Vertex> result;
        for (const Vertex& v : vertices) {
            if (contains(v)) {
                result.push_back(v);
            }
        }
        return result;
    }

private:
    std::vector<std::set<coord_t>> values_;
};

} // namespace torus

#endif // TORUS_SEARCH_CUBE_FILTER_H
