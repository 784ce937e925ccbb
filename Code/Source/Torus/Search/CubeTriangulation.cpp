/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Search/CubeTriangulation.h"
#include "Core/TorusConfig.h"
#include "Core/TorusException.h"

#include <algorithm>
#include <numeric>
#include <set>

namespace torus {

UnitCubeTriangulation::UnitCubeTriangulation(int dimension)
    : dimension_(dimension) {
    TORUS_CHECK_ARG(dimension > 0, "cube dimension must be positive");
    TORUS_CHECK_ARG(static_cast<size_t>(dimension) <= config::MAX_LATTICE_DIM,
                    "cube dimension exceeds MAX_LATTICE_DIM");
}

std::vector<Vertex> UnitCubeTriangulation::points() const {
    std::vector<Vertex> result;
    const size_t n = size_t(1) << dimension_;
    result.reserve(n);
    for (size_t bits = 0; bits < n; ++bits) {
        Vertex v(static_cast<size_t>(dimension_), 0);
        for (int i = 0; i < dimension_; ++i) {
            // most significant bit is axis 0, so the sequence is lexicographic
            v[static_cast<size_t>(i)] = static_cast<coord_t>((bits >> (dimension_ - 1 - i)) & 1u);
        }
        result.push_back(std::move(v));
    }
    return result;
}

std::vector<Simplex> UnitCubeTriangulation::simplices() const {
    std::vector<int> p(static_cast<size_t>(dimension_));
    std::iota(p.begin(), p.end(), 0);

    std::vector<Simplex> result;
    do {
        Simplex simplex;
        simplex.reserve(static_cast<size_t>(dimension_ + 1));
        for (int i = 0; i <= dimension_; ++i) {
            Vertex v(static_cast<size_t>(dimension_), 1);
            for (int j = i; j < dimension_; ++j) {
                v[static_cast<size_t>(p[static_cast<size_t>(j)])] = 0;
            }
            simplex.push_back(std::move(v));
        }
        result.push_back(std::move(simplex));
    } while (std::next_permutation(p.begin(), p.end()));
    return result;
}

size_t UnitCubeTriangulation::size() const {
    size_t n = 1;
    for (int k = 2; k <= dimension_; ++k) {
        n *= static_cast<size_t>(k);
    }
    return n;
}

// ----------------------------------------------------------------------------

CubeTriangulation::CubeTriangulation(std::vector<Vertex> ordered_vertices)
    : vertices_(std::move(ordered_vertices)),
      unit_(vertices_.empty() ? 0 : static_cast<int>(vertices_.front().size())) {
    const size_t d = static_cast<size_t>(unit_.dimension());
    TORUS_CHECK_ARG(vertices_.size() == (size_t(1) << d),
                    "a " + std::to_string(d) + "-cube needs " +
                    std::to_string(size_t(1) << d) + " corners");

    extent_min_ = vertices_.front();
    extent_max_ = vertices_.front();
    for (size_t k = 0; k < vertices_.size(); ++k) {
        const Vertex& v = vertices_[k];
        TORUS_CHECK_ARG(v.size() == d, "corner " + to_string(v) + " has the wrong dimension");
        TORUS_CHECK_ARG(sort_key_.emplace(v, k).second, "corner " + to_string(v) + " is repeated");
        for (size_t i = 0; i < d; ++i) {
            extent_min_[i] = std::min(extent_min_[i], v[i]);
            extent_max_[i] = std::max(extent_max_[i], v[i]);
        }
    }
    for (size_t i = 0; i < d; ++i) {
        TORUS_CHECK_ARG(extent_min_[i] < extent_max_[i], "cube is degenerate along an axis");
    }

    const std::vector<Vertex> corners = points();
    for (const Vertex& c : corners) {
        TORUS_CHECK_ARG(sort_key_.count(c) > 0,
                        "corner " + to_string(c) + " of the bounding cube is missing");
    }
    const std::vector<Vertex> unit_points = unit_.points();
    for (size_t k = 0; k < corners.size(); ++k) {
        unit_vertex_map_.emplace(unit_points[k], corners[k]);
    }
}

std::vector<Vertex> CubeTriangulation::points() const {
    std::vector<Vertex> result;
    for (const Vertex& u : unit_.points()) {
        Vertex p(u.size());
        for (size_t i = 0; i < u.size(); ++i) {
            p[i] = u[i] == 0 ? extent_min_[i] : extent_max_[i];
        }
        result.push_back(std::move(p));
    }
    return result;
}

std::vector<Simplex> CubeTriangulation::simplices() const {
    std::vector<Simplex> result;
    for (const Simplex& unit_simplex : unit_.simplices()) {
        Simplex simplex;
        simplex.reserve(unit_simplex.size());
        for (const Vertex& u : unit_simplex) {
            simplex.push_back(unit_vertex_map_.at(u));
        }
        std::sort(simplex.begin(), simplex.end(), [this](const Vertex& a, const Vertex& b) {
            return sort_key_.at(a) < sort_key_.at(b);
        });
        result.push_back(std::move(simplex));
    }
    return result;
}

void add_box_triangulation(BoxComplex& box) {
    const UnitCubeTriangulation unit(box.dimension());
    const std::vector<Vertex> offsets = unit.points();
    const auto& sides = box.side_lengths();

    const BoxComplex::Checkpoint mark = box.checkpoint();
    try {
        for (const Vertex& base : box.points()) {
            bool interior = true;
            for (size_t i = 0; i < base.size(); ++i) {
                interior = interior && base[i] < sides[i];
            }
            if (!interior) {
                continue;
            }
            std::vector<Vertex> corners;
            corners.reserve(offsets.size());
            for (const Vertex& o : offsets) {
                Vertex c(base);
                for (size_t i = 0; i < c.size(); ++i) {
                    c[i] += o[i];
                }
                corners.push_back(std::move(c));
            }
            for (const Simplex& s : CubeTriangulation(std::move(corners)).simplices()) {
                box.add_simplex(s);
            }
        }
    } catch (const TorusException&) {
        box.rollback(mark);
        throw;
    }
}

} // namespace torus
