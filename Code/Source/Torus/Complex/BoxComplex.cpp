/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Complex/BoxComplex.h"
#include "Core/Logger.h"
#include "Core/Simplex.h"
#include "Core/TorusConfig.h"
#include "Core/TorusException.h"
#include "Search/OrientationGraph.h"

#include <string>

namespace torus {

BoxComplex::BoxComplex(std::vector<coord_t> side_lengths)
    : side_lengths_(std::move(side_lengths)),
      cells_(static_cast<int>(side_lengths_.size())) {
    TORUS_CHECK_ARG(!side_lengths_.empty(), "box needs at least one axis");
    TORUS_CHECK_ARG(side_lengths_.size() <= config::MAX_LATTICE_DIM,
                    "box dimension " + std::to_string(side_lengths_.size()) +
                    " exceeds MAX_LATTICE_DIM");
    for (coord_t r : side_lengths_) {
        TORUS_CHECK_ARG(r > 0, "side lengths must be positive");
    }
}

bool BoxComplex::in_box(const Vertex& vertex) const {
    if (vertex.size() != side_lengths_.size()) {
        return false;
    }
    for (size_t i = 0; i < vertex.size(); ++i) {
        if (vertex[i] < 0 || vertex[i] > side_lengths_[i]) {
            return false;
        }
    }
    return true;
}

std::vector<Vertex> BoxComplex::points() const {
    std::vector<Vertex> result;
    Vertex p(side_lengths_.size(), 0);
    while (true) {
        result.push_back(p);
        // odometer with the last axis fastest, giving lexicographic order
        size_t axis = p.size();
        while (axis > 0) {
            --axis;
            if (p[axis] < side_lengths_[axis]) {
                ++p[axis];
                break;
            }
            p[axis] = 0;
            if (axis == 0) {
                return result;
            }
        }
    }
}

const Simplex& BoxComplex::make_simplex(const Simplex& simplex) {
    return store_.intern(simplex);
}

void BoxComplex::check_insertable(const Simplex& simplex) const {
    TORUS_CHECK_ARG(!simplex.empty(), "cannot insert the empty simplex");
    TORUS_CHECK_ARG(static_cast<int>(simplex.size()) <= dimension() + 1,
                    "simplex " + to_string(simplex) + " has more vertices than the box allows");
    for (const Vertex& v : simplex) {
        if (!in_box(v)) {
            throw OutOfBoxException(v, side_lengths_, __FILE__, __LINE__, __FUNCTION__);
        }
    }
    TORUS_CHECK_ARG(has_distinct_vertices(simplex),
                    "simplex " + to_string(simplex) + " has repeated vertices");
}

Simplex BoxComplex::add_simplex(const Simplex& simplex) {
    check_insertable(simplex);

    const Checkpoint mark = checkpoint();
    try {
        return insert_recursive(simplex);
    } catch (const VertexOrderError&) {
        rollback(mark);
        throw;
    }
}

const Simplex& BoxComplex::insert_recursive(const Simplex& simplex) {
    const Simplex& canonical = store_.intern(simplex);
    if (cells_.contains(canonical)) {
        return canonical;
    }

    std::vector<Simplex> simplex_boundary;
    simplex_boundary.reserve(canonical.size() > 1 ? canonical.size() : 0);
    for (const Simplex& f : faces(canonical)) {
        simplex_boundary.push_back(insert_recursive(f));
    }

    cells_.table()[static_cast<int>(canonical.size())].insert(canonical);
    cells_.boundary_map().emplace(canonical, std::move(simplex_boundary));
    inserted_.push_back(canonical);
    return canonical;
}

std::vector<Simplex> BoxComplex::facets_at_boundary(size_t axis, bool inner) const {
    TORUS_CHECK_ARG(axis < side_lengths_.size(), "axis out of range");
    const coord_t value = inner ? 0 : side_lengths_[axis];
    std::vector<Simplex> result;
    for (const Simplex& facet : simplices(dimension())) {
        bool on_face = true;
        for (const Vertex& p : facet) {
            if (p[axis] != value) {
                on_face = false;
                break;
            }
        }
        if (on_face) {
            result.push_back(facet);
        }
    }
    return result;
}

std::vector<Edge> BoxComplex::lattice_edges() const {
    std::vector<Edge> result;
    for (const Vertex& v : points()) {
        bool interior = true;
        for (size_t i = 0; i < v.size(); ++i) {
            if (v[i] >= side_lengths_[i]) {
                interior = false;
                break;
            }
        }
        if (!interior) {
            continue;
        }
        for (size_t i = 0; i < v.size(); ++i) {
            result.emplace_back(v, translate(v, i, 1));
        }
    }
    return result;
}

OrientationGraph BoxComplex::edge_graph() const {
    OrientationGraph graph;
    for (const Simplex& vertex : simplices(1)) {
        graph.add_vertex(vertex.front());
    }
    for (const Simplex& edge : simplices(2)) {
        graph.add_edge(edge[0], edge[1]);
    }
    return graph;
}

BoxComplex BoxComplex::reversed() const {
    BoxComplex result(side_lengths_);
    for (auto it = cells_.table().rbegin(); it != cells_.table().rend(); ++it) {
        for (const Simplex& s : it->second) {
            result.add_simplex(torus::reversed(s));
        }
    }
    result.commit();
    return result;
}

BoxComplex BoxComplex::merged(const BoxComplex& other) const {
    TORUS_CHECK_ARG(side_lengths_ == other.side_lengths_,
                    "cannot merge complexes over different boxes");
    BoxComplex result(*this);
    for (auto it = other.cells_.table().rbegin(); it != other.cells_.table().rend(); ++it) {
        for (const Simplex& s : it->second) {
            result.add_simplex(s);
        }
    }
    result.commit();
    return result;
}

void BoxComplex::rollback(const Checkpoint& mark) {
    TORUS_CHECK_ARG(mark.inserted <= inserted_.size(), "checkpoint is newer than the trail");
    while (inserted_.size() > mark.inserted) {
        const Simplex& s = inserted_.back();
        auto level = cells_.table().find(static_cast<int>(s.size()));
        if (level != cells_.table().end()) {
            level->second.erase(s);
            if (level->second.empty()) {
                cells_.table().erase(level);
            }
        }
        cells_.boundary_map().erase(s);
        inserted_.pop_back();
    }
    store_.rollback(mark.store);
}

void BoxComplex::commit() {
    store_.commit();
    inserted_.clear();
}

} // namespace torus
