/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Search/EdgeAccumulator.h"
#include "Core/Logger.h"
#include "Core/TorusException.h"
#include "Search/OrientationGraph.h"
#include "Symmetry/GroupOrbit.h"

#include <algorithm>
#include <set>

namespace torus {

namespace {

Edge sorted_edge(const Simplex& s) {
    return s[0] < s[1] ? Edge(s[0], s[1]) : Edge(s[1], s[0]);
}

} // namespace

EdgeAccumulator::EdgeAccumulator(std::vector<coord_t> side_lengths,
                                 std::vector<GroupGenerator> generators)
    : side_lengths_(std::move(side_lengths)),
      generators_(std::move(generators)) {
    const BoxComplex box(side_lengths_);
    std::set<Edge> remaining;
    for (const Edge& e : box.lattice_edges()) {
        remaining.insert(e.first < e.second ? e : Edge(e.second, e.first));
    }

    GroupOrbitOptions options;
    options.include_torus_images = true;
    while (!remaining.empty()) {
        const Edge edge = *remaining.begin();
        BoxComplex builder(side_lengths_);
        GroupOrbit group(builder, generators_, options);
        const Orbit o = group.add_simplex_orbit(Simplex{edge.first, edge.second});
        builder.commit();
        for (const Simplex& s : o) {
            remaining.erase(sorted_edge(s));
        }
        remaining.erase(edge);
        builders_.push_back(std::move(builder));
    }
    TORUS_LOG_DEBUG("Lattice edges fall into " + std::to_string(builders_.size()) + " orbits");
}

size_t EdgeAccumulator::for_each_acyclic_orientation(
    const std::function<bool(const BoxComplex&)>& visitor) const {
    TORUS_CHECK_ARG(builders_.size() < 8 * sizeof(unsigned long long),
                    "too many edge orbits to enumerate");
    std::vector<BoxComplex> reversed_builders;
    reversed_builders.reserve(builders_.size());
    for (const BoxComplex& b : builders_) {
        reversed_builders.push_back(b.reversed());
    }

    const unsigned long long n_combinations = 1ull << builders_.size();
    size_t count = 0;
    for (unsigned long long bits = 0; bits < n_combinations; ++bits) {
        BoxComplex total(side_lengths_);
        for (size_t i = 0; i < builders_.size(); ++i) {
            const bool flip = ((bits >> i) & 1ull) != 0;
            total = total.merged(flip ? reversed_builders[i] : builders_[i]);
        }
        if (!total.edge_graph().is_acyclic()) {
            continue;
        }
        ++count;
        if (!visitor(total)) {
            break;
        }
    }
    return count;
}

std::vector<BoxComplex> EdgeAccumulator::acyclic_orientations() const {
    std::vector<BoxComplex> result;
    for_each_acyclic_orientation([&result](const BoxComplex& b) {
        result.push_back(b);
        return true;
    });
    return result;
}

} // namespace torus
