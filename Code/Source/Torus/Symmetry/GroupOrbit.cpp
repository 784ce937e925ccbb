/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Symmetry/GroupOrbit.h"
#include "Core/Logger.h"
#include "Core/Simplex.h"
#include "Core/TorusConfig.h"
#include "Core/TorusException.h"

#include <algorithm>
#include <deque>

namespace torus {

GroupOrbit::GroupOrbit(BoxComplex& complex,
                       std::vector<GroupGenerator> generators,
                       GroupOrbitOptions options)
    : complex_(complex),
      generators_(std::move(generators)),
      options_(options) {
    for (const auto& g : generators_) {
        TORUS_CHECK_ARG(!g.is_affine() || g.dimension() == complex_.dimension(),
                        "generator " + g.name() + " does not act on a " +
                        std::to_string(complex_.dimension()) + "-dimensional lattice");
    }
}

Simplex GroupOrbit::canonicalize(const Simplex& simplex) const {
    TORUS_CHECK_ARG(!simplex.empty(), "cannot canonicalize the empty simplex");
    const auto& sides = complex_.side_lengths();
    for (const Vertex& v : simplex) {
        TORUS_CHECK_ARG(v.size() == sides.size(),
                        "vertex " + to_string(v) + " does not lie in a " +
                        std::to_string(sides.size()) + "-dimensional lattice");
    }
    Simplex result(simplex);
    for (size_t i = 0; i < sides.size(); ++i) {
        coord_t lowest = result.front()[i];
        for (const Vertex& v : result) {
            lowest = std::min(lowest, v[i]);
        }
        const coord_t shift = floor_div(lowest, sides[i]);
        if (shift != 0) {
            result = translate(result, i, -shift * sides[i]);
        }
    }
    return complex_.make_simplex(result);
}

std::vector<Simplex> GroupOrbit::torus_images(const Simplex& simplex) const {
    std::vector<Simplex> images{complex_.make_simplex(simplex)};
    const auto& sides = complex_.side_lengths();
    for (size_t i = 0; i < sides.size(); ++i) {
        const bool on_inner_face = std::all_of(simplex.begin(), simplex.end(),
                                               [i](const Vertex& v) { return v[i] == 0; });
        if (!on_inner_face) {
            continue;
        }
        const size_t n = images.size();
        for (size_t k = 0; k < n; ++k) {
            images.push_back(complex_.make_simplex(translate(images[k], i, sides[i])));
        }
    }
    return images;
}

Orbit GroupOrbit::orbit(const Simplex& simplex) const {
    const Simplex start = canonicalize(simplex);
    Orbit result{start};
    if (options_.include_torus_images) {
        for (auto& image : torus_images(start)) {
            result.insert(std::move(image));
        }
    }

    std::deque<Simplex> todo{start};
    while (!todo.empty()) {
        const Simplex current = std::move(todo.front());
        todo.pop_front();
        for (const auto& g : generators_) {
            Simplex image = canonicalize(g.apply(current));
            if (result.count(image) > 0) {
                continue;
            }
            if (options_.include_torus_images) {
                for (auto& t : torus_images(image)) {
                    result.insert(std::move(t));
                }
            }
            result.insert(image);
            todo.push_back(std::move(image));
            TORUS_THROW_IF(result.size() > config::MAX_ORBIT_SIZE, ConsistencyException,
                           "orbit of " + to_string(simplex) + " exceeds MAX_ORBIT_SIZE");
        }
    }
    return result;
}

std::vector<Orbit> GroupOrbit::top_orbits() const {
    const int top = complex_.dimension() + 1;
    std::set<Simplex> pool = complex_.simplices(top);
    std::vector<Orbit> result;

    const BoxComplex::Checkpoint mark = complex_.checkpoint();
    try {
        while (!pool.empty()) {
            const Simplex seed = *pool.begin();
            Orbit o = orbit(seed);
            for (const Simplex& image : o) {
                if (pool.count(image) == 0) {
                    throw InvalidGroupActionException(image, o, __FILE__, __LINE__, __FUNCTION__);
                }
            }
            for (const Simplex& image : o) {
                pool.erase(image);
            }
            result.push_back(std::move(o));
        }
    } catch (const TorusException&) {
        complex_.rollback(mark);
        throw;
    }

    TORUS_LOG_DEBUG("Partitioned " + std::to_string(complex_.simplices(top).size()) +
                    " top simplices into " + std::to_string(result.size()) + " orbits");
    return result;
}

Orbit GroupOrbit::add_simplex_orbit(const Simplex& simplex) {
    const BoxComplex::Checkpoint mark = complex_.checkpoint();
    try {
        Orbit o = orbit(simplex);
        for (const Simplex& member : o) {
            complex_.add_simplex(member);
        }
        return o;
    } catch (const TorusException&) {
        complex_.rollback(mark);
        throw;
    }
}

} // namespace torus
