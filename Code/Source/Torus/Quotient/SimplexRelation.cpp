/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Quotient/SimplexRelation.h"
#include "Core/TorusException.h"

#include <deque>
#include <sstream>

namespace torus {

SimplexClass::SimplexClass(std::set<Simplex> members)
    : members_(std::move(members)) {
    TORUS_CHECK_ARG(!members_.empty(), "an equivalence class cannot be empty");
}

std::string to_string(const SimplexClass& cls) {
    return to_string(Orbit(cls.members().begin(), cls.members().end()));
}

SimplexRelation::SimplexRelation(const SimplexCells& complex)
    : complex_(complex) {}

ClassRef SimplexRelation::class_of(const Simplex& simplex) const {
    auto it = class_map_.find(simplex);
    if (it != class_map_.end()) {
        return it->second;
    }
    return std::make_shared<const SimplexClass>(std::set<Simplex>{simplex});
}

bool SimplexRelation::equivalent(const Simplex& a, const Simplex& b) const {
    if (a == b) {
        return true;
    }
    auto it = class_map_.find(a);
    return it != class_map_.end() && it->second->contains(b);
}

size_t SimplexRelation::n_classes() const {
    std::set<const SimplexClass*> distinct;
    for (const auto& kv : class_map_) {
        distinct.insert(kv.second.get());
    }
    return distinct.size();
}

void SimplexRelation::merge(const std::vector<Simplex>& simplices) {
    std::set<Simplex> united;
    for (const Simplex& s : simplices) {
        ClassRef cls = class_of(s);
        united.insert(cls->members().begin(), cls->members().end());
    }
    auto merged = std::make_shared<const SimplexClass>(std::move(united));
    for (const Simplex& member : merged->members()) {
        class_map_[member] = merged;
    }
}

void SimplexRelation::identify(const std::vector<Simplex>& simplices) {
    std::deque<std::vector<Simplex>> work;
    work.push_back(simplices);

    while (!work.empty()) {
        std::vector<Simplex> group = std::move(work.front());
        work.pop_front();
        if (group.size() < 2) {
            continue;
        }

        const size_t n_vertices = group.front().size();
        bool already_identified = true;
        for (const Simplex& s : group) {
            TORUS_CHECK_ARG(s.size() == n_vertices,
                            "cannot identify simplices of different size: " +
                            to_string(group.front()) + " and " + to_string(s));
            TORUS_CHECK_ARG(complex_.contains(s),
                            "simplex " + to_string(s) + " is not in the complex");
            if (!equivalent(group.front(), s)) {
                already_identified = false;
            }
        }
        // Every earlier merge already propagated to the faces.
        if (already_identified) {
            continue;
        }

        merge(group);

        std::vector<const std::vector<Simplex>*> boundaries;
        boundaries.reserve(group.size());
        for (const Simplex& s : group) {
            boundaries.push_back(&complex_.boundary(s));
        }
        const size_t n_faces = boundaries.front()->size();
        for (size_t i = 0; i < n_faces; ++i) {
            std::vector<Simplex> faces_i;
            faces_i.reserve(group.size());
            for (const auto* bd : boundaries) {
                faces_i.push_back(bd->at(i));
            }
            work.push_back(std::move(faces_i));
        }
    }
}

void SimplexRelation::validate() const {
    for (const auto& [src, cls] : class_map_) {
        const auto& src_boundary = complex_.boundary(src);
        for (const Simplex& dst : cls->members()) {
            std::map<Vertex, Vertex> vertex_map;
            for (size_t k = 0; k < src.size(); ++k) {
                vertex_map.emplace(src[k], dst[k]);
            }

            const auto& dst_boundary = complex_.boundary(dst);
            if (src_boundary.size() != dst_boundary.size()) {
                TORUS_THROW(ConsistencyException,
                            "Boundary size mismatch in identification: " +
                            to_string(src) + " ~ " + to_string(dst));
            }
            for (size_t i = 0; i < src_boundary.size(); ++i) {
                const Simplex& src_facet = src_boundary[i];
                const Simplex& dst_facet = dst_boundary[i];
                if (src_facet.size() != dst_facet.size()) {
                    TORUS_THROW(ConsistencyException,
                                "Face size mismatch in identification: " +
                                to_string(src_facet) + " vs " + to_string(dst_facet));
                }
                for (size_t k = 0; k < src_facet.size(); ++k) {
                    auto it = vertex_map.find(src_facet[k]);
                    if (it == vertex_map.end() || it->second != dst_facet[k]) {
                        std::ostringstream oss;
                        oss << "Vertex order mismatch in identification: "
                            << to_string(src_facet[k]) << " does not map to "
                            << to_string(dst_facet[k]) << " (" << to_string(src)
                            << " ~ " << to_string(dst) << ")";
                        TORUS_THROW(ConsistencyException, oss.str());
                    }
                }
                if (!equivalent(src_facet, dst_facet)) {
                    TORUS_THROW(ConsistencyException,
                                "Faces " + std::to_string(i) + " of " + to_string(src) +
                                " and " + to_string(dst) + " are not identified: " +
                                to_string(src_facet) + " vs " + to_string(dst_facet));
                }
            }
        }
    }
}

QuotientCells SimplexRelation::quotient() const {
    QuotientCells result(complex_.dimension());
    for (const auto& [n_vertices, level] : complex_.table()) {
        auto& classes = result.table()[n_vertices];
        for (const Simplex& s : level) {
            classes.insert(class_of(s));
        }
    }
    for (const auto& [s, bd] : complex_.boundary_map()) {
        ClassRef cls = class_of(s);
        if (result.contains(cls)) {
            continue;  // every member induces the same faces
        }
        std::vector<ClassRef> faces;
        faces.reserve(bd.size());
        for (const Simplex& f : bd) {
            faces.push_back(class_of(f));
        }
        result.boundary_map().emplace(std::move(cls), std::move(faces));
    }
    return result;
}

} // namespace torus
