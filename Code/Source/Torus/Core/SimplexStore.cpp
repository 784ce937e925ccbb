/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "SimplexStore.h"
#include "TorusException.h"

namespace torus {

const Simplex& SimplexStore::intern(const Simplex& simplex) {
    SimplexKey key(simplex);
    auto it = orders_.find(key);
    if (it == orders_.end()) {
        trail_.push_back(key);
        auto inserted = orders_.emplace(std::move(key), simplex);
        return inserted.first->second;
    }
    if (it->second != simplex) {
        throw VertexOrderError(it->second, simplex, __FILE__, __LINE__, __FUNCTION__);
    }
    return it->second;
}

const Simplex* SimplexStore::find(const SimplexKey& key) const {
    auto it = orders_.find(key);
    return it == orders_.end() ? nullptr : &it->second;
}

void SimplexStore::rollback(Checkpoint mark) {
    TORUS_CHECK_ARG(mark <= trail_.size(), "checkpoint is newer than the trail");
    while (trail_.size() > mark) {
        orders_.erase(trail_.back());
        trail_.pop_back();
    }
}

} // namespace torus
