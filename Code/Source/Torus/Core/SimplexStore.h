/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef TORUS_CORE_SIMPLEX_STORE_H
#define TORUS_CORE_SIMPLEX_STORE_H

/**
 * @file SimplexStore.h
 * @brief Registry enforcing one vertex order per vertex set
 *
 * The first order submitted for a vertex set becomes its canonical order
 * for the lifetime of the store; any later submission with a different
 * order raises VertexOrderError. The store is owned by a single complex,
 * so independent complexes never share orientation state.
 *
 * Newly registered keys are appended to a trail so that a caller can take
 * a checkpoint and later roll back everything registered after it.
 */

#include "Simplex.h"
#include "Types.h"

#include <cstddef>
#include <unordered_map>
#include <vector>

namespace torus {

class SimplexStore {
public:
    SimplexStore() = default;

    /**
     * @brief Register (or check) the vertex order of a simplex
     *
     * @return The simplex in its accepted order (equal to the argument)
     * @throws VertexOrderError if the vertex set is already registered
     *         with a different order
     */
    const Simplex& intern(const Simplex& simplex);

    /**
     * @brief Recorded order for a vertex set, or nullptr if unseen
     */
    const Simplex* find(const SimplexKey& key) const;

    bool contains(const SimplexKey& key) const { return find(key) != nullptr; }

    size_t size() const { return orders_.size(); }

    // ---- Trail ----
    using Checkpoint = size_t;

    Checkpoint checkpoint() const { return trail_.size(); }

    /**
     * @brief Forget every key registered after the checkpoint
     */
    void rollback(Checkpoint mark);

    /**
     * @brief Drop trail history (keeps all registered orders)
     */
    void commit() { trail_.clear(); }

private:
    std::unordered_map<SimplexKey, Simplex, SimplexKey::Hash> orders_;
    std::vector<SimplexKey> trail_;
};

} // namespace torus

#endif // TORUS_CORE_SIMPLEX_STORE_H
