/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef TORUS_SEARCH_SEARCH_OPTIONS_H
#define TORUS_SEARCH_SEARCH_OPTIONS_H

#include <cstddef>

namespace torus {

/**
 * @brief Options for EdgeOrientationSearch
 */
struct SearchOptions {
    /// Reject a branch whose full edge graph has a cycle after inserting the orbit
    bool verify_acyclic_after_insert = true;

    /// Log progress at INFO every this many terminal states (0 disables)
    std::size_t progress_interval = 0;

    /// Stop after this many terminal states (0 = unlimited)
    std::size_t max_states = 0;
};

} // namespace torus

#endif // TORUS_SEARCH_SEARCH_OPTIONS_H
