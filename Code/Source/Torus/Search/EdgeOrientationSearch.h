/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef TORUS_SEARCH_EDGE_ORIENTATION_SEARCH_H
#define TORUS_SEARCH_EDGE_ORIENTATION_SEARCH_H

/**
 * @file EdgeOrientationSearch.h
 * @brief Backtracking enumeration of complete edge orientations
 *
 * Depth-first search over the undecided triangulation edges of a state.
 * At each level the first undecided edge is oriented one way, then the
 * other. A branch is pruned when
 *  - the unit graph plus the new edge has a cycle (cheap pre-filter),
 *  - inserting the edge orbit raises VertexOrderError, or
 *  - with SearchOptions::verify_acyclic_after_insert, the full edge graph
 *    has a cycle afterwards.
 * States without undecided edges are terminal and are handed out one at a
 * time by next().
 *
 * The search keeps a single working state and an explicit stack of frames;
 * siblings are separated by rolling the working state back to the frame's
 * checkpoint, so memory grows with the depth only.
 *
 * Usage:
 * @code
 *   EdgeOrientationSearch search(start);
 *   while (auto state = search.next()) {
 *       use(*state);
 *   }
 * @endcode
 */

#include "Search/SearchOptions.h"
#include "Search/TriangulationEdgeFinder.h"

#include <optional>
#include <vector>

namespace torus {

class EdgeOrientationSearch {
public:
    explicit EdgeOrientationSearch(TriangulationEdgeFinder start,
                                   SearchOptions options = SearchOptions());

    /**
     * @brief The next terminal state, or nothing once the search is exhausted
     */
    std::optional<TriangulationEdgeFinder> next();

    /// Drain the remaining terminal states
    std::vector<TriangulationEdgeFinder> collect();

    size_t n_yielded() const { return n_yielded_; }

    /// Orientations attempted so far
    size_t n_tried() const { return n_tried_; }

    /// Orientations pruned so far
    size_t n_pruned() const { return n_pruned_; }

    size_t depth() const { return stack_.size(); }

    const SearchOptions& options() const { return options_; }

private:
    struct Frame {
        Edge edge;
        int next_choice = 0;
        BoxComplex::Checkpoint checkpoint;
    };

    TriangulationEdgeFinder state_;
    SearchOptions options_;
    std::vector<Frame> stack_;
    bool started_ = false;
    size_t n_yielded_ = 0;
    size_t n_tried_ = 0;
    size_t n_pruned_ = 0;

    bool open_frame();
    bool descend(const Edge& edge);
    TriangulationEdgeFinder emit();
};

} // namespace torus

#endif // TORUS_SEARCH_EDGE_ORIENTATION_SEARCH_H
