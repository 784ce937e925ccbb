/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#include "Search/EdgeOrientationSearch.h"
#include "Core/Logger.h"

#include <string>

namespace torus {

EdgeOrientationSearch::EdgeOrientationSearch(TriangulationEdgeFinder start, SearchOptions options)
    : state_(std::move(start)),
      options_(options) {}

bool EdgeOrientationSearch::open_frame() {
    const std::set<Edge> undecided = state_.triangulation_edges();
    if (undecided.empty()) {
        return false;
    }
    stack_.push_back(Frame{*undecided.begin(), 0, state_.checkpoint()});
    return true;
}

bool EdgeOrientationSearch::descend(const Edge& edge) {
    ++n_tried_;

    OrientationGraph graph = state_.unit_graph();
    graph.add_edge(edge.first, edge.second);
    if (!graph.is_acyclic()) {
        ++n_pruned_;
        return false;
    }
    if (!state_.try_orient(edge, options_.verify_acyclic_after_insert)) {
        ++n_pruned_;
        return false;
    }
    return true;
}

TriangulationEdgeFinder EdgeOrientationSearch::emit() {
    ++n_yielded_;
    if (options_.progress_interval > 0 && n_yielded_ % options_.progress_interval == 0) {
        TORUS_INFO() << "Edge orientation search: " << n_yielded_ << " states, "
                     << n_tried_ << " orientations tried, " << n_pruned_ << " pruned";
    }
    TriangulationEdgeFinder result(state_);
    result.commit();
    return result;
}

std::optional<TriangulationEdgeFinder> EdgeOrientationSearch::next() {
    if (options_.max_states > 0 && n_yielded_ >= options_.max_states) {
        return std::nullopt;
    }

    if (!started_) {
        started_ = true;
        if (!open_frame()) {
            return emit();
        }
    }

    while (!stack_.empty()) {
        Frame& top = stack_.back();
        state_.rollback(top.checkpoint);
        if (top.next_choice >= 2) {
            stack_.pop_back();
            continue;
        }
        const Edge edge = top.next_choice == 0 ? top.edge : Edge(top.edge.second, top.edge.first);
        ++top.next_choice;

        if (!descend(edge)) {
            continue;
        }
        TORUS_LOG_DEBUG("Depth " + std::to_string(stack_.size()) + ": " + to_string(edge));
        if (!open_frame()) {
            return emit();
        }
    }
    return std::nullopt;
}

std::vector<TriangulationEdgeFinder> EdgeOrientationSearch::collect() {
    std::vector<TriangulationEdgeFinder> result;
    while (auto state = next()) {
        result.push_back(std::move(*state));
    }
    return result;
}

} // namespace torus
