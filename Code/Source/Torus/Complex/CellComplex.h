/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef TORUS_COMPLEX_CELL_COMPLEX_H
#define TORUS_COMPLEX_CELL_COMPLEX_H

/**
 * @file CellComplex.h
 * @brief Simplex table plus boundary map over an arbitrary cell type
 *
 * A CellComplex is the data a homology computation needs: cells grouped by
 * vertex count and, for every cell with at least two vertices, the ordered
 * tuple of its codimension-1 faces. The box complex uses Simplex cells;
 * quotients use equivalence classes of simplices as cells.
 *
 * The table is indexed by vertex count, so k-simplices live at key k+1 and
 * a d-dimensional complex has its top cells at key d+1.
 */

#include "Core/TorusException.h"
#include "Core/Types.h"
#include "Complex/DeltaComplex.h"

#include <functional>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace torus {

template<typename Cell, typename Less = std::less<Cell>>
class CellComplex {
public:
    using cell_type = Cell;
    using CellSet = std::set<Cell, Less>;
    using Table = std::map<int, CellSet>;
    using Boundary = std::map<Cell, std::vector<Cell>, Less>;

    /// Formats a cell for diagnostics
    using Formatter = std::function<std::string(const Cell&)>;

    CellComplex() = default;

    explicit CellComplex(int dimension) : dimension_(dimension) {}

    CellComplex(int dimension, Table simplices, Boundary boundary)
        : dimension_(dimension),
          simplices_(std::move(simplices)),
          boundary_(std::move(boundary)) {}

    int dimension() const { return dimension_; }

    const Table& table() const { return simplices_; }
    Table& table() { return simplices_; }

    const Boundary& boundary_map() const { return boundary_; }
    Boundary& boundary_map() { return boundary_; }

    /**
     * @brief Cells with the given number of vertices (empty set if none)
     */
    const CellSet& cells(int n_vertices) const {
        static const CellSet empty;
        auto it = simplices_.find(n_vertices);
        return it == simplices_.end() ? empty : it->second;
    }

    /**
     * @brief Faces of a cell (empty for vertices)
     * @throws InvalidArgumentException if the cell is unknown
     */
    const std::vector<Cell>& boundary(const Cell& cell) const {
        auto it = boundary_.find(cell);
        TORUS_THROW_IF(it == boundary_.end(), InvalidArgumentException,
                       "cell has no boundary entry");
        return it->second;
    }

    bool contains(const Cell& cell) const {
        return boundary_.find(cell) != boundary_.end();
    }

    size_t n_cells() const {
        size_t n = 0;
        for (const auto& kv : simplices_) {
            n += kv.second.size();
        }
        return n;
    }

    /**
     * @brief Verify the simplicial identity d_i d_j = d_{j-1} d_i for i < j
     *
     * Checked per cell: for every cell s and every pair i < j of face
     * indices, face j-1 of face i must equal face i of face j.
     *
     * @throws ConsistencyException naming the cell and both faces
     */
    void check_boundaries(const Formatter& format = Formatter()) const {
        for (const auto& [n_vertices, level] : simplices_) {
            for (const Cell& cell : level) {
                const auto& cell_faces = boundary(cell);
                const int n = static_cast<int>(cell_faces.size());
                for (int j = 0; j < n; ++j) {
                    for (int i = 0; i < j; ++i) {
                        const auto& face_i = boundary(cell_faces[static_cast<size_t>(i)]);
                        const auto& face_j = boundary(cell_faces[static_cast<size_t>(j)]);
                        if (face_i.empty() && face_j.empty()) {
                            continue;  // faces are vertices
                        }
                        const Cell& di_djm1 = face_i.at(static_cast<size_t>(j - 1));
                        const Cell& dj_di = face_j.at(static_cast<size_t>(i));
                        if (Less()(di_djm1, dj_di) || Less()(dj_di, di_djm1)) {
                            std::ostringstream oss;
                            oss << "Invalid boundary: i=" << i << ", j=" << j
                                << ", cell with " << n_vertices << " vertices";
                            if (format) {
                                oss << " " << format(cell) << ": "
                                    << format(di_djm1) << " != " << format(dj_di);
                            }
                            TORUS_THROW(ConsistencyException, oss.str());
                        }
                    }
                }
            }
        }
    }

    /**
     * @brief Enumerate cells and express faces by index
     *
     * Cells of each vertex count are numbered in sorted order; the faces of
     * an n-vertex cell are indices into the (n-1)-vertex enumeration.
     */
    DeltaComplex delta_complex() const {
        DeltaComplex delta(dimension_);
        std::map<Cell, int, Less> previous_enumeration;
        for (int n_vertices = 1; n_vertices <= dimension_ + 1; ++n_vertices) {
            const CellSet& level = cells(n_vertices);
            std::vector<std::vector<int>> face_indices;
            face_indices.reserve(level.size());
            for (const Cell& cell : level) {
                std::vector<int> indices;
                for (const Cell& f : boundary(cell)) {
                    auto it = previous_enumeration.find(f);
                    TORUS_THROW_IF(it == previous_enumeration.end(), ConsistencyException,
                                   "face of a " + std::to_string(n_vertices) +
                                   "-vertex cell is missing from the table");
                    indices.push_back(it->second);
                }
                face_indices.push_back(std::move(indices));
            }
            delta.set_cells(n_vertices - 1, std::move(face_indices));

            previous_enumeration.clear();
            int pos = 0;
            for (const Cell& cell : level) {
                previous_enumeration.emplace(cell, pos++);
            }
        }
        return delta;
    }

private:
    int dimension_ = 0;
    Table simplices_;
    Boundary boundary_;
};

/**
 * @brief Cell complex whose cells are ordered simplices
 */
using SimplexCells = CellComplex<Simplex>;

} // namespace torus

#endif // TORUS_COMPLEX_CELL_COMPLEX_H
