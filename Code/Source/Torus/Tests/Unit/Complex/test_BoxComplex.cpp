/**
 * @file test_BoxComplex.cpp
 * @brief Unit tests for BoxComplex.h - insertion, boundaries and rollback
 */

#include <gtest/gtest.h>
#include "Complex/BoxComplex.h"
#include "Core/Simplex.h"
#include "Core/TorusException.h"
#include "Search/CubeTriangulation.h"
#include "Search/OrientationGraph.h"

using namespace torus;

class BoxComplexTest : public ::testing::Test {
protected:
    BoxComplex square{{1, 1}};

    const Vertex v00{0, 0};
    const Vertex v01{0, 1};
    const Vertex v10{1, 0};
    const Vertex v11{1, 1};
};

// =============================================================================
// Construction
// =============================================================================

TEST_F(BoxComplexTest, InvalidBoxRejected) {
    EXPECT_THROW(BoxComplex(std::vector<coord_t>{}), InvalidArgumentException);
    EXPECT_THROW(BoxComplex({2, 0}), InvalidArgumentException);
    EXPECT_THROW(BoxComplex(std::vector<coord_t>(10, 1)), InvalidArgumentException);
}

TEST_F(BoxComplexTest, PointsAreLexicographic) {
    BoxComplex box({1, 2});
    const auto points = box.points();
    ASSERT_EQ(points.size(), 6u);
    EXPECT_EQ(points.front(), (Vertex{0, 0}));
    EXPECT_EQ(points[1], (Vertex{0, 1}));
    EXPECT_EQ(points[2], (Vertex{0, 2}));
    EXPECT_EQ(points.back(), (Vertex{1, 2}));
}

TEST_F(BoxComplexTest, AddSimplexInsertsAllFaces) {
    const Simplex t = square.add_simplex({v00, v10, v11});
    EXPECT_EQ(t, (Simplex{v00, v10, v11}));
    EXPECT_EQ(square.simplices(3).size(), 1u);
    EXPECT_EQ(square.simplices(2).size(), 3u);
    EXPECT_EQ(square.simplices(1).size(), 3u);

    const auto& bd = square.boundary(t);
    ASSERT_EQ(bd.size(), 3u);
    EXPECT_EQ(bd[0], (Simplex{v10, v11}));
    EXPECT_EQ(bd[1], (Simplex{v00, v11}));
    EXPECT_EQ(bd[2], (Simplex{v00, v10}));
    EXPECT_TRUE(square.boundary(Simplex{v00}).empty());
}

TEST_F(BoxComplexTest, AddSimplexIsIdempotent) {
    square.add_simplex({v00, v10, v11});
    const size_t n = square.cells().n_cells();
    EXPECT_EQ(square.add_simplex({v00, v10, v11}), (Simplex{v00, v10, v11}));
    EXPECT_EQ(square.cells().n_cells(), n);
}

TEST_F(BoxComplexTest, OrderConflictOnSharedFace) {
    square.add_simplex({v00, v10, v11});
    // The diagonal was recorded as (0,0) -> (1,1)
    EXPECT_THROW(square.add_simplex({v11, v01, v00}), VertexOrderError);
    EXPECT_NO_THROW(square.add_simplex({v00, v01, v11}));
}

TEST_F(BoxComplexTest, FailedInsertionLeavesComplexUnchanged) {
    square.add_simplex({v00, v11});
    const size_t n_cells = square.cells().n_cells();

    // Face 0, (0,1),(0,0), is inserted before face 1, (1,1),(0,0), conflicts
    EXPECT_THROW(square.add_simplex({v11, v01, v00}), VertexOrderError);
    EXPECT_EQ(square.cells().n_cells(), n_cells);
    EXPECT_FALSE(square.contains(Simplex{v01}));
    EXPECT_EQ(square.recorded_order(Simplex{v01, v00}), nullptr);
    EXPECT_EQ(square.recorded_order(Simplex{v11, v01, v00}), nullptr);
}

TEST_F(BoxComplexTest, OutOfBoxRejected) {
    try {
        square.add_simplex({v00, Vertex{2, 0}});
        FAIL() << "expected OutOfBoxException";
    } catch (const OutOfBoxException& e) {
        EXPECT_EQ(e.vertex(), (Vertex{2, 0}));
        EXPECT_EQ(e.status(), TorusStatus::OutOfBox);
    }
    EXPECT_THROW(square.add_simplex({Vertex{-1, 0}}), OutOfBoxException);
    EXPECT_THROW(square.add_simplex({Vertex{0, 0, 0}}), OutOfBoxException);
    EXPECT_EQ(square.cells().n_cells(), 0u);
}

TEST_F(BoxComplexTest, MalformedSimplexRejected) {
    EXPECT_THROW(square.add_simplex({}), InvalidArgumentException);
    EXPECT_THROW(square.add_simplex({v00, v10, v00}), InvalidArgumentException);
    EXPECT_THROW(square.add_simplex({v00, v10, v11, v01}), InvalidArgumentException);
}

// =============================================================================
// Order consistency over arbitrary insertion sequences
// =============================================================================

TEST_F(BoxComplexTest, SameKeySameOrderAlwaysSucceeds) {
    BoxComplex box({2, 2});
    add_box_triangulation(box);
    for (const auto& [n, level] : box.cells().table()) {
        for (const Simplex& s : level) {
            EXPECT_EQ(box.add_simplex(s), s);
            if (s.size() > 1) {
                EXPECT_THROW(box.add_simplex(reversed(s)), VertexOrderError);
            }
        }
    }
}

// =============================================================================
// Boundary identities
// =============================================================================

TEST_F(BoxComplexTest, BoundaryIdentityHoldsForTriangulatedCube) {
    BoxComplex cube({1, 1, 1});
    add_box_triangulation(cube);
    EXPECT_EQ(cube.simplices(4).size(), 6u);
    EXPECT_NO_THROW(cube.cells().check_boundaries());

    for (const Simplex& s : cube.simplices(4)) {
        const auto& bd = cube.boundary(s);
        for (size_t j = 0; j < bd.size(); ++j) {
            for (size_t i = 0; i < j; ++i) {
                EXPECT_EQ(cube.boundary(bd[i])[j - 1], cube.boundary(bd[j])[i]);
            }
        }
    }
}

TEST_F(BoxComplexTest, FacetsAtBoundary) {
    BoxComplex box({2, 1});
    add_box_triangulation(box);
    const auto inner = box.facets_at_boundary(0, true);
    const auto outer = box.facets_at_boundary(0, false);
    ASSERT_EQ(inner.size(), 1u);
    ASSERT_EQ(outer.size(), 1u);
    EXPECT_EQ(inner[0], (Simplex{{0, 0}, {0, 1}}));
    EXPECT_EQ(outer[0], (Simplex{{2, 0}, {2, 1}}));
    EXPECT_EQ(box.facets_at_boundary(1, true).size(), 2u);
    EXPECT_THROW(box.facets_at_boundary(2), InvalidArgumentException);
}

// =============================================================================
// Trail
// =============================================================================

TEST_F(BoxComplexTest, RollbackRestoresEarlierState) {
    square.add_simplex({v00, v10, v11});
    const auto mark = square.checkpoint();
    square.add_simplex({v00, v01, v11});
    EXPECT_EQ(square.simplices(3).size(), 2u);

    square.rollback(mark);
    EXPECT_EQ(square.simplices(3).size(), 1u);
    EXPECT_EQ(square.simplices(2).size(), 3u);
    EXPECT_FALSE(square.contains(Simplex{v01}));
    // (0,1) was forgotten, so the reversed order is now acceptable
    EXPECT_NO_THROW(square.add_simplex({v11, v01}));
}

// =============================================================================
// Derived complexes
// =============================================================================

TEST_F(BoxComplexTest, ReversedComplex) {
    square.add_simplex({v00, v10, v11});
    const BoxComplex rev = square.reversed();
    EXPECT_TRUE(rev.contains(Simplex{v11, v10, v00}));
    EXPECT_TRUE(rev.contains(Simplex{v11, v00}));
    EXPECT_EQ(rev.cells().n_cells(), square.cells().n_cells());
}

TEST_F(BoxComplexTest, MergedComplex) {
    BoxComplex other({1, 1});
    other.add_simplex({v00, v01, v11});
    square.add_simplex({v00, v10, v11});

    const BoxComplex total = square.merged(other);
    EXPECT_EQ(total.simplices(3).size(), 2u);
    EXPECT_EQ(total.simplices(2).size(), 5u);

    EXPECT_THROW(square.merged(other.reversed()), VertexOrderError);
    EXPECT_THROW(square.merged(BoxComplex({2, 1})), InvalidArgumentException);
}

TEST_F(BoxComplexTest, LatticeEdgesAndEdgeGraph) {
    BoxComplex box({2, 1});
    const auto edges = box.lattice_edges();
    // base points (0,0) and (1,0), two axes each
    ASSERT_EQ(edges.size(), 4u);
    EXPECT_EQ(edges[0], Edge(Vertex{0, 0}, Vertex{1, 0}));
    EXPECT_EQ(edges[1], Edge(Vertex{0, 0}, Vertex{0, 1}));

    square.add_simplex({v00, v10, v11});
    const OrientationGraph graph = square.edge_graph();
    EXPECT_EQ(graph.n_vertices(), 3u);
    EXPECT_EQ(graph.n_edges(), 3u);
    EXPECT_TRUE(graph.has_edge(v00, v11));
    EXPECT_FALSE(graph.has_edge(v11, v00));
}
