/**
 * @file test_DeltaComplex.cpp
 * @brief Unit tests for CellComplex.h and DeltaComplex.h
 */

#include <gtest/gtest.h>
#include "Complex/BoxComplex.h"
#include "Complex/CellComplex.h"
#include "Complex/DeltaComplex.h"
#include "Core/TorusException.h"

using namespace torus;

class DeltaComplexTest : public ::testing::Test {
protected:
    void SetUp() override {
        triangle.add_simplex({{0, 0}, {1, 0}, {1, 1}});
    }

    BoxComplex triangle{{1, 1}};
};

TEST_F(DeltaComplexTest, EnumeratesCellsInSortedOrder) {
    const DeltaComplex delta = triangle.cells().delta_complex();
    EXPECT_EQ(delta.dimension(), 2);
    EXPECT_EQ(delta.n_cells(0), 3);
    EXPECT_EQ(delta.n_cells(1), 3);
    EXPECT_EQ(delta.n_cells(2), 1);

    // vertices: (0,0)=0 (1,0)=1 (1,1)=2
    // edges sorted: ((0,0),(1,0))=0 ((0,0),(1,1))=1 ((1,0),(1,1))=2
    EXPECT_EQ(delta.faces(1, 0), (std::vector<int>{1, 0}));
    EXPECT_EQ(delta.faces(1, 1), (std::vector<int>{2, 0}));
    EXPECT_EQ(delta.faces(2, 0), (std::vector<int>{2, 1, 0}));
    EXPECT_NO_THROW(delta.check());
}

TEST_F(DeltaComplexTest, BoundaryMatricesCompose) {
    const DeltaComplex delta = triangle.cells().delta_complex();
    const IntMatrix d1 = delta.boundary_matrix(1);
    const IntMatrix d2 = delta.boundary_matrix(2);
    ASSERT_EQ(d1.rows(), 3);
    ASSERT_EQ(d1.cols(), 3);
    ASSERT_EQ(d2.rows(), 3);
    ASSERT_EQ(d2.cols(), 1);
    EXPECT_TRUE((d1 * d2).isZero());

    const IntMatrix eps = delta.boundary_matrix(0, true);
    ASSERT_EQ(eps.rows(), 1);
    EXPECT_TRUE((eps * d1).isZero());
    EXPECT_EQ(delta.boundary_matrix(0).rows(), 0);
    EXPECT_EQ(delta.boundary_matrix(3).cols(), 0);
    EXPECT_EQ(delta.euler_characteristic(), 1);
}

TEST_F(DeltaComplexTest, RepeatedFacesAccumulate) {
    // A loop: one vertex, one edge whose two faces coincide
    DeltaComplex loop(1);
    loop.set_cells(0, {{}});
    loop.set_cells(1, {{0, 0}});
    const IntMatrix d1 = loop.boundary_matrix(1);
    ASSERT_EQ(d1.rows(), 1);
    EXPECT_EQ(d1(0, 0), 0);
}

TEST_F(DeltaComplexTest, InvalidFaceIndicesRejected) {
    DeltaComplex delta(1);
    delta.set_cells(0, {{}, {}});
    EXPECT_THROW(delta.set_cells(1, {{0, 2}}), InvalidArgumentException);
    EXPECT_THROW(delta.set_cells(1, {{0}}), InvalidArgumentException);
    EXPECT_THROW(delta.set_cells(2, {}), InvalidArgumentException);
}

TEST_F(DeltaComplexTest, CorruptedBoundaryDetected) {
    BoxComplex square({1, 1});
    square.add_simplex({{0, 0}, {1, 0}, {1, 1}});
    SimplexCells cells = square.cells();
    auto& bd = cells.boundary_map().at(Simplex{{0, 0}, {1, 0}, {1, 1}});
    std::swap(bd[0], bd[2]);
    EXPECT_THROW(cells.check_boundaries(), ConsistencyException);
    EXPECT_THROW(cells.delta_complex().check(), ConsistencyException);
}

TEST_F(DeltaComplexTest, UnknownCellRejected) {
    EXPECT_THROW(triangle.cells().boundary(Simplex{{0, 1}}), InvalidArgumentException);
}
