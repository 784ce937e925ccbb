/**
 * @file test_EdgeAccumulator.cpp
 * @brief Unit tests for EdgeAccumulator.h
 */

#include <gtest/gtest.h>
#include "Search/EdgeAccumulator.h"
#include "Search/OrientationGraph.h"

#include <set>

using namespace torus;

TEST(EdgeAccumulatorTest, UnitSquareOrbits) {
    const EdgeAccumulator acc({1, 1}, {});
    ASSERT_EQ(acc.edge_builders().size(), 2u);

    // orbits are seeded from the smallest remaining edge: vertical first
    const auto& vertical = acc.edge_builders()[0];
    const auto& horizontal = acc.edge_builders()[1];
    EXPECT_EQ(vertical.simplices(2).size(), 2u);
    EXPECT_EQ(horizontal.simplices(2).size(), 2u);
    EXPECT_TRUE(vertical.contains(Simplex{{0, 0}, {0, 1}}));
    EXPECT_TRUE(vertical.contains(Simplex{{1, 0}, {1, 1}}));
    EXPECT_TRUE(horizontal.contains(Simplex{{0, 0}, {1, 0}}));
    EXPECT_TRUE(horizontal.contains(Simplex{{0, 1}, {1, 1}}));
}

TEST(EdgeAccumulatorTest, AllSquareOrientationsAreAcyclic) {
    const EdgeAccumulator acc({1, 1}, {});
    const auto orientations = acc.acyclic_orientations();
    EXPECT_EQ(orientations.size(), 4u);

    std::set<std::vector<Edge>> distinct;
    for (const BoxComplex& b : orientations) {
        const OrientationGraph g = b.edge_graph();
        EXPECT_TRUE(g.is_acyclic());
        EXPECT_EQ(g.n_edges(), 4u);
        distinct.insert(g.edges());
    }
    EXPECT_EQ(distinct.size(), 4u);
}

TEST(EdgeAccumulatorTest, VisitorCanStop) {
    const EdgeAccumulator acc({1, 1}, {});
    size_t visited = 0;
    const size_t n = acc.for_each_acyclic_orientation([&visited](const BoxComplex&) {
        ++visited;
        return false;
    });
    EXPECT_EQ(n, 1u);
    EXPECT_EQ(visited, 1u);
}

TEST(EdgeAccumulatorTest, OrbitsUnderDiagonalTranslation) {
    const EdgeAccumulator acc({2, 2}, {GroupGenerator::translation({1, 1})});
    EXPECT_EQ(acc.edge_builders().size(), 4u);

    size_t n_edges = 0;
    for (const BoxComplex& b : acc.edge_builders()) {
        n_edges += b.simplices(2).size();
    }
    // 8 lattice edges plus 4 torus images on the far faces
    EXPECT_EQ(n_edges, 12u);

    for (const BoxComplex& b : acc.acyclic_orientations()) {
        EXPECT_TRUE(b.edge_graph().is_acyclic());
    }
}
