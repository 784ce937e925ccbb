/**
 * @file test_GroupOrbit.cpp
 * @brief Unit tests for GroupOrbit.h - canonicalization, orbit closure and orbit insertion
 */

#include <gtest/gtest.h>
#include "Complex/BoxComplex.h"
#include "Core/TorusException.h"
#include "Search/CubeTriangulation.h"
#include "Symmetry/GroupOrbit.h"

using namespace torus;

class GroupOrbitTest : public ::testing::Test {
protected:
    BoxComplex box{{2, 2}};
    const std::vector<GroupGenerator> swap{GroupGenerator::permutation({1, 0})};
    const std::vector<GroupGenerator> shift{GroupGenerator::translation({1, 0})};
};

TEST_F(GroupOrbitTest, CanonicalizeMovesIntoFundamentalBox) {
    GroupOrbit group(box, {});
    EXPECT_EQ(group.canonicalize({{2, 0}, {3, 1}}), (Simplex{{0, 0}, {1, 1}}));
    EXPECT_EQ(group.canonicalize({{-1, 0}, {0, 0}}), (Simplex{{1, 0}, {2, 0}}));
    EXPECT_EQ(group.canonicalize({{-2, -3}}), (Simplex{{0, 1}}));
    // the far face x_1 = side maps back onto x_1 = 0
    EXPECT_EQ(group.canonicalize({{1, 2}, {2, 2}}), (Simplex{{1, 0}, {2, 0}}));
    EXPECT_EQ(group.canonicalize({{1, 1}, {2, 2}}), (Simplex{{1, 1}, {2, 2}}));
}

TEST_F(GroupOrbitTest, CanonicalizeRespectsRecordedOrder) {
    GroupOrbit group(box, {});
    box.add_simplex({{1, 1}, {0, 0}});
    EXPECT_THROW(group.canonicalize({{2, 2}, {3, 3}}), VertexOrderError);
    EXPECT_EQ(group.canonicalize({{3, 3}, {2, 2}}), (Simplex{{1, 1}, {0, 0}}));
}

TEST_F(GroupOrbitTest, OrbitUnderTranslation) {
    GroupOrbit group(box, shift);
    const Orbit o = group.orbit({{0, 0}, {1, 0}});
    EXPECT_EQ(o, (Orbit{Simplex{{0, 0}, {1, 0}}, Simplex{{1, 0}, {2, 0}}}));
}

TEST_F(GroupOrbitTest, OrbitIsClosed) {
    add_box_triangulation(box);
    const std::vector<GroupGenerator> generators{GroupGenerator::permutation({1, 0}),
                                                 GroupGenerator::translation({1, 1})};
    GroupOrbit group(box, generators);
    for (const Simplex& s : box.simplices(3)) {
        const Orbit o = group.orbit(s);
        for (const Simplex& member : o) {
            for (const auto& g : generators) {
                EXPECT_EQ(o.count(group.canonicalize(g.apply(member))), 1u)
                    << to_string(member) << " under " << g.name();
            }
        }
    }
}

TEST_F(GroupOrbitTest, TorusImagesIncluded) {
    GroupOrbitOptions options;
    options.include_torus_images = true;
    GroupOrbit group(box, {}, options);
    const Orbit o = group.orbit({{0, 0}, {0, 1}});
    // translate of the x = 0 face onto x = 2
    EXPECT_EQ(o, (Orbit{Simplex{{0, 0}, {0, 1}}, Simplex{{2, 0}, {2, 1}}}));

    const Orbit corner = group.orbit({{0, 0}});
    EXPECT_EQ(corner.size(), 4u);
}

TEST_F(GroupOrbitTest, TopOrbitsPartitionTopSimplices) {
    add_box_triangulation(box);
    GroupOrbit group(box, swap);
    const auto orbits = group.top_orbits();
    size_t total = 0;
    std::set<Simplex> seen;
    for (const Orbit& o : orbits) {
        EXPECT_EQ(o.size(), 2u);
        for (const Simplex& s : o) {
            EXPECT_TRUE(seen.insert(s).second) << to_string(s) << " in two orbits";
            EXPECT_TRUE(box.contains(s));
        }
        total += o.size();
    }
    EXPECT_EQ(total, box.simplices(3).size());
}

TEST_F(GroupOrbitTest, TopOrbitsRejectInvalidAction) {
    add_box_triangulation(box);
    GroupOrbit group(box, {GroupGenerator::reflection(2, 0)});
    try {
        group.top_orbits();
        FAIL() << "expected InvalidGroupActionException";
    } catch (const InvalidGroupActionException& e) {
        EXPECT_FALSE(box.contains(e.image()));
        EXPECT_EQ(e.orbit().count(e.image()), 1u);
        EXPECT_EQ(e.status(), TorusStatus::InvalidGroupAction);
    }
}

TEST_F(GroupOrbitTest, AddSimplexOrbitInsertsEveryMember) {
    GroupOrbit group(box, swap);
    const Orbit o = group.add_simplex_orbit({{0, 0}, {1, 0}, {1, 1}});
    EXPECT_EQ(o.size(), 2u);
    EXPECT_TRUE(box.contains(Simplex{{0, 0}, {1, 0}, {1, 1}}));
    EXPECT_TRUE(box.contains(Simplex{{0, 0}, {0, 1}, {1, 1}}));
}

TEST_F(GroupOrbitTest, AddSimplexOrbitIsAllOrNothing) {
    // (0,1) -> (0,0) makes the swapped image (1,0) -> (0,0) conflict
    box.add_simplex({{0, 0}, {1, 0}});
    const size_t n_cells = box.cells().n_cells();
    GroupOrbit group(box, swap);
    EXPECT_THROW(group.add_simplex_orbit({{0, 1}, {0, 0}}), VertexOrderError);
    EXPECT_EQ(box.cells().n_cells(), n_cells);
    EXPECT_EQ(box.recorded_order(Simplex{{0, 0}, {0, 1}}), nullptr);
}

TEST_F(GroupOrbitTest, RejectsVerticesOfTheWrongDimension) {
    GroupOrbit group(box, {});
    EXPECT_THROW(group.canonicalize({{0}, {1}}), InvalidArgumentException);
    EXPECT_THROW(group.canonicalize({{0, 0}, {1, 0, 0}}), InvalidArgumentException);

    // a custom generator dropping a coordinate
    const auto drop = GroupGenerator::custom("drop", [](const Vertex& v) { return Vertex{v[0]}; });
    GroupOrbit dropping(box, {drop});
    EXPECT_THROW(dropping.orbit({{0, 0}, {1, 0}}), InvalidArgumentException);
    EXPECT_FALSE(box.contains(Simplex{{0, 0}, {1, 0}}));
}
