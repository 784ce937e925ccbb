/**
 * @file test_SimplexStore.cpp
 * @brief Unit tests for SimplexStore.h and the elementary simplex operations
 */

#include <gtest/gtest.h>
#include "Core/Simplex.h"
#include "Core/SimplexStore.h"
#include "Core/TorusException.h"

using namespace torus;

namespace {

const Vertex a{0, 0};
const Vertex b{1, 0};
const Vertex c{1, 1};

} // namespace

// =============================================================================
// SimplexKey
// =============================================================================

TEST(SimplexKeyTest, OrderIndependent) {
    EXPECT_EQ(SimplexKey({a, b, c}), SimplexKey({c, a, b}));
    EXPECT_EQ(SimplexKey({c, b}).vertices(), (Simplex{b, c}));
    EXPECT_NE(SimplexKey({a, b}), SimplexKey({a, c}));
}

TEST(SimplexKeyTest, HashAgreesWithEquality) {
    SimplexKey::Hash hash;
    EXPECT_EQ(hash(SimplexKey({a, b, c})), hash(SimplexKey({b, c, a})));
}

// =============================================================================
// Faces and translations
// =============================================================================

TEST(SimplexOpsTest, FaceRemovesOneVertex) {
    const Simplex s{a, b, c};
    EXPECT_EQ(face(s, 0), (Simplex{b, c}));
    EXPECT_EQ(face(s, 1), (Simplex{a, c}));
    EXPECT_EQ(face(s, 2), (Simplex{a, b}));
    EXPECT_EQ(faces(s).size(), 3u);
    EXPECT_TRUE(faces(Simplex{a}).empty());
}

TEST(SimplexOpsTest, DistinctVertices) {
    EXPECT_TRUE(has_distinct_vertices({a, b, c}));
    EXPECT_FALSE(has_distinct_vertices({a, b, a}));
}

TEST(SimplexOpsTest, TranslateAndReverse) {
    EXPECT_EQ(translate(Simplex{a, b}, 1, 2), (Simplex{{0, 2}, {1, 2}}));
    EXPECT_EQ(reversed(Simplex{a, b, c}), (Simplex{c, b, a}));
}

TEST(SimplexOpsTest, FloorDivRoundsDown) {
    EXPECT_EQ(floor_div(5, 2), 2);
    EXPECT_EQ(floor_div(-1, 2), -1);
    EXPECT_EQ(floor_div(-2, 2), -1);
    EXPECT_EQ(floor_div(-3, 2), -2);
    EXPECT_EQ(floor_div(0, 3), 0);
}

TEST(SimplexOpsTest, Formatting) {
    EXPECT_EQ(to_string(a), "(0, 0)");
    EXPECT_EQ(to_string(Vertex{3}), "(3,)");
    EXPECT_EQ(to_string(Simplex{a, b}), "((0, 0), (1, 0))");
}

// =============================================================================
// SimplexStore
// =============================================================================

TEST(SimplexStoreTest, FirstOrderWins) {
    SimplexStore store;
    EXPECT_EQ(store.intern({b, a}), (Simplex{b, a}));
    EXPECT_EQ(store.intern({b, a}), (Simplex{b, a}));
    EXPECT_EQ(store.size(), 1u);
    EXPECT_THROW(store.intern({a, b}), VertexOrderError);
    EXPECT_EQ(*store.find(SimplexKey({a, b})), (Simplex{b, a}));
}

TEST(SimplexStoreTest, ConflictNamesBothOrders) {
    SimplexStore store;
    store.intern({a, b, c});
    try {
        store.intern({a, c, b});
        FAIL() << "expected VertexOrderError";
    } catch (const VertexOrderError& e) {
        EXPECT_EQ(e.previous(), (Simplex{a, b, c}));
        EXPECT_EQ(e.conflicting(), (Simplex{a, c, b}));
        EXPECT_EQ(e.status(), TorusStatus::VertexOrder);
        const std::string what = e.what();
        EXPECT_NE(what.find("conflicting vertex order"), std::string::npos);
        EXPECT_NE(what.find(to_string(Simplex{a, c, b})), std::string::npos);
    }
}

TEST(SimplexStoreTest, RollbackForgetsNewKeys) {
    SimplexStore store;
    store.intern({a, b});
    const auto mark = store.checkpoint();
    store.intern({b, c});
    store.intern({c, a});
    EXPECT_EQ(store.size(), 3u);

    store.rollback(mark);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_FALSE(store.contains(SimplexKey({b, c})));
    // The forgotten vertex set may now be registered in the other order
    EXPECT_NO_THROW(store.intern({c, b}));
}

TEST(SimplexStoreTest, CommitKeepsOrders) {
    SimplexStore store;
    store.intern({a, b});
    store.commit();
    EXPECT_EQ(store.checkpoint(), 0u);
    store.rollback(0);
    EXPECT_TRUE(store.contains(SimplexKey({a, b})));
}
