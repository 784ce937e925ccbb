/**
 * @file test_GroupGenerator.cpp
 * @brief Unit tests for GroupGenerator.h
 */

#include <gtest/gtest.h>
#include "Core/TorusException.h"
#include "Symmetry/GroupGenerator.h"

using namespace torus;

TEST(GroupGeneratorTest, Factories) {
    EXPECT_EQ(GroupGenerator::identity(3)(Vertex{1, 2, 3}), (Vertex{1, 2, 3}));
    EXPECT_EQ(GroupGenerator::translation({1, -1})(Vertex{0, 0}), (Vertex{1, -1}));
    EXPECT_EQ(GroupGenerator::permutation({2, 0, 1})(Vertex{5, 6, 7}), (Vertex{7, 5, 6}));
    EXPECT_EQ(GroupGenerator::reflection(2, 1)(Vertex{3, 4}), (Vertex{3, -4}));
}

TEST(GroupGeneratorTest, LinearMap) {
    GroupGenerator::Matrix rotation(2, 2);
    rotation << 0, -1,
                1,  0;
    GroupGenerator::Vector shift(2);
    shift << 1, 0;
    const auto g = GroupGenerator::linear(rotation, shift);
    EXPECT_TRUE(g.is_affine());
    EXPECT_EQ(g(Vertex{1, 0}), (Vertex{1, 1}));
    EXPECT_EQ(g(Vertex{0, 1}), (Vertex{0, 0}));
}

TEST(GroupGeneratorTest, ComposeAppliesInnerFirst) {
    const auto shift = GroupGenerator::translation({1, 0});
    const auto swap = GroupGenerator::permutation({1, 0});
    const auto g = GroupGenerator::compose(swap, shift);
    EXPECT_TRUE(g.is_affine());
    EXPECT_EQ(g(Vertex{0, 0}), (Vertex{0, 1}));
    EXPECT_EQ(g.name(), swap.name() + "*" + shift.name());

    const auto custom = GroupGenerator::custom("double", [](const Vertex& v) {
        return Vertex{2 * v[0], 2 * v[1]};
    });
    const auto h = GroupGenerator::compose(custom, shift);
    EXPECT_FALSE(h.is_affine());
    EXPECT_EQ(h(Vertex{1, 1}), (Vertex{4, 2}));
}

TEST(GroupGeneratorTest, ApplyKeepsVertexOrder) {
    const auto swap = GroupGenerator::permutation({1, 0});
    EXPECT_EQ(swap.apply(Simplex{{0, 0}, {1, 0}, {1, 1}}),
              (Simplex{{0, 0}, {0, 1}, {1, 1}}));
}

TEST(GroupGeneratorTest, InvalidArgumentsRejected) {
    EXPECT_THROW(GroupGenerator::permutation({0, 0}), InvalidArgumentException);
    EXPECT_THROW(GroupGenerator::reflection(2, 2), InvalidArgumentException);
    EXPECT_THROW(GroupGenerator::identity(0), InvalidArgumentException);
    EXPECT_THROW(GroupGenerator::identity(2)(Vertex{1, 2, 3}), InvalidArgumentException);
    EXPECT_THROW(GroupGenerator::custom("none", GroupGenerator::Function()), InvalidArgumentException);

    const auto widen = GroupGenerator::custom("widen", [](const Vertex& v) {
        Vertex image(v);
        image.push_back(0);
        return image;
    });
    EXPECT_THROW(widen(Vertex{1, 2}), InvalidArgumentException);
}
