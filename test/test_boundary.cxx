#include <gtest/gtest.h>
#include "Boundary.hxx"
#include <cmath>
#include <map>
#include <stdexcept>

TEST(Boundary, DecodesImplicitlyClosedRuns) {
    std::vector<Boundary::Point> P{ {0,0,0}, {1,0,0}, {1,1,0}, {0,1,0} };
    Boundary B(P, {4, 0, 1, 2, 3});
    auto loops = B.loops();
    ASSERT_EQ(loops.size(), 1u);
    EXPECT_EQ(loops[0], (std::vector<std::size_t>{0, 1, 2, 3}));
    EXPECT_EQ(B.numEdges(), 4u);
}

TEST(Boundary, DropsRepeatedClosingIndex) {
    // polyline sources repeat the first point to close the loop
    std::vector<Boundary::Point> P{ {0,0,0}, {1,0,0}, {1,1,0}, {0,1,0} };
    Boundary B(P, {5, 0, 1, 2, 3, 0});
    auto loops = B.loops();
    ASSERT_EQ(loops.size(), 1u);
    EXPECT_EQ(loops[0].size(), 4u);
    EXPECT_EQ(B.numEdges(), 4u);
}

TEST(Boundary, MultipleRuns) {
    std::vector<Boundary::Point> P(7, Boundary::Point{0,0,0});
    Boundary B(P, {3, 0, 1, 2, 4, 3, 4, 5, 6});
    auto loops = B.loops();
    ASSERT_EQ(loops.size(), 2u);
    EXPECT_EQ(loops[1], (std::vector<std::size_t>{3, 4, 5, 6}));
    EXPECT_EQ(B.numLoops(), 2u);
    EXPECT_EQ(B.numEdges(), 7u);
}

TEST(Boundary, RejectsOverrunningRun) {
    std::vector<Boundary::Point> P{ {0,0,0}, {1,0,0}, {1,1,0} };
    EXPECT_THROW({ Boundary B(P, {4, 0, 1, 2}); }, std::invalid_argument);
}

TEST(Boundary, OutOfRangeIndexIsKeptForLaterTranslation) {
    std::vector<Boundary::Point> P{ {0,0,0}, {1,0,0}, {1,1,0} };
    Boundary B(P, {3, 0, 1, 9});
    EXPECT_EQ(B.loops()[0][2], 9u);
}

TEST(Boundary, BoundsAndMaxExtent) {
    std::vector<Boundary::Point> P{ {-1,0,0}, {3,0,0}, {3,2,0.5}, {-1,2,0.5} };
    Boundary B(P, {4, 0, 1, 2, 3});
    auto b = B.bounds();
    EXPECT_DOUBLE_EQ(b[0], -1.0); EXPECT_DOUBLE_EQ(b[1], 3.0);
    EXPECT_DOUBLE_EQ(b[2], 0.0);  EXPECT_DOUBLE_EQ(b[3], 2.0);
    EXPECT_DOUBLE_EQ(b[4], 0.0);  EXPECT_DOUBLE_EQ(b[5], 0.5);
    EXPECT_DOUBLE_EQ(B.maxExtent(), 4.0);
}

TEST(Boundary, MaxExtentUsesLargestAxis) {
    // z extent dominates
    std::vector<Boundary::Point> P{ {0,0,0}, {1,0,5}, {0,1,2} };
    Boundary B(P, {3, 0, 1, 2});
    EXPECT_DOUBLE_EQ(B.maxExtent(), 5.0);
}

TEST(Boundary, PolygonRotated) {
    Boundary B = Boundary::polygon(4, 8.0);
    ASSERT_EQ(B.numPoints(), 4u);
    EXPECT_NEAR(B.points()[0][0], 8.0, 1e-12);
    EXPECT_NEAR(B.points()[1][1], 8.0, 1e-12);
    B.rotateZ(45.0);
    const double c = 8.0 / std::sqrt(2.0);
    auto b = B.bounds();
    EXPECT_NEAR(b[0], -c, 1e-12); EXPECT_NEAR(b[1], c, 1e-12);
    EXPECT_NEAR(b[2], -c, 1e-12); EXPECT_NEAR(b[3], c, 1e-12);
    EXPECT_NEAR(B.maxExtent(), 2.0 * c, 1e-12);
    EXPECT_THROW(Boundary::polygon(2, 1.0), std::invalid_argument);
    EXPECT_THROW(Boundary::polygon(5, 0.0), std::invalid_argument);
}

TEST(Boundary, Translate) {
    Boundary B = Boundary::polygon(3, 1.0);
    B.translate(1.0, 2.0, 3.0);
    for (const auto& p : B.points()) EXPECT_DOUBLE_EQ(p[2], 3.0);
    EXPECT_NEAR(B.points()[0][0], 2.0, 1e-12);
    EXPECT_NEAR(B.points()[0][1], 2.0, 1e-12);
}

TEST(Boundary, BoxFacesShareEveryEdgeTwice) {
    Boundary B = Boundary::box(0, 1, 0, 1, 0, 1);
    ASSERT_EQ(B.numPoints(), 8u);
    ASSERT_EQ(B.numLoops(), 6u);
    // each directed edge appears once, each undirected edge twice in opposite directions
    std::map<std::pair<std::size_t,std::size_t>, int> directed;
    for (const auto& L : B.loops()) {
        ASSERT_EQ(L.size(), 4u);
        for (std::size_t k = 0; k < L.size(); ++k) directed[{L[k], L[(k+1) % L.size()]}]++;
    }
    EXPECT_EQ(directed.size(), 24u);
    for (const auto& kv : directed) {
        EXPECT_EQ(kv.second, 1);
        EXPECT_EQ(directed.count({kv.first.second, kv.first.first}), 1u);
    }
    EXPECT_THROW(Boundary::box(0, 0, 0, 1, 0, 1), std::invalid_argument);
}

TEST(SolidTopology, SingleVolume) {
    auto T = SolidTopology::singleVolume(6);
    ASSERT_EQ(T.shells.size(), 1u);
    EXPECT_EQ(T.shells[0].size(), 6u);
    ASSERT_EQ(T.volumes.size(), 1u);
    EXPECT_EQ(T.volumes[0], (std::vector<std::size_t>{0}));
    EXPECT_FALSE(T.empty());
    EXPECT_TRUE(SolidTopology().empty());
}
