#include <gtest/gtest.h>
#include "GmshSession.hxx"
#include <gmsh.h>
#include <stdexcept>

TEST(GmshSession, InitializesAndFinalizes) {
    EXPECT_FALSE(GmshSession::active());
    {
        GmshSession s("session_test");
        EXPECT_TRUE(GmshSession::active());
        EXPECT_EQ(gmsh::isInitialized(), 1);
        std::string name;
        gmsh::model::getCurrent(name);
        EXPECT_EQ(name, "session_test");
        EXPECT_EQ(s.modelName(), "session_test");
    }
    EXPECT_FALSE(GmshSession::active());
    EXPECT_EQ(gmsh::isInitialized(), 0);
}

TEST(GmshSession, TearsDownOnException) {
    try {
        GmshSession s;
        gmsh::model::geo::addPoint(0, 0, 0, 1.0, 1);
        throw std::runtime_error("boom");
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "boom");
    }
    EXPECT_FALSE(GmshSession::active());
    EXPECT_EQ(gmsh::isInitialized(), 0);
}

TEST(GmshSession, NextSessionStartsEmpty) {
    {
        GmshSession s;
        gmsh::model::geo::addPoint(0, 0, 0, 1.0, 1);
        gmsh::model::geo::synchronize();
    }
    GmshSession s;
    gmsh::vectorpair ents;
    gmsh::model::getEntities(ents);
    EXPECT_TRUE(ents.empty());
}
