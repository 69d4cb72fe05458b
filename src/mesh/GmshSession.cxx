#include "GmshSession.hxx"
#include <gmsh.h>

#include <atomic>
#include <cstdio>
#include <exception>

namespace {
std::mutex& sessionMutex() {
    static std::mutex m;
    return m;
}
std::atomic<bool> g_active{false};
}

GmshSession::GmshSession(const std::string& modelName, int verbosity)
    : lock_(sessionMutex()), name_(modelName) {
    // skip user config files (~/.gmshrc)
    gmsh::initialize(0, nullptr, false);
    g_active = true;
    // a failed setup must not leave gmsh initialized
    try {
        gmsh::option::setNumber("General.Terminal", verbosity > 0 ? 1 : 0);
        gmsh::option::setNumber("General.Verbosity", verbosity);
        gmsh::model::add(name_);
    } catch (...) {
        gmsh::finalize();
        g_active = false;
        throw;
    }
}

GmshSession::~GmshSession() {
    try {
        gmsh::clear();
        gmsh::finalize();
    } catch (const std::exception& e) {
        std::fprintf(stderr, "gmsh teardown failed: %s\n", e.what());
    }
    g_active = false;
}

bool GmshSession::active() {
    return g_active;
}
