#ifndef EDGEMESH_GMSH_SESSION_HXX
#define EDGEMESH_GMSH_SESSION_HXX

#include <mutex>
#include <string>

// Scoped ownership of the process-wide gmsh model.
// Construction takes a global lock, initializes gmsh and adds a fresh model;
// destruction clears and finalizes gmsh, then releases the lock. Only one
// session exists at a time, so concurrent callers are serialized.
class GmshSession {
public:
    explicit GmshSession(const std::string& modelName = "edgemesh", int verbosity = 0);
    ~GmshSession();

    GmshSession(const GmshSession&) = delete;
    GmshSession& operator=(const GmshSession&) = delete;

    const std::string& modelName() const { return name_; }

    // True while any session is open in this process.
    static bool active();

private:
    std::unique_lock<std::mutex> lock_;
    std::string name_;
};

#endif // EDGEMESH_GMSH_SESSION_HXX
