#include "ScopedTempFile.hxx"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace {
std::atomic<unsigned long> g_counter{0};
}

ScopedTempFile::ScopedTempFile(const std::string& extension) {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const std::string name = "edgemesh_" + std::to_string(stamp) + "_" +
                             std::to_string(g_counter.fetch_add(1)) + extension;
    path_ = (fs::temp_directory_path() / name).string();
}

ScopedTempFile::~ScopedTempFile() {
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) std::fprintf(stderr, "Could not remove temporary file %s: %s\n", path_.c_str(), ec.message().c_str());
}
