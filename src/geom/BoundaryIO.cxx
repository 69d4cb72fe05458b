#include "BoundaryIO.hxx"

#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace {
static inline std::string trim(const std::string& s) {
    std::size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) --b;
    return s.substr(a, b - a);
}

static void splitTokens(const std::string& line, std::vector<std::string>& out) {
    out.clear(); std::istringstream iss(line); std::string t; while (iss >> t) out.push_back(t);
}

static std::size_t parseIndex(const std::string& tok, int lineNo) {
    if (tok.empty() || tok[0] == '-') {
        throw std::runtime_error("line " + std::to_string(lineNo) + ": negative index '" + tok + "'");
    }
    return static_cast<std::size_t>(std::stoul(tok));
}

static std::vector<std::size_t> parseIndexList(const std::vector<std::string>& toks, int lineNo) {
    std::vector<std::size_t> out;
    for (std::size_t i = 1; i < toks.size(); ++i) out.push_back(parseIndex(toks[i], lineNo));
    return out;
}
}

namespace BoundaryIO {

bool readFile(const std::string& path,
              Boundary& outBoundary,
              MeshOptions& outOptions,
              std::string* errorMessage) {
    try {
        std::ifstream ifs(path);
        if (!ifs) throw std::runtime_error("Could not open boundary file for reading");
        Boundary B;
        MeshOptions opt = outOptions;
        SolidTopology solid;
        std::string line; std::vector<std::string> toks;
        int lineNo = 0;
        while (std::getline(ifs, line)) {
            ++lineNo;
            auto hashPos = line.find('#'); if (hashPos != std::string::npos) line = line.substr(0, hashPos);
            std::string t = trim(line); if (t.empty() || t[0] == '*') continue;
            splitTokens(t, toks); if (toks.empty()) continue;
            const std::string& key = toks[0];
            if (key == "point") {
                if (toks.size() != 4) throw std::runtime_error("line " + std::to_string(lineNo) + ": point needs x y z");
                B.addPoint({std::stod(toks[1]), std::stod(toks[2]), std::stod(toks[3])});
            } else if (key == "loop") {
                auto idx = parseIndexList(toks, lineNo);
                if (idx.empty()) throw std::runtime_error("line " + std::to_string(lineNo) + ": empty loop");
                B.addLoop(idx);
            } else if (key == "target_size" && toks.size() >= 2) {
                opt.targetSize = std::stod(toks[1]);
            } else if (key == "algorithm" && toks.size() >= 2) {
                if (!algorithm2DFromName(toks[1], opt.algorithm)) throw std::runtime_error("Unknown algorithm '" + toks[1] + "'");
            } else if (key == "algorithm3d" && toks.size() >= 2) {
                if (!algorithm3DFromName(toks[1], opt.algorithm3D)) throw std::runtime_error("Unknown 3D algorithm '" + toks[1] + "'");
            } else if (key == "dimension" && toks.size() >= 2) {
                opt.dimension = std::stoi(toks[1]);
            } else if (key == "extraction" && toks.size() >= 2) {
                if (!extractionFromName(toks[1], opt.extraction)) throw std::runtime_error("Unknown extraction '" + toks[1] + "'");
            } else if (key == "shell") {
                solid.shells.push_back(parseIndexList(toks, lineNo));
            } else if (key == "volume") {
                solid.volumes.push_back(parseIndexList(toks, lineNo));
            } else if (key == "end") {
                break;
            } else {
                throw std::runtime_error("line " + std::to_string(lineNo) + ": unknown keyword '" + key + "'");
            }
        }
        if (!solid.volumes.empty() && solid.shells.empty()) throw std::runtime_error("volume given without shells");
        if (!solid.shells.empty()) {
            if (solid.volumes.empty()) solid.volumes.push_back({0});
            opt.solid = solid;
        }
        std::string err;
        if (!opt.validate(&err)) throw std::runtime_error(err);
        outBoundary = std::move(B);
        outOptions = std::move(opt);
        return true;
    } catch (const std::exception& e) {
        if (errorMessage) *errorMessage = e.what();
        return false;
    }
}

bool writeFile(const std::string& path,
               const Boundary& boundary,
               const MeshOptions& options,
               std::string* errorMessage) {
    try {
        std::ofstream ofs(path);
        if (!ofs) throw std::runtime_error("Could not open boundary file for writing");
        ofs.precision(17);
        ofs << "* edgemesh boundary v1\n";
        for (const auto& p : boundary.points()) {
            ofs << "point " << p[0] << ' ' << p[1] << ' ' << p[2] << '\n';
        }
        for (const auto& L : boundary.loops()) {
            ofs << "loop";
            for (std::size_t i : L) ofs << ' ' << i;
            ofs << '\n';
        }
        if (options.targetSize) ofs << "target_size " << *options.targetSize << '\n';
        ofs << "algorithm " << algorithm2DName(options.algorithm) << '\n';
        ofs << "algorithm3d " << algorithm3DName(options.algorithm3D) << '\n';
        ofs << "dimension " << options.dimension << '\n';
        ofs << "extraction " << extractionName(options.extraction) << '\n';
        if (options.solid) {
            for (const auto& shell : options.solid->shells) {
                ofs << "shell";
                for (std::size_t i : shell) ofs << ' ' << i;
                ofs << '\n';
            }
            for (const auto& vol : options.solid->volumes) {
                ofs << "volume";
                for (std::size_t i : vol) ofs << ' ' << i;
                ofs << '\n';
            }
        }
        ofs << "end\n";
        if (!ofs) throw std::runtime_error("Write failed");
        return true;
    } catch (const std::exception& e) {
        if (errorMessage) *errorMessage = e.what();
        return false;
    }
}

} // namespace BoundaryIO
