#include "config.h"
#include "errors.h"
#include "utils.h"

#include <algorithm>

namespace kicadfile {

static const char* SYMBOL_ENV[] = {
    "KICAD_SYMBOL_DIR", "KICAD9_SYMBOL_DIR", "KICAD8_SYMBOL_DIR", "KICAD7_SYMBOL_DIR",
};
static const char* FOOTPRINT_ENV[] = {
    "KICAD_FOOTPRINT_DIR", "KICAD9_FOOTPRINT_DIR", "KICAD8_FOOTPRINT_DIR", "KICAD7_FOOTPRINT_DIR",
};
static const char* SHARE_DIRS[] = {
    "/usr/share/kicad",
    "/usr/local/share/kicad",
    "/Applications/KiCad/KiCad.app/Contents/SharedSupport",
};

static void add_unique(std::vector<std::string>& dirs, const std::string& dir) {
    if (dir.empty()) return;
    if (std::find(dirs.begin(), dirs.end(), dir) == dirs.end()) dirs.push_back(dir);
}

Config Config::from_environment() {
    Config cfg;
    for (const char* var : SYMBOL_ENV) {
        std::string dir = env_or_empty(var);
        if (is_directory(dir)) add_unique(cfg.symbol_dirs, dir);
    }
    for (const char* var : FOOTPRINT_ENV) {
        std::string dir = env_or_empty(var);
        if (is_directory(dir)) add_unique(cfg.footprint_dirs, dir);
    }
    for (const char* share : SHARE_DIRS) {
        std::string sym = join_path(share, "symbols");
        std::string fp = join_path(share, "footprints");
        if (is_directory(sym)) add_unique(cfg.symbol_dirs, sym);
        if (is_directory(fp)) add_unique(cfg.footprint_dirs, fp);
    }
    cfg.verbose = parse_bool(env_or_empty("KICADFILE_VERBOSE"), false);
    return cfg;
}

void Config::merge(const json& j) {
    if (!j.is_object()) throw InvalidArgument("configuration must be a JSON object");
    try {
        // Explicit directories go ahead of discovered ones
        if (j.contains("symbol_dirs")) {
            std::vector<std::string> dirs = j["symbol_dirs"].get<std::vector<std::string>>();
            for (auto& d : symbol_dirs) add_unique(dirs, d);
            symbol_dirs = dirs;
        }
        if (j.contains("footprint_dirs")) {
            std::vector<std::string> dirs = j["footprint_dirs"].get<std::vector<std::string>>();
            for (auto& d : footprint_dirs) add_unique(dirs, d);
            footprint_dirs = dirs;
        }
        verbose = j.value("verbose", verbose);
        generator = j.value("generator", generator);
        generator_version = j.value("generator_version", generator_version);
    } catch (const json::exception& e) {
        throw InvalidArgument(std::string("bad configuration: ") + e.what());
    }
}

void Config::load_file(const std::string& path) {
    std::string text = read_file(path);
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ParseError(std::string("config: ") + e.what(), e.byte, 0, 0);
    }
    merge(j);
}

LibraryOptions Config::library_options(const std::string& project_dir) const {
    LibraryOptions opts;
    opts.symbol_dirs = symbol_dirs;
    opts.footprint_dirs = footprint_dirs;
    opts.project_dir = project_dir;
    opts.verbose = verbose;
    return opts;
}

} // namespace kicadfile
