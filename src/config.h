#pragma once

#include "library.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace kicadfile {

using json = nlohmann::json;

struct Config {
    std::vector<std::string> symbol_dirs;
    std::vector<std::string> footprint_dirs;
    bool verbose = false;
    std::string generator = "kicadfile";
    std::string generator_version = "9.0";

    // Environment variables, then the usual install locations
    static Config from_environment();

    // Overlay keys of a JSON object: symbol_dirs, footprint_dirs,
    // verbose, generator, generator_version
    void merge(const json& j);
    void load_file(const std::string& path);

    LibraryOptions library_options(const std::string& project_dir) const;
};

} // namespace kicadfile
