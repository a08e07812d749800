#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace kicadfile {

using json = nlohmann::json;

// The documents of one KiCad project, found by the project's name.
// Paths are empty for files that do not exist.
struct ProjectFiles {
    std::string name;
    std::string directory;
    std::string project;   // .kicad_pro
    std::string board;     // .kicad_pcb
    std::string schematic; // .kicad_sch
};

// From any file of the project or its directory. A directory takes the
// name of its first .kicad_pro, else its own name. NotFoundError when
// the path does not exist.
ProjectFiles resolve_project_files(const std::string& path);

// KiCad files directly inside dir, grouped by category: project, board,
// schematic, symbol_library, footprint, design_rules, worksheet.
// NotFoundError for a missing directory.
std::map<std::string, std::vector<std::string>> list_project_files(const std::string& dir);

// Parsed .kicad_pro. ParseError for malformed JSON,
// StructuralInvariantViolation when the top level is not an object.
json read_project_file(const std::string& path);

} // namespace kicadfile
