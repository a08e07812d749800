#pragma once

#include "geometry.h"
#include "schematic.h"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>

namespace kicadfile {

using json = nlohmann::json;

// Operation surface shared by every way of editing a KiCad project.
// Each operation takes file paths plus typed parameters and returns a
// JSON payload, or throws a kicadfile::Error; a failed operation never
// leaves a partially written file.

struct ComponentSpec {
    std::string lib_id;
    std::string reference;
    std::string value;
    std::string footprint;
    Point position;
    int rotation = 0;
    Mirror mirror = Mirror::None;
    int unit = 1;
    std::map<std::string, std::string> properties;
};

class SchematicOps {
public:
    virtual ~SchematicOps() = default;

    virtual json read_schematic(const std::string& path) = 0;
    virtual json create_schematic(const std::string& path, const std::string& title,
                                  const std::string& revision, const std::string& paper) = 0;

    virtual json add_component(const std::string& path, const ComponentSpec& spec) = 0;
    virtual json remove_component(const std::string& path, const std::string& reference,
                                  int unit) = 0;
    virtual json move_component(const std::string& path, const std::string& reference,
                                const Point& to, std::optional<int> rotation,
                                std::optional<Mirror> mirror, int unit) = 0;
    virtual json update_component_property(const std::string& path, const std::string& reference,
                                           const std::string& name, const std::string& value) = 0;
    virtual json add_power_symbol(const std::string& path, const std::string& name,
                                  const Point& at, int rotation) = 0;

    virtual json add_wire(const std::string& path, const Point& start, const Point& end) = 0;
    virtual json remove_wire(const std::string& path, const Point& start, const Point& end) = 0;
    virtual json add_label(const std::string& path, const std::string& text, const Point& at,
                           LabelKind kind, int rotation, const std::string& shape) = 0;
    virtual json add_junction(const std::string& path, const Point& at) = 0;
    virtual json add_no_connect(const std::string& path, const Point& at) = 0;
    virtual json remove_no_connect(const std::string& path, const Point& at) = 0;

    virtual json get_symbol_pin_positions(const std::string& path, const std::string& reference,
                                          int unit) = 0;
    virtual json get_pin_net(const std::string& path, const std::string& reference,
                             const std::string& pin) = 0;
    virtual json get_net_connections(const std::string& path, const std::string& net) = 0;
    virtual json list_nets(const std::string& path) = 0;

    virtual json resolve_library_symbol(const std::string& path, const std::string& lib_id) = 0;
    virtual json get_sheet_hierarchy(const std::string& path) = 0;
    virtual json validate_schematic(const std::string& path) = 0;
    virtual json generate_netlist(const std::string& path, const std::string& output) = 0;

    virtual json compare_schematic_board(const std::string& schematic,
                                         const std::string& board) = 0;
    virtual json sync_schematic_to_board(const std::string& schematic,
                                         const std::string& board) = 0;
};

struct FootprintSpec {
    std::string lib_id;
    std::string reference;
    std::string value;
    Point position;
    double rotation = 0.0;
    std::string layer = "F.Cu";
    std::map<std::string, std::string> pad_nets;
};

class BoardOps {
public:
    virtual ~BoardOps() = default;

    virtual json read_board(const std::string& path) = 0;
    virtual json place_footprint(const std::string& path, const FootprintSpec& spec) = 0;
    virtual json move_footprint(const std::string& path, const std::string& reference,
                                const Point& to, std::optional<double> rotation) = 0;
    virtual json remove_footprint(const std::string& path, const std::string& reference) = 0;
    virtual json add_track(const std::string& path, const Point& start, const Point& end,
                           double width, const std::string& layer, const std::string& net) = 0;
    virtual json add_via(const std::string& path, const Point& at, double size, double drill,
                         const std::string& net) = 0;
    virtual json assign_net(const std::string& path, const std::string& reference,
                            const std::string& pad, const std::string& net) = 0;
    virtual json get_design_rules(const std::string& path) = 0;
};

class LibraryOps {
public:
    virtual ~LibraryOps() = default;

    virtual json search_symbols(const std::string& query, const std::string& project_dir) = 0;
    virtual json search_footprints(const std::string& query, const std::string& project_dir) = 0;
    virtual json list_libraries(const std::string& project_dir) = 0;
    virtual json get_symbol_info(const std::string& lib_id, const std::string& project_dir) = 0;
    virtual json get_footprint_info(const std::string& lib_id, const std::string& project_dir) = 0;
    virtual json suggest_footprints(const std::string& lib_id, const std::string& project_dir) = 0;

    virtual json create_project_library(const std::string& project_dir,
                                        const std::string& name) = 0;
    virtual json register_project_library(const std::string& project_dir,
                                          const std::string& name, const std::string& kind) = 0;
    virtual json import_symbol(const std::string& lib_id, const std::string& dest_library,
                               const std::string& project_dir) = 0;
    virtual json import_footprint(const std::string& lib_id, const std::string& dest_library,
                                  const std::string& project_dir) = 0;
};

class ProjectOps {
public:
    virtual ~ProjectOps() = default;

    virtual json open_project(const std::string& path) = 0;
    virtual json list_project_files(const std::string& path) = 0;
    virtual json get_project_metadata(const std::string& path) = 0;
};

} // namespace kicadfile
