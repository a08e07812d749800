#pragma once

#include "backend.h"
#include "config.h"
#include "library.h"

#include <string>

namespace kicadfile {

// Implements every operation by editing the files directly. Each call
// is one read-modify-write cycle with its own library resolver, rooted
// at the directory of the document it works on.
class FileBackend : public SchematicOps, public BoardOps, public LibraryOps, public ProjectOps {
public:
    explicit FileBackend(const Config& cfg);

    // ── Schematic ──
    json read_schematic(const std::string& path) override;
    json create_schematic(const std::string& path, const std::string& title,
                          const std::string& revision, const std::string& paper) override;
    json add_component(const std::string& path, const ComponentSpec& spec) override;
    json remove_component(const std::string& path, const std::string& reference, int unit) override;
    json move_component(const std::string& path, const std::string& reference, const Point& to,
                        std::optional<int> rotation, std::optional<Mirror> mirror,
                        int unit) override;
    json update_component_property(const std::string& path, const std::string& reference,
                                   const std::string& name, const std::string& value) override;
    json add_power_symbol(const std::string& path, const std::string& name, const Point& at,
                          int rotation) override;
    json add_wire(const std::string& path, const Point& start, const Point& end) override;
    json remove_wire(const std::string& path, const Point& start, const Point& end) override;
    json add_label(const std::string& path, const std::string& text, const Point& at,
                   LabelKind kind, int rotation, const std::string& shape) override;
    json add_junction(const std::string& path, const Point& at) override;
    json add_no_connect(const std::string& path, const Point& at) override;
    json remove_no_connect(const std::string& path, const Point& at) override;
    json get_symbol_pin_positions(const std::string& path, const std::string& reference,
                                  int unit) override;
    json get_pin_net(const std::string& path, const std::string& reference,
                     const std::string& pin) override;
    json get_net_connections(const std::string& path, const std::string& net) override;
    json list_nets(const std::string& path) override;
    json resolve_library_symbol(const std::string& path, const std::string& lib_id) override;
    json get_sheet_hierarchy(const std::string& path) override;
    json validate_schematic(const std::string& path) override;
    json generate_netlist(const std::string& path, const std::string& output) override;
    json compare_schematic_board(const std::string& schematic, const std::string& board) override;
    json sync_schematic_to_board(const std::string& schematic, const std::string& board) override;

    // ── Board ──
    json read_board(const std::string& path) override;
    json place_footprint(const std::string& path, const FootprintSpec& spec) override;
    json move_footprint(const std::string& path, const std::string& reference, const Point& to,
                        std::optional<double> rotation) override;
    json remove_footprint(const std::string& path, const std::string& reference) override;
    json add_track(const std::string& path, const Point& start, const Point& end, double width,
                   const std::string& layer, const std::string& net) override;
    json add_via(const std::string& path, const Point& at, double size, double drill,
                 const std::string& net) override;
    json assign_net(const std::string& path, const std::string& reference,
                    const std::string& pad, const std::string& net) override;
    json get_design_rules(const std::string& path) override;

    // ── Library ──
    json search_symbols(const std::string& query, const std::string& project_dir) override;
    json search_footprints(const std::string& query, const std::string& project_dir) override;
    json list_libraries(const std::string& project_dir) override;
    json get_symbol_info(const std::string& lib_id, const std::string& project_dir) override;
    json get_footprint_info(const std::string& lib_id, const std::string& project_dir) override;
    json suggest_footprints(const std::string& lib_id, const std::string& project_dir) override;
    json create_project_library(const std::string& project_dir, const std::string& name) override;
    json register_project_library(const std::string& project_dir, const std::string& name,
                                  const std::string& kind) override;
    json import_symbol(const std::string& lib_id, const std::string& dest_library,
                       const std::string& project_dir) override;
    json import_footprint(const std::string& lib_id, const std::string& dest_library,
                          const std::string& project_dir) override;

    // ── Project ──
    json open_project(const std::string& path) override;
    json list_project_files(const std::string& path) override;
    json get_project_metadata(const std::string& path) override;

private:
    Config cfg_;

    LibraryResolver resolver_for(const std::string& document_path) const;
    void log(const std::string& msg) const;
};

} // namespace kicadfile
