#pragma once

#include "connectivity.h"
#include "pin_locator.h"
#include "schematic.h"

#include <string>
#include <vector>

// Forward declare pugixml types
namespace pugi {
    class xml_node;
}

namespace kicadfile {

struct NetlistOptions {
    std::string tool = "kicadfile";
    bool verbose = false;
};

// Writes a KiCad XML netlist (export version "E"): design header,
// components, libparts and nets taken from the connectivity graph.
class NetlistWriter {
public:
    explicit NetlistWriter(const NetlistOptions& opts = {});

    std::string write(const SchematicDocument& doc, PinLocator& locator, ConnectivityGraph& graph);

    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    NetlistOptions opts_;
    std::vector<std::string> warnings_;

    void write_design(pugi::xml_node& root, const SchematicDocument& doc, const Schematic& sch);
    void write_components(pugi::xml_node& root, const Schematic& sch);
    void write_libparts(pugi::xml_node& root, const SchematicDocument& doc, const Schematic& sch,
                        PinLocator& locator);
    void write_nets(pugi::xml_node& root, ConnectivityGraph& graph);

    void log(const std::string& msg);
    void warn(const std::string& msg);
};

} // namespace kicadfile
