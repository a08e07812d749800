#include "erc.h"
#include "errors.h"
#include "utils.h"

#include <algorithm>
#include <map>
#include <regex>
#include <set>

namespace kicadfile {

const char* severity_name(Severity s) {
    return s == Severity::Error ? "error" : "warning";
}

static void add(ErcReport& report, Violation v) {
    if (v.severity == Severity::Error) report.errors++;
    else report.warnings++;
    report.violations.push_back(std::move(v));
}

// ── Required fields ─────────────────────────────────────────────────

std::vector<Violation> check_required_fields(const SchematicDocument& doc) {
    std::vector<Violation> out;
    std::string sheet_path = "/" + doc.uuid();

    for (auto& node : doc.root().children()) {
        if (!node.is("symbol")) continue;
        std::string ref = symbol_reference(node);

        std::vector<std::string> missing;
        for (const char* field : {"lib_id", "at", "unit", "in_bom", "on_board", "dnp", "uuid"})
            if (!node.find(field)) missing.push_back(field);

        bool has_path = false;
        if (const SExpr* inst = node.find("instances")) {
            for (auto* project : inst->find_all("project"))
                for (auto* path : project->find_all("path"))
                    if (path->str_at(1) == sheet_path) has_path = true;
        }
        if (!has_path) missing.push_back("instances " + sheet_path);

        for (auto& field : missing) {
            Violation v;
            v.severity = Severity::Error;
            v.type = "missing_field";
            v.reference = ref;
            v.description = "Symbol " + (ref.empty() ? std::string("(unnamed)") : ref) +
                            " lacks " + field;
            if (const SExpr* at = node.find("at")) v.positions.push_back({at->num_at(1), at->num_at(2)});
            out.push_back(std::move(v));
        }
    }
    return out;
}

// ── ERC ─────────────────────────────────────────────────────────────

ErcReport check_schematic(const SchematicDocument& doc, ConnectivityGraph& graph) {
    ErcReport report;
    Schematic sch = doc.read();

    // Units of one part legitimately share a reference
    std::map<std::pair<std::string, int>, std::vector<Point>> seen;
    for (auto& sym : sch.symbols) {
        if (sym.power || sym.reference.empty() || sym.reference[0] == '#') continue;
        seen[{sym.reference, sym.unit}].push_back(sym.position);
    }
    for (auto& [key, positions] : seen) {
        if (positions.size() < 2) continue;
        Violation v;
        v.severity = Severity::Error;
        v.type = "duplicate_reference";
        v.reference = key.first;
        v.description = "Duplicate reference designator '" + key.first + "' (" +
                        std::to_string(positions.size()) + " instances)";
        v.positions = positions;
        add(report, std::move(v));
    }

    for (auto& pin : graph.floating_pins()) {
        Violation v;
        v.type = "floating_pin";
        v.reference = pin.reference;
        v.pin = pin.pin;
        v.description = "Pin " + pin.pin + " of " + pin.reference +
                        " is not connected and has no no-connect marker";
        v.positions.push_back(pin.position);
        add(report, std::move(v));
    }

    for (auto& ref : graph.unconnected_power()) {
        Violation v;
        v.type = "unconnected_power";
        v.reference = ref;
        v.description = "Power symbol " + ref + " is not connected to any component pin";
        if (const SymbolInstance* sym = sch.find_symbol(ref)) v.positions.push_back(sym->position);
        add(report, std::move(v));
    }

    for (auto& v : check_required_fields(doc)) add(report, std::move(v));
    return report;
}

// ── Parameter checks ────────────────────────────────────────────────

const std::string& validate_reference(const std::string& ref) {
    static const std::regex pattern("^[A-Za-z]+[0-9]+[A-Za-z]?$");
    if (ref.empty() || !std::regex_match(ref, pattern))
        throw InvalidArgument("Invalid reference designator: '" + ref +
                              "'. Expected letter(s) + number(s), e.g. R1, U3, C10",
                              {{"reference", ref}});
    return ref;
}

const std::string& validate_net_name(const std::string& name) {
    static const std::regex pattern("^[A-Za-z0-9_\\-/.+~]+$");
    if (name.empty()) throw InvalidArgument("Net name cannot be empty");
    if (!std::regex_match(name, pattern))
        throw InvalidArgument("Invalid net name: '" + name +
                              "'. Allowed characters: alphanumeric, _, -, /, ., +, ~",
                              {{"net", name}});
    return name;
}

const std::string& validate_layer(const std::string& layer) {
    static const std::set<std::string> layers = {
        "F.Cu", "B.Cu", "In1.Cu", "In2.Cu", "In3.Cu", "In4.Cu",
        "In5.Cu", "In6.Cu", "In7.Cu", "In8.Cu",
        "F.SilkS", "B.SilkS", "F.Mask", "B.Mask",
        "F.Paste", "B.Paste", "F.CrtYd", "B.CrtYd",
        "F.Fab", "B.Fab", "Edge.Cuts", "Margin",
        "Dwgs.User", "Cmts.User", "Eco1.User", "Eco2.User",
    };
    if (!layers.count(layer))
        throw InvalidArgument("Unknown layer: '" + layer + "'", {{"layer", layer}});
    return layer;
}

double validate_positive(double value, const std::string& name) {
    if (!(value > 0.0))
        throw InvalidArgument(name + " must be positive, got " + fmt(value), {{name, fmt(value)}});
    return value;
}

} // namespace kicadfile
