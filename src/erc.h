#pragma once

#include "connectivity.h"
#include "geometry.h"
#include "schematic.h"

#include <string>
#include <vector>

namespace kicadfile {

enum class Severity { Error, Warning };

const char* severity_name(Severity s);

struct Violation {
    Severity severity = Severity::Warning;
    std::string type;   // duplicate_reference, floating_pin, unconnected_power, missing_field
    std::string description;
    std::string reference;
    std::string pin;
    std::vector<Point> positions;
};

struct ErcReport {
    std::vector<Violation> violations;
    int errors = 0;
    int warnings = 0;
    bool passed() const { return errors == 0; }
};

// File-level electrical checks: duplicate references, floating pins,
// power symbols reaching no component, and the per-symbol fields KiCad
// 8/9 needs to open the file.
ErcReport check_schematic(const SchematicDocument& doc, ConnectivityGraph& graph);

// Structural part only; usable without library access
std::vector<Violation> check_required_fields(const SchematicDocument& doc);

// ── Parameter checks ────────────────────────────────────────────────
// Each throws InvalidArgument and returns its input unchanged.

// Letters then digits, optional unit letter: R1, U3, Q2A
const std::string& validate_reference(const std::string& ref);
// Letters, digits and _ - / . + ~
const std::string& validate_net_name(const std::string& name);
const std::string& validate_layer(const std::string& layer);
double validate_positive(double value, const std::string& name);

} // namespace kicadfile
