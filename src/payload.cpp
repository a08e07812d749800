#include "payload.h"

namespace kicadfile {

// ── Schematic ───────────────────────────────────────────────────────

void to_json(json& j, const Point& p) {
    j = json{{"x", p.x}, {"y", p.y}};
}

void to_json(json& j, const Property& p) {
    j = json{{"name", p.name}, {"value", p.value}, {"position", p.position}, {"hidden", p.hidden}};
}

void to_json(json& j, const SymbolInstance& s) {
    j = json{
        {"lib_id", s.lib_id},
        {"reference", s.reference},
        {"value", s.value},
        {"footprint", s.footprint},
        {"uuid", s.uuid},
        {"position", s.position},
        {"rotation", s.rotation},
        {"mirror", mirror_name(s.mirror)},
        {"unit", s.unit},
        {"in_bom", s.in_bom},
        {"on_board", s.on_board},
        {"dnp", s.dnp},
        {"is_power", s.power},
        {"renderable", s.renderable},
        {"properties", s.properties},
    };
}

void to_json(json& j, const Wire& w) {
    j = json{{"start", w.start}, {"end", w.end}, {"uuid", w.uuid}};
}

void to_json(json& j, const Label& l) {
    j = json{{"text", l.text}, {"type", label_tag(l.kind)}, {"position", l.position},
             {"rotation", l.rotation}, {"uuid", l.uuid}};
    if (!l.shape.empty()) j["shape"] = l.shape;
}

void to_json(json& j, const Junction& jn) {
    j = json{{"position", jn.position}, {"uuid", jn.uuid}};
}

void to_json(json& j, const NoConnect& nc) {
    j = json{{"position", nc.position}, {"uuid", nc.uuid}};
}

void to_json(json& j, const SheetPin& p) {
    j = json{{"name", p.name}, {"shape", p.shape}, {"position", p.position}};
}

void to_json(json& j, const Sheet& s) {
    j = json{{"sheetname", s.name}, {"sheetfile", s.file}, {"uuid", s.uuid},
             {"position", s.position}, {"size", s.size}, {"pins", s.pins}};
}

void to_json(json& j, const Schematic& s) {
    j = json{
        {"info", {
            {"version", s.version},
            {"generator", s.generator},
            {"generator_version", s.generator_version},
            {"uuid", s.uuid},
            {"paper", s.paper},
            {"title_block", s.title_block},
            {"num_symbols", s.symbols.size()},
            {"num_wires", s.wires.size()},
            {"num_labels", s.labels.size()},
        }},
        {"symbols", s.symbols},
        {"wires", s.wires},
        {"labels", s.labels},
        {"junctions", s.junctions},
        {"no_connects", s.no_connects},
        {"sheets", s.sheets},
    };
}

// ── Library ─────────────────────────────────────────────────────────

void to_json(json& j, const LibPin& p) {
    j = json{{"number", p.number}, {"name", p.name}, {"type", p.electrical_type},
             {"shape", p.shape}, {"position", p.position}, {"angle", p.angle},
             {"length", p.length}, {"unit", p.unit}};
}

void to_json(json& j, const PinPosition& p) {
    j = json{{"number", p.number}, {"name", p.name}, {"type", p.electrical_type},
             {"position", p.position}, {"angle", p.angle}, {"unit", p.unit}};
}

void to_json(json& j, const LibraryEntry& e) {
    j = json{{"nickname", e.nickname}, {"path", e.path}, {"project", e.project}};
}

void to_json(json& j, const SymbolSummary& s) {
    j = json{{"lib_id", s.lib_id}, {"description", s.description}, {"keywords", s.keywords}};
}

void to_json(json& j, const SymbolInfo& s) {
    j = json{
        {"lib_id", s.lib_id},
        {"description", s.description},
        {"keywords", s.keywords},
        {"datasheet", s.datasheet},
        {"default_footprint", s.default_footprint},
        {"fp_filters", s.fp_filters},
        {"is_power", s.power},
        {"unit_count", s.unit_count},
        {"pins", s.pins},
    };
}

void to_json(json& j, const FootprintPad& p) {
    j = json{{"number", p.number}, {"type", p.type}, {"shape", p.shape},
             {"position", p.position}, {"size", p.size}, {"layers", p.layers}};
}

void to_json(json& j, const FootprintInfo& f) {
    j = json{{"lib_id", f.lib_id}, {"description", f.description}, {"tags", f.tags},
             {"smd", f.smd}, {"pad_count", f.pads.size()}, {"pads", f.pads}};
}

// ── Board ───────────────────────────────────────────────────────────

void to_json(json& j, const BoardNet& n) {
    j = json{{"number", n.id}, {"name", n.name}};
}

void to_json(json& j, const Pad& p) {
    j = json{{"number", p.number}, {"type", p.type}, {"shape", p.shape},
             {"offset", p.offset}, {"position", p.position}, {"size", p.size},
             {"rotation", p.rotation}, {"layers", p.layers},
             {"net", p.net_id}, {"net_name", p.net_name}};
}

void to_json(json& j, const Footprint& f) {
    j = json{
        {"reference", f.reference},
        {"value", f.value},
        {"footprint", f.lib_id},
        {"layer", f.layer},
        {"uuid", f.uuid},
        {"position", f.position},
        {"rotation", f.rotation},
        {"properties", f.properties},
        {"pads", f.pads},
    };
}

void to_json(json& j, const Track& t) {
    j = json{{"start", t.start}, {"end", t.end}, {"width", t.width},
             {"layer", t.layer}, {"net", t.net_id}, {"uuid", t.uuid}};
}

void to_json(json& j, const Via& v) {
    j = json{{"position", v.position}, {"size", v.size}, {"drill", v.drill},
             {"layers", v.layers}, {"net", v.net_id}, {"uuid", v.uuid}};
}

void to_json(json& j, const Zone& z) {
    j = json{{"net", z.net_id}, {"net_name", z.net_name}, {"layers", z.layers}, {"uuid", z.uuid}};
}

void to_json(json& j, const Board& b) {
    j = json{
        {"info", {
            {"version", b.version},
            {"generator", b.generator},
            {"thickness", b.thickness},
            {"layers", b.layers},
            {"title_block", b.title_block},
            {"num_components", b.footprints.size()},
            {"num_nets", b.nets.size()},
            {"num_tracks", b.tracks.size()},
            {"num_vias", b.vias.size()},
        }},
        {"components", b.footprints},
        {"nets", b.nets},
        {"tracks", b.tracks},
        {"vias", b.vias},
        {"zones", b.zones},
    };
}

void to_json(json& j, const DesignRules& r) {
    j = json::object();
    for (auto& [name, value] : r.numeric) j[name] = value;
    for (auto& [name, value] : r.text) j[name] = value;
}

// ── Analysis ────────────────────────────────────────────────────────

void to_json(json& j, const NetPin& p) {
    j = json{{"reference", p.reference}, {"pin_number", p.pin}, {"pin_name", p.pin_name},
             {"pin_type", p.electrical_type}, {"position", p.position}};
}

void to_json(json& j, const NetMembers& m) {
    j = json{
        {"net_name", m.name},
        {"explicit", m.explicit_name},
        {"pins", m.pins},
        {"labels", m.labels},
        {"wires", m.wires},
        {"junctions", m.junctions},
        {"power_symbols", m.power_symbols},
    };
}

void to_json(json& j, const ComponentRef& c) {
    j = json{{"reference", c.reference}, {"value", c.value}, {"lib_id", c.lib_id},
             {"footprint", c.footprint}};
}

void to_json(json& j, const FieldMismatch& m) {
    j = json{{"reference", m.reference}, {"schematic", m.schematic}, {"board", m.board}};
}

void to_json(json& j, const CompareResult& r) {
    j = json{
        {"summary", {
            {"schematic_components", r.schematic_components},
            {"board_components", r.board_components},
            {"matched", r.matched},
            {"missing_from_board", r.missing_from_board.size()},
            {"missing_from_schematic", r.missing_from_schematic.size()},
            {"footprint_mismatches", r.footprint_mismatches.size()},
            {"value_mismatches", r.value_mismatches.size()},
        }},
        {"missing_from_board", r.missing_from_board},
        {"missing_from_schematic", r.missing_from_schematic},
        {"footprint_mismatches", r.footprint_mismatches},
        {"value_mismatches", r.value_mismatches},
    };
}

void to_json(json& j, const SyncResult& r) {
    j = json{{"placed", r.placed}, {"values_updated", r.values_updated},
             {"net_conflicts", r.net_conflicts}, {"warnings", r.warnings}};
}

void to_json(json& j, const Violation& v) {
    j = json{{"severity", severity_name(v.severity)}, {"type", v.type},
             {"description", v.description}, {"reference", v.reference}};
    if (!v.pin.empty()) j["pin"] = v.pin;
    if (!v.positions.empty()) j["positions"] = v.positions;
}

void to_json(json& j, const ErcReport& r) {
    j = json{{"passed", r.passed()}, {"error_count", r.errors},
             {"warning_count", r.warnings}, {"violations", r.violations}};
}

void to_json(json& j, const SheetNode& n) {
    j = json{{"name", n.name}, {"file", n.file}, {"sheets", n.children}};
    if (!n.error.empty()) {
        j["error"] = n.error;
        return;
    }
    j["symbols_count"] = n.symbols;
    j["wires_count"] = n.wires;
    j["labels_count"] = n.labels;
    if (!n.pins.empty()) j["pins"] = n.pins;
}

// ── Parameters and errors ───────────────────────────────────────────

Point read_point(const json& j) {
    if (j.is_array() && j.size() >= 2 && j[0].is_number() && j[1].is_number())
        return {j[0].get<double>(), j[1].get<double>()};
    if (j.is_object() && j.contains("x") && j.contains("y") &&
        j["x"].is_number() && j["y"].is_number())
        return {j["x"].get<double>(), j["y"].get<double>()};
    throw InvalidArgument("expected a point, got " + j.dump());
}

json error_payload(const Error& e) {
    return json{
        {"status", "error"},
        {"kind", error_kind_name(e.kind())},
        {"message", e.what()},
        {"details", e.details()},
    };
}

} // namespace kicadfile
