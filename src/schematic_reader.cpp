#include "schematic_reader.h"
#include "errors.h"

#include <set>

namespace kicadfile {

// Top-level items of a KiCad 6-9 schematic
static const std::set<std::string> KNOWN_ITEMS = {
    "version", "generator", "generator_version", "uuid", "paper", "page",
    "title_block", "lib_symbols", "symbol", "wire", "bus", "bus_entry",
    "bus_alias", "label", "global_label", "hierarchical_label",
    "directive_label", "netclass_flag", "junction", "no_connect", "sheet",
    "sheet_instances", "symbol_instances", "text", "text_box", "textbox",
    "polyline", "rectangle", "circle", "arc", "bezier", "image", "table",
    "rule_area", "embedded_fonts", "embedded_files", "group",
};

static Point at_point(const SExpr& at) {
    return {at.num_at(1), at.num_at(2)};
}

static bool parse_symbol(const SExpr& n, SymbolInstance& s, std::string& err) {
    s.lib_id = n.child_str("lib_id");
    if (s.lib_id.empty()) { err = "symbol without lib_id"; return false; }
    const SExpr* at = n.find("at");
    if (!at || at->size() < 3) { err = "symbol " + s.lib_id + " without position"; return false; }
    s.position = at_point(*at);
    s.rotation = quantize_rotation(at->num_at(3));
    s.mirror = parse_mirror(n.child_str("mirror"));
    s.unit = symbol_unit(n);
    s.in_bom = n.child_flag("in_bom", true);
    s.on_board = n.child_flag("on_board", true);
    s.dnp = n.child_flag("dnp", false);
    s.uuid = n.child_str("uuid");

    for (auto* p : n.find_all("property")) {
        Property prop;
        prop.name = p->str_at(1);
        prop.value = p->str_at(2);
        if (auto* pat = p->find("at")) prop.position = at_point(*pat);
        prop.hidden = property_hidden(*p);
        if (prop.name == "Reference") s.reference = prop.value;
        else if (prop.name == "Value") s.value = prop.value;
        else if (prop.name == "Footprint") s.footprint = prop.value;
        s.properties.push_back(std::move(prop));
    }
    if (s.reference.empty()) s.reference = symbol_reference(n);
    if (s.reference.empty()) { err = "symbol " + s.lib_id + " without reference"; return false; }

    if (auto* inst = n.find("instances")) {
        for (auto* proj : inst->find_all("project")) {
            for (auto* path : proj->find_all("path")) {
                InstancePath ip;
                ip.project = proj->str_at(1);
                ip.path = path->str_at(1);
                ip.reference = path->child_str("reference");
                ip.unit = static_cast<int>(path->child_num("unit", 1));
                s.instances.push_back(std::move(ip));
            }
        }
    }
    return true;
}

static bool parse_wire(const SExpr& n, Wire& w, std::string& err) {
    const SExpr* pts = n.find("pts");
    auto xy = pts ? pts->find_all("xy") : std::vector<const SExpr*>{};
    if (xy.size() != 2) { err = "wire without exactly two points"; return false; }
    w.start = at_point(*xy[0]);
    w.end = at_point(*xy[1]);
    w.uuid = n.child_str("uuid");
    return true;
}

static bool parse_label(const SExpr& n, LabelKind kind, Label& l, std::string& err) {
    l.kind = kind;
    l.text = n.str_at(1);
    if (l.text.empty()) { err = std::string(label_tag(kind)) + " without text"; return false; }
    const SExpr* at = n.find("at");
    if (!at) { err = "label \"" + l.text + "\" without position"; return false; }
    l.position = at_point(*at);
    l.rotation = quantize_rotation(at->num_at(3));
    l.shape = n.child_str("shape");
    l.uuid = n.child_str("uuid");
    return true;
}

static bool parse_marker(const SExpr& n, Point& pos, std::string& uuid, std::string& err) {
    const SExpr* at = n.find("at");
    if (!at) { err = n.tag() + " without position"; return false; }
    pos = at_point(*at);
    uuid = n.child_str("uuid");
    return true;
}

static bool parse_sheet(const SExpr& n, Sheet& sh, std::string& err) {
    for (auto* p : n.find_all("property")) {
        std::string key = p->str_at(1);
        if (key == "Sheetname" || key == "Sheet name") sh.name = p->str_at(2);
        else if (key == "Sheetfile" || key == "Sheet file") sh.file = p->str_at(2);
    }
    if (sh.file.empty()) { err = "sheet without file"; return false; }
    if (auto* at = n.find("at")) sh.position = at_point(*at);
    if (auto* size = n.find("size")) sh.size = at_point(*size);
    sh.uuid = n.child_str("uuid");
    for (auto* pin : n.find_all("pin")) {
        SheetPin sp;
        sp.name = pin->str_at(1);
        sp.shape = pin->str_at(2);
        if (auto* at = pin->find("at")) sp.position = at_point(*at);
        sh.pins.push_back(std::move(sp));
    }
    return true;
}

bool SchematicReader::read_items(const SExpr& root, Schematic& out, bool strict) {
    if (!root.is("kicad_sch")) return fail("root is not kicad_sch");

    out.version = root.child_str("version");
    out.generator = root.child_str("generator");
    out.generator_version = root.child_str("generator_version");
    out.uuid = root.child_str("uuid");
    out.paper = root.child_str("paper");

    for (size_t i = 1; i < root.size(); i++) {
        const SExpr& n = root[i];
        const std::string tag = n.tag();
        std::string err;
        bool ok = true;

        if (tag == "title_block") {
            for (auto& c : n.children()) {
                if (!c.is_list()) continue;
                if (c.tag() == "comment")
                    out.title_block["comment" + c.str_at(1)] = c.str_at(2);
                else
                    out.title_block[c.tag()] = c.str_at(1);
            }
        } else if (tag == "lib_symbols") {
            for (auto* sym : n.find_all("symbol")) {
                LibSymbolDef def = read_lib_symbol(*sym);
                if (strict && !def.extends.empty() && def.pins.empty())
                    return fail("cached symbol " + def.name + " only extends " + def.extends);
                out.lib_symbols[def.name] = std::move(def);
            }
        } else if (tag == "symbol") {
            SymbolInstance s;
            ok = parse_symbol(n, s, err);
            if (ok) out.symbols.push_back(std::move(s));
        } else if (tag == "wire") {
            Wire w;
            ok = parse_wire(n, w, err);
            if (ok) out.wires.push_back(std::move(w));
        } else if (tag == "label" || tag == "global_label" || tag == "hierarchical_label") {
            Label l;
            ok = parse_label(n, *parse_label_kind(tag), l, err);
            if (ok) out.labels.push_back(std::move(l));
        } else if (tag == "junction") {
            Junction j;
            ok = parse_marker(n, j.position, j.uuid, err);
            if (ok) out.junctions.push_back(std::move(j));
        } else if (tag == "no_connect") {
            NoConnect nc;
            ok = parse_marker(n, nc.position, nc.uuid, err);
            if (ok) out.no_connects.push_back(std::move(nc));
        } else if (tag == "sheet") {
            Sheet sh;
            ok = parse_sheet(n, sh, err);
            if (ok) out.sheets.push_back(std::move(sh));
        } else if (!KNOWN_ITEMS.count(tag)) {
            ok = false;
            err = "unsupported item (" + (tag.empty() ? std::string("?") : tag) + ")";
        }

        if (!ok) {
            if (strict) return fail(err);
            warn("skipped: " + err);
        }
    }

    for (auto& s : out.symbols) {
        auto def = out.lib_symbols.find(s.lib_id);
        s.renderable = def != out.lib_symbols.end();
        s.power = s.lib_id.compare(0, 6, "power:") == 0 || s.reference.compare(0, 1, "#") == 0 ||
                  (s.renderable && def->second.power);
        if (!s.renderable) warn("symbol " + s.reference + " has no cached definition for " + s.lib_id);
    }
    return true;
}

bool StrictSchematicReader::read(const SExpr& root, Schematic& out) {
    return read_items(root, out, true);
}

bool TolerantSchematicReader::read(const SExpr& root, Schematic& out) {
    return read_items(root, out, false);
}

Schematic read_schematic(const SExpr& root, std::vector<std::string>* warnings) {
    StrictSchematicReader strict;
    Schematic primary;
    if (strict.read(root, primary)) {
        if (warnings) warnings->insert(warnings->end(), strict.warnings().begin(),
                                       strict.warnings().end());
        return primary;
    }

    TolerantSchematicReader tolerant;
    Schematic fallback;
    if (tolerant.read(root, fallback)) {
        if (warnings) warnings->insert(warnings->end(), tolerant.warnings().begin(),
                                       tolerant.warnings().end());
        return fallback;
    }

    throw StructuralInvariantViolation(
        "schematic could not be read (strict: " + strict.error() +
            "; tolerant: " + tolerant.error() + ")",
        {{"strict", strict.error()}, {"tolerant", tolerant.error()}});
}

} // namespace kicadfile
