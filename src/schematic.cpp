#include "schematic.h"
#include "errors.h"
#include "schematic_reader.h"

#include <algorithm>
#include <cstdio>
#include <sstream>

namespace kicadfile {

static const double PROP_OFFSET = 2.0;    // mm between stacked property labels
static const char* FONT_EFFECTS = "(effects\n\t\t(font\n\t\t\t(size 1.27 1.27)\n\t\t)";

// ── Snapshot helpers ────────────────────────────────────────────────

const Property* SymbolInstance::property(const std::string& name) const {
    for (auto& p : properties)
        if (p.name == name) return &p;
    return nullptr;
}

const SymbolInstance* Schematic::find_symbol(const std::string& reference, int unit) const {
    for (auto& s : symbols)
        if (s.reference == reference && (unit == 0 || s.unit == unit)) return &s;
    return nullptr;
}

const char* label_tag(LabelKind kind) {
    switch (kind) {
        case LabelKind::Global:       return "global_label";
        case LabelKind::Hierarchical: return "hierarchical_label";
        default:                      return "label";
    }
}

std::optional<LabelKind> parse_label_kind(const std::string& s) {
    if (s == "label" || s == "local" || s.empty()) return LabelKind::Local;
    if (s == "global_label" || s == "global") return LabelKind::Global;
    if (s == "hierarchical_label" || s == "hierarchical") return LabelKind::Hierarchical;
    return std::nullopt;
}

std::string symbol_reference(const SExpr& node) {
    for (auto* p : node.find_all("property"))
        if (p->str_at(1) == "Reference") return p->str_at(2);
    // Older files only carry the reference in the instances block
    if (auto* inst = node.find("instances"))
        if (auto* proj = inst->find("project"))
            if (auto* path = proj->find("path"))
                return path->child_str("reference");
    return "";
}

int symbol_unit(const SExpr& node) {
    return static_cast<int>(node.child_num("unit", 1));
}

bool property_hidden(const SExpr& prop) {
    if (prop.child_flag("hide")) return true;
    if (auto* eff = prop.find("effects")) {
        if (eff->child_flag("hide")) return true;
        for (auto& c : eff->children())
            if (c.is_atom() && c.value() == "hide") return true;
    }
    return false;
}

// "R_1_1" -> unit 1, style 1
static void sub_symbol_unit(const std::string& name, int& unit, int& style) {
    unit = 0;
    style = 0;
    auto last = name.rfind('_');
    if (last == std::string::npos || last == 0) return;
    auto prev = name.rfind('_', last - 1);
    if (prev == std::string::npos) return;
    unit = parse_int(name.substr(prev + 1, last - prev - 1), 0);
    style = parse_int(name.substr(last + 1), 0);
}

static LibPin read_lib_pin(const SExpr& pin, int unit, int style) {
    LibPin p;
    p.electrical_type = pin.str_at(1);
    p.shape = pin.str_at(2);
    p.unit = unit;
    p.style = style;
    if (auto* at = pin.find("at")) {
        p.position = {at->num_at(1), at->num_at(2)};
        p.angle = quantize_rotation(at->num_at(3));
    }
    p.length = pin.child_num("length");
    p.name = pin.child_str("name");
    p.number = pin.child_str("number");
    p.hidden = pin.child_flag("hide");
    for (auto& c : pin.children())
        if (c.is_atom() && c.value() == "hide") p.hidden = true;
    return p;
}

LibSymbolDef read_lib_symbol(const SExpr& node) {
    LibSymbolDef def;
    def.name = node.str_at(1);
    def.extends = node.child_str("extends");
    def.power = node.find("power") != nullptr;

    for (auto* prop : node.find_all("property"))
        def.properties[prop->str_at(1)] = prop->str_at(2);

    auto filters = def.properties.find("ki_fp_filters");
    if (filters != def.properties.end()) {
        std::istringstream iss(filters->second);
        std::string f;
        while (iss >> f) def.fp_filters.push_back(f);
    }

    for (auto* pin : node.find_all("pin"))
        def.pins.push_back(read_lib_pin(*pin, 0, 0));

    for (auto* sub : node.find_all("symbol")) {
        int unit = 0, style = 0;
        sub_symbol_unit(sub->str_at(1), unit, style);
        def.unit_count = std::max(def.unit_count, unit);
        for (auto* pin : sub->find_all("pin"))
            def.pins.push_back(read_lib_pin(*pin, unit, style));
    }
    return def;
}

// ── SchematicDocument ───────────────────────────────────────────────

SchematicDocument SchematicDocument::load(const std::string& path) {
    SchematicDocument doc;
    doc.snapshot_ = read_snapshot(path);
    doc.root_ = parse_sexpr(doc.snapshot_.content);
    if (!doc.root_.is("kicad_sch"))
        throw StructuralInvariantViolation("not a schematic: root is (" + doc.root_.tag() + ")",
                                           {{"path", path}});
    return doc;
}

SchematicDocument SchematicDocument::from_text(const std::string& text, const std::string& path) {
    SchematicDocument doc;
    doc.snapshot_ = FileSnapshot{path, text};
    doc.root_ = parse_sexpr(text);
    if (!doc.root_.is("kicad_sch"))
        throw StructuralInvariantViolation("not a schematic: root is (" + doc.root_.tag() + ")");
    return doc;
}

std::string SchematicDocument::skeleton_text(const SchematicSkeleton& opts) {
    std::ostringstream out;
    out << "(kicad_sch\n"
        << "\t(version 20231120)\n"
        << "\t(generator " << sq(opts.generator) << ")\n"
        << "\t(generator_version " << sq(opts.generator_version) << ")\n"
        << "\t(uuid " << sq(generate_uuid()) << ")\n"
        << "\t(paper " << sq(opts.paper.empty() ? "A4" : opts.paper) << ")\n";
    if (!opts.title.empty() || !opts.revision.empty()) {
        out << "\t(title_block\n";
        if (!opts.title.empty()) out << "\t\t(title " << sq(opts.title) << ")\n";
        if (!opts.revision.empty()) out << "\t\t(rev " << sq(opts.revision) << ")\n";
        out << "\t)\n";
    }
    out << "\t(lib_symbols)\n"
        << "\t(sheet_instances\n"
        << "\t\t(path \"/\"\n"
        << "\t\t\t(page \"1\")\n"
        << "\t\t)\n"
        << "\t)\n"
        << ")\n";
    return out.str();
}

void SchematicDocument::create(const std::string& path, const SchematicSkeleton& opts) {
    create_file(path, skeleton_text(opts));
}

std::string SchematicDocument::uuid() const {
    return root_.child_str("uuid");
}

std::string SchematicDocument::project_name() const {
    return snapshot_.path.empty() ? "project" : file_stem(snapshot_.path);
}

Schematic SchematicDocument::read(std::vector<std::string>* warnings) const {
    return read_schematic(root_, warnings);
}

void SchematicDocument::save() {
    if (snapshot_.path.empty()) throw InvalidArgument("document has no file path");
    std::string content = text();
    commit_file(snapshot_, content);
    snapshot_.content = std::move(content);
}

// ── lib_symbols cache ───────────────────────────────────────────────

const SExpr* SchematicDocument::cached_symbol(const std::string& lib_id) const {
    const SExpr* libs = root_.find("lib_symbols");
    if (!libs) return nullptr;
    for (auto* s : libs->find_all("symbol"))
        if (s->str_at(1) == lib_id) return s;
    return nullptr;
}

SExpr& SchematicDocument::lib_symbols_node() {
    if (SExpr* libs = root_.find("lib_symbols")) return *libs;
    size_t at = 1;
    for (size_t i = 0; i < root_.size(); i++) {
        const std::string t = root_[i].tag();
        if (t == "version" || t == "generator" || t == "generator_version" ||
            t == "uuid" || t == "paper" || t == "title_block")
            at = i + 1;
    }
    return root_.insert(at, parse_snippet("(lib_symbols)"));
}

bool SchematicDocument::cache_symbol(const std::string& lib_id, const SExpr& definition) {
    if (cached_symbol(lib_id)) return false;
    if (!definition.is("symbol") || definition.size() < 2)
        throw InvalidArgument("not a symbol definition for " + lib_id);
    SExpr copy = definition;
    // Only the outer name is qualified; unit sub-symbols keep "R_0_1" form
    copy.set_atom(1, SExpr::string(lib_id));
    lib_symbols_node().append(std::move(copy));
    return true;
}

// ── Symbol instances ────────────────────────────────────────────────

std::vector<size_t> SchematicDocument::find_symbol_nodes(const std::string& reference,
                                                         int unit) const {
    std::vector<size_t> out;
    for (size_t i = 0; i < root_.size(); i++) {
        const SExpr& n = root_[i];
        if (!n.is("symbol")) continue;
        if (symbol_reference(n) != reference) continue;
        if (unit != 0 && symbol_unit(n) != unit) continue;
        out.push_back(i);
    }
    return out;
}

size_t SchematicDocument::insertion_index() const {
    int idx = root_.index_of("sheet_instances");
    if (idx < 0) idx = root_.index_of("symbol_instances");
    return idx < 0 ? root_.size() : static_cast<size_t>(idx);
}

SExpr& SchematicDocument::insert_item(const std::string& snippet) {
    return root_.insert(insertion_index(), parse_snippet(snippet));
}

static std::string property_snippet(const std::string& name, const std::string& value,
                                    const Point& at, bool hidden) {
    std::ostringstream out;
    out << "(property " << sq(name) << " " << sq(value) << "\n"
        << "\t(at " << fmt(at.x) << " " << fmt(at.y) << " 0)\n"
        << "\t" << FONT_EFFECTS << "\n";
    if (hidden) out << "\t\t(hide yes)\n";
    out << "\t)\n"
        << ")";
    return out.str();
}

std::string SchematicDocument::add_symbol(const NewSymbol& sym) {
    if (sym.lib_id.empty()) throw InvalidArgument("lib_id is required");
    if (sym.reference.empty()) throw InvalidArgument("reference is required");
    if (sym.unit < 1) throw InvalidArgument("unit must be >= 1", {{"unit", std::to_string(sym.unit)}});

    if (sym.reference[0] != '#') {
        for (size_t idx : find_symbol_nodes(sym.reference, 0)) {
            const SExpr& other = root_[idx];
            bool other_unit = other.child_str("lib_id") == sym.lib_id &&
                              symbol_unit(other) != sym.unit;
            if (!other_unit)
                throw StructuralInvariantViolation("duplicate reference " + sym.reference,
                                                   {{"reference", sym.reference}});
        }
    }

    std::string id = generate_uuid();
    double x = sym.position.x, y = sym.position.y;
    bool power = sym.reference[0] == '#';

    std::ostringstream out;
    out << "(symbol\n"
        << "\t(lib_id " << sq(sym.lib_id) << ")\n"
        << "\t(at " << fmt(x) << " " << fmt(y) << " " << quantize_rotation(sym.rotation) << ")\n";
    if (sym.mirror != Mirror::None) out << "\t(mirror " << mirror_name(sym.mirror) << ")\n";
    out << "\t(unit " << sym.unit << ")\n"
        << "\t(exclude_from_sim no)\n"
        << "\t(in_bom " << (sym.in_bom ? "yes" : "no") << ")\n"
        << "\t(on_board " << (sym.on_board ? "yes" : "no") << ")\n"
        << "\t(dnp " << (sym.dnp ? "yes" : "no") << ")\n"
        << "\t(uuid " << sq(id) << ")\n"
        << ")";
    SExpr node = parse_snippet(out.str());

    node.append(parse_snippet(property_snippet("Reference", sym.reference, {x, y - PROP_OFFSET}, power)));
    node.append(parse_snippet(property_snippet("Value", sym.value, {x, y + PROP_OFFSET}, false)));
    node.append(parse_snippet(property_snippet("Footprint", sym.footprint, {x, y + 2 * PROP_OFFSET}, true)));
    node.append(parse_snippet(property_snippet("Datasheet", "~", {x, y + 2 * PROP_OFFSET}, true)));
    double offset = 3 * PROP_OFFSET;
    for (auto& [name, value] : sym.properties) {
        if (name == "Reference" || name == "Value" || name == "Footprint" || name == "Datasheet")
            continue;
        node.append(parse_snippet(property_snippet(name, value, {x, y + offset}, true)));
        offset += PROP_OFFSET;
    }

    for (auto& num : sym.pin_numbers) {
        node.append(parse_snippet("(pin " + sq(num) + "\n\t(uuid " + sq(generate_uuid()) + ")\n)"));
    }

    std::ostringstream inst;
    inst << "(instances\n"
         << "\t(project " << sq(project_name()) << "\n"
         << "\t\t(path " << sq("/" + uuid()) << "\n"
         << "\t\t\t(reference " << sq(sym.reference) << ")\n"
         << "\t\t\t(unit " << sym.unit << ")\n"
         << "\t\t)\n"
         << "\t)\n"
         << ")";
    node.append(parse_snippet(inst.str()));

    root_.insert(insertion_index(), std::move(node));
    return id;
}

void SchematicDocument::move_symbol(const std::string& reference, const Point& to,
                                    std::optional<int> rotation, std::optional<Mirror> mirror,
                                    int unit) {
    auto nodes = find_symbol_nodes(reference, unit);
    if (nodes.empty()) throw NotFoundError("symbol", reference);
    if (nodes.size() > 1)
        throw InvalidArgument("reference " + reference + " has several units; pass unit",
                              {{"reference", reference}});

    SExpr& sym = root_[nodes[0]];
    SExpr* at = sym.find("at");
    if (!at) throw StructuralInvariantViolation("symbol " + reference + " has no position");

    Point delta{to.x - at->num_at(1), to.y - at->num_at(2)};
    int rot = rotation ? quantize_rotation(*rotation)
                       : quantize_rotation(at->num_at(3));

    SExpr new_at = parse_snippet("(at " + fmt(to.x) + " " + fmt(to.y) + " " +
                                 std::to_string(rot) + ")");
    new_at.set_lead(at->lead());
    *at = new_at;

    if (mirror) {
        int idx = sym.index_of("mirror");
        if (*mirror == Mirror::None) {
            if (idx >= 0) sym.remove(static_cast<size_t>(idx));
        } else if (idx >= 0) {
            sym[static_cast<size_t>(idx)].set_atom(1, SExpr::symbol(mirror_name(*mirror)));
        } else {
            size_t after = static_cast<size_t>(sym.index_of("at")) + 1;
            sym.insert(after, parse_snippet(std::string("(mirror ") + mirror_name(*mirror) + ")"));
        }
    }

    // Field labels travel with the body
    for (auto* prop : sym.find_all("property")) {
        SExpr* pat = prop->find("at");
        if (!pat || pat->size() < 3) continue;
        pat->set_atom(1, SExpr::number(pat->num_at(1) + delta.x));
        pat->set_atom(2, SExpr::number(pat->num_at(2) + delta.y));
    }
}

bool SchematicDocument::update_property(const std::string& reference, const std::string& name,
                                        const std::string& value) {
    if (name.empty()) throw InvalidArgument("property name is required");
    auto nodes = find_symbol_nodes(reference, 0);
    if (nodes.empty()) throw NotFoundError("symbol", reference);

    if (name == "Reference" && value != reference && !value.empty() && value[0] != '#' &&
        !find_symbol_nodes(value, 0).empty())
        throw StructuralInvariantViolation("duplicate reference " + value, {{"reference", value}});

    bool changed = false;
    for (size_t idx : nodes) {
        SExpr& sym = root_[idx];
        SExpr* target = nullptr;
        for (auto* prop : sym.find_all("property"))
            if (prop->str_at(1) == name) target = prop;

        if (target) {
            if (target->str_at(2) == value) continue;
            target->set_atom(2, SExpr::string(value));
        } else {
            const SExpr* at = sym.find("at");
            Point pos{at ? at->num_at(1) : 0.0, at ? at->num_at(2) + 3 * PROP_OFFSET : 0.0};
            int before = sym.index_of("pin");
            if (before < 0) before = sym.index_of("instances");
            size_t where = before < 0 ? sym.size() : static_cast<size_t>(before);
            sym.insert(where, parse_snippet(property_snippet(name, value, pos, true)));
        }
        changed = true;

        if (name == "Reference") {
            if (SExpr* inst = sym.find("instances"))
                for (auto* proj : inst->find_all("project"))
                    for (auto* path : proj->find_all("path"))
                        path->set_child_atom("reference", SExpr::string(value));
        }
    }
    return changed;
}

int SchematicDocument::remove_symbol(const std::string& reference, int unit) {
    auto nodes = find_symbol_nodes(reference, unit);
    if (nodes.empty()) throw NotFoundError("symbol", reference);
    for (auto it = nodes.rbegin(); it != nodes.rend(); ++it)
        root_.remove(*it);
    return static_cast<int>(nodes.size());
}

std::string SchematicDocument::next_power_reference() const {
    int max_n = 0;
    for (auto& n : root_.children()) {
        if (!n.is("symbol")) continue;
        std::string ref = symbol_reference(n);
        if (ref.compare(0, 4, "#PWR") != 0) continue;
        max_n = std::max(max_n, parse_int(ref.substr(4), 0));
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "#PWR%03d", max_n + 1);
    return buf;
}

// ── Wiring ──────────────────────────────────────────────────────────

static Point node_point(const SExpr& n) {
    return snap_point({n.num_at(1), n.num_at(2)});
}

std::string SchematicDocument::add_wire(const Point& start, const Point& end) {
    if (snap_point(start) == snap_point(end))
        throw InvalidArgument("wire has zero length");
    std::string id = generate_uuid();
    insert_item("(wire\n"
                "\t(pts\n"
                "\t\t(xy " + fmt(start.x) + " " + fmt(start.y) + ") (xy " +
                fmt(end.x) + " " + fmt(end.y) + ")\n"
                "\t)\n"
                "\t(stroke\n"
                "\t\t(width 0)\n"
                "\t\t(type default)\n"
                "\t)\n"
                "\t(uuid " + sq(id) + ")\n"
                ")");
    return id;
}

void SchematicDocument::remove_wire(const Point& start, const Point& end) {
    Point a = snap_point(start), b = snap_point(end);
    for (size_t i = 0; i < root_.size(); i++) {
        if (!root_[i].is("wire")) continue;
        const SExpr* pts = root_[i].find("pts");
        if (!pts) continue;
        auto xy = pts->find_all("xy");
        if (xy.size() != 2) continue;
        Point p = node_point(*xy[0]), q = node_point(*xy[1]);
        if ((p == a && q == b) || (p == b && q == a)) {
            root_.remove(i);
            return;
        }
    }
    throw NotFoundError("wire", "(" + fmt(start.x) + "," + fmt(start.y) + ")-(" +
                        fmt(end.x) + "," + fmt(end.y) + ")");
}

std::string SchematicDocument::add_label(const std::string& text, const Point& at, LabelKind kind,
                                         int rotation, const std::string& shape) {
    if (text.empty()) throw InvalidArgument("label text is required");
    std::string id = generate_uuid();
    std::ostringstream out;
    out << "(" << label_tag(kind) << " " << sq(text) << "\n";
    if (kind != LabelKind::Local)
        out << "\t(shape " << (shape.empty() ? "input" : shape) << ")\n";
    out << "\t(at " << fmt(at.x) << " " << fmt(at.y) << " " << quantize_rotation(rotation) << ")\n"
        << "\t(fields_autoplaced yes)\n"
        << "\t" << FONT_EFFECTS << "\n"
        << "\t\t(justify left" << (kind == LabelKind::Local ? " bottom" : "") << ")\n"
        << "\t)\n"
        << "\t(uuid " << sq(id) << ")\n"
        << ")";
    insert_item(out.str());
    return id;
}

std::string SchematicDocument::add_junction(const Point& at) {
    std::string id = generate_uuid();
    insert_item("(junction\n"
                "\t(at " + fmt(at.x) + " " + fmt(at.y) + ")\n"
                "\t(diameter 0)\n"
                "\t(color 0 0 0 0)\n"
                "\t(uuid " + sq(id) + ")\n"
                ")");
    return id;
}

std::string SchematicDocument::add_no_connect(const Point& at) {
    std::string id = generate_uuid();
    insert_item("(no_connect\n"
                "\t(at " + fmt(at.x) + " " + fmt(at.y) + ")\n"
                "\t(uuid " + sq(id) + ")\n"
                ")");
    return id;
}

void SchematicDocument::remove_no_connect(const Point& at) {
    Point target = snap_point(at);
    for (size_t i = 0; i < root_.size(); i++) {
        if (!root_[i].is("no_connect")) continue;
        const SExpr* pos = root_[i].find("at");
        if (pos && node_point(*pos) == target) {
            root_.remove(i);
            return;
        }
    }
    throw NotFoundError("no_connect", "(" + fmt(at.x) + "," + fmt(at.y) + ")");
}

} // namespace kicadfile
