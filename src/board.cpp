#include "board.h"
#include "errors.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>

namespace kicadfile {

static const char* FP_FONT = "(effects (font (size 1 1) (thickness 0.15)))";

// KiCad stores pad and text angles as absolute board rotation
static double normalize_angle(double deg) {
    double a = std::fmod(deg, 360.0);
    if (a < 0) a += 360.0;
    if (std::abs(a) < 0.001 || std::abs(a - 360.0) < 0.001) a = 0.0;
    return a;
}

static std::string at_text(const Point& p, double rotation) {
    std::string s = "(at " + fmt(p.x) + " " + fmt(p.y);
    if (rotation != 0.0) s += " " + fmt(rotation);
    return s + ")";
}

static std::vector<std::string> atom_values(const SExpr* node) {
    std::vector<std::string> out;
    if (!node) return out;
    for (size_t i = 1; i < node->size(); i++) out.push_back(node->str_at(i));
    return out;
}

const Footprint* Board::find_footprint(const std::string& reference) const {
    for (auto& fp : footprints)
        if (fp.reference == reference) return &fp;
    return nullptr;
}

const BoardNet* Board::find_net(int id) const {
    for (auto& n : nets)
        if (n.id == id) return &n;
    return nullptr;
}

const BoardNet* Board::find_net(const std::string& name) const {
    for (auto& n : nets)
        if (n.name == name) return &n;
    return nullptr;
}

std::string footprint_reference(const SExpr& node) {
    for (auto* prop : node.find_all("property"))
        if (prop->str_at(1) == "Reference") return prop->str_at(2);
    // KiCad 6-7 footprints
    for (auto* text : node.find_all("fp_text"))
        if (text->str_at(1) == "reference") return text->str_at(2);
    return "";
}

static std::string footprint_field(const SExpr& node, const std::string& name) {
    for (auto* prop : node.find_all("property"))
        if (prop->str_at(1) == name) return prop->str_at(2);
    std::string legacy = to_lower(name);
    for (auto* text : node.find_all("fp_text"))
        if (text->str_at(1) == legacy) return text->str_at(2);
    return "";
}

static bool is_footprint(const SExpr& n) {
    return n.is("footprint") || n.is("module");
}

// ── Loading ─────────────────────────────────────────────────────────

BoardDocument BoardDocument::load(const std::string& path) {
    BoardDocument doc;
    doc.snapshot_ = read_snapshot(path);
    doc.root_ = parse_sexpr(doc.snapshot_.content);
    if (!doc.root_.is("kicad_pcb"))
        throw StructuralInvariantViolation("not a board: root is (" + doc.root_.tag() + ")",
                                           {{"path", path}});
    return doc;
}

BoardDocument BoardDocument::from_text(const std::string& text, const std::string& path) {
    BoardDocument doc;
    doc.snapshot_ = FileSnapshot{path, text};
    doc.root_ = parse_sexpr(text);
    if (!doc.root_.is("kicad_pcb"))
        throw StructuralInvariantViolation("not a board: root is (" + doc.root_.tag() + ")");
    return doc;
}

// ── Reading ─────────────────────────────────────────────────────────

static Pad read_pad(const SExpr& node, const Footprint& fp, const Board& board,
                    std::vector<std::string>& warnings) {
    Pad pad;
    pad.number = node.str_at(1);
    pad.type = node.str_at(2);
    pad.shape = node.str_at(3);
    if (const SExpr* at = node.find("at")) {
        pad.offset = {at->num_at(1), at->num_at(2)};
        pad.rotation = at->num_at(3);
    }
    if (const SExpr* size = node.find("size")) pad.size = {size->num_at(1), size->num_at(2)};
    pad.layers = atom_values(node.find("layers"));
    pad.uuid = node.child_str("uuid", node.child_str("tstamp"));

    // Pad offsets are in the footprint frame; footprint angles are CCW
    pad.position = snap_point(rotate_point({fp.position.x + pad.offset.x,
                                            fp.position.y + pad.offset.y},
                                           fp.position, -fp.rotation));

    if (const SExpr* net = node.find("net")) {
        if (net->size() > 1 && (*net)[1].is_number()) {
            pad.net_id = static_cast<int>(net->num_at(1));
            pad.net_name = net->str_at(2);
        } else {
            // Name-only form
            pad.net_name = net->str_at(1);
            if (const BoardNet* n = board.find_net(pad.net_name)) pad.net_id = n->id;
        }
        if (pad.net_id != 0 && !board.find_net(pad.net_id))
            warnings.push_back("pad " + fp.reference + "." + pad.number + " refers to net " +
                               std::to_string(pad.net_id) + " missing from the net table");
    }
    return pad;
}

static Footprint read_footprint(const SExpr& node, const Board& board,
                                std::vector<std::string>& warnings) {
    Footprint fp;
    fp.lib_id = node.str_at(1);
    fp.layer = node.child_str("layer");
    fp.uuid = node.child_str("uuid", node.child_str("tstamp"));
    if (const SExpr* at = node.find("at")) {
        fp.position = {at->num_at(1), at->num_at(2)};
        fp.rotation = at->num_at(3);
    }
    for (auto* prop : node.find_all("property"))
        fp.properties[prop->str_at(1)] = prop->str_at(2);
    fp.reference = footprint_reference(node);
    fp.value = footprint_field(node, "Value");
    for (auto* pad : node.find_all("pad"))
        fp.pads.push_back(read_pad(*pad, fp, board, warnings));
    return fp;
}

Board BoardDocument::read(std::vector<std::string>* warnings) const {
    std::vector<std::string> local;
    std::vector<std::string>& warn = warnings ? *warnings : local;

    Board board;
    board.version = root_.child_str("version");
    board.generator = root_.child_str("generator");
    if (const SExpr* general = root_.find("general"))
        board.thickness = general->child_num("thickness");
    if (const SExpr* layers = root_.find("layers")) {
        for (auto& l : layers->children())
            if (l.is_list() && l.size() > 1) board.layers.push_back(l.str_at(1));
    }
    if (const SExpr* tb = root_.find("title_block")) {
        for (auto& c : tb->children()) {
            if (!c.is_list()) continue;
            std::string key = c.tag();
            if (key == "comment") key += " " + c.str_at(1);
            board.title_block[key] = c.str_at(c.size() - 1);
        }
    }

    for (auto* net : root_.find_all("net"))
        board.nets.push_back({static_cast<int>(net->num_at(1)), net->str_at(2)});

    for (auto& c : root_.children()) {
        if (is_footprint(c)) {
            board.footprints.push_back(read_footprint(c, board, warn));
        } else if (c.is("segment") || c.is("arc")) {
            Track t;
            if (const SExpr* s = c.find("start")) t.start = {s->num_at(1), s->num_at(2)};
            if (const SExpr* e = c.find("end")) t.end = {e->num_at(1), e->num_at(2)};
            t.width = c.child_num("width");
            t.layer = c.child_str("layer");
            t.net_id = static_cast<int>(c.child_num("net"));
            t.uuid = c.child_str("uuid", c.child_str("tstamp"));
            board.tracks.push_back(t);
        } else if (c.is("via")) {
            Via v;
            if (const SExpr* at = c.find("at")) v.position = {at->num_at(1), at->num_at(2)};
            v.size = c.child_num("size");
            v.drill = c.child_num("drill");
            v.layers = atom_values(c.find("layers"));
            v.net_id = static_cast<int>(c.child_num("net"));
            v.uuid = c.child_str("uuid", c.child_str("tstamp"));
            board.vias.push_back(v);
        } else if (c.is("zone")) {
            Zone z;
            z.net_id = static_cast<int>(c.child_num("net"));
            z.net_name = c.child_str("net_name");
            if (const SExpr* layers = c.find("layers")) z.layers = atom_values(layers);
            else if (c.find("layer")) z.layers.push_back(c.child_str("layer"));
            z.uuid = c.child_str("uuid", c.child_str("tstamp"));
            board.zones.push_back(z);
        }
    }
    return board;
}

DesignRules BoardDocument::design_rules() const {
    DesignRules rules;
    const SExpr* setup = root_.find("setup");
    if (!setup) return rules;
    rules.present = true;
    for (auto& c : setup->children()) {
        // Nested lists (stackup, pcbplotparams) are not scalar rules
        if (!c.is_list() || c.size() < 2 || c[1].is_list()) continue;
        if (c.size() == 2 && c[1].is_number()) {
            rules.numeric[c.tag()] = c.num_at(1);
        } else {
            std::string text;
            for (size_t i = 1; i < c.size(); i++) {
                if (c[i].is_list()) break;
                if (!text.empty()) text += " ";
                text += c.str_at(i);
            }
            rules.text[c.tag()] = text;
        }
    }
    return rules;
}

void BoardDocument::validate() const {
    std::vector<std::string> warnings;
    Board board = read(&warnings);
    for (auto& fp : board.footprints) {
        for (auto& pad : fp.pads) {
            bool missing = pad.net_id != 0 ? board.find_net(pad.net_id) == nullptr
                                           : !pad.net_name.empty() && !board.find_net(pad.net_name);
            if (missing)
                throw StructuralInvariantViolation(
                    "pad " + fp.reference + "." + pad.number + " refers to a net missing from the net table",
                    {{"reference", fp.reference}, {"pad", pad.number},
                     {"net", pad.net_id ? std::to_string(pad.net_id) : pad.net_name}});
        }
    }
    for (auto& t : board.tracks)
        if (t.net_id != 0 && !board.find_net(t.net_id))
            throw StructuralInvariantViolation("track refers to net " + std::to_string(t.net_id) +
                                               " missing from the net table", {{"uuid", t.uuid}});
    for (auto& v : board.vias)
        if (v.net_id != 0 && !board.find_net(v.net_id))
            throw StructuralInvariantViolation("via refers to net " + std::to_string(v.net_id) +
                                               " missing from the net table", {{"uuid", v.uuid}});
}

// ── Nets ────────────────────────────────────────────────────────────

int BoardDocument::last_index_of(const std::vector<std::string>& tags) const {
    int last = -1;
    for (size_t i = 0; i < root_.size(); i++) {
        const SExpr& c = root_[i];
        if (!c.is_list()) continue;
        if (std::find(tags.begin(), tags.end(), c.tag()) != tags.end()) last = static_cast<int>(i);
    }
    return last;
}

int BoardDocument::resolve_net(const std::string& name) {
    if (name.empty()) return 0;
    int max_id = 0;
    for (auto* net : root_.find_all("net")) {
        if (net->str_at(2) == name) return static_cast<int>(net->num_at(1));
        max_id = std::max(max_id, static_cast<int>(net->num_at(1)));
    }
    int id = max_id + 1;

    int at = last_index_of({"net"});
    if (at < 0) at = last_index_of({"setup", "layers", "paper", "general"});
    size_t index = at < 0 ? root_.size() : static_cast<size_t>(at) + 1;
    root_.insert(index, parse_snippet("(net " + std::to_string(id) + " " + sq(name) + ")"));
    return id;
}

void BoardDocument::set_pad_net(SExpr& pad, int id, const std::string& name) {
    int idx = pad.index_of("net");
    if (id == 0) {
        if (idx >= 0) pad.remove(static_cast<size_t>(idx));
        return;
    }
    SExpr net = parse_snippet("(net " + std::to_string(id) + " " + sq(name) + ")");
    if (idx >= 0) {
        net.set_lead(pad[static_cast<size_t>(idx)].lead());
        pad[static_cast<size_t>(idx)] = net;
        return;
    }
    int before = pad.index_of("uuid");
    if (before < 0) before = pad.index_of("tstamp");
    pad.insert(before < 0 ? pad.size() : static_cast<size_t>(before), net);
}

// ── Footprints ──────────────────────────────────────────────────────

SExpr* BoardDocument::footprint_node(const std::string& reference) {
    for (size_t i = 0; i < root_.size(); i++)
        if (is_footprint(root_[i]) && footprint_reference(root_[i]) == reference) return &root_[i];
    return nullptr;
}

static void refresh_uuids(SExpr& node) {
    for (size_t i = 0; i < node.size(); i++) {
        SExpr& c = node[i];
        if (!c.is_list()) continue;
        if ((c.is("uuid") || c.is("tstamp")) && c.size() > 1)
            c.set_atom(1, SExpr::string(generate_uuid()));
        else
            refresh_uuids(c);
    }
}

static std::string flip_layer_name(const std::string& layer) {
    if (layer.compare(0, 2, "F.") == 0) return "B." + layer.substr(2);
    if (layer.compare(0, 2, "B.") == 0) return "F." + layer.substr(2);
    return layer;
}

// Mirror a footprint body to the back side: swap F.* and B.* layers and
// negate local y coordinates of pads and graphics
static void flip_to_back(SExpr& node, bool top) {
    for (size_t i = 0; i < node.size(); i++) {
        SExpr& c = node[i];
        if (!c.is_list()) continue;
        std::string tag = c.tag();
        if (tag == "layer" || tag == "layers") {
            for (size_t k = 1; k < c.size(); k++) {
                if (!c[k].is_atom()) continue;
                std::string v = c.str_at(k);
                std::string flipped = flip_layer_name(v);
                if (flipped != v) c.set_atom(k, SExpr::string(flipped));
            }
            continue;
        }
        if (!top && (tag == "at" || tag == "start" || tag == "end" || tag == "mid" ||
                     tag == "center" || tag == "xy")) {
            if (c.size() > 2) c.set_atom(2, SExpr::number(-c.num_at(2)));
            if (tag == "at" && c.size() > 3 && c[3].is_number())
                c.set_atom(3, SExpr::number(normalize_angle(-c.num_at(3))));
            continue;
        }
        // The footprint's own (at) is the board anchor and stays
        if (top && tag == "at") continue;
        flip_to_back(c, false);
    }
}

static SExpr property_node(const std::string& name, const std::string& value,
                           const Point& at, const std::string& layer, bool hidden) {
    std::ostringstream out;
    out << "(property " << sq(name) << " " << sq(value) << "\n"
        << "\t(at " << fmt(at.x) << " " << fmt(at.y) << " 0)\n"
        << "\t(layer " << sq(layer) << ")\n";
    if (hidden) out << "\t(hide yes)\n";
    out << "\t(uuid " << sq(generate_uuid()) << ")\n"
        << "\t" << FP_FONT << "\n"
        << ")";
    return parse_snippet(out.str());
}

static bool set_field(SExpr& node, const std::string& name, const std::string& value) {
    for (auto* prop : node.find_all("property")) {
        if (prop->str_at(1) != name) continue;
        if (prop->str_at(2) == value) return false;
        prop->set_atom(2, SExpr::string(value));
        return true;
    }
    std::string legacy = to_lower(name);
    if (legacy == "reference" || legacy == "value") {
        for (auto* text : node.find_all("fp_text")) {
            if (text->str_at(1) != legacy) continue;
            if (text->str_at(2) == value) return false;
            text->set_atom(2, SExpr::string(value));
            return true;
        }
    }
    return false;
}

static bool has_field(const SExpr& node, const std::string& name) {
    for (auto* prop : node.find_all("property"))
        if (prop->str_at(1) == name) return true;
    std::string legacy = to_lower(name);
    for (auto* text : node.find_all("fp_text"))
        if (text->str_at(1) == legacy) return true;
    return false;
}

std::string BoardDocument::place_footprint(const NewFootprint& fp, const SExpr* definition) {
    if (fp.reference.empty()) throw InvalidArgument("footprint reference must not be empty");
    if (fp.lib_id.empty()) throw InvalidArgument("footprint lib_id must not be empty");
    if (fp.layer != "F.Cu" && fp.layer != "B.Cu")
        throw InvalidArgument("footprint layer must be F.Cu or B.Cu", {{"layer", fp.layer}});
    if (footprint_node(fp.reference))
        throw StructuralInvariantViolation("reference " + fp.reference + " already on the board",
                                           {{"reference", fp.reference}});

    // Nets first: resolve_net may grow the root
    std::map<std::string, int> net_ids;
    for (auto& [pad, net] : fp.pad_nets) net_ids[pad] = resolve_net(net);

    std::string id = generate_uuid();
    bool back = fp.layer == "B.Cu";
    double rotation = normalize_angle(fp.rotation);
    std::string silk = back ? "B.SilkS" : "F.SilkS";
    std::string fab = back ? "B.Fab" : "F.Fab";

    SExpr node;
    if (definition) {
        node = *definition;
        node.set_lead("");
        if (node.is("module")) node.set_atom(0, SExpr::symbol("footprint"));
        node.set_atom(1, SExpr::string(fp.lib_id));
        for (const char* tag : {"version", "generator", "generator_version", "tedit",
                                "at", "uuid", "tstamp"}) {
            int idx;
            while ((idx = node.index_of(tag)) >= 0) node.remove(static_cast<size_t>(idx));
        }
        refresh_uuids(node);
        if (back) flip_to_back(node, true);
        node.set_child_atom("layer", SExpr::string(fp.layer));
        size_t after = static_cast<size_t>(node.index_of("layer")) + 1;
        node.insert(after, parse_snippet("(uuid " + sq(id) + ")"));
        node.insert(after + 1, parse_snippet(at_text(fp.position, rotation)));

        if (!set_field(node, "Reference", fp.reference) && !has_field(node, "Reference"))
            node.append(property_node("Reference", fp.reference, {0, -2}, silk, false));
        std::string value = fp.value.empty() ? split_lib_id(fp.lib_id).second : fp.value;
        if (!set_field(node, "Value", value) && !has_field(node, "Value"))
            node.append(property_node("Value", value, {0, 2}, fab, false));
        set_field(node, "Footprint", fp.lib_id);
    } else {
        node = parse_snippet("(footprint " + sq(fp.lib_id) + "\n"
                             "\t(layer " + sq(fp.layer) + ")\n"
                             "\t(uuid " + sq(id) + ")\n"
                             "\t" + at_text(fp.position, rotation) + "\n"
                             ")");
        std::string value = fp.value.empty() ? split_lib_id(fp.lib_id).second : fp.value;
        node.append(property_node("Reference", fp.reference, {0, -2}, silk, false));
        node.append(property_node("Value", value, {0, 2}, fab, false));
        node.append(property_node("Footprint", fp.lib_id, {0, 0}, fab, true));
    }

    std::set<std::string> seen;
    for (auto* pad : node.find_all("pad")) {
        if (rotation != 0.0) {
            if (SExpr* at = pad->find("at")) {
                double r = normalize_angle(at->num_at(3) + rotation);
                SExpr new_at = parse_snippet("(at " + fmt(at->num_at(1)) + " " + fmt(at->num_at(2)) +
                                             (r != 0.0 ? " " + fmt(r) : "") + ")");
                new_at.set_lead(at->lead());
                *at = new_at;
            }
        }
        std::string number = pad->str_at(1);
        auto it = net_ids.find(number);
        if (it != net_ids.end()) {
            set_pad_net(*pad, it->second, fp.pad_nets.at(number));
            seen.insert(number);
        }
        if (!pad->find("uuid") && !pad->find("tstamp"))
            pad->append(parse_snippet("(uuid " + sq(generate_uuid()) + ")"));
    }
    if (definition) {
        for (auto& [pad, net] : fp.pad_nets)
            if (!seen.count(pad))
                throw NotFoundError("pad", fp.reference + "." + pad,
                                    {{"reference", fp.reference}, {"pad", pad}, {"net", net}});
    }

    int at = last_index_of({"footprint", "module"});
    if (at < 0) at = last_index_of({"net"});
    size_t index = at < 0 ? root_.size() : static_cast<size_t>(at) + 1;
    root_.insert(index, std::move(node));
    return id;
}

void BoardDocument::move_footprint(const std::string& reference, const Point& to,
                                   std::optional<double> rotation) {
    SExpr* node = footprint_node(reference);
    if (!node) throw NotFoundError("footprint", reference);
    SExpr* at = node->find("at");
    if (!at) throw StructuralInvariantViolation("footprint " + reference + " has no position");

    double old_rot = normalize_angle(at->num_at(3));
    double new_rot = rotation ? normalize_angle(*rotation) : old_rot;

    SExpr new_at = parse_snippet(at_text(to, new_rot));
    new_at.set_lead(at->lead());
    *at = new_at;

    if (new_rot == old_rot) return;
    // Pad and text angles are absolute: carry the rotation change
    double delta = new_rot - old_rot;
    for (size_t i = 0; i < node->size(); i++) {
        SExpr& c = (*node)[i];
        if (!(c.is("pad") || c.is("property") || c.is("fp_text"))) continue;
        SExpr* cat = c.find("at");
        if (!cat) continue;
        if (c.is("pad") || cat->size() > 3) {
            double r = normalize_angle(cat->num_at(3) + delta);
            SExpr updated = parse_snippet("(at " + fmt(cat->num_at(1)) + " " + fmt(cat->num_at(2)) +
                                          (r != 0.0 || !c.is("pad") ? " " + fmt(r) : "") + ")");
            updated.set_lead(cat->lead());
            *cat = updated;
        }
    }
}

bool BoardDocument::set_footprint_property(const std::string& reference, const std::string& name,
                                           const std::string& value) {
    if (name.empty()) throw InvalidArgument("property name must not be empty");
    SExpr* node = footprint_node(reference);
    if (!node) throw NotFoundError("footprint", reference);
    if (name == "Reference" && value != reference && footprint_node(value))
        throw StructuralInvariantViolation("reference " + value + " already on the board",
                                           {{"reference", value}});
    if (has_field(*node, name)) return set_field(*node, name, value);

    std::string fab = node->child_str("layer") == "B.Cu" ? "B.Fab" : "F.Fab";
    int before = node->index_of("pad");
    SExpr prop = property_node(name, value, {0, 0}, fab, true);
    if (before < 0) node->append(std::move(prop));
    else node->insert(static_cast<size_t>(before), std::move(prop));
    return true;
}

void BoardDocument::remove_footprint(const std::string& reference) {
    for (size_t i = 0; i < root_.size(); i++) {
        if (is_footprint(root_[i]) && footprint_reference(root_[i]) == reference) {
            root_.remove(i);
            return;
        }
    }
    throw NotFoundError("footprint", reference);
}

// ── Routing ─────────────────────────────────────────────────────────

static void check_copper(const std::string& layer) {
    if (layer.size() < 4 || layer.compare(layer.size() - 3, 3, ".Cu") != 0)
        throw InvalidArgument("not a copper layer: " + layer, {{"layer", layer}});
}

static size_t routing_index(const BoardDocument& doc, int last_routing, int last_fp) {
    if (last_routing >= 0) return static_cast<size_t>(last_routing) + 1;
    if (last_fp >= 0) return static_cast<size_t>(last_fp) + 1;
    return doc.root().size();
}

std::string BoardDocument::add_track(const Point& start, const Point& end, double width,
                                     const std::string& layer, const std::string& net) {
    if (width <= 0.0) throw InvalidArgument("track width must be positive");
    check_copper(layer);
    if (snap_point(start) == snap_point(end)) throw InvalidArgument("track has zero length");

    int net_id = resolve_net(net);
    std::string id = generate_uuid();
    std::ostringstream out;
    out << "(segment (start " << fmt(start.x) << " " << fmt(start.y) << ")"
        << " (end " << fmt(end.x) << " " << fmt(end.y) << ")"
        << " (width " << fmt(width) << ")"
        << " (layer " << sq(layer) << ")"
        << " (net " << net_id << ")"
        << " (uuid " << sq(id) << "))";
    size_t index = routing_index(*this, last_index_of({"segment", "arc", "via"}),
                                 last_index_of({"footprint", "module"}));
    root_.insert(index, parse_snippet(out.str()));
    return id;
}

std::string BoardDocument::add_via(const Point& at, double size, double drill,
                                   const std::string& net, const std::string& from_layer,
                                   const std::string& to_layer) {
    if (drill <= 0.0 || size <= drill)
        throw InvalidArgument("via size must exceed a positive drill",
                              {{"size", fmt(size)}, {"drill", fmt(drill)}});
    check_copper(from_layer);
    check_copper(to_layer);

    int net_id = resolve_net(net);
    std::string id = generate_uuid();
    std::ostringstream out;
    out << "(via (at " << fmt(at.x) << " " << fmt(at.y) << ")"
        << " (size " << fmt(size) << ")"
        << " (drill " << fmt(drill) << ")"
        << " (layers " << sq(from_layer) << " " << sq(to_layer) << ")"
        << " (net " << net_id << ")"
        << " (uuid " << sq(id) << "))";
    size_t index = routing_index(*this, last_index_of({"segment", "arc", "via"}),
                                 last_index_of({"footprint", "module"}));
    root_.insert(index, parse_snippet(out.str()));
    return id;
}

int BoardDocument::assign_net(const std::string& reference, const std::string& pad,
                              const std::string& net) {
    if (!footprint_node(reference)) throw NotFoundError("footprint", reference);
    int id = resolve_net(net);
    SExpr* node = footprint_node(reference);

    int count = 0;
    for (auto* p : node->find_all("pad")) {
        if (p->str_at(1) != pad) continue;
        set_pad_net(*p, id, net);
        count++;
    }
    if (count == 0)
        throw NotFoundError("pad", reference + "." + pad, {{"reference", reference}, {"pad", pad}});
    return count;
}

void BoardDocument::save() {
    if (snapshot_.path.empty()) throw InvalidArgument("document has no file path");
    validate();
    std::string content = text();
    commit_file(snapshot_, content);
    snapshot_.content = std::move(content);
}

} // namespace kicadfile
