#include "file_backend.h"
#include "board.h"
#include "connectivity.h"
#include "erc.h"
#include "errors.h"
#include "hierarchy.h"
#include "netlist_writer.h"
#include "payload.h"
#include "pin_locator.h"
#include "project.h"
#include "schematic.h"
#include "sync.h"
#include "utils.h"

#include <iostream>
#include <optional>
#include <set>

namespace kicadfile {

FileBackend::FileBackend(const Config& cfg) : cfg_(cfg) {}

void FileBackend::log(const std::string& msg) const {
    if (cfg_.verbose) std::cerr << "[backend] " << msg << "\n";
}

LibraryResolver FileBackend::resolver_for(const std::string& document_path) const {
    return LibraryResolver(cfg_.library_options(parent_dir(document_path)));
}

static void add_warnings(json& out, const std::vector<std::string>& warnings) {
    if (warnings.empty()) return;
    json& list = out["warnings"];
    for (auto& w : warnings) list.push_back(w);
}

// Overwrites an existing output file atomically, or creates it
static void write_output(const std::string& path, const std::string& content) {
    if (file_exists(path)) commit_file(read_snapshot(path), content);
    else create_file(path, content);
}

static void check_net(const std::string& net) {
    if (!net.empty()) validate_net_name(net);
}

// ── Schematic: documents ────────────────────────────────────────────

json FileBackend::read_schematic(const std::string& path) {
    SchematicDocument doc = SchematicDocument::load(path);
    std::vector<std::string> warnings;
    json out = doc.read(&warnings);
    out["path"] = path;
    add_warnings(out, warnings);
    return out;
}

json FileBackend::create_schematic(const std::string& path, const std::string& title,
                                   const std::string& revision, const std::string& paper) {
    SchematicSkeleton opts;
    opts.title = title;
    opts.revision = revision;
    if (!paper.empty()) opts.paper = paper;
    opts.generator = cfg_.generator;
    opts.generator_version = cfg_.generator_version;
    SchematicDocument::create(path, opts);
    log("Created " + path);
    return json{{"path", path}, {"uuid", SchematicDocument::load(path).uuid()}};
}

// ── Schematic: symbols ──────────────────────────────────────────────

json FileBackend::add_component(const std::string& path, const ComponentSpec& spec) {
    if (spec.reference.empty() || spec.reference[0] != '#') validate_reference(spec.reference);

    SchematicDocument doc = SchematicDocument::load(path);
    LibraryResolver resolver = resolver_for(path);
    bool cached = resolver.populate_cache(doc, spec.lib_id);

    const SExpr* entry = doc.cached_symbol(spec.lib_id);
    if (!entry) throw NotFoundError("symbol", spec.lib_id);
    LibSymbolDef def = read_lib_symbol(*entry);
    if (spec.unit > def.unit_count)
        throw InvalidArgument(spec.lib_id + " has " + std::to_string(def.unit_count) + " units",
                              {{"unit", std::to_string(spec.unit)}});

    NewSymbol ns;
    ns.lib_id = spec.lib_id;
    ns.reference = spec.reference;
    ns.value = spec.value.empty() ? split_lib_id(spec.lib_id).second : spec.value;
    ns.footprint = spec.footprint;
    if (ns.footprint.empty() && def.properties.count("Footprint"))
        ns.footprint = def.properties["Footprint"];
    ns.position = spec.position;
    ns.rotation = quantize_rotation(spec.rotation, cfg_.verbose);
    ns.mirror = spec.mirror;
    ns.unit = spec.unit;
    for (auto& [name, value] : spec.properties) ns.properties.emplace_back(name, value);

    PinLocator locator(doc, resolver);
    std::set<std::string> seen;
    for (auto& pin : locator.library_pins(spec.lib_id)) {
        if ((pin.unit != 0 && pin.unit != spec.unit) || pin.style > 1) continue;
        if (seen.insert(pin.number).second) ns.pin_numbers.push_back(pin.number);
    }

    std::string id = doc.add_symbol(ns);
    doc.save();
    log("Added " + spec.reference + " (" + spec.lib_id + ")");

    json out = {
        {"reference", spec.reference},
        {"lib_id", spec.lib_id},
        {"value", ns.value},
        {"footprint", ns.footprint},
        {"unit", spec.unit},
        {"position", spec.position},
        {"uuid", id},
        {"library_cached", cached},
    };
    add_warnings(out, resolver.warnings());
    return out;
}

json FileBackend::remove_component(const std::string& path, const std::string& reference,
                                   int unit) {
    SchematicDocument doc = SchematicDocument::load(path);
    int removed = doc.remove_symbol(reference, unit);
    doc.save();
    return json{{"reference", reference}, {"removed_units", removed}};
}

json FileBackend::move_component(const std::string& path, const std::string& reference,
                                 const Point& to, std::optional<int> rotation,
                                 std::optional<Mirror> mirror, int unit) {
    SchematicDocument doc = SchematicDocument::load(path);
    if (rotation) rotation = quantize_rotation(*rotation, cfg_.verbose);
    doc.move_symbol(reference, to, rotation, mirror, unit);
    doc.save();

    json out = {{"reference", reference}, {"position", to}};
    Schematic sch = doc.read();
    if (const SymbolInstance* sym = sch.find_symbol(reference, unit)) {
        out["rotation"] = sym->rotation;
        out["mirror"] = mirror_name(sym->mirror);
    }
    return out;
}

json FileBackend::update_component_property(const std::string& path, const std::string& reference,
                                            const std::string& name, const std::string& value) {
    SchematicDocument doc = SchematicDocument::load(path);
    bool changed = doc.update_property(reference, name, value);
    if (changed) doc.save();
    return json{{"reference", reference}, {"property", name}, {"value", value}, {"changed", changed}};
}

json FileBackend::add_power_symbol(const std::string& path, const std::string& name,
                                   const Point& at, int rotation) {
    if (name.empty()) throw InvalidArgument("power symbol name must not be empty");
    std::string lib_id = "power:" + name;

    SchematicDocument doc = SchematicDocument::load(path);
    LibraryResolver resolver = resolver_for(path);
    resolver.populate_cache(doc, lib_id);

    NewSymbol ns;
    ns.lib_id = lib_id;
    ns.reference = doc.next_power_reference();
    ns.value = name;
    ns.position = at;
    ns.rotation = quantize_rotation(rotation, cfg_.verbose);
    PinLocator locator(doc, resolver);
    for (auto& pin : locator.library_pins(lib_id))
        if (pin.style <= 1) ns.pin_numbers.push_back(pin.number);

    std::string id = doc.add_symbol(ns);
    doc.save();
    return json{{"name", name}, {"lib_id", lib_id}, {"reference", ns.reference},
                {"position", at}, {"uuid", id}};
}

// ── Schematic: wiring ───────────────────────────────────────────────

json FileBackend::add_wire(const std::string& path, const Point& start, const Point& end) {
    SchematicDocument doc = SchematicDocument::load(path);
    std::string id = doc.add_wire(start, end);
    doc.save();
    return json{{"start", start}, {"end", end}, {"uuid", id}};
}

json FileBackend::remove_wire(const std::string& path, const Point& start, const Point& end) {
    SchematicDocument doc = SchematicDocument::load(path);
    doc.remove_wire(start, end);
    doc.save();
    return json{{"start", start}, {"end", end}, {"removed", true}};
}

json FileBackend::add_label(const std::string& path, const std::string& text, const Point& at,
                            LabelKind kind, int rotation, const std::string& shape) {
    validate_net_name(text);
    SchematicDocument doc = SchematicDocument::load(path);
    std::string id = doc.add_label(text, at, kind, quantize_rotation(rotation, cfg_.verbose), shape);
    doc.save();
    return json{{"text", text}, {"type", label_tag(kind)}, {"position", at}, {"uuid", id}};
}

json FileBackend::add_junction(const std::string& path, const Point& at) {
    SchematicDocument doc = SchematicDocument::load(path);
    std::string id = doc.add_junction(at);
    doc.save();
    return json{{"position", at}, {"uuid", id}};
}

json FileBackend::add_no_connect(const std::string& path, const Point& at) {
    SchematicDocument doc = SchematicDocument::load(path);
    std::string id = doc.add_no_connect(at);
    doc.save();
    return json{{"position", at}, {"uuid", id}};
}

json FileBackend::remove_no_connect(const std::string& path, const Point& at) {
    SchematicDocument doc = SchematicDocument::load(path);
    doc.remove_no_connect(at);
    doc.save();
    return json{{"position", at}, {"removed", true}};
}

// ── Schematic: queries ──────────────────────────────────────────────

json FileBackend::get_symbol_pin_positions(const std::string& path, const std::string& reference,
                                           int unit) {
    SchematicDocument doc = SchematicDocument::load(path);
    Schematic sch = doc.read();
    LibraryResolver resolver = resolver_for(path);
    PinLocator locator(doc, resolver);

    json pins = json::array();
    bool found = false;
    for (auto& sym : sch.symbols) {
        if (sym.reference != reference || (unit > 0 && sym.unit != unit)) continue;
        found = true;
        for (auto& p : locator.pins_of(sym)) pins.push_back(p);
    }
    if (!found) throw NotFoundError("symbol", reference);

    json out = {{"reference", reference}, {"pins", pins}};
    add_warnings(out, resolver.warnings());
    return out;
}

json FileBackend::get_pin_net(const std::string& path, const std::string& reference,
                              const std::string& pin) {
    SchematicDocument doc = SchematicDocument::load(path);
    Schematic sch = doc.read();
    LibraryResolver resolver = resolver_for(path);
    PinLocator locator(doc, resolver);
    ConnectivityGraph graph(sch, locator);

    auto net = graph.net_of(reference, pin);
    json out = {{"reference", reference}, {"pin", pin}, {"connected", net.has_value()}};
    out["net"] = net ? json(*net) : json(nullptr);
    return out;
}

json FileBackend::get_net_connections(const std::string& path, const std::string& net) {
    SchematicDocument doc = SchematicDocument::load(path);
    Schematic sch = doc.read();
    LibraryResolver resolver = resolver_for(path);
    PinLocator locator(doc, resolver);
    ConnectivityGraph graph(sch, locator);

    json out = graph.members_of(net);
    add_warnings(out, graph.warnings());
    return out;
}

json FileBackend::list_nets(const std::string& path) {
    SchematicDocument doc = SchematicDocument::load(path);
    Schematic sch = doc.read();
    LibraryResolver resolver = resolver_for(path);
    PinLocator locator(doc, resolver);
    ConnectivityGraph graph(sch, locator);

    json nets = json::array();
    for (auto& net : graph.nets())
        nets.push_back(json{{"name", net.name}, {"explicit", net.explicit_name},
                            {"pin_count", net.pins.size()}});
    json out = {{"nets", nets}};
    add_warnings(out, graph.warnings());
    return out;
}

json FileBackend::resolve_library_symbol(const std::string& path, const std::string& lib_id) {
    SchematicDocument doc = SchematicDocument::load(path);
    LibraryResolver resolver = resolver_for(path);
    bool added = resolver.populate_cache(doc, lib_id);
    if (added) doc.save();

    LibSymbolDef def = read_lib_symbol(*doc.cached_symbol(lib_id));
    PinLocator locator(doc, resolver);
    json out = {
        {"lib_id", lib_id},
        {"cached_now", added},
        {"extends", def.extends},
        {"is_power", def.power},
        {"unit_count", def.unit_count},
        {"pins", locator.library_pins(lib_id)},
    };
    add_warnings(out, resolver.warnings());
    return out;
}

json FileBackend::get_sheet_hierarchy(const std::string& path) {
    return read_sheet_hierarchy(path);
}

json FileBackend::validate_schematic(const std::string& path) {
    SchematicDocument doc = SchematicDocument::load(path);
    std::vector<std::string> warnings;
    Schematic sch = doc.read(&warnings);
    LibraryResolver resolver = resolver_for(path);
    PinLocator locator(doc, resolver);
    ConnectivityGraph graph(sch, locator);

    json out = check_schematic(doc, graph);
    out["path"] = path;
    warnings.insert(warnings.end(), graph.warnings().begin(), graph.warnings().end());
    add_warnings(out, warnings);
    return out;
}

json FileBackend::generate_netlist(const std::string& path, const std::string& output) {
    if (output.empty()) throw InvalidArgument("output path is required");
    SchematicDocument doc = SchematicDocument::load(path);
    Schematic sch = doc.read();
    LibraryResolver resolver = resolver_for(path);
    PinLocator locator(doc, resolver);
    ConnectivityGraph graph(sch, locator);

    NetlistOptions opts;
    opts.tool = cfg_.generator;
    opts.verbose = cfg_.verbose;
    NetlistWriter writer(opts);
    write_output(output, writer.write(doc, locator, graph));

    json out = {{"schematic", path}, {"output", output}};
    add_warnings(out, writer.warnings());
    return out;
}

// ── Schematic and board ─────────────────────────────────────────────

json FileBackend::compare_schematic_board(const std::string& schematic, const std::string& board) {
    Schematic sch = SchematicDocument::load(schematic).read();
    Board pcb = BoardDocument::load(board).read();
    json out = compare(sch, pcb);
    out["schematic"] = schematic;
    out["board"] = board;
    return out;
}

json FileBackend::sync_schematic_to_board(const std::string& schematic, const std::string& board) {
    SchematicDocument doc = SchematicDocument::load(schematic);
    Schematic sch = doc.read();
    BoardDocument pcb = BoardDocument::load(board);

    LibraryResolver resolver = resolver_for(schematic);
    PinLocator locator(doc, resolver);
    ConnectivityGraph graph(sch, locator);

    SyncOptions opts;
    opts.verbose = cfg_.verbose;
    BoardSync syncer(resolver, opts);
    SyncResult result = syncer.sync(sch, pcb, &graph);
    if (!result.placed.empty() || !result.values_updated.empty()) pcb.save();

    json out = result;
    out["schematic"] = schematic;
    out["board"] = board;
    out["after"] = compare(sch, pcb.read());
    return out;
}

// ── Board ───────────────────────────────────────────────────────────

json FileBackend::read_board(const std::string& path) {
    BoardDocument doc = BoardDocument::load(path);
    std::vector<std::string> warnings;
    json out = doc.read(&warnings);
    out["path"] = path;
    add_warnings(out, warnings);
    return out;
}

json FileBackend::place_footprint(const std::string& path, const FootprintSpec& spec) {
    validate_reference(spec.reference);
    for (auto& [pad, net] : spec.pad_nets) check_net(net);

    BoardDocument doc = BoardDocument::load(path);
    LibraryResolver resolver = resolver_for(path);

    NewFootprint fp;
    fp.lib_id = spec.lib_id;
    fp.reference = spec.reference;
    fp.value = spec.value;
    fp.position = spec.position;
    fp.rotation = spec.rotation;
    fp.layer = spec.layer;
    fp.pad_nets = spec.pad_nets;

    std::vector<std::string> warnings;
    std::optional<ResolvedFootprint> def;
    try {
        def = resolver.resolve_footprint(spec.lib_id);
    } catch (const NotFoundError& e) {
        warnings.push_back(std::string(e.what()) + "; placed without pads");
        if (!fp.pad_nets.empty()) warnings.push_back("pad nets ignored: footprint has no pads");
        fp.pad_nets.clear();
    }
    std::string id = def ? doc.place_footprint(fp, &def->node) : doc.place_footprint(fp);
    doc.save();

    json out = {{"reference", spec.reference}, {"footprint", spec.lib_id}, {"layer", spec.layer},
                {"position", spec.position}, {"uuid", id}};
    Board pcb = doc.read();
    if (const Footprint* placed = pcb.find_footprint(spec.reference))
        out["pad_count"] = placed->pads.size();
    add_warnings(out, warnings);
    return out;
}

json FileBackend::move_footprint(const std::string& path, const std::string& reference,
                                 const Point& to, std::optional<double> rotation) {
    BoardDocument doc = BoardDocument::load(path);
    doc.move_footprint(reference, to, rotation);
    doc.save();
    json out = {{"reference", reference}, {"position", to}};
    Board pcb = doc.read();
    if (const Footprint* fp = pcb.find_footprint(reference)) out["rotation"] = fp->rotation;
    return out;
}

json FileBackend::remove_footprint(const std::string& path, const std::string& reference) {
    BoardDocument doc = BoardDocument::load(path);
    doc.remove_footprint(reference);
    doc.save();
    return json{{"reference", reference}, {"removed", true}};
}

json FileBackend::add_track(const std::string& path, const Point& start, const Point& end,
                            double width, const std::string& layer, const std::string& net) {
    validate_positive(width, "width");
    validate_layer(layer);
    check_net(net);
    BoardDocument doc = BoardDocument::load(path);
    std::string id = doc.add_track(start, end, width, layer, net);
    doc.save();
    return json{{"start", start}, {"end", end}, {"width", width}, {"layer", layer},
                {"net", net}, {"uuid", id}};
}

json FileBackend::add_via(const std::string& path, const Point& at, double size, double drill,
                          const std::string& net) {
    validate_positive(size, "size");
    validate_positive(drill, "drill");
    check_net(net);
    BoardDocument doc = BoardDocument::load(path);
    std::string id = doc.add_via(at, size, drill, net);
    doc.save();
    return json{{"position", at}, {"size", size}, {"drill", drill}, {"net", net}, {"uuid", id}};
}

json FileBackend::assign_net(const std::string& path, const std::string& reference,
                             const std::string& pad, const std::string& net) {
    check_net(net);
    BoardDocument doc = BoardDocument::load(path);
    int count = doc.assign_net(reference, pad, net);
    doc.save();
    Board pcb = doc.read();
    const BoardNet* n = pcb.find_net(net);
    return json{{"reference", reference}, {"pad", pad}, {"net", net},
                {"net_number", n ? n->id : 0}, {"pads_updated", count}};
}

json FileBackend::get_design_rules(const std::string& path) {
    BoardDocument doc = BoardDocument::load(path);
    DesignRules rules = doc.design_rules();
    json out = {{"path", path}, {"rules", rules}};
    if (!rules.present) add_warnings(out, {"board has no setup section"});
    return out;
}

// ── Library ─────────────────────────────────────────────────────────

json FileBackend::search_symbols(const std::string& query, const std::string& project_dir) {
    LibraryResolver resolver(cfg_.library_options(project_dir));
    json out = {{"query", query}, {"results", resolver.search_symbols(query)}};
    add_warnings(out, resolver.warnings());
    return out;
}

json FileBackend::search_footprints(const std::string& query, const std::string& project_dir) {
    LibraryResolver resolver(cfg_.library_options(project_dir));
    json out = {{"query", query}, {"results", resolver.search_footprints(query)}};
    add_warnings(out, resolver.warnings());
    return out;
}

json FileBackend::list_libraries(const std::string& project_dir) {
    LibraryResolver resolver(cfg_.library_options(project_dir));
    return json{{"symbol_libraries", resolver.symbol_libraries()},
                {"footprint_libraries", resolver.footprint_libraries()}};
}

json FileBackend::get_symbol_info(const std::string& lib_id, const std::string& project_dir) {
    LibraryResolver resolver(cfg_.library_options(project_dir));
    json out = resolver.symbol_info(lib_id);
    add_warnings(out, resolver.warnings());
    return out;
}

json FileBackend::get_footprint_info(const std::string& lib_id, const std::string& project_dir) {
    LibraryResolver resolver(cfg_.library_options(project_dir));
    return resolver.footprint_info(lib_id);
}

json FileBackend::suggest_footprints(const std::string& lib_id, const std::string& project_dir) {
    LibraryResolver resolver(cfg_.library_options(project_dir));
    auto suggestions = resolver.suggest_footprints(lib_id);
    json out = {{"lib_id", lib_id}, {"count", suggestions.size()}, {"footprints", suggestions}};
    add_warnings(out, resolver.warnings());
    return out;
}

json FileBackend::create_project_library(const std::string& project_dir, const std::string& name) {
    kicadfile::create_project_library(project_dir, name);
    return json{{"name", name},
                {"symbol_library", join_path(project_dir, name + ".kicad_sym")},
                {"footprint_library", join_path(project_dir, name + ".pretty")}};
}

json FileBackend::register_project_library(const std::string& project_dir, const std::string& name,
                                           const std::string& kind) {
    bool added = kicadfile::register_project_library(project_dir, name, kind);
    return json{{"name", name}, {"kind", kind}, {"registered", added}};
}

json FileBackend::import_symbol(const std::string& lib_id, const std::string& dest_library,
                                const std::string& project_dir) {
    LibraryResolver resolver(cfg_.library_options(project_dir));
    bool imported = resolver.import_symbol(lib_id, dest_library);
    return json{{"lib_id", lib_id}, {"destination", dest_library}, {"imported", imported}};
}

json FileBackend::import_footprint(const std::string& lib_id, const std::string& dest_library,
                                   const std::string& project_dir) {
    LibraryResolver resolver(cfg_.library_options(project_dir));
    bool imported = resolver.import_footprint(lib_id, dest_library);
    return json{{"lib_id", lib_id},
                {"destination", dest_library},
                {"copied_file", join_path(dest_library, split_lib_id(lib_id).second + ".kicad_mod")},
                {"imported", imported}};
}

// ── Project ─────────────────────────────────────────────────────────

static json path_or_null(const std::string& path) {
    return path.empty() ? json(nullptr) : json(path);
}

json FileBackend::open_project(const std::string& path) {
    ProjectFiles files = resolve_project_files(path);
    json out = {{"name", files.name},
                {"directory", files.directory},
                {"project_file", path_or_null(files.project)},
                {"board_file", path_or_null(files.board)},
                {"schematic_file", path_or_null(files.schematic)},
                {"has_board", !files.board.empty()},
                {"has_schematic", !files.schematic.empty()}};
    if (!files.project.empty()) {
        // An unreadable project file still leaves the documents usable
        try {
            json pro = read_project_file(files.project);
            out["kicad_version"] = nullptr;
            if (pro.contains("meta") && pro["meta"].is_object())
                out["kicad_version"] = pro["meta"].value("version", json(nullptr));
        } catch (const Error& e) {
            add_warnings(out, {e.what()});
        }
    }
    log("Opened project " + files.name + " in " + files.directory);
    return out;
}

json FileBackend::list_project_files(const std::string& path) {
    std::string dir = is_directory(path) ? path : parent_dir(path);
    return json{{"directory", dir}, {"files", kicadfile::list_project_files(dir)}};
}

json FileBackend::get_project_metadata(const std::string& path) {
    if (path.size() < 11 || path.compare(path.size() - 11, 11, ".kicad_pro") != 0)
        throw InvalidArgument("expected a .kicad_pro file", {{"path", path}});
    json pro = read_project_file(path);
    return json{{"name", file_stem(path)},
                {"path", path},
                {"meta", pro.value("meta", json::object())},
                {"board", pro.value("board", json::object())},
                {"libraries", pro.value("libraries", json::object())},
                {"schematic", pro.value("schematic", json::object())},
                {"text_variables", pro.value("text_variables", json::object())}};
}

} // namespace kicadfile
