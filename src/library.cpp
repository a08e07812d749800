#include "library.h"
#include "errors.h"
#include "utils.h"

#include <iostream>
#include <set>
#include <sstream>

#include <sys/stat.h>

namespace kicadfile {

LibraryResolver::LibraryResolver(const LibraryOptions& opts)
    : opts_(opts)
{}

// ── Library tables ──────────────────────────────────────────────────

std::string LibraryResolver::expand_vars(const std::string& uri) const {
    std::string out;
    size_t i = 0;
    while (i < uri.size()) {
        if (uri.compare(i, 2, "${") == 0) {
            auto close = uri.find('}', i + 2);
            if (close != std::string::npos) {
                std::string var = uri.substr(i + 2, close - i - 2);
                std::string val;
                if (var == "KIPRJMOD" || var == "PROJ_DIR") val = opts_.project_dir;
                else val = env_or_empty(var.c_str());
                if (!val.empty() || var == "KIPRJMOD" || var == "PROJ_DIR") {
                    out += val;
                    i = close + 1;
                    continue;
                }
            }
        }
        out += uri[i++];
    }
    return out;
}

std::vector<LibraryEntry> LibraryResolver::read_lib_table(const std::string& file,
                                                          const char* root_tag) const {
    std::vector<LibraryEntry> out;
    if (!file_exists(file)) return out;
    SExpr root;
    try {
        root = parse_sexpr(read_file(file));
    } catch (const Error& e) {
        std::cerr << "[library] Warning: cannot read " << file << ": " << e.what() << "\n";
        return out;
    }
    if (!root.is(root_tag)) return out;
    for (auto* lib : root.find_all("lib")) {
        if (lib->find("disabled")) continue;
        LibraryEntry e;
        e.nickname = lib->child_str("name");
        e.path = expand_vars(lib->child_str("uri"));
        e.project = true;
        if (!e.nickname.empty() && !e.path.empty()) out.push_back(std::move(e));
    }
    return out;
}

std::vector<LibraryEntry> LibraryResolver::symbol_libraries() const {
    std::vector<LibraryEntry> out;
    if (!opts_.project_dir.empty())
        out = read_lib_table(join_path(opts_.project_dir, "sym-lib-table"), "sym_lib_table");
    for (auto& dir : opts_.symbol_dirs) {
        for (auto& path : list_dir(dir, ".kicad_sym")) {
            if (!file_exists(path)) continue;
            out.push_back({file_stem(path), path, false});
        }
    }
    return out;
}

std::vector<LibraryEntry> LibraryResolver::footprint_libraries() const {
    std::vector<LibraryEntry> out;
    if (!opts_.project_dir.empty())
        out = read_lib_table(join_path(opts_.project_dir, "fp-lib-table"), "fp_lib_table");
    for (auto& dir : opts_.footprint_dirs) {
        for (auto& path : list_dir(dir, ".pretty")) {
            if (!is_directory(path)) continue;
            out.push_back({file_stem(path), path, false});
        }
    }
    return out;
}

std::optional<std::string> LibraryResolver::find_symbol_library(const std::string& nickname) const {
    for (auto& lib : symbol_libraries())
        if (lib.nickname == nickname && file_exists(lib.path)) return lib.path;
    return std::nullopt;
}

std::optional<std::string> LibraryResolver::find_footprint_library(const std::string& nickname) const {
    for (auto& lib : footprint_libraries())
        if (lib.nickname == nickname && is_directory(lib.path)) return lib.path;
    return std::nullopt;
}

// ── Symbol lookup ───────────────────────────────────────────────────

const SExpr& LibraryResolver::load_library(const std::string& path) {
    auto it = lib_file_cache_.find(path);
    if (it != lib_file_cache_.end()) return it->second;

    SExpr root = parse_sexpr(read_file(path));
    if (!root.is("kicad_symbol_lib"))
        throw StructuralInvariantViolation("not a symbol library: " + path, {{"path", path}});
    log("Loaded symbol library " + path);
    return lib_file_cache_.emplace(path, std::move(root)).first->second;
}

const SExpr& LibraryResolver::find_symbol_node(const std::string& nickname,
                                               const std::string& name) {
    auto path = find_symbol_library(nickname);
    if (!path) throw NotFoundError("symbol library", nickname);
    const SExpr& root = load_library(*path);
    for (auto* sym : root.find_all("symbol"))
        if (sym->str_at(1) == name) return *sym;
    throw NotFoundError("symbol", nickname + ":" + name, {{"library", *path}});
}

ResolvedSymbol LibraryResolver::resolve(const std::string& lib_id) {
    auto [nickname, name] = split_lib_id(lib_id);
    if (nickname.empty() || name.empty())
        throw InvalidArgument("library id must look like Library:Symbol", {{"id", lib_id}});

    ResolvedSymbol r;
    r.lib_id = lib_id;
    r.node = find_symbol_node(nickname, name);
    r.library_path = *find_symbol_library(nickname);
    r.def = read_lib_symbol(r.node);
    return r;
}

static bool has_body(const SExpr& node) {
    return node.find("symbol") != nullptr || node.find("pin") != nullptr;
}

std::vector<LibPin> LibraryResolver::resolve_pins(const SExpr& definition,
                                                  const std::string& lib_id) {
    LibSymbolDef def = read_lib_symbol(definition);
    if (!def.pins.empty() || def.extends.empty()) return def.pins;

    std::string nickname = split_lib_id(lib_id).first;
    std::string start = split_lib_id(def.name).second;
    std::set<std::string> visited{start};
    std::string chain = start;
    std::string current = def.extends;

    for (int depth = 1;; depth++) {
        chain += " -> " + current;
        if (depth > MAX_EXTENDS_DEPTH || visited.count(current))
            throw InheritanceDepthExceeded(lib_id, chain);
        visited.insert(current);

        const SExpr& parent = find_symbol_node(nickname, current);
        LibSymbolDef pdef = read_lib_symbol(parent);
        if (!pdef.pins.empty()) {
            log("Resolved pins of " + lib_id + " via " + chain);
            return pdef.pins;
        }
        if (pdef.extends.empty()) {
            if (!has_body(parent)) throw GeometryUnresolvedError(lib_id, current);
            return pdef.pins;
        }
        current = pdef.extends;
    }
}

SExpr LibraryResolver::flattened(const std::string& lib_id) {
    ResolvedSymbol r = resolve(lib_id);
    if (r.def.extends.empty()) return r.node;

    auto [nickname, name] = split_lib_id(lib_id);
    std::set<std::string> visited{name};
    std::string chain = name;
    std::string current = r.def.extends;
    // Links from the nearest parent up to the root ancestor
    std::vector<const SExpr*> links;
    for (int depth = 1;; depth++) {
        chain += " -> " + current;
        if (depth > MAX_EXTENDS_DEPTH || visited.count(current))
            throw InheritanceDepthExceeded(lib_id, chain);
        visited.insert(current);
        const SExpr& node = find_symbol_node(nickname, current);
        links.push_back(&node);
        if (!node.find("extends")) {
            if (!has_body(node)) throw GeometryUnresolvedError(lib_id, current);
            break;
        }
        current = node.child_str("extends");
    }

    SExpr out = r.node;
    out.remove(static_cast<size_t>(out.index_of("extends")));

    // Nearest link wins for every property and attribute
    const SExpr* root = links.back();
    for (const SExpr* link : links) {
        for (auto& child : link->children()) {
            if (!child.is_list()) continue;
            const std::string tag = child.tag();
            if (tag == "symbol" || tag == "extends") continue;
            if (tag == "property") {
                bool present = false;
                for (auto* p : out.find_all("property"))
                    if (p->str_at(1) == child.str_at(1)) present = true;
                if (!present) out.append(child);
            } else if (!out.find(tag)) {
                out.append(child);
            }
        }
    }

    // Units come from the root, renamed after the derived symbol
    std::string base = root->str_at(1);
    for (auto* unit : root->find_all("symbol")) {
        SExpr sub = *unit;
        std::string sub_name = sub.str_at(1);
        if (sub_name.compare(0, base.size(), base) == 0)
            sub.set_atom(1, SExpr::string(name + sub_name.substr(base.size())));
        out.append(std::move(sub));
    }
    if (links.size() > 1) log("Flattened " + lib_id + " through " + chain);
    return out;
}

bool LibraryResolver::populate_cache(SchematicDocument& doc, const std::string& lib_id) {
    if (doc.cached_symbol(lib_id)) return false;
    SExpr def = flattened(lib_id);
    bool added = doc.cache_symbol(lib_id, def);
    if (added) log("Cached " + lib_id);
    return added;
}

// ── Footprints ──────────────────────────────────────────────────────

ResolvedFootprint LibraryResolver::resolve_footprint(const std::string& lib_id) {
    auto [nickname, name] = split_lib_id(lib_id);
    if (nickname.empty() || name.empty())
        throw InvalidArgument("footprint id must look like Library:Footprint", {{"id", lib_id}});
    auto dir = find_footprint_library(nickname);
    if (!dir) throw NotFoundError("footprint library", nickname);

    std::string path = join_path(*dir, name + ".kicad_mod");
    if (!file_exists(path)) throw NotFoundError("footprint", lib_id, {{"library", *dir}});

    ResolvedFootprint fp;
    fp.lib_id = lib_id;
    fp.path = path;
    fp.node = parse_sexpr(read_file(path));
    if (!fp.node.is("footprint") && !fp.node.is("module"))
        throw StructuralInvariantViolation("not a footprint: " + path, {{"path", path}});
    return fp;
}

std::vector<std::string> LibraryResolver::footprint_names(const LibraryEntry& lib) const {
    std::vector<std::string> names;
    for (auto& path : list_dir(lib.path, ".kicad_mod"))
        names.push_back(file_stem(path));
    return names;
}

FootprintInfo LibraryResolver::footprint_info(const std::string& lib_id) {
    ResolvedFootprint fp = resolve_footprint(lib_id);
    FootprintInfo info;
    info.lib_id = lib_id;
    info.description = fp.node.child_str("descr");
    info.tags = fp.node.child_str("tags");
    if (auto* attr = fp.node.find("attr"))
        for (auto& c : attr->children())
            if (c.is_atom() && c.value() == "smd") info.smd = true;

    for (auto* pad : fp.node.find_all("pad")) {
        FootprintPad p;
        p.number = pad->str_at(1);
        p.type = pad->str_at(2);
        p.shape = pad->str_at(3);
        if (auto* at = pad->find("at")) p.position = {at->num_at(1), at->num_at(2)};
        if (auto* size = pad->find("size")) p.size = {size->num_at(1), size->num_at(2)};
        if (auto* layers = pad->find("layers"))
            for (size_t i = 1; i < layers->size(); i++) p.layers.push_back(layers->str_at(i));
        info.pads.push_back(std::move(p));
    }
    return info;
}

// ── Queries ─────────────────────────────────────────────────────────

static std::string prop_value(const SExpr& sym, const std::string& name) {
    for (auto* p : sym.find_all("property"))
        if (p->str_at(1) == name) return p->str_at(2);
    return "";
}

std::vector<SymbolSummary> LibraryResolver::search_symbols(const std::string& query, size_t limit) {
    std::vector<SymbolSummary> out;
    std::string q = to_lower(query);
    for (auto& lib : symbol_libraries()) {
        const SExpr* root = nullptr;
        try {
            root = &load_library(lib.path);
        } catch (const Error& e) {
            warn(std::string("skipped library ") + lib.path + ": " + e.what());
            continue;
        }
        for (auto* sym : root->find_all("symbol")) {
            SymbolSummary s;
            s.lib_id = lib.nickname + ":" + sym->str_at(1);
            s.description = prop_value(*sym, "Description");
            if (s.description.empty()) s.description = prop_value(*sym, "ki_description");
            s.keywords = prop_value(*sym, "ki_keywords");
            if (to_lower(s.lib_id).find(q) == std::string::npos &&
                to_lower(s.description).find(q) == std::string::npos &&
                to_lower(s.keywords).find(q) == std::string::npos)
                continue;
            out.push_back(std::move(s));
            if (out.size() >= limit) return out;
        }
    }
    return out;
}

std::vector<std::string> LibraryResolver::search_footprints(const std::string& query, size_t limit) {
    std::vector<std::string> out;
    std::string q = to_lower(query);
    for (auto& lib : footprint_libraries()) {
        for (auto& name : footprint_names(lib)) {
            std::string id = lib.nickname + ":" + name;
            if (to_lower(id).find(q) == std::string::npos) continue;
            out.push_back(id);
            if (out.size() >= limit) return out;
        }
    }
    return out;
}

SymbolInfo LibraryResolver::symbol_info(const std::string& lib_id) {
    SExpr node = flattened(lib_id);
    LibSymbolDef def = read_lib_symbol(node);

    SymbolInfo info;
    info.lib_id = lib_id;
    info.description = def.properties.count("Description") ? def.properties["Description"]
                                                           : def.properties["ki_description"];
    info.keywords = def.properties["ki_keywords"];
    info.datasheet = def.properties["Datasheet"];
    info.default_footprint = def.properties["Footprint"];
    info.fp_filters = def.fp_filters;
    info.power = def.power;
    info.unit_count = def.unit_count;
    info.pins = def.pins;
    return info;
}

std::vector<std::string> LibraryResolver::suggest_footprints(const std::string& lib_id) {
    static const size_t MAX_SUGGESTIONS = 100;
    SymbolInfo info = symbol_info(lib_id);

    std::vector<std::string> out;
    std::set<std::string> seen;
    if (!info.default_footprint.empty()) {
        out.push_back(info.default_footprint);
        seen.insert(info.default_footprint);
    }
    if (info.fp_filters.empty()) return out;

    for (auto& lib : footprint_libraries()) {
        for (auto& name : footprint_names(lib)) {
            std::string id = lib.nickname + ":" + name;
            for (auto& filter : info.fp_filters) {
                // "Lib:Pattern" filters match the full id, bare ones the name
                const std::string& target = filter.find(':') != std::string::npos ? id : name;
                if (!glob_match(filter, target, true)) continue;
                if (seen.insert(id).second) out.push_back(id);
                break;
            }
            if (out.size() >= MAX_SUGGESTIONS) return out;
        }
    }
    log("Suggested " + std::to_string(out.size()) + " footprints for " + lib_id);
    return out;
}

bool LibraryResolver::import_symbol(const std::string& lib_id, const std::string& dest_library) {
    SExpr sym = flattened(lib_id);
    std::string name = split_lib_id(lib_id).second;

    FileSnapshot snap = read_snapshot(dest_library);
    SExpr root = parse_sexpr(snap.content);
    if (!root.is("kicad_symbol_lib"))
        throw StructuralInvariantViolation("not a symbol library: " + dest_library,
                                           {{"path", dest_library}});
    for (auto* existing : root.find_all("symbol"))
        if (existing->str_at(1) == name) return false;

    root.append(std::move(sym));
    commit_file(snap, serialize(root));
    lib_file_cache_.erase(dest_library);
    log("Imported " + lib_id + " into " + dest_library);
    return true;
}

bool LibraryResolver::import_footprint(const std::string& lib_id, const std::string& dest_pretty) {
    ResolvedFootprint fp = resolve_footprint(lib_id);
    if (!is_directory(dest_pretty)) throw NotFoundError("footprint library", dest_pretty);

    // The .kicad_mod is copied byte for byte
    std::string content = read_file(fp.path);
    std::string target = join_path(dest_pretty, split_lib_id(lib_id).second + ".kicad_mod");
    if (file_exists(target)) {
        if (read_file(target) == content) return false;
        throw IOConflict(target, "a different footprint of that name is already there");
    }
    create_file(target, content);
    log("Copied " + fp.path + " to " + target);
    return true;
}

void LibraryResolver::log(const std::string& msg) {
    if (opts_.verbose) {
        std::cerr << "[library] " << msg << "\n";
    }
}

void LibraryResolver::warn(const std::string& msg) {
    warnings_.push_back(msg);
    log("Warning: " + msg);
}

// ── Project libraries ───────────────────────────────────────────────

static void check_library_name(const std::string& name) {
    if (name.empty() || name.find_first_of("/:\\\"") != std::string::npos)
        throw InvalidArgument("invalid library name \"" + name + "\"");
}

void create_project_library(const std::string& project_dir, const std::string& name) {
    check_library_name(name);
    if (!is_directory(project_dir)) throw NotFoundError("project directory", project_dir);

    create_file(join_path(project_dir, name + ".kicad_sym"),
                "(kicad_symbol_lib\n"
                "\t(version 20231120)\n"
                "\t(generator \"kicadfile\")\n"
                "\t(generator_version \"9.0\")\n"
                ")\n");
    std::string pretty = join_path(project_dir, name + ".pretty");
    if (::mkdir(pretty.c_str(), 0755) != 0 && !is_directory(pretty))
        throw IoError(pretty, "cannot create footprint library directory");
}

bool register_project_library(const std::string& project_dir, const std::string& name,
                              const std::string& kind) {
    check_library_name(name);
    bool symbols = kind == "symbol";
    if (!symbols && kind != "footprint")
        throw InvalidArgument("library kind must be symbol or footprint", {{"kind", kind}});

    std::string table = join_path(project_dir, symbols ? "sym-lib-table" : "fp-lib-table");
    std::string root_tag = symbols ? "sym_lib_table" : "fp_lib_table";
    std::string uri = "${KIPRJMOD}/" + name + (symbols ? ".kicad_sym" : ".pretty");
    std::string entry = "(lib (name " + sq(name) + ")(type \"KiCad\")(uri " + sq(uri) +
                        ")(options \"\")(descr \"\"))";

    if (!file_exists(table)) {
        create_file(table, "(" + root_tag + "\n\t(version 7)\n\t" + entry + "\n)\n");
        return true;
    }

    FileSnapshot snap = read_snapshot(table);
    SExpr root = parse_sexpr(snap.content);
    if (!root.is(root_tag))
        throw StructuralInvariantViolation("not a library table: " + table, {{"path", table}});
    for (auto* lib : root.find_all("lib"))
        if (lib->child_str("name") == name) return false;
    root.append(parse_snippet(entry));
    commit_file(snap, serialize(root));
    return true;
}

} // namespace kicadfile
