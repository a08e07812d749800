#pragma once

#include "geometry.h"
#include "sexpr.h"
#include "utils.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kicadfile {

// ── Typed schematic snapshot ────────────────────────────────────────

struct Property {
    std::string name;
    std::string value;
    Point position;
    bool hidden = false;
};

struct InstancePath {
    std::string project;
    std::string path;      // "/<root uuid>[/<sheet uuid>...]"
    std::string reference;
    int unit = 1;
};

struct SymbolInstance {
    std::string lib_id;
    std::string reference;
    std::string value;
    std::string footprint;
    std::string uuid;
    Point position;
    int rotation = 0;
    Mirror mirror = Mirror::None;
    int unit = 1;
    bool in_bom = true;
    bool on_board = true;
    bool dnp = false;
    std::vector<Property> properties;
    std::vector<InstancePath> instances;
    bool power = false;      // power symbol (power: library or '#' reference)
    bool renderable = true;  // lib_id has a cached definition

    SymbolTransform transform() const { return {position, rotation, mirror}; }
    const Property* property(const std::string& name) const;
};

struct Wire {
    Point start;
    Point end;
    std::string uuid;
};

enum class LabelKind { Local, Global, Hierarchical };

const char* label_tag(LabelKind kind);
std::optional<LabelKind> parse_label_kind(const std::string& s);

struct Label {
    LabelKind kind = LabelKind::Local;
    std::string text;
    Point position;
    int rotation = 0;
    std::string shape; // global/hierarchical only
    std::string uuid;
};

struct Junction {
    Point position;
    std::string uuid;
};

struct NoConnect {
    Point position;
    std::string uuid;
};

struct SheetPin {
    std::string name;
    std::string shape;
    Point position;
};

struct Sheet {
    std::string name;
    std::string file;
    std::string uuid;
    Point position;
    Point size;
    std::vector<SheetPin> pins;
};

struct LibPin {
    std::string number;
    std::string name;
    std::string electrical_type;
    std::string shape;
    Point position;       // library frame, Y-up; the connection point
    int angle = 0;
    double length = 0.0;
    int unit = 0;         // 0 = common to all units
    int style = 0;        // body style (1 = normal, 2 = De Morgan)
    bool hidden = false;
};

struct LibSymbolDef {
    std::string name;     // as written, e.g. "Device:R" in a cache, "R" in a library
    std::string extends;  // parent name when inheriting geometry
    bool power = false;
    std::vector<LibPin> pins;
    std::map<std::string, std::string> properties;
    std::vector<std::string> fp_filters;
    int unit_count = 1;

    bool has_geometry() const { return !pins.empty() || extends.empty(); }
};

struct Schematic {
    std::string version;
    std::string generator;
    std::string generator_version;
    std::string uuid;
    std::string paper;
    std::map<std::string, std::string> title_block;
    std::map<std::string, LibSymbolDef> lib_symbols; // keyed by cache name
    std::vector<SymbolInstance> symbols;
    std::vector<Wire> wires;
    std::vector<Label> labels;
    std::vector<Junction> junctions;
    std::vector<NoConnect> no_connects;
    std::vector<Sheet> sheets;

    const SymbolInstance* find_symbol(const std::string& reference, int unit = 0) const;
};

// Parse a library-style symbol definition node (symbol "NAME" ...)
LibSymbolDef read_lib_symbol(const SExpr& node);

// ── Schematic document ──────────────────────────────────────────────

struct SchematicSkeleton {
    std::string title;
    std::string revision;
    std::string paper = "A4";
    std::string generator = "kicadfile";
    std::string generator_version = "9.0";
};

struct NewSymbol {
    std::string lib_id;
    std::string reference;
    std::string value;
    std::string footprint;
    Point position;
    int rotation = 0;
    Mirror mirror = Mirror::None;
    int unit = 1;
    bool in_bom = true;
    bool on_board = true;
    bool dnp = false;
    std::vector<std::pair<std::string, std::string>> properties; // extra, hidden
    std::vector<std::string> pin_numbers;                         // for (pin "N" (uuid))
};

// A .kicad_sch file held as a token tree. Mutators locate the smallest
// subtree by structural signature and rewrite only that subtree; save()
// commits atomically and refuses if the file changed on disk meanwhile.
class SchematicDocument {
public:
    static SchematicDocument load(const std::string& path);
    static SchematicDocument from_text(const std::string& text, const std::string& path = "");
    // Minimal valid document text
    static std::string skeleton_text(const SchematicSkeleton& opts);

    const SExpr& root() const { return root_; }
    const std::string& path() const { return snapshot_.path; }
    std::string text() const { return serialize(root_); }
    std::string uuid() const;
    // Project name used in instances blocks (file stem)
    std::string project_name() const;

    // Typed snapshot through the strict/tolerant reader chain
    Schematic read(std::vector<std::string>* warnings = nullptr) const;

    // ── lib_symbols cache ──
    const SExpr* cached_symbol(const std::string& lib_id) const;
    // Insert a definition under its qualified name; no-op if present.
    // Returns true when the cache changed.
    bool cache_symbol(const std::string& lib_id, const SExpr& definition);

    // ── symbol instances ──
    std::string add_symbol(const NewSymbol& sym);
    void move_symbol(const std::string& reference, const Point& to,
                     std::optional<int> rotation = std::nullopt,
                     std::optional<Mirror> mirror = std::nullopt, int unit = 0);
    // Returns false when the property already had this value
    bool update_property(const std::string& reference, const std::string& name,
                         const std::string& value);
    // Returns the number of units removed
    int remove_symbol(const std::string& reference, int unit = 0);
    std::string next_power_reference() const;

    // ── wiring ──
    std::string add_wire(const Point& start, const Point& end);
    void remove_wire(const Point& start, const Point& end);
    std::string add_label(const std::string& text, const Point& at, LabelKind kind,
                          int rotation = 0, const std::string& shape = "");
    std::string add_junction(const Point& at);
    std::string add_no_connect(const Point& at);
    void remove_no_connect(const Point& at);

    void save();
    // Write to a new path that must not exist yet
    static void create(const std::string& path, const SchematicSkeleton& opts);

private:
    FileSnapshot snapshot_;
    SExpr root_;

    std::vector<size_t> find_symbol_nodes(const std::string& reference, int unit) const;
    SExpr& lib_symbols_node();
    // Index before which new top-level items go (before sheet_instances)
    size_t insertion_index() const;
    SExpr& insert_item(const std::string& snippet);
};

// Reference of a top-level symbol node, from its Reference property
std::string symbol_reference(const SExpr& node);
int symbol_unit(const SExpr& node);
// (hide yes) on the property or inside its effects, or a bare hide flag
bool property_hidden(const SExpr& prop);

} // namespace kicadfile
