#pragma once

#include "schematic.h"
#include "sexpr.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kicadfile {

// Longest extends chain followed before giving up
constexpr int MAX_EXTENDS_DEPTH = 5;

struct LibraryOptions {
    std::vector<std::string> symbol_dirs;    // system roots holding *.kicad_sym
    std::vector<std::string> footprint_dirs; // system roots holding *.pretty
    std::string project_dir;                 // for sym-lib-table / fp-lib-table
    bool verbose = false;
};

struct LibraryEntry {
    std::string nickname;
    std::string path;
    bool project = false; // from a project library table
};

struct ResolvedSymbol {
    std::string lib_id;
    std::string library_path;
    SExpr node;          // definition as written in the library
    LibSymbolDef def;
};

struct ResolvedFootprint {
    std::string lib_id;
    std::string path;
    SExpr node;
};

struct SymbolSummary {
    std::string lib_id;
    std::string description;
    std::string keywords;
};

struct FootprintPad {
    std::string number;
    std::string type;
    std::string shape;
    Point position;
    Point size;
    std::vector<std::string> layers;
};

struct FootprintInfo {
    std::string lib_id;
    std::string description;
    std::string tags;
    bool smd = false;
    std::vector<FootprintPad> pads;
};

struct SymbolInfo {
    std::string lib_id;
    std::string description;
    std::string keywords;
    std::string datasheet;
    std::string default_footprint;
    std::vector<std::string> fp_filters;
    bool power = false;
    int unit_count = 1;
    std::vector<LibPin> pins;
};

// Locates symbol and footprint definitions: project library tables
// first, then the system roots. Parsed library files are cached for the
// lifetime of the resolver.
class LibraryResolver {
public:
    explicit LibraryResolver(const LibraryOptions& opts = {});

    std::vector<LibraryEntry> symbol_libraries() const;
    std::vector<LibraryEntry> footprint_libraries() const;

    // Path of the .kicad_sym for a library nickname
    std::optional<std::string> find_symbol_library(const std::string& nickname) const;
    std::optional<std::string> find_footprint_library(const std::string& nickname) const;

    ResolvedSymbol resolve(const std::string& lib_id);
    ResolvedFootprint resolve_footprint(const std::string& lib_id);

    // Pins of a definition. Own pins win; otherwise the extends chain is
    // followed through the original library file, at most
    // MAX_EXTENDS_DEPTH links and never revisiting a name.
    std::vector<LibPin> resolve_pins(const SExpr& definition, const std::string& lib_id);

    // Definition with any extends chain folded in, ready for a cache
    SExpr flattened(const std::string& lib_id);

    // Copy lib_id into the document's lib_symbols; false if already there
    bool populate_cache(SchematicDocument& doc, const std::string& lib_id);

    std::vector<SymbolSummary> search_symbols(const std::string& query, size_t limit = 50);
    std::vector<std::string> search_footprints(const std::string& query, size_t limit = 50);
    SymbolInfo symbol_info(const std::string& lib_id);
    FootprintInfo footprint_info(const std::string& lib_id);
    // Footprints matching the symbol's ki_fp_filters (at most 100)
    std::vector<std::string> suggest_footprints(const std::string& lib_id);

    // Copy a symbol into another .kicad_sym (flattened); returns false
    // if a symbol of that name is already there
    bool import_symbol(const std::string& lib_id, const std::string& dest_library);
    // Copy a footprint's .kicad_mod into a .pretty directory; false when
    // an identical copy is already there, IOConflict for a different one
    bool import_footprint(const std::string& lib_id, const std::string& dest_pretty);

    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    LibraryOptions opts_;
    std::vector<std::string> warnings_;
    // Cache of parsed library files: path -> root node
    std::map<std::string, SExpr> lib_file_cache_;

    const SExpr& load_library(const std::string& path);
    const SExpr& find_symbol_node(const std::string& nickname, const std::string& name);
    std::vector<LibraryEntry> read_lib_table(const std::string& file, const char* root_tag) const;
    std::string expand_vars(const std::string& uri) const;
    std::vector<std::string> footprint_names(const LibraryEntry& lib) const;

    void log(const std::string& msg);
    void warn(const std::string& msg);
};

// New empty <name>.kicad_sym and <name>.pretty under project_dir
void create_project_library(const std::string& project_dir, const std::string& name);

// Add a ${KIPRJMOD} entry to sym-lib-table ("symbol") or fp-lib-table
// ("footprint"); false when the nickname is already registered
bool register_project_library(const std::string& project_dir, const std::string& name,
                              const std::string& kind);

} // namespace kicadfile
