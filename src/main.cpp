#include "config.h"
#include "errors.h"
#include "file_backend.h"
#include "payload.h"

#include <nlohmann/json.hpp>

#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace kicadfile;

static void print_help() {
    std::cout << "Usage: kicadfile [options] <operation> [key=value ...] [--params JSON]\n"
              << "\n"
              << "Read and edit KiCad schematic, board and library files in place.\n"
              << "Prints a JSON payload on stdout; errors are reported as\n"
              << "{\"status\":\"error\",\"kind\":...,\"message\":...,\"details\":{...}}.\n"
              << "\n"
              << "Options:\n"
              << "  --symbol-dir <dir>        Extra symbol library root (repeatable)\n"
              << "  --footprint-dir <dir>     Extra footprint library root (repeatable)\n"
              << "  --config <file>           JSON configuration file\n"
              << "  --params <json>           Operation parameters as a JSON object\n"
              << "  --list-operations         List operation names and exit\n"
              << "  --verbose                 Log progress to stderr\n"
              << "  -h, --help                Show help\n"
              << "\n"
              << "Example:\n"
              << "  kicadfile add-wire path=amp.kicad_sch start_x=10 start_y=20 end_x=30 end_y=20\n";
}

// ── Parameter access ────────────────────────────────────────────────

static const json& need(const json& p, const char* key) {
    if (!p.contains(key)) throw InvalidArgument(std::string("missing parameter: ") + key, {{"parameter", key}});
    return p[key];
}

static std::string str(const json& p, const char* key) {
    const json& v = need(p, key);
    if (v.is_string()) return v.get<std::string>();
    // key=100 arrives as a number; references and pad numbers are text
    if (v.is_number()) return v.dump();
    throw InvalidArgument(std::string("parameter must be a string: ") + key, {{"parameter", key}});
}

static std::string opt_str(const json& p, const char* key, const std::string& def = "") {
    return p.contains(key) ? str(p, key) : def;
}

static double num(const json& p, const char* key) {
    const json& v = need(p, key);
    if (!v.is_number()) throw InvalidArgument(std::string("parameter must be a number: ") + key, {{"parameter", key}});
    return v.get<double>();
}

static double opt_num(const json& p, const char* key, double def) {
    return p.contains(key) ? num(p, key) : def;
}

static int opt_int(const json& p, const char* key, int def) {
    return p.contains(key) ? static_cast<int>(num(p, key)) : def;
}

static Point point(const json& p, const char* x, const char* y) {
    return {num(p, x), num(p, y)};
}

// Position from x/y or a "position" point
static Point at(const json& p) {
    if (p.contains("position")) return read_point(p["position"]);
    return point(p, "x", "y");
}

static std::map<std::string, std::string> string_map(const json& p, const char* key) {
    std::map<std::string, std::string> out;
    if (!p.contains(key)) return out;
    const json& v = p[key];
    if (!v.is_object()) throw InvalidArgument(std::string("parameter must be an object: ") + key);
    for (auto it = v.begin(); it != v.end(); ++it)
        out[it.key()] = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
    return out;
}

static LabelKind label_kind(const json& p) {
    std::string type = opt_str(p, "label_type", "local");
    if (type == "net_label") return LabelKind::Local;
    auto kind = parse_label_kind(type);
    if (!kind) throw InvalidArgument("unknown label_type: " + type, {{"label_type", type}});
    return *kind;
}

static std::optional<Mirror> opt_mirror(const json& p) {
    if (!p.contains("mirror")) return std::nullopt;
    std::string m = str(p, "mirror");
    if (m != "x" && m != "y" && m != "none" && !m.empty())
        throw InvalidArgument("mirror must be x, y or none", {{"mirror", m}});
    return parse_mirror(m);
}

// key=value; the value is JSON when it parses as JSON, a string otherwise
static void add_param(json& params, const std::string& arg) {
    auto eq = arg.find('=');
    if (eq == std::string::npos || eq == 0)
        throw InvalidArgument("expected key=value, got '" + arg + "'");
    std::string key = arg.substr(0, eq);
    std::string value = arg.substr(eq + 1);
    json parsed = json::parse(value, nullptr, false);
    params[key] = parsed.is_discarded() ? json(value) : parsed;
}

// ── Operations ──────────────────────────────────────────────────────

using Operation = std::function<json(FileBackend&, const json&)>;

static std::map<std::string, Operation> operations() {
    std::map<std::string, Operation> ops;

    // Schematic
    ops["read-schematic"] = [](FileBackend& b, const json& p) {
        return b.read_schematic(str(p, "path"));
    };
    ops["create-schematic"] = [](FileBackend& b, const json& p) {
        return b.create_schematic(str(p, "path"), opt_str(p, "title"), opt_str(p, "revision"),
                                  opt_str(p, "paper", "A4"));
    };
    ops["add-component"] = [](FileBackend& b, const json& p) {
        ComponentSpec spec;
        spec.lib_id = str(p, "lib_id");
        spec.reference = str(p, "reference");
        spec.value = opt_str(p, "value");
        spec.footprint = opt_str(p, "footprint");
        spec.position = at(p);
        spec.rotation = opt_int(p, "rotation", 0);
        spec.mirror = opt_mirror(p).value_or(Mirror::None);
        spec.unit = opt_int(p, "unit", 1);
        spec.properties = string_map(p, "properties");
        return b.add_component(str(p, "path"), spec);
    };
    ops["remove-component"] = [](FileBackend& b, const json& p) {
        return b.remove_component(str(p, "path"), str(p, "reference"), opt_int(p, "unit", 0));
    };
    ops["move-component"] = [](FileBackend& b, const json& p) {
        std::optional<int> rotation;
        if (p.contains("rotation")) rotation = static_cast<int>(num(p, "rotation"));
        return b.move_component(str(p, "path"), str(p, "reference"), at(p), rotation,
                                opt_mirror(p), opt_int(p, "unit", 0));
    };
    ops["update-component-property"] = [](FileBackend& b, const json& p) {
        return b.update_component_property(str(p, "path"), str(p, "reference"),
                                           str(p, "property_name"), str(p, "property_value"));
    };
    ops["add-power-symbol"] = [](FileBackend& b, const json& p) {
        return b.add_power_symbol(str(p, "path"), str(p, "name"), at(p), opt_int(p, "rotation", 0));
    };
    ops["add-wire"] = [](FileBackend& b, const json& p) {
        return b.add_wire(str(p, "path"), point(p, "start_x", "start_y"), point(p, "end_x", "end_y"));
    };
    ops["remove-wire"] = [](FileBackend& b, const json& p) {
        return b.remove_wire(str(p, "path"), point(p, "start_x", "start_y"), point(p, "end_x", "end_y"));
    };
    ops["add-label"] = [](FileBackend& b, const json& p) {
        return b.add_label(str(p, "path"), str(p, "text"), at(p), label_kind(p),
                           opt_int(p, "rotation", 0), opt_str(p, "shape"));
    };
    ops["add-junction"] = [](FileBackend& b, const json& p) {
        return b.add_junction(str(p, "path"), at(p));
    };
    ops["add-no-connect"] = [](FileBackend& b, const json& p) {
        return b.add_no_connect(str(p, "path"), at(p));
    };
    ops["remove-no-connect"] = [](FileBackend& b, const json& p) {
        return b.remove_no_connect(str(p, "path"), at(p));
    };
    ops["get-pin-positions"] = [](FileBackend& b, const json& p) {
        return b.get_symbol_pin_positions(str(p, "path"), str(p, "reference"), opt_int(p, "unit", 0));
    };
    ops["get-pin-net"] = [](FileBackend& b, const json& p) {
        return b.get_pin_net(str(p, "path"), str(p, "reference"), str(p, "pin"));
    };
    ops["get-net-members"] = [](FileBackend& b, const json& p) {
        return b.get_net_connections(str(p, "path"), str(p, "net"));
    };
    ops["list-nets"] = [](FileBackend& b, const json& p) {
        return b.list_nets(str(p, "path"));
    };
    ops["resolve-library-symbol"] = [](FileBackend& b, const json& p) {
        return b.resolve_library_symbol(str(p, "path"), str(p, "lib_id"));
    };
    ops["get-sheet-hierarchy"] = [](FileBackend& b, const json& p) {
        return b.get_sheet_hierarchy(str(p, "path"));
    };
    ops["validate-schematic"] = [](FileBackend& b, const json& p) {
        return b.validate_schematic(str(p, "path"));
    };
    ops["generate-netlist"] = [](FileBackend& b, const json& p) {
        return b.generate_netlist(str(p, "path"), str(p, "output"));
    };
    ops["compare-schematic-board"] = [](FileBackend& b, const json& p) {
        return b.compare_schematic_board(str(p, "schematic_path"), str(p, "board_path"));
    };
    ops["sync-schematic-to-board"] = [](FileBackend& b, const json& p) {
        return b.sync_schematic_to_board(str(p, "schematic_path"), str(p, "board_path"));
    };

    // Board
    ops["read-board"] = [](FileBackend& b, const json& p) {
        return b.read_board(str(p, "path"));
    };
    ops["place-footprint"] = [](FileBackend& b, const json& p) {
        FootprintSpec spec;
        spec.lib_id = str(p, "footprint");
        spec.reference = str(p, "reference");
        spec.value = opt_str(p, "value");
        spec.position = at(p);
        spec.rotation = opt_num(p, "rotation", 0.0);
        spec.layer = opt_str(p, "layer", "F.Cu");
        spec.pad_nets = string_map(p, "pad_nets");
        return b.place_footprint(str(p, "path"), spec);
    };
    ops["move-footprint"] = [](FileBackend& b, const json& p) {
        std::optional<double> rotation;
        if (p.contains("rotation")) rotation = num(p, "rotation");
        return b.move_footprint(str(p, "path"), str(p, "reference"), at(p), rotation);
    };
    ops["remove-footprint"] = [](FileBackend& b, const json& p) {
        return b.remove_footprint(str(p, "path"), str(p, "reference"));
    };
    ops["add-track"] = [](FileBackend& b, const json& p) {
        return b.add_track(str(p, "path"), point(p, "start_x", "start_y"), point(p, "end_x", "end_y"),
                           num(p, "width"), opt_str(p, "layer", "F.Cu"), opt_str(p, "net"));
    };
    ops["add-via"] = [](FileBackend& b, const json& p) {
        return b.add_via(str(p, "path"), at(p), opt_num(p, "size", 0.8), opt_num(p, "drill", 0.4),
                         opt_str(p, "net"));
    };
    ops["assign-net"] = [](FileBackend& b, const json& p) {
        return b.assign_net(str(p, "path"), str(p, "reference"), str(p, "pad"), str(p, "net"));
    };
    ops["get-design-rules"] = [](FileBackend& b, const json& p) {
        return b.get_design_rules(str(p, "path"));
    };

    // Library
    ops["search-symbols"] = [](FileBackend& b, const json& p) {
        return b.search_symbols(str(p, "query"), opt_str(p, "project_dir"));
    };
    ops["search-footprints"] = [](FileBackend& b, const json& p) {
        return b.search_footprints(str(p, "query"), opt_str(p, "project_dir"));
    };
    ops["list-libraries"] = [](FileBackend& b, const json& p) {
        return b.list_libraries(opt_str(p, "project_dir"));
    };
    ops["get-symbol-info"] = [](FileBackend& b, const json& p) {
        return b.get_symbol_info(str(p, "lib_id"), opt_str(p, "project_dir"));
    };
    ops["get-footprint-info"] = [](FileBackend& b, const json& p) {
        return b.get_footprint_info(str(p, "lib_id"), opt_str(p, "project_dir"));
    };
    ops["suggest-footprints"] = [](FileBackend& b, const json& p) {
        return b.suggest_footprints(str(p, "lib_id"), opt_str(p, "project_dir"));
    };
    ops["create-project-library"] = [](FileBackend& b, const json& p) {
        return b.create_project_library(str(p, "project_dir"), str(p, "name"));
    };
    ops["register-project-library"] = [](FileBackend& b, const json& p) {
        return b.register_project_library(str(p, "project_dir"), str(p, "name"),
                                          opt_str(p, "kind", "symbol"));
    };
    ops["import-symbol"] = [](FileBackend& b, const json& p) {
        return b.import_symbol(str(p, "lib_id"), str(p, "destination"), opt_str(p, "project_dir"));
    };
    ops["import-footprint"] = [](FileBackend& b, const json& p) {
        return b.import_footprint(str(p, "lib_id"), str(p, "destination"), opt_str(p, "project_dir"));
    };

    // Project
    ops["open-project"] = [](FileBackend& b, const json& p) {
        return b.open_project(str(p, "path"));
    };
    ops["list-project-files"] = [](FileBackend& b, const json& p) {
        return b.list_project_files(str(p, "path"));
    };
    ops["get-project-metadata"] = [](FileBackend& b, const json& p) {
        return b.get_project_metadata(str(p, "path"));
    };
    return ops;
}

int main(int argc, char* argv[]) {
    std::string operation;
    std::vector<std::string> symbol_dirs;
    std::vector<std::string> footprint_dirs;
    std::string config_file;
    bool verbose = false;
    json params = json::object();

    auto ops = operations();

    try {
        // Parse arguments
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                print_help();
                return 0;
            } else if (arg == "--list-operations") {
                for (auto& [name, op] : ops) std::cout << name << "\n";
                return 0;
            } else if (arg == "--symbol-dir" || arg == "--footprint-dir" ||
                       arg == "--config" || arg == "--params") {
                if (i + 1 >= argc) {
                    std::cerr << "Error: " << arg << " requires an argument\n";
                    return 2;
                }
                std::string value = argv[++i];
                if (arg == "--symbol-dir") symbol_dirs.push_back(value);
                else if (arg == "--footprint-dir") footprint_dirs.push_back(value);
                else if (arg == "--config") config_file = value;
                else {
                    json extra = json::parse(value, nullptr, false);
                    if (extra.is_discarded() || !extra.is_object())
                        throw InvalidArgument("--params must be a JSON object");
                    params.update(extra);
                }
            } else if (arg == "--verbose") {
                verbose = true;
            } else if (arg[0] == '-') {
                std::cerr << "Error: unknown option '" << arg << "'\n";
                print_help();
                return 2;
            } else if (operation.empty()) {
                operation = arg;
            } else {
                add_param(params, arg);
            }
        }

        if (operation.empty()) {
            std::cerr << "Error: no operation specified\n";
            print_help();
            return 2;
        }
        auto op = ops.find(operation);
        if (op == ops.end())
            throw InvalidArgument("unknown operation: " + operation, {{"operation", operation}});

        Config cfg = Config::from_environment();
        if (!config_file.empty()) cfg.load_file(config_file);
        json overrides = json::object();
        if (!symbol_dirs.empty()) overrides["symbol_dirs"] = symbol_dirs;
        if (!footprint_dirs.empty()) overrides["footprint_dirs"] = footprint_dirs;
        if (verbose) overrides["verbose"] = true;
        cfg.merge(overrides);

        FileBackend backend(cfg);
        json result = op->second(backend, params);
        json out = {{"status", "success"}, {"operation", operation}};
        out.update(result);
        std::cout << out.dump(2) << "\n";
        return 0;
    } catch (const Error& e) {
        std::cout << error_payload(e).dump(2) << "\n";
        return 1;
    } catch (const json::exception& e) {
        std::cout << error_payload(InvalidArgument(e.what())).dump(2) << "\n";
        return 1;
    }
}
