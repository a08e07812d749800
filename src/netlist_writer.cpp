#include "netlist_writer.h"
#include "errors.h"
#include "utils.h"

#include <pugixml.hpp>

#include <algorithm>
#include <ctime>
#include <iostream>
#include <map>
#include <set>
#include <sstream>

namespace kicadfile {

NetlistWriter::NetlistWriter(const NetlistOptions& opts) : opts_(opts) {}

void NetlistWriter::log(const std::string& msg) {
    if (opts_.verbose) std::cerr << "[netlist] " << msg << "\n";
}

void NetlistWriter::warn(const std::string& msg) {
    warnings_.push_back(msg);
    log("warning: " + msg);
}

std::string NetlistWriter::write(const SchematicDocument& doc, PinLocator& locator,
                                 ConnectivityGraph& graph) {
    Schematic sch = doc.read();

    pugi::xml_document xml;
    auto decl = xml.append_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "utf-8";

    pugi::xml_node root = xml.append_child("export");
    root.append_attribute("version") = "E";

    write_design(root, doc, sch);
    write_components(root, sch);
    write_libparts(root, doc, sch, locator);
    write_nets(root, graph);

    std::ostringstream out;
    xml.save(out, "  ");
    return out.str();
}

// ── Design ──────────────────────────────────────────────────────────

void NetlistWriter::write_design(pugi::xml_node& root, const SchematicDocument& doc,
                                 const Schematic& sch) {
    pugi::xml_node design = root.append_child("design");
    design.append_child("source").text() = doc.path().c_str();

    char date[64];
    std::time_t now = std::time(nullptr);
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", std::localtime(&now));
    design.append_child("date").text() = date;
    design.append_child("tool").text() = opts_.tool.c_str();

    pugi::xml_node sheet = design.append_child("sheet");
    sheet.append_attribute("number") = "1";
    sheet.append_attribute("name") = "/";
    sheet.append_attribute("tstamps") = "/";
    pugi::xml_node tb = sheet.append_child("title_block");
    auto field = [&](const char* tag, const char* key) {
        auto it = sch.title_block.find(key);
        tb.append_child(tag).text() = it == sch.title_block.end() ? "" : it->second.c_str();
    };
    field("title", "title");
    field("company", "company");
    field("rev", "rev");
    field("date", "date");
    tb.append_child("source").text() = file_stem(doc.path()).c_str();
}

// ── Components ──────────────────────────────────────────────────────

void NetlistWriter::write_components(pugi::xml_node& root, const Schematic& sch) {
    pugi::xml_node comps = root.append_child("components");

    // One <comp> per reference; units of a part share it
    std::map<std::string, const SymbolInstance*> parts;
    for (auto& sym : sch.symbols) {
        if (sym.power || sym.reference.empty() || sym.reference[0] == '#') continue;
        if (!sym.on_board && !sym.in_bom) continue;
        parts.emplace(sym.reference, &sym);
    }
    std::vector<const SymbolInstance*> ordered;
    for (auto& [ref, sym] : parts) ordered.push_back(sym);
    std::sort(ordered.begin(), ordered.end(), [](const SymbolInstance* a, const SymbolInstance* b) {
        return natural_less(a->reference, b->reference);
    });

    for (auto* sym : ordered) {
        pugi::xml_node comp = comps.append_child("comp");
        comp.append_attribute("ref") = sym->reference.c_str();
        comp.append_child("value").text() = sym->value.c_str();
        if (!sym->footprint.empty())
            comp.append_child("footprint").text() = sym->footprint.c_str();
        if (const Property* ds = sym->property("Datasheet"))
            comp.append_child("datasheet").text() = ds->value.c_str();

        auto [lib, part] = split_lib_id(sym->lib_id);
        pugi::xml_node src = comp.append_child("libsource");
        src.append_attribute("lib") = lib.c_str();
        src.append_attribute("part") = part.c_str();

        pugi::xml_node fields;
        for (auto& p : sym->properties) {
            if (p.name == "Reference" || p.name == "Value" || p.name == "Footprint" ||
                p.name == "Datasheet")
                continue;
            if (!fields) fields = comp.append_child("fields");
            pugi::xml_node f = fields.append_child("field");
            f.append_attribute("name") = p.name.c_str();
            f.text() = p.value.c_str();
        }

        pugi::xml_node path = comp.append_child("sheetpath");
        path.append_attribute("names") = "/";
        path.append_attribute("tstamps") = "/";
        comp.append_child("tstamps").text() = sym->uuid.c_str();
    }
    log("components: " + std::to_string(ordered.size()));
}

// ── Library parts ───────────────────────────────────────────────────

void NetlistWriter::write_libparts(pugi::xml_node& root, const SchematicDocument& doc,
                                   const Schematic& sch, PinLocator& locator) {
    pugi::xml_node libparts = root.append_child("libparts");

    std::set<std::string> lib_ids;
    for (auto& sym : sch.symbols)
        if (!sym.power) lib_ids.insert(sym.lib_id);

    for (auto& lib_id : lib_ids) {
        auto [lib, part] = split_lib_id(lib_id);
        pugi::xml_node lp = libparts.append_child("libpart");
        lp.append_attribute("lib") = lib.c_str();
        lp.append_attribute("part") = part.c_str();

        if (const SExpr* cached = doc.cached_symbol(lib_id)) {
            LibSymbolDef def = read_lib_symbol(*cached);
            auto desc = def.properties.find("Description");
            if (desc == def.properties.end()) desc = def.properties.find("ki_description");
            if (desc != def.properties.end())
                lp.append_child("description").text() = desc->second.c_str();
            if (!def.fp_filters.empty()) {
                pugi::xml_node filters = lp.append_child("footprints");
                for (auto& f : def.fp_filters) filters.append_child("fp").text() = f.c_str();
            }
        }

        std::vector<LibPin> pins;
        try {
            pins = locator.library_pins(lib_id);
        } catch (const Error& e) {
            warn("pins of " + lib_id + " unavailable: " + e.what());
            continue;
        }
        if (pins.empty()) continue;

        std::set<std::string> seen;
        pugi::xml_node xpins = lp.append_child("pins");
        for (auto& pin : pins) {
            if (pin.style > 1 || !seen.insert(pin.number).second) continue;
            pugi::xml_node xp = xpins.append_child("pin");
            xp.append_attribute("num") = pin.number.c_str();
            xp.append_attribute("name") = pin.name.c_str();
            xp.append_attribute("type") = pin.electrical_type.c_str();
        }
    }
}

// ── Nets ────────────────────────────────────────────────────────────

void NetlistWriter::write_nets(pugi::xml_node& root, ConnectivityGraph& graph) {
    pugi::xml_node nets = root.append_child("nets");
    int code = 1;
    for (auto& net : graph.nets()) {
        pugi::xml_node xn = nets.append_child("net");
        xn.append_attribute("code") = code++;
        xn.append_attribute("name") = net.name.c_str();
        for (auto& pin : net.pins) {
            pugi::xml_node node = xn.append_child("node");
            node.append_attribute("ref") = pin.reference.c_str();
            node.append_attribute("pin") = pin.pin.c_str();
            if (!pin.pin_name.empty() && pin.pin_name != "~")
                node.append_attribute("pinfunction") = pin.pin_name.c_str();
            node.append_attribute("pintype") = pin.electrical_type.c_str();
        }
    }
    log("nets: " + std::to_string(code - 1));
}

} // namespace kicadfile
