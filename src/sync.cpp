#include "sync.h"
#include "errors.h"
#include "utils.h"

#include <algorithm>
#include <iostream>
#include <map>
#include <optional>
#include <set>

namespace kicadfile {

static bool is_board_part(const SymbolInstance& sym) {
    if (sym.reference.empty() || sym.reference[0] == '#') return false;
    return !sym.power;
}

CompareResult compare(const Schematic& sch, const Board& board) {
    // Units of one part share a reference; the first one seen stands for all
    std::map<std::string, const SymbolInstance*> sch_by_ref;
    for (auto& sym : sch.symbols)
        if (is_board_part(sym)) sch_by_ref.emplace(sym.reference, &sym);

    std::map<std::string, const Footprint*> board_by_ref;
    for (auto& fp : board.footprints)
        if (!fp.reference.empty()) board_by_ref.emplace(fp.reference, &fp);

    std::set<std::string> refs;
    for (auto& [ref, sym] : sch_by_ref) refs.insert(ref);
    for (auto& [ref, fp] : board_by_ref) refs.insert(ref);
    std::vector<std::string> ordered(refs.begin(), refs.end());
    std::sort(ordered.begin(), ordered.end(), natural_less);

    CompareResult r;
    r.schematic_components = static_cast<int>(sch_by_ref.size());
    r.board_components = static_cast<int>(board_by_ref.size());
    for (auto& ref : ordered) {
        auto s = sch_by_ref.find(ref);
        auto b = board_by_ref.find(ref);
        if (b == board_by_ref.end()) {
            const SymbolInstance& sym = *s->second;
            r.missing_from_board.push_back({ref, sym.value, sym.lib_id, sym.footprint});
            continue;
        }
        if (s == sch_by_ref.end()) {
            const Footprint& fp = *b->second;
            r.missing_from_schematic.push_back({ref, fp.value, fp.lib_id, fp.lib_id});
            continue;
        }

        const SymbolInstance& sym = *s->second;
        const Footprint& fp = *b->second;
        bool mismatch = false;
        if (!sym.footprint.empty() && !fp.lib_id.empty() && sym.footprint != fp.lib_id) {
            r.footprint_mismatches.push_back({ref, sym.footprint, fp.lib_id});
            mismatch = true;
        }
        if (!sym.value.empty() && !fp.value.empty() && sym.value != fp.value) {
            r.value_mismatches.push_back({ref, sym.value, fp.value});
            mismatch = true;
        }
        if (!mismatch) r.matched++;
    }
    return r;
}

// ── BoardSync ───────────────────────────────────────────────────────

BoardSync::BoardSync(LibraryResolver& resolver, const SyncOptions& opts)
    : resolver_(resolver), opts_(opts)
{}

void BoardSync::log(const std::string& msg) {
    if (opts_.verbose) std::cerr << "[sync] " << msg << "\n";
}

// New parts go on a grid to the right of everything already placed
Point BoardSync::next_slot(const Board& board, int index) const {
    double x0 = 20.0, y0 = 20.0;
    if (!board.footprints.empty()) {
        double max_x = board.footprints.front().position.x;
        double min_y = board.footprints.front().position.y;
        for (auto& fp : board.footprints) {
            max_x = std::max(max_x, fp.position.x);
            min_y = std::min(min_y, fp.position.y);
        }
        x0 = max_x + opts_.spacing;
        y0 = min_y;
    }
    int cols = std::max(1, opts_.columns);
    return {x0 + (index % cols) * opts_.spacing, y0 + (index / cols) * opts_.spacing};
}

SyncResult BoardSync::sync(const Schematic& sch, BoardDocument& board, ConnectivityGraph* graph) {
    Board before = board.read();
    CompareResult diff = compare(sch, before);
    SyncResult result;

    int slot = 0;
    for (auto& part : diff.missing_from_board) {
        if (part.footprint.empty()) {
            result.warnings.push_back(part.reference + " has no footprint; not placed");
            continue;
        }

        NewFootprint fp;
        fp.lib_id = part.footprint;
        fp.reference = part.reference;
        fp.value = part.value;
        fp.position = next_slot(before, slot++);

        if (graph) {
            try {
                for (auto& pin : graph->pin_numbers(part.reference)) {
                    // A conflicting net leaves this pad unassigned, not the part
                    try {
                        auto net = graph->net_of(part.reference, pin);
                        if (net) fp.pad_nets[pin] = *net;
                    } catch (const AmbiguousConnectivityError& e) {
                        result.net_conflicts.push_back(part.reference + ":" + pin);
                        result.warnings.push_back(part.reference + " pin " + pin +
                                                  " left unconnected: " + e.what());
                    }
                }
            } catch (const Error& e) {
                result.warnings.push_back("nets of " + part.reference + " unresolved: " + e.what());
            }
        }

        std::optional<ResolvedFootprint> def;
        try {
            def = resolver_.resolve_footprint(part.footprint);
        } catch (const Error& e) {
            result.warnings.push_back(part.reference + ": " + e.what() + "; placed without pads");
        }

        if (def) {
            // Pads the footprint lacks are reported, not fatal
            std::set<std::string> pads;
            for (auto* p : def->node.find_all("pad")) pads.insert(p->str_at(1));
            for (auto it = fp.pad_nets.begin(); it != fp.pad_nets.end();) {
                if (pads.count(it->first)) {
                    ++it;
                } else {
                    result.warnings.push_back(part.reference + " pin " + it->first +
                                              " has no matching pad in " + part.footprint);
                    it = fp.pad_nets.erase(it);
                }
            }
            board.place_footprint(fp, &def->node);
        } else {
            fp.pad_nets.clear();
            board.place_footprint(fp);
        }
        log("placed " + part.reference + " (" + part.footprint + ")");
        result.placed.push_back(part.reference);
    }

    for (auto& m : diff.value_mismatches) {
        if (board.set_footprint_property(m.reference, "Value", m.schematic))
            result.values_updated.push_back(m.reference);
    }
    for (auto& m : diff.footprint_mismatches)
        result.warnings.push_back(m.reference + " footprint differs: schematic " + m.schematic +
                                  ", board " + m.board);
    for (auto& part : diff.missing_from_schematic)
        result.warnings.push_back(part.reference + " is on the board but not in the schematic");
    return result;
}

} // namespace kicadfile
