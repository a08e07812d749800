#pragma once

#include "board.h"
#include "connectivity.h"
#include "library.h"
#include "schematic.h"

#include <string>
#include <vector>

namespace kicadfile {

struct ComponentRef {
    std::string reference;
    std::string value;
    std::string lib_id;     // symbol lib_id, or footprint lib_id for board-only parts
    std::string footprint;
};

struct FieldMismatch {
    std::string reference;
    std::string schematic;
    std::string board;
};

struct CompareResult {
    std::vector<ComponentRef> missing_from_board;
    std::vector<ComponentRef> missing_from_schematic;
    std::vector<FieldMismatch> footprint_mismatches;
    std::vector<FieldMismatch> value_mismatches;
    int matched = 0;
    int schematic_components = 0;
    int board_components = 0;
};

// Reference-keyed diff. Power symbols and '#' references are left out;
// fields compare only when both sides carry a value.
CompareResult compare(const Schematic& sch, const Board& board);

struct SyncOptions {
    double spacing = 10.0;   // mm between auto-placed footprints
    int columns = 10;
    bool verbose = false;
};

struct SyncResult {
    std::vector<std::string> placed;
    std::vector<std::string> values_updated;
    std::vector<std::string> net_conflicts; // "REF:PIN" left off an ambiguous net
    std::vector<std::string> warnings;
};

// Brings the board in line with the schematic: places footprints for
// missing parts (pads netted from the schematic when a graph is given)
// and rewrites differing values. Footprint mismatches, board-only parts
// and parts without a footprint are only reported.
class BoardSync {
public:
    BoardSync(LibraryResolver& resolver, const SyncOptions& opts = {});

    SyncResult sync(const Schematic& sch, BoardDocument& board, ConnectivityGraph* graph);

private:
    LibraryResolver& resolver_;
    SyncOptions opts_;

    Point next_slot(const Board& board, int index) const;
    void log(const std::string& msg);
};

} // namespace kicadfile
