#pragma once

#include "schematic.h"

#include <set>
#include <string>
#include <vector>

namespace kicadfile {

struct SheetNode {
    std::string name;
    std::string file;
    std::string error;     // set when the sheet could not be read
    int symbols = 0;
    int wires = 0;
    int labels = 0;
    std::vector<SheetPin> pins;
    std::vector<SheetNode> children;
};

// Tree of hierarchical sheets below a root schematic. Sheet files are
// resolved against the parent's directory; a file reached twice on one
// walk is reported as a circular reference instead of being re-read.
SheetNode read_sheet_hierarchy(const std::string& root_path);

} // namespace kicadfile
