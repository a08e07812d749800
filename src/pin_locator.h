#pragma once

#include "geometry.h"
#include "library.h"
#include "schematic.h"

#include <map>
#include <string>
#include <vector>

namespace kicadfile {

struct PinPosition {
    std::string reference;
    std::string number;
    std::string name;
    std::string electrical_type;
    Point position;   // absolute, sheet coordinates
    int angle = 0;    // pin direction after placement
    int unit = 0;
};

// Computes absolute pin positions of placed symbols. Pin geometry comes
// from the document's lib_symbols cache; entries that only extend a
// parent are completed through the library resolver.
class PinLocator {
public:
    PinLocator(const SchematicDocument& doc, LibraryResolver& resolver);

    // Pins of one placed unit: pins of that unit plus the common unit 0,
    // normal body style only
    std::vector<PinPosition> pins_of(const SymbolInstance& sym);

    // Library pins for a lib_id (cached per locator)
    const std::vector<LibPin>& library_pins(const std::string& lib_id);

private:
    const SchematicDocument& doc_;
    LibraryResolver& resolver_;
    std::map<std::string, std::vector<LibPin>> pin_cache_;
};

} // namespace kicadfile
