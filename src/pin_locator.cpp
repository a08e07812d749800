#include "pin_locator.h"

namespace kicadfile {

PinLocator::PinLocator(const SchematicDocument& doc, LibraryResolver& resolver)
    : doc_(doc), resolver_(resolver)
{}

const std::vector<LibPin>& PinLocator::library_pins(const std::string& lib_id) {
    auto it = pin_cache_.find(lib_id);
    if (it != pin_cache_.end()) return it->second;

    std::vector<LibPin> pins;
    if (const SExpr* cached = doc_.cached_symbol(lib_id)) {
        pins = resolver_.resolve_pins(*cached, lib_id);
    } else {
        // Not cached: go straight to the library
        ResolvedSymbol r = resolver_.resolve(lib_id);
        pins = resolver_.resolve_pins(r.node, lib_id);
    }
    return pin_cache_.emplace(lib_id, std::move(pins)).first->second;
}

std::vector<PinPosition> PinLocator::pins_of(const SymbolInstance& sym) {
    std::vector<PinPosition> out;
    SymbolTransform t = sym.transform();
    for (auto& pin : library_pins(sym.lib_id)) {
        if (pin.unit != 0 && pin.unit != sym.unit) continue;
        if (pin.style > 1) continue;

        PinPosition p;
        p.reference = sym.reference;
        p.number = pin.number;
        p.name = pin.name;
        p.electrical_type = pin.electrical_type;
        p.position = transform_pin(pin.position, t);
        p.angle = transform_pin_angle(pin.angle, t);
        p.unit = sym.unit;
        out.push_back(std::move(p));
    }
    return out;
}

} // namespace kicadfile
