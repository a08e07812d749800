#pragma once

#include "board.h"
#include "connectivity.h"
#include "erc.h"
#include "errors.h"
#include "hierarchy.h"
#include "library.h"
#include "pin_locator.h"
#include "schematic.h"
#include "sync.h"

#include <nlohmann/json.hpp>

namespace kicadfile {

using json = nlohmann::json;

// JSON forms of the typed snapshots returned by operations.
// Found by nlohmann through argument-dependent lookup.

void to_json(json& j, const Point& p);
void to_json(json& j, const Property& p);
void to_json(json& j, const SymbolInstance& s);
void to_json(json& j, const Wire& w);
void to_json(json& j, const Label& l);
void to_json(json& j, const Junction& jn);
void to_json(json& j, const NoConnect& nc);
void to_json(json& j, const SheetPin& p);
void to_json(json& j, const Sheet& s);
void to_json(json& j, const Schematic& s);

void to_json(json& j, const LibPin& p);
void to_json(json& j, const PinPosition& p);
void to_json(json& j, const LibraryEntry& e);
void to_json(json& j, const SymbolSummary& s);
void to_json(json& j, const SymbolInfo& s);
void to_json(json& j, const FootprintPad& p);
void to_json(json& j, const FootprintInfo& f);

void to_json(json& j, const BoardNet& n);
void to_json(json& j, const Pad& p);
void to_json(json& j, const Footprint& f);
void to_json(json& j, const Track& t);
void to_json(json& j, const Via& v);
void to_json(json& j, const Zone& z);
void to_json(json& j, const Board& b);
void to_json(json& j, const DesignRules& r);

void to_json(json& j, const NetPin& p);
void to_json(json& j, const NetMembers& m);
void to_json(json& j, const ComponentRef& c);
void to_json(json& j, const FieldMismatch& m);
void to_json(json& j, const CompareResult& r);
void to_json(json& j, const SyncResult& r);
void to_json(json& j, const Violation& v);
void to_json(json& j, const ErcReport& r);
void to_json(json& j, const SheetNode& n);

// {"x": .., "y": ..} or [x, y]; InvalidArgument otherwise
Point read_point(const json& j);

// {"status":"error","kind":..,"message":..,"details":{..}}
json error_payload(const Error& e);

} // namespace kicadfile
