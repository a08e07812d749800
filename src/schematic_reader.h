#pragma once

#include "schematic.h"
#include "sexpr.h"

#include <string>
#include <vector>

namespace kicadfile {

// Builds a typed Schematic from a kicad_sch token tree.
class SchematicReader {
public:
    virtual ~SchematicReader() = default;

    virtual const char* name() const = 0;

    // Returns false when the tree holds something this reader does not
    // model; error() then says what.
    virtual bool read(const SExpr& root, Schematic& out) = 0;

    const std::vector<std::string>& warnings() const { return warnings_; }
    const std::string& error() const { return error_; }

protected:
    std::vector<std::string> warnings_;
    std::string error_;

    // Shared item walk; strict stops at the first problem, otherwise the
    // item is skipped with a warning.
    bool read_items(const SExpr& root, Schematic& out, bool strict);

    bool fail(const std::string& msg) {
        error_ = msg;
        return false;
    }
    void warn(const std::string& msg) { warnings_.push_back(msg); }
};

// Models every construct it accepts exactly. Rejects unknown top-level
// items, malformed items and cache entries that only extend a parent.
class StrictSchematicReader : public SchematicReader {
public:
    const char* name() const override { return "strict"; }
    bool read(const SExpr& root, Schematic& out) override;
};

// Reads whatever it can; malformed or unknown items become warnings.
class TolerantSchematicReader : public SchematicReader {
public:
    const char* name() const override { return "tolerant"; }
    bool read(const SExpr& root, Schematic& out) override;
};

// Strict reader first, tolerant reader when strict declines. Throws
// StructuralInvariantViolation naming both failures if neither can read.
Schematic read_schematic(const SExpr& root, std::vector<std::string>* warnings = nullptr);

} // namespace kicadfile
