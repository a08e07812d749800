#include "hierarchy.h"
#include "errors.h"
#include "utils.h"

#include <filesystem>

namespace kicadfile {

static std::string canonical_path(const std::string& path) {
    std::error_code ec;
    auto p = std::filesystem::weakly_canonical(path, ec);
    return ec ? path : p.string();
}

static SheetNode build_tree(const std::string& path, std::set<std::string>& visited) {
    SheetNode node;
    node.name = file_stem(path);
    node.file = path;

    if (!visited.insert(canonical_path(path)).second) {
        node.error = "circular reference detected";
        return node;
    }

    Schematic sch;
    try {
        sch = SchematicDocument::load(path).read();
    } catch (const Error& e) {
        node.error = e.what();
        return node;
    }
    node.symbols = static_cast<int>(sch.symbols.size());
    node.wires = static_cast<int>(sch.wires.size());
    node.labels = static_cast<int>(sch.labels.size());

    for (auto& sheet : sch.sheets) {
        if (sheet.file.empty()) continue;
        std::string child_path = join_path(parent_dir(path), sheet.file);
        SheetNode child;
        if (file_exists(child_path)) {
            child = build_tree(child_path, visited);
        } else {
            child.file = child_path;
            child.error = "file not found";
        }
        child.name = sheet.name.empty() ? file_stem(child_path) : sheet.name;
        child.pins = sheet.pins;
        node.children.push_back(std::move(child));
    }
    return node;
}

SheetNode read_sheet_hierarchy(const std::string& root_path) {
    if (!file_exists(root_path)) throw NotFoundError("schematic", root_path, {{"path", root_path}});
    std::set<std::string> visited;
    return build_tree(root_path, visited);
}

} // namespace kicadfile
