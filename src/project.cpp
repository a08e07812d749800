#include "project.h"
#include "errors.h"
#include "utils.h"

#include <algorithm>
#include <utility>

namespace kicadfile {

static const std::pair<const char*, const char*> KICAD_FILE_KINDS[] = {
    {".kicad_pro", "project"},
    {".kicad_pcb", "board"},
    {".kicad_sch", "schematic"},
    {".kicad_sym", "symbol_library"},
    {".kicad_mod", "footprint"},
    {".kicad_dru", "design_rules"},
    {".kicad_wks", "worksheet"},
};

static std::string existing(const std::string& dir, const std::string& name) {
    std::string path = join_path(dir, name);
    return file_exists(path) ? path : std::string();
}

ProjectFiles resolve_project_files(const std::string& path) {
    ProjectFiles files;
    if (is_directory(path)) {
        files.directory = path;
        auto pro = list_dir(path, ".kicad_pro");
        files.name = pro.empty() ? file_stem(path) : file_stem(pro.front());
    } else if (file_exists(path)) {
        files.directory = parent_dir(path);
        files.name = file_stem(path);
    } else {
        throw NotFoundError("project", path);
    }

    files.project = existing(files.directory, files.name + ".kicad_pro");
    files.board = existing(files.directory, files.name + ".kicad_pcb");
    files.schematic = existing(files.directory, files.name + ".kicad_sch");
    return files;
}

std::map<std::string, std::vector<std::string>> list_project_files(const std::string& dir) {
    if (!is_directory(dir)) throw NotFoundError("directory", dir);
    std::map<std::string, std::vector<std::string>> files;
    for (auto& [suffix, kind] : KICAD_FILE_KINDS) {
        for (auto& path : list_dir(dir, suffix))
            if (!is_directory(path)) files[kind].push_back(path);
    }
    for (auto& [kind, paths] : files)
        std::sort(paths.begin(), paths.end(), natural_less);
    return files;
}

json read_project_file(const std::string& path) {
    std::string text = read_file(path);
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ParseError(path + ": " + e.what(), e.byte, 0, 0);
    }
    if (!j.is_object())
        throw StructuralInvariantViolation("project file is not a JSON object", {{"path", path}});
    return j;
}

} // namespace kicadfile
