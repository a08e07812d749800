#include "errors.h"
#include "library.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <algorithm>

using namespace kicadfile;
using namespace kicadfile::test;

class LibraryTest : public ::testing::Test {
protected:
    void SetUp() override { write_libraries(dir_); }

    LibraryResolver resolver() { return LibraryResolver(library_options(dir_)); }

    TempDir dir_;
};

static std::vector<std::string> numbers(const std::vector<LibPin>& pins) {
    std::vector<std::string> out;
    for (auto& p : pins) out.push_back(p.number);
    std::sort(out.begin(), out.end());
    return out;
}

// ── Lookup ──────────────────────────────────────────────────────────

TEST_F(LibraryTest, ListsLibraries) {
    LibraryResolver lib = resolver();
    auto syms = lib.symbol_libraries();
    ASSERT_EQ(syms.size(), 2u);
    EXPECT_TRUE(lib.find_symbol_library("Device").has_value());
    EXPECT_FALSE(lib.find_symbol_library("Nope").has_value());
    EXPECT_TRUE(lib.find_footprint_library("Resistor_SMD").has_value());
}

TEST_F(LibraryTest, ResolvesPlainSymbol) {
    LibraryResolver lib = resolver();
    ResolvedSymbol r = lib.resolve("Device:R");
    EXPECT_EQ(r.def.name, "R");
    EXPECT_EQ(numbers(r.def.pins), (std::vector<std::string>{"1", "2"}));
    EXPECT_EQ(r.def.fp_filters, std::vector<std::string>{"R_*"});
    EXPECT_EQ(r.library_path, dir_.file("symbols/Device.kicad_sym"));
}

TEST_F(LibraryTest, RejectsMalformedIds) {
    LibraryResolver lib = resolver();
    EXPECT_THROW(lib.resolve("R"), InvalidArgument);
    EXPECT_THROW(lib.resolve("Device:"), InvalidArgument);
    EXPECT_THROW(lib.resolve("Nope:R"), NotFoundError);
    EXPECT_THROW(lib.resolve("Device:Nope"), NotFoundError);
    EXPECT_THROW(lib.resolve_footprint("Resistor_SMD:R_9999"), NotFoundError);
}

// ── Inheritance ─────────────────────────────────────────────────────

TEST_F(LibraryTest, ExtendsChainSuppliesPins) {
    LibraryResolver lib = resolver();
    ResolvedSymbol r = lib.resolve("Device:R_US_Small");
    EXPECT_TRUE(r.def.pins.empty());
    auto pins = lib.resolve_pins(r.node, r.lib_id);
    EXPECT_EQ(numbers(pins), (std::vector<std::string>{"1", "2"}));
}

TEST_F(LibraryTest, ChainOfFiveLinksResolves) {
    LibraryResolver lib = resolver();
    ResolvedSymbol r = lib.resolve("Device:Deep_2");
    EXPECT_EQ(lib.resolve_pins(r.node, r.lib_id).size(), 2u);
}

TEST_F(LibraryTest, ChainTooDeep) {
    LibraryResolver lib = resolver();
    ResolvedSymbol r = lib.resolve("Device:Deep_0");
    try {
        lib.resolve_pins(r.node, r.lib_id);
        FAIL() << "expected InheritanceDepthExceeded";
    } catch (const InheritanceDepthExceeded& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InheritanceDepthExceeded);
        EXPECT_NE(e.details().at("chain").find("Deep_0 -> Deep_1"), std::string::npos);
    }
}

TEST_F(LibraryTest, CircularChain) {
    LibraryResolver lib = resolver();
    ResolvedSymbol r = lib.resolve("Device:Loop_A");
    EXPECT_THROW(lib.resolve_pins(r.node, r.lib_id), InheritanceDepthExceeded);
    EXPECT_THROW(lib.flattened("Device:Loop_B"), InheritanceDepthExceeded);
}

TEST_F(LibraryTest, ParentWithoutGeometry) {
    LibraryResolver lib = resolver();
    ResolvedSymbol r = lib.resolve("Device:Hollow");
    EXPECT_THROW(lib.resolve_pins(r.node, r.lib_id), GeometryUnresolvedError);
}

TEST_F(LibraryTest, FlattenedRenamesUnits) {
    LibraryResolver lib = resolver();
    SExpr flat = lib.flattened("Device:R_US_Small");
    EXPECT_EQ(flat.find("extends"), nullptr);

    std::vector<std::string> subs;
    for (auto* s : flat.find_all("symbol")) subs.push_back(s->str_at(1));
    EXPECT_EQ(subs, (std::vector<std::string>{"R_US_Small_0_1", "R_US_Small_1_1"}));

    LibSymbolDef def = read_lib_symbol(flat);
    EXPECT_EQ(def.properties["Value"], "R_US_Small");  // own value kept
    EXPECT_EQ(def.properties["Description"], "Resistor");
    EXPECT_EQ(def.pins.size(), 2u);
}

TEST_F(LibraryTest, NearestLinkWinsWhenFlattening) {
    LibraryResolver lib = resolver();
    SExpr flat = lib.flattened("Device:NTC_10k");
    LibSymbolDef def = read_lib_symbol(flat);
    EXPECT_EQ(def.properties["Value"], "NTC_10k");
    EXPECT_EQ(def.properties["Description"], "from NTC");
    EXPECT_EQ(def.properties["ki_keywords"], "thermistor ntc");
    EXPECT_EQ(def.properties["Reference"], "TH");
    EXPECT_EQ(def.fp_filters, std::vector<std::string>{"R_*"});
    EXPECT_EQ(def.pins.size(), 2u);

    int descriptions = 0;
    for (auto* p : flat.find_all("property"))
        if (p->str_at(1) == "Description") descriptions++;
    EXPECT_EQ(descriptions, 1);

    SymbolInfo info = lib.symbol_info("Device:NTC_10k");
    EXPECT_EQ(info.description, "from NTC");
    EXPECT_EQ(info.keywords, "thermistor ntc");
    EXPECT_EQ(lib.suggest_footprints("Device:NTC_10k"),
              std::vector<std::string>{"Resistor_SMD:R_0603"});
}

TEST_F(LibraryTest, PopulateCacheOnce) {
    LibraryResolver lib = resolver();
    SchematicDocument doc = SchematicDocument::from_text(schematic(""));
    EXPECT_TRUE(lib.populate_cache(doc, "Device:R_US"));
    EXPECT_FALSE(lib.populate_cache(doc, "Device:R_US"));

    const SExpr* cached = doc.cached_symbol("Device:R_US");
    ASSERT_NE(cached, nullptr);
    EXPECT_EQ(cached->str_at(1), "Device:R_US");
    EXPECT_EQ(cached->find("extends"), nullptr);
}

// ── Queries ─────────────────────────────────────────────────────────

TEST_F(LibraryTest, SearchSymbols) {
    LibraryResolver lib = resolver();
    auto hits = lib.search_symbols("resistor");
    ASSERT_FALSE(hits.empty());
    EXPECT_EQ(hits[0].lib_id, "Device:R");

    auto amps = lib.search_symbols("OPAMP");
    ASSERT_EQ(amps.size(), 1u);
    EXPECT_EQ(amps[0].lib_id, "Device:OpAmp_Dual");

    EXPECT_EQ(lib.search_symbols("Deep_", 3).size(), 3u);
}

TEST_F(LibraryTest, SearchFootprints) {
    LibraryResolver lib = resolver();
    EXPECT_EQ(lib.search_footprints("0603"), std::vector<std::string>{"Resistor_SMD:R_0603"});
    EXPECT_TRUE(lib.search_footprints("qfn").empty());
}

TEST_F(LibraryTest, SymbolInfoCountsUnits) {
    LibraryResolver lib = resolver();
    SymbolInfo info = lib.symbol_info("Device:OpAmp_Dual");
    EXPECT_EQ(info.unit_count, 3);
    EXPECT_EQ(info.pins.size(), 8u);
    EXPECT_EQ(info.default_footprint, "Package_SO:SOIC-8");

    SymbolInfo gnd = lib.symbol_info("power:GND");
    EXPECT_TRUE(gnd.power);
}

TEST_F(LibraryTest, FootprintInfo) {
    LibraryResolver lib = resolver();
    FootprintInfo info = lib.footprint_info("Resistor_SMD:R_0603");
    EXPECT_EQ(info.description, "Resistor SMD 0603");
    EXPECT_TRUE(info.smd);
    ASSERT_EQ(info.pads.size(), 2u);
    EXPECT_EQ(info.pads[0].number, "1");
    EXPECT_EQ(info.pads[0].position, Point(-0.825, 0));
    EXPECT_EQ(info.pads[1].layers.size(), 3u);
}

TEST_F(LibraryTest, SuggestFootprintsFromFilters) {
    LibraryResolver lib = resolver();
    EXPECT_EQ(lib.suggest_footprints("Device:R"), std::vector<std::string>{"Resistor_SMD:R_0603"});
    // Default footprint first, no filters
    EXPECT_EQ(lib.suggest_footprints("Device:OpAmp_Dual"),
              std::vector<std::string>{"Package_SO:SOIC-8"});
}

// ── Project libraries ───────────────────────────────────────────────

TEST_F(LibraryTest, ProjectTableExpandsProjectDir) {
    TempDir project;
    write_text(project.file("Mine.kicad_sym"), power_library());
    write_text(project.file("sym-lib-table"),
               "(sym_lib_table\n"
               "\t(version 7)\n"
               "\t(lib (name \"Mine\")(type \"KiCad\")(uri \"${KIPRJMOD}/Mine.kicad_sym\")"
               "(options \"\")(descr \"\"))\n"
               "\t(lib (name \"Off\")(type \"KiCad\")(uri \"${KIPRJMOD}/Off.kicad_sym\")(disabled))\n"
               ")\n");

    LibraryOptions opts = library_options(dir_);
    opts.project_dir = project.path();
    LibraryResolver lib(opts);

    auto libs = lib.symbol_libraries();
    ASSERT_EQ(libs.size(), 3u);
    EXPECT_EQ(libs[0].nickname, "Mine");
    EXPECT_TRUE(libs[0].project);
    EXPECT_EQ(libs[0].path, project.file("Mine.kicad_sym"));
    EXPECT_NO_THROW(lib.resolve("Mine:GND"));
}

TEST_F(LibraryTest, CreateRegisterAndImport) {
    TempDir project;
    create_project_library(project.path(), "Proj");
    EXPECT_TRUE(file_exists(project.file("Proj.kicad_sym")));
    EXPECT_TRUE(is_directory(project.file("Proj.pretty")));
    EXPECT_THROW(create_project_library(project.path(), "Proj"), IOConflict);
    EXPECT_THROW(create_project_library(project.path(), "a/b"), InvalidArgument);

    EXPECT_TRUE(register_project_library(project.path(), "Proj", "symbol"));
    EXPECT_FALSE(register_project_library(project.path(), "Proj", "symbol"));
    EXPECT_TRUE(register_project_library(project.path(), "Proj", "footprint"));
    EXPECT_THROW(register_project_library(project.path(), "Proj", "3d"), InvalidArgument);

    LibraryOptions opts = library_options(dir_);
    opts.project_dir = project.path();
    LibraryResolver lib(opts);
    EXPECT_TRUE(lib.import_symbol("Device:R_US", project.file("Proj.kicad_sym")));
    EXPECT_FALSE(lib.import_symbol("Device:R_US", project.file("Proj.kicad_sym")));

    // Imported copy stands on its own
    ResolvedSymbol r = lib.resolve("Proj:R_US");
    EXPECT_TRUE(r.def.extends.empty());
    EXPECT_EQ(r.def.pins.size(), 2u);
    EXPECT_TRUE(lib.find_footprint_library("Proj").has_value());
}

TEST_F(LibraryTest, ImportFootprintCopiesFile) {
    TempDir project;
    create_project_library(project.path(), "Proj");
    std::string pretty = project.file("Proj.pretty");

    LibraryResolver lib = resolver();
    EXPECT_TRUE(lib.import_footprint("Resistor_SMD:R_0603", pretty));
    std::string copied = join_path(pretty, "R_0603.kicad_mod");
    EXPECT_EQ(read_file(copied), read_file(dir_.file("footprints/Resistor_SMD.pretty/R_0603.kicad_mod")));

    // Same file again is a no-op; a different one of that name is refused
    EXPECT_FALSE(lib.import_footprint("Resistor_SMD:R_0603", pretty));
    write_text(copied, "(footprint \"R_0603\")\n");
    EXPECT_THROW(lib.import_footprint("Resistor_SMD:R_0603", pretty), IOConflict);
    EXPECT_EQ(read_file(copied), "(footprint \"R_0603\")\n");

    EXPECT_THROW(lib.import_footprint("Resistor_SMD:R_0603", project.file("Missing.pretty")),
                 NotFoundError);
    EXPECT_THROW(lib.import_footprint("Resistor_SMD:R_9999", pretty), NotFoundError);
}
