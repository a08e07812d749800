#include "config.h"
#include "erc.h"
#include "errors.h"
#include "hierarchy.h"
#include "netlist_writer.h"
#include "payload.h"
#include "test_support.h"

#include <gtest/gtest.h>
#include <pugixml.hpp>

#include <iterator>
#include <memory>

using namespace kicadfile;
using namespace kicadfile::test;

class AnalysisTest : public ::testing::Test {
protected:
    void SetUp() override {
        write_libraries(dir_);
        resolver_ = std::make_unique<LibraryResolver>(library_options(dir_));
    }

    void load(const std::string& body) {
        doc_ = std::make_unique<SchematicDocument>(SchematicDocument::from_text(schematic(body)));
    }

    ConnectivityGraph& graph() {
        sch_ = doc_->read();
        locator_ = std::make_unique<PinLocator>(*doc_, *resolver_);
        graph_ = std::make_unique<ConnectivityGraph>(sch_, *locator_);
        return *graph_;
    }

    TempDir dir_;
    std::unique_ptr<LibraryResolver> resolver_;
    std::unique_ptr<SchematicDocument> doc_;
    Schematic sch_;
    std::unique_ptr<PinLocator> locator_;
    std::unique_ptr<ConnectivityGraph> graph_;
};

static int count_type(const ErcReport& r, const std::string& type) {
    int n = 0;
    for (auto& v : r.violations)
        if (v.type == type) n++;
    return n;
}

// ── ERC ─────────────────────────────────────────────────────────────

TEST_F(AnalysisTest, ErcFindsProblems) {
    load(placed_symbol("Device:R", "R1", "10k", 100, 100) +
         placed_symbol("Device:R", "R1", "10k", 200, 100) +
         placed_symbol("power:GND", "#PWR01", "GND", 100, 96.19) +
         placed_symbol("power:+5V", "#PWR02", "+5V", 300, 50) +
         wire(100, 103.81, 110, 103.81));
    ErcReport r = check_schematic(*doc_, graph());

    EXPECT_FALSE(r.passed());
    EXPECT_EQ(r.errors, 1);
    EXPECT_EQ(r.warnings, 3);
    EXPECT_EQ(count_type(r, "duplicate_reference"), 1);
    EXPECT_EQ(count_type(r, "floating_pin"), 2);
    EXPECT_EQ(count_type(r, "unconnected_power"), 1);

    for (auto& v : r.violations) {
        if (v.type != "duplicate_reference") continue;
        EXPECT_EQ(v.severity, Severity::Error);
        EXPECT_EQ(v.positions.size(), 2u);
    }
}

TEST_F(AnalysisTest, ErcPassesCleanSheet) {
    load(placed_symbol("Device:R", "R1", "10k", 100, 100) +
         placed_symbol("power:GND", "#PWR01", "GND", 100, 96.19) +
         "\t(no_connect (at 100 103.81) (uuid \"nc\"))\n");
    ErcReport r = check_schematic(*doc_, graph());
    EXPECT_TRUE(r.passed());
    EXPECT_TRUE(r.violations.empty());

    json j = r;
    EXPECT_TRUE(j["passed"].get<bool>());
    EXPECT_EQ(j["error_count"], 0);
}

TEST_F(AnalysisTest, SeparateUnitsAreNotDuplicates) {
    load(placed_symbol("Device:OpAmp_Dual", "U1", "LM358", 100, 100, 0, 1) +
         placed_symbol("Device:OpAmp_Dual", "U1", "LM358", 150, 100, 0, 2));
    EXPECT_EQ(count_type(check_schematic(*doc_, graph()), "duplicate_reference"), 0);
}

TEST_F(AnalysisTest, RequiredFields) {
    load("\t(symbol (lib_id \"Device:R\") (at 50 50 0) (uuid \"u7\")\n"
         "\t\t(property \"Reference\" \"R7\" (at 50 48 0)))\n" +
         placed_symbol("Device:R", "R1", "10k", 100, 100));
    auto missing = check_required_fields(*doc_);
    // unit, in_bom, on_board, dnp and the instances path
    ASSERT_EQ(missing.size(), 5u);
    for (auto& v : missing) {
        EXPECT_EQ(v.reference, "R7");
        EXPECT_EQ(v.type, "missing_field");
        EXPECT_EQ(v.severity, Severity::Error);
    }
    EXPECT_NE(missing.back().description.find(std::string("/") + ROOT_UUID), std::string::npos);
}

// ── Parameter checks ────────────────────────────────────────────────

TEST(Validators, References) {
    EXPECT_EQ(validate_reference("R1"), "R1");
    EXPECT_NO_THROW(validate_reference("U12A"));
    EXPECT_THROW(validate_reference("1R"), InvalidArgument);
    EXPECT_THROW(validate_reference("R"), InvalidArgument);
    EXPECT_THROW(validate_reference(""), InvalidArgument);
}

TEST(Validators, NetNamesAndLayers) {
    EXPECT_NO_THROW(validate_net_name("+3V3"));
    EXPECT_NO_THROW(validate_net_name("/bus/SDA~"));
    EXPECT_THROW(validate_net_name("A B"), InvalidArgument);
    EXPECT_THROW(validate_net_name(""), InvalidArgument);
    EXPECT_NO_THROW(validate_layer("In2.Cu"));
    EXPECT_THROW(validate_layer("F.Copper"), InvalidArgument);
    EXPECT_DOUBLE_EQ(validate_positive(0.25, "width"), 0.25);
    EXPECT_THROW(validate_positive(0, "width"), InvalidArgument);
}

// ── Hierarchy ───────────────────────────────────────────────────────

static std::string sheet(const std::string& name, const std::string& file, const std::string& pin) {
    std::string s = "\t(sheet (at 20 20) (size 30 20) (uuid \"" + generate_uuid_from_seed(name) + "\")\n"
                    "\t\t(property \"Sheetname\" \"" + name + "\" (at 20 19 0))\n"
                    "\t\t(property \"Sheetfile\" \"" + file + "\" (at 20 41 0))\n";
    if (!pin.empty()) s += "\t\t(pin \"" + pin + "\" input (at 20 25 180) (uuid \"p-" + pin + "\"))\n";
    return s + "\t)\n";
}

TEST(Hierarchy, WalksSheetsAndReportsProblems) {
    TempDir dir;
    write_text(dir.file("top.kicad_sch"),
               schematic(sheet("Power", "power.kicad_sch", "VIN") + sheet("Gone", "gone.kicad_sch", "")));
    write_text(dir.file("power.kicad_sch"),
               schematic(wire(0, 0, 10, 0) + sheet("Back", "top.kicad_sch", "")));

    SheetNode root = read_sheet_hierarchy(dir.file("top.kicad_sch"));
    EXPECT_EQ(root.name, "top");
    EXPECT_TRUE(root.error.empty());
    ASSERT_EQ(root.children.size(), 2u);

    const SheetNode& power = root.children[0];
    EXPECT_EQ(power.name, "Power");
    EXPECT_EQ(power.wires, 1);
    ASSERT_EQ(power.pins.size(), 1u);
    EXPECT_EQ(power.pins[0].name, "VIN");
    ASSERT_EQ(power.children.size(), 1u);
    EXPECT_EQ(power.children[0].error, "circular reference detected");

    EXPECT_EQ(root.children[1].error, "file not found");

    json j = root;
    EXPECT_EQ(j["sheets"][1]["error"], "file not found");
    EXPECT_FALSE(j["sheets"][1].contains("symbols_count"));

    EXPECT_THROW(read_sheet_hierarchy(dir.file("nope.kicad_sch")), NotFoundError);
}

// ── Netlist ─────────────────────────────────────────────────────────

TEST_F(AnalysisTest, NetlistXml) {
    load(placed_symbol("Device:R", "R1", "10k", 100, 100, 0, 1, "Resistor_SMD:R_0603") +
         placed_symbol("Device:R", "R2", "4k7", 120, 100) +
         placed_symbol("power:GND", "#PWR01", "GND", 100, 96.19) +
         wire(100, 103.81, 120, 103.81) +
         label("label", "VOUT", 110, 103.81));
    resolver_->populate_cache(*doc_, "Device:R");
    resolver_->populate_cache(*doc_, "power:GND");

    ConnectivityGraph& g = graph();
    NetlistWriter writer;
    std::string text = writer.write(*doc_, *locator_, g);

    pugi::xml_document xml;
    ASSERT_TRUE(xml.load_string(text.c_str()));
    pugi::xml_node root = xml.child("export");
    EXPECT_STREQ(root.attribute("version").value(), "E");

    // Power symbols are not components
    int comps = 0;
    for (pugi::xml_node c : root.child("components").children("comp")) {
        comps++;
        EXPECT_NE(c.attribute("ref").value()[0], '#');
    }
    EXPECT_EQ(comps, 2);
    pugi::xml_node r1 = root.child("components").find_child_by_attribute("comp", "ref", "R1");
    EXPECT_STREQ(r1.child_value("value"), "10k");
    EXPECT_STREQ(r1.child_value("footprint"), "Resistor_SMD:R_0603");
    EXPECT_STREQ(r1.child("libsource").attribute("part").value(), "R");

    pugi::xml_node lp = root.child("libparts").child("libpart");
    EXPECT_STREQ(lp.attribute("part").value(), "R");
    EXPECT_STREQ(lp.child_value("description"), "Resistor");
    EXPECT_STREQ(lp.child("footprints").child_value("fp"), "R_*");
    EXPECT_EQ(std::distance(lp.child("pins").children("pin").begin(),
                            lp.child("pins").children("pin").end()), 2);
    EXPECT_FALSE(lp.next_sibling("libpart"));

    pugi::xml_node nets = root.child("nets");
    pugi::xml_node vout = nets.find_child_by_attribute("net", "name", "VOUT");
    ASSERT_TRUE(vout);
    EXPECT_EQ(std::distance(vout.children("node").begin(), vout.children("node").end()), 2);
    pugi::xml_node gnd = nets.find_child_by_attribute("net", "name", "GND");
    ASSERT_TRUE(gnd);
    EXPECT_STREQ(gnd.child("node").attribute("ref").value(), "R1");
    EXPECT_STREQ(gnd.child("node").attribute("pintype").value(), "passive");
    EXPECT_TRUE(writer.warnings().empty());
}

// ── Configuration ───────────────────────────────────────────────────

TEST(Config, MergePutsExplicitDirsFirst) {
    Config cfg;
    cfg.symbol_dirs = {"/usr/share/kicad/symbols"};
    cfg.merge(json{{"symbol_dirs", {"/opt/libs", "/usr/share/kicad/symbols"}},
                   {"verbose", true},
                   {"generator_version", "8.0"}});
    EXPECT_EQ(cfg.symbol_dirs, (std::vector<std::string>{"/opt/libs", "/usr/share/kicad/symbols"}));
    EXPECT_TRUE(cfg.verbose);
    EXPECT_EQ(cfg.generator, "kicadfile");
    EXPECT_EQ(cfg.generator_version, "8.0");

    LibraryOptions opts = cfg.library_options("/proj");
    EXPECT_EQ(opts.project_dir, "/proj");
    EXPECT_TRUE(opts.verbose);
}

TEST(Config, RejectsBadInput) {
    Config cfg;
    EXPECT_THROW(cfg.merge(json::array()), InvalidArgument);
    EXPECT_THROW(cfg.merge(json{{"symbol_dirs", 3}}), InvalidArgument);

    TempDir dir;
    write_text(dir.file("bad.json"), "{\"verbose\": ");
    EXPECT_THROW(cfg.load_file(dir.file("bad.json")), ParseError);
    EXPECT_THROW(cfg.load_file(dir.file("missing.json")), NotFoundError);

    write_text(dir.file("good.json"), "{\"footprint_dirs\": [\"/fp\"]}");
    cfg.load_file(dir.file("good.json"));
    EXPECT_EQ(cfg.footprint_dirs, std::vector<std::string>{"/fp"});
}

// ── Payloads ────────────────────────────────────────────────────────

TEST(Payload, Points) {
    EXPECT_EQ(json(Point(1.5, -2)), (json{{"x", 1.5}, {"y", -2.0}}));
    EXPECT_EQ(read_point(json::array({3, 4})), Point(3, 4));
    EXPECT_EQ(read_point(json{{"x", 1}, {"y", 2}}), Point(1, 2));
    EXPECT_THROW(read_point(json("12")), InvalidArgument);
    EXPECT_THROW(read_point(json{{"x", 1}}), InvalidArgument);
}

TEST(Payload, ErrorPayload) {
    json j = error_payload(NotFoundError("symbol", "R9", {{"path", "a.kicad_sch"}}));
    EXPECT_EQ(j["status"], "error");
    EXPECT_EQ(j["kind"], "NotFoundError");
    EXPECT_EQ(j["message"], "symbol not found: R9");
    EXPECT_EQ(j["details"]["id"], "R9");
    EXPECT_EQ(j["details"]["path"], "a.kicad_sch");

    EXPECT_EQ(error_payload(AmbiguousConnectivityError("A", "B"))["kind"],
              "AmbiguousConnectivityError");
}
