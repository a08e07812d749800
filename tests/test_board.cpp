#include "board.h"
#include "errors.h"
#include "library.h"
#include "test_support.h"

#include <gtest/gtest.h>

using namespace kicadfile;
using namespace kicadfile::test;

static const char* TWO_NETS = "\t(net 0 \"\")\n\t(net 1 \"GND\")\n\t(net 2 \"VOUT\")\n";

static BoardDocument sample_board() {
    return BoardDocument::from_text(
        board(board_footprint("Resistor_SMD:R_0603", "R1", "10k", 10, 10,
                              "(net 1 \"GND\")", "(net 2 \"VOUT\")"),
              TWO_NETS));
}

// ── Reading ─────────────────────────────────────────────────────────

TEST(Board, ReadsFootprintsAndNets) {
    Board b = sample_board().read();
    EXPECT_DOUBLE_EQ(b.thickness, 1.6);
    EXPECT_EQ(b.layers.size(), 3u);
    ASSERT_EQ(b.nets.size(), 3u);
    ASSERT_EQ(b.footprints.size(), 1u);

    const Footprint* r1 = b.find_footprint("R1");
    ASSERT_NE(r1, nullptr);
    EXPECT_EQ(r1->value, "10k");
    EXPECT_EQ(r1->lib_id, "Resistor_SMD:R_0603");
    ASSERT_EQ(r1->pads.size(), 2u);
    EXPECT_EQ(r1->pads[0].position, Point(9.175, 10));
    EXPECT_EQ(r1->pads[0].net_name, "GND");
    EXPECT_EQ(r1->pads[1].net_id, 2);
    EXPECT_EQ(b.find_net("VOUT")->id, 2);
}

TEST(Board, PadPositionFollowsFootprintRotation) {
    BoardDocument doc = BoardDocument::from_text(board(
        "\t(footprint \"Resistor_SMD:R_0603\" (layer \"F.Cu\") (at 60 50 90)\n"
        "\t\t(property \"Reference\" \"R5\" (at 0 0 90) (layer \"F.SilkS\"))\n"
        "\t\t(pad \"1\" smd rect (at -0.825 0 90) (size 0.8 0.95) (layers \"F.Cu\"))\n"
        "\t)\n"));
    Board b = doc.read();
    const Footprint* fp = b.find_footprint("R5");
    ASSERT_NE(fp, nullptr);
    EXPECT_DOUBLE_EQ(fp->rotation, 90);
    EXPECT_EQ(fp->pads[0].position, Point(60, 50.825));
}

TEST(Board, NameOnlyPadNet) {
    BoardDocument doc = BoardDocument::from_text(
        board(board_footprint("Lib:X", "J1", "CONN", 0, 0, "(net \"GND\")"), TWO_NETS));
    Board b = doc.read();
    const Footprint* fp = b.find_footprint("J1");
    EXPECT_EQ(fp->pads[0].net_id, 1);
    EXPECT_EQ(fp->pads[0].net_name, "GND");
}

TEST(Board, RejectsOtherRoots) {
    EXPECT_THROW(BoardDocument::from_text("(kicad_sch (version 1))"), StructuralInvariantViolation);
}

TEST(Board, ValidateCatchesDanglingNets) {
    BoardDocument doc = BoardDocument::from_text(
        board(board_footprint("Lib:X", "R1", "1k", 0, 0, "(net 5 \"GHOST\")")));
    std::vector<std::string> warnings;
    doc.read(&warnings);
    EXPECT_EQ(warnings.size(), 1u);
    EXPECT_THROW(doc.validate(), StructuralInvariantViolation);
    EXPECT_NO_THROW(sample_board().validate());
}

// ── Editing ─────────────────────────────────────────────────────────

TEST(Board, ResolveNetAppendsAfterNetTable) {
    BoardDocument doc = sample_board();
    EXPECT_EQ(doc.resolve_net("GND"), 1);
    EXPECT_EQ(doc.resolve_net(""), 0);
    EXPECT_EQ(doc.resolve_net("SDA"), 3);
    EXPECT_EQ(doc.resolve_net("SDA"), 3);

    const SExpr& root = doc.root();
    int idx = root.index_of("net");
    EXPECT_EQ(root[static_cast<size_t>(idx) + 3].str_at(2), "SDA");
    EXPECT_NE(doc.text().find("(net 2 \"VOUT\")\n\t(net 3 \"SDA\")"), std::string::npos);
}

class BoardPlacementTest : public ::testing::Test {
protected:
    void SetUp() override {
        write_libraries(dir_);
        LibraryResolver lib(library_options(dir_));
        def_ = lib.resolve_footprint("Resistor_SMD:R_0603");
    }

    TempDir dir_;
    ResolvedFootprint def_;
};

TEST_F(BoardPlacementTest, CopiesLibraryDefinition) {
    BoardDocument doc = BoardDocument::from_text(board(""));
    NewFootprint fp;
    fp.lib_id = "Resistor_SMD:R_0603";
    fp.reference = "R1";
    fp.value = "10k";
    fp.position = {60, 50};
    fp.rotation = 90;
    fp.pad_nets = {{"1", "GND"}};
    std::string id = doc.place_footprint(fp, &def_.node);

    Board b = doc.read();
    const Footprint* r1 = b.find_footprint("R1");
    ASSERT_NE(r1, nullptr);
    EXPECT_EQ(r1->uuid, id);
    EXPECT_EQ(r1->value, "10k");
    EXPECT_EQ(r1->properties.at("Footprint"), "Resistor_SMD:R_0603");
    ASSERT_EQ(r1->pads.size(), 2u);
    EXPECT_EQ(r1->pads[0].position, Point(60, 50.825));
    EXPECT_DOUBLE_EQ(r1->pads[0].rotation, 90);
    EXPECT_EQ(r1->pads[0].net_name, "GND");
    EXPECT_EQ(r1->pads[1].net_id, 0);
    // Fresh identifiers, library metadata dropped
    EXPECT_NE(r1->pads[0].uuid, "a5");
    EXPECT_EQ(doc.root().find("footprint")->find("version"), nullptr);
    EXPECT_NE(b.find_net("GND"), nullptr);
}

TEST_F(BoardPlacementTest, BackSidePlacementFlips) {
    BoardDocument doc = BoardDocument::from_text(board(""));
    NewFootprint fp;
    fp.lib_id = "Resistor_SMD:R_0603";
    fp.reference = "R2";
    fp.position = {10, 10};
    fp.layer = "B.Cu";
    doc.place_footprint(fp, &def_.node);

    Board b = doc.read();
    const Footprint* r2 = b.find_footprint("R2");
    ASSERT_NE(r2, nullptr);
    EXPECT_EQ(r2->layer, "B.Cu");
    EXPECT_EQ(r2->value, "R_0603");
    EXPECT_EQ(r2->pads[0].layers,
              (std::vector<std::string>{"B.Cu", "B.Paste", "B.Mask"}));
    EXPECT_NE(doc.text().find("(start -0.8 0.4)"), std::string::npos);
}

TEST_F(BoardPlacementTest, RejectsBadPlacements) {
    BoardDocument doc = sample_board();
    NewFootprint fp;
    fp.lib_id = "Resistor_SMD:R_0603";
    fp.reference = "R1";
    EXPECT_THROW(doc.place_footprint(fp, &def_.node), StructuralInvariantViolation);

    fp.reference = "R7";
    fp.layer = "In1.Cu";
    EXPECT_THROW(doc.place_footprint(fp, &def_.node), InvalidArgument);

    fp.layer = "F.Cu";
    fp.pad_nets = {{"3", "SIG"}};
    EXPECT_THROW(doc.place_footprint(fp, &def_.node), NotFoundError);
}

TEST(Board, BareFootprintWithoutDefinition) {
    BoardDocument doc = sample_board();
    NewFootprint fp;
    fp.lib_id = "Missing:Part";
    fp.reference = "U1";
    fp.position = {30, 30};
    doc.place_footprint(fp);

    Board b = doc.read();
    const Footprint* u1 = b.find_footprint("U1");
    ASSERT_NE(u1, nullptr);
    EXPECT_TRUE(u1->pads.empty());
    EXPECT_EQ(u1->value, "Part");
    EXPECT_EQ(u1->properties.at("Footprint"), "Missing:Part");
    // Placed after the existing footprint
    EXPECT_EQ(footprint_reference(doc.root()[doc.root().size() - 1]), "U1");
}

TEST(Board, MoveFootprintCarriesAngles) {
    BoardDocument doc = sample_board();
    doc.move_footprint("R1", {20, 20}, 90);
    Board b = doc.read();
    const Footprint* r1 = b.find_footprint("R1");
    EXPECT_EQ(r1->position, Point(20, 20));
    EXPECT_DOUBLE_EQ(r1->rotation, 90);
    EXPECT_DOUBLE_EQ(r1->pads[0].rotation, 90);
    EXPECT_EQ(r1->pads[0].position, Point(20, 20.825));

    doc.move_footprint("R1", {25, 20});
    EXPECT_DOUBLE_EQ(doc.read().find_footprint("R1")->rotation, 90);
    EXPECT_THROW(doc.move_footprint("R9", {0, 0}), NotFoundError);
}

TEST(Board, FootprintProperties) {
    BoardDocument doc = sample_board();
    EXPECT_TRUE(doc.set_footprint_property("R1", "Value", "22k"));
    EXPECT_FALSE(doc.set_footprint_property("R1", "Value", "22k"));
    EXPECT_TRUE(doc.set_footprint_property("R1", "MPN", "RC0603"));

    Board b = doc.read();
    const Footprint* r1 = b.find_footprint("R1");
    EXPECT_EQ(r1->value, "22k");
    EXPECT_EQ(r1->properties.at("MPN"), "RC0603");
    EXPECT_THROW(doc.set_footprint_property("R1", "", "x"), InvalidArgument);
}

TEST(Board, TracksAndVias) {
    BoardDocument doc = sample_board();
    EXPECT_THROW(doc.add_track({0, 0}, {1, 0}, 0, "F.Cu", "GND"), InvalidArgument);
    EXPECT_THROW(doc.add_track({0, 0}, {1, 0}, 0.25, "F.SilkS", "GND"), InvalidArgument);
    EXPECT_THROW(doc.add_track({1, 1}, {1, 1}, 0.25, "F.Cu", "GND"), InvalidArgument);
    EXPECT_THROW(doc.add_via({5, 5}, 0.4, 0.4, "GND"), InvalidArgument);

    doc.add_track({0, 0}, {10, 0}, 0.25, "B.Cu", "VCC");
    doc.add_via({10, 0}, 0.8, 0.4, "VCC");

    Board b = doc.read();
    ASSERT_EQ(b.tracks.size(), 1u);
    ASSERT_EQ(b.vias.size(), 1u);
    const BoardNet* vcc = b.find_net("VCC");
    ASSERT_NE(vcc, nullptr);
    EXPECT_EQ(b.tracks[0].net_id, vcc->id);
    EXPECT_EQ(b.tracks[0].layer, "B.Cu");
    EXPECT_EQ(b.vias[0].net_id, vcc->id);
    EXPECT_EQ(b.vias[0].layers, (std::vector<std::string>{"F.Cu", "B.Cu"}));
    EXPECT_NO_THROW(doc.validate());
}

TEST(Board, AssignNet) {
    BoardDocument doc = sample_board();
    EXPECT_EQ(doc.assign_net("R1", "2", "SIG"), 1);
    EXPECT_EQ(doc.read().find_footprint("R1")->pads[1].net_name, "SIG");
    doc.assign_net("R1", "2", "");
    EXPECT_EQ(doc.read().find_footprint("R1")->pads[1].net_id, 0);
    EXPECT_THROW(doc.assign_net("R1", "9", "SIG"), NotFoundError);
    EXPECT_THROW(doc.assign_net("R9", "1", "SIG"), NotFoundError);
}

TEST(Board, RemoveFootprint) {
    BoardDocument doc = sample_board();
    doc.remove_footprint("R1");
    EXPECT_TRUE(doc.read().footprints.empty());
    EXPECT_THROW(doc.remove_footprint("R1"), NotFoundError);
}

TEST(Board, SaveRoundTrip) {
    TempDir dir;
    std::string path = dir.file("demo.kicad_pcb");
    std::string text = board(board_footprint("Lib:X", "R1", "1k", 0, 0), TWO_NETS);
    write_text(path, text);

    BoardDocument doc = BoardDocument::load(path);
    EXPECT_EQ(doc.text(), text);
    doc.add_track({0, 0}, {5, 0}, 0.2, "F.Cu", "GND");
    doc.save();
    EXPECT_EQ(BoardDocument::load(path).read().tracks.size(), 1u);

    // File changed on disk since it was loaded
    doc.assign_net("R1", "1", "GND");
    write_text(path, "(kicad_pcb (version 1))");
    EXPECT_THROW(doc.save(), IOConflict);
}

// ── Design rules ────────────────────────────────────────────────────

TEST(Board, DesignRulesFromSetup) {
    std::string text = board("");
    const std::string setup = "\t(setup\n\t\t(pad_to_mask_clearance 0)\n\t)\n";
    text.replace(text.find(setup), setup.size(),
                 "\t(setup\n"
                 "\t\t(stackup\n"
                 "\t\t\t(layer \"F.SilkS\" (type \"Top Silk Screen\"))\n"
                 "\t\t)\n"
                 "\t\t(pad_to_mask_clearance 0.05)\n"
                 "\t\t(solder_mask_min_width 0.1)\n"
                 "\t\t(allow_soldermask_bridges_in_footprints no)\n"
                 "\t\t(tenting front back)\n"
                 "\t\t(pcbplotparams\n"
                 "\t\t\t(layerselection 0x00010fc_ffffffff)\n"
                 "\t\t)\n"
                 "\t)\n");

    DesignRules r = BoardDocument::from_text(text).design_rules();
    EXPECT_TRUE(r.present);
    EXPECT_DOUBLE_EQ(r.numeric.at("pad_to_mask_clearance"), 0.05);
    EXPECT_DOUBLE_EQ(r.numeric.at("solder_mask_min_width"), 0.1);
    EXPECT_EQ(r.text.at("allow_soldermask_bridges_in_footprints"), "no");
    EXPECT_EQ(r.text.at("tenting"), "front back");
    // Nested sections are not rules
    EXPECT_EQ(r.numeric.size() + r.text.size(), 4u);
}

TEST(Board, NoSetupNoRules) {
    std::string text = board("");
    const std::string setup = "\t(setup\n\t\t(pad_to_mask_clearance 0)\n\t)\n";
    text.erase(text.find(setup), setup.size());
    DesignRules r = BoardDocument::from_text(text).design_rules();
    EXPECT_FALSE(r.present);
    EXPECT_TRUE(r.numeric.empty());
    EXPECT_TRUE(r.text.empty());
}
