#include "connectivity.h"
#include "errors.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <memory>

using namespace kicadfile;
using namespace kicadfile::test;

TEST(DisjointSet, UnitesAndFinds) {
    DisjointSet ds;
    for (int i = 0; i < 6; i++) ds.add();
    ds.unite(0, 1);
    ds.unite(2, 3);
    ds.unite(1, 3);
    EXPECT_EQ(ds.find(0), ds.find(2));
    EXPECT_NE(ds.find(0), ds.find(4));
    ds.unite(3, 3);
    EXPECT_EQ(ds.size(), 6u);
}

// R1 and R2 side by side; their lower pins share a wire labelled VOUT,
// R1's upper pin sits on a GND symbol and R2's upper pin is open.
// R3 has an unnamed wire stub on pin 2 and a no-connect on pin 1.
static std::string sample_body() {
    return placed_symbol("Device:R", "R1", "10k", 100, 100) +
           placed_symbol("Device:R", "R2", "4k7", 120, 100) +
           placed_symbol("Device:R", "R3", "1k", 140, 100) +
           placed_symbol("power:GND", "#PWR01", "GND", 100, 96.19) +
           placed_symbol("power:+5V", "#PWR02", "+5V", 200, 50) +
           wire(100, 103.81, 120, 103.81) +
           label("label", "VOUT", 110, 103.81) +
           wire(140, 103.81, 150, 103.81) +
           "\t(no_connect (at 140 96.19) (uuid \"nc1\"))\n";
}

class ConnectivityTest : public ::testing::Test {
protected:
    void SetUp() override { write_libraries(dir_); }

    ConnectivityGraph& build(const std::string& body) {
        doc_ = std::make_unique<SchematicDocument>(SchematicDocument::from_text(schematic(body)));
        sch_ = doc_->read();
        resolver_ = std::make_unique<LibraryResolver>(library_options(dir_));
        locator_ = std::make_unique<PinLocator>(*doc_, *resolver_);
        graph_ = std::make_unique<ConnectivityGraph>(sch_, *locator_);
        return *graph_;
    }

    TempDir dir_;
    std::unique_ptr<SchematicDocument> doc_;
    Schematic sch_;
    std::unique_ptr<LibraryResolver> resolver_;
    std::unique_ptr<PinLocator> locator_;
    std::unique_ptr<ConnectivityGraph> graph_;
};

TEST_F(ConnectivityTest, PinPositionsFromLibrary) {
    build(sample_body());
    auto pins = locator_->pins_of(*sch_.find_symbol("R1"));
    ASSERT_EQ(pins.size(), 2u);
    EXPECT_EQ(pins[0].number, "1");
    EXPECT_EQ(pins[0].position, Point(100, 96.19));
    EXPECT_EQ(pins[0].angle, 270);
    EXPECT_EQ(pins[1].position, Point(100, 103.81));
}

TEST_F(ConnectivityTest, LabelNamesWireThroughItsInterior) {
    ConnectivityGraph& g = build(sample_body());
    EXPECT_EQ(g.net_of("R1", "2"), std::optional<std::string>("VOUT"));
    EXPECT_EQ(g.net_of("R2", "2"), std::optional<std::string>("VOUT"));

    NetMembers m = g.members_of("VOUT");
    ASSERT_EQ(m.pins.size(), 2u);
    EXPECT_EQ(m.pins[0].reference, "R1");
    EXPECT_EQ(m.pins[1].reference, "R2");
    EXPECT_EQ(m.labels.size(), 1u);
    EXPECT_EQ(m.wires.size(), 1u);
    EXPECT_TRUE(m.explicit_name);
}

TEST_F(ConnectivityTest, PowerSymbolNamesNet) {
    ConnectivityGraph& g = build(sample_body());
    EXPECT_EQ(g.net_of("R1", "1"), std::optional<std::string>("GND"));
    NetMembers gnd = g.members_of("GND");
    ASSERT_EQ(gnd.pins.size(), 1u);
    EXPECT_EQ(gnd.power_symbols, std::vector<std::string>{"#PWR01"});
}

TEST_F(ConnectivityTest, LonePinHasNoNet) {
    ConnectivityGraph& g = build(sample_body());
    EXPECT_FALSE(g.net_of("R2", "1").has_value());
}

TEST_F(ConnectivityTest, UnnamedNetTakesFirstPin) {
    ConnectivityGraph& g = build(sample_body());
    EXPECT_EQ(g.net_of("R3", "2"), std::optional<std::string>("Net-(R3-Pad2)"));
    EXPECT_FALSE(g.members_of("Net-(R3-Pad2)").explicit_name);
}

TEST_F(ConnectivityTest, NetsCoverEveryPin) {
    ConnectivityGraph& g = build(sample_body());
    auto nets = g.nets();
    // GND, VOUT, R3 stub and the open pins of R2 and R3
    ASSERT_EQ(nets.size(), 5u);
    size_t pins = 0;
    for (auto& n : nets) pins += n.pins.size();
    EXPECT_EQ(pins, 6u);
}

TEST_F(ConnectivityTest, FloatingPinsSkipNoConnects) {
    ConnectivityGraph& g = build(sample_body());
    auto floating = g.floating_pins();
    ASSERT_EQ(floating.size(), 1u);
    EXPECT_EQ(floating[0].reference, "R2");
    EXPECT_EQ(floating[0].pin, "1");
}

TEST_F(ConnectivityTest, UnconnectedPower) {
    ConnectivityGraph& g = build(sample_body());
    EXPECT_EQ(g.unconnected_power(), std::vector<std::string>{"#PWR02"});
}

TEST_F(ConnectivityTest, PinNumbers) {
    ConnectivityGraph& g = build(sample_body());
    EXPECT_EQ(g.pin_numbers("R1"), (std::vector<std::string>{"1", "2"}));
    EXPECT_TRUE(g.pin_numbers("R99").empty());
}

TEST_F(ConnectivityTest, UnknownReferenceOrPin) {
    ConnectivityGraph& g = build(sample_body());
    EXPECT_THROW(g.net_of("R99", "1"), NotFoundError);
    EXPECT_THROW(g.net_of("R1", "3"), NotFoundError);
    EXPECT_THROW(g.members_of("NOPE"), NotFoundError);
}

TEST_F(ConnectivityTest, MissingDefinitionReportedOnQuery) {
    ConnectivityGraph& g = build(sample_body() + placed_symbol("Device:Nope", "U9", "?", 50, 50));
    EXPECT_FALSE(g.warnings().empty());
    EXPECT_THROW(g.net_of("U9", "1"), NotFoundError);
    // Other parts still answer
    EXPECT_EQ(g.net_of("R1", "2"), std::optional<std::string>("VOUT"));
}

TEST_F(ConnectivityTest, ConflictingLocalLabelsAreAmbiguous) {
    ConnectivityGraph& g = build(placed_symbol("Device:R", "R1", "10k", 100, 100) +
                                 wire(100, 103.81, 120, 103.81) +
                                 label("label", "A", 105, 103.81) +
                                 label("label", "B", 115, 103.81));
    EXPECT_THROW(g.net_of("R1", "2"), AmbiguousConnectivityError);
    EXPECT_THROW(g.nets(), AmbiguousConnectivityError);
    // Unrelated pins are unaffected
    EXPECT_FALSE(g.net_of("R1", "1").has_value());
}

TEST_F(ConnectivityTest, GlobalLabelOutranksLocal) {
    ConnectivityGraph& g = build(placed_symbol("Device:R", "R1", "10k", 100, 100) +
                                 wire(100, 103.81, 120, 103.81) +
                                 label("label", "A", 105, 103.81) +
                                 label("global_label", "SDA", 120, 103.81));
    EXPECT_EQ(g.net_of("R1", "2"), std::optional<std::string>("SDA"));
}

TEST_F(ConnectivityTest, SameNameJoinsSeparateWires) {
    ConnectivityGraph& g = build(placed_symbol("Device:R", "R1", "10k", 100, 100) +
                                 placed_symbol("Device:R", "R2", "10k", 200, 100) +
                                 label("label", "CLK", 100, 103.81) +
                                 label("label", "CLK", 200, 96.19));
    EXPECT_EQ(g.net_of("R2", "1"), std::optional<std::string>("CLK"));
    EXPECT_EQ(g.members_of("CLK").pins.size(), 2u);
}

TEST_F(ConnectivityTest, OnlyPlacedUnitPinsCount) {
    ConnectivityGraph& g = build(placed_symbol("Device:OpAmp_Dual", "U1", "LM358", 100, 100, 0, 2));
    EXPECT_EQ(g.pin_numbers("U1"), (std::vector<std::string>{"5", "6", "7"}));
}

TEST_F(ConnectivityTest, PowerFlagDoesNotNameItsNet) {
    // GND and a PWR_FLAG share R1's lower wire; a second flag sits alone on R2
    ConnectivityGraph& g = build(placed_symbol("Device:R", "R1", "10k", 100, 100) +
                                 placed_symbol("Device:R", "R2", "10k", 200, 100) +
                                 wire(100, 103.81, 110, 103.81) +
                                 placed_symbol("power:GND", "#PWR01", "GND", 110, 103.81) +
                                 placed_symbol("power:PWR_FLAG", "#FLG01", "PWR_FLAG", 105, 103.81) +
                                 placed_symbol("power:PWR_FLAG", "#FLG02", "PWR_FLAG", 200, 103.81));
    EXPECT_EQ(g.net_of("R1", "2"), std::optional<std::string>("GND"));
    EXPECT_EQ(g.net_of("R2", "2"), std::optional<std::string>("Net-(R2-Pad2)"));

    NetMembers gnd = g.members_of("GND");
    EXPECT_EQ(gnd.pins.size(), 1u);
    EXPECT_EQ(gnd.power_symbols, (std::vector<std::string>{"#PWR01", "#FLG01"}));

    EXPECT_THROW(g.members_of("PWR_FLAG"), NotFoundError);
    EXPECT_NO_THROW(g.nets());
}

TEST_F(ConnectivityTest, MovePreservesTopology) {
    SchematicDocument doc = SchematicDocument::from_text(schematic(
        placed_symbol("Device:R", "R1", "10k", 100, 100) +
        placed_symbol("Device:R", "R2", "4k7", 120, 100) +
        placed_symbol("Device:OpAmp_Dual", "U1", "LM358", 60, 60, 90, 2) +
        wire(100, 103.81, 120, 103.81)));
    LibraryResolver resolver(library_options(dir_));
    PinLocator locator(doc, resolver);

    Schematic before = doc.read();
    auto r1_before = locator.pins_of(*before.find_symbol("R1"));
    auto u1_before = locator.pins_of(*before.find_symbol("U1"));
    ConnectivityGraph g0(before, locator);
    auto net_before = g0.net_of("R1", "2");
    ASSERT_TRUE(net_before.has_value());
    size_t members_before = g0.members_of(*net_before).pins.size();

    const Point d(-5.08, 0);
    doc.move_symbol("R1", Point(100, 100) + d, std::nullopt, std::nullopt, 0);
    doc.move_symbol("U1", Point(60, 60) + d, std::nullopt, std::nullopt, 0);
    // The wire's R1 end follows the pin
    doc.remove_wire({100, 103.81}, {120, 103.81});
    doc.add_wire(Point(100, 103.81) + d, {120, 103.81});

    Schematic after = doc.read();
    auto r1_after = locator.pins_of(*after.find_symbol("R1"));
    auto u1_after = locator.pins_of(*after.find_symbol("U1"));
    ASSERT_EQ(r1_after.size(), r1_before.size());
    for (size_t i = 0; i < r1_after.size(); i++) {
        EXPECT_EQ(r1_after[i].number, r1_before[i].number);
        EXPECT_EQ(r1_after[i].position, r1_before[i].position + d);
        EXPECT_EQ(r1_after[i].angle, r1_before[i].angle);
    }
    // Rotation is kept, so rotated pins shift by the same delta
    ASSERT_EQ(u1_after.size(), u1_before.size());
    for (size_t i = 0; i < u1_after.size(); i++)
        EXPECT_EQ(u1_after[i].position, u1_before[i].position + d);

    ConnectivityGraph g1(after, locator);
    EXPECT_EQ(g1.net_of("R1", "2"), net_before);
    EXPECT_EQ(g1.net_of("R2", "2"), net_before);
    EXPECT_EQ(g1.members_of(*net_before).pins.size(), members_before);
    EXPECT_FALSE(g1.net_of("R1", "1").has_value());
}

TEST_F(ConnectivityTest, CommonPinResolvesThroughEveryUnit) {
    // Unit 1's copy of pin 3 is open; unit 2's copy sits on GND
    ConnectivityGraph& g = build(placed_symbol("Device:SW_Dual", "SW1", "SW_Dual", 100, 100, 0, 1) +
                                 placed_symbol("Device:SW_Dual", "SW1", "SW_Dual", 150, 100, 0, 2) +
                                 placed_symbol("power:GND", "#PWR01", "GND", 150, 105.08));
    EXPECT_EQ(g.pin_numbers("SW1"), (std::vector<std::string>{"1", "2", "3"}));
    EXPECT_EQ(g.net_of("SW1", "3"), std::optional<std::string>("GND"));
}

TEST_F(ConnectivityTest, CommonPinOnTwoNetsIsAmbiguous) {
    ConnectivityGraph& g = build(placed_symbol("Device:SW_Dual", "SW1", "SW_Dual", 100, 100, 0, 1) +
                                 placed_symbol("Device:SW_Dual", "SW1", "SW_Dual", 150, 100, 0, 2) +
                                 wire(100, 105.08, 110, 105.08) +
                                 label("label", "COM_A", 110, 105.08) +
                                 placed_symbol("power:GND", "#PWR01", "GND", 150, 105.08));
    EXPECT_THROW(g.net_of("SW1", "3"), AmbiguousConnectivityError);
    EXPECT_FALSE(g.net_of("SW1", "1").has_value());
}
