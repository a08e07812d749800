#pragma once

#include "geometry.h"
#include "sexpr.h"
#include "utils.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kicadfile {

struct BoardNet {
    int id = 0;
    std::string name;
};

struct Pad {
    std::string number;
    std::string type;     // smd, thru_hole, np_thru_hole, connect
    std::string shape;
    Point offset;         // relative to the footprint origin
    Point position;       // absolute board position
    Point size;
    double rotation = 0.0;
    std::vector<std::string> layers;
    int net_id = 0;
    std::string net_name;
    std::string uuid;
};

struct Footprint {
    std::string lib_id;
    std::string reference;
    std::string value;
    std::string layer;
    std::string uuid;
    Point position;
    double rotation = 0.0;
    std::map<std::string, std::string> properties;
    std::vector<Pad> pads;
};

struct Track {
    Point start;
    Point end;
    double width = 0.0;
    std::string layer;
    int net_id = 0;
    std::string uuid;
};

struct Via {
    Point position;
    double size = 0.0;
    double drill = 0.0;
    std::vector<std::string> layers;
    int net_id = 0;
    std::string uuid;
};

struct Zone {
    int net_id = 0;
    std::string net_name;
    std::vector<std::string> layers;
    std::string uuid;
};

struct Board {
    std::string version;
    std::string generator;
    double thickness = 0.0;
    std::vector<std::string> layers;
    std::map<std::string, std::string> title_block;
    std::vector<BoardNet> nets;
    std::vector<Footprint> footprints;
    std::vector<Track> tracks;
    std::vector<Via> vias;
    std::vector<Zone> zones;

    const Footprint* find_footprint(const std::string& reference) const;
    const BoardNet* find_net(int id) const;
    const BoardNet* find_net(const std::string& name) const;
};

// Scalar settings of the board's (setup) node
struct DesignRules {
    bool present = false; // the board has a (setup) node
    std::map<std::string, double> numeric;   // pad_to_mask_clearance 0.05
    std::map<std::string, std::string> text; // tenting "front back"
};

struct NewFootprint {
    std::string lib_id;
    std::string reference;
    std::string value;
    Point position;
    double rotation = 0.0;
    std::string layer = "F.Cu";
    std::map<std::string, std::string> pad_nets; // pad number -> net name
};

// A .kicad_pcb file held as a token tree, edited one subtree at a time.
class BoardDocument {
public:
    static BoardDocument load(const std::string& path);
    static BoardDocument from_text(const std::string& text, const std::string& path = "");

    const SExpr& root() const { return root_; }
    const std::string& path() const { return snapshot_.path; }
    std::string text() const { return serialize(root_); }

    Board read(std::vector<std::string>* warnings = nullptr) const;

    DesignRules design_rules() const;

    // Every pad net must be present in the net table
    void validate() const;

    // Net id for a name, appending (net N "name") when missing; 0 for ""
    int resolve_net(const std::string& name);

    // Place a footprint. With a library definition its pads and graphics
    // are copied; otherwise a bare footprint holding only properties.
    std::string place_footprint(const NewFootprint& fp, const SExpr* definition = nullptr);
    void move_footprint(const std::string& reference, const Point& to,
                        std::optional<double> rotation = std::nullopt);
    // Returns false when unchanged
    bool set_footprint_property(const std::string& reference, const std::string& name,
                                const std::string& value);
    void remove_footprint(const std::string& reference);

    std::string add_track(const Point& start, const Point& end, double width,
                          const std::string& layer, const std::string& net);
    std::string add_via(const Point& at, double size, double drill, const std::string& net,
                        const std::string& from_layer = "F.Cu",
                        const std::string& to_layer = "B.Cu");
    // Returns the number of pads updated
    int assign_net(const std::string& reference, const std::string& pad, const std::string& net);

    void save();

private:
    FileSnapshot snapshot_;
    SExpr root_;

    SExpr* footprint_node(const std::string& reference);
    // Index of the last top-level item with one of the tags, or -1
    int last_index_of(const std::vector<std::string>& tags) const;
    void set_pad_net(SExpr& pad, int id, const std::string& name);
};

std::string footprint_reference(const SExpr& node);

} // namespace kicadfile
